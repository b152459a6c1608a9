#include "protocol/message_format.hpp"

#include <cstdio>

namespace parley {

namespace {

// Frames a parent may contain, by parent type.
bool can_contain(Frame parent, Frame child) {
    switch (parent) {
    case Frame::kMessage:
        return child == Frame::kParagraph;
    case Frame::kParagraph:
        return child == Frame::kText || child == Frame::kPushFormat ||
               child == Frame::kPopFormat || child == Frame::kHyperlink ||
               child == Frame::kMention;
    default:
        return false;
    }
}

bool frame_from_code(uint64_t code, Frame& frame) {
    if (code > static_cast<uint64_t>(Frame::kMention)) return false;
    frame = static_cast<Frame>(code);
    return true;
}

bool varint_error(VarintStatus st, ValidationError& err) {
    err = {};
    err.code = st == VarintStatus::kOverflow
        ? ValidationErrorCode::kVarintOverflow
        : ValidationErrorCode::kTruncated;
    return false;
}

// Read one frame header and body from r.
bool read_frame(ByteReader& r, Frame& frame, ByteRange& body,
                ValidationError& err) {
    uint64_t code;
    VarintStatus st = r.get_varint(code);
    if (st != VarintStatus::kOk) return varint_error(st, err);

    if (!frame_from_code(code, frame)) {
        err = {};
        err.code = ValidationErrorCode::kUnknownFrame;
        err.value = code;
        return false;
    }

    uint64_t length;
    st = r.get_varint(length);
    if (st != VarintStatus::kOk) return varint_error(st, err);

    if (length > r.remaining()) {
        err = {};
        err.code = ValidationErrorCode::kFrameOverflow;
        err.frame = frame;
        err.expected = length;
        err.found = r.remaining();
        return false;
    }

    r.take(static_cast<size_t>(length), body);
    return true;
}

bool read_text(ByteRange body, std::string_view& text, ValidationError& err) {
    if (!is_valid_utf8(body.data, body.size)) {
        err = {};
        err.code = ValidationErrorCode::kText;
        return false;
    }
    text = std::string_view(reinterpret_cast<const char*>(body.data), body.size);
    return true;
}

bool read_format(Frame frame, ByteRange body, uint16_t& bits,
                 ValidationError& err) {
    if (body.size != 2) {
        err = {};
        err.code = ValidationErrorCode::kFrameLength;
        err.frame = frame;
        err.expected = 2;
        err.found = body.size;
        return false;
    }

    ByteReader r(body);
    r.get_u16(bits);

    if (bits & ~KNOWN_FORMATS) {
        err = {};
        err.code = ValidationErrorCode::kUnknownFormat;
        err.value = bits & ~KNOWN_FORMATS;
        return false;
    }
    return true;
}

bool read_hyperlink(ByteRange body, std::optional<std::string_view>& label,
                    std::string_view& url, ValidationError& err) {
    ByteReader r(body);
    uint64_t label_len;
    VarintStatus st = r.get_varint(label_len);
    if (st != VarintStatus::kOk) return varint_error(st, err);

    if (label_len > r.remaining()) {
        err = {};
        err.code = ValidationErrorCode::kFrameOverflow;
        err.frame = Frame::kHyperlink;
        err.expected = label_len;
        err.found = r.remaining();
        return false;
    }

    ByteRange label_bytes;
    r.take(static_cast<size_t>(label_len), label_bytes);

    label.reset();
    if (label_len > 0) {
        std::string_view text;
        if (!read_text(label_bytes, text, err)) return false;
        label = text;
    }

    ByteRange url_bytes = r.rest();
    for (size_t i = 0; i < url_bytes.size; i++) {
        if (url_bytes.data[i] >= 0x80) {
            err = {};
            err.code = ValidationErrorCode::kNonAsciiUrl;
            return false;
        }
    }
    url = std::string_view(reinterpret_cast<const char*>(url_bytes.data),
                           url_bytes.size);
    return true;
}

bool read_mention(ByteRange body, UserId& user, ValidationError& err) {
    ByteReader r(body);
    VarintStatus st = r.get_varint(user);
    if (st != VarintStatus::kOk) return varint_error(st, err);

    if (!r.empty()) {
        err = {};
        err.code = ValidationErrorCode::kFrameTooLong;
        err.frame = Frame::kMention;
        err.found = r.remaining();
        return false;
    }
    return true;
}

bool bad_child(Frame parent, Frame child, ValidationError& err) {
    err = {};
    err.code = ValidationErrorCode::kBadChild;
    err.frame = parent;
    err.child = child;
    return false;
}

// Validate the children of a container frame.
bool validate_children(Frame parent, ByteRange body, Validation& out,
                       ValidationError& err) {
    ByteReader r(body);

    while (!r.empty()) {
        Frame frame;
        ByteRange child;
        if (!read_frame(r, frame, child, err)) return false;

        if (!can_contain(parent, frame)) return bad_child(parent, frame, err);

        switch (frame) {
        case Frame::kParagraph:
            if (!validate_children(frame, child, out, err)) return false;
            break;
        case Frame::kText: {
            std::string_view text;
            if (!read_text(child, text, err)) return false;
            break;
        }
        case Frame::kPushFormat:
        case Frame::kPopFormat: {
            uint16_t bits;
            if (!read_format(frame, child, bits, err)) return false;
            break;
        }
        case Frame::kHyperlink: {
            std::optional<std::string_view> label;
            std::string_view url;
            if (!read_hyperlink(child, label, url, err)) return false;
            break;
        }
        case Frame::kMention: {
            UserId user;
            if (!read_mention(child, user, err)) return false;
            out.mentions.push_back(user);
            break;
        }
        case Frame::kMessage:
            // no frame may contain Message; can_contain() rejected it
            return bad_child(parent, frame, err);
        }
    }

    return true;
}

bool read_root(ByteReader& r, ByteRange& body, ValidationError& err) {
    Frame frame;
    if (!read_frame(r, frame, body, err)) return false;

    if (frame != Frame::kMessage) {
        err = {};
        err.code = ValidationErrorCode::kBadRoot;
        err.frame = frame;
        return false;
    }
    return true;
}

bool render_paragraph(ByteRange body, Renderer& renderer, ValidationError& err) {
    ByteReader r(body);
    uint16_t current = 0;

    while (!r.empty()) {
        Frame frame;
        ByteRange child;
        if (!read_frame(r, frame, child, err)) return false;
        if (!can_contain(Frame::kParagraph, frame)) {
            return bad_child(Frame::kParagraph, frame, err);
        }

        switch (frame) {
        case Frame::kText: {
            std::string_view text;
            if (!read_text(child, text, err)) return false;
            renderer.text(text);
            break;
        }
        case Frame::kPushFormat: {
            uint16_t bits;
            if (!read_format(frame, child, bits, err)) return false;
            uint16_t added = bits & ~current;
            if (added) {
                current |= added;
                renderer.push_format(added, current);
            }
            break;
        }
        case Frame::kPopFormat: {
            uint16_t bits;
            if (!read_format(frame, child, bits, err)) return false;
            uint16_t removed = bits & current;
            if (removed) {
                current &= ~removed;
                renderer.pop_format(removed, current);
            }
            break;
        }
        case Frame::kHyperlink: {
            std::optional<std::string_view> label;
            std::string_view url;
            if (!read_hyperlink(child, label, url, err)) return false;
            renderer.hyperlink(label, url);
            break;
        }
        case Frame::kMention: {
            UserId user;
            if (!read_mention(child, user, err)) return false;
            renderer.mention(user);
            break;
        }
        default:
            return bad_child(Frame::kParagraph, frame, err);
        }
    }
    return true;
}

} // namespace

const char* frame_name(Frame frame) {
    switch (frame) {
    case Frame::kMessage:    return "Message";
    case Frame::kParagraph:  return "Paragraph";
    case Frame::kText:       return "Text";
    case Frame::kPushFormat: return "PushFormat";
    case Frame::kPopFormat:  return "PopFormat";
    case Frame::kHyperlink:  return "Hyperlink";
    case Frame::kMention:    return "Mention";
    }
    return "?";
}

std::string ValidationError::to_string() const {
    char buf[160];
    switch (code) {
    case ValidationErrorCode::kNone:
        return "no error";
    case ValidationErrorCode::kTruncated:
        return "message ends in the middle of a field";
    case ValidationErrorCode::kVarintOverflow:
        return "message contains a LEB128 value greater than 2^64 - 1";
    case ValidationErrorCode::kFrameOverflow:
        std::snprintf(buf, sizeof(buf),
                      "frame %s declares length %lu greater than message length %lu",
                      frame_name(frame), expected, found);
        return buf;
    case ValidationErrorCode::kFrameLength:
        std::snprintf(buf, sizeof(buf),
                      "expected frame type %s to have %lu bytes, but found %lu",
                      frame_name(frame), expected, found);
        return buf;
    case ValidationErrorCode::kFrameTooLong:
        std::snprintf(buf, sizeof(buf), "frame %s contains %lu extra bytes",
                      frame_name(frame), found);
        return buf;
    case ValidationErrorCode::kUnknownFrame:
        std::snprintf(buf, sizeof(buf), "message contains unknown frame %lu",
                      value);
        return buf;
    case ValidationErrorCode::kBadRoot:
        std::snprintf(buf, sizeof(buf), "%s is not a valid root frame",
                      frame_name(frame));
        return buf;
    case ValidationErrorCode::kBadChild:
        std::snprintf(buf, sizeof(buf), "frame %s cannot contain frame %s",
                      frame_name(frame), frame_name(child));
        return buf;
    case ValidationErrorCode::kText:
        return "message contains invalid UTF-8 text";
    case ValidationErrorCode::kUnknownFormat:
        std::snprintf(buf, sizeof(buf), "message contains unknown formatting %lu",
                      value);
        return buf;
    case ValidationErrorCode::kNonAsciiUrl:
        return "message contains a non-ASCII URL";
    case ValidationErrorCode::kTrailingBytes:
        std::snprintf(buf, sizeof(buf), "message is followed by %lu extra bytes", found);
        return buf;
    }
    return "unknown error";
}

bool validate_message(const uint8_t* data, size_t size,
                      Validation& out, ValidationError& err) {
    out = {};
    ByteReader r(data, size);

    ByteRange body;
    if (!read_root(r, body, err)) return false;
    if (!validate_children(Frame::kMessage, body, out, err)) return false;

    out.body = ByteRange{data, r.position()};
    out.rest = r.rest();
    return true;
}

bool is_valid_utf8(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint8_t c = data[i];
        if (c < 0x80) {
            i++;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (size - i < len) return false;
        for (size_t j = 1; j < len; j++) {
            uint8_t cc = data[i + j];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

bool render_message(const uint8_t* data, size_t size, Renderer& renderer,
                    ValidationError& err) {
    ByteReader r(data, size);
    ByteRange body;
    if (!read_root(r, body, err)) return false;

    ByteReader blocks(body);
    while (!blocks.empty()) {
        Frame frame;
        ByteRange child;
        if (!read_frame(blocks, frame, child, err)) return false;
        if (!can_contain(Frame::kMessage, frame)) {
            return bad_child(Frame::kMessage, frame, err);
        }

        renderer.begin_paragraph();
        if (!render_paragraph(child, renderer, err)) return false;
        renderer.end_paragraph();
    }
    return true;
}

// --- PlainTextRenderer ---

void PlainTextRenderer::begin_paragraph() {
    if (!first_paragraph_) out_ += "\n\n";
    first_paragraph_ = false;
}

void PlainTextRenderer::end_paragraph() {}

void PlainTextRenderer::text(std::string_view text) {
    out_.append(text.data(), text.size());
}

void PlainTextRenderer::hyperlink(std::optional<std::string_view> label,
                                  std::string_view url) {
    if (label) {
        out_.append(label->data(), label->size());
        out_ += ' ';
    }
    out_ += '<';
    out_.append(url.data(), url.size());
    out_ += '>';
}

void PlainTextRenderer::mention(UserId user) {
    out_ += '@';
    out_ += std::to_string(user);
}

} // namespace parley
