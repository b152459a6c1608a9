#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/types.hpp"
#include "protocol/byte_io.hpp"

namespace parley {

// Frame types of the message body grammar.
// Layout of every frame: [varint type][varint length][length bytes of body]
enum class Frame : uint8_t {
    kMessage    = 0,
    kParagraph  = 1,
    kText       = 2,
    kPushFormat = 3,
    kPopFormat  = 4,
    kHyperlink  = 5,
    kMention    = 6,
};

const char* frame_name(Frame frame);

// Formatting flags carried by PushFormat / PopFormat (2 bytes, little-endian).
enum Format : uint16_t {
    kFormatEmphasis = 0x0001,
    kFormatStrong   = 0x0002,
};

inline constexpr uint16_t KNOWN_FORMATS = kFormatEmphasis | kFormatStrong;

enum class ValidationErrorCode : uint8_t {
    kNone = 0,
    kTruncated,       // varint or fixed field runs past the end of its frame
    kVarintOverflow,  // varint exceeds 64 bits
    kFrameOverflow,   // frame: declared length (expected) > available (found)
    kFrameLength,     // frame: body must be `expected` bytes, has `found`
    kFrameTooLong,    // frame: `found` extra bytes after its content
    kUnknownFrame,    // value: frame type code
    kBadRoot,         // frame: root frame type
    kBadChild,        // frame: parent, child: offending child
    kText,            // invalid UTF-8
    kUnknownFormat,   // value: unknown format bits
    kNonAsciiUrl,
    kTrailingBytes,   // found: bytes after the root frame
};

struct ValidationError {
    ValidationErrorCode code = ValidationErrorCode::kNone;
    Frame frame = Frame::kMessage;
    Frame child = Frame::kMessage;
    uint64_t value = 0;
    uint64_t expected = 0;
    uint64_t found = 0;

    // Human readable diagnostic, suitable for MessageInvalid.
    std::string to_string() const;
};

// Result of a successful validation.
// body and rest point into the validated buffer.
struct Validation {
    std::vector<UserId> mentions;  // in encounter order, duplicates kept
    ByteRange body;                // bytes consumed by the root frame
    ByteRange rest;                // bytes following the root frame
};

// Validate a user-sent message body.
// Returns false and fills err on any structural violation.
// A non-empty rest is not an error here; callers decide.
bool validate_message(const uint8_t* data, size_t size,
                      Validation& out, ValidationError& err);

// Check that [data, data + size) is well-formed UTF-8.
bool is_valid_utf8(const uint8_t* data, size_t size);

// Receives the structure of a message from render().
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual void begin_paragraph() = 0;
    virtual void end_paragraph() = 0;
    virtual void text(std::string_view text) = 0;

    // format: bits being applied, current: effective cumulative formatting.
    virtual void push_format(uint16_t format, uint16_t current) = 0;

    // format: bits being removed, current: effective cumulative formatting.
    virtual void pop_format(uint16_t format, uint16_t current) = 0;

    virtual void hyperlink(std::optional<std::string_view> label,
                           std::string_view url) = 0;
    virtual void mention(UserId user) = 0;
};

// Walk a message and report its contents to renderer.
// The message is validated while walking; on failure err is filled and the
// renderer may have received a prefix of the message.
bool render_message(const uint8_t* data, size_t size, Renderer& renderer,
                    ValidationError& err);

// Renders a message as plain text: paragraphs separated by a blank line,
// mentions as @<user>, hyperlinks as "label <url>".
class PlainTextRenderer : public Renderer {
public:
    void begin_paragraph() override;
    void end_paragraph() override;
    void text(std::string_view text) override;
    void push_format(uint16_t, uint16_t) override {}
    void pop_format(uint16_t, uint16_t) override {}
    void hyperlink(std::optional<std::string_view> label,
                   std::string_view url) override;
    void mention(UserId user) override;

    const std::string& result() const { return out_; }

private:
    std::string out_;
    bool first_paragraph_ = true;
};

} // namespace parley
