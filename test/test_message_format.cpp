#include "test_util.hpp"
#include "message_fixture.hpp"
#include "protocol/message_format.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace parley;
using namespace msgfix;

static bool validate(const Bytes& b, Validation& v, ValidationError& err) {
    return validate_message(b.data(), b.size(), v, err);
}

static void test_simple_message() {
    Bytes msg = simple_message("hi");
    Validation v;
    ValidationError err;
    CHECK(validate(msg, v, err));
    CHECK(v.mentions.empty());
    CHECK_EQ(v.body.size, msg.size());
    CHECK(v.body.data == msg.data());
    CHECK(v.rest.empty());
}

static void test_rich_message() {
    Bytes msg = message({
        paragraph({text("Hello "), push_format(kFormatStrong), text("world"),
                   pop_format(kFormatStrong)}),
        paragraph({hyperlink("docs", "https://example.org/"), hyperlink("", "http://a.b"),
                   mention(42)}),
        paragraph({}),
    });
    Validation v;
    ValidationError err;
    CHECK(validate(msg, v, err));
    CHECK_EQ(v.mentions.size(), 1u);
    CHECK_EQ(v.mentions[0], 42u);
}

static void test_empty_message() {
    Bytes msg = message({});
    Validation v;
    ValidationError err;
    CHECK(validate(msg, v, err));
    CHECK_EQ(v.body.size, 2u);
}

static void test_text_under_message() {
    Bytes msg = frame(Frame::kMessage, text("hi"));
    Validation v;
    ValidationError err;
    CHECK(!validate(msg, v, err));
    CHECK(err.code == ValidationErrorCode::kBadChild);
    CHECK(err.frame == Frame::kMessage);
    CHECK(err.child == Frame::kText);
    CHECK_STR_EQ(err.to_string(), "frame Message cannot contain frame Text");
}

static void test_bad_root() {
    const Frame roots[] = {Frame::kParagraph, Frame::kText, Frame::kPushFormat,
                           Frame::kPopFormat, Frame::kHyperlink, Frame::kMention};
    for (Frame f : roots) {
        Bytes msg = frame(f, {});
        Validation v;
        ValidationError err;
        CHECK(!validate(msg, v, err));
        CHECK(err.code == ValidationErrorCode::kBadRoot);
        CHECK(err.frame == f);
    }
}

static void test_nested_paragraph() {
    Bytes msg = message({paragraph({paragraph({})})});
    Validation v;
    ValidationError err;
    CHECK(!validate(msg, v, err));
    CHECK(err.code == ValidationErrorCode::kBadChild);
    CHECK(err.frame == Frame::kParagraph);
    CHECK(err.child == Frame::kParagraph);
}

static void test_duplicate_mentions() {
    Bytes msg = message({paragraph({mention(5), text(" and "), mention(5)})});
    Validation v;
    ValidationError err;
    CHECK(validate(msg, v, err));
    CHECK_EQ(v.mentions.size(), 2u);
    CHECK_EQ(v.mentions[0], 5u);
    CHECK_EQ(v.mentions[1], 5u);
}

static void test_mentions_in_order() {
    Bytes msg = message({paragraph({mention(3)}), paragraph({mention(1), mention(2)})});
    Validation v;
    ValidationError err;
    CHECK(validate(msg, v, err));
    CHECK(v.mentions == std::vector<UserId>({3, 1, 2}));
}

static void test_frame_overflow() {
    // Message declares 10 bytes, only 2 follow
    Bytes msg = {0x00, 0x0a, 0x01, 0x00};
    Validation v;
    ValidationError err;
    CHECK(!validate(msg, v, err));
    CHECK(err.code == ValidationErrorCode::kFrameOverflow);
    CHECK(err.frame == Frame::kMessage);
    CHECK_EQ(err.expected, 10u);
    CHECK_EQ(err.found, 2u);
}

static void test_truncated_header() {
    Validation v;
    ValidationError err;

    Bytes empty;
    CHECK(!validate(empty, v, err));
    CHECK(err.code == ValidationErrorCode::kTruncated);

    Bytes only_type = {0x00};
    CHECK(!validate(only_type, v, err));
    CHECK(err.code == ValidationErrorCode::kTruncated);
}

static void test_unknown_frame() {
    Bytes msg = message({frame(Frame::kParagraph, raw_frame(9, {}))});
    Validation v;
    ValidationError err;
    CHECK(!validate(msg, v, err));
    CHECK(err.code == ValidationErrorCode::kUnknownFrame);
    CHECK_EQ(err.value, 9u);
}

static void test_varint_overflow() {
    Bytes msg = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f, 0x00};
    Validation v;
    ValidationError err;
    CHECK(!validate(msg, v, err));
    CHECK(err.code == ValidationErrorCode::kVarintOverflow);
}

static void test_invalid_utf8() {
    Bytes bad_text = frame(Frame::kText, Bytes{0xc3, 0x28});
    Bytes msg = message({paragraph({bad_text})});
    Validation v;
    ValidationError err;
    CHECK(!validate(msg, v, err));
    CHECK(err.code == ValidationErrorCode::kText);

    // Invalid label
    Bytes label = {0x02, 0xed, 0xa0};
    Bytes link = frame(Frame::kHyperlink, cat({label, Bytes{'x'}}));
    msg = message({paragraph({link})});
    CHECK(!validate(msg, v, err));
    CHECK(err.code == ValidationErrorCode::kText);
}

static void test_utf8_edge_cases() {
    const std::string ok = "h\xc3\xa9llo \xe2\x82\xac \xf0\x9f\x98\x80";
    CHECK(is_valid_utf8(reinterpret_cast<const uint8_t*>(ok.data()), ok.size()));

    const uint8_t overlong[] = {0xc0, 0xaf};
    CHECK(!is_valid_utf8(overlong, sizeof(overlong)));
    const uint8_t surrogate[] = {0xed, 0xa0, 0x80};
    CHECK(!is_valid_utf8(surrogate, sizeof(surrogate)));
    const uint8_t too_big[] = {0xf4, 0x90, 0x80, 0x80};
    CHECK(!is_valid_utf8(too_big, sizeof(too_big)));
    const uint8_t cut[] = {0xe2, 0x82};
    CHECK(!is_valid_utf8(cut, sizeof(cut)));
}

static void test_format_errors() {
    Validation v;
    ValidationError err;

    Bytes unknown = message({paragraph({push_format(0x0004)})});
    CHECK(!validate(unknown, v, err));
    CHECK(err.code == ValidationErrorCode::kUnknownFormat);
    CHECK_EQ(err.value, 4u);

    Bytes short_pop = message({paragraph({frame(Frame::kPopFormat, Bytes{0x01})})});
    CHECK(!validate(short_pop, v, err));
    CHECK(err.code == ValidationErrorCode::kFrameLength);
    CHECK(err.frame == Frame::kPopFormat);
    CHECK_EQ(err.expected, 2u);
    CHECK_EQ(err.found, 1u);
}

static void test_hyperlink_errors() {
    Validation v;
    ValidationError err;

    Bytes non_ascii = message({paragraph({hyperlink("x", "http://\xc3\xa9.org")})});
    CHECK(!validate(non_ascii, v, err));
    CHECK(err.code == ValidationErrorCode::kNonAsciiUrl);

    // Label length past the end of the hyperlink body
    Bytes overflow = message({paragraph({frame(Frame::kHyperlink, Bytes{0x05, 'a'})})});
    CHECK(!validate(overflow, v, err));
    CHECK(err.code == ValidationErrorCode::kFrameOverflow);
    CHECK(err.frame == Frame::kHyperlink);
}

static void test_mention_errors() {
    Validation v;
    ValidationError err;

    Bytes extra = message({paragraph({frame(Frame::kMention, Bytes{0x05, 0x00})})});
    CHECK(!validate(extra, v, err));
    CHECK(err.code == ValidationErrorCode::kFrameTooLong);
    CHECK(err.frame == Frame::kMention);
    CHECK_EQ(err.found, 1u);

    Bytes empty = message({paragraph({frame(Frame::kMention, {})})});
    CHECK(!validate(empty, v, err));
    CHECK(err.code == ValidationErrorCode::kTruncated);
}

static void test_rest_reported() {
    Bytes first = simple_message("a");
    Bytes buf = cat({first, Bytes{0xde, 0xad}});
    Validation v;
    ValidationError err;
    CHECK(validate(buf, v, err));
    CHECK_EQ(v.body.size, first.size());
    CHECK_EQ(v.rest.size, 2u);
    CHECK_EQ(v.rest.data[0], 0xdeu);
}

static void test_plain_text_renderer() {
    Bytes msg = message({
        paragraph({text("Hi "), mention(7), text(", see "),
                   push_format(kFormatEmphasis), hyperlink("docs", "https://x.org"),
                   pop_format(kFormatEmphasis)}),
        paragraph({hyperlink("", "https://y.org")}),
    });
    PlainTextRenderer r;
    ValidationError err;
    CHECK(render_message(msg.data(), msg.size(), r, err));
    CHECK_STR_EQ(r.result(), "Hi @7, see docs <https://x.org>\n\n<https://y.org>");
}

// Records format transitions.
class FormatRecorder : public Renderer {
public:
    std::vector<std::pair<uint16_t, uint16_t>> pushes;
    std::vector<std::pair<uint16_t, uint16_t>> pops;
    int paragraphs = 0;

    void begin_paragraph() override { paragraphs++; }
    void end_paragraph() override {}
    void text(std::string_view) override {}
    void push_format(uint16_t f, uint16_t cur) override { pushes.push_back({f, cur}); }
    void pop_format(uint16_t f, uint16_t cur) override { pops.push_back({f, cur}); }
    void hyperlink(std::optional<std::string_view>, std::string_view) override {}
    void mention(UserId) override {}
};

static void test_render_formats() {
    Bytes msg = message({paragraph({
        push_format(kFormatEmphasis),
        push_format(kFormatEmphasis | kFormatStrong),  // only Strong is new
        pop_format(kFormatEmphasis),
        pop_format(kFormatEmphasis),                   // already off: no event
    })});
    FormatRecorder r;
    ValidationError err;
    CHECK(render_message(msg.data(), msg.size(), r, err));
    CHECK_EQ(r.paragraphs, 1);
    CHECK_EQ(r.pushes.size(), 2u);
    CHECK_EQ(r.pushes[0].first, kFormatEmphasis);
    CHECK_EQ(r.pushes[1].first, kFormatStrong);
    CHECK_EQ(r.pushes[1].second, kFormatEmphasis | kFormatStrong);
    CHECK_EQ(r.pops.size(), 1u);
    CHECK_EQ(r.pops[0].second, kFormatStrong);
}

static void test_render_rejects_invalid() {
    Bytes msg = frame(Frame::kParagraph, {});
    PlainTextRenderer r;
    ValidationError err;
    CHECK(!render_message(msg.data(), msg.size(), r, err));
    CHECK(err.code == ValidationErrorCode::kBadRoot);
}

static void test_error_strings() {
    ValidationError err;
    err.code = ValidationErrorCode::kFrameOverflow;
    err.frame = Frame::kText;
    err.expected = 9;
    err.found = 3;
    CHECK_STR_EQ(err.to_string(),
                 "frame Text declares length 9 greater than message length 3");

    err = {};
    err.code = ValidationErrorCode::kTrailingBytes;
    err.found = 4;
    CHECK_STR_EQ(err.to_string(), "message is followed by 4 extra bytes");
}

int main() {
    test_simple_message();
    test_rich_message();
    test_empty_message();
    test_text_under_message();
    test_bad_root();
    test_nested_paragraph();
    test_duplicate_mentions();
    test_mentions_in_order();
    test_frame_overflow();
    test_truncated_header();
    test_unknown_frame();
    test_varint_overflow();
    test_invalid_utf8();
    test_utf8_edge_cases();
    test_format_errors();
    test_hyperlink_errors();
    test_mention_errors();
    test_rest_reported();
    test_plain_text_renderer();
    test_render_formats();
    test_render_rejects_invalid();
    test_error_strings();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
