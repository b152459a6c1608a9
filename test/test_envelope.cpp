#include "test_util.hpp"
#include "core/config.hpp"
#include "protocol/byte_io.hpp"
#include "protocol/cookie.hpp"
#include "protocol/envelope.hpp"
#include "protocol/serializer.hpp"

#include <string>
#include <vector>

using namespace parley;

static EnvelopeError parse(const std::vector<uint8_t>& buf, Envelope& env) {
    return parse_envelope(buf.data(), buf.size(), env);
}

static void test_cookie_origin() {
    CookieGenerator server(Origin::kServer);
    Cookie a = server.next();
    Cookie b = server.next();
    CHECK(a.is_server());
    CHECK(!a.is_client());
    CHECK(a != b);
    CHECK_EQ(a.raw(), Cookie::SERVER_BIT);
    CHECK_EQ(b.raw(), Cookie::SERVER_BIT | 1);

    // Peer counter is independent of the local one
    Cookie c = server.next_for(Origin::kClient);
    CHECK(c.is_client());
    CHECK_EQ(c.raw(), 0u);
    CHECK_EQ(server.next().raw(), Cookie::SERVER_BIT | 2);

    CookieGenerator client(Origin::kClient);
    CHECK(client.next().is_client());
    CHECK(client.local() == Origin::kClient);
}

static void test_encode_layout() {
    std::vector<uint8_t> payload = {0xaa, 0xbb, 0xcc};
    auto buf = encode_envelope(Cookie(0x0102030405060708ull), Kind::kSendMessage,
                               kMustProcess | kResponseRequired, payload);

    const std::vector<uint8_t> expected = {
        0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,  // cookie LE
        0x02, 0x00,                                      // kind
        0x03, 0x00,                                      // flags
        0x03,                                            // length
        0xaa, 0xbb, 0xcc};
    CHECK(buf == expected);

    Envelope env;
    CHECK(parse(buf, env) == EnvelopeError::kNone);
    CHECK_EQ(env.cookie.raw(), 0x0102030405060708ull);
    CHECK_EQ(env.kind, 0x0002u);
    CHECK(env.has_flag(kMustProcess));
    CHECK(env.has_flag(kResponseRequired));
    CHECK(env.payload == payload);
    CHECK(encode_envelope(env) == buf);
}

static void test_empty_payload() {
    auto buf = build_envelope(Cookie(Cookie::SERVER_BIT), ConnectedBody{});
    CHECK_EQ(buf.size(), ENVELOPE_FIXED_SIZE + 1);
    Envelope env;
    CHECK(parse(buf, env) == EnvelopeError::kNone);
    CHECK(env.cookie.is_server());
    CHECK_EQ(env.kind, 0u);
    CHECK_EQ(env.flags, 0u);
    CHECK(env.payload.empty());
}

static void test_underflow() {
    Envelope env;
    std::vector<uint8_t> short_buf(ENVELOPE_FIXED_SIZE - 1, 0);
    CHECK(parse(short_buf, env) == EnvelopeError::kUnderflow);
    CHECK_EQ(close_code_for(EnvelopeError::kUnderflow), 4000u);

    // Header complete, length varint missing
    std::vector<uint8_t> no_len(ENVELOPE_FIXED_SIZE, 0);
    CHECK(parse(no_len, env) == EnvelopeError::kUnderflow);

    // Length varint cut short
    std::vector<uint8_t> cut(ENVELOPE_FIXED_SIZE, 0);
    cut.push_back(0x80);
    CHECK(parse(cut, env) == EnvelopeError::kUnderflow);
}

static void test_length_mismatch() {
    auto buf = encode_envelope(Cookie(1), Kind::kSendMessage, 0, {1, 2, 3});
    Envelope env;

    auto longer = buf;
    longer.push_back(0);
    CHECK(parse(longer, env) == EnvelopeError::kLengthMismatch);

    auto shorter = buf;
    shorter.pop_back();
    CHECK(parse(shorter, env) == EnvelopeError::kLengthMismatch);
    CHECK_EQ(close_code_for(EnvelopeError::kLengthMismatch), 4002u);
}

static void test_too_large() {
    std::vector<uint8_t> buf;
    put_u64(buf, 1);
    put_u16(buf, static_cast<uint16_t>(Kind::kSendMessage));
    put_u16(buf, 0);
    put_varint(buf, MAX_PAYLOAD_SIZE + 1);
    Envelope env;
    CHECK(parse(buf, env) == EnvelopeError::kTooLarge);
    CHECK_EQ(close_code_for(EnvelopeError::kTooLarge), 1009u);
}

static void test_bad_flags() {
    auto buf = encode_envelope(Cookie(1), Kind::kSendMessage, 0x0004, {});
    Envelope env;
    CHECK(parse(buf, env) == EnvelopeError::kBadFlags);
    CHECK_EQ(close_code_for(EnvelopeError::kBadFlags), 4004u);

    // Flags are checked before the length
    buf.push_back(0xff);
    CHECK(parse(buf, env) == EnvelopeError::kBadFlags);
}

static void test_kinds() {
    Kind k;
    CHECK(kind_from_u16(0x0002, k));
    CHECK(k == Kind::kSendMessage);
    CHECK(kind_from_u16(0x8002, k));
    CHECK(k == Kind::kMessageInvalid);
    CHECK(!kind_from_u16(0x0003, k));
    CHECK(!kind_from_u16(0x8003, k));
    CHECK(is_response_kind(0x8001));
    CHECK(!is_response_kind(0x0001));
}

static void test_new_message_body() {
    NewMessageBody body;
    body.id = 77;
    body.user = 5;
    body.timestamp = -12;
    body.message = {0x00, 0x00};

    auto buf = serialize(body);
    CHECK_EQ(buf.size(), NewMessageBody::kFixedSize + 2);
    CHECK_EQ(buf[0], 77u);
    CHECK_EQ(buf[8], 5u);
    CHECK_EQ(buf[16], 0xf4u);

    NewMessageBody out;
    CHECK(deserialize(buf, out));
    CHECK_EQ(out.id, 77u);
    CHECK_EQ(out.user, 5u);
    CHECK(out.timestamp == -12);
    CHECK(out.message == body.message);

    buf.resize(NewMessageBody::kFixedSize - 1);
    CHECK(!deserialize(buf, out));
}

static void test_message_received_body() {
    MessageReceivedBody body;
    body.id = 0x1122334455667788ull;
    auto buf = serialize(body);
    CHECK_EQ(buf.size(), 8u);

    MessageReceivedBody out;
    CHECK(deserialize(buf, out));
    CHECK_EQ(out.id, body.id);

    buf.push_back(0);
    CHECK(!deserialize(buf, out));
    buf.resize(4);
    CHECK(!deserialize(buf, out));
}

static void test_message_invalid_body() {
    MessageInvalidBody body;
    body.message = std::string("bad frame");
    auto buf = serialize(body);

    MessageInvalidBody out;
    CHECK(deserialize(buf, out));
    CHECK(out.message.has_value());
    CHECK_STR_EQ(*out.message, "bad frame");

    MessageInvalidBody none;
    CHECK(serialize(none).empty());
    CHECK(deserialize(std::vector<uint8_t>{}, out));
    CHECK(!out.message.has_value());

    CHECK(!deserialize(std::vector<uint8_t>{0xff}, out));
}

static void test_default_flags() {
    SendMessageBody send;
    send.message = {0x00, 0x00};
    auto buf = build_envelope(Cookie(3), send);
    Envelope env;
    CHECK(parse(buf, env) == EnvelopeError::kNone);
    CHECK_EQ(env.flags, kMustProcess | kResponseRequired);

    SendMessageBody decoded;
    CHECK(deserialize(env.payload, decoded));
    CHECK(decoded.message == send.message);

    buf = build_envelope(Cookie(Cookie::SERVER_BIT | 4), NewMessageBody{});
    CHECK(parse(buf, env) == EnvelopeError::kNone);
    CHECK_EQ(env.flags, kMustProcess);
    CHECK_EQ(env.kind, 0x0001u);

    buf = build_envelope(Cookie(9), UnknownEventBody{});
    CHECK(parse(buf, env) == EnvelopeError::kNone);
    CHECK_EQ(env.kind, 0x8000u);
    CHECK_EQ(env.flags, 0u);
}

int main() {
    test_cookie_origin();
    test_encode_layout();
    test_empty_payload();
    test_underflow();
    test_length_mismatch();
    test_too_large();
    test_bad_flags();
    test_kinds();
    test_new_message_body();
    test_message_received_body();
    test_message_invalid_body();
    test_default_flags();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
