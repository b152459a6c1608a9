#pragma once

#include <cstdint>

namespace parley {

// Correlation id pairing a request envelope with its reply.
// Bit 63 records the origin so that ids issued by the client and by the
// server never collide on one connection.
class Cookie {
public:
    static constexpr uint64_t SERVER_BIT = uint64_t(1) << 63;

    Cookie() = default;
    explicit Cookie(uint64_t raw) : raw_(raw) {}

    uint64_t raw() const { return raw_; }

    // Is this a cookie for a server-sent event?
    bool is_server() const { return (raw_ & SERVER_BIT) != 0; }

    // Is this a cookie for a client-sent event?
    bool is_client() const { return (raw_ & SERVER_BIT) == 0; }

    bool operator==(const Cookie& o) const { return raw_ == o.raw_; }
    bool operator!=(const Cookie& o) const { return raw_ != o.raw_; }

private:
    uint64_t raw_ = 0;
};

enum class Origin : uint8_t {
    kClient = 0,
    kServer = 1,
};

// Issues cookies for one connection. Keeps an independent monotonic counter
// per origin; values are not reused while the generator lives.
class CookieGenerator {
public:
    explicit CookieGenerator(Origin local) : local_(local) {}

    // Next cookie for a locally originated request.
    Cookie next() { return next_for(local_); }

    // Next cookie of the given origin.
    Cookie next_for(Origin origin) {
        uint64_t& counter = counters_[static_cast<int>(origin)];
        uint64_t value = counter;
        counter = (counter + 1) & ~Cookie::SERVER_BIT;
        return Cookie(origin == Origin::kServer ? value | Cookie::SERVER_BIT
                                                : value);
    }

    Origin local() const { return local_; }

private:
    Origin local_;
    uint64_t counters_[2] = {0, 0};
};

} // namespace parley
