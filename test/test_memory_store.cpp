#include "test_util.hpp"
#include "store/memory_store.hpp"

#include <string>
#include <vector>

using namespace parley;

static void test_persist_assigns_ids() {
    InMemoryMessageStore store;
    store.add_conversation(7, {1, 2});
    store.add_conversation(8, {3});

    EventId id = 0;
    Timestamp ts = 0;
    std::string err;
    CHECK(store.persist(7, 1, {0x00, 0x00}, id, ts, err));
    CHECK_EQ(id, 1u);
    CHECK(ts > 0);

    // Ids are unique across conversations
    CHECK(store.persist(8, 3, {0x01}, id, ts, err));
    CHECK_EQ(id, 2u);
    CHECK(store.persist(7, 2, {0x02}, id, ts, err));
    CHECK_EQ(id, 3u);

    auto events = store.events(7);
    CHECK_EQ(events.size(), 2u);
    CHECK_EQ(events[0].id, 1u);
    CHECK_EQ(events[0].user, 1u);
    CHECK_EQ(events[0].conversation, 7u);
    CHECK(events[0].body == std::vector<uint8_t>({0x00, 0x00}));
    CHECK_EQ(events[1].id, 3u);
    CHECK(store.events(99).empty());
}

static void test_unknown_conversation() {
    InMemoryMessageStore store;
    EventId id = 0;
    Timestamp ts = 0;
    std::string err;
    CHECK(!store.persist(5, 1, {}, id, ts, err));
    CHECK_STR_EQ(err, "unknown conversation 5");

    bool member = true;
    err.clear();
    CHECK(!store.is_member(5, 1, member, err));
    CHECK(!err.empty());

    std::vector<UserId> members;
    err.clear();
    CHECK(!store.members(5, members, err));
    CHECK(!err.empty());
}

static void test_membership() {
    InMemoryMessageStore store;
    store.add_conversation(7, {1, 2});
    CHECK(store.has_conversation(7));
    CHECK(!store.has_conversation(8));

    bool member = false;
    std::string err;
    CHECK(store.is_member(7, 2, member, err));
    CHECK(member);
    CHECK(store.is_member(7, 3, member, err));
    CHECK(!member);

    std::vector<UserId> members;
    CHECK(store.members(7, members, err));
    CHECK(members == std::vector<UserId>({1, 2}));

    // Redeclaring replaces the member list
    store.add_conversation(7, {3});
    CHECK(store.is_member(7, 3, member, err));
    CHECK(member);
    CHECK(store.is_member(7, 1, member, err));
    CHECK(!member);
}

int main() {
    test_persist_assigns_ids();
    test_unknown_conversation();
    test_membership();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
