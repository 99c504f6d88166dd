#include <catch2/catch.hpp>
#include <tku/dedup.hpp>

using namespace tku;

static UsageRecord make_record(const std::string& provider, const std::string& message_id,
                               const std::string& request_id, uint64_t input = 1,
                               int64_t millis = 0) {
    UsageRecord r;
    r.provider = provider;
    r.message_id = message_id;
    r.request_id = request_id;
    r.input_tokens = input;
    r.timestamp = timestamp_from_millis(millis);
    return r;
}

TEST_CASE("dedup keeps first occurrence per identity", "[dedup]") {
    std::vector<UsageRecord> records = {
        make_record("claude", "msg_1", "req_1", 10),
        make_record("claude", "msg_2", "req_2", 20),
        make_record("claude", "msg_1", "req_1", 99),
    };
    auto out = dedup(records);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].input_tokens == 10);
    REQUIRE(out[1].input_tokens == 20);
}

TEST_CASE("dedup identity includes provider and both ids", "[dedup]") {
    std::vector<UsageRecord> records = {
        make_record("claude", "m", "r"),
        make_record("codex", "m", "r"),
        make_record("claude", "m", "r2"),
        make_record("claude", "m2", "r"),
    };
    REQUIRE(dedup(records).size() == 4);
}

TEST_CASE("dedup does not confuse shifted field boundaries", "[dedup]") {
    auto a = make_record("claude", "ab", "c");
    auto b = make_record("claude", "a", "bc");
    REQUIRE(record_identity_hash(a) != record_identity_hash(b));
    REQUIRE(dedup({a, b}).size() == 2);
}

TEST_CASE("dedup collapses records with empty ids per provider", "[dedup]") {
    std::vector<UsageRecord> records = {
        make_record("amp", "", "", 5),
        make_record("amp", "", "", 6),
        make_record("opencode", "", "", 7),
    };
    auto out = dedup(records);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].input_tokens == 5);
    REQUIRE(out[1].provider == "opencode");
}

TEST_CASE("dedup is idempotent", "[dedup]") {
    std::vector<UsageRecord> records = {
        make_record("claude", "1", ""), make_record("claude", "2", ""),
        make_record("claude", "1", ""), make_record("pi", "1", ""),
    };
    auto once = dedup(records);
    auto twice = dedup(once);
    REQUIRE(once == twice);
}

TEST_CASE("sort_records orders by provider rank then time", "[dedup]") {
    std::vector<UsageRecord> records = {
        make_record("zzz", "a", "", 1, 0),
        make_record("codex", "b", "", 2, 500),
        make_record("claude", "c", "", 3, 900),
        make_record("codex", "d", "", 4, 100),
        make_record("claude", "e", "", 5, 100),
        make_record("aaa", "f", "", 6, 0),
    };
    sort_records(records, {"claude", "codex"});

    std::vector<std::string> ids;
    for (const auto& r : records) ids.push_back(r.message_id);
    // Unknown providers go last, alphabetically
    REQUIRE(ids == std::vector<std::string>{"e", "c", "d", "b", "f", "a"});
}

TEST_CASE("sort then dedup is independent of drain order", "[dedup]") {
    auto first = make_record("claude", "dup", "r", 1, 1000);
    auto later = make_record("claude", "dup", "r", 2, 2000);

    std::vector<UsageRecord> one = {later, first};
    std::vector<UsageRecord> two = {first, later};
    sort_records(one, {"claude"});
    sort_records(two, {"claude"});

    auto a = dedup(one);
    auto b = dedup(two);
    REQUIRE(a == b);
    REQUIRE(a.size() == 1);
    REQUIRE(a[0].input_tokens == 1);
}

TEST_CASE("sort_records breaks ties on the remaining fields", "[dedup]") {
    auto big = make_record("claude", "m", "r", 7, 1000);
    auto small = make_record("claude", "m", "r", 3, 1000);
    auto other_model = make_record("claude", "m", "r", 3, 1000);
    other_model.model = "z-model";

    std::vector<UsageRecord> one = {other_model, big, small};
    std::vector<UsageRecord> two = {big, small, other_model};
    sort_records(one, {"claude"});
    sort_records(two, {"claude"});
    REQUIRE(one == two);
    REQUIRE(one[0].input_tokens == 3);
    REQUIRE(one[1].input_tokens == 7);
    REQUIRE(one[2].model == "z-model");
}
