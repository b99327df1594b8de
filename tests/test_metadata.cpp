#include <catch2/catch_test_macros.hpp>
#include "memory.hpp"
#include "metadata.hpp"
#include "record_json.hpp"

using namespace engram;

// ── JSON conversion ─────────────────────────────────────────────

TEST_CASE("metadata_to_json: every value alternative", "[metadata]") {
    Metadata md;
    md["user_id"] = std::string("u1");
    md["score"] = 2.5;
    md["pinned"] = true;
    md["tags"] = std::vector<std::string>{"a", "b"};

    auto j = metadata_to_json(md);
    REQUIRE(j["user_id"] == "u1");
    REQUIRE(j["score"] == 2.5);
    REQUIRE(j["pinned"] == true);
    REQUIRE(j["tags"] == nlohmann::json::array({"a", "b"}));
}

TEST_CASE("metadata_from_json: numbers become double", "[metadata]") {
    auto md = metadata_from_json(nlohmann::json{{"count", 3}});
    REQUIRE(std::holds_alternative<double>(md["count"]));
    REQUIRE(std::get<double>(md["count"]) == 3.0);
}

TEST_CASE("metadata_from_json: unsupported values are skipped", "[metadata]") {
    auto md = metadata_from_json(nlohmann::json{
        {"nothing", nullptr},
        {"nested", {{"a", 1}}},
        {"kept", "yes"}
    });
    REQUIRE(md.size() == 1);
    REQUIRE(metadata_string(md, "kept") == std::optional<std::string>("yes"));
}

TEST_CASE("metadata_from_json: arrays keep only strings", "[metadata]") {
    auto md = metadata_from_json(nlohmann::json{{"tags", {"x", 1, "y", true}}});
    REQUIRE(metadata_list(md, "tags") == std::vector<std::string>{"x", "y"});
}

TEST_CASE("metadata_from_json: non-object yields empty map", "[metadata]") {
    REQUIRE(metadata_from_json(nlohmann::json::array({1, 2})).empty());
}

// ── Accessors ───────────────────────────────────────────────────

TEST_CASE("metadata_string: absent or wrong type is nullopt", "[metadata]") {
    Metadata md;
    md["n"] = 1.0;
    REQUIRE_FALSE(metadata_string(md, "missing").has_value());
    REQUIRE_FALSE(metadata_string(md, "n").has_value());
}

TEST_CASE("metadata_list: absent or wrong type is empty", "[metadata]") {
    Metadata md;
    md["tags"] = std::string("not-a-list");
    REQUIRE(metadata_list(md, "tags").empty());
    REQUIRE(metadata_list(md, "missing").empty());
}

// ── parse_metadata_arg ──────────────────────────────────────────

TEST_CASE("parse_metadata_arg: typed values", "[metadata]") {
    auto b = parse_metadata_arg("pinned=true");
    REQUIRE(b);
    REQUIRE(b->first == "pinned");
    REQUIRE(std::get<bool>(b->second) == true);

    auto n = parse_metadata_arg("weight=0.25");
    REQUIRE(n);
    REQUIRE(std::get<double>(n->second) == 0.25);

    auto s = parse_metadata_arg("source=chat log");
    REQUIRE(s);
    REQUIRE(std::get<std::string>(s->second) == "chat log");
}

TEST_CASE("parse_metadata_arg: value may contain '='", "[metadata]") {
    auto kv = parse_metadata_arg("expr=a=b");
    REQUIRE(kv);
    REQUIRE(kv->first == "expr");
    REQUIRE(std::get<std::string>(kv->second) == "a=b");
}

TEST_CASE("parse_metadata_arg: rejects missing key or '='", "[metadata]") {
    REQUIRE_FALSE(parse_metadata_arg("novalue").has_value());
    REQUIRE_FALSE(parse_metadata_arg("=value").has_value());
}

// ── Canonical query JSON ────────────────────────────────────────

TEST_CASE("query_to_canonical_json: tag order does not matter", "[metadata]") {
    MemoryQuery a;
    a.text = "pizza";
    a.filters.tags = {"food", "likes"};

    MemoryQuery b = a;
    b.filters.tags = {"likes", "food", "likes"};

    REQUIRE(query_to_canonical_json(a).dump() == query_to_canonical_json(b).dump());
}

TEST_CASE("query_to_canonical_json: every field participates", "[metadata]") {
    MemoryQuery base;
    base.text = "pizza";
    std::string key = query_to_canonical_json(base).dump();

    MemoryQuery q = base;
    q.top_k = 3;
    REQUIRE(query_to_canonical_json(q).dump() != key);

    q = base;
    q.similarity_threshold = 0.5;
    REQUIRE(query_to_canonical_json(q).dump() != key);

    q = base;
    q.include_embeddings = true;
    REQUIRE(query_to_canonical_json(q).dump() != key);

    q = base;
    q.filters.user_id = "u1";
    REQUIRE(query_to_canonical_json(q).dump() != key);

    q = base;
    q.filters.metadata["source"] = std::string("chat");
    REQUIRE(query_to_canonical_json(q).dump() != key);

    q = base;
    q.time_range = TimeRange{10, 20};
    REQUIRE(query_to_canonical_json(q).dump() != key);
}

// ── Record JSON ─────────────────────────────────────────────────

TEST_CASE("record_to_json: embedding omitted on request", "[metadata]") {
    MemoryRecord r;
    r.id = "abc";
    r.content = "I like pizza";
    r.embedding = {1.0f, 0.0f};
    r.scope = "pref";
    r.kind = "like";
    r.created_at = 1700000000;

    auto with = record_to_json(r);
    auto without = record_to_json(r, false);
    REQUIRE(with.contains("embedding"));
    REQUIRE_FALSE(without.contains("embedding"));
    REQUIRE_FALSE(with.contains("similarity_score"));

    auto back = record_from_json(with);
    REQUIRE(back.id == "abc");
    REQUIRE(back.embedding == r.embedding);
    REQUIRE(back.created_at == 1700000000);
    REQUIRE_FALSE(back.similarity_score.has_value());
}
