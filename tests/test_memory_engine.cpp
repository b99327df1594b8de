#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "memory_engine.hpp"
#include "caches/local_query_cache.hpp"
#include "errors.hpp"
#include "indexes/flat_vector_index.hpp"
#include "mock_embedder.hpp"
#include "mock_vector_index.hpp"
#include "stores/json_record_store.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <set>
#include <thread>
#include <unistd.h>

using namespace engram;
using Catch::Matchers::WithinAbs;

static constexpr uint64_t kNow = 1700000000;
static constexpr uint64_t kDay = 86400;

struct EngineFixture {
    std::string path = "/tmp/engram_test_engine_" + std::to_string(getpid()) + ".json";
    Config config;
    KeywordEmbedder embedder;
    std::unique_ptr<JsonRecordStore> store;
    FlatVectorIndex index;
    LocalQueryCache cache{"", 100};
    EngineMetrics metrics;
    uint64_t now = kNow;

    EngineFixture() {
        std::filesystem::remove(path);
        store = std::make_unique<JsonRecordStore>(path);
        config.surprise.threshold = 0.95;
    }

    ~EngineFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + ".tmp");
    }

    std::unique_ptr<MemoryEngine> engine(VectorIndex* idx, QueryCache* c = nullptr) {
        auto e = std::make_unique<MemoryEngine>(config, embedder, *store, idx, c, &metrics);
        e->set_clock([this] { return now; });
        return e;
    }

    std::unique_ptr<MemoryEngine> engine() { return engine(&index, &cache); }
};

static MemoryQuery make_query(const std::string& text, int32_t top_k = 10) {
    MemoryQuery q;
    q.text = text;
    q.top_k = top_k;
    return q;
}

static std::set<std::string> ids_of(const std::vector<MemoryRecord>& records) {
    std::set<std::string> ids;
    for (const auto& r : records) ids.insert(r.id);
    return ids;
}

// ── Collection naming ────────────────────────────────────────

TEST_CASE("MemoryEngine: collection name per tenant", "[engine]") {
    REQUIRE(MemoryEngine::collection_name("acme") == "tenant_acme_memories");
    REQUIRE(MemoryEngine::collection_name("acme-corp-eu") == "tenant_acme_corp_eu_memories");
}

TEST_CASE("MemoryEngine: tenant ids outside [A-Za-z0-9-] are rejected", "[engine]") {
    REQUIRE(MemoryEngine::collection_name("Acme-42") == "tenant_Acme_42_memories");
    REQUIRE_THROWS_AS(MemoryEngine::collection_name(""), InvalidTenantError);
    REQUIRE_THROWS_AS(MemoryEngine::collection_name("a_b"), InvalidTenantError);
    REQUIRE_THROWS_AS(MemoryEngine::collection_name("a:b"), InvalidTenantError);
    REQUIRE_THROWS_AS(MemoryEngine::collection_name("a b"), InvalidTenantError);
    REQUIRE_THROWS_AS(MemoryEngine::collection_name(std::string(129, 'a')), InvalidTenantError);
    REQUIRE(MemoryEngine::collection_name(std::string(128, 'a')).size() == 128 + 16);
}

TEST_CASE("MemoryEngine: cache keys are tenant scoped", "[engine]") {
    auto q = make_query("pizza");
    std::string key = MemoryEngine::query_cache_key("acme", q);
    REQUIRE(key.rfind("memory_query:acme:", 0) == 0);
    REQUIRE(key.size() == std::string("memory_query:acme:").size() + 64);
    REQUIRE(MemoryEngine::record_cache_key("acme", "abc") == "memory:acme:abc");
}

// ── Store ────────────────────────────────────────────────────

TEST_CASE("MemoryEngine: store persists record with mirrored scope and kind", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();

    Metadata md;
    md[meta::kUserId] = std::string("alice");
    auto id = engine->store("acme", "I like pizza", "pref", "like", md);
    REQUIRE(id.has_value());
    REQUIRE(id->size() == 32);

    auto coll = MemoryEngine::collection_name("acme");
    auto records = f.store->fetch_by_ids(coll, {*id}, true);
    REQUIRE(records.size() == 1);
    const auto& r = records[0];
    REQUIRE(r.content == "I like pizza");
    REQUIRE(r.created_at == kNow);
    REQUIRE(r.embedding.size() == KeywordEmbedder::kDims);
    REQUIRE(metadata_string(r.metadata, meta::kScope) == std::optional<std::string>("pref"));
    REQUIRE(metadata_string(r.metadata, meta::kKind) == std::optional<std::string>("like"));
    REQUIRE(metadata_string(r.metadata, meta::kUserId) == std::optional<std::string>("alice"));
    REQUIRE(f.index.size(coll) == 1);

    auto s = f.metrics.snapshot();
    REQUIRE(s.memories_stored == 1);
    REQUIRE(s.embeddings_generated == 1);
}

TEST_CASE("MemoryEngine: identical content is stored once", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();

    auto first = engine->store("acme", "I like pizza", "pref", "like");
    auto second = engine->store("acme", "I like pizza", "pref", "like");

    REQUIRE(first.has_value());
    REQUIRE_FALSE(second.has_value());
    REQUIRE(f.store->count(MemoryEngine::collection_name("acme")) == 1);

    auto s = f.metrics.snapshot();
    REQUIRE(s.memories_stored == 1);
    REQUIRE(s.memories_deduplicated == 1);
    REQUIRE(s.embeddings_generated == 2);
}

TEST_CASE("MemoryEngine: same content in another scope is novel", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    REQUIRE(engine->store("acme", "I like pizza", "pref", "like").has_value());
    REQUIRE(engine->store("acme", "I like pizza", "history", "order").has_value());
}

TEST_CASE("MemoryEngine: surprise filter disabled stores duplicates", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();
    REQUIRE(engine->store("acme", "pizza", "pref", "like").has_value());
    REQUIRE(engine->store("acme", "pizza", "pref", "like").has_value());
}

TEST_CASE("MemoryEngine: embedder failure propagates from store", "[engine]") {
    EngineFixture f;
    f.embedder.fail = true;
    auto engine = f.engine();
    REQUIRE_THROWS_AS(engine->store("acme", "pizza", "pref", "like"), EmbeddingError);
    REQUIRE(f.store->count(MemoryEngine::collection_name("acme")) == 0);
}

TEST_CASE("MemoryEngine: malformed embeddings are rejected", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();

    SECTION("empty vector") {
        f.embedder.override_vector = Embedding{};
        REQUIRE_THROWS_AS(engine->store("acme", "x", "s", "k"), EmbeddingError);
    }
    SECTION("non-finite values") {
        Embedding v(KeywordEmbedder::kDims, 0.5f);
        v[3] = std::numeric_limits<float>::quiet_NaN();
        f.embedder.override_vector = v;
        REQUIRE_THROWS_AS(engine->store("acme", "x", "s", "k"), EmbeddingError);
    }
    SECTION("all-zero vector") {
        f.embedder.override_vector = Embedding(KeywordEmbedder::kDims, 0.0f);
        REQUIRE_THROWS_AS(engine->store("acme", "x", "s", "k"), EmbeddingError);
        REQUIRE_THROWS_AS(engine->query("acme", make_query("x")), EmbeddingError);
    }
    SECTION("length differs from declared dimensionality") {
        f.embedder.declared_dims = 4;
        REQUIRE_THROWS_AS(engine->store("acme", "x", "s", "k"), EmbeddingError);
    }
}

TEST_CASE("MemoryEngine: embedding length is fixed per tenant", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();
    REQUIRE(engine->store("acme", "pizza", "s", "k").has_value());

    f.embedder.override_vector = Embedding{1.0f, 0.0f, 0.0f, 0.0f};
    f.embedder.declared_dims = 4;
    REQUIRE_THROWS_AS(engine->store("acme", "other", "s", "k"), EmbeddingError);

    // A fresh tenant learns its own dimensionality.
    REQUIRE(engine->store("globex", "other", "s", "k").has_value());
}

TEST_CASE("MemoryEngine: tenant dimensionality is learned from stored records", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    f.engine()->store("acme", "pizza", "s", "k");

    // New engine over the same store, embedder now producing 4 dims.
    f.embedder.override_vector = Embedding{1.0f, 0.0f, 0.0f, 0.0f};
    f.embedder.declared_dims = 4;
    auto engine = f.engine();
    REQUIRE_THROWS_AS(engine->store("acme", "x", "s", "k"), EmbeddingError);
    REQUIRE_THROWS_AS(engine->query("acme", make_query("x")), EmbeddingError);
}

TEST_CASE("MemoryEngine: store failure propagates before indexing", "[engine]") {
    EngineFixture f;
    JsonRecordStore broken("/proc/engram_no_such_dir/memory.json");
    ScriptedVectorIndex index;
    MemoryEngine engine(f.config, f.embedder, broken, &index);

    REQUIRE_THROWS_AS(engine.store("acme", "pizza", "s", "k"), StoreError);
    REQUIRE(index.inserted.empty());
}

// ── Query ────────────────────────────────────────────────────

TEST_CASE("MemoryEngine: store, reject duplicate, then retrieve once", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();

    auto a = engine->store("acme", "I like pizza", "pref", "like");
    REQUIRE(a.has_value());
    REQUIRE_FALSE(engine->store("acme", "I like pizza", "pref", "like").has_value());

    auto results = engine->query("acme", make_query("pizza", 5));
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == *a);
    REQUIRE(results[0].content == "I like pizza");
    REQUIRE(results[0].similarity_score.has_value());
    REQUIRE_THAT(*results[0].similarity_score, WithinAbs(1.0, 1e-6));
}

TEST_CASE("MemoryEngine: query returns empty list when nothing matches", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    engine->store("acme", "I like pizza", "pref", "like");

    REQUIRE(engine->query("acme", make_query("coffee")).empty());
    REQUIRE(engine->query("empty-tenant", make_query("pizza")).empty());
}

TEST_CASE("MemoryEngine: tenants are isolated", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    engine->store("acme", "I like pizza", "pref", "like");
    engine->store("globex", "I like pizza", "pref", "like");

    auto acme = engine->query("acme", make_query("pizza"));
    auto globex = engine->query("globex", make_query("pizza"));
    REQUIRE(acme.size() == 1);
    REQUIRE(globex.size() == 1);
    REQUIRE(acme[0].id != globex[0].id);
}

TEST_CASE("MemoryEngine: tenants differing by '-' and '_' never share records", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    auto id = engine->store("a-b", "I like pizza", "pref", "like");
    REQUIRE(id.has_value());

    REQUIRE_THROWS_AS(engine->store("a_b", "I like sushi", "pref", "like"), InvalidTenantError);
    REQUIRE_THROWS_AS(engine->query("a_b", make_query("pizza")), InvalidTenantError);
    REQUIRE_THROWS_AS(engine->get("a_b", *id), InvalidTenantError);
    REQUIRE_THROWS_AS(engine->forget("a_b", *id), InvalidTenantError);
    REQUIRE_THROWS_AS(engine->stats("a_b"), InvalidTenantError);

    REQUIRE(engine->query("a-b", make_query("pizza")).size() == 1);
    REQUIRE(engine->get("a-b", *id).has_value());
    REQUIRE(f.embedder.embed_count.load() == 2);
}

TEST_CASE("MemoryEngine: invalid queries are rejected", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();

    auto q = make_query("pizza", 0);
    REQUIRE_THROWS_AS(engine->query("acme", q), InvalidQueryError);

    q = make_query("pizza", -3);
    REQUIRE_THROWS_AS(engine->query("acme", q), InvalidQueryError);

    q = make_query("pizza");
    q.similarity_threshold = 1.5;
    REQUIRE_THROWS_AS(engine->query("acme", q), InvalidQueryError);

    q.similarity_threshold = -1.5;
    REQUIRE_THROWS_AS(engine->query("acme", q), InvalidQueryError);

    REQUIRE(f.embedder.embed_count.load() == 0);
}

TEST_CASE("MemoryEngine: distance mode accepts thresholds up to 2", "[engine]") {
    EngineFixture f;
    f.config.metric_mode = MetricMode::Distance;
    FlatVectorIndex index(MetricMode::Distance);
    auto engine = f.engine(&index);

    auto q = make_query("pizza");
    q.similarity_threshold = -0.1;
    REQUIRE_THROWS_AS(engine->query("acme", q), InvalidQueryError);

    q.similarity_threshold = 1.5;
    REQUIRE_NOTHROW(engine->query("acme", q));
}

TEST_CASE("MemoryEngine: distance mode retrieves close records", "[engine]") {
    EngineFixture f;
    f.config.metric_mode = MetricMode::Distance;
    f.config.surprise.threshold = 0.05;
    FlatVectorIndex index(MetricMode::Distance);
    auto engine = f.engine(&index);

    auto a = engine->store("acme", "I like pizza", "pref", "like");
    engine->store("acme", "I drink coffee", "pref", "like");
    REQUIRE_FALSE(engine->store("acme", "pizza again", "pref", "like").has_value());

    auto q = make_query("pizza");
    q.similarity_threshold = 0.3;
    auto results = engine->query("acme", q);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == *a);
    // Combined scores are always "higher = better".
    REQUIRE(*results[0].similarity_score > 0.99);
}

TEST_CASE("MemoryEngine: score equal to threshold is included", "[engine]") {
    EngineFixture f;
    ScriptedVectorIndex index(MetricMode::Similarity);
    auto engine = f.engine(&index);
    auto id = engine->store("acme", "I like pizza", "pref", "like");
    REQUIRE(id.has_value());

    auto q = make_query("pizza");
    q.similarity_threshold = 0.7;

    index.hits = {{*id, 0.7}};
    auto results = engine->query("acme", q);
    REQUIRE(results.size() == 1);
    REQUIRE_THAT(*results[0].similarity_score, WithinAbs(0.7, 1e-12));

    index.hits = {{*id, 0.69}};
    REQUIRE(engine->query("acme", q).empty());
}

TEST_CASE("MemoryEngine: distance threshold boundary is included", "[engine]") {
    EngineFixture f;
    f.config.metric_mode = MetricMode::Distance;
    ScriptedVectorIndex index(MetricMode::Distance);
    auto engine = f.engine(&index);
    auto id = engine->store("acme", "I like pizza", "pref", "like");
    REQUIRE(id.has_value());

    auto q = make_query("pizza");
    q.similarity_threshold = 0.3;

    index.hits = {{*id, 0.3}};
    REQUIRE(engine->query("acme", q).size() == 1);

    index.hits = {{*id, 0.31}};
    REQUIRE(engine->query("acme", q).empty());
}

TEST_CASE("MemoryEngine: index is asked for twice top_k", "[engine]") {
    EngineFixture f;
    ScriptedVectorIndex index;
    auto engine = f.engine(&index);
    engine->query("acme", make_query("pizza", 4));
    REQUIRE(index.last_top_k == 8);
}

TEST_CASE("MemoryEngine: ids the store no longer has are dropped", "[engine]") {
    EngineFixture f;
    ScriptedVectorIndex index;
    auto engine = f.engine(&index);
    auto id = engine->store("acme", "I like pizza", "pref", "like");

    index.hits = {{"ghost", 0.99}, {*id, 0.9}};
    auto results = engine->query("acme", make_query("pizza"));
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == *id);
}

TEST_CASE("MemoryEngine: top_k caps the result", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();
    for (int i = 0; i < 10; i++) {
        engine->store("acme", "pizza night " + std::to_string(i), "pref", "like");
    }

    REQUIRE(engine->query("acme", make_query("pizza", 3)).size() == 3);
    REQUIRE(engine->query("acme", make_query("pizza", 1)).size() == 1);
    REQUIRE(engine->query("acme", make_query("pizza", 50)).size() == 10);
}

TEST_CASE("MemoryEngine: newer record ranks first on equal similarity", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();

    f.now = kNow - 30 * kDay;
    auto old_id = engine->store("acme", "I like pizza", "pref", "like");
    f.now = kNow;
    auto fresh_id = engine->store("acme", "I like pizza", "pref", "like");

    auto results = engine->query("acme", make_query("pizza"));
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == *fresh_id);
    REQUIRE(results[1].id == *old_id);
    REQUIRE(*results[0].similarity_score > *results[1].similarity_score);
    REQUIRE_THAT(*results[1].similarity_score,
                 WithinAbs(*results[0].similarity_score * std::exp(-1.5), 1e-6));
}

TEST_CASE("MemoryEngine: every required tag must be present", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;

    auto run = [&f](VectorIndex* index) {
        auto engine = f.engine(index);
        Metadata both;
        both[meta::kTags] = std::vector<std::string>{"food", "likes"};
        Metadata one;
        one[meta::kTags] = std::vector<std::string>{"food"};

        auto full = engine->store("acme", "pizza with friends", "pref", "like", both);
        engine->store("acme", "pizza alone", "pref", "like", one);
        engine->store("acme", "pizza untagged", "pref", "like");

        auto q = make_query("pizza");
        q.filters.tags = {"likes", "food"};
        auto results = engine->query("acme", q);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].id == *full);
    };

    SECTION("through the index") { run(&f.index); }
    SECTION("through the fallback scan") { run(nullptr); }
}

TEST_CASE("MemoryEngine: metadata, user and scope filters", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();

    Metadata alice;
    alice[meta::kUserId] = std::string("alice");
    alice[meta::kSessionId] = std::string("s1");
    alice["source"] = std::string("chat");
    Metadata bob;
    bob[meta::kUserId] = std::string("bob");

    auto a = engine->store("acme", "pizza for alice", "pref", "like", alice);
    auto b = engine->store("acme", "pizza for bob", "pref", "like", bob);
    auto c = engine->store("acme", "pizza order", "history", "order", alice);

    auto q = make_query("pizza");
    q.filters.user_id = "alice";
    REQUIRE(ids_of(engine->query("acme", q)) == std::set<std::string>{*a, *c});

    q.filters.scope = "pref";
    REQUIRE(ids_of(engine->query("acme", q)) == std::set<std::string>{*a});

    q = make_query("pizza");
    q.filters.metadata["source"] = std::string("chat");
    q.filters.kind = "like";
    REQUIRE(ids_of(engine->query("acme", q)) == std::set<std::string>{*a});

    q = make_query("pizza");
    q.filters.session_id = "s2";
    REQUIRE(engine->query("acme", q).empty());

    q = make_query("pizza");
    q.filters.user_id = "bob";
    REQUIRE(ids_of(engine->query("acme", q)) == std::set<std::string>{*b});
}

TEST_CASE("MemoryEngine: time range filter is inclusive", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();

    f.now = kNow - 10 * kDay;
    auto old_id = engine->store("acme", "pizza then", "pref", "like");
    f.now = kNow;
    auto new_id = engine->store("acme", "pizza now", "pref", "like");

    auto q = make_query("pizza");
    q.time_range = TimeRange{kNow - 10 * kDay, kNow - 10 * kDay};
    REQUIRE(ids_of(engine->query("acme", q)) == std::set<std::string>{*old_id});

    q.time_range = TimeRange{kNow - kDay, kNow};
    REQUIRE(ids_of(engine->query("acme", q)) == std::set<std::string>{*new_id});
}

TEST_CASE("MemoryEngine: embeddings are returned only on request", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    engine->store("acme", "I like pizza", "pref", "like");

    auto q = make_query("pizza");
    auto results = engine->query("acme", q);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].embedding.empty());

    q.include_embeddings = true;
    results = engine->query("acme", q);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].embedding.size() == KeywordEmbedder::kDims);
}

// ── Degraded paths ───────────────────────────────────────────

TEST_CASE("MemoryEngine: fallback scan matches the index on the recent window", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto indexed = f.engine(&f.index);

    indexed->store("acme", "I like pizza", "pref", "like");
    indexed->store("acme", "pizza and sushi", "pref", "like");
    indexed->store("acme", "coffee in the morning", "pref", "like");
    indexed->store("acme", "pizza with coffee", "history", "order");
    indexed->store("acme", "hiking trip", "fact", "event");

    auto q = make_query("pizza", 10);
    q.similarity_threshold = 0.5;
    auto via_index = indexed->query("acme", q);

    auto scanning = f.engine(nullptr);
    auto via_scan = scanning->query("acme", q);

    REQUIRE_FALSE(via_index.empty());
    REQUIRE(ids_of(via_index) == ids_of(via_scan));
    REQUIRE(f.metrics.snapshot().fallback_searches == 1);
}

TEST_CASE("MemoryEngine: failing index degrades to fallback", "[engine]") {
    EngineFixture f;
    FailingVectorIndex failing;
    auto engine = f.engine(&failing);

    auto id = engine->store("acme", "I like pizza", "pref", "like");
    REQUIRE(id.has_value());

    auto results = engine->query("acme", make_query("pizza"));
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == *id);

    auto s = f.metrics.snapshot();
    REQUIRE(s.fallback_searches == 1);
    // Index insert and search; the surprise lookup failure is not counted.
    REQUIRE(s.index_errors == 2);
    REQUIRE(engine->forget("acme", *id));
}

TEST_CASE("MemoryEngine: failing index with fail-closed surprise rejects stores", "[engine]") {
    EngineFixture f;
    f.config.surprise.fail_open = false;
    FailingVectorIndex failing;
    auto engine = f.engine(&failing);
    REQUIRE_FALSE(engine->store("acme", "I like pizza", "pref", "like").has_value());
}

TEST_CASE("MemoryEngine: runs without index or cache", "[engine]") {
    EngineFixture f;
    auto engine = f.engine(nullptr, nullptr);
    auto id = engine->store("acme", "I like pizza", "pref", "like");
    REQUIRE(id.has_value());
    REQUIRE(engine->query("acme", make_query("pizza")).size() == 1);
    REQUIRE(engine->get("acme", *id).has_value());
    REQUIRE(engine->forget("acme", *id));
}

// ── Cache ────────────────────────────────────────────────────

TEST_CASE("MemoryEngine: repeated query is served from cache", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    engine->store("acme", "I like pizza", "pref", "like");

    auto first = engine->query("acme", make_query("pizza"));
    int embeds = f.embedder.embed_count.load();
    auto second = engine->query("acme", make_query("pizza"));

    REQUIRE(f.embedder.embed_count.load() == embeds);
    REQUIRE(ids_of(first) == ids_of(second));
    REQUIRE(second[0].similarity_score.has_value());
    REQUIRE(f.metrics.snapshot().queries_cached == 1);
    REQUIRE(f.metrics.snapshot().queries_total == 2);
}

TEST_CASE("MemoryEngine: tag order shares a cache entry", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();

    auto q1 = make_query("pizza");
    q1.filters.tags = {"a", "b"};
    auto q2 = make_query("pizza");
    q2.filters.tags = {"b", "a"};

    engine->query("acme", q1);
    engine->query("acme", q2);
    REQUIRE(f.metrics.snapshot().queries_cached == 1);
}

TEST_CASE("MemoryEngine: store invalidates only the tenant's query cache", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    engine->store("acme", "I like pizza", "pref", "like");
    engine->store("globex", "I like pizza", "pref", "like");

    engine->query("acme", make_query("pizza"));
    engine->query("globex", make_query("pizza"));

    engine->store("acme", "I like sushi", "pref", "like");

    engine->query("globex", make_query("pizza"));
    REQUIRE(f.metrics.snapshot().queries_cached == 1);
    engine->query("acme", make_query("pizza"));
    REQUIRE(f.metrics.snapshot().queries_cached == 1);
}

TEST_CASE("MemoryEngine: forgotten record disappears from cached queries", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    auto id = engine->store("acme", "I like pizza", "pref", "like");

    REQUIRE(engine->query("acme", make_query("pizza")).size() == 1);
    REQUIRE(engine->forget("acme", *id));
    REQUIRE(engine->query("acme", make_query("pizza")).empty());
}

// ── Cancellation ─────────────────────────────────────────────

TEST_CASE("MemoryEngine: cancelled query throws and skips the cache", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    engine->store("acme", "I like pizza", "pref", "like");
    uint32_t cached_before = f.cache.size();

    std::atomic<bool> cancel{true};
    REQUIRE_THROWS_AS(engine->query("acme", make_query("pizza"), &cancel), QueryCancelled);
    REQUIRE(f.cache.size() == cached_before);

    cancel = false;
    REQUIRE(engine->query("acme", make_query("pizza"), &cancel).size() == 1);
    REQUIRE(f.cache.size() == cached_before + 1);
}

// ── Forget / get ─────────────────────────────────────────────

TEST_CASE("MemoryEngine: forget removes from store and index", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    auto id = engine->store("acme", "I like pizza", "pref", "like");
    auto coll = MemoryEngine::collection_name("acme");
    REQUIRE(f.index.size(coll) == 1);

    REQUIRE(engine->forget("acme", *id));
    REQUIRE(f.index.size(coll) == 0);
    REQUIRE(f.store->count(coll) == 0);
    REQUIRE_FALSE(engine->get("acme", *id).has_value());

    REQUIRE_FALSE(engine->forget("acme", *id));
    REQUIRE(f.metrics.snapshot().memories_deleted == 1);
}

TEST_CASE("MemoryEngine: forget of unknown id returns false", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    REQUIRE_FALSE(engine->forget("acme", "no-such-id"));
}

TEST_CASE("MemoryEngine: get returns record without embedding", "[engine]") {
    EngineFixture f;
    auto engine = f.engine();
    auto id = engine->store("acme", "I like pizza", "pref", "like");

    auto cached = engine->get("acme", *id);
    REQUIRE(cached.has_value());
    REQUIRE(cached->content == "I like pizza");
    REQUIRE(cached->embedding.empty());

    // Same answer straight from the store.
    auto uncached_engine = f.engine(&f.index, nullptr);
    auto direct = uncached_engine->get("acme", *id);
    REQUIRE(direct.has_value());
    REQUIRE(direct->created_at == kNow);
    REQUIRE(direct->embedding.empty());

    REQUIRE_FALSE(engine->get("globex", *id).has_value());
}

// ── Stats ────────────────────────────────────────────────────

TEST_CASE("MemoryEngine: stats breakdowns", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();

    Metadata alice;
    alice[meta::kUserId] = std::string("alice");

    f.now = kNow - 3 * kDay;
    engine->store("acme", "old pizza", "pref", "like", alice);
    f.now = kNow;
    engine->store("acme", "new pizza", "pref", "like", alice);
    engine->store("acme", "hiking", "fact", "event");
    engine->store("globex", "other tenant", "pref", "like");

    auto s = engine->stats("acme");
    REQUIRE(s.collection == "tenant_acme_memories");
    REQUIRE(s.total == 3);
    REQUIRE(s.last_24h == 2);
    REQUIRE(s.by_scope_kind[ScopeKind("pref", "like")] == 2);
    REQUIRE(s.by_scope_kind[ScopeKind("fact", "event")] == 1);
    REQUIRE(s.by_user["alice"] == 2);
    REQUIRE(s.by_user[""] == 1);
    REQUIRE(s.metrics.memories_stored == 4);

    auto j = stats_to_json(s);
    REQUIRE(j["total_memories"] == 3);
    REQUIRE(j["by_scope_kind"].size() == 2);
    REQUIRE(j["metrics"]["memories_stored"] == 4);
}

// ── Index warm-up ────────────────────────────────────────────

TEST_CASE("MemoryEngine: warm_index loads recent records into the index", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto writer = f.engine(nullptr);
    for (int i = 0; i < 5; i++) {
        f.now = kNow + static_cast<uint64_t>(i);
        writer->store("acme", "pizza " + std::to_string(i), "pref", "like");
    }

    FlatVectorIndex fresh;
    auto reader = f.engine(&fresh);
    REQUIRE(reader->warm_index("acme", 3) == 3);
    REQUIRE(fresh.size(MemoryEngine::collection_name("acme")) == 3);

    REQUIRE(reader->warm_index("acme", 100) == 5);
    REQUIRE(fresh.size(MemoryEngine::collection_name("acme")) == 5);

    auto no_index = f.engine(nullptr);
    REQUIRE(no_index->warm_index("acme", 100) == 0);
}

TEST_CASE("MemoryEngine: warm_index without a limit covers the whole collection", "[engine]") {
    EngineFixture f;
    f.config.fallback_window = 2;
    f.config.surprise.enabled = false;
    auto writer = f.engine(nullptr);
    std::vector<std::string> ids;
    const char* texts[] = {"pizza", "sushi", "coffee", "rust", "python"};
    for (int i = 0; i < 5; i++) {
        f.now = kNow + static_cast<uint64_t>(i);
        ids.push_back(*writer->store("acme", texts[i], "pref", "like"));
    }

    f.config.surprise.enabled = true;
    FlatVectorIndex fresh;
    auto reader = f.engine(&fresh);
    REQUIRE(reader->warm_index("acme") == 5);
    REQUIRE(fresh.size(MemoryEngine::collection_name("acme")) == 5);

    // The oldest record sits outside the fallback window but is still
    // indexed, so its duplicate is recognised.
    REQUIRE_FALSE(reader->store("acme", "pizza", "pref", "like").has_value());
    REQUIRE(f.metrics.snapshot().memories_deduplicated == 1);
}

// ── Expiry ───────────────────────────────────────────────────

TEST_CASE("MemoryEngine: store stamps expires_at from the retention default", "[engine]") {
    EngineFixture f;
    REQUIRE(f.config.retention.default_ttl_hours == 0);
    f.config.retention.default_ttl_hours = 168;
    auto engine = f.engine();
    auto coll = MemoryEngine::collection_name("acme");

    auto by_default = engine->store("acme", "pizza", "pref", "like");
    auto custom = engine->store("acme", "sushi", "pref", "like", {}, 2);
    auto forever = engine->store("acme", "coffee", "pref", "like", {}, 0);

    auto records = f.store->fetch_by_ids(coll, {*by_default, *custom, *forever}, false);
    REQUIRE(records.size() == 3);
    for (const auto& r : records) {
        if (r.id == *by_default) REQUIRE(r.expires_at == kNow + 168 * 3600);
        if (r.id == *custom)     REQUIRE(r.expires_at == kNow + 2 * 3600);
        if (r.id == *forever)    REQUIRE(r.expires_at == 0);
    }
}

TEST_CASE("MemoryEngine: expired records are hidden from query and get", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();

    auto short_lived = engine->store("acme", "I like pizza", "pref", "like", {}, 1);
    auto lasting = engine->store("acme", "pizza again", "pref", "like", {}, 48);
    REQUIRE(engine->query("acme", make_query("pizza")).size() == 2);
    REQUIRE(engine->get("acme", *short_lived).has_value());

    // Exactly at expires_at the record is gone, even from warm caches.
    f.now = kNow + 3600;
    REQUIRE(ids_of(engine->query("acme", make_query("pizza"))) ==
            std::set<std::string>{*lasting});
    REQUIRE_FALSE(engine->get("acme", *short_lived).has_value());
    REQUIRE(engine->get("acme", *lasting).has_value());

    auto uncached = f.engine(&f.index, nullptr);
    REQUIRE(uncached->query("acme", make_query("pizza")).size() == 1);
    REQUIRE_FALSE(uncached->get("acme", *short_lived).has_value());
}

TEST_CASE("MemoryEngine: prune_expired removes from store, index and cache", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();
    auto coll = MemoryEngine::collection_name("acme");

    auto gone = engine->store("acme", "I like pizza", "pref", "like", {}, 1);
    engine->store("acme", "pizza forever", "pref", "like", {}, 0);
    engine->store("globex", "pizza elsewhere", "pref", "like", {}, 1);

    f.now = kNow + 2 * 3600;
    auto s = engine->stats("acme");
    REQUIRE(s.total == 2);
    REQUIRE(s.expired == 1);
    REQUIRE(stats_to_json(s)["expired_memories"] == 1);

    REQUIRE(engine->prune_expired("acme") == 1);
    REQUIRE(f.store->count(coll) == 1);
    REQUIRE(f.index.size(coll) == 1);
    REQUIRE(f.store->fetch_by_ids(coll, {*gone}, false).empty());
    REQUIRE(f.cache.get(MemoryEngine::record_cache_key("acme", *gone)) == std::nullopt);
    REQUIRE(engine->stats("acme").expired == 0);
    REQUIRE(f.metrics.snapshot().memories_pruned == 1);

    // Other tenants are pruned separately.
    REQUIRE(f.store->count(MemoryEngine::collection_name("globex")) == 1);
    REQUIRE(engine->prune_expired("acme") == 0);
    REQUIRE(engine->prune_expired("globex") == 1);
}

TEST_CASE("MemoryEngine: prune_expired survives index failures", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    FailingVectorIndex broken;
    auto engine = f.engine(&broken);
    engine->store("acme", "I like pizza", "pref", "like", {}, 1);

    f.now = kNow + 3600;
    REQUIRE(engine->prune_expired("acme") == 1);
    REQUIRE(f.store->count(MemoryEngine::collection_name("acme")) == 0);
    REQUIRE(f.metrics.snapshot().index_errors >= 1);
}

TEST_CASE("MemoryEngine: warm_index skips expired records", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto writer = f.engine(nullptr);
    writer->store("acme", "pizza", "pref", "like", {}, 1);
    writer->store("acme", "sushi", "pref", "like", {}, 0);

    f.now = kNow + 3600;
    FlatVectorIndex fresh;
    REQUIRE(f.engine(&fresh)->warm_index("acme") == 1);
}

// ── Concurrency ──────────────────────────────────────────────

TEST_CASE("MemoryEngine: concurrent stores and queries", "[engine]") {
    EngineFixture f;
    f.config.surprise.enabled = false;
    auto engine = f.engine();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&engine, t] {
            for (int i = 0; i < 10; i++) {
                engine->store("acme", "pizza " + std::to_string(t * 100 + i), "pref", "like");
                engine->query("acme", make_query("pizza", 5));
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(f.store->count(MemoryEngine::collection_name("acme")) == 40);
    REQUIRE(f.metrics.snapshot().memories_stored == 40);
    REQUIRE(engine->query("acme", make_query("pizza", 50)).size() == 40);
}
