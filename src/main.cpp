#include "config.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "memory_engine.hpp"
#include "query_cache.hpp"
#include "record_json.hpp"
#include "record_store.hpp"
#include "util.hpp"
#include "vector_index.hpp"
#include <atomic>
#include <climits>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static std::atomic<bool> g_cancel{false};

static void signal_handler(int /*sig*/) {
    g_cancel.store(true);
}

static void print_usage() {
    std::cout << "Usage: engram COMMAND [options] [TEXT|ID]\n"
              << "\n"
              << "Commands:\n"
              << "  store TEXT           Embed and store a memory (prints its id or null)\n"
              << "  query TEXT           Retrieve memories ranked by similarity and recency\n"
              << "  get ID               Show a single memory\n"
              << "  delete ID            Delete a memory\n"
              << "  stats                Show collection statistics\n"
              << "  prune                Delete expired memories\n"
              << "\n"
              << "Options:\n"
              << "  --tenant T           Tenant id (required)\n"
              << "  --scope S            Scope (store: required; query: filter)\n"
              << "  --kind K             Kind (store: required; query: filter)\n"
              << "  --meta KEY=VALUE     Metadata entry (store) or equality filter (query)\n"
              << "  --tag TAG            Tag to attach (store) or require (query)\n"
              << "  --user U             user_id (store: metadata; query: filter)\n"
              << "  --session S          session_id (store: metadata; query: filter)\n"
              << "  --conversation C     conversation_id (store: metadata; query: filter)\n"
              << "  --ttl-hours N        Expiry for a stored memory (0 = never; default from config)\n"
              << "  --top-k N            Maximum results (default 10)\n"
              << "  --threshold X        Similarity threshold in the configured metric mode\n"
              << "  --since TS           Only memories created at or after epoch TS\n"
              << "  --until TS           Only memories created at or before epoch TS\n"
              << "  --embeddings         Include embeddings in query output\n"
              << "  -v, --verbose        Log store/query summaries to stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY               API key for OpenAI embeddings\n"
              << "  ENGRAM_EMBEDDINGS_PROVIDER   openai or ollama\n"
              << "  ENGRAM_EMBEDDINGS_BASE_URL   Embedding service base URL\n"
              << "  ENGRAM_STORE_PATH            Record store file\n"
              << "  ENGRAM_INDEX_BACKEND         flat or none\n"
              << "  ENGRAM_METRIC_MODE           similarity or distance\n";
}

struct CliOptions {
    std::string command;
    std::string tenant;
    std::string scope;
    std::string kind;
    std::string user;
    std::string session;
    std::string conversation;
    std::vector<std::string> tags;
    engram::Metadata metadata;
    std::optional<uint32_t> ttl_hours;
    int32_t top_k = 10;
    std::optional<double> threshold;
    std::optional<uint64_t> since;
    std::optional<uint64_t> until;
    bool embeddings = false;
    bool verbose = false;
    std::vector<std::string> positional;
};

static std::string join_positional(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}

// Returns false (after printing why) on a malformed command line.
static bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "--tenant") == 0 && has_value) {
            opts.tenant = argv[++i];
        } else if (std::strcmp(arg, "--scope") == 0 && has_value) {
            opts.scope = argv[++i];
        } else if (std::strcmp(arg, "--kind") == 0 && has_value) {
            opts.kind = argv[++i];
        } else if (std::strcmp(arg, "--user") == 0 && has_value) {
            opts.user = argv[++i];
        } else if (std::strcmp(arg, "--session") == 0 && has_value) {
            opts.session = argv[++i];
        } else if (std::strcmp(arg, "--conversation") == 0 && has_value) {
            opts.conversation = argv[++i];
        } else if (std::strcmp(arg, "--tag") == 0 && has_value) {
            opts.tags.emplace_back(argv[++i]);
        } else if (std::strcmp(arg, "--meta") == 0 && has_value) {
            auto kv = engram::parse_metadata_arg(argv[++i]);
            if (!kv) {
                std::cerr << "Invalid --meta value: " << argv[i] << " (expected KEY=VALUE)\n";
                return false;
            }
            opts.metadata[kv->first] = kv->second;
        } else if (std::strcmp(arg, "--ttl-hours") == 0 && has_value) {
            auto v = engram::parse_uint64(argv[++i]);
            if (!v || *v > UINT32_MAX) {
                std::cerr << "Invalid --ttl-hours value: " << argv[i] << "\n";
                return false;
            }
            opts.ttl_hours = static_cast<uint32_t>(*v);
        } else if (std::strcmp(arg, "--top-k") == 0 && has_value) {
            auto v = engram::parse_int64(argv[++i]);
            if (!v || *v < 1 || *v > INT32_MAX) {
                std::cerr << "Invalid --top-k value: " << argv[i]
                          << " (expected 1-" << INT32_MAX << ")\n";
                return false;
            }
            opts.top_k = static_cast<int32_t>(*v);
        } else if (std::strcmp(arg, "--threshold") == 0 && has_value) {
            opts.threshold = engram::parse_double(argv[++i]);
            if (!opts.threshold) {
                std::cerr << "Invalid --threshold value: " << argv[i] << "\n";
                return false;
            }
        } else if ((std::strcmp(arg, "--since") == 0 || std::strcmp(arg, "--until") == 0) &&
                   has_value) {
            auto v = engram::parse_uint64(argv[++i]);
            if (!v) {
                std::cerr << "Invalid " << arg << " value: " << argv[i]
                          << " (expected epoch seconds)\n";
                return false;
            }
            if (std::strcmp(arg, "--since") == 0) opts.since = *v;
            else opts.until = *v;
        } else if (std::strcmp(arg, "--embeddings") == 0) {
            opts.embeddings = true;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (arg[0] == '-' && arg[1] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.positional.emplace_back(arg);
        }
    }

    if (opts.command.empty()) {
        std::cerr << "Missing command\n";
        return false;
    }
    if (opts.tenant.empty()) {
        std::cerr << "Missing --tenant\n";
        return false;
    }
    return true;
}

static int run_store(engram::MemoryEngine& engine, const CliOptions& opts) {
    std::string text = join_positional(opts.positional);
    if (text.empty() || opts.scope.empty() || opts.kind.empty()) {
        std::cerr << "store requires --scope, --kind and TEXT\n";
        return 1;
    }

    engram::Metadata metadata = opts.metadata;
    if (!opts.user.empty())         metadata[engram::meta::kUserId] = opts.user;
    if (!opts.session.empty())      metadata[engram::meta::kSessionId] = opts.session;
    if (!opts.conversation.empty()) metadata[engram::meta::kConversationId] = opts.conversation;
    if (!opts.tags.empty())         metadata[engram::meta::kTags] = opts.tags;

    auto id = engine.store(opts.tenant, text, opts.scope, opts.kind, metadata, opts.ttl_hours);
    nlohmann::json out = {{"id", nullptr}, {"stored", id.has_value()}};
    if (id) out["id"] = *id;
    std::cout << out.dump(2) << "\n";
    return 0;
}

static int run_query(engram::MemoryEngine& engine, const CliOptions& opts) {
    engram::MemoryQuery query;
    query.text = join_positional(opts.positional);
    if (query.text.empty()) {
        std::cerr << "query requires TEXT\n";
        return 1;
    }

    auto& f = query.filters;
    if (!opts.user.empty())         f.user_id = opts.user;
    if (!opts.session.empty())      f.session_id = opts.session;
    if (!opts.conversation.empty()) f.conversation_id = opts.conversation;
    if (!opts.scope.empty())        f.scope = opts.scope;
    if (!opts.kind.empty())         f.kind = opts.kind;
    f.tags = opts.tags;
    f.metadata = opts.metadata;

    if (opts.since || opts.until) {
        query.time_range = engram::TimeRange{opts.since.value_or(0),
                                             opts.until.value_or(UINT64_MAX)};
    }
    query.top_k = opts.top_k;
    if (opts.threshold) query.similarity_threshold = *opts.threshold;
    query.include_embeddings = opts.embeddings;

    auto results = engine.query(opts.tenant, query, &g_cancel);
    std::cout << engram::records_to_json(results, opts.embeddings).dump(2) << "\n";
    return 0;
}

static int run_get(engram::MemoryEngine& engine, const CliOptions& opts) {
    if (opts.positional.size() != 1) {
        std::cerr << "get requires exactly one ID\n";
        return 1;
    }
    auto record = engine.get(opts.tenant, opts.positional[0]);
    if (!record) {
        std::cerr << "Not found: " << opts.positional[0] << "\n";
        return 1;
    }
    std::cout << engram::record_to_json(*record, false).dump(2) << "\n";
    return 0;
}

static int run_delete(engram::MemoryEngine& engine, const CliOptions& opts) {
    if (opts.positional.size() != 1) {
        std::cerr << "delete requires exactly one ID\n";
        return 1;
    }
    bool deleted = engine.forget(opts.tenant, opts.positional[0]);
    nlohmann::json out = {{"id", opts.positional[0]}, {"deleted", deleted}};
    std::cout << out.dump(2) << "\n";
    return 0;
}

static int run_command(engram::MemoryEngine& engine, const CliOptions& opts) {
    if (opts.command == "store")  return run_store(engine, opts);
    if (opts.command == "query")  return run_query(engine, opts);
    if (opts.command == "get")    return run_get(engine, opts);
    if (opts.command == "delete") return run_delete(engine, opts);
    if (opts.command == "stats") {
        std::cout << engram::stats_to_json(engine.stats(opts.tenant)).dump(2) << "\n";
        return 0;
    }
    if (opts.command == "prune") {
        nlohmann::json out = {{"pruned", engine.prune_expired(opts.tenant)}};
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    std::cerr << "Unknown command: " << opts.command << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        }
    }

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 1;
    }

    auto config = engram::Config::load();
    if (opts.verbose) config.verbose = true;

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) std::cerr << "[config] " << p << "\n";
        return 1;
    }

    engram::http_init();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    engram::http_set_abort_flag(&g_cancel);

    engram::CurlHttpClient http_client;
    auto embedder = engram::create_embedder(config, http_client);
    if (!embedder) {
        std::cerr << "Error: no embedding provider configured "
                  << "(set embeddings.provider or OPENAI_API_KEY)\n";
        engram::http_cleanup();
        return 1;
    }

    auto store = engram::create_record_store(config);
    auto index = engram::create_vector_index(config);
    auto cache = engram::create_query_cache(config);

    engram::MemoryEngine engine(config, *embedder, *store, index.get(), cache.get());

    int rc = 0;
    try {
        // The flat index lives in-process; rebuild it from the whole
        // collection so duplicate detection sees every stored record.
        if (index) engine.warm_index(opts.tenant);
        rc = run_command(engine, opts);
    } catch (const engram::EngineError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    engram::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
