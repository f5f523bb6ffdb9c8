// =============================================================================
// polarity CLI - Command-line front end for the sentiment engine
// =============================================================================
//
// Usage:
//   polarity [global options] <command> [args]
//
// Commands:
//   classify    Classify a token sequence (ids or words)
//   similarity  Similarity score between two tokens
//   token       Show one token's metadata
//   stats       Show engine statistics
//   save        Persist the loaded state to PostgreSQL
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   polarity --config polarity.env classify 12 40 7
//   polarity --db --caller alice classify great service
//   polarity similarity 12 40 --context
//   polarity --db -h dbhost -U trainer save
//
// =============================================================================

#include <charconv>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "polarity/config.hpp"
#include "polarity/logging.hpp"
#include "polarity/error.hpp"
#include "polarity/service.hpp"
#include "polarity/collaborators.hpp"
#include "polarity/io/model_loader.hpp"
#include "polarity/db/connection.hpp"
#include "polarity/db/state_repository.hpp"

namespace polarity::cli {
    int cmd_classify(int argc, char* argv[]);
    int cmd_similarity(int argc, char* argv[]);
    int cmd_token(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_save(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define POLARITY_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"classify",   "Classify a token sequence (ids or words)", polarity::cli::cmd_classify},
    {"similarity", "Similarity score between two tokens", polarity::cli::cmd_similarity},
    {"token",      "Show token metadata by id or word", polarity::cli::cmd_token},
    {"stats",      "Show engine statistics", polarity::cli::cmd_stats},
    {"save",       "Persist the loaded state to PostgreSQL", polarity::cli::cmd_save},
    {"version",    "Show version information", polarity::cli::cmd_version},
    {"help",       "Show this help message", polarity::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "polarity.env";
    std::string caller;
    bool use_db = false;
    bool verbose = false;
    // db.* values from connection flags, applied over the loaded configuration
    std::vector<std::pair<std::string, std::string>> db_overrides;
};

static GlobalOptions g_options;

namespace polarity::cli {

namespace {

// Engine plus its collaborators, assembled once per invocation
struct Session {
    std::unique_ptr<RoleRegistry> roles;
    LoggingEventSink events;
    SystemClock clock;
    std::unique_ptr<SentimentService> service;
    std::unique_ptr<db::Connection> conn;
    std::unique_ptr<db::PgStateRepository> repository;
};

CallerId effective_caller(const RoleRegistry& roles) {
    return g_options.caller.empty() ? roles.owner() : g_options.caller;
}

std::unique_ptr<Session> open_session() {
    auto session = std::make_unique<Session>();
    const Config& config = Config::getInstance();

    session->roles = std::make_unique<RoleRegistry>(config.get<std::string>("service.owner", "owner"));

    EngineState state;
    if (g_options.use_db) {
        db::ConnectionConfig db_config;
        session->conn = std::make_unique<db::Connection>(db_config);
        if (!session->conn->ok()) {
            throw DatabaseError("Connection failed", session->conn->error(), ErrorCode::CONNECTION_FAILED);
        }
        session->repository = std::make_unique<db::PgStateRepository>(session->conn->get());
        session->repository->ensure_schema();
        if (session->repository->has_state()) {
            state = session->repository->load();
        }
    }

    // Model files, when configured, are applied over whatever was loaded
    io::ModelPaths paths;
    paths.vocabulary = config.get<std::string>("model.vocabulary");
    paths.embeddings = config.get<std::string>("model.embeddings");
    paths.class_weights = config.get<std::string>("model.class_weights");
    paths.domains = config.get<std::string>("model.domains");
    io::load_model(state, paths);

    session->service = std::make_unique<SentimentService>(
        *session->roles, session->events, session->clock, std::move(state));
    return session;
}

void persist(Session& session) {
    if (session.repository) {
        session.repository->save(session.service->snapshot());
    }
}

// Numeric id, or a vocabulary word
std::optional<TokenId> resolve_token(const SentimentService& service, const std::string& arg) {
    TokenId id = 0;
    auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), id);
    if (ec == std::errc() && ptr == arg.data() + arg.size()) {
        return id;
    }
    return service.token_id(arg);
}

} // namespace

// =============================================================================
// Help / Version
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "Polarity - Deterministic fixed-point sentiment engine\n";
    std::cout << "Version " << POLARITY_VERSION_STRING << "\n\n";
    std::cout << "Usage: polarity [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: polarity.env)\n";
    std::cout << "  --caller <id>           Caller identity (default: configured owner)\n";
    std::cout << "  --db                    Load state from and save state to PostgreSQL\n";
    std::cout << "  -v, --verbose           Debug logging and configuration dump\n";
    std::cout << "  -d, --dbname <name>     Database name (overrides db.name)\n";
    std::cout << "  -h, --host <host>       Database host (overrides db.host)\n";
    std::cout << "  -p, --port <port>       Database port (overrides db.port)\n";
    std::cout << "  -U, --user <user>       Database user (overrides db.user)\n";
    std::cout << "  -W, --password <pass>   Database password (overrides db.password)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  PL_DB_HOST, PL_DB_PORT, PL_DB_USER, PL_DB_PASS, PL_DB_NAME\n";
    std::cout << "  PL_MODEL_VOCABULARY, PL_MODEL_EMBEDDINGS, PL_MODEL_CLASS_WEIGHTS, PL_MODEL_DOMAINS\n";
    std::cout << "  PL_LOG_LEVEL, PL_LOG_FILE, PL_OWNER\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "Polarity " << POLARITY_VERSION_STRING << "\n";
    std::cout << "Classes: " << constants::NUM_CLASSES
              << ", domains: " << constants::NUM_DOMAINS
              << ", vocabulary cap: " << constants::VOCAB_CAP << "\n";
    return 0;
}

// =============================================================================
// Classify
// =============================================================================

int cmd_classify(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: polarity classify <token> [token...]\n";
        return 1;
    }

    auto session = open_session();
    SentimentService& service = *session->service;

    std::vector<TokenId> tokens;
    for (int i = 0; i < argc; ++i) {
        auto id = resolve_token(service, argv[i]);
        if (!id) {
            std::cerr << "Unknown token: " << argv[i] << "\n";
            return 1;
        }
        tokens.push_back(*id);
    }

    ClassificationResult result = service.classify_sentiment(effective_caller(*session->roles), tokens);

    std::cout << "Class:      " << result.sentiment_class << " (" << class_name(result.sentiment_class) << ")\n";
    std::cout << "Confidence: " << result.confidence << "\n";
    std::cout << "Domain:     " << result.domain << " (" << domain_name(result.domain) << ")\n";
    std::cout << "Input:      " << result.input_text << "\n";

    persist(*session);
    return 0;
}

// =============================================================================
// Similarity
// =============================================================================

int cmd_similarity(int argc, char* argv[]) {
    std::vector<std::string> positional;
    bool include_context = false;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--context") {
            include_context = true;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        std::cerr << "Usage: polarity similarity <a> <b> [--context]\n";
        return 1;
    }

    auto session = open_session();
    SentimentService& service = *session->service;

    auto a = resolve_token(service, positional[0]);
    auto b = resolve_token(service, positional[1]);
    if (!a || !b) {
        std::cerr << "Unknown token: " << (a ? positional[1] : positional[0]) << "\n";
        return 1;
    }

    std::cout << service.similarity(*a, *b, include_context) << "\n";
    return 0;
}

// =============================================================================
// Token
// =============================================================================

int cmd_token(int argc, char* argv[]) {
    if (argc != 1) {
        std::cerr << "Usage: polarity token <id|word>\n";
        return 1;
    }

    auto session = open_session();
    SentimentService& service = *session->service;

    auto id = resolve_token(service, argv[0]);
    if (!id) {
        std::cerr << "Unknown token: " << argv[0] << "\n";
        return 1;
    }

    TokenMetadata m = service.token_metadata(*id);
    std::cout << "Id:           " << *id << "\n";
    std::cout << "Word:         " << m.word << "\n";
    std::cout << "Sentiment:    " << m.sentiment << "\n";
    std::cout << "Flags:        0x" << std::hex << static_cast<int>(m.flags) << std::dec << "\n";
    std::cout << "Category:     " << static_cast<int>(m.category)
              << " / " << static_cast<int>(m.secondary_category) << "\n";
    std::cout << "Weight:       " << static_cast<int>(m.weight) << "\n";
    std::cout << "Influence:    " << static_cast<int>(m.context_influence) << "\n";
    std::cout << "Domain:       " << domain_name(m.domain_relevance)
              << " (strength " << static_cast<int>(m.domain_strength) << ")\n";
    std::cout << "Usage:        " << m.usage_count << "\n";
    std::cout << "Cooccurrence: " << m.cooccurrence_total << "\n";
    return 0;
}

// =============================================================================
// Stats
// =============================================================================

int cmd_stats([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto session = open_session();
    const SentimentService& service = *session->service;

    std::cout << "Vocabulary size:       " << service.vocabulary_size() << "\n";
    std::cout << "Phrases:               " << service.phrase_count() << "\n";
    std::cout << "Total classifications: " << service.total_classifications() << "\n";
    std::cout << "Correct predictions:   " << service.correct_predictions() << "\n";
    std::cout << "Paused:                " << (service.paused() ? "yes" : "no") << "\n";
    std::cout << "\nClass distribution:\n";
    for (int c = 0; c < constants::NUM_CLASSES; ++c) {
        std::cout << "  " << c << " " << class_name(c);
        for (size_t i = strlen(class_name(c)); i < 18; ++i) std::cout << ' ';
        std::cout << service.class_distribution(c) << "\n";
    }

    if (g_options.verbose && !g_options.caller.empty()) {
        UserContext ctx = service.user_context(g_options.caller);
        std::cout << "\nCaller " << g_options.caller << ":\n";
        std::cout << "  Interactions:   " << ctx.total_interactions << "\n";
        std::cout << "  Last seen:      " << ctx.last_interaction << "\n";
        std::cout << "  Primary domain: " << domain_name(ctx.primary_domain) << "\n";
        std::cout << "  Topics:         " << ctx.topic_buffer[0] << " " << ctx.topic_buffer[1]
                  << " " << ctx.topic_buffer[2] << "\n";
    }
    return 0;
}

// =============================================================================
// Save
// =============================================================================

int cmd_save([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    // Saving always targets the database, even without --db
    g_options.use_db = true;

    auto session = open_session();
    persist(*session);
    std::cout << "Saved state (vocabulary size " << session->service->vocabulary_size() << ")\n";
    return 0;
}

}  // namespace polarity::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "--caller" && i + 1 < argc) {
            g_options.caller = argv[++i];
        } else if (arg == "--db") {
            g_options.use_db = true;
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (const char* key = polarity::db::ConnectionConfig::option_key(arg); key && i + 1 < argc) {
            g_options.db_overrides.emplace_back(key, argv[++i]);
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (!polarity::init_config(g_options.config_file)) {
        return 1;
    }
    for (const auto& [key, value] : g_options.db_overrides) {
        polarity::Config::getInstance().set(key, value);
    }
    if (g_options.verbose) {
        polarity::set_log_level(polarity::LogLevel::DEBUG);
        polarity::Config::getInstance().print();
    }

    if (argc < 1) {
        polarity::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const polarity::PolarityException& e) {
                std::cerr << e.what() << "\n";
                return 2;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'polarity help' for usage.\n";
    return 1;
}
