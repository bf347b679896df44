// =============================================================================
// factlog CLI - Entity history from the fact log
// =============================================================================
//
// Usage:
//   factlog [global options] <command> [args]
//
// Commands:
//   history     Every snapshot of an entity, oldest first
//   changes     The delta each transaction applied
//   current     The entity's current state
//   as-of       The entity's state after a given transaction
//   schema      Create the fact log tables
//   demo        Replay the three-event order example (in memory)
//   version     Show version information
//
// Examples:
//   factlog schema
//   factlog history order-287fc397
//   factlog as-of order-287fc397 13194139534315
//   factlog --remove-retracted history order-287fc397
//
// Exit codes: 0 ok, 1 usage, 2 entity not found, 3 store unavailable,
//             4 data integrity error
//
// =============================================================================

#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "factlog/config.hpp"
#include "factlog/db/connection.hpp"
#include "factlog/error.hpp"
#include "factlog/logging.hpp"
#include "factlog/reconstruct/pipeline.hpp"
#include "factlog/store/memory_store.hpp"
#include "factlog/store/pg_store.hpp"

#define FACTLOG_VERSION_STRING "1.0.0"

namespace factlog::cli {
    int cmd_history(int argc, char* argv[]);
    int cmd_changes(int argc, char* argv[]);
    int cmd_current(int argc, char* argv[]);
    int cmd_as_of(int argc, char* argv[]);
    int cmd_schema(int argc, char* argv[]);
    int cmd_demo(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_NOT_FOUND = 2,
    EXIT_STORE_UNAVAILABLE = 3,
    EXIT_INTEGRITY = 4
};

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"history", "Every snapshot of an entity, oldest first", factlog::cli::cmd_history},
    {"changes", "The delta each transaction applied", factlog::cli::cmd_changes},
    {"current", "The entity's current state", factlog::cli::cmd_current},
    {"as-of",   "The entity's state after a given transaction", factlog::cli::cmd_as_of},
    {"schema",  "Create the fact log tables", factlog::cli::cmd_schema},
    {"demo",    "Replay the three-event order example (in memory)", factlog::cli::cmd_demo},
    {"version", "Show version information", factlog::cli::cmd_version},
    {"help",    "Show this help message", factlog::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "factlog.env";
    factlog::db::ConnectionConfig db;
    bool remove_retracted = false;
    bool verbose = false;
};

static GlobalOptions g_options;

namespace factlog::cli {

namespace {

std::unique_ptr<PgFactStore> open_store() {
    int pool_size = Config::getInstance().get<int>("db.pool_size", 4);
    return std::make_unique<PgFactStore>(g_options.db, static_cast<size_t>(pool_size));
}

ReconstructOptions reconstruct_options() {
    ReconstructOptions options = ReconstructOptions::from_config(Config::getInstance());
    if (g_options.remove_retracted) {
        options.retraction_policy = RetractionPolicy::Remove;
    }
    return options;
}

std::string instant_text(const std::optional<Instant>& instant) {
    return instant ? instant->to_string() : "-";
}

void print_snapshot(const Snapshot& snapshot) {
    std::cout << "tx " << snapshot.tx << "  " << instant_text(snapshot.tx_instant) << "\n";
    for (const auto& [attribute, value] : snapshot.state) {
        std::cout << "  " << attribute << " = " << value << "\n";
    }
}

void print_delta(const Delta& delta) {
    std::cout << "tx " << delta.tx << "  " << instant_text(delta.tx_instant) << "\n";
    for (const auto& [attribute, value] : delta.values) {
        std::cout << "  + " << attribute << " = " << value << "\n";
    }
    for (const auto& attribute : delta.retracted) {
        std::cout << "  - " << attribute << "\n";
    }
}

bool require_entity(int argc, char* argv[], const char* usage) {
    if (argc < 1 || argv[0][0] == '\0') {
        std::cerr << "Usage: factlog " << usage << "\n";
        return false;
    }
    return true;
}

} // anonymous namespace

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "factlog - entity history from an append-only fact log\n";
    std::cout << "Version " << FACTLOG_VERSION_STRING << "\n\n";
    std::cout << "Usage: factlog [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Config file (default: factlog.env)\n";
    std::cout << "  -d, --dbname <name>     Database name (default: factlog)\n";
    std::cout << "  -U, --user <user>       Database user (default: postgres)\n";
    std::cout << "  -h, --host <host>       Database host (default: localhost)\n";
    std::cout << "  -p, --port <port>       Database port (default: 5432)\n";
    std::cout << "  -W, --password <pw>     Database password\n";
    std::cout << "  --remove-retracted      Drop retracted attributes from later snapshots\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  FACTLOG_DB_HOST, FACTLOG_DB_PORT, FACTLOG_DB_USER, FACTLOG_DB_PASS,\n";
    std::cout << "  FACTLOG_DB_NAME, FACTLOG_LOG_LEVEL, FACTLOG_RETRACTION_POLICY\n";
    return EXIT_OK;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "factlog " << FACTLOG_VERSION_STRING << "\n";
    std::cout << "libpq " << PQlibVersion() << "\n";
    return EXIT_OK;
}

int cmd_history(int argc, char* argv[]) {
    if (!require_entity(argc, argv, "history <entity>")) return EXIT_USAGE;

    auto store = open_store();
    Reconstructor reconstructor(*store, reconstruct_options());
    std::vector<Snapshot> snapshots = reconstructor.reconstruct(argv[0]);
    if (snapshots.empty()) {
        std::cerr << "Entity not found: " << argv[0] << "\n";
        return EXIT_NOT_FOUND;
    }
    for (const auto& snapshot : snapshots) {
        print_snapshot(snapshot);
    }
    return EXIT_OK;
}

int cmd_changes(int argc, char* argv[]) {
    if (!require_entity(argc, argv, "changes <entity>")) return EXIT_USAGE;

    auto store = open_store();
    Reconstructor reconstructor(*store, reconstruct_options());
    std::vector<Delta> deltas = reconstructor.changes(argv[0]);
    if (deltas.empty()) {
        std::cerr << "Entity not found: " << argv[0] << "\n";
        return EXIT_NOT_FOUND;
    }
    for (const auto& delta : deltas) {
        print_delta(delta);
    }
    return EXIT_OK;
}

int cmd_current(int argc, char* argv[]) {
    if (!require_entity(argc, argv, "current <entity>")) return EXIT_USAGE;

    auto store = open_store();
    Reconstructor reconstructor(*store, reconstruct_options());
    std::optional<Snapshot> snapshot = reconstructor.current(argv[0]);
    if (!snapshot) {
        std::cerr << "Entity not found: " << argv[0] << "\n";
        return EXIT_NOT_FOUND;
    }
    print_snapshot(*snapshot);
    return EXIT_OK;
}

int cmd_as_of(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: factlog as-of <entity> <tx>\n";
        return EXIT_USAGE;
    }

    TxId tx = 0;
    try {
        size_t used = 0;
        tx = std::stoll(argv[1], &used);
        if (used != strlen(argv[1])) throw std::invalid_argument(argv[1]);
    } catch (const std::exception&) {
        std::cerr << "Not a transaction id: " << argv[1] << "\n";
        return EXIT_USAGE;
    }

    auto store = open_store();
    Reconstructor reconstructor(*store, reconstruct_options());
    std::optional<Snapshot> snapshot = reconstructor.as_of(argv[0], tx);
    if (!snapshot) {
        std::cerr << "Entity " << argv[0] << " has no state as of tx " << tx << "\n";
        return EXIT_NOT_FOUND;
    }
    print_snapshot(*snapshot);
    return EXIT_OK;
}

int cmd_schema([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto store = open_store();
    store->ensure_schema();
    std::cout << "Schema ready on " << g_options.db.host << ":" << g_options.db.port
              << "/" << g_options.db.dbname << "\n";
    return EXIT_OK;
}

int cmd_demo([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    // Place an order, assign it to a warehouse, ship it
    const EntityId entity = "order-287fc397";
    const Uuid order_id = *Uuid::parse("287fc397-a432-49d7-9068-d7499cd2e28c");

    MemoryFactStore store(13194139534313);
    store.transact(entity, {{"order/id", order_id},
                            {"order/operator", "me"},
                            {"order/time", *Instant::parse("2018-07-01T12:00:00Z")},
                            {"order/action", "place order"}});
    store.transact(entity, {{"order/id", order_id},
                            {"order/operator", "logistics system"},
                            {"order/action", "assign to warehouse A"}});
    store.transact(entity, {{"order/id", order_id},
                            {"order/operator", "shipper B"},
                            {"order/time", *Instant::parse("2018-07-01T12:20:00Z")},
                            {"order/location", "warehouse A"},
                            {"order/action", "ship to logistics center C"}});

    Reconstructor reconstructor(store, reconstruct_options());

    std::cout << "== changes\n";
    for (const auto& delta : reconstructor.changes(entity)) {
        print_delta(delta);
    }

    std::cout << "\n== history\n";
    std::vector<Snapshot> snapshots = reconstructor.reconstruct(entity);
    for (const auto& snapshot : snapshots) {
        print_snapshot(snapshot);
    }

    std::optional<AttributeMap> current = store.query_current(entity);
    bool matches = current && !snapshots.empty() && snapshots.back().state == *current;
    std::cout << "\nLast snapshot " << (matches ? "matches" : "DOES NOT match")
              << " the store's current state\n";
    return matches ? EXIT_OK : EXIT_INTEGRITY;
}

} // namespace factlog::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static std::string find_config_file(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            return argv[i + 1];
        }
    }
    return g_options.config_file;
}

// Consumes global options; leaves argv pointing at the command
static bool parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            ++i;  // already applied
        } else if (g_options.db.parse_arg(argc, argv, i)) {
            // database override
        } else if (arg == "--remove-retracted") {
            g_options.remove_retracted = true;
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return true;
}

int main(int argc, char* argv[]) {
    if (!factlog::init_config(find_config_file(argc, argv))) {
        return EXIT_USAGE;
    }
    g_options.db = factlog::db::ConnectionConfig::from_config(factlog::Config::getInstance());

    if (!parse_global_options(argc, argv)) {
        return EXIT_USAGE;
    }
    if (g_options.verbose) {
        factlog::set_log_level(factlog::LogLevel::DEBUG);
        factlog::Config::getInstance().print();
    }

    if (argc < 1) {
        factlog::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) != 0) continue;

        try {
            return cmd->handler(argc, argv);
        } catch (const factlog::StoreUnavailableError& e) {
            std::cerr << e.what() << "\n";
            return EXIT_STORE_UNAVAILABLE;
        } catch (const factlog::MalformedFactGroupError& e) {
            std::cerr << e.what() << "\n";
            return EXIT_INTEGRITY;
        } catch (const factlog::FactlogException& e) {
            std::cerr << e.what() << "\n";
            return e.code() == factlog::ErrorCode::INVALID_ARGUMENT ? EXIT_INTEGRITY : EXIT_USAGE;
        } catch (const std::exception& e) {
            std::cerr << "factlog: " << e.what() << "\n";
            return EXIT_USAGE;
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'factlog help' for usage.\n";
    return EXIT_USAGE;
}
