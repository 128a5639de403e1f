// =============================================================================
// stevedore CLI - partitioned table migrations
// =============================================================================
//
// Usage:
//   stevedore <command> [options]
//
// Commands:
//   create      Create the partitioned parent and partitions LO..HI
//   copy        Copy source partitions into the new partitions in batches
//   lifecycle   Copy, constrain, index and attach each partition
//   drop        Drop the partitions and the parent
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   stevedore create --config orders.conf --parts 0:64
//   stevedore lifecycle --config orders.conf --parts 0:64 --save-retry left.txt
//   stevedore lifecycle --config orders.conf --retry left.txt
//
// =============================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stevedore/config.hpp"
#include "stevedore/db/connection.hpp"
#include "stevedore/db/executor.hpp"
#include "stevedore/error.hpp"
#include "stevedore/logging.hpp"
#include "stevedore/migrate/bulk_copy.hpp"
#include "stevedore/migrate/lifecycle.hpp"
#include "stevedore/migrate/retry_file.hpp"
#include "stevedore/migrate/settings.hpp"
#include "stevedore/migrate/tables.hpp"

namespace stevedore::cli {
    int cmd_create(int argc, char* argv[]);
    int cmd_copy(int argc, char* argv[]);
    int cmd_lifecycle(int argc, char* argv[]);
    int cmd_drop(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define STEVEDORE_VERSION_MAJOR 1
#define STEVEDORE_VERSION_MINOR 0
#define STEVEDORE_VERSION_PATCH 0
#define STEVEDORE_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"create",    "Create the partitioned parent and its partitions", stevedore::cli::cmd_create},
    {"copy",      "Bulk copy source partitions into new partitions", stevedore::cli::cmd_copy},
    {"lifecycle", "Copy, constrain, index and attach each partition", stevedore::cli::cmd_lifecycle},
    {"drop",      "Drop the partitions and the parent", stevedore::cli::cmd_drop},
    {"version",   "Show version information", stevedore::cli::cmd_version},
    {"help",      "Show this help message", stevedore::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

constexpr int EXIT_OK = 0;
constexpr int EXIT_INCOMPLETE = 1;
constexpr int EXIT_USAGE = 2;

// =============================================================================
// Signals
// =============================================================================

static std::atomic<bool> g_interrupted{false};

extern "C" void on_interrupt(int) {
    g_interrupted.store(true);
}

static void install_signal_handlers() {
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
}

// =============================================================================
// Options
// =============================================================================

namespace stevedore::cli {

struct Options {
    std::string config_file;
    std::optional<std::pair<int64_t, int64_t>> parts;
    std::optional<int> workers;
    std::optional<int64_t> batch;
    std::string retry_file;
    std::string save_retry;
    db::ConnectionFlags db;
};

static bool parse_range(const std::string& text, std::pair<int64_t, int64_t>& out) {
    size_t colon = text.find(':');
    if (colon == std::string::npos) return false;
    try {
        size_t used = 0;
        std::string lo = text.substr(0, colon);
        std::string hi = text.substr(colon + 1);
        out.first = std::stoll(lo, &used);
        if (used != lo.size()) return false;
        out.second = std::stoll(hi, &used);
        if (used != hi.size()) return false;
    } catch (const std::logic_error&) {
        return false;
    }
    return out.first <= out.second;
}

static bool parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (opts.db.parse_arg(argc, argv, i)) continue;

        try {
            if (arg == "--config" && has_value) {
                opts.config_file = argv[++i];
            } else if (arg == "--parts" && has_value) {
                std::pair<int64_t, int64_t> range;
                if (!parse_range(argv[++i], range)) {
                    std::cerr << "Invalid --parts value, expected LO:HI with LO <= HI\n";
                    return false;
                }
                opts.parts = range;
            } else if (arg == "--workers" && has_value) {
                opts.workers = std::stoi(argv[++i]);
            } else if (arg == "--batch" && has_value) {
                opts.batch = std::stoll(argv[++i]);
            } else if (arg == "--retry" && has_value) {
                opts.retry_file = argv[++i];
            } else if (arg == "--save-retry" && has_value) {
                opts.save_retry = argv[++i];
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid number for " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Config file and environment first, then command-line overrides.
struct Context {
    Options opts;
    migrate::RunSettings settings;
    db::PartitionSchema schema;
    std::unique_ptr<db::PgExecutor> executor;
};

static Context make_context(const Options& opts) {
    if (!init_config(opts.config_file)) {
        throw ConfigError("configuration is invalid", "make_context");
    }
    Config& config = Config::getInstance();

    Context ctx;
    ctx.opts = opts;
    ctx.settings = migrate::RunSettings::from_config(config);
    if (opts.workers) {
        if (*opts.workers < 1) throw ConfigError("--workers must be at least 1");
        ctx.settings.workers = *opts.workers;
    }
    if (opts.batch) {
        if (*opts.batch < 1) throw ConfigError("--batch must be at least 1");
        ctx.settings.batch_size = *opts.batch;
    }
    ctx.schema = migrate::schema_from_config(config);

    // Database flags that were given win over config; config over SD_DB_*.
    db::ConnectionConfig conn = opts.db.apply(db::ConnectionConfig::from_config(config));

    ctx.executor = std::make_unique<db::PgExecutor>(conn, static_cast<size_t>(ctx.settings.workers));
    return ctx;
}

static void require_parts(const Options& opts) {
    if (!opts.parts && opts.retry_file.empty()) {
        throw ConfigError("--parts LO:HI is required unless --retry is given");
    }
}

// =============================================================================
// Running a pool
// =============================================================================

// Wait for the pool, logging progress and forwarding SIGINT/SIGTERM as kill.
template<typename Item>
static pool::Signals<Item> supervise(pool::PoolHandle<Item>& handle, const migrate::RunSettings& settings) {
    const auto poll = std::min(settings.progress_interval, std::chrono::milliseconds(250));
    auto last_report = std::chrono::steady_clock::now();

    while (!handle.wait_for(poll)) {
        if (g_interrupted.load() && !handle.killed()) {
            LOG_WARN("Interrupted, stopping ", handle.name(), " (in-flight statements will finish)");
            handle.kill();
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= settings.progress_interval) {
            last_report = now;
            auto s = handle.signals();
            auto p = s.progress();
            LOG_INFO("[", handle.name(), "] ", p.landed, "/", p.total, " landed (",
                     static_cast<int>(p.percent), "%), ", p.in_flight, " in flight, ",
                     p.pending, " pending, ", s.failed.size(), " failed");
        }
    }
    handle.join();

    auto s = handle.signals();
    for (const auto& [name, value] : s.counters) {
        LOG_INFO("[", handle.name(), "] ", name, " = ", value);
    }
    LOG_INFO("[", handle.name(), "] ", pool::shutdown_reason_name(s.reason), ": landed ", s.landed,
             ", failed ", s.failed.size(), ", cancelled ", s.cancelled.size());
    return s;
}

template<typename Item>
static int finish(const pool::Signals<Item>& s, const Options& opts) {
    auto leftovers = s.retry_items();
    if (leftovers.empty()) return EXIT_OK;

    for (const auto& item : s.failed) {
        LOG_ERROR("Failed: ", item);
    }
    if (!opts.save_retry.empty()) {
        migrate::save_retry_file(opts.save_retry, leftovers);
    } else {
        LOG_WARN(leftovers.size(), " item(s) left over; pass --save-retry FILE to keep them");
    }
    return EXIT_INCOMPLETE;
}

static std::optional<std::vector<migrate::Partition>> discover(Context& ctx) {
    auto found = std::make_shared<migrate::DiscoveredPartitions>();
    auto handle = migrate::start_discovery(*ctx.executor, ctx.schema,
                                           ctx.opts.parts->first, ctx.opts.parts->second,
                                           ctx.settings.workers, ctx.settings.policy, found);
    auto s = supervise(handle, ctx.settings);
    if (!s.retry_items().empty()) {
        LOG_ERROR("Partition discovery did not complete");
        return std::nullopt;
    }
    return found->partitions();
}

// =============================================================================
// Commands
// =============================================================================

// Parse options, build context, run body; map exceptions to exit codes.
template<typename Body>
static int run_command(const char* name, int argc, char* argv[], bool needs_parts, Body body) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        std::cerr << "Run 'stevedore help' for usage.\n";
        return EXIT_USAGE;
    }

    try {
        if (needs_parts) require_parts(opts);
        Context ctx = make_context(opts);
        LOG_INFO("stevedore ", name, ": ", ctx.settings.workers, " workers, parent ", ctx.schema.parent);
        return body(ctx);
    } catch (const ConfigError& e) {
        LOG_ERROR(e.what());
        return EXIT_USAGE;
    } catch (const InvalidArgumentError& e) {
        LOG_ERROR(e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        LOG_ERROR(name, " failed: ", e.what());
        return EXIT_INCOMPLETE;
    }
}

static int run_tables(const char* name, migrate::TableAction action, int argc, char* argv[]) {
    return run_command(name, argc, argv, true, [action](Context& ctx) {
        auto items = ctx.opts.retry_file.empty()
            ? migrate::plan_tables(ctx.schema, action, ctx.opts.parts->first, ctx.opts.parts->second,
                                   ctx.settings.policy)
            : migrate::load_table_items(ctx.opts.retry_file, ctx.schema, ctx.settings.policy);

        auto handle = migrate::start_tables(*ctx.executor, ctx.schema, ctx.settings.workers,
                                            std::move(items), ctx.settings.policy);
        return finish(supervise(handle, ctx.settings), ctx.opts);
    });
}

int cmd_create(int argc, char* argv[]) {
    return run_tables("create", migrate::TableAction::Create, argc, argv);
}

int cmd_drop(int argc, char* argv[]) {
    return run_tables("drop", migrate::TableAction::Drop, argc, argv);
}

int cmd_copy(int argc, char* argv[]) {
    return run_command("copy", argc, argv, true, [](Context& ctx) {
        std::vector<migrate::CopyItem> items;
        if (!ctx.opts.retry_file.empty()) {
            items = migrate::load_copy_items(ctx.opts.retry_file, ctx.settings.policy);
        } else {
            auto parts = discover(ctx);
            if (!parts) return EXIT_INCOMPLETE;
            items = migrate::plan_copy(ctx.schema, *parts, ctx.settings.batch_size, ctx.settings.policy);
        }

        auto handle = migrate::start_bulk_copy(*ctx.executor, ctx.settings.workers,
                                               std::move(items), ctx.settings.policy);
        return finish(supervise(handle, ctx.settings), ctx.opts);
    });
}

int cmd_lifecycle(int argc, char* argv[]) {
    return run_command("lifecycle", argc, argv, true, [](Context& ctx) {
        migrate::PartitionLifecycle lifecycle(*ctx.executor, ctx.schema, ctx.settings.policy,
                                              ctx.settings.batch_size);

        std::vector<migrate::LifecycleItem> items;
        if (!ctx.opts.retry_file.empty()) {
            items = migrate::load_lifecycle_items(ctx.opts.retry_file, lifecycle);
        } else {
            auto parts = discover(ctx);
            if (!parts) return EXIT_INCOMPLETE;
            items = lifecycle.initial(*parts);
        }

        auto handle = lifecycle.start(ctx.settings.workers, std::move(items));
        return finish(supervise(handle, ctx.settings), ctx.opts);
    });
}

// =============================================================================
// Help / Version
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "stevedore - partitioned Postgres migrations\n";
    std::cout << "Version " << STEVEDORE_VERSION_STRING << "\n\n";
    std::cout << "Usage: stevedore <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nOptions:\n";
    std::cout << "  --config <file>         key = value file (pool.*, copy.*, schema.*, db.*)\n";
    std::cout << "  --parts <lo:hi>         Partition numbers to work on, hi exclusive\n";
    std::cout << "  --workers <n>           Worker threads (default: SD_WORKERS or 8)\n";
    std::cout << "  --batch <n>             Keys per copy batch (default: SD_BATCH_SIZE)\n";
    std::cout << "  --retry <file>          Resume the items saved in <file>\n";
    std::cout << "  --save-retry <file>     Save failed and cancelled items to <file>\n";
    std::cout << "  -d, --dbname <name>     Database name\n";
    std::cout << "  -h, --host <host>       Database host\n";
    std::cout << "  -p, --port <port>       Database port\n";
    std::cout << "  -U, --user <user>       Database user\n";
    std::cout << "  -W, --password <pass>   Database password\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  SD_DB_HOST SD_DB_PORT SD_DB_USER SD_DB_PASS SD_DB_NAME\n";
    std::cout << "  SD_LOG_LEVEL SD_WORKERS SD_TIMEOUT_MS SD_TIMEOUT_STEP_MS\n";
    std::cout << "  SD_RETRIES SD_MAX_ESCALATIONS SD_BATCH_SIZE\n";
    std::cout << "\nExit status: 0 all work landed, 1 failed or cancelled work, 2 usage error\n";

    return EXIT_OK;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "stevedore " << STEVEDORE_VERSION_STRING << "\n";
    return EXIT_OK;
}

} // namespace stevedore::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    stevedore::set_log_output(std::cerr);
    install_signal_handlers();

    if (argc < 2) {
        stevedore::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[1];
    argc -= 2;
    argv += 2;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'stevedore help' for usage.\n";
    return EXIT_USAGE;
}
