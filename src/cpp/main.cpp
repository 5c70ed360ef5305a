// =============================================================================
// plan-harvest -- execution plan collector for MySQL
//
// Periodically samples performance_schema.events_statements_history_long,
// explains new statements with the most privileged method available per
// schema, and ships obfuscated, signed plan events to an HTTP intake.
//
// One collector instance keeps its checkpoint and per-schema explain cache in
// memory; both reset only on restart.
// =============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

#include <curl/curl.h>

#include "config.hpp"
#include "utils/logger.hpp"
#include "connectors/mysql_connector.hpp"
#include "collector/event_sink.hpp"
#include "collector/obfuscator.hpp"
#include "collector/plan_collector.hpp"

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop = true; }

void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config PATH       JSON config file (default: built-in defaults)\n"
        "  --interval N        Seconds between collection runs (default: 10)\n"
        "  --once              Run a single collection, then exit\n"
        "  --dry-run           Log plan batches instead of posting them\n"
        "  --verbose           Enable debug logging\n"
        "  --help              Show this help\n",
        prog);
}

// Sleeps in short slices so a signal ends the wait promptly
void wait_interval(int seconds) {
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_stop && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    int interval_override = -1;
    bool once = false;
    bool dry_run = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            interval_override = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--once") == 0) {
            once = true;
        } else if (std::strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    harvest::CollectorConfig cfg;
    try {
        if (!config_path.empty()) cfg = harvest::CollectorConfig::from_file(config_path);
    } catch (const std::exception& e) {
        LOG_ERR("[main] Invalid config %s: %s", config_path.c_str(), e.what());
        return 1;
    }
    if (interval_override > 0) cfg.collection_interval_s = interval_override;
    if (cfg.collection_interval_s < 1) cfg.collection_interval_s = 1;

    harvest::g_log_level = verbose ? harvest::LogLevel::DEBUG
                                   : harvest::parse_log_level(cfg.log_level);

    LOG_INF("=== plan-harvest ===");
    LOG_INF("Target %s:%u, plans %s, row limit %d, interval %ds",
        cfg.connection.host.c_str(), cfg.connection.port,
        cfg.plans_enabled() ? "enabled" : "disabled",
        cfg.execution_plan_query_limit, cfg.collection_interval_s);
    if (dry_run) LOG_INF("=== DRY RUN MODE === (plan events are not sent)");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exit_code = 0;
    {
        harvest::MySqlConnector db;
        harvest::LiteralObfuscator obfuscator;
        harvest::HttpEventSink sink(cfg.intake_url, cfg.api_key, dry_run);

        try {
            harvest::PlanCollector collector(cfg, db, obfuscator, sink);

            while (!g_stop) {
                if (db.ensure_connected(cfg.connection)) {
                    try {
                        auto stats = collector.collect();
                        if (stats.ran) {
                            LOG_INF("[main] Run: %d rows scanned, %d plans collected (%lld ms)",
                                stats.rows_scanned, stats.plans_collected,
                                static_cast<long long>(stats.duration_ms));
                        }
                    } catch (const std::exception& e) {
                        // Drop the session: its state is unknown after an unclassified failure
                        LOG_ERR("[main] Collection run failed: %s", e.what());
                        db.disconnect();
                        exit_code = 2;
                    }
                } else {
                    exit_code = 2;
                }

                if (once) break;
                exit_code = 0;
                wait_interval(cfg.collection_interval_s);
            }
        } catch (const std::invalid_argument& e) {
            LOG_ERR("[main] %s", e.what());
            exit_code = 1;
        }
    }

    curl_global_cleanup();
    LOG_INF("=== plan-harvest stopped ===");
    return exit_code;
}
