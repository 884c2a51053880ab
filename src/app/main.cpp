/**
 * @file main.cpp
 * @brief BeaconMesh daemon and control client entry point.
 * @author BeaconMesh contributors
 *
 *   beaconmesh run       Config → Logger → Journal → Coordinator → Control endpoint
 *   beaconmesh port ...  One request to the running daemon's control endpoint
 *   beaconmesh peers
 *   beaconmesh discover
 */

#include "app/control_server.hpp"
#include "cluster/frame_transport.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "host/host_probe.hpp"
#include "telemetry/event_journal.hpp"
#include "telemetry/json_sink.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace beacon_mesh;

namespace {

constexpr int EXIT_RUNTIME_FAILURE = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr uint32_t CONTROL_TIMEOUT_MS = 5000;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::string command;
    std::vector<std::string> operands;
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::string machine_id;
    std::string log_dir;
};

void print_usage() {
    std::cout << "Usage: beaconmesh <command> [OPTIONS]\n"
              << "Commands:\n"
              << "  run                               Run the discovery daemon\n"
              << "  peers                             List known peers\n"
              << "  discover                          Broadcast now and list new peers\n"
              << "  port check <port>\n"
              << "  port claim <port> <service> [pid]\n"
              << "  port release <port>\n"
              << "  port validate <service> [port]\n"
              << "  port suggest <service>\n"
              << "  port status\n"
              << "Options:\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --machine-id <id>    Override the generated machine id\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --help, -h           Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--machine-id" && i + 1 < argc) {
            args.machine_id = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }
    return args;
}

/**
 * @brief The config file is optional unless named explicitly.
 */
Result<Config> resolve_config(const CLIArgs& args) {
    if (!args.config_given && !std::filesystem::exists(args.config_path)) {
        return default_config();
    }
    return load_config(args.config_path);
}

std::optional<int> parse_int(const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/**
 * @brief Map `port <op> ...` operands onto a control request.
 */
Result<nlohmann::json> build_port_request(const std::vector<std::string>& operands) {
    if (operands.empty()) {
        return Error{ErrorKind::ConfigurationError, "port: missing operation"};
    }
    const auto& op = operands[0];
    auto number = [&](size_t index) -> std::optional<int> {
        if (index >= operands.size()) return std::nullopt;
        return parse_int(operands[index]);
    };

    if (op == "check" || op == "release") {
        auto port = number(1);
        if (!port) return Error{ErrorKind::ConfigurationError, "port " + op + ": expected <port>"};
        return nlohmann::json{{"op", op == "check" ? "check_port" : "release_port"}, {"port", *port}};
    }
    if (op == "claim") {
        auto port = number(1);
        if (!port || operands.size() < 3) {
            return Error{ErrorKind::ConfigurationError, "port claim: expected <port> <service> [pid]"};
        }
        nlohmann::json request = {{"op", "claim_port"}, {"port", *port}, {"service", operands[2]}};
        if (auto pid = number(3)) request["pid"] = *pid;
        return request;
    }
    if (op == "validate" || op == "suggest") {
        if (operands.size() < 2) {
            return Error{ErrorKind::ConfigurationError, "port " + op + ": expected <service>"};
        }
        nlohmann::json request = {{"op", op == "validate" ? "validate_service" : "suggest_port"},
                                  {"service", operands[1]}};
        if (op == "validate") {
            if (auto port = number(2)) request["port"] = *port;
        }
        return request;
    }
    if (op == "status") {
        return nlohmann::json{{"op", "get_port_status"}};
    }
    return Error{ErrorKind::ConfigurationError, "port: unknown operation '" + op + "'"};
}

/**
 * @brief Send one request to the local daemon and print the reply.
 */
int run_client(const Config& config, const nlohmann::json& request, uint32_t timeout_ms) {
    auto reply = request_reply("127.0.0.1", config.ports.control_port, request.dump(), timeout_ms);
    if (!reply) {
        std::cerr << "Daemon not reachable on 127.0.0.1:" << config.ports.control_port
                  << ": " << reply.error().message << std::endl;
        return EXIT_RUNTIME_FAILURE;
    }

    auto parsed = nlohmann::json::parse(*reply, nullptr, false);
    if (parsed.is_discarded()) {
        std::cerr << "Malformed reply from daemon" << std::endl;
        return EXIT_RUNTIME_FAILURE;
    }
    std::cout << parsed.dump(2) << std::endl;

    bool failed = parsed.contains("error")
               || !parsed.value("success", true);
    return failed ? EXIT_RUNTIME_FAILURE : 0;
}

int run_daemon(Config config, const CLIArgs& args) {
    if (!args.machine_id.empty()) config.node.machine_id = args.machine_id;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "beaconmesh",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level);

    // ── Initialize Event Journal ─────────────
    std::unique_ptr<ILogSink> event_sink;
    if (!config.telemetry.event_log.empty()) {
        auto event_path = config.telemetry.event_log;
        auto dir = event_path.has_parent_path() ? event_path.parent_path() : std::filesystem::path{"."};
        event_sink = std::make_unique<JsonFileSink>(dir, event_path.stem().string(),
                                                    config.telemetry.max_file_size_mb,
                                                    config.telemetry.rotate_count);
    } else {
        event_sink = std::make_unique<NullSink>();
    }
    EventJournal journal(std::move(event_sink));

    auto local = describe_local_machine(config.node);
    logger.info("main", "BeaconMesh starting as " + local.machine_id
                        + " in cluster " + local.cluster_name);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Start Coordinator ────────────────────
    DiscoveryCoordinator coordinator(config, local, logger, &journal);
    if (auto started = coordinator.start(); !started) {
        logger.error("main", "Startup failed: " + started.error().message);
        logger.flush();
        return started.error().is(ErrorKind::ConfigurationError) ? EXIT_CONFIG_ERROR
                                                                 : EXIT_RUNTIME_FAILURE;
    }

    ControlServer control(coordinator, logger);
    if (auto serving = control.start(config.ports.control_port); !serving) {
        logger.warn("main", "Control endpoint unavailable: " + serving.error().message);
    }

    logger.info("main", "Running. Press Ctrl+C to shutdown.");
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("main", "Shutdown requested");
    control.stop();
    coordinator.stop();
    journal.flush();
    logger.info("main", "BeaconMesh stopped");
    logger.flush();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.command.empty()) {
        print_usage();
        return EXIT_CONFIG_ERROR;
    }

    auto config = resolve_config(args);
    if (!config) {
        std::cerr << "Failed to load config: " << config.error().message << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    if (args.command == "run") {
        return run_daemon(*config, args);
    }
    if (args.command == "peers") {
        return run_client(*config, {{"op", "list_peers"}}, CONTROL_TIMEOUT_MS);
    }
    if (args.command == "discover") {
        return run_client(*config, {{"op", "discover_now"}},
                          config->discovery.discover_window_ms + CONTROL_TIMEOUT_MS);
    }
    if (args.command == "port") {
        auto request = build_port_request(args.operands);
        if (!request) {
            std::cerr << request.error().message << std::endl;
            return EXIT_CONFIG_ERROR;
        }
        return run_client(*config, *request, CONTROL_TIMEOUT_MS);
    }

    std::cerr << "Unknown command '" << args.command << "'" << std::endl;
    print_usage();
    return EXIT_CONFIG_ERROR;
}
