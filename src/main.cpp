// main.cpp - Main entry point
#include <getopt.h>
#include <signal.h>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>
#include "conf/config.hpp"
#include "conf/config_store.hpp"
#include "core/backup.hpp"
#include "core/config_schema.hpp"
#include "core/container_gateway.hpp"
#include "core/docker_orchestrator.hpp"
#include "core/errors.hpp"
#include "core/lifecycle.hpp"
#include "core/registry.hpp"
#include "core/serialize.hpp"
#include "core/sessions.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace sparkbox;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path root;
    std::string socket;
    fs::path log_file;
    bool verbose = false;
    bool plain = false;
    std::vector<std::string> args;
};

// Exit codes, one per error class
enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_VALIDATION = 2,
    EXIT_PRECONDITION = 3,
    EXIT_NOT_FOUND = 4,
    EXIT_AUTHENTICATION = 5,
    EXIT_FATAL = 6,
    EXIT_RUNTIME = 7,
};

static void print_help() {
    std::cout << "Usage: sparkboxd [OPTIONS] <command> [args...]\n\n";
    std::cout << "Module Commands (module <subcommand>):\n";
    std::cout << "  module list              List modules with enabled state\n";
    std::cout << "  module store             Full module metadata\n";
    std::cout << "  module enable <id>       Enable and deploy a module\n";
    std::cout << "  module disable <id>      Disable a module and remove its containers\n\n";

    std::cout << "Configuration Commands (config <subcommand>):\n";
    std::cout << "  config show              Show live configuration (secrets masked)\n";
    std::cout << "  config schema            Show editable configuration fields\n";
    std::cout << "  config set KEY=VALUE...  Update allowlisted keys\n";
    std::cout << "  config gen               Generate default daemon config file\n\n";

    std::cout << "Backup Commands (backup <subcommand>):\n";
    std::cout << "  backup create [--plain]  Create a backup (encrypted if a key is set)\n";
    std::cout << "  backup list              List backups, newest first\n";
    std::cout << "  backup fetch <file>      Resolve a backup for download\n";
    std::cout << "  backup delete <file>     Delete a backup\n";
    std::cout << "  backup prune <keep>      Keep only the newest <keep> backups\n\n";

    std::cout << "Container Commands (container <subcommand>):\n";
    std::cout << "  container list           List managed containers\n";
    std::cout << "  container stats <id>     CPU, memory and network usage\n";
    std::cout << "  container start <id>\n";
    std::cout << "  container stop <id>\n";
    std::cout << "  container restart <id>\n";
    std::cout << "  container logs <id>      Follow container logs\n\n";

    std::cout << "Other Commands:\n";
    std::cout << "  status watch             Print container status periodically\n";
    std::cout << "  system info              Container engine summary\n";
    std::cout << "  system stats             Host CPU, memory, disk and uptime\n";
    std::cout << "  system watch             Print host stats periodically\n";
    std::cout << "  update                   Pull images and recreate enabled modules\n\n";

    std::cout << "Options:\n";
    std::cout << "  -r, --root DIR          SparkBox root (default $SB_ROOT or "
              << DEFAULT_ROOT << ")\n";
    std::cout << "  -c, --config FILE       Daemon config file path\n";
    std::cout << "  -s, --socket PATH       Docker socket path\n";
    std::cout << "  -l, --log FILE          Append log to FILE\n";
    std::cout << "  -p, --plain             Do not encrypt (backup create)\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -h, --help              Show this help\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"root", required_argument, 0, 'r'},
                                           {"config", required_argument, 0, 'c'},
                                           {"socket", required_argument, 0, 's'},
                                           {"log", required_argument, 0, 'l'},
                                           {"plain", no_argument, 0, 'p'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "r:c:s:l:pvh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'r':
            opts.root = optarg;
            break;
        case 'c':
            opts.config_file = optarg;
            break;
        case 's':
            opts.socket = optarg;
            break;
        case 'l':
            opts.log_file = optarg;
            break;
        case 'p':
            opts.plain = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(EXIT_USAGE);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& cli) {
    fs::path root = cli.root;
    if (root.empty()) {
        const char* env_root = std::getenv("SB_ROOT");
        root = (env_root && *env_root) ? fs::path(env_root) : fs::path(DEFAULT_ROOT);
    }

    Config config = cli.config_file.empty() ? Config::load_default(root)
                                            : Config::from_file(cli.config_file);
    if (config.root.empty()) {
        config.root = root;
    }
    config.merge_with_cli(cli.root, cli.socket, cli.log_file, cli.verbose);
    return config;
}

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static bool is_long_running(const CliOptions& cli) {
    if (cli.command == "status")
        return true;
    if (cli.args.empty())
        return false;
    return (cli.command == "container" && cli.args[0] == "logs") ||
           (cli.command == "backup" && cli.args[0] == "fetch") ||
           (cli.command == "system" && cli.args[0] == "watch");
}

// Blocks until SIGINT/SIGTERM, or until timeout_sec passes when positive.
// The signals must already be blocked in every thread.
static void wait_for_signal(const sigset_t& signals, int timeout_sec) {
    if (timeout_sec <= 0) {
        int sig = 0;
        sigwait(&signals, &sig);
        LOG_DEBUG("Received signal " + std::to_string(sig));
        return;
    }
    struct timespec ts;
    ts.tv_sec = timeout_sec;
    ts.tv_nsec = 0;
    sigtimedwait(&signals, nullptr, &ts);
}

static ConfigValues parse_assignments(const std::vector<std::string>& args, size_t first) {
    ConfigValues updates;
    for (size_t i = first; i < args.size(); ++i) {
        auto eq = args[i].find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ValidationError("Expected KEY=VALUE, got \"" + args[i] + "\"");
        }
        updates[args[i].substr(0, eq)] = args[i].substr(eq + 1);
    }
    if (updates.empty()) {
        throw ValidationError("No configuration values given");
    }
    return updates;
}

static const std::string& require_arg(const CliOptions& cli, size_t index,
                                      const std::string& usage) {
    if (cli.args.size() <= index) {
        throw ValidationError("Usage: sparkboxd " + usage);
    }
    return cli.args[index];
}

static int run(const CliOptions& cli, const Config& config, const sigset_t& signals) {
    ModuleRegistry registry(config.modules_dir());
    DockerOrchestrator orchestrator(config.docker_socket, config.root,
                                    config.deploy_script());
    ModuleLifecycleManager lifecycle(registry, orchestrator,
                                     config.enabled_modules_file());
    ConfigStore store(config.env_file());
    ConfigSchemaBuilder schema(lifecycle);
    ContainerGateway gateway(orchestrator, config.container_prefix);

    enum class Command { MODULE, CONFIG, BACKUP, CONTAINER, STATUS, SYSTEM, UPDATE, UNKNOWN };

    auto get_command = [](const std::string& cmd) -> Command {
        if (cmd == "module")
            return Command::MODULE;
        if (cmd == "config")
            return Command::CONFIG;
        if (cmd == "backup")
            return Command::BACKUP;
        if (cmd == "container")
            return Command::CONTAINER;
        if (cmd == "status")
            return Command::STATUS;
        if (cmd == "system")
            return Command::SYSTEM;
        if (cmd == "update")
            return Command::UPDATE;
        return Command::UNKNOWN;
    };

    switch (get_command(cli.command)) {
    case Command::MODULE: {
        const std::string& subcmd = require_arg(cli, 0, "module <list|store|enable|disable>");

        if (subcmd == "list") {
            print_json(module_summary(lifecycle.list()));
        } else if (subcmd == "store") {
            print_json(module_store(lifecycle.list()));
        } else if (subcmd == "enable") {
            const std::string& id = require_arg(cli, 1, "module enable <id>");
            bool changed = lifecycle.enable(id);
            print_json({{"module", id}, {"enabled", true}, {"changed", changed}});
        } else if (subcmd == "disable") {
            const std::string& id = require_arg(cli, 1, "module disable <id>");
            print_json(lifecycle.disable(id));
        } else {
            std::cerr << "Unknown module subcommand: " << subcmd << "\n";
            return EXIT_USAGE;
        }
        return EXIT_OK;
    }

    case Command::CONFIG: {
        const std::string& subcmd = require_arg(cli, 0, "config <show|schema|set|gen>");

        if (subcmd == "show") {
            print_json(store.read_masked());
        } else if (subcmd == "schema") {
            print_json({{"groups", schema.schema()}, {"allowed_keys", schema.allowed_keys()}});
        } else if (subcmd == "set") {
            ConfigValues updates = parse_assignments(cli.args, 1);
            schema.apply_update(store, updates);
            json keys = json::array();
            for (const auto& entry : updates)
                keys.push_back(entry.first);
            print_json({{"updated", keys}});
        } else if (subcmd == "gen") {
            fs::path output = cli.args.size() > 1 ? fs::path(cli.args[1])
                                                  : config.root / DAEMON_CONFIG_FILE;
            if (!config.save_to_file(output)) {
                throw FatalError("Failed to write " + output.string());
            }
            print_json({{"config", output.string()}});
        } else {
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            return EXIT_USAGE;
        }
        return EXIT_OK;
    }

    case Command::BACKUP: {
        const std::string& subcmd =
            require_arg(cli, 0, "backup <create|list|fetch|delete|prune>");
        BackupEngine backups(config.root, config.backups_dir(), store,
                             std::chrono::seconds(config.decrypt_ttl));

        if (subcmd == "create") {
            print_json(backups.create(!cli.plain));
        } else if (subcmd == "list") {
            print_json(backups.list());
        } else if (subcmd == "fetch") {
            const std::string& file = require_arg(cli, 1, "backup fetch <file>");
            if (!BackupEngine::is_encrypted_filename(file)) {
                print_json({{"path", backups.get_path(file).string()}, {"temporary", false}});
                return EXIT_OK;
            }
            fs::path plain = backups.decrypt(file);
            print_json({{"path", plain.string()},
                        {"temporary", true},
                        {"expires_in", config.decrypt_ttl}});
            // The decrypted copy lives until the ttl passes or we are stopped.
            wait_for_signal(signals, config.decrypt_ttl);
        } else if (subcmd == "delete") {
            const std::string& file = require_arg(cli, 1, "backup delete <file>");
            backups.remove(file);
            print_json({{"deleted", file}});
        } else if (subcmd == "prune") {
            const std::string& keep_arg = require_arg(cli, 1, "backup prune <keep>");
            int keep = 0;
            try {
                keep = std::stoi(keep_arg);
            } catch (const std::exception&) {
                throw ValidationError("Invalid keep count: " + keep_arg);
            }
            if (keep < 0) {
                throw ValidationError("Invalid keep count: " + keep_arg);
            }
            print_json({{"deleted", backups.prune(static_cast<size_t>(keep))}});
        } else {
            std::cerr << "Unknown backup subcommand: " << subcmd << "\n";
            return EXIT_USAGE;
        }
        return EXIT_OK;
    }

    case Command::CONTAINER: {
        const std::string& subcmd =
            require_arg(cli, 0, "container <list|stats|start|stop|restart|logs>");

        if (subcmd == "list") {
            print_json(gateway.list());
            return EXIT_OK;
        }

        const std::string& id = require_arg(cli, 1, "container " + subcmd + " <id>");
        if (subcmd == "stats") {
            print_json(gateway.stats(id));
        } else if (subcmd == "start") {
            gateway.start(id);
            print_json({{"container", id}, {"action", "start"}});
        } else if (subcmd == "stop") {
            gateway.stop(id);
            print_json({{"container", id}, {"action", "stop"}});
        } else if (subcmd == "restart") {
            gateway.restart(id);
            print_json({{"container", id}, {"action", "restart"}});
        } else if (subcmd == "logs") {
            SessionHub hub(gateway, std::chrono::seconds(config.status_interval), config.log_tail);
            hub.subscribe_logs("cli", id, [](const std::string&, const std::string& line) {
                std::cout << line << std::flush;
            });
            wait_for_signal(signals, 0);
            hub.disconnect("cli");
        } else {
            std::cerr << "Unknown container subcommand: " << subcmd << "\n";
            return EXIT_USAGE;
        }
        return EXIT_OK;
    }

    case Command::STATUS: {
        SessionHub hub(gateway, std::chrono::seconds(config.status_interval), config.log_tail);
        hub.subscribe_status(
            "cli",
            [](const std::vector<ContainerInfo>& containers) {
                std::cout << json(containers).dump() << std::endl;
            },
            [](const std::string& message) {
                std::cout << json{{"error", message}}.dump() << std::endl;
            });
        wait_for_signal(signals, 0);
        hub.disconnect("cli");
        return EXIT_OK;
    }

    case Command::SYSTEM: {
        const std::string& subcmd = require_arg(cli, 0, "system <info|stats|watch>");
        if (subcmd == "info") {
            print_json(gateway.system_info());
        } else if (subcmd == "stats") {
            print_json(read_host_stats());
        } else if (subcmd == "watch") {
            SessionHub hub(gateway, std::chrono::seconds(config.status_interval), config.log_tail,
                           std::chrono::seconds(config.hoststats_interval));
            hub.subscribe_host_stats("cli", [](const HostStats& stats) {
                std::cout << json(stats).dump() << std::endl;
            });
            wait_for_signal(signals, 0);
            hub.disconnect("cli");
        } else {
            std::cerr << "Unknown system subcommand: " << subcmd << "\n";
            return EXIT_USAGE;
        }
        return EXIT_OK;
    }

    case Command::UPDATE:
        orchestrator.update_all();
        print_json({{"updated", true}});
        return EXIT_OK;

    case Command::UNKNOWN:
    default:
        std::cerr << "Unknown command: " << cli.command << "\n";
        print_help();
        return EXIT_USAGE;
    }
}

static int report(int code, const std::string& message) {
    LOG_DEBUG("Exiting with " + std::to_string(code) + ": " + message);
    std::cout << json{{"error", message}}.dump(2) << std::endl;
    return code;
}

int main(int argc, char* argv[]) {
    CliOptions cli = parse_args(argc, argv);

    if (cli.command.empty()) {
        print_help();
        return EXIT_OK;
    }

    // Streaming commands wait for these signals; block them before any
    // worker thread starts so only sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (is_long_running(cli)) {
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    }

    try {
        Config config = load_config(cli);
        Logger::getInstance().init(config.verbose, config.log_file);
        LOG_DEBUG("SparkBox root: " + config.root.string());
        return run(cli, config, signals);
    } catch (const ValidationError& e) {
        return report(EXIT_VALIDATION, e.what());
    } catch (const PreconditionError& e) {
        return report(EXIT_PRECONDITION, e.what());
    } catch (const NotFoundError& e) {
        return report(EXIT_NOT_FOUND, e.what());
    } catch (const AuthenticationError& e) {
        return report(EXIT_AUTHENTICATION, e.what());
    } catch (const FatalError& e) {
        LOG_ERROR(std::string("Fatal Error: ") + e.what());
        return report(EXIT_FATAL, e.what());
    } catch (const RuntimeError& e) {
        LOG_ERROR(e.what());
        return report(EXIT_RUNTIME, e.what());
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return report(EXIT_FATAL, e.what());
    }
}
