// main.cpp - Main entry point
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include "conf/config.hpp"
#include "console.hpp"
#include "core/error.hpp"
#include "core/evidence.hpp"
#include "core/installation.hpp"
#include "core/json.hpp"
#include "core/repair.hpp"
#include "core/session.hpp"
#include "core/uuid.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace uuidfix;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path minecraft_dir;
    std::string version;
    std::string player;
    std::string uuid;
    bool json = false;
    bool verbose = false;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: uuidfix [OPTIONS] [command] [args...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  repair             Interactive repair loop (default action)\n";
    std::cout << "  list               List save folders and saves\n";
    std::cout << "  uuid               Resolve the player UUID and show the evidence\n";
    std::cout << "  fix <save>         Repair one save without prompts\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -d, --minecraft DIR     .minecraft folder\n";
    std::cout << "  -V, --version NAME      Game version folder (omit for shared saves)\n";
    std::cout << "  -p, --player NAME       In-game name\n";
    std::cout << "  -u, --uuid UUID         Use this UUID instead of collecting evidence\n";
    std::cout << "  -j, --json              JSON output\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nRepair renames player files in place and keeps no backup.\n";
    std::cout << "Close the game before repairing.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  uuidfix                                   # Interactive repair\n";
    std::cout << "  uuidfix -d ~/.minecraft list              # List saves\n";
    std::cout << "  uuidfix -d ~/.minecraft -V 1.20 -p Steve fix MyWorld\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"minecraft", required_argument, 0, 'd'},
                                           {"version", required_argument, 0, 'V'},
                                           {"player", required_argument, 0, 'p'},
                                           {"uuid", required_argument, 0, 'u'},
                                           {"json", no_argument, 0, 'j'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"output", required_argument, 0, 'o'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:d:V:p:u:jvo:h", long_options, &option_index)) !=
           -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'd':
            opts.minecraft_dir = strip_quotes(optarg);
            break;
        case 'V':
            opts.version = optarg;
            break;
        case 'p':
            opts.player = optarg;
            break;
        case 'u':
            opts.uuid = optarg;
            break;
        case 'j':
            opts.json = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
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

static Config load_config(const CliOptions& opts) {
    Config config;
    if (!opts.config_file.empty()) {
        config = Config::from_file(opts.config_file);
    } else {
        config = Config::load_default();
    }
    config.merge_with_cli(opts.minecraft_dir, opts.player, opts.verbose);
    return config;
}

static void print_report(const RepairReport& report) {
    std::cout << "Save: " << report.save_name << "\n";
    std::cout << "UUID: " << report.uuid << "\n";
    for (const auto& result : report.categories) {
        std::cout << "  " << result.category << ": " << repair_outcome_to_string(result.outcome);
        if (result.outcome == RepairOutcome::Renamed) {
            std::cout << " (" << result.from.filename().string() << " -> "
                      << result.to.filename().string() << ")";
        } else if (!result.message.empty()) {
            std::cout << " (" << result.message << ")";
        }
        std::cout << "\n";
    }
    std::cout << report.renamed() << " renamed, " << report.skipped() << " skipped, "
              << report.failed() << " failed\n";
}

static json::Value candidates_to_json(const Resolution& resolution) {
    json::Value root = json::Value::object();
    root["uuid"] = json::Value(resolution.uuid);
    root["manual"] = json::Value(resolution.manual);
    json::Value list = json::Value::array();
    for (const auto& candidate : resolution.candidates) {
        json::Value item = json::Value::object();
        item["uuid"] = json::Value(candidate.uuid);
        item["source"] = json::Value(evidence_source_to_string(candidate.source));
        item["origin"] = json::Value(candidate.origin.string());
        list.push_back(item);
    }
    root["candidates"] = list;
    return root;
}

static Resolution resolve_for(const Config& config, const Installation& mc,
                              const CollectionChoice& choice, Operator& op) {
    if (config.player_name.empty()) {
        LOG_WARN("No in-game name given, usercache entries are not filtered by name");
    }
    return resolve(make_evidence_context(config, mc, choice, config.player_name), op);
}

static int run_list(const Config& config, bool as_json) {
    Installation mc(config.minecraft_dir);
    std::vector<CollectionChoice> choices = enumerate_collections(mc);

    if (as_json) {
        json::Value root = json::Value::array();
        for (const auto& choice : choices) {
            json::Value item = json::Value::object();
            item["isolated"] = json::Value(choice.kind == CollectionKind::Isolated);
            item["version"] = json::Value(choice.version_name);
            item["path"] = json::Value(choice.saves.path().string());
            json::Value saves = json::Value::array();
            for (const auto& save : choice.saves.saves()) {
                saves.push_back(json::Value(save.name));
            }
            item["saves"] = saves;
            root.push_back(item);
        }
        std::cout << json::dump(root, 2) << "\n";
        return 0;
    }

    if (choices.empty()) {
        std::cout << "No save folders found.\n";
        return 0;
    }
    for (const auto& choice : choices) {
        std::cout << choice.label() << " (" << choice.saves.path().string() << ")\n";
        for (const auto& save : choice.saves.saves()) {
            std::cout << "  " << save.name << "\n";
        }
    }
    return 0;
}

static int run_uuid(const Config& config, const CliOptions& cli) {
    Installation mc(config.minecraft_dir);
    CollectionChoice choice = find_collection(mc, cli.version);
    ConsoleOperator console;
    Resolution resolution = resolve_for(config, mc, choice, console);

    if (cli.json) {
        std::cout << json::dump(candidates_to_json(resolution), 2) << "\n";
    } else {
        for (const auto& candidate : resolution.candidates) {
            std::cout << evidence_source_to_string(candidate.source) << ": " << candidate.uuid;
            if (!candidate.origin.empty()) {
                std::cout << " (" << candidate.origin.string() << ")";
            }
            std::cout << "\n";
        }
        std::cout << resolution.uuid << "\n";
    }
    return 0;
}

static int run_fix(const Config& config, const CliOptions& cli) {
    if (cli.args.empty()) {
        std::cerr << "Usage: uuidfix fix <save>\n";
        return 1;
    }
    const std::string& save_name = cli.args[0];

    Installation mc(config.minecraft_dir);
    CollectionChoice choice = find_collection(mc, cli.version);

    const SaveEntry* target = nullptr;
    std::vector<SaveEntry> saves = choice.saves.saves();
    for (const auto& save : saves) {
        if (save.name == save_name) {
            target = &save;
            break;
        }
    }
    if (!target) {
        std::cerr << "Save not found: " << save_name << " in " << choice.saves.path().string()
                  << "\n";
        return 1;
    }

    std::string uuid;
    if (!cli.uuid.empty()) {
        uuid = normalize_uuid(cli.uuid);
    } else {
        ConsoleOperator console;
        uuid = resolve_for(config, mc, choice, console).uuid;
    }

    RepairReport report = fix_save(*target, uuid);
    if (cli.json) {
        std::cout << json::dump(report.to_json(), 2) << "\n";
    } else {
        print_report(report);
    }
    return report.failed() == 0 ? 0 : 1;
}

static int run_repair_loop(const Config& config) {
    std::cout << "Repair renames player files in place and keeps no backup.\n";
    std::cout << "Close the game before continuing.\n";

    ConsoleOperator console;
    RepairSession session(config);
    session.run(console, [](const RepairReport& report) {
        print_report(report);
        std::cout << "Repair complete!\n";
    });
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        // Logging is needed before the config exists to report config errors
        Logger::getInstance().init(cli.verbose, "");
        Config config = load_config(cli);
        Logger::getInstance().init(config.verbose, config.log_file);

        enum class Command { REPAIR, LIST, UUID, FIX, CONFIG, UNKNOWN };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd.empty() || cmd == "repair")
                return Command::REPAIR;
            if (cmd == "list")
                return Command::LIST;
            if (cmd == "uuid")
                return Command::UUID;
            if (cmd == "fix")
                return Command::FIX;
            if (cmd == "config")
                return Command::CONFIG;
            return Command::UNKNOWN;
        };

        switch (get_command(cli.command)) {
        case Command::REPAIR:
            return run_repair_loop(config);

        case Command::LIST:
            return run_list(config, cli.json);

        case Command::UUID:
            return run_uuid(config, cli);

        case Command::FIX:
            return run_fix(config, cli);

        case Command::CONFIG: {
            if (cli.args.empty()) {
                std::cerr << "Usage: uuidfix config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "gen") {
                std::string output = cli.output.empty() ? CONFIG_FILENAME : cli.output;
                if (!config.save_to_file(output)) {
                    std::cerr << "Failed to write config: " << output << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output << "\n";
                return 0;
            } else if (subcmd == "show") {
                json::Value root = json::Value::object();
                root["minecraft_dir"] = json::Value(config.minecraft_dir.string());
                root["player_name"] = json::Value(config.player_name);
                json::Value scripts = json::Value::array();
                for (const auto& script : config.launcher_scripts) {
                    scripts.push_back(json::Value(script));
                }
                root["launcher_scripts"] = scripts;
                root["usercache_name"] = json::Value(config.usercache_name);
                root["include_root_usercache"] = json::Value(config.include_root_usercache);
                root["script_encoding"] = json::Value(config.script_encoding);
                root["verbose"] = json::Value(config.verbose);
                root["log_file"] = json::Value(config.log_file.string());
                std::cout << json::dump(root, 2) << "\n";
                return 0;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            std::cerr << "Available: gen, show\n";
            return 1;
        }

        case Command::UNKNOWN:
            std::cerr << "Unknown command: " << cli.command << "\n";
            print_help();
            return 1;
        }
    } catch (const FixError& e) {
        LOG_ERROR(error_kind_to_string(e.kind()) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
