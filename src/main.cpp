#include "analytics_client.hpp"
#include "brew_error.hpp"
#include "brew_service.hpp"
#include "config.hpp"
#include "console.hpp"
#include "mas_service.hpp"
#include "proxy.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

void print_usage() {
    std::cout << "Usage: brewline [--verbose] <command> [arguments]\n\n"
              << "Packages:\n"
              << "  list                       List installed formulae\n"
              << "  casks                      List installed casks\n"
              << "  search <query>             Search formulae and casks\n"
              << "  info <name> [--cask]       Show package details\n"
              << "  install <name>... [--cask] Install packages\n"
              << "  reinstall <name> [--cask]  Reinstall a package\n"
              << "  uninstall <name>... [--cask]\n"
              << "                             Uninstall packages\n"
              << "  upgrade [name...]          Upgrade packages (all when none given)\n"
              << "  outdated                   List outdated packages\n"
              << "  status                     Summary of installed, outdated and pinned packages\n"
              << "  deps <name>                Show the dependency tree\n"
              << "  uses <name>                List installed dependents\n"
              << "  leaves                     List packages nothing depends on\n"
              << "  pinned | pin <name> | unpin <name>\n\n"
              << "Maintenance:\n"
              << "  update                     Update Homebrew\n"
              << "  cleanup [--dry-run]        Remove old versions\n"
              << "  clear-cache                Prune the whole download cache\n"
              << "  doctor                     Run diagnostics\n"
              << "  disk-usage                 Show cache, Cellar and Caskroom sizes\n"
              << "  analytics [on|off]         Show or change analytics state\n"
              << "  services                   List services\n"
              << "  service <start|stop|restart> <name>\n"
              << "  taps | tap <name> | untap <name> | tap-info <name>\n"
              << "  bundle-dump                Print a Brewfile of what is installed\n"
              << "  bundle-install <file>      Install everything in a Brewfile\n"
              << "  quarantine                 List quarantined applications\n"
              << "  unquarantine <app path>    Clear the quarantine attribute\n"
              << "  cask-path <cask>           Show where a cask's app is installed\n"
              << "  popular [--by-category]    Most installed packages (last 30 days)\n"
              << "  version                    Show Homebrew version and prefix\n\n"
              << "Mac App Store:\n"
              << "  mas-list | mas-outdated | mas-search <query> | mas-install <id> | mas-upgrade\n\n"
              << "Configuration is read from $BREWLINE_CONFIG or ~/.config/brewline/config.json.\n"
              << "Set BREWLINE_DEBUG=1 or pass --verbose to log every command run.\n";
}

static void print_stream(OutputStream& stream) {
    while (auto chunk = stream.next()) {
        std::cout << *chunk << std::flush;
    }
}

static std::string format_date(const TimePoint& time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

static void print_tree(const std::vector<DependencyNode>& nodes, const std::string& indent) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        bool last = i + 1 == nodes.size();
        std::cout << indent << (last ? "└── " : "├── ") << nodes[i].name << "\n";
        print_tree(nodes[i].children, indent + (last ? "    " : "│   "));
    }
}

static void print_names(const std::vector<std::string>& names) {
    for (const auto& name : names) std::cout << name << "\n";
}

static bool require_argument(const std::vector<std::string>& args, size_t count, const std::string& command) {
    if (args.size() >= count) return true;
    print_error("Missing argument for " + command + " command");
    print_usage();
    return false;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    bool cask = false;
    bool dry_run = false;
    bool by_category = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--cask") cask = true;
        else if (arg == "--dry-run") dry_run = true;
        else if (arg == "--by-category") by_category = true;
        else if (arg == "--verbose" || arg == "-v") verbose = true;
        else args.push_back(arg);
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        Config config = Config::load();
        set_verbose(verbose || config.verbose);

        LocalProcessRunner runner(RunnerOptions{config.path_prefixes, {}});
        if (config.use_system_proxy) {
            runner.set_proxy_environment(discover_proxy_environment(runner, config.scutil_path));
        }
        BrewPathResolver resolver(config.brew_paths);
        BrewService brew(runner, resolver, config.application_dirs);
        MasService mas(runner, config.mas_path, config.path_prefixes);

        if (command == "help" || command == "--help" || command == "-h") {
            print_usage();
            return 0;
        }
        else if (command == "list") {
            for (const auto& formula : brew.installed_formulae()) {
                std::cout << formula.name << " " << GREEN << formula.version << RESET
                          << (formula.installed_as_dependency ? GRAY + " (dependency)" + RESET : "") << "\n";
            }
        }
        else if (command == "casks") {
            for (const auto& c : brew.installed_casks()) {
                std::cout << c.token << " " << GREEN << c.version << RESET
                          << " " << c.display_name() << "\n";
            }
        }
        else if (command == "search") {
            if (!require_argument(rest, 1, command)) return 1;
            SearchResults results = brew.search(rest[0]);
            if (results.empty()) {
                print_info("No packages found for '" + rest[0] + "'");
                return 0;
            }
            print_info("Formulae");
            print_names(results.formulae);
            print_info("Casks");
            print_names(results.casks);
        }
        else if (command == "info") {
            if (!require_argument(rest, 1, command)) return 1;
            if (cask) {
                Cask info = brew.cask_info(rest[0]);
                std::cout << info.display_name() << " (" << info.token << ") " << info.version << "\n"
                          << info.description.value_or("") << "\n"
                          << info.homepage.value_or("") << "\n";
            } else {
                Formula info = brew.formula_info(rest[0]);
                std::cout << info.full_name << " " << info.version << "\n"
                          << info.description.value_or("") << "\n"
                          << info.homepage.value_or("") << "\n";
                if (!info.dependencies.empty()) {
                    std::cout << "Dependencies: " << join(info.dependencies, ", ") << "\n";
                }
                if (info.installed_on) {
                    std::cout << "Installed on " << format_date(*info.installed_on) << "\n";
                }
            }
        }
        else if (command == "install") {
            if (!require_argument(rest, 1, command)) return 1;
            auto stream = rest.size() == 1 ? brew.install(rest[0], cask) : brew.install_many(rest, cask);
            print_stream(*stream);
        }
        else if (command == "reinstall") {
            if (!require_argument(rest, 1, command)) return 1;
            print_stream(*brew.reinstall(rest[0], cask));
        }
        else if (command == "uninstall") {
            if (!require_argument(rest, 1, command)) return 1;
            if (rest.size() == 1) {
                brew.uninstall(rest[0], cask);
                print_success(rest[0] + " uninstalled successfully");
            } else {
                print_stream(*brew.uninstall_many(rest, cask));
            }
        }
        else if (command == "upgrade") {
            auto stream = rest.size() > 1 ? brew.upgrade_many(rest) : brew.upgrade(rest.empty() ? "" : rest[0]);
            print_stream(*stream);
        }
        else if (command == "outdated") {
            for (const auto& package : brew.outdated()) {
                std::cout << package.name << " " << YELLOW << package.installed_version << RESET
                          << " -> " << GREEN << package.current_version << RESET
                          << (package.is_cask ? " [cask]" : "")
                          << (package.pinned ? " [pinned]" : "") << "\n";
            }
        }
        else if (command == "status") {
            BrewSnapshot snapshot = brew.snapshot();
            std::cout << "Formulae: " << snapshot.formulae.size() << "\n"
                      << "Casks:    " << snapshot.casks.size() << "\n"
                      << "Outdated: " << snapshot.outdated.size() << "\n"
                      << "Pinned:   " << snapshot.pinned.size() << "\n";
        }
        else if (command == "deps") {
            if (!require_argument(rest, 1, command)) return 1;
            DependencyTree tree = brew.dependency_tree(rest[0]);
            std::cout << tree.package_name << "\n";
            print_tree(tree.dependencies, "");
        }
        else if (command == "uses") {
            if (!require_argument(rest, 1, command)) return 1;
            print_names(brew.dependents(rest[0]));
        }
        else if (command == "leaves") {
            for (const auto& name : brew.leaves()) std::cout << name << "\n";
        }
        else if (command == "pinned") {
            print_names(brew.pinned());
        }
        else if (command == "pin" || command == "unpin") {
            if (!require_argument(rest, 1, command)) return 1;
            if (command == "pin") brew.pin(rest[0]);
            else brew.unpin(rest[0]);
            print_success(rest[0] + (command == "pin" ? " pinned" : " unpinned"));
        }
        else if (command == "update") {
            print_progress("Updating Homebrew", 0);
            brew.update();
            print_progress("Updating Homebrew", 100);
            print_success("Homebrew is up to date");
        }
        else if (command == "cleanup") {
            CleanupResult result = brew.cleanup(dry_run);
            if (result.empty()) {
                print_success("Nothing to clean up");
                return 0;
            }
            for (const auto& name : result.formulae_removed) std::cout << "formula " << name << "\n";
            for (const auto& name : result.casks_removed) std::cout << "cask    " << name << "\n";
            print_success((dry_run ? "Would free " : "Freed ") + format_bytes(result.bytes_freed));
        }
        else if (command == "clear-cache") {
            print_stream(*brew.clear_cache());
        }
        else if (command == "doctor") {
            auto issues = brew.doctor();
            if (issues.empty()) {
                print_success("Your system is ready to brew.");
                return 0;
            }
            for (const auto& issue : issues) {
                const std::string& color = issue.severity == Severity::Error ? RED : YELLOW;
                std::cout << color << "[" << issue.category << "] " << RESET << issue.message << "\n";
            }
        }
        else if (command == "disk-usage") {
            DiskUsageInfo usage = brew.disk_usage();
            std::cout << "Cache:    " << format_bytes(usage.cache_size) << "\n"
                      << "Cellar:   " << format_bytes(usage.cellar_size) << "\n"
                      << "Caskroom: " << format_bytes(usage.caskroom_size) << "\n"
                      << "Total:    " << format_bytes(usage.total_size()) << "\n";
        }
        else if (command == "analytics") {
            if (!rest.empty()) {
                if (rest[0] != "on" && rest[0] != "off") {
                    print_error("analytics takes 'on' or 'off'");
                    return 1;
                }
                brew.set_analytics(rest[0] == "on");
            }
            std::cout << "Analytics are " << (brew.analytics_enabled() ? "enabled" : "disabled") << "\n";
        }
        else if (command == "services") {
            for (const auto& service : brew.services()) {
                std::cout << service.name << " " << (service.is_active() ? GREEN : GRAY)
                          << to_string(service.status) << RESET
                          << " " << service.user.value_or("") << "\n";
            }
        }
        else if (command == "service") {
            if (!require_argument(rest, 2, command)) return 1;
            ServiceAction action;
            if (rest[0] == "start") action = ServiceAction::Start;
            else if (rest[0] == "stop") action = ServiceAction::Stop;
            else if (rest[0] == "restart") action = ServiceAction::Restart;
            else {
                print_error("Unknown service action '" + rest[0] + "'");
                return 1;
            }
            brew.control_service(rest[1], action);
            print_success(rest[1] + ": " + to_string(action) + " done");
        }
        else if (command == "taps") {
            for (const auto& tap : brew.taps()) {
                std::cout << tap.name << " (" << tap.formula_count << " formulae, "
                          << tap.cask_count << " casks)" << (tap.official ? " [official]" : "") << "\n";
            }
        }
        else if (command == "tap-info") {
            if (!require_argument(rest, 1, command)) return 1;
            TapInfo tap = brew.tap_info(rest[0]);
            std::cout << tap.name << "\n" << tap.path << "\n" << tap.remote.value_or("") << "\n"
                      << tap.total_count() << " items\n";
        }
        else if (command == "tap" || command == "untap") {
            if (!require_argument(rest, 1, command)) return 1;
            if (command == "tap") brew.add_tap(rest[0]);
            else brew.remove_tap(rest[0]);
            print_success(rest[0] + (command == "tap" ? " tapped" : " untapped"));
        }
        else if (command == "bundle-dump") {
            std::cout << brew.export_brewfile();
        }
        else if (command == "bundle-install") {
            if (!require_argument(rest, 1, command)) return 1;
            print_stream(*brew.import_brewfile_from_path(rest[0]));
        }
        else if (command == "quarantine") {
            for (const auto& app : brew.quarantined_apps()) {
                std::cout << app.name << " " << GRAY << app.path << RESET;
                if (app.cask_name) std::cout << " [" << *app.cask_name << "]";
                if (app.quarantine_date) std::cout << " since " << format_date(*app.quarantine_date);
                std::cout << "\n";
            }
        }
        else if (command == "unquarantine") {
            if (!require_argument(rest, 1, command)) return 1;
            brew.remove_quarantine(rest[0]);
            print_success("Quarantine removed from " + rest[0]);
        }
        else if (command == "cask-path") {
            if (!require_argument(rest, 1, command)) return 1;
            auto path = brew.cask_install_path(rest[0]);
            if (!path) {
                print_error("No installed application found for cask '" + rest[0] + "'");
                return 1;
            }
            std::cout << *path << "\n";
        }
        else if (command == "popular") {
            AnalyticsClient analytics(config.analytics_formula_url, config.analytics_cask_url);
            if (by_category) {
                for (const auto& [category, packages] : analytics.popular_by_category()) {
                    print_info(to_string(category));
                    for (const auto& package : packages) {
                        std::cout << "  " << package.name << " " << package.install_count << "\n";
                    }
                }
            } else {
                for (const auto& package : analytics.popular_packages()) {
                    std::cout << package.name << (package.is_cask ? " [cask] " : " ")
                              << package.install_count << "\n";
                }
            }
        }
        else if (command == "version") {
            auto version = resolver.version(runner);
            if (!version) throw BrewNotInstalled();
            std::cout << "Homebrew " << *version << "\n"
                      << "Prefix: " << resolver.prefix(runner).value_or("unknown") << "\n";
        }
        else if (command == "mas-list") {
            for (const auto& app : mas.installed_apps()) {
                std::cout << app.id << " " << app.name << " (" << app.version << ")\n";
            }
        }
        else if (command == "mas-outdated") {
            for (const auto& app : mas.outdated_apps()) {
                std::cout << app.id << " " << app.name << " (" << app.installed_version
                          << " -> " << app.available_version << ")\n";
            }
        }
        else if (command == "mas-search") {
            if (!require_argument(rest, 1, command)) return 1;
            for (const auto& app : mas.search(rest[0])) {
                std::cout << app.id << " " << app.name << " (" << app.version << ")\n";
            }
        }
        else if (command == "mas-install") {
            if (!require_argument(rest, 1, command)) return 1;
            print_stream(*mas.install(std::stoll(rest[0])));
        }
        else if (command == "mas-upgrade") {
            print_stream(*mas.upgrade_all());
        }
        else {
            print_error("Unknown command '" + command + "'");
            print_usage();
            return 1;
        }
    }
    catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
    return 0;
}
