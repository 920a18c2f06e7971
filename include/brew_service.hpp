#pragma once

#include "models.hpp"
#include "path_resolver.hpp"
#include "process_runner.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

// Read-only state fetched in one go.
struct BrewSnapshot {
    std::vector<Formula> formulae;
    std::vector<Cask> casks;
    std::vector<OutdatedPackage> outdated;
    std::vector<std::string> pinned;
};

// Typed front for the `brew` command line. Every method builds one argument
// vector, runs it and hands the output to the matching parser. Failures are
// thrown as BrewError subclasses.
class BrewService {
public:
    BrewService(ProcessRunner& runner,
                BrewPathResolver& resolver,
                std::vector<std::string> application_dirs);

    std::vector<Formula> installed_formulae();
    std::vector<Cask> installed_casks();
    SearchResults search(const std::string& query);
    Formula formula_info(const std::string& name);
    Cask cask_info(const std::string& name);

    OutputStreamPtr install(const std::string& name, bool is_cask);
    OutputStreamPtr reinstall(const std::string& name, bool is_cask);
    void uninstall(const std::string& name, bool is_cask);
    // Upgrades everything when name is empty.
    OutputStreamPtr upgrade(const std::string& name = "");
    std::vector<OutdatedPackage> outdated();

    OutputStreamPtr install_many(std::vector<std::string> names, bool are_casks);
    OutputStreamPtr uninstall_many(std::vector<std::string> names, bool are_casks);
    OutputStreamPtr upgrade_many(std::vector<std::string> names);

    CleanupResult cleanup(bool dry_run);
    OutputStreamPtr clear_cache();
    std::vector<DiagnosticIssue> doctor();
    OutputStreamPtr doctor_stream();
    DiskUsageInfo disk_usage();
    bool analytics_enabled();
    void set_analytics(bool enabled);

    std::vector<ServiceInfo> services();
    void control_service(const std::string& name, ServiceAction action);
    void update();

    DependencyTree dependency_tree(const std::string& name);
    std::vector<std::string> dependents(const std::string& name);
    std::set<std::string> leaves();

    std::vector<std::string> pinned();
    void pin(const std::string& name);
    void unpin(const std::string& name);

    std::vector<TapInfo> taps();
    TapInfo tap_info(const std::string& name);
    void add_tap(const std::string& name);
    void remove_tap(const std::string& name);

    std::string export_brewfile();
    OutputStreamPtr import_brewfile(const std::string& content);
    OutputStreamPtr import_brewfile_from_path(const std::string& path);

    std::vector<QuarantinedApp> quarantined_apps();
    void remove_quarantine(const std::string& app_path);
    std::optional<std::string> cask_install_path(const std::string& cask_name);

    // Installed formulae, casks, outdated and pinned lists, queried concurrently.
    BrewSnapshot snapshot();

private:
    std::string brew_path();
    ExecutionResult brew(const std::vector<std::string>& arguments);
    // Throws NonZeroExit unless the command exited 0.
    ExecutionResult brew_checked(const std::vector<std::string>& arguments);
    OutputStreamPtr brew_stream(const std::vector<std::string>& arguments);
    std::vector<std::string> expanded_application_dirs() const;

    ProcessRunner& runner_;
    BrewPathResolver& resolver_;
    std::vector<std::string> application_dirs_;
};
