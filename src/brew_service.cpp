#include "brew_service.hpp"
#include "brew_error.hpp"
#include "bulk_sequencer.hpp"
#include "config.hpp"
#include "console.hpp"
#include "dependency_tree.hpp"
#include "empty_result_policy.hpp"
#include "json_decoders.hpp"
#include "text_parsers.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const std::string QUARANTINE_ATTRIBUTE = "com.apple.quarantine";

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> package_arguments(const std::string& verb, const std::string& name, bool is_cask) {
    if (is_cask) return {verb, "--cask", name};
    return {verb, name};
}

// Removes the temporary Brewfile once `brew bundle` has been read to the end.
// If the consumer walks away early brew may still need the file, so it stays.
class TemporaryFileStream final : public OutputStream {
public:
    TemporaryFileStream(OutputStreamPtr inner, std::string path)
        : inner_(std::move(inner)), path_(std::move(path)) {}

    ~TemporaryFileStream() override {
        if (!exhausted_) {
            print_debug("leaving " + path_ + " for the running brew bundle");
        }
    }

    std::optional<std::string> next() override {
        auto chunk = inner_->next();
        if (!chunk && !exhausted_) {
            exhausted_ = true;
            std::error_code ec;
            fs::remove(path_, ec);
            if (ec) print_debug("could not remove " + path_ + ": " + ec.message());
        }
        return chunk;
    }

    void terminate() override { inner_->terminate(); }
    std::optional<int> exit_code() const override { return inner_->exit_code(); }

private:
    OutputStreamPtr inner_;
    std::string path_;
    bool exhausted_ = false;
};

std::string write_temporary_brewfile(const std::string& content) {
    std::string path_template = (fs::temp_directory_path() / "Brewfile.XXXXXX").string();
    std::vector<char> buffer(path_template.begin(), path_template.end());
    buffer.push_back('\0');

    int fd = ::mkstemp(buffer.data());
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "mkstemp");
    ::close(fd);

    std::string path(buffer.data());
    std::ofstream file(path, std::ios::trunc);
    file << content;
    if (!file) {
        std::error_code ec;
        fs::remove(path, ec);
        throw BrewError("Failed to write temporary Brewfile " + path);
    }
    return path;
}

int64_t du_size(ProcessRunner& runner, const std::string& path) {
    ExecutionResult result = runner.execute(build_command("du", {"-sk", path}));
    if (!result.success()) return 0;
    return parse_du_kilobytes(result.std_out).value_or(0);
}

} // namespace

BrewService::BrewService(ProcessRunner& runner,
                         BrewPathResolver& resolver,
                         std::vector<std::string> application_dirs)
    : runner_(runner), resolver_(resolver), application_dirs_(std::move(application_dirs)) {}

std::string BrewService::brew_path() {
    auto path = resolver_.resolve();
    if (!path) throw BrewNotInstalled();
    return *path;
}

ExecutionResult BrewService::brew(const std::vector<std::string>& arguments) {
    return runner_.execute(build_command(brew_path(), arguments));
}

ExecutionResult BrewService::brew_checked(const std::vector<std::string>& arguments) {
    ExecutionResult result = brew(arguments);
    if (!result.success()) {
        throw NonZeroExit(result.exit_code, trim(result.std_err));
    }
    return result;
}

OutputStreamPtr BrewService::brew_stream(const std::vector<std::string>& arguments) {
    return runner_.stream(build_command(brew_path(), arguments));
}

std::vector<std::string> BrewService::expanded_application_dirs() const {
    std::vector<std::string> dirs;
    for (const auto& dir : application_dirs_) dirs.push_back(expand_home(dir));
    return dirs;
}

// Formulae and casks

std::vector<Formula> BrewService::installed_formulae() {
    return decode_formulae(brew_checked({"info", "--installed", "--json=v2"}).std_out);
}

std::vector<Cask> BrewService::installed_casks() {
    ExecutionResult result = brew({"info", "--installed", "--cask", "--json=v2"});
    if (is_empty_result(EmptyResultOperation::CaskListing, result)) {
        return {};
    }
    if (!result.success()) {
        throw NonZeroExit(result.exit_code, trim(result.std_err));
    }
    return decode_casks(result.std_out);
}

SearchResults BrewService::search(const std::string& query) {
    if (query.empty()) return {};
    return parse_search_results(brew_checked({"search", "--formulae", "--casks", query}).std_out);
}

Formula BrewService::formula_info(const std::string& name) {
    ExecutionResult result = brew({"info", "--json=v2", name});
    if (!result.success()) throw PackageNotFound(name);

    std::vector<Formula> formulae = decode_formulae(result.std_out);
    if (formulae.empty()) throw PackageNotFound(name);
    return formulae.front();
}

Cask BrewService::cask_info(const std::string& name) {
    ExecutionResult result = brew({"info", "--cask", "--json=v2", name});
    if (!result.success()) throw PackageNotFound(name);

    std::vector<Cask> casks = decode_casks(result.std_out);
    if (casks.empty()) throw PackageNotFound(name);
    return casks.front();
}

// Install / uninstall / upgrade

OutputStreamPtr BrewService::install(const std::string& name, bool is_cask) {
    return brew_stream(package_arguments("install", name, is_cask));
}

OutputStreamPtr BrewService::reinstall(const std::string& name, bool is_cask) {
    return brew_stream(package_arguments("reinstall", name, is_cask));
}

void BrewService::uninstall(const std::string& name, bool is_cask) {
    brew_checked(package_arguments("uninstall", name, is_cask));
}

OutputStreamPtr BrewService::upgrade(const std::string& name) {
    if (name.empty()) return brew_stream({"upgrade"});
    return brew_stream({"upgrade", name});
}

std::vector<OutdatedPackage> BrewService::outdated() {
    return decode_outdated(brew_checked({"outdated", "--json=v2"}).std_out);
}

OutputStreamPtr BrewService::install_many(std::vector<std::string> names, bool are_casks) {
    return sequence_streams(std::move(names), INSTALL_VERB,
                            [this, are_casks](const std::string& name) { return install(name, are_casks); });
}

OutputStreamPtr BrewService::uninstall_many(std::vector<std::string> names, bool are_casks) {
    return sequence_actions(std::move(names), UNINSTALL_VERB,
                            [this, are_casks](const std::string& name) { uninstall(name, are_casks); });
}

OutputStreamPtr BrewService::upgrade_many(std::vector<std::string> names) {
    return sequence_streams(std::move(names), UPGRADE_VERB,
                            [this](const std::string& name) { return upgrade(name); });
}

// Maintenance

CleanupResult BrewService::cleanup(bool dry_run) {
    std::vector<std::string> arguments = {"cleanup"};
    if (dry_run) arguments.push_back("--dry-run");
    return parse_cleanup_output(brew_checked(arguments).std_out);
}

OutputStreamPtr BrewService::clear_cache() {
    return brew_stream({"cleanup", "--prune=all", "-s"});
}

// `brew doctor` exits 1 whenever it has something to say.
std::vector<DiagnosticIssue> BrewService::doctor() {
    return parse_doctor_output(brew({"doctor"}).std_out);
}

OutputStreamPtr BrewService::doctor_stream() {
    return brew_stream({"doctor"});
}

DiskUsageInfo BrewService::disk_usage() {
    DiskUsageInfo usage;
    usage.cache_size = du_size(runner_, brew_checked({"--cache"}).trimmed_output());

    ExecutionResult cellar = brew({"--cellar"});
    if (cellar.success()) usage.cellar_size = du_size(runner_, cellar.trimmed_output());

    ExecutionResult caskroom = brew({"--caskroom"});
    if (caskroom.success()) usage.caskroom_size = du_size(runner_, caskroom.trimmed_output());

    return usage;
}

bool BrewService::analytics_enabled() {
    std::string state = lowercase(brew_checked({"analytics", "state"}).trimmed_output());
    if (state.find("disabled") != std::string::npos) return false;
    return state.find("enabled") != std::string::npos || state.find("on") != std::string::npos;
}

void BrewService::set_analytics(bool enabled) {
    brew_checked({"analytics", enabled ? "on" : "off"});
}

// Services

std::vector<ServiceInfo> BrewService::services() {
    return decode_services(brew_checked({"services", "list", "--json"}).std_out);
}

void BrewService::control_service(const std::string& name, ServiceAction action) {
    brew_checked({"services", to_string(action), name});
}

void BrewService::update() {
    brew_checked({"update"});
}

// Dependencies

DependencyTree BrewService::dependency_tree(const std::string& name) {
    return parse_dependency_tree(brew_checked({"deps", "--tree", name}).std_out, name);
}

std::vector<std::string> BrewService::dependents(const std::string& name) {
    ExecutionResult result = brew({"uses", "--installed", name});
    if (!result.success()) {
        if (is_empty_result(EmptyResultOperation::Dependents, result)) return {};
        throw NonZeroExit(result.exit_code, trim(result.std_err));
    }
    return parse_lines(result.std_out);
}

std::set<std::string> BrewService::leaves() {
    ExecutionResult result = brew({"leaves"});
    if (!result.success()) return {};
    std::vector<std::string> names = parse_lines(result.std_out);
    return std::set<std::string>(names.begin(), names.end());
}

// Pins

std::vector<std::string> BrewService::pinned() {
    ExecutionResult result = brew({"list", "--pinned"});
    if (!result.success()) {
        if (is_empty_result(EmptyResultOperation::PinnedList, result)) return {};
        throw NonZeroExit(result.exit_code, trim(result.std_err));
    }
    return parse_lines(result.std_out);
}

void BrewService::pin(const std::string& name) {
    brew_checked({"pin", name});
}

void BrewService::unpin(const std::string& name) {
    brew_checked({"unpin", name});
}

// Taps

std::vector<TapInfo> BrewService::taps() {
    return decode_taps(brew_checked({"tap-info", "--json", "--installed"}).std_out);
}

TapInfo BrewService::tap_info(const std::string& name) {
    std::vector<TapInfo> taps = decode_taps(brew_checked({"tap-info", name, "--json"}).std_out);
    if (taps.empty()) throw PackageNotFound(name);
    return taps.front();
}

void BrewService::add_tap(const std::string& name) {
    brew_checked({"tap", name});
}

void BrewService::remove_tap(const std::string& name) {
    brew_checked({"untap", name});
}

// Brewfile

std::string BrewService::export_brewfile() {
    return brew_checked({"bundle", "dump", "--describe", "--file=-"}).std_out;
}

OutputStreamPtr BrewService::import_brewfile(const std::string& content) {
    std::string path = write_temporary_brewfile(content);
    try {
        return std::make_unique<TemporaryFileStream>(import_brewfile_from_path(path), path);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(path, ec);
        throw;
    }
}

OutputStreamPtr BrewService::import_brewfile_from_path(const std::string& path) {
    return brew_stream({"bundle", "install", "--file=" + path});
}

// Quarantine

std::vector<QuarantinedApp> BrewService::quarantined_apps() {
    std::map<std::string, std::string> cask_by_app;
    for (const auto& cask : installed_casks()) {
        cask_by_app[lowercase(cask.display_name())] = cask.token;
    }

    std::vector<QuarantinedApp> apps;
    for (const auto& dir : expanded_application_dirs()) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        fs::directory_iterator entries(dir, ec);
        if (ec) {
            print_debug("cannot read " + dir + ": " + ec.message());
            continue;
        }
        for (const auto& entry : entries) {
            if (entry.path().extension() != ".app") continue;
            std::string app_path = entry.path().string();

            ExecutionResult result = runner_.execute(
                build_command("xattr", {"-p", QUARANTINE_ATTRIBUTE, app_path}));
            if (!result.success() || trim(result.std_out).empty()) continue;

            QuarantinedApp app;
            app.name = entry.path().stem().string();
            app.path = app_path;
            app.quarantine_date = decode_quarantine_timestamp(result.std_out);
            auto cask = cask_by_app.find(lowercase(app.name));
            if (cask != cask_by_app.end()) app.cask_name = cask->second;
            apps.push_back(std::move(app));
        }
    }
    return apps;
}

void BrewService::remove_quarantine(const std::string& app_path) {
    ExecutionResult result = runner_.execute(
        build_command("xattr", {"-dr", QUARANTINE_ATTRIBUTE, app_path}));
    if (!result.success()) {
        throw NonZeroExit(result.exit_code, "Failed to remove quarantine: " + trim(result.std_err));
    }
}

std::optional<std::string> BrewService::cask_install_path(const std::string& cask_name) {
    ExecutionResult result = brew({"info", "--cask", cask_name});
    if (!result.success()) return std::nullopt;

    auto app = parse_cask_artifact_app(result.std_out);
    if (!app) return std::nullopt;

    for (const auto& dir : expanded_application_dirs()) {
        std::string location = dir + "/" + *app;
        std::error_code ec;
        if (fs::exists(location, ec)) return location;
    }
    return std::nullopt;
}

BrewSnapshot BrewService::snapshot() {
    auto formulae = std::async(std::launch::async, [this] { return installed_formulae(); });
    auto casks = std::async(std::launch::async, [this] { return installed_casks(); });
    auto outdated_list = std::async(std::launch::async, [this] { return outdated(); });
    auto pinned_list = std::async(std::launch::async, [this] { return pinned(); });

    BrewSnapshot snapshot;
    snapshot.formulae = formulae.get();
    snapshot.casks = casks.get();
    snapshot.outdated = outdated_list.get();
    snapshot.pinned = pinned_list.get();
    return snapshot;
}
