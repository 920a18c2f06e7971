#include "proxy.hpp"
#include "brew_error.hpp"
#include "console.hpp"
#include "text_parsers.hpp"
#include <optional>
#include <sstream>

static const std::string KEY_VALUE_SEPARATOR = " : ";

ProxySettings parse_scutil_proxy(const std::string& output) {
    ProxySettings settings;
    bool in_exceptions = false;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);

        if (trimmed.find("ExceptionsList") != std::string::npos) {
            in_exceptions = true;
            continue;
        }
        if (in_exceptions && trimmed == "}") {
            in_exceptions = false;
            continue;
        }

        size_t separator = trimmed.find(KEY_VALUE_SEPARATOR);
        if (separator == std::string::npos) continue;

        std::string value = trimmed.substr(separator + KEY_VALUE_SEPARATOR.size());
        if (in_exceptions) {
            settings.exceptions.push_back(value);
        } else {
            settings.values[trimmed.substr(0, separator)] = value;
        }
    }
    return settings;
}

static std::optional<std::string> proxy_url(const ProxySettings& settings,
                                             const std::string& kind,
                                             const std::string& scheme) {
    auto enabled = settings.values.find(kind + "Enable");
    auto host = settings.values.find(kind + "Proxy");
    auto port = settings.values.find(kind + "Port");
    if (enabled == settings.values.end() || enabled->second != "1" ||
        host == settings.values.end() || port == settings.values.end()) {
        return std::nullopt;
    }
    return scheme + "://" + host->second + ":" + port->second;
}

Environment proxy_environment(const ProxySettings& settings) {
    Environment env;
    if (auto url = proxy_url(settings, "HTTP", "http")) {
        env["HTTP_PROXY"] = *url;
        env["http_proxy"] = *url;
    }
    if (auto url = proxy_url(settings, "HTTPS", "http")) {
        env["HTTPS_PROXY"] = *url;
        env["https_proxy"] = *url;
    }
    if (auto url = proxy_url(settings, "SOCKS", "socks5")) {
        env["ALL_PROXY"] = *url;
        env["all_proxy"] = *url;
    }
    if (!settings.exceptions.empty()) {
        std::string no_proxy = join(settings.exceptions, ",");
        env["NO_PROXY"] = no_proxy;
        env["no_proxy"] = no_proxy;
    }
    return env;
}

Environment discover_proxy_environment(ProcessRunner& runner, const std::string& scutil_path) {
    try {
        ExecutionResult result = runner.execute(build_command(scutil_path, {"--proxy"}));
        if (!result.success()) {
            print_debug("scutil --proxy exited with " + std::to_string(result.exit_code));
            return {};
        }
        Environment env = proxy_environment(parse_scutil_proxy(result.std_out));
        print_debug("system proxy variables: " + std::to_string(env.size()));
        return env;
    } catch (const LaunchFailure& e) {
        print_debug(std::string("no system proxy settings: ") + e.what());
        return {};
    }
}
