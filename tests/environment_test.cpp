#include "command.hpp"
#include "environment.hpp"
#include "proxy.hpp"
#include "scripted_runner.hpp"
#include <gtest/gtest.h>

TEST(EnvironmentTest, LayersOverrideInOrder) {
    Environment inherited{{"HOME", "/home/me"}, {"HTTP_PROXY", "old"}, {"LANG", "C"}};
    Environment proxy{{"HTTP_PROXY", "http://proxy:8080"}};
    Environment overrides{{"LANG", "en_US.UTF-8"}, {"HTTP_PROXY", "http://override:1"}};

    Environment env = build_environment(inherited, proxy, overrides, {});

    EXPECT_EQ(env["HOME"], "/home/me");
    EXPECT_EQ(env["LANG"], "en_US.UTF-8");
    EXPECT_EQ(env["HTTP_PROXY"], "http://override:1");
}

TEST(EnvironmentTest, PathPrefixesArePrepended) {
    Environment env = build_environment({{"PATH", "/usr/bin:/bin"}}, {}, {},
                                        {"/opt/homebrew/bin", "/usr/local/bin"});
    EXPECT_EQ(env["PATH"], "/opt/homebrew/bin:/usr/local/bin:/usr/bin:/bin");

    Environment no_path = build_environment({}, {}, {}, {"/opt/homebrew/bin"});
    EXPECT_EQ(no_path["PATH"], "/opt/homebrew/bin");
}

TEST(EnvironmentTest, EnvpEntries) {
    auto entries = to_envp({{"A", "1"}, {"B", "two words"}});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0], "A=1");
    EXPECT_EQ(entries[1], "B=two words");
}

TEST(CommandSpecTest, DisplayQuotesOnlyWhenNeeded) {
    CommandSpec command = build_command("/opt/homebrew/bin/brew", {"install", "--cask", "visual studio code", ""});
    EXPECT_EQ(command.executable(), "/opt/homebrew/bin/brew");
    EXPECT_EQ(command.arguments().size(), 4u);
    std::string display = command.to_string();
    EXPECT_NE(display.find("install --cask"), std::string::npos);
    EXPECT_NE(display.find("\"visual studio code\""), std::string::npos);
    EXPECT_NE(display.find("\"\""), std::string::npos);
}

// ============================================================================
// System proxy
// ============================================================================

namespace {

const char* SCUTIL_OUTPUT =
    "<dictionary> {\n"
    "  ExceptionsList : <array> {\n"
    "    0 : *.local\n"
    "    1 : 169.254/16\n"
    "  }\n"
    "  FTPPassive : 1\n"
    "  HTTPEnable : 1\n"
    "  HTTPPort : 3128\n"
    "  HTTPProxy : proxy.corp\n"
    "  HTTPSEnable : 1\n"
    "  HTTPSPort : 3129\n"
    "  HTTPSProxy : secure.corp\n"
    "  SOCKSEnable : 0\n"
    "  SOCKSPort : 1080\n"
    "  SOCKSProxy : socks.corp\n"
    "}\n";

} // namespace

TEST(ProxyTest, ParsesScutilDictionary) {
    ProxySettings settings = parse_scutil_proxy(SCUTIL_OUTPUT);

    EXPECT_EQ(settings.values["HTTPProxy"], "proxy.corp");
    EXPECT_EQ(settings.values["HTTPSPort"], "3129");
    ASSERT_EQ(settings.exceptions.size(), 2u);
    EXPECT_EQ(settings.exceptions[0], "*.local");
}

TEST(ProxyTest, EnabledProxiesBecomeVariables) {
    Environment env = proxy_environment(parse_scutil_proxy(SCUTIL_OUTPUT));

    EXPECT_EQ(env["HTTP_PROXY"], "http://proxy.corp:3128");
    EXPECT_EQ(env["http_proxy"], "http://proxy.corp:3128");
    EXPECT_EQ(env["HTTPS_PROXY"], "http://secure.corp:3129");
    EXPECT_EQ(env.count("ALL_PROXY"), 0u);
    EXPECT_EQ(env["NO_PROXY"], "*.local,169.254/16");
    EXPECT_EQ(env["no_proxy"], "*.local,169.254/16");
}

TEST(ProxyTest, MissingToolMeansNoProxy) {
    ScriptedRunner runner;
    runner.fail_launch("--proxy");
    EXPECT_TRUE(discover_proxy_environment(runner, "/usr/sbin/scutil").empty());
}

TEST(ProxyTest, DiscoveryUsesToolOutput) {
    ScriptedRunner runner;
    runner.on("--proxy", ok(SCUTIL_OUTPUT));
    Environment env = discover_proxy_environment(runner, "/usr/sbin/scutil");
    EXPECT_EQ(env["HTTP_PROXY"], "http://proxy.corp:3128");
}
