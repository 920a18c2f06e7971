#include "text_parsers.hpp"
#include <gtest/gtest.h>

// ============================================================================
// Search
// ============================================================================

TEST(SearchParserTest, SplitsFormulaeAndCasks) {
    const std::string output =
        "==> Formulae\n"
        "wget\n"
        "wget2\n"
        "\n"
        "==> Casks\n"
        "wgetgui\n";

    SearchResults results = parse_search_results(output);

    ASSERT_EQ(results.formulae.size(), 2u);
    ASSERT_EQ(results.casks.size(), 1u);
    EXPECT_EQ(results.formulae[0], "wget");
    EXPECT_EQ(results.formulae[1], "wget2");
    EXPECT_EQ(results.casks[0], "wgetgui");
}

TEST(SearchParserTest, SeveralNamesOnOneLine) {
    SearchResults results = parse_search_results("==> Formulae\njq  jless   jo\n");
    EXPECT_EQ(results.formulae.size(), 3u);
    EXPECT_TRUE(results.casks.empty());
}

TEST(SearchParserTest, OtherHeadingsAreSkipped) {
    auto line = classify_search_line("==> Did you mean?");
    EXPECT_TRUE(std::holds_alternative<SkippedLine>(line));
    EXPECT_TRUE(parse_search_results("").empty());
}

// ============================================================================
// Doctor
// ============================================================================

TEST(DoctorParserTest, WarningsCarryTheirCategory) {
    const std::string output =
        "Please note that these warnings are just used to help the Homebrew maintainers\n"
        "Warning: Unbrewed dylibs were found in /usr/local/lib.\n"
        "  /usr/local/lib/libfoo.dylib\n"
        "  /usr/local/lib/libbar.dylib\n"
        "Warning: Some installed formulae are deprecated.\n"
        "  python@3.8\n";

    auto issues = parse_doctor_output(output);

    ASSERT_EQ(issues.size(), 3u);
    EXPECT_EQ(issues[0].category, "Unbrewed dylibs were found in /usr/local/lib.");
    EXPECT_EQ(issues[0].message, "/usr/local/lib/libfoo.dylib");
    EXPECT_EQ(issues[0].severity, Severity::Warning);
    EXPECT_EQ(issues[2].category, "Some installed formulae are deprecated.");
    EXPECT_EQ(issues[2].message, "python@3.8");
}

TEST(DoctorParserTest, ErrorIsStandaloneAndResetsCategory) {
    const std::string output =
        "Warning: Something old.\n"
        "Error: Xcode is missing.\n"
        "  detail without a category\n";

    auto issues = parse_doctor_output(output);

    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].category, "Error");
    EXPECT_EQ(issues[0].message, "Xcode is missing.");
    EXPECT_EQ(issues[0].severity, Severity::Error);
}

TEST(DoctorParserTest, CleanSystemHasNoIssues) {
    EXPECT_TRUE(parse_doctor_output("Your system is ready to brew.\n").empty());
}

// ============================================================================
// Cleanup and sizes
// ============================================================================

TEST(ByteSizeTest, UnitsUse1024) {
    EXPECT_EQ(parse_byte_size("Freed 512B"), 512);
    EXPECT_EQ(parse_byte_size("Freed 2.5KB"), 2560);
    EXPECT_EQ(parse_byte_size("Freed 3MB"), 3145728);
    EXPECT_EQ(parse_byte_size("Freed 1GB"), 1073741824);
    EXPECT_EQ(parse_byte_size("freed 4 mb of space"), 4194304);
    EXPECT_FALSE(parse_byte_size("nothing here").has_value());
}

TEST(ByteSizeTest, HugeSizeIsRejected) {
    EXPECT_FALSE(parse_byte_size("freed 99999999999999GB").has_value());

    CleanupResult result = parse_cleanup_output("==> This operation has freed approximately 99999999999999GB of disk space.\n");
    EXPECT_EQ(result.bytes_freed, 0);
}

TEST(CleanupParserTest, CountsRemovedPackagesAndFreedSpace) {
    const std::string output =
        "Removing: /opt/homebrew/Cellar/wget/1.21.3... (91 files, 4.2MB)\n"
        "Removing: /opt/homebrew/Caskroom/firefox/118.0... (1 file, 80MB)\n"
        "Removing: /Users/me/Library/Caches/Homebrew/downloads/abc--wget.tar.gz... (1MB)\n"
        "==> This operation has freed approximately 85.2MB of disk space.\n";

    CleanupResult result = parse_cleanup_output(output);

    ASSERT_EQ(result.formulae_removed.size(), 1u);
    EXPECT_EQ(result.formulae_removed[0], "wget");
    ASSERT_EQ(result.casks_removed.size(), 1u);
    EXPECT_EQ(result.casks_removed[0], "firefox");
    EXPECT_EQ(result.downloads_cleaned, 1);
    EXPECT_EQ(result.bytes_freed, 89338675);
    EXPECT_FALSE(result.empty());
}

TEST(CleanupParserTest, NothingToDo) {
    EXPECT_TRUE(parse_cleanup_output("").empty());
}

// ============================================================================
// mas
// ============================================================================

TEST(MasParserTest, ListIsSortedAndSkipsNoise) {
    const std::string output =
        "497799835   Xcode        (15.0)\n"
        "No installed apps found\n"
        "409183694   Keynote      (13.1)\n"
        "\n";

    auto apps = parse_mas_list(output);

    ASSERT_EQ(apps.size(), 2u);
    EXPECT_EQ(apps[0].id, 409183694);
    EXPECT_EQ(apps[0].name, "Keynote");
    EXPECT_EQ(apps[0].version, "13.1");
    EXPECT_EQ(apps[1].name, "Xcode");
}

TEST(MasParserTest, NameWithSpaces) {
    auto app = parse_mas_line("1295203466  Microsoft Remote Desktop  (10.9.4)");
    ASSERT_TRUE(app.has_value());
    EXPECT_EQ(app->name, "Microsoft Remote Desktop");
    EXPECT_EQ(app->version, "10.9.4");
}

TEST(MasParserTest, OutdatedLines) {
    auto apps = parse_mas_outdated("497799835 Xcode (14.3 -> 15.0)\ngarbage\n");
    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(apps[0].installed_version, "14.3");
    EXPECT_EQ(apps[0].available_version, "15.0");
}

TEST(MasParserTest, OversizedIdIsSkipped) {
    auto apps = parse_mas_list("99999999999999999999  Huge App (1.0)\n497799835  Xcode (15.0)\n");
    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(apps[0].name, "Xcode");

    EXPECT_TRUE(parse_mas_outdated("99999999999999999999 Huge App (1.0 -> 2.0)\n").empty());
}

TEST(MasParserTest, SearchResultsKeepOrder) {
    auto results = parse_mas_search("  2 Zed (1.0)\n  1 Alpha (2.0)\n");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].name, "Zed");
    EXPECT_TRUE(results[0].is_free());
}

// ============================================================================
// Misc
// ============================================================================

TEST(QuarantineTest, TimestampCountsFrom2001) {
    auto date = decode_quarantine_timestamp("0083;5b000000;Chrome;UUID");
    ASSERT_TRUE(date.has_value());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(date->time_since_epoch()).count();
    EXPECT_EQ(seconds, 978307200 + 0x5b000000);
}

TEST(QuarantineTest, MalformedPayloadHasNoDate) {
    EXPECT_FALSE(decode_quarantine_timestamp("0083").has_value());
    EXPECT_FALSE(decode_quarantine_timestamp("0083;zzzz;Chrome").has_value());
}

TEST(CaskArtifactTest, AppNameMayContainSpaces) {
    const std::string output =
        "==> Name\n"
        "Visual Studio Code\n"
        "==> Artifacts\n"
        "Visual Studio Code.app (App)\n";
    EXPECT_EQ(parse_cask_artifact_app(output), std::string("Visual Studio Code.app"));
    EXPECT_FALSE(parse_cask_artifact_app("==> Artifacts\nbin (Binary)\n").has_value());
}

TEST(MiscParserTest, DuAndVersion) {
    EXPECT_EQ(parse_du_kilobytes("2048\t/opt/homebrew/Cellar\n"), 2048 * 1024);
    EXPECT_FALSE(parse_du_kilobytes("du: cannot access").has_value());
    EXPECT_FALSE(parse_du_kilobytes("99999999999999999999\t/opt/homebrew\n").has_value());
    EXPECT_FALSE(parse_du_kilobytes("9007199254740993\t/opt/homebrew\n").has_value());
    EXPECT_EQ(parse_brew_version("Homebrew 4.2.0\nHomebrew/homebrew-core (git revision abc)\n"), "4.2.0");
}

TEST(MiscParserTest, ParseLinesTrimsAndDropsBlanks) {
    auto lines = parse_lines("  wget \r\n\n jq\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "wget");
    EXPECT_EQ(lines[1], "jq");
}

TEST(MiscParserTest, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(2560), "2.5 KB");
    EXPECT_EQ(format_bytes(3145728), "3.0 MB");
}
