#include "dependency_tree.hpp"
#include <gtest/gtest.h>

TEST(DependencyTreeTest, BoxDrawingTreeThreeLevels) {
    const std::string output =
        "wget\n"
        "├── libidn2\n"
        "│   ├── libunistring\n"
        "│   └── gettext\n"
        "│       └── libunistring\n"
        "└── openssl@3\n"
        "    └── ca-certificates\n";

    DependencyTree tree = parse_dependency_tree(output, "wget");

    EXPECT_EQ(tree.package_name, "wget");
    ASSERT_EQ(tree.dependencies.size(), 2u);

    const DependencyNode& libidn2 = tree.dependencies[0];
    EXPECT_EQ(libidn2.name, "libidn2");
    ASSERT_EQ(libidn2.children.size(), 2u);
    EXPECT_EQ(libidn2.children[0].name, "libunistring");
    EXPECT_TRUE(libidn2.children[0].children.empty());
    EXPECT_EQ(libidn2.children[1].name, "gettext");
    ASSERT_EQ(libidn2.children[1].children.size(), 1u);
    EXPECT_EQ(libidn2.children[1].children[0].name, "libunistring");

    const DependencyNode& openssl = tree.dependencies[1];
    EXPECT_EQ(openssl.name, "openssl@3");
    ASSERT_EQ(openssl.children.size(), 1u);
    EXPECT_EQ(openssl.children[0].name, "ca-certificates");
}

TEST(DependencyTreeTest, AsciiConnectors) {
    const std::string output =
        "curl\n"
        "|-- brotli\n"
        "`-- openssl@3\n"
        "    `-- ca-certificates\n";

    DependencyTree tree = parse_dependency_tree(output, "curl");

    ASSERT_EQ(tree.dependencies.size(), 2u);
    EXPECT_EQ(tree.dependencies[0].name, "brotli");
    EXPECT_EQ(tree.dependencies[1].name, "openssl@3");
    ASSERT_EQ(tree.dependencies[1].children.size(), 1u);
    EXPECT_EQ(tree.dependencies[1].children[0].name, "ca-certificates");
}

TEST(DependencyTreeTest, SiblingOrderIsPreserved) {
    const std::string output =
        "root\n"
        "├── zeta\n"
        "├── alpha\n"
        "└── mid\n";

    DependencyTree tree = parse_dependency_tree(output, "root");

    ASSERT_EQ(tree.dependencies.size(), 3u);
    EXPECT_EQ(tree.dependencies[0].name, "zeta");
    EXPECT_EQ(tree.dependencies[1].name, "alpha");
    EXPECT_EQ(tree.dependencies[2].name, "mid");
}

TEST(DependencyTreeTest, EmptyAndSingleLineHaveNoDependencies) {
    EXPECT_TRUE(parse_dependency_tree("", "jq").dependencies.empty());
    EXPECT_TRUE(parse_dependency_tree("jq\n", "jq").dependencies.empty());
    EXPECT_EQ(parse_dependency_tree("", "jq").package_name, "jq");
}

TEST(DependencyTreeTest, OrphanDeeperThanParentIsSkipped) {
    const std::string output =
        "root\n"
        "│       └── orphan\n"
        "└── child\n";

    DependencyTree tree = parse_dependency_tree(output, "root");

    ASSERT_EQ(tree.dependencies.size(), 1u);
    EXPECT_EQ(tree.dependencies[0].name, "child");
}

TEST(DependencyTreeTest, IndentColumnsCountGlyphsOnce) {
    EXPECT_EQ(tree_indent_columns("wget"), 0u);
    EXPECT_EQ(tree_indent_columns("├── libidn2"), 4u);
    EXPECT_EQ(tree_indent_columns("│   └── gettext"), 8u);
    EXPECT_EQ(tree_node_name("│   └── gettext"), "gettext");
}
