#pragma once

#include "models.hpp"
#include <string>

// Columns per nesting level in `brew deps --tree` output ("├── ", "│   ").
constexpr size_t TREE_INDENT_WIDTH = 4;

// Rebuilds the tree printed by `brew deps --tree <root>`. The first non-blank
// line is the root itself; the result holds its descendants in listing order.
// Empty or single-line input gives a tree without dependencies.
DependencyTree parse_dependency_tree(const std::string& output,
                                     const std::string& root,
                                     size_t indent_width = TREE_INDENT_WIDTH);

// Leading columns taken up by whitespace and connector glyphs.
size_t tree_indent_columns(const std::string& line);

// The line with its connector glyphs and surrounding whitespace removed.
std::string tree_node_name(const std::string& line);
