#include "dependency_tree.hpp"
#include "text_parsers.hpp"
#include <vector>

namespace {

struct TreeLine {
    size_t level;
    std::string name;
};

// Width in bytes of a connector glyph at pos, or 0. Box drawing characters
// U+2500 (─), U+2502 (│), U+251C (├) and U+2514 (└) count as one column, as
// do the ASCII fallbacks.
size_t connector_width(const std::string& line, size_t pos) {
    unsigned char c = static_cast<unsigned char>(line[pos]);
    if (c == ' ' || c == '\t' || c == '|' || c == '`' || c == '-' || c == '+') return 1;
    if (c == 0xE2 && pos + 2 < line.size() && static_cast<unsigned char>(line[pos + 1]) == 0x94) {
        unsigned char last = static_cast<unsigned char>(line[pos + 2]);
        if (last == 0x80 || last == 0x82 || last == 0x9C || last == 0x94) return 3;
    }
    return 0;
}

size_t leading_bytes(const std::string& line, size_t* columns) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < line.size()) {
        size_t width = connector_width(line, pos);
        if (width == 0) break;
        pos += width;
        ++count;
    }
    if (columns) *columns = count;
    return pos;
}

std::vector<DependencyNode> parse_children(const std::vector<TreeLine>& lines,
                                           size_t& index,
                                           size_t level) {
    std::vector<DependencyNode> nodes;
    while (index < lines.size()) {
        const TreeLine& line = lines[index];
        if (line.level <= level) break;

        if (line.level == level + 1) {
            DependencyNode node{line.name, {}};
            ++index;
            if (index < lines.size() && lines[index].level > line.level) {
                node.children = parse_children(lines, index, line.level);
            }
            nodes.push_back(std::move(node));
        } else {
            // Deeper than any open parent: no place for it in the tree.
            ++index;
        }
    }
    return nodes;
}

} // namespace

size_t tree_indent_columns(const std::string& line) {
    size_t columns = 0;
    leading_bytes(line, &columns);
    return columns;
}

std::string tree_node_name(const std::string& line) {
    return trim(line.substr(leading_bytes(line, nullptr)));
}

DependencyTree parse_dependency_tree(const std::string& output,
                                     const std::string& root,
                                     size_t indent_width) {
    DependencyTree tree{root, {}};
    if (indent_width == 0) indent_width = TREE_INDENT_WIDTH;

    std::vector<TreeLine> lines;
    for (const auto& raw : split_lines(output)) {
        std::string name = tree_node_name(raw);
        if (name.empty()) continue;
        lines.push_back({tree_indent_columns(raw) / indent_width, name});
    }
    if (lines.size() < 2) return tree;

    size_t index = 1;
    tree.dependencies = parse_children(lines, index, lines.front().level);
    return tree;
}
