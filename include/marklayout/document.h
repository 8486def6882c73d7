#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <utility>

namespace marklayout {

/// Block-level element types produced by the markup parser
enum class BlockType {
    Title,
    Heading,
    Bullet,
    Paragraph,
    Spacer,
    Table,
};

constexpr size_t kBlockTypeCount = 6;

/// One table row: an ordered list of cell strings.
/// Rows of the same table may differ in length.
using TableRow = std::vector<std::string>;

/// A block-level element in the document
struct Block {
    BlockType type = BlockType::Paragraph;
    std::string text;                     // Title, Heading, Bullet, Paragraph
    std::vector<TableRow> tableRows;      // For Table type

    static Block title(const std::string& t)     { return {BlockType::Title, t, {}}; }
    static Block heading(const std::string& t)   { return {BlockType::Heading, t, {}}; }
    static Block bullet(const std::string& t)    { return {BlockType::Bullet, t, {}}; }
    static Block paragraph(const std::string& t) { return {BlockType::Paragraph, t, {}}; }
    static Block spacer()                        { return {BlockType::Spacer, {}, {}}; }
    static Block table(std::vector<TableRow> rows) {
        return {BlockType::Table, {}, std::move(rows)};
    }

    /// Widest row of a table block (0 for other types)
    size_t columnCount() const {
        size_t cols = 0;
        for (const auto& row : tableRows) {
            if (row.size() > cols) cols = row.size();
        }
        return cols;
    }

    bool operator==(const Block& other) const {
        return type == other.type && text == other.text && tableRows == other.tableRows;
    }
    bool operator!=(const Block& other) const { return !(*this == other); }
};

/// Lower-case name of a block type ("title", "heading", ...)
const char* blockTypeName(BlockType type);

} // namespace marklayout
