#pragma once

#include "marklayout/document.h"
#include <string>
#include <vector>
#include <optional>

namespace marklayout {

/// Classification of a single input line
enum class TokenType {
    Title,
    SectionHeading,
    BulletItem,
    TableRow,
    Blank,
    Paragraph,
};

/// Transient result of classifying one line.
/// `text` is set for Title/SectionHeading/BulletItem/Paragraph,
/// `cells` for TableRow.
struct Token {
    TokenType type = TokenType::Blank;
    std::string text;
    TableRow cells;

    bool operator==(const Token& other) const {
        return type == other.type && text == other.text && cells == other.cells;
    }
    bool operator!=(const Token& other) const { return !(*this == other); }
};

/// Map one raw line (terminator already stripped) to a token.
/// Rules, first match wins: table row, blank, "# ", "## ", "- ", paragraph.
Token classifyLine(const std::string& line);

/// True when every cell is non-empty and made only of '-', ':' and spaces
/// (a markdown header separator such as |---|:--:|).
bool isSeparatorRow(const TableRow& row);

/// Split text into lines on "\n", "\r\n" or "\r". Terminators are removed;
/// a trailing terminator does not produce an extra empty line.
std::vector<std::string> splitLines(const std::string& text);

/// Buffer of pending rows for the table currently being read
class TableAccumulator {
public:
    void push(TableRow row);

    /// Wrap the pending rows into one Table block and clear the buffer.
    /// Returns nullopt when nothing is pending.
    std::optional<Block> flush();

    bool empty() const { return rows_.empty(); }
    size_t size() const { return rows_.size(); }

private:
    std::vector<TableRow> rows_;
};

/// Parser switches
struct ParseOptions {
    /// Drop |---|---| style separator rows instead of keeping them as data.
    bool skipSeparatorRows = false;
};

/// Two-state machine turning a token stream into blocks.
/// One instance per document; not shared between threads.
class BlockBuilder {
public:
    enum class State {
        Outside,
        InTable,
    };

    explicit BlockBuilder(ParseOptions options = {});

    /// Classify and consume one line
    void feedLine(const std::string& line);

    /// Consume one already classified token
    void feed(const Token& token);

    /// Flush any open table and hand back the blocks.
    /// The builder is reset and may be reused for a new document.
    std::vector<Block> finish();

    State state() const { return state_; }
    const std::vector<Block>& blocks() const { return blocks_; }
    size_t pendingRows() const { return table_.size(); }

private:
    void closeTable();
    void appendBlock(const Token& token);

    ParseOptions options_;
    State state_ = State::Outside;
    TableAccumulator table_;
    std::vector<Block> blocks_;
};

/// Parse a whole document into blocks, in source order
std::vector<Block> buildBlocks(const std::string& text, const ParseOptions& options = {});

} // namespace marklayout
