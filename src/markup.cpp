#include "marklayout/markup.h"
#include "marklayout/log.h"
#include <utility>

namespace marklayout {

namespace {

const char* const kWhitespace = " \t\n\r\f\v";

/// Trim whitespace
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const char* prefix, size_t prefixLen) {
    return s.size() >= prefixLen && s.compare(0, prefixLen, prefix) == 0;
}

/// Leading and trailing '|' plus at least one '|' in between.
/// `s` is already trimmed.
bool isTableRowLine(const std::string& s) {
    if (s.size() < 3 || s.front() != '|' || s.back() != '|') return false;
    return s.find('|', 1) < s.size() - 1;
}

/// Drop every boundary '|' on each side, split on the rest, trim each cell
TableRow splitCells(const std::string& s) {
    TableRow cells;
    auto first = s.find_first_not_of('|');
    std::string inner = first == std::string::npos
        ? std::string()
        : s.substr(first, s.find_last_not_of('|') - first + 1);
    size_t start = 0;
    while (true) {
        auto bar = inner.find('|', start);
        if (bar == std::string::npos) {
            cells.push_back(trim(inner.substr(start)));
            break;
        }
        cells.push_back(trim(inner.substr(start, bar - start)));
        start = bar + 1;
    }
    return cells;
}

Token textToken(TokenType type, const std::string& text) {
    Token token;
    token.type = type;
    token.text = text;
    return token;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Line classification
// ---------------------------------------------------------------------------

Token classifyLine(const std::string& line) {
    std::string stripped = trim(line);

    if (isTableRowLine(stripped)) {
        Token token;
        token.type = TokenType::TableRow;
        token.cells = splitCells(stripped);
        return token;
    }

    if (stripped.empty()) {
        return Token{};
    }

    // "## " must not be mistaken for "# ": "##" never matches "# " at offset 0
    if (startsWith(stripped, "# ", 2)) {
        return textToken(TokenType::Title, trim(stripped.substr(2)));
    }
    if (startsWith(stripped, "## ", 3)) {
        return textToken(TokenType::SectionHeading, trim(stripped.substr(3)));
    }
    if (startsWith(stripped, "- ", 2)) {
        return textToken(TokenType::BulletItem, trim(stripped.substr(2)));
    }

    return textToken(TokenType::Paragraph, stripped);
}

bool isSeparatorRow(const TableRow& row) {
    if (row.empty()) return false;
    for (const auto& cell : row) {
        if (cell.empty()) return false;
        if (cell.find_first_not_of("-: ") != std::string::npos) return false;
        if (cell.find('-') == std::string::npos) return false;
    }
    return true;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(text.substr(start, i - start));
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            ++i;
            start = i;
        } else {
            ++i;
        }
    }
    if (start < text.size()) {
        lines.push_back(text.substr(start));
    }
    return lines;
}

// ---------------------------------------------------------------------------
// TableAccumulator
// ---------------------------------------------------------------------------

void TableAccumulator::push(TableRow row) {
    rows_.push_back(std::move(row));
}

std::optional<Block> TableAccumulator::flush() {
    if (rows_.empty()) return std::nullopt;
    Block block = Block::table(std::move(rows_));
    rows_.clear();
    return block;
}

// ---------------------------------------------------------------------------
// BlockBuilder
// ---------------------------------------------------------------------------

BlockBuilder::BlockBuilder(ParseOptions options)
    : options_(options) {}

void BlockBuilder::feedLine(const std::string& line) {
    feed(classifyLine(line));
}

void BlockBuilder::feed(const Token& token) {
    if (token.type == TokenType::TableRow) {
        if (options_.skipSeparatorRows && isSeparatorRow(token.cells)) {
            return;
        }
        state_ = State::InTable;
        table_.push(token.cells);
        return;
    }

    if (state_ == State::InTable) {
        closeTable();
    }
    appendBlock(token);
}

std::vector<Block> BlockBuilder::finish() {
    if (state_ == State::InTable) {
        closeTable();
    }
    std::vector<Block> result = std::move(blocks_);
    blocks_.clear();
    state_ = State::Outside;
    return result;
}

void BlockBuilder::closeTable() {
    if (auto table = table_.flush()) {
        ML_LOGD("BlockBuilder: table rows=%zu cols=%zu",
                table->tableRows.size(), table->columnCount());
        blocks_.push_back(std::move(*table));
    }
    state_ = State::Outside;
}

void BlockBuilder::appendBlock(const Token& token) {
    switch (token.type) {
        case TokenType::Title:
            blocks_.push_back(Block::title(token.text));
            break;
        case TokenType::SectionHeading:
            blocks_.push_back(Block::heading(token.text));
            break;
        case TokenType::BulletItem:
            blocks_.push_back(Block::bullet(token.text));
            break;
        case TokenType::Paragraph:
            blocks_.push_back(Block::paragraph(token.text));
            break;
        case TokenType::Blank:
            blocks_.push_back(Block::spacer());
            break;
        case TokenType::TableRow:
            // Rows are routed to the accumulator by feed()
            break;
    }
}

std::vector<Block> buildBlocks(const std::string& text, const ParseOptions& options) {
    BlockBuilder builder(options);
    auto lines = splitLines(text);
    for (const auto& line : lines) {
        builder.feedLine(line);
    }
    auto blocks = builder.finish();
    ML_LOGD("buildBlocks: text=%zu lines=%zu blocks=%zu",
            text.size(), lines.size(), blocks.size());
    return blocks;
}

} // namespace marklayout
