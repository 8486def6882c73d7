#include <gtest/gtest.h>
#include "marklayout/markup.h"
#include "marklayout/document.h"
#include "marklayout/log.h"

using namespace marklayout;

// MARK: - Line Classification Tests

TEST(ClassifyTest, TitleMarker) {
    auto token = classifyLine("# Jane Doe");
    EXPECT_EQ(token.type, TokenType::Title);
    EXPECT_EQ(token.text, "Jane Doe");
}

TEST(ClassifyTest, HeadingPrecedence) {
    EXPECT_EQ(classifyLine("## Section").type, TokenType::SectionHeading);
    EXPECT_EQ(classifyLine("## Section").text, "Section");
    EXPECT_EQ(classifyLine("# Section").type, TokenType::Title);

    auto deep = classifyLine("### Section");
    EXPECT_EQ(deep.type, TokenType::Paragraph);
    EXPECT_EQ(deep.text, "### Section");
}

TEST(ClassifyTest, BulletMarker) {
    auto token = classifyLine("  -   Python  ");
    EXPECT_EQ(token.type, TokenType::BulletItem);
    EXPECT_EQ(token.text, "Python");
}

TEST(ClassifyTest, MarkersNeedTrailingSpace) {
    EXPECT_EQ(classifyLine("#Title").type, TokenType::Paragraph);
    EXPECT_EQ(classifyLine("-dash").type, TokenType::Paragraph);
    EXPECT_EQ(classifyLine("#").type, TokenType::Paragraph);
    EXPECT_EQ(classifyLine("# ").type, TokenType::Paragraph);
}

TEST(ClassifyTest, BlankLines) {
    EXPECT_EQ(classifyLine("").type, TokenType::Blank);
    EXPECT_EQ(classifyLine("   \t ").type, TokenType::Blank);
}

TEST(ClassifyTest, ParagraphIsTrimmed) {
    auto token = classifyLine("   Plain text here.  ");
    EXPECT_EQ(token.type, TokenType::Paragraph);
    EXPECT_EQ(token.text, "Plain text here.");
}

TEST(ClassifyTest, TableRowCells) {
    auto token = classifyLine("  | Language  | Level |  ");
    ASSERT_EQ(token.type, TokenType::TableRow);
    ASSERT_EQ(token.cells.size(), 2);
    EXPECT_EQ(token.cells[0], "Language");
    EXPECT_EQ(token.cells[1], "Level");
}

TEST(ClassifyTest, TableRowKeepsEmptyCells) {
    auto token = classifyLine("| a || c |");
    ASSERT_EQ(token.type, TokenType::TableRow);
    ASSERT_EQ(token.cells.size(), 3);
    EXPECT_EQ(token.cells[0], "a");
    EXPECT_EQ(token.cells[1], "");
    EXPECT_EQ(token.cells[2], "c");
}

TEST(ClassifyTest, TableRowStripsAllBoundaryDelimiters) {
    auto token = classifyLine("|| a | b ||");
    ASSERT_EQ(token.type, TokenType::TableRow);
    ASSERT_EQ(token.cells.size(), 2);
    EXPECT_EQ(token.cells[0], "a");
    EXPECT_EQ(token.cells[1], "b");

    auto bare = classifyLine("|||");
    ASSERT_EQ(bare.type, TokenType::TableRow);
    ASSERT_EQ(bare.cells.size(), 1);
    EXPECT_EQ(bare.cells[0], "");
}

TEST(ClassifyTest, TableRowNeedsInteriorDelimiter) {
    EXPECT_EQ(classifyLine("| lonely |").type, TokenType::Paragraph);
    EXPECT_EQ(classifyLine("|").type, TokenType::Paragraph);
    EXPECT_EQ(classifyLine("||").type, TokenType::Paragraph);
    EXPECT_EQ(classifyLine("| a | b").type, TokenType::Paragraph);
}

TEST(ClassifyTest, SeparatorRowIsOrdinaryRow) {
    auto token = classifyLine("|----------|-----------|");
    ASSERT_EQ(token.type, TokenType::TableRow);
    ASSERT_EQ(token.cells.size(), 2);
    EXPECT_EQ(token.cells[0], "----------");
}

TEST(ClassifyTest, TableRowWinsOverMarkers) {
    auto token = classifyLine("| # not a title | - nor a bullet |");
    ASSERT_EQ(token.type, TokenType::TableRow);
    EXPECT_EQ(token.cells[0], "# not a title");
    EXPECT_EQ(token.cells[1], "- nor a bullet");
}

TEST(ClassifyTest, Idempotent) {
    const std::string lines[] = {"# A", "## B", "- C", "| d | e |", "", "f", "\x01\xff|"};
    for (const auto& line : lines) {
        EXPECT_EQ(classifyLine(line), classifyLine(line));
    }
}

TEST(ClassifyTest, SeparatorDetection) {
    EXPECT_TRUE(isSeparatorRow({"---", ":--:", "--:"}));
    EXPECT_FALSE(isSeparatorRow({"---", "B2"}));
    EXPECT_FALSE(isSeparatorRow({"---", ""}));
    EXPECT_FALSE(isSeparatorRow({":"}));
    EXPECT_FALSE(isSeparatorRow({}));
}

// MARK: - Line Splitting Tests

TEST(SplitLinesTest, Terminators) {
    auto lines = splitLines("a\nb\r\nc\rd");
    ASSERT_EQ(lines.size(), 4);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
    EXPECT_EQ(lines[3], "d");
}

TEST(SplitLinesTest, TrailingTerminatorAddsNoLine) {
    EXPECT_EQ(splitLines("a\n").size(), 1);
    EXPECT_EQ(splitLines("a\n\n").size(), 2);
    EXPECT_TRUE(splitLines("").empty());
}

// MARK: - Table Accumulator Tests

TEST(TableAccumulatorTest, FlushEmptyReturnsNothing) {
    TableAccumulator acc;
    EXPECT_FALSE(acc.flush().has_value());
}

TEST(TableAccumulatorTest, FlushWrapsAndClears) {
    TableAccumulator acc;
    acc.push({"a", "b"});
    acc.push({"c"});
    EXPECT_EQ(acc.size(), 2);

    auto table = acc.flush();
    ASSERT_TRUE(table.has_value());
    EXPECT_EQ(table->type, BlockType::Table);
    ASSERT_EQ(table->tableRows.size(), 2);
    EXPECT_EQ(table->tableRows[1], (TableRow{"c"}));

    EXPECT_TRUE(acc.empty());
    EXPECT_FALSE(acc.flush().has_value());
}

// MARK: - Block Builder Tests

TEST(BlockBuilderTest, EmptyInput) {
    EXPECT_TRUE(buildBlocks("").empty());
}

TEST(BlockBuilderTest, TableClosedByParagraph) {
    auto blocks = buildBlocks("| a | b |\n| c | d |\nEND");
    std::vector<Block> expected = {
        Block::table({{"a", "b"}, {"c", "d"}}),
        Block::paragraph("END"),
    };
    EXPECT_EQ(blocks, expected);
}

TEST(BlockBuilderTest, TrailingTableIsFlushed) {
    auto blocks = buildBlocks("| a | b |");
    std::vector<Block> expected = {Block::table({{"a", "b"}})};
    EXPECT_EQ(blocks, expected);
}

TEST(BlockBuilderTest, BlanksAreNotCollapsed) {
    auto blocks = buildBlocks("A\n\nB");
    std::vector<Block> expected = {
        Block::paragraph("A"), Block::spacer(), Block::paragraph("B"),
    };
    EXPECT_EQ(blocks, expected);

    auto many = buildBlocks("A\n\n\n\nB");
    ASSERT_EQ(many.size(), 5);
    EXPECT_EQ(many[1].type, BlockType::Spacer);
    EXPECT_EQ(many[2].type, BlockType::Spacer);
    EXPECT_EQ(many[3].type, BlockType::Spacer);
}

TEST(BlockBuilderTest, ResumeScenario) {
    const std::string text =
        "# Jane Doe\n"
        "## SKILLS\n"
        "- Python\n"
        "- Rust\n"
        "\n"
        "## LANGUAGES\n"
        "| Language | Level |\n"
        "| English | C1 |\n";

    std::vector<Block> expected = {
        Block::title("Jane Doe"),
        Block::heading("SKILLS"),
        Block::bullet("Python"),
        Block::bullet("Rust"),
        Block::spacer(),
        Block::heading("LANGUAGES"),
        Block::table({{"Language", "Level"}, {"English", "C1"}}),
    };
    EXPECT_EQ(buildBlocks(text), expected);
}

TEST(BlockBuilderTest, AdjacentTablesSplitByBlank) {
    auto blocks = buildBlocks("| a | b |\n\n| c | d |");
    ASSERT_EQ(blocks.size(), 3);
    EXPECT_EQ(blocks[0].type, BlockType::Table);
    EXPECT_EQ(blocks[1].type, BlockType::Spacer);
    EXPECT_EQ(blocks[2].type, BlockType::Table);
    EXPECT_EQ(blocks[2].tableRows[0][0], "c");
}

TEST(BlockBuilderTest, RaggedRowsArePreserved) {
    auto blocks = buildBlocks("| a | b | c |\n| d |  |\n| e | f |");
    ASSERT_EQ(blocks.size(), 1);
    ASSERT_EQ(blocks[0].tableRows.size(), 3);
    EXPECT_EQ(blocks[0].tableRows[0].size(), 3);
    EXPECT_EQ(blocks[0].tableRows[1].size(), 2);
    EXPECT_EQ(blocks[0].tableRows[2].size(), 2);
    EXPECT_EQ(blocks[0].columnCount(), 3);
}

TEST(BlockBuilderTest, SeparatorRowKeptByDefault) {
    auto blocks = buildBlocks("| Language | Level |\n|---|---|\n| English | B2 |");
    ASSERT_EQ(blocks.size(), 1);
    ASSERT_EQ(blocks[0].tableRows.size(), 3);
    EXPECT_EQ(blocks[0].tableRows[1][0], "---");
}

TEST(BlockBuilderTest, SeparatorRowSkippedWhenRequested) {
    ParseOptions options;
    options.skipSeparatorRows = true;
    auto blocks = buildBlocks("| Language | Level |\n|---|---|\n| English | B2 |", options);
    ASSERT_EQ(blocks.size(), 1);
    ASSERT_EQ(blocks[0].tableRows.size(), 2);
    EXPECT_EQ(blocks[0].tableRows[1][0], "English");
}

TEST(BlockBuilderTest, OrderPreservedForPlainLines) {
    auto blocks = buildBlocks("one\n## two\n- three\n# four\nfive");
    ASSERT_EQ(blocks.size(), 5);
    EXPECT_EQ(blocks[0].text, "one");
    EXPECT_EQ(blocks[1].text, "two");
    EXPECT_EQ(blocks[2].text, "three");
    EXPECT_EQ(blocks[3].text, "four");
    EXPECT_EQ(blocks[4].text, "five");
}

TEST(BlockBuilderTest, GarbageInputNeverFails) {
    std::string garbage;
    for (int i = 0; i < 256; ++i) {
        garbage += static_cast<char>(i);
    }
    const char tail[] = "\n|\xff|\x00|\n#\n\r\r\n";
    garbage += std::string(tail, sizeof(tail) - 1);
    ASSERT_EQ(garbage.size(), 256u + 12u);

    auto blocks = buildBlocks(garbage);
    ASSERT_GE(blocks.size(), 4u);
    // "|\xff|\x00|" is a row with a NUL cell, then "#", then "\r" and "\r\n" blanks
    const auto& row = blocks[blocks.size() - 4];
    ASSERT_EQ(row.type, BlockType::Table);
    ASSERT_EQ(row.tableRows.size(), 1u);
    ASSERT_EQ(row.tableRows[0].size(), 2u);
    EXPECT_EQ(row.tableRows[0][0], "\xff");
    EXPECT_EQ(row.tableRows[0][1], std::string(1, '\0'));
    EXPECT_EQ(blocks[blocks.size() - 3], Block::paragraph("#"));
    EXPECT_EQ(blocks[blocks.size() - 2].type, BlockType::Spacer);
    EXPECT_EQ(blocks[blocks.size() - 1].type, BlockType::Spacer);
    for (const auto& block : blocks) {
        if (block.type == BlockType::Table) {
            EXPECT_FALSE(block.tableRows.empty());
        }
    }
}

#if ML_LOG_LEVEL >= 1
TEST(BlockBuilderTest, ParsingWritesNothingAtDefaultLogLevel) {
    testing::internal::CaptureStderr();
    auto blocks = buildBlocks("# A\n| a | b |\n| c | d |\n\ntext");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
    EXPECT_EQ(blocks.size(), 4);
}
#endif

TEST(BlockBuilderTest, StateMachineTransitions) {
    BlockBuilder builder;
    EXPECT_EQ(builder.state(), BlockBuilder::State::Outside);

    builder.feedLine("| a | b |");
    EXPECT_EQ(builder.state(), BlockBuilder::State::InTable);
    EXPECT_EQ(builder.pendingRows(), 1);
    EXPECT_TRUE(builder.blocks().empty());

    builder.feedLine("| c | d |");
    EXPECT_EQ(builder.pendingRows(), 2);

    builder.feedLine("- item");
    EXPECT_EQ(builder.state(), BlockBuilder::State::Outside);
    EXPECT_EQ(builder.pendingRows(), 0);
    ASSERT_EQ(builder.blocks().size(), 2);
    EXPECT_EQ(builder.blocks()[0].type, BlockType::Table);
    EXPECT_EQ(builder.blocks()[1].type, BlockType::Bullet);

    builder.feedLine("| e | f |");
    auto blocks = builder.finish();
    ASSERT_EQ(blocks.size(), 3);
    EXPECT_EQ(blocks[2].type, BlockType::Table);

    // Reset after finish
    EXPECT_EQ(builder.state(), BlockBuilder::State::Outside);
    EXPECT_TRUE(builder.blocks().empty());
    EXPECT_TRUE(builder.finish().empty());
}

TEST(BlockBuilderTest, FeedTokensDirectly) {
    BlockBuilder builder;
    Token row;
    row.type = TokenType::TableRow;
    row.cells = {"x"};
    builder.feed(row);
    builder.feed(Token{});
    auto blocks = builder.finish();
    ASSERT_EQ(blocks.size(), 2);
    EXPECT_EQ(blocks[0], Block::table({{"x"}}));
    EXPECT_EQ(blocks[1], Block::spacer());
}

TEST(DocumentTest, BlockTypeNames) {
    EXPECT_STREQ(blockTypeName(BlockType::Title), "title");
    EXPECT_STREQ(blockTypeName(BlockType::Heading), "heading");
    EXPECT_STREQ(blockTypeName(BlockType::Table), "table");
}
