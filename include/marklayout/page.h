#pragma once

#include "marklayout/platform.h"
#include "marklayout/style.h"
#include <string>
#include <vector>

namespace marklayout {

/// A single text run positioned on a page.
/// The output writer draws text at exactly this position.
struct TextRun {
    std::string text;
    FontDescriptor font;
    Color color = Color::black();
    float x = 0;           // Horizontal position from left edge of page
    float y = 0;           // Vertical position (baseline) from top edge of page
    float width = 0;       // Measured width of the run

    // Source tracking
    int blockIndex = -1;   // Index of source Block
    int tableRow = -1;     // Row within a table block, -1 outside tables
    int tableColumn = -1;  // Column within a table block
    bool isMarker = false; // List marker, not part of the block text
};

/// A laid-out line on a page
struct Line {
    std::vector<TextRun> runs;
    float x = 0;           // Line start x
    float y = 0;           // Baseline y position
    float width = 0;       // Total line width
    float height = 0;      // Line height (font size * line spacing)
    float ascent = 0;
    float descent = 0;

    bool isLastLineOfParagraph = false;
};

/// Types of visual decorations on a page
enum class DecorationType {
    TableBorder,       // Stroked cell rectangle
    HeaderShading,     // Filled header cell background
};

/// A non-text element on a page
struct Decoration {
    DecorationType type = DecorationType::TableBorder;
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;
    float lineWidth = 0;   // For TableBorder
    Color color;
    int blockIndex = -1;
};

/// A single laid-out page
struct Page {
    int pageIndex = 0;
    std::vector<Line> lines;
    std::vector<Decoration> decorations;

    // Page dimensions
    float width = 0;
    float height = 0;

    // Content bounds (within margins)
    float contentX = 0;
    float contentY = 0;
    float contentWidth = 0;
    float contentHeight = 0;

    // Source tracking
    int firstBlockIndex = -1;   // First block that appears on this page
    int lastBlockIndex = -1;    // Last block that appears on this page
};

/// Warning types that may occur during parsing or layout
enum class LayoutWarning {
    None,
    EmptyContent,
    ParseError,
    LayoutOverflow,
    InvalidGeometry,
};

/// Result of laying out a document
struct LayoutResult {
    std::string documentId;
    std::vector<Page> pages;
    int totalBlocks = 0;
    std::vector<LayoutWarning> warnings;

    bool hasWarning(LayoutWarning w) const {
        for (auto warning : warnings) {
            if (warning == w) return true;
        }
        return false;
    }
};

} // namespace marklayout
