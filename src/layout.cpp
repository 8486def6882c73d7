#include "marklayout/layout.h"
#include "marklayout/log.h"
#include <algorithm>
#include <cctype>

namespace marklayout {

namespace {

std::string applyTextTransform(const std::string& text, TextTransform transform) {
    if (transform == TextTransform::None) return text;
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) {
                       return c < 0x80 ? static_cast<char>(std::toupper(c))
                                       : static_cast<char>(c);
                   });
    return result;
}

/// Byte length of the UTF-8 character starting with `lead`
size_t utf8CharLen(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

float linesHeight(const std::vector<Line>& lines) {
    float h = 0;
    for (const auto& line : lines) {
        h += line.height;
    }
    return h;
}

} // anonymous namespace

class LayoutEngine::Impl {
public:
    explicit Impl(std::shared_ptr<PlatformAdapter> platform)
        : platform_(std::move(platform)) {}

    LayoutResult layoutDocument(const std::vector<StyledBlock>& blocks,
                                const Style& style,
                                const std::string& documentId) {
        LayoutResult result;
        result.documentId = documentId;
        result.totalBlocks = static_cast<int>(blocks.size());

        PageGeometry geometry = style.page;
        if (!geometry.isValid()) {
            ML_LOGW("layout: invalid page geometry %.1fx%.1f, using A4",
                    geometry.width, geometry.height);
            result.warnings.push_back(LayoutWarning::InvalidGeometry);
            geometry = PageGeometry{};
        }

        const float contentWidth = geometry.contentWidth();
        const float contentHeight = geometry.contentHeight();
        const float contentX = geometry.marginLeft;
        const float contentY = geometry.marginTop;

        auto makePage = [&](int index) {
            Page page;
            page.pageIndex = index;
            page.width = geometry.width;
            page.height = geometry.height;
            page.contentX = contentX;
            page.contentY = contentY;
            page.contentWidth = contentWidth;
            page.contentHeight = contentHeight;
            return page;
        };

        float cursorY = 0;
        Page currentPage = makePage(0);

        auto pageHasContent = [&]() {
            return !currentPage.lines.empty() || !currentPage.decorations.empty();
        };

        auto startNewPage = [&]() {
            result.pages.push_back(std::move(currentPage));
            currentPage = makePage(static_cast<int>(result.pages.size()));
            cursorY = 0;
            ML_LOGD("layout: newPage pageIndex=%d", currentPage.pageIndex);
        };

        auto noteBlock = [&](int blockIdx) {
            if (currentPage.firstBlockIndex < 0) currentPage.firstBlockIndex = blockIdx;
            currentPage.lastBlockIndex = blockIdx;
        };

        for (int blockIdx = 0; blockIdx < static_cast<int>(blocks.size()); ++blockIdx) {
            const auto& block = blocks[blockIdx].block;
            const auto& desc = blocks[blockIdx].style;
            const FontDescriptor font = style.fontFor(desc);

            // Spacers only move the cursor. A gap that reaches the page
            // bottom ends the page and is not carried over.
            if (block.type == BlockType::Spacer) {
                float gap = desc.spacingBefore + desc.spacingAfter;
                if (cursorY + gap > contentHeight) {
                    if (pageHasContent()) startNewPage();
                    continue;
                }
                cursorY += gap;
                continue;
            }

            // Spacing before, suppressed at the top of a page
            if (cursorY > 0) {
                cursorY += desc.spacingBefore;
            }

            const float blockX = contentX + desc.leftIndent;
            const float availableWidth = std::max(1.0f, contentWidth - desc.leftIndent);

            // Handle table blocks
            if (block.type == BlockType::Table) {
                const TableStyle ts = desc.table ? *desc.table : TableStyle{};

                size_t cols = block.columnCount();
                if (cols == 0) cols = 1;
                const float cellWidth = availableWidth / static_cast<float>(cols);
                const float padX = ts.cellPaddingLeft + ts.cellPaddingRight;
                const float padY = ts.cellPaddingTop + ts.cellPaddingBottom;
                const float textWidth = std::max(1.0f, cellWidth - padX);
                const float minLineHeight = font.size * desc.lineSpacingMultiplier;

                ML_LOGD("layout: table rows=%zu cols=%zu cellWidth=%.1f",
                        block.tableRows.size(), cols, cellWidth);

                for (size_t rowIdx = 0; rowIdx < block.tableRows.size(); ++rowIdx) {
                    const auto& row = block.tableRows[rowIdx];
                    const bool isHeader = ts.shadeHeaderRow && rowIdx == 0;

                    // First pass: lay out cells, padding ragged rows with empty cells
                    std::vector<std::vector<Line>> cellLines(cols);
                    float rowHeight = minLineHeight + padY;
                    for (size_t col = 0; col < cols; ++col) {
                        const std::string text = col < row.size() ? row[col] : std::string();
                        cellLines[col] = breakLines(text, font, desc.lineSpacingMultiplier,
                                                    TextTransform::None, std::string(),
                                                    textWidth, blockIdx);
                        float cellHeight = linesHeight(cellLines[col]) + padY;
                        if (cellHeight > rowHeight) rowHeight = cellHeight;
                    }

                    // Tables break between rows only
                    if (cursorY + rowHeight > contentHeight && pageHasContent()) {
                        startNewPage();
                    }

                    // Second pass: place cell content and decorations
                    const float rowTop = contentY + cursorY;
                    for (size_t col = 0; col < cols; ++col) {
                        const float cellX = blockX + cellWidth * static_cast<float>(col);

                        if (isHeader) {
                            Decoration shade;
                            shade.type = DecorationType::HeaderShading;
                            shade.x = cellX;
                            shade.y = rowTop;
                            shade.width = cellWidth;
                            shade.height = rowHeight;
                            shade.color = ts.headerBackground;
                            shade.blockIndex = blockIdx;
                            currentPage.decorations.push_back(shade);
                        }

                        auto& lines = cellLines[col];
                        float offsetY = ts.cellPaddingTop;
                        if (ts.cellVerticalAlign == VerticalAlign::Middle) {
                            offsetY += (rowHeight - padY - linesHeight(lines)) / 2.0f;
                        }

                        float cellCursorY = rowTop + offsetY;
                        for (auto& line : lines) {
                            line.y = cellCursorY + line.ascent;
                            line.x = cellX + ts.cellPaddingLeft;
                            for (auto& run : line.runs) {
                                run.x += cellX + ts.cellPaddingLeft;
                                run.y = line.y;
                                run.tableRow = static_cast<int>(rowIdx);
                                run.tableColumn = static_cast<int>(col);
                                if (isHeader) run.color = ts.headerTextColor;
                            }
                            cellCursorY += line.height;
                            currentPage.lines.push_back(std::move(line));
                        }

                        if (ts.gridLines) {
                            Decoration border;
                            border.type = DecorationType::TableBorder;
                            border.x = cellX;
                            border.y = rowTop;
                            border.width = cellWidth;
                            border.height = rowHeight;
                            border.lineWidth = ts.gridWidth;
                            border.color = ts.gridColor;
                            border.blockIndex = blockIdx;
                            currentPage.decorations.push_back(border);
                        }
                    }

                    noteBlock(blockIdx);
                    cursorY += rowHeight;
                }

                cursorY += desc.spacingAfter;
                continue;
            }

            // Text blocks
            std::vector<Line> lines = breakLines(block.text, font, desc.lineSpacingMultiplier,
                                                 desc.textTransform, desc.listMarker,
                                                 availableWidth, blockIdx);

            for (auto& line : lines) {
                if (cursorY + line.height > contentHeight && pageHasContent()) {
                    startNewPage();
                }

                line.y = contentY + cursorY + line.ascent;
                line.x = blockX;

                applyAlignment(line, desc.alignment, availableWidth);

                for (auto& run : line.runs) {
                    run.x += blockX;
                    run.y = line.y;
                }

                cursorY += line.height;
                currentPage.lines.push_back(std::move(line));
                noteBlock(blockIdx);
            }

            cursorY += desc.spacingAfter;
        }

        if (pageHasContent()) {
            result.pages.push_back(std::move(currentPage));
        }

        // Detect layout overflow: page count out of proportion with content
        if (result.totalBlocks > 0 &&
            static_cast<int>(result.pages.size()) > result.totalBlocks * 50) {
            ML_LOGW("layout: overflow detected pages=%zu blocks=%d",
                    result.pages.size(), result.totalBlocks);
            result.warnings.push_back(LayoutWarning::LayoutOverflow);
        }

        ML_LOGI("layoutDocument: id='%s' pages=%zu blocks=%d",
                documentId.c_str(), result.pages.size(), result.totalBlocks);
        return result;
    }

    std::vector<Line> layoutBlock(const Block& block,
                                  const StyleDescriptor& desc,
                                  const Style& style,
                                  float availableWidth) {
        if (block.type == BlockType::Table || block.type == BlockType::Spacer) {
            return {};
        }
        auto lines = breakLines(block.text, style.fontFor(desc), desc.lineSpacingMultiplier,
                                desc.textTransform, desc.listMarker, availableWidth, 0);
        for (auto& line : lines) {
            applyAlignment(line, desc.alignment, availableWidth);
        }
        return lines;
    }

private:
    std::shared_ptr<PlatformAdapter> platform_;

    // ---------------------------------------------------------------
    // Greedy line breaking of one text string. Runs are positioned
    // relative to x = 0; the caller places the lines.
    // ---------------------------------------------------------------
    std::vector<Line> breakLines(const std::string& text,
                                 const FontDescriptor& font,
                                 float lineSpacing,
                                 TextTransform transform,
                                 const std::string& marker,
                                 float availableWidth,
                                 int blockIndex) {
        std::vector<Line> lines;

        std::string remaining = applyTextTransform(text, transform);
        if (remaining.empty()) return lines;

        const float lineHeight = font.size * lineSpacing;
        const FontMetrics metrics = platform_->resolveFontMetrics(font);

        // List marker on the first line; following lines hang after it
        float markerWidth = 0;
        std::string markerText;
        if (!marker.empty()) {
            markerText = marker + " ";
            markerWidth = platform_->measureText(markerText, font).width;
            if (markerWidth >= availableWidth) markerWidth = 0;
        }

        Line currentLine;
        float lineX = 0;
        bool lineHasText = false;

        if (markerWidth > 0) {
            TextRun markerRun;
            markerRun.text = markerText;
            markerRun.font = font;
            markerRun.x = 0;
            markerRun.width = markerWidth;
            markerRun.blockIndex = blockIndex;
            markerRun.isMarker = true;
            currentLine.runs.push_back(markerRun);
            lineX = markerWidth;
        }
        const float lineStartX = lineX;

        auto completeLine = [&](bool isLast) {
            currentLine.isLastLineOfParagraph = isLast;
            currentLine.width = lineX;
            currentLine.height = lineHeight;
            currentLine.ascent = metrics.ascent;
            currentLine.descent = metrics.descent;
            lines.push_back(std::move(currentLine));
            currentLine = Line{};
            lineX = lineStartX;
            lineHasText = false;
        };

        auto pushRun = [&](const std::string& s, float width) {
            TextRun run;
            run.text = s;
            run.font = font;
            run.x = lineX;
            run.width = width;
            run.blockIndex = blockIndex;
            currentLine.runs.push_back(run);
            lineX += width;
            lineHasText = true;
        };

        while (!remaining.empty()) {
            // Skip leading spaces at the beginning of a line
            if (!lineHasText) {
                size_t firstNonSpace = remaining.find_first_not_of(' ');
                if (firstNonSpace == std::string::npos) break;
                if (firstNonSpace > 0) remaining.erase(0, firstNonSpace);
            }

            float spaceLeft = availableWidth - lineX;
            auto measurement = platform_->measureText(remaining, font);

            if (measurement.width <= spaceLeft) {
                pushRun(remaining, measurement.width);
                remaining.clear();
                break;
            }

            size_t breakPos = platform_->findLineBreak(remaining, font, spaceLeft);
            if (breakPos > remaining.size()) breakPos = remaining.size();

            if (breakPos == 0) {
                // Nothing fits on an empty line: force one UTF-8 character
                breakPos = std::min(utf8CharLen(static_cast<unsigned char>(remaining[0])),
                                    remaining.size());
            }

            std::string segment = remaining.substr(0, breakPos);
            while (!segment.empty() && segment.back() == ' ') {
                segment.pop_back();
            }
            pushRun(segment, platform_->measureText(segment, font).width);
            remaining.erase(0, breakPos);

            if (!remaining.empty()) {
                completeLine(false);
            }
        }

        if (lineHasText) {
            completeLine(true);
        }
        if (!lines.empty()) {
            lines.back().isLastLineOfParagraph = true;
        }
        return lines;
    }

    // ---------------------------------------------------------------
    // Text alignment
    // ---------------------------------------------------------------
    void applyAlignment(Line& line, TextAlignment alignment, float contentWidth) {
        float extraSpace = contentWidth - line.width;
        if (extraSpace <= 0) return;

        switch (alignment) {
            case TextAlignment::Left:
                break;
            case TextAlignment::Center: {
                float offset = extraSpace / 2.0f;
                line.x += offset;
                for (auto& run : line.runs) {
                    run.x += offset;
                }
                break;
            }
            case TextAlignment::Right:
                line.x += extraSpace;
                for (auto& run : line.runs) {
                    run.x += extraSpace;
                }
                break;
            case TextAlignment::Justified:
                if (!line.isLastLineOfParagraph) {
                    justifyLine(line, contentWidth);
                }
                break;
        }
    }

    // ---------------------------------------------------------------
    // Justification: spread the free space over the spaces of text runs
    // ---------------------------------------------------------------
    void justifyLine(Line& line, float contentWidth) {
        if (line.runs.empty()) return;

        int spaceCount = 0;
        for (const auto& run : line.runs) {
            if (run.isMarker) continue;
            spaceCount += static_cast<int>(std::count(run.text.begin(), run.text.end(), ' '));
        }
        if (spaceCount == 0) return;

        float extraSpace = contentWidth - line.width;
        if (extraSpace <= 0) return;
        float extraPerSpace = extraSpace / static_cast<float>(spaceCount);

        float xCursor = line.runs[0].x;
        for (auto& run : line.runs) {
            run.x = xCursor;
            if (!run.isMarker) {
                int spacesInRun = static_cast<int>(std::count(run.text.begin(), run.text.end(), ' '));
                run.width += spacesInRun * extraPerSpace;
            }
            xCursor += run.width;
        }
        line.width = contentWidth;
    }
};

LayoutEngine::LayoutEngine(std::shared_ptr<PlatformAdapter> platform)
    : impl_(std::make_unique<Impl>(std::move(platform))) {}

LayoutEngine::~LayoutEngine() = default;

LayoutResult LayoutEngine::layoutDocument(const std::vector<StyledBlock>& blocks,
                                          const Style& style,
                                          const std::string& documentId) {
    return impl_->layoutDocument(blocks, style, documentId);
}

std::vector<Line> LayoutEngine::layoutBlock(const Block& block,
                                            const StyleDescriptor& descriptor,
                                            const Style& style,
                                            float availableWidth) {
    return impl_->layoutBlock(block, descriptor, style, availableWidth);
}

} // namespace marklayout
