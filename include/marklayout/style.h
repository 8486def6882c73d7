#pragma once

#include "marklayout/platform.h"
#include <cstdint>
#include <optional>
#include <string>

namespace marklayout {

/// Text alignment options
enum class TextAlignment {
    Left,
    Center,
    Right,
    Justified,
};

enum class TextTransform {
    None,
    Uppercase,
};

/// Relative font size class; converted to points through Style
enum class SizeTier {
    Body,
    Section,
    Title,
};

enum class VerticalAlign {
    Top,
    Middle,
};

/// 8-bit RGB color
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    static constexpr Color black()     { return {0x00, 0x00, 0x00}; }
    static constexpr Color grey()      { return {0x80, 0x80, 0x80}; }
    static constexpr Color lightGrey() { return {0xD3, 0xD3, 0xD3}; }

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

/// Table presentation: grid, header row shading, cell padding
struct TableStyle {
    bool gridLines = true;
    float gridWidth = 0.5f;
    Color gridColor = Color::grey();

    // Applied to the first row only when the table has more than one row
    bool shadeHeaderRow = true;
    Color headerBackground = Color::lightGrey();
    Color headerTextColor = Color::black();

    float cellPaddingLeft = 4.0f;
    float cellPaddingRight = 4.0f;
    float cellPaddingTop = 2.0f;
    float cellPaddingBottom = 2.0f;
    VerticalAlign cellVerticalAlign = VerticalAlign::Middle;
};

/// Presentation of one block. All lengths in points.
struct StyleDescriptor {
    FontWeight fontWeight = FontWeight::Regular;
    FontStyle fontStyle = FontStyle::Normal;
    SizeTier sizeTier = SizeTier::Body;
    float lineSpacingMultiplier = 1.3f;    // leading / font size
    float spacingBefore = 0;
    float spacingAfter = 0;
    float leftIndent = 0;
    TextAlignment alignment = TextAlignment::Left;
    TextTransform textTransform = TextTransform::None;
    std::string listMarker;                // Drawn before the first line (bullets)

    // Only set for Table blocks
    std::optional<TableStyle> table;
};

/// Page size and margins in points
struct PageGeometry {
    float width = 595.28f;     // A4
    float height = 841.89f;
    float marginTop = 40.0f;
    float marginBottom = 40.0f;
    float marginLeft = 40.0f;
    float marginRight = 40.0f;

    float contentWidth() const { return width - marginLeft - marginRight; }
    float contentHeight() const { return height - marginTop - marginBottom; }

    bool isValid() const { return contentWidth() > 0 && contentHeight() > 0; }
};

/// Document-wide settings: base font, size tiers and page geometry
struct Style {
    FontDescriptor font;                   // Body font; size is the Body tier size

    float sectionScale = 1.3f;
    float titleScale = 2.0f;

    PageGeometry page;

    /// Font size in points for a size tier
    float fontSize(SizeTier tier) const {
        switch (tier) {
            case SizeTier::Body:    return font.size;
            case SizeTier::Section: return font.size * sectionScale;
            case SizeTier::Title:   return font.size * titleScale;
        }
        return font.size;
    }

    /// Font for a block with the given descriptor
    FontDescriptor fontFor(const StyleDescriptor& desc) const {
        FontDescriptor f = font;
        f.size = fontSize(desc.sizeTier);
        f.weight = desc.fontWeight;
        f.style = desc.fontStyle;
        return f;
    }
};

} // namespace marklayout
