#pragma once

#include <string>
#include <vector>
#include <optional>

#include "marklayout/document.h"
#include "marklayout/platform.h"
#include "marklayout/style.h"

namespace marklayout {

/// Theme selector: either a block kind ("title", "table", ...) or "*"
struct CSSSelector {
    bool universal = false;
    BlockType blockType = BlockType::Paragraph;

    bool matches(BlockType type) const { return universal || blockType == type; }

    int specificity() const { return universal ? 0 : 1; }
};

/// Declarations of one theme rule. Lengths are in points.
struct CSSProperties {
    std::optional<FontWeight> fontWeight;
    std::optional<FontStyle> fontStyle;
    std::optional<SizeTier> fontSize;
    std::optional<float> lineHeight;       // multiplier
    std::optional<float> marginTop;
    std::optional<float> marginBottom;
    std::optional<float> marginLeft;
    std::optional<TextAlignment> textAlign;
    std::optional<TextTransform> textTransform;
    std::optional<std::string> listMarker;
    std::optional<float> borderWidth;      // table grid, 0 disables the grid
    std::optional<float> cellPadding;      // all four sides
    std::optional<bool> headerShading;

    bool empty() const;

    /// Merge another set of properties into this one (other overrides)
    void merge(const CSSProperties& other);
};

struct CSSRule {
    CSSSelector selector;
    CSSProperties properties;
};

/// Theme stylesheet: block-kind selectors with presentation overrides.
///
///   heading { font-size: section; text-transform: none; margin-top: 18pt }
///   table   { border-width: 1; header-shading: off }
class CSSStylesheet {
public:
    std::vector<CSSRule> rules;

    /// Parse a stylesheet string. Unknown selectors, properties and
    /// values are skipped; parsing never fails.
    static CSSStylesheet parse(const std::string& css);

    /// Properties for a block kind, cascaded by specificity then order
    CSSProperties cascadeFor(BlockType type) const;
};

} // namespace marklayout
