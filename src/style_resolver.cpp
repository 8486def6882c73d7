#include "marklayout/style_resolver.h"
#include "marklayout/log.h"
#include <utility>

namespace marklayout {

namespace {

constexpr size_t indexOf(BlockType type) {
    return static_cast<size_t>(type);
}

StyleDescriptor textStyle(FontWeight weight, SizeTier tier, float lineSpacing,
                          float before, float after, float indent,
                          TextTransform transform = TextTransform::None,
                          const char* marker = "") {
    StyleDescriptor d;
    d.fontWeight = weight;
    d.sizeTier = tier;
    d.lineSpacingMultiplier = lineSpacing;
    d.spacingBefore = before;
    d.spacingAfter = after;
    d.leftIndent = indent;
    d.alignment = TextAlignment::Left;
    d.textTransform = transform;
    d.listMarker = marker;
    return d;
}

StyleDescriptor tableStyle(float after) {
    StyleDescriptor d = textStyle(FontWeight::Regular, SizeTier::Body, 1.3f, 0, after, 0);
    d.table = TableStyle{};
    return d;
}

/// Apply theme properties onto a descriptor
void applyProperties(const CSSProperties& props, StyleDescriptor& style) {
    if (props.fontWeight) style.fontWeight = *props.fontWeight;
    if (props.fontStyle) style.fontStyle = *props.fontStyle;
    if (props.fontSize) style.sizeTier = *props.fontSize;
    if (props.lineHeight) style.lineSpacingMultiplier = *props.lineHeight;
    if (props.marginTop) style.spacingBefore = *props.marginTop;
    if (props.marginBottom) style.spacingAfter = *props.marginBottom;
    if (props.marginLeft) style.leftIndent = *props.marginLeft;
    if (props.textAlign) style.alignment = *props.textAlign;
    if (props.textTransform) style.textTransform = *props.textTransform;
    if (props.listMarker) style.listMarker = *props.listMarker;

    if (style.table) {
        if (props.borderWidth) {
            style.table->gridWidth = *props.borderWidth;
            style.table->gridLines = *props.borderWidth > 0;
        }
        if (props.cellPadding) {
            style.table->cellPaddingLeft = *props.cellPadding;
            style.table->cellPaddingRight = *props.cellPadding;
            style.table->cellPaddingTop = *props.cellPadding;
            style.table->cellPaddingBottom = *props.cellPadding;
        }
        if (props.headerShading) style.table->shadeHeaderRow = *props.headerShading;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// StyleTable
// ---------------------------------------------------------------------------

StyleTable StyleTable::defaults() {
    StyleTable t;
    t.entries_ = {{
        //                        weight               tier               lead   before after indent
        /* Title     */ textStyle(FontWeight::Bold,    SizeTier::Title,   1.2f,  0,     18,   0),
        /* Heading   */ textStyle(FontWeight::Bold,    SizeTier::Section, 1.23f, 12,    6,    0,
                                  TextTransform::Uppercase),
        /* Bullet    */ textStyle(FontWeight::Regular, SizeTier::Body,    1.3f,  0,     1,    12,
                                  TextTransform::None, "\xe2\x80\xa2"),
        /* Paragraph */ textStyle(FontWeight::Regular, SizeTier::Body,    1.3f,  0,     2,    0),
        /* Spacer    */ textStyle(FontWeight::Regular, SizeTier::Body,    1.3f,  0,     6,    0),
        /* Table     */ tableStyle(6),
    }};
    // Section headings are bold oblique
    t.entries_[indexOf(BlockType::Heading)].fontStyle = FontStyle::Italic;
    return t;
}

const StyleDescriptor& StyleTable::lookup(BlockType type) const {
    return entries_[indexOf(type)];
}

void StyleTable::set(BlockType type, StyleDescriptor descriptor) {
    entries_[indexOf(type)] = std::move(descriptor);
}

StyleTable StyleTable::themed(const CSSStylesheet& stylesheet) const {
    StyleTable result = *this;
    for (size_t i = 0; i < kBlockTypeCount; ++i) {
        auto type = static_cast<BlockType>(i);
        auto props = stylesheet.cascadeFor(type);
        if (props.empty()) continue;
        applyProperties(props, result.entries_[i]);
        ML_LOGD("StyleTable::themed: '%s' overridden", blockTypeName(type));
    }
    return result;
}

// ---------------------------------------------------------------------------
// StyleResolver
// ---------------------------------------------------------------------------

StyleResolver::StyleResolver()
    : table_(StyleTable::defaults()) {}

StyleResolver::StyleResolver(StyleTable table)
    : table_(std::move(table)) {}

StyleResolver::StyleResolver(const CSSStylesheet& stylesheet)
    : table_(StyleTable::defaults().themed(stylesheet)) {}

StyleDescriptor StyleResolver::resolve(const Block& block) const {
    StyleDescriptor style = table_.lookup(block.type);
    // A single-row table has no header row to shade
    if (style.table && block.tableRows.size() < 2) {
        style.table->shadeHeaderRow = false;
    }
    return style;
}

std::vector<StyledBlock> StyleResolver::resolve(const std::vector<Block>& blocks) const {
    std::vector<StyledBlock> result;
    result.reserve(blocks.size());
    for (const auto& block : blocks) {
        result.push_back(StyledBlock{block, resolve(block)});
    }
    ML_LOGI("StyleResolver::resolve: blocks=%zu", result.size());
    return result;
}

} // namespace marklayout
