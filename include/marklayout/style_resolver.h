#pragma once

#include "marklayout/css.h"
#include "marklayout/style.h"
#include "marklayout/document.h"
#include <array>
#include <vector>

namespace marklayout {

/// A block paired with its presentation, in document order
struct StyledBlock {
    Block block;
    StyleDescriptor style;
};

/// Block kind -> descriptor lookup table. The single source of truth for
/// presentation; theming replaces entries, never the parser.
class StyleTable {
public:
    /// The built-in CV theme
    static StyleTable defaults();

    const StyleDescriptor& lookup(BlockType type) const;
    void set(BlockType type, StyleDescriptor descriptor);

    /// Copy of this table with the stylesheet's rules applied
    StyleTable themed(const CSSStylesheet& stylesheet) const;

private:
    std::array<StyleDescriptor, kBlockTypeCount> entries_;
};

/// Attaches descriptors to blocks
class StyleResolver {
public:
    StyleResolver();
    explicit StyleResolver(StyleTable table);
    explicit StyleResolver(const CSSStylesheet& stylesheet);

    /// Descriptor for one block. Total over all block types.
    StyleDescriptor resolve(const Block& block) const;

    /// Resolve every block, preserving order
    std::vector<StyledBlock> resolve(const std::vector<Block>& blocks) const;

    const StyleTable& table() const { return table_; }

private:
    StyleTable table_;
};

} // namespace marklayout
