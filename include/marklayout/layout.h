#pragma once

#include "marklayout/document.h"
#include "marklayout/style.h"
#include "marklayout/style_resolver.h"
#include "marklayout/page.h"
#include "marklayout/platform.h"
#include <memory>
#include <string>
#include <vector>

namespace marklayout {

/// The layout engine: takes styled blocks + page settings and produces
/// pages with positioned text runs and table decorations.
/// Blocks are never reordered or dropped; tables break only between rows.
class LayoutEngine {
public:
    explicit LayoutEngine(std::shared_ptr<PlatformAdapter> platform);
    ~LayoutEngine();

    /// Lay out a document's styled blocks into pages
    LayoutResult layoutDocument(const std::vector<StyledBlock>& blocks,
                                const Style& style,
                                const std::string& documentId = {});

    /// Break a single text block into lines at x = 0, y = 0
    std::vector<Line> layoutBlock(const Block& block,
                                  const StyleDescriptor& descriptor,
                                  const Style& style,
                                  float availableWidth);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace marklayout
