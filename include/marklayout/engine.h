#pragma once

#include "marklayout/document.h"
#include "marklayout/markup.h"
#include "marklayout/style.h"
#include "marklayout/css.h"
#include "marklayout/style_resolver.h"
#include "marklayout/layout.h"
#include "marklayout/page.h"
#include "marklayout/platform.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marklayout {

/// Main entry point: markup text in, styled blocks or pages out.
/// Holds the last parsed document so it can be re-laid out with new
/// settings; one instance per document stream.
class Engine {
public:
    explicit Engine(std::shared_ptr<PlatformAdapter> platform);
    ~Engine();

    /// Parse markup and attach styles from the current theme.
    /// Without explicit options the ones from setParseOptions() apply.
    std::vector<StyledBlock> compose(const std::string& markup,
                                     const std::string& documentId = {},
                                     const std::optional<ParseOptions>& options = std::nullopt);

    /// Parse markup and lay it out with the current theme
    LayoutResult layoutMarkup(const std::string& markup,
                              const std::string& documentId,
                              const Style& style);

    /// Parse a theme stylesheet and markup, then lay out.
    /// The theme stays active for later calls.
    LayoutResult layoutMarkup(const std::string& markup,
                              const std::string& themeCss,
                              const std::string& documentId,
                              const Style& style);

    /// Re-layout the last document with new settings, without re-parsing
    LayoutResult relayout(const Style& style);

    /// Replace the active theme with the defaults plus the given stylesheet
    void setTheme(const CSSStylesheet& stylesheet);

    void setParseOptions(const ParseOptions& options) { parseOptions_ = options; }

    const std::vector<Block>& lastBlocks() const { return lastBlocks_; }
    const StyleResolver& resolver() const { return resolver_; }

    std::shared_ptr<PlatformAdapter> platform() const;

private:
    LayoutResult layoutLast(const Style& style);

    std::shared_ptr<PlatformAdapter> platform_;
    std::unique_ptr<LayoutEngine> layoutEngine_;
    StyleResolver resolver_;
    ParseOptions parseOptions_;
    std::vector<Block> lastBlocks_;
    std::string lastDocumentId_;
};

} // namespace marklayout
