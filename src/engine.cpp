#include "marklayout/engine.h"
#include "marklayout/log.h"
#include <exception>

namespace marklayout {

Engine::Engine(std::shared_ptr<PlatformAdapter> platform)
    : platform_(std::move(platform))
    , layoutEngine_(std::make_unique<LayoutEngine>(platform_)) {}

Engine::~Engine() = default;

std::vector<StyledBlock> Engine::compose(const std::string& markup,
                                         const std::string& documentId,
                                         const std::optional<ParseOptions>& options) {
    lastBlocks_ = buildBlocks(markup, options.value_or(parseOptions_));
    lastDocumentId_ = documentId;
    return resolver_.resolve(lastBlocks_);
}

LayoutResult Engine::layoutMarkup(const std::string& markup,
                                  const std::string& documentId,
                                  const Style& style) {
    ML_LOGI("layoutMarkup: doc='%s' text=%zu page=%.0fx%.0f",
            documentId.c_str(), markup.size(), style.page.width, style.page.height);

    try {
        lastBlocks_ = buildBlocks(markup, parseOptions_);
    } catch (const std::exception& e) {
        ML_LOGW("layoutMarkup: parse failed for '%s': %s", documentId.c_str(), e.what());
        LayoutResult result;
        result.documentId = documentId;
        result.warnings.push_back(LayoutWarning::ParseError);
        return result;
    }
    lastDocumentId_ = documentId;

    return layoutLast(style);
}

LayoutResult Engine::layoutMarkup(const std::string& markup,
                                  const std::string& themeCss,
                                  const std::string& documentId,
                                  const Style& style) {
    ML_LOGI("layoutMarkup+theme: doc='%s' text=%zu css=%zu",
            documentId.c_str(), markup.size(), themeCss.size());

    try {
        setTheme(CSSStylesheet::parse(themeCss));
        lastBlocks_ = buildBlocks(markup, parseOptions_);
    } catch (const std::exception& e) {
        ML_LOGW("layoutMarkup+theme: parse failed for '%s': %s", documentId.c_str(), e.what());
        LayoutResult result;
        result.documentId = documentId;
        result.warnings.push_back(LayoutWarning::ParseError);
        return result;
    }
    lastDocumentId_ = documentId;

    return layoutLast(style);
}

LayoutResult Engine::relayout(const Style& style) {
    ML_LOGI("relayout: doc='%s' blocks=%zu page=%.0fx%.0f",
            lastDocumentId_.c_str(), lastBlocks_.size(),
            style.page.width, style.page.height);

    if (lastBlocks_.empty()) {
        ML_LOGW("relayout: empty content for '%s'", lastDocumentId_.c_str());
        LayoutResult result;
        result.documentId = lastDocumentId_;
        result.warnings.push_back(LayoutWarning::EmptyContent);
        return result;
    }

    return layoutLast(style);
}

void Engine::setTheme(const CSSStylesheet& stylesheet) {
    resolver_ = StyleResolver(stylesheet);
}

std::shared_ptr<PlatformAdapter> Engine::platform() const {
    return platform_;
}

// ---------------------------------------------------------------------------
// Internal
// ---------------------------------------------------------------------------

LayoutResult Engine::layoutLast(const Style& style) {
    auto styled = resolver_.resolve(lastBlocks_);
    auto result = layoutEngine_->layoutDocument(styled, style, lastDocumentId_);

    if (lastBlocks_.empty()) {
        result.warnings.push_back(LayoutWarning::EmptyContent);
    }

    ML_LOGI("layoutMarkup: doc='%s' blocks=%d pages=%zu warnings=%zu",
            lastDocumentId_.c_str(), result.totalBlocks,
            result.pages.size(), result.warnings.size());
    return result;
}

} // namespace marklayout
