#include "marklayout/css.h"
#include "marklayout/log.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace marklayout {

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return std::string();
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Split on a delimiter, trimming each piece and dropping empty ones
std::vector<std::string> splitList(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t stop = text.find(delimiter, begin);
        if (stop == std::string::npos) stop = text.size();
        std::string part = trim(text.substr(begin, stop - begin));
        if (!part.empty()) parts.push_back(std::move(part));
        begin = stop + 1;
    }
    return parts;
}

/// Remove /* ... */ comments; an unterminated comment runs to the end
std::string stripComments(const std::string& css) {
    std::string out;
    out.reserve(css.size());
    size_t pos = 0;
    while (pos < css.size()) {
        size_t open = css.find("/*", pos);
        out.append(css, pos, open == std::string::npos ? std::string::npos : open - pos);
        if (open == std::string::npos) break;
        size_t close = css.find("*/", open + 2);
        if (close == std::string::npos) break;
        pos = close + 2;
    }
    return out;
}

/// A number with its (possibly empty) unit suffix, e.g. "4.5pt"
struct Quantity {
    float value = 0;
    std::string unit;
};

std::optional<Quantity> parseQuantity(const std::string& text) {
    size_t i = 0;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) ++i;
    size_t digits = 0;
    bool seenDot = false;
    for (; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isdigit(c)) {
            ++digits;
        } else if (c == '.' && !seenDot) {
            seenDot = true;
        } else {
            break;
        }
    }
    if (digits == 0) return std::nullopt;

    Quantity q;
    try {
        q.value = std::stof(text.substr(0, i));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    q.unit = text.substr(i);
    return q;
}

/// Unitless number
std::optional<float> parseNumber(const std::string& text) {
    auto q = parseQuantity(text);
    if (!q || !q->unit.empty()) return std::nullopt;
    return q->value;
}

/// Length in points. "px" is taken as a point; relative units are rejected.
std::optional<float> parseLength(const std::string& text) {
    auto q = parseQuantity(text);
    if (!q) return std::nullopt;
    if (!q->unit.empty() && q->unit != "pt" && q->unit != "px") return std::nullopt;
    return q->value;
}

/// Length that must not be negative (margins, borders, padding)
std::optional<float> parseExtent(const std::string& text) {
    auto len = parseLength(text);
    if (!len || *len < 0) return std::nullopt;
    return len;
}

std::string unquote(const std::string& text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
        text.back() == text.front()) {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

struct SelectorName {
    const char* name;
    BlockType type;
};

constexpr SelectorName kSelectorNames[] = {
    {"title", BlockType::Title},         {"h1", BlockType::Title},
    {"heading", BlockType::Heading},     {"h2", BlockType::Heading},
    {"bullet", BlockType::Bullet},       {"li", BlockType::Bullet},
    {"paragraph", BlockType::Paragraph}, {"p", BlockType::Paragraph},
    {"spacer", BlockType::Spacer},
    {"table", BlockType::Table},
};

std::optional<CSSSelector> parseSelector(const std::string& text) {
    const std::string name = toLower(text);
    CSSSelector selector;
    if (name == "*") {
        selector.universal = true;
        return selector;
    }
    for (const auto& entry : kSelectorNames) {
        if (name == entry.name) {
            selector.blockType = entry.type;
            return selector;
        }
    }
    return std::nullopt;
}

/// CSS box shorthand: top [right [bottom [left]]]. Right is not used.
/// One bad value rejects the whole declaration.
void applyMarginShorthand(CSSProperties& props, const std::string& value) {
    std::vector<float> sides;
    std::istringstream stream(value);
    std::string token;
    while (stream >> token) {
        auto len = parseExtent(token);
        if (!len || sides.size() == 4) return;
        sides.push_back(*len);
    }
    if (sides.empty()) return;

    const float top = sides[0];
    const float right = sides.size() > 1 ? sides[1] : top;
    props.marginTop = top;
    props.marginBottom = sides.size() > 2 ? sides[2] : top;
    props.marginLeft = sides.size() > 3 ? sides[3] : right;
}

void applyDeclaration(CSSProperties& props, const std::string& property,
                      const std::string& rawValue) {
    const std::string value = toLower(rawValue);

    if (property == "font-weight") {
        if (value == "bold") {
            props.fontWeight = FontWeight::Bold;
        } else if (value == "normal") {
            props.fontWeight = FontWeight::Regular;
        } else if (auto weight = parseNumber(value)) {
            if (*weight >= 100 && *weight <= 900) {
                props.fontWeight = static_cast<FontWeight>(static_cast<uint16_t>(*weight));
            }
        }
    } else if (property == "font-style") {
        if (value == "italic" || value == "oblique") props.fontStyle = FontStyle::Italic;
        else if (value == "normal") props.fontStyle = FontStyle::Normal;
    } else if (property == "font-size") {
        if (value == "body") props.fontSize = SizeTier::Body;
        else if (value == "section") props.fontSize = SizeTier::Section;
        else if (value == "title") props.fontSize = SizeTier::Title;
    } else if (property == "line-height") {
        auto lead = parseNumber(value);
        if (lead && *lead > 0) props.lineHeight = *lead;
    } else if (property == "text-align") {
        if (value == "left") props.textAlign = TextAlignment::Left;
        else if (value == "center") props.textAlign = TextAlignment::Center;
        else if (value == "right") props.textAlign = TextAlignment::Right;
        else if (value == "justify") props.textAlign = TextAlignment::Justified;
    } else if (property == "text-transform") {
        if (value == "none") props.textTransform = TextTransform::None;
        else if (value == "uppercase") props.textTransform = TextTransform::Uppercase;
    } else if (property == "list-marker") {
        props.listMarker = value == "none" ? std::string() : unquote(rawValue);
    } else if (property == "margin") {
        applyMarginShorthand(props, value);
    } else if (property == "margin-top") {
        if (auto len = parseExtent(value)) props.marginTop = *len;
    } else if (property == "margin-bottom") {
        if (auto len = parseExtent(value)) props.marginBottom = *len;
    } else if (property == "margin-left") {
        if (auto len = parseExtent(value)) props.marginLeft = *len;
    } else if (property == "border-width") {
        if (auto len = parseExtent(value)) props.borderWidth = *len;
    } else if (property == "cell-padding") {
        if (auto len = parseExtent(value)) props.cellPadding = *len;
    } else if (property == "header-shading") {
        if (value == "on" || value == "true") props.headerShading = true;
        else if (value == "off" || value == "false" || value == "none") props.headerShading = false;
    } else {
        ML_LOGD("CSSStylesheet: ignoring property '%s'", property.c_str());
    }
}

CSSProperties parseDeclarations(const std::string& block) {
    CSSProperties props;
    for (const auto& declaration : splitList(block, ';')) {
        auto colon = declaration.find(':');
        if (colon == std::string::npos) continue;
        applyDeclaration(props, toLower(trim(declaration.substr(0, colon))),
                         trim(declaration.substr(colon + 1)));
    }
    return props;
}

/// Position just past an @-rule starting at `pos`: either its terminating
/// ';' or its balanced { } block. npos when the rule is unterminated.
size_t skipAtRule(const std::string& css, size_t pos) {
    size_t semi = css.find(';', pos);
    size_t brace = css.find('{', pos);
    if (brace == std::string::npos || (semi != std::string::npos && semi < brace)) {
        return semi == std::string::npos ? std::string::npos : semi + 1;
    }
    int depth = 0;
    for (size_t i = brace; i < css.size(); ++i) {
        if (css[i] == '{') {
            ++depth;
        } else if (css[i] == '}' && --depth == 0) {
            return i + 1;
        }
    }
    return std::string::npos;
}

template <typename T>
void overlay(std::optional<T>& target, const std::optional<T>& source) {
    if (source) target = source;
}

} // anonymous namespace

// --- CSSProperties ---

bool CSSProperties::empty() const {
    return !fontWeight && !fontStyle && !fontSize && !lineHeight && !marginTop &&
           !marginBottom && !marginLeft && !textAlign && !textTransform &&
           !listMarker && !borderWidth && !cellPadding && !headerShading;
}

void CSSProperties::merge(const CSSProperties& other) {
    overlay(fontWeight, other.fontWeight);
    overlay(fontStyle, other.fontStyle);
    overlay(fontSize, other.fontSize);
    overlay(lineHeight, other.lineHeight);
    overlay(marginTop, other.marginTop);
    overlay(marginBottom, other.marginBottom);
    overlay(marginLeft, other.marginLeft);
    overlay(textAlign, other.textAlign);
    overlay(textTransform, other.textTransform);
    overlay(listMarker, other.listMarker);
    overlay(borderWidth, other.borderWidth);
    overlay(cellPadding, other.cellPadding);
    overlay(headerShading, other.headerShading);
}

// --- CSSStylesheet ---

CSSStylesheet CSSStylesheet::parse(const std::string& css) {
    CSSStylesheet sheet;
    const std::string text = stripComments(css);

    size_t pos = text.find_first_not_of(kWhitespace);
    while (pos != std::string::npos) {
        if (text[pos] == '@') {
            pos = skipAtRule(text, pos);
        } else {
            size_t open = text.find('{', pos);
            size_t close = open == std::string::npos ? open : text.find('}', open + 1);
            if (close == std::string::npos) break;

            const auto selectors = splitList(text.substr(pos, open - pos), ',');
            const std::string body = trim(text.substr(open + 1, close - open - 1));
            if (!body.empty()) {
                const CSSProperties properties = parseDeclarations(body);
                for (const auto& name : selectors) {
                    auto selector = parseSelector(name);
                    if (!selector) {
                        ML_LOGW("CSSStylesheet: unknown selector '%s'", name.c_str());
                        continue;
                    }
                    sheet.rules.push_back(CSSRule{*selector, properties});
                }
            }
            pos = close + 1;
        }
        if (pos == std::string::npos) break;
        pos = text.find_first_not_of(kWhitespace, pos);
    }

    ML_LOGI("CSSStylesheet::parse: css=%zu rules=%zu", css.size(), sheet.rules.size());
    return sheet;
}

CSSProperties CSSStylesheet::cascadeFor(BlockType type) const {
    std::vector<const CSSRule*> matches;
    for (const auto& rule : rules) {
        if (rule.selector.matches(type)) {
            matches.push_back(&rule);
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const CSSRule* a, const CSSRule* b) {
                         return a->selector.specificity() < b->selector.specificity();
                     });

    CSSProperties result;
    for (const auto* rule : matches) {
        result.merge(rule->properties);
    }
    return result;
}

} // namespace marklayout
