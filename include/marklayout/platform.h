#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace marklayout {

/// Font weight values matching CSS font-weight
enum class FontWeight : uint16_t {
    Regular    = 400,
    Medium     = 500,
    Semibold   = 600,
    Bold       = 700,
};

enum class FontStyle {
    Normal,
    Italic,
};

/// Font descriptor for requesting a specific font
struct FontDescriptor {
    std::string family = "Helvetica";
    float size = 10.0f;
    FontWeight weight = FontWeight::Regular;
    FontStyle style = FontStyle::Normal;
};

/// Metrics for a resolved font
struct FontMetrics {
    float ascent = 0;       // Distance from baseline to top
    float descent = 0;      // Distance from baseline to bottom (positive)
    float leading = 0;      // Inter-line spacing recommended by font

    float lineHeight() const { return ascent + descent + leading; }
};

/// Result of measuring a text run
struct TextMeasurement {
    float width = 0;
    float height = 0;
};

/// Abstract interface for font operations of the output backend.
/// A PDF writer implements it with its own font tables; tests use a
/// fixed-width mock.
class PlatformAdapter {
public:
    virtual ~PlatformAdapter() = default;

    /// Resolve a font descriptor and return its metrics
    virtual FontMetrics resolveFontMetrics(const FontDescriptor& desc) = 0;

    /// Measure the width of a text string with the given font
    virtual TextMeasurement measureText(const std::string& text,
                                        const FontDescriptor& font) = 0;

    /// Find a valid line break position within text that fits maxWidth.
    /// Returns the byte index where the break should occur.
    /// If the entire text fits, returns text.size().
    virtual size_t findLineBreak(const std::string& text,
                                 const FontDescriptor& font,
                                 float maxWidth) = 0;
};

} // namespace marklayout
