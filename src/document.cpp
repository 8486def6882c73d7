#include "marklayout/document.h"

namespace marklayout {

const char* blockTypeName(BlockType type) {
    switch (type) {
        case BlockType::Title:     return "title";
        case BlockType::Heading:   return "heading";
        case BlockType::Bullet:    return "bullet";
        case BlockType::Paragraph: return "paragraph";
        case BlockType::Spacer:    return "spacer";
        case BlockType::Table:     return "table";
    }
    return "";
}

} // namespace marklayout
