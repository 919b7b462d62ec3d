#pragma once

#include <string>

namespace holdings::domain {

enum class ElementKind {
    ENTITY_ZONE,
    ENTITY_LABEL,
    ASSET_BUBBLE,
    ASSET_LABEL,
    PERCENTAGE_OVERLAY,
    LEGEND_ENTRY,
    GUIDE_SHAPE
};

inline std::string toString(ElementKind kind) {
    switch (kind) {
        case ElementKind::ENTITY_ZONE: return "entity-zone";
        case ElementKind::ENTITY_LABEL: return "entity-label";
        case ElementKind::ASSET_BUBBLE: return "asset-bubble";
        case ElementKind::ASSET_LABEL: return "asset-label";
        case ElementKind::PERCENTAGE_OVERLAY: return "percentage-overlay";
        case ElementKind::LEGEND_ENTRY: return "legend-entry";
        case ElementKind::GUIDE_SHAPE: return "guide-shape";
        default: return "unknown";
    }
}

} // namespace holdings::domain
