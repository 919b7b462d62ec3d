#pragma once

#include <cstdlib>
#include <string>

namespace holdings::settings {

/**
 * @brief Настройки построения сцены
 *
 * Читает из ENV:
 * - LAYOUT_ANCHOR_RADIUS (default: 5.5) - радиус окружности якорей
 * - LAYOUT_ZONE_SCALE (default: 0.0005) - множитель sqrt(total_value) для зоны
 * - LAYOUT_ZONE_MIN_SIZE (default: 40) - минимальный размер зоны
 * - LAYOUT_ZONE_LIGHTEN (default: 0.8) - осветление цвета зоны
 * - LAYOUT_ASSET_SCALE (default: 0.8) - множитель log10(total_value)
 * - LAYOUT_MARKER_SCALE (default: 25) - базовый размер -> размер маркера
 * - LAYOUT_OVERLAY_MIN_SIZE (default: 35) - порог для подписи с процентом
 * - LAYOUT_SOURCE_LABEL (default: "CoinGecko API")
 *
 * @throws std::invalid_argument если значение не число
 */
class LayoutSettings {
public:
    LayoutSettings() {
        if (const char* val = std::getenv("LAYOUT_ANCHOR_RADIUS")) {
            anchorRadius_ = std::stod(val);
        }
        if (const char* val = std::getenv("LAYOUT_ZONE_SCALE")) {
            zoneScale_ = std::stod(val);
        }
        if (const char* val = std::getenv("LAYOUT_ZONE_MIN_SIZE")) {
            zoneMinSize_ = std::stod(val);
        }
        if (const char* val = std::getenv("LAYOUT_ZONE_LIGHTEN")) {
            zoneLighten_ = std::stod(val);
        }
        if (const char* val = std::getenv("LAYOUT_ASSET_SCALE")) {
            assetScale_ = std::stod(val);
        }
        if (const char* val = std::getenv("LAYOUT_MARKER_SCALE")) {
            markerScale_ = std::stod(val);
        }
        if (const char* val = std::getenv("LAYOUT_OVERLAY_MIN_SIZE")) {
            overlayMinSize_ = std::stod(val);
        }
        if (const char* val = std::getenv("LAYOUT_SOURCE_LABEL")) {
            sourceLabel_ = val;
        }
    }

    double getAnchorRadius() const { return anchorRadius_; }
    double getZoneScale() const { return zoneScale_; }
    double getZoneMinSize() const { return zoneMinSize_; }
    double getZoneLighten() const { return zoneLighten_; }
    double getAssetScale() const { return assetScale_; }
    double getMarkerScale() const { return markerScale_; }
    double getOverlayMinSize() const { return overlayMinSize_; }
    const std::string& getSourceLabel() const { return sourceLabel_; }

private:
    double anchorRadius_ = 5.5;
    double zoneScale_ = 0.0005;
    double zoneMinSize_ = 40.0;
    double zoneLighten_ = 0.8;
    double assetScale_ = 0.8;
    double markerScale_ = 25.0;
    double overlayMinSize_ = 35.0;
    std::string sourceLabel_ = "CoinGecko API";
};

} // namespace holdings::settings
