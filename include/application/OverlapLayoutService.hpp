#pragma once

#include "ports/input/ILayoutService.hpp"
#include "settings/LayoutSettings.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace holdings::application {

/**
 * @brief Сервис построения сцены пересечений
 *
 * Приближённая диаграмма Венна для многих множеств:
 * - участники стоят на окружности, порядок по убыванию totalValue;
 * - актив ставится во взвешенный центр якорей своих держателей,
 *   вес - стоимость именно этого актива у держателя;
 * - размер пузыря логарифмический, цвет по диапазону доли рынка.
 *
 * Это не точное решение диаграммы Венна (для > 3 множеств оно
 * в общем случае не существует), а визуальное приближение.
 */
class OverlapLayoutService : public ports::input::ILayoutService {
public:
    static constexpr std::array<const char*, 15> kEntityPalette = {
        "#3366CC", "#DC3912", "#FF9900", "#109618", "#990099",
        "#0099C6", "#DD4477", "#66AA00", "#B82E2E", "#316395",
        "#994499", "#22AA99", "#AAAA11", "#6633CC", "#E67300"
    };

    static constexpr const char* kMultiHolderColor = "#8C1AFF";

    explicit OverlapLayoutService(std::shared_ptr<settings::LayoutSettings> settings);

    domain::LayoutScene layout(const domain::HoldingsIndex& index,
                               const domain::Selection& selection) const override;

    /// Цвет участника по рангу, палитра повторяется по кругу
    static std::string entityColor(std::size_t rank);

private:
    struct Anchor {
        const domain::Entity* entity = nullptr;
        utils::Point position;
        std::string color;
    };

    struct AssetPlacement {
        const domain::Asset* asset = nullptr;
        utils::Point position;
        double baseSize = 0.0;
        double drawnSize = 0.0;
        double percentage = 0.0;
        std::vector<const Anchor*> holders;
    };

    std::shared_ptr<settings::LayoutSettings> settings_;

    std::vector<Anchor> placeEntities(std::vector<const domain::Entity*> entities) const;
    AssetPlacement placeAsset(const domain::Asset& asset,
                              const std::vector<const Anchor*>& holders,
                              double selectedTotal) const;

    domain::SceneElement makeEntityZone(const Anchor& anchor) const;
    domain::SceneElement makeEntityLabel(const Anchor& anchor) const;
    domain::SceneElement makeAssetBubble(const AssetPlacement& placement) const;
    domain::SceneElement makeAssetLabel(const AssetPlacement& placement) const;
    domain::SceneElement makePercentageOverlay(const AssetPlacement& placement) const;

    std::string assetTooltip(const AssetPlacement& placement) const;

    void addLegend(domain::LayoutScene& scene) const;
    void addGuides(domain::LayoutScene& scene) const;
};

} // namespace holdings::application
