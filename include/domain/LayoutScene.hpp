#pragma once

#include "enums/ElementKind.hpp"
#include "enums/PercentageTier.hpp"
#include "utils/Geometry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace holdings::domain {

/**
 * @brief Элемент сцены
 *
 * size зависит от вида элемента: для пузырей и зон это диаметр маркера
 * в точках рендера, для guide-shape это радиус в единицах сцены.
 */
struct SceneElement {
    ElementKind kind = ElementKind::ASSET_BUBBLE;
    std::string id;                         ///< Участник, актив или ключ легенды
    utils::Point position;
    double size = 0.0;
    std::string color;
    std::string outlineColor;
    double opacity = 1.0;
    std::optional<std::string> text;
    std::optional<std::string> tooltip;

    // Только для пузырей активов и записей легенды
    std::optional<PercentageTier> tier;
    double percentage = 0.0;
    bool multiHolder = false;
};

/**
 * @brief Фиксированное окно просмотра, масштаб 1:1
 */
struct ViewWindow {
    double xMin = -7.0;
    double xMax = 7.0;
    double yMin = -7.0;
    double yMax = 7.0;
    double aspectRatio = 1.0;
};

/**
 * @brief Текстовая подпись сцены
 */
struct Annotation {
    utils::Point position;
    std::string text;
    double fontSize = 12.0;
    std::string color;
};

/**
 * @brief Сцена для рендера
 *
 * Не ссылается на индекс, пересчитывается целиком на каждый вызов.
 * elements упорядочены по порядку отрисовки (последний сверху).
 */
class LayoutScene {
public:
    ViewWindow view;
    std::vector<SceneElement> elements;
    std::vector<SceneElement> legend;
    std::vector<SceneElement> guides;
    std::vector<Annotation> annotations;

    bool empty() const {
        return elements.empty();
    }

    std::vector<const SceneElement*> elementsOf(ElementKind kind) const {
        std::vector<const SceneElement*> result;
        for (const auto& e : elements) {
            if (e.kind == kind) {
                result.push_back(&e);
            }
        }
        return result;
    }

    /// Первый элемент данного вида с данным id, nullptr если нет
    const SceneElement* find(ElementKind kind, const std::string& id) const {
        for (const auto& e : elements) {
            if (e.kind == kind && e.id == id) {
                return &e;
            }
        }
        return nullptr;
    }
};

} // namespace holdings::domain
