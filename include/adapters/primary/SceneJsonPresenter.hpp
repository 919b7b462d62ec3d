#pragma once

#include "domain/LayoutScene.hpp"
#include <nlohmann/json.hpp>

namespace holdings::adapters::primary {

/**
 * @brief Сцена -> JSON для внешнего рендера
 *
 * Рендеру не нужна дополнительная логика раскладки: окно просмотра,
 * порядок отрисовки и цвета уже в документе.
 */
class SceneJsonPresenter {
public:
    static nlohmann::ordered_json toJson(const domain::LayoutScene& scene) {
        nlohmann::ordered_json j;
        j["view"] = {
            {"x_range", {scene.view.xMin, scene.view.xMax}},
            {"y_range", {scene.view.yMin, scene.view.yMax}},
            {"aspect_ratio", scene.view.aspectRatio}
        };
        j["empty"] = scene.empty();
        j["elements"] = elementsToJson(scene.elements);
        j["legend"] = elementsToJson(scene.legend);
        j["guides"] = elementsToJson(scene.guides);

        nlohmann::ordered_json annotations = nlohmann::ordered_json::array();
        for (const auto& a : scene.annotations) {
            annotations.push_back({
                {"x", a.position.x},
                {"y", a.position.y},
                {"text", a.text},
                {"font_size", a.fontSize},
                {"color", a.color}
            });
        }
        j["annotations"] = annotations;
        return j;
    }

    static nlohmann::ordered_json elementToJson(const domain::SceneElement& e) {
        nlohmann::ordered_json j;
        j["kind"] = domain::toString(e.kind);
        j["id"] = e.id;
        j["x"] = e.position.x;
        j["y"] = e.position.y;
        j["size"] = e.size;
        j["color"] = e.color;
        if (!e.outlineColor.empty()) {
            j["outline_color"] = e.outlineColor;
        }
        j["opacity"] = e.opacity;
        if (e.text) {
            j["text"] = *e.text;
        }
        if (e.tooltip) {
            j["tooltip"] = *e.tooltip;
        }
        if (e.tier) {
            j["tier"] = domain::toString(*e.tier);
        }
        if (e.kind == domain::ElementKind::ASSET_BUBBLE) {
            j["percentage"] = e.percentage;
            j["multi_holder"] = e.multiHolder;
        }
        return j;
    }

private:
    static nlohmann::ordered_json elementsToJson(const std::vector<domain::SceneElement>& elements) {
        nlohmann::ordered_json array = nlohmann::ordered_json::array();
        for (const auto& e : elements) {
            array.push_back(elementToJson(e));
        }
        return array;
    }
};

} // namespace holdings::adapters::primary
