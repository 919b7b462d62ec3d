#pragma once

#include "domain/HoldingsIndex.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace holdings::application {

/**
 * @brief Пересечение выбора с индексом
 *
 * Сохраняет порядок выбора, пропускает неизвестные и повторные идентификаторы.
 */
class SelectionFilter {
public:
    static std::vector<const domain::Entity*> entities(const domain::HoldingsIndex& index,
                                                       const std::vector<std::string>& ids) {
        std::vector<const domain::Entity*> result;
        std::unordered_set<std::string> seen;
        for (const auto& id : ids) {
            if (!seen.insert(id).second) continue;
            if (const auto* entity = index.findEntity(id)) {
                result.push_back(entity);
            }
        }
        return result;
    }

    static std::vector<const domain::Asset*> assets(const domain::HoldingsIndex& index,
                                                    const std::vector<std::string>& symbols) {
        std::vector<const domain::Asset*> result;
        std::unordered_set<std::string> seen;
        for (const auto& symbol : symbols) {
            if (!seen.insert(symbol).second) continue;
            if (const auto* asset = index.findAsset(symbol)) {
                result.push_back(asset);
            }
        }
        return result;
    }
};

} // namespace holdings::application
