#pragma once

#include "Entity.hpp"
#include "Asset.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace holdings::domain {

/**
 * @brief Нормализованный индекс Entity <-> Asset
 *
 * Участники хранятся в порядке поступления, активы отсортированы
 * по totalValue по убыванию (при равенстве сохраняется порядок появления).
 * После построения не изменяется.
 */
class HoldingsIndex {
public:
    HoldingsIndex() = default;

    HoldingsIndex(std::vector<Entity> entities, std::vector<Asset> assets)
        : entities_(std::move(entities)), assets_(std::move(assets))
    {
        for (std::size_t i = 0; i < entities_.size(); ++i) {
            entityPos_.emplace(entities_[i].name, i);
        }
        for (std::size_t i = 0; i < assets_.size(); ++i) {
            assetPos_.emplace(assets_[i].symbol, i);
        }
    }

    const std::vector<Entity>& entities() const { return entities_; }
    const std::vector<Asset>& assets() const { return assets_; }

    /// nullptr, если участника нет в индексе
    const Entity* findEntity(const std::string& name) const {
        auto it = entityPos_.find(name);
        return it != entityPos_.end() ? &entities_[it->second] : nullptr;
    }

    /// nullptr, если актива нет в индексе
    const Asset* findAsset(const std::string& symbol) const {
        auto it = assetPos_.find(symbol);
        return it != assetPos_.end() ? &assets_[it->second] : nullptr;
    }

    bool empty() const {
        return entities_.empty() && assets_.empty();
    }

    double totalEntityValue() const {
        double total = 0.0;
        for (const auto& e : entities_) {
            total += e.totalValue;
        }
        return total;
    }

    double totalAssetValue() const {
        double total = 0.0;
        for (const auto& a : assets_) {
            total += a.totalValue;
        }
        return total;
    }

    bool operator==(const HoldingsIndex& other) const {
        return entities_ == other.entities_ && assets_ == other.assets_;
    }

private:
    std::vector<Entity> entities_;
    std::vector<Asset> assets_;
    std::unordered_map<std::string, std::size_t> entityPos_;
    std::unordered_map<std::string, std::size_t> assetPos_;
};

} // namespace holdings::domain
