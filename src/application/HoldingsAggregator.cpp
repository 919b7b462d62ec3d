#include "application/HoldingsAggregator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace holdings::application {

HoldingsAggregator::HoldingsAggregator() {
    std::cout << "[HoldingsAggregator] Created" << std::endl;
}

double HoldingsAggregator::sanitize(const std::optional<double>& value, bool& invalid) {
    if (!value) {
        return 0.0;
    }
    if (!std::isfinite(*value) || *value < 0.0) {
        invalid = true;
        return 0.0;
    }
    return *value;
}

domain::HoldingsIndex HoldingsAggregator::aggregate(const domain::RawHoldingsSnapshot& raw) const {
    std::vector<domain::Entity> entities;
    std::vector<domain::Asset> assets;
    std::unordered_set<std::string> seenEntities;
    std::unordered_map<std::string, std::size_t> assetPos;

    entities.reserve(raw.entities.size());

    for (const auto& [entityId, record] : raw.entities) {
        if (!seenEntities.insert(entityId).second) {
            std::cerr << "[HoldingsAggregator] Duplicate entity '" << entityId
                      << "', keeping first record" << std::endl;
            continue;
        }

        domain::Entity entity(entityId);
        std::unordered_map<std::string, std::string> names;
        bool invalid = false;

        for (const auto& [symbol, rawAsset] : record.assets) {
            domain::Holding holding(sanitize(rawAsset.quantity, invalid),
                                    sanitize(rawAsset.valueUsd, invalid));

            if (entity.add(symbol, holding)) {
                names.emplace(symbol, rawAsset.name.value_or(symbol));
            } else {
                std::cerr << "[HoldingsAggregator] Entity '" << entityId
                          << "' lists '" << symbol << "' twice, merging" << std::endl;
            }
        }

        if (invalid) {
            std::cerr << "[HoldingsAggregator] Entity '" << entityId
                      << "' has invalid numeric fields, treated as 0" << std::endl;
        }

        for (const auto& symbol : entity.symbols) {
            const domain::Holding& holding = entity.assets.at(symbol);

            auto pos = assetPos.find(symbol);
            if (pos == assetPos.end()) {
                pos = assetPos.emplace(symbol, assets.size()).first;
                assets.emplace_back(symbol, names.at(symbol));
            }

            domain::Asset& asset = assets[pos->second];
            asset.entities.push_back(entityId);
            asset.totalQuantity += holding.quantity;
            asset.totalValue += holding.valueUsd;
        }

        entities.push_back(std::move(entity));
    }

    std::stable_sort(assets.begin(), assets.end(),
                     [](const domain::Asset& a, const domain::Asset& b) {
                         return a.totalValue > b.totalValue;
                     });

    return domain::HoldingsIndex(std::move(entities), std::move(assets));
}

} // namespace holdings::application
