#pragma once

#include "domain/HoldingsIndex.hpp"
#include <nlohmann/json.hpp>

namespace holdings::adapters::primary {

/**
 * @brief Нормализованный индекс -> JSON
 *
 * Имена полей (total_value, total_quantity, assets, entities, quantity,
 * value_usd, name) - фактический контракт со слоем представления.
 * Позиции участника пишутся в порядке источника.
 */
class IndexJsonPresenter {
public:
    static nlohmann::ordered_json toJson(const domain::HoldingsIndex& index) {
        nlohmann::ordered_json entities = nlohmann::ordered_json::object();
        for (const auto& entity : index.entities()) {
            nlohmann::ordered_json holdings = nlohmann::ordered_json::object();
            for (const auto& symbol : entity.symbols) {
                const auto& holding = entity.assets.at(symbol);
                holdings[symbol] = {
                    {"quantity", holding.quantity},
                    {"value_usd", holding.valueUsd}
                };
            }
            entities[entity.name] = {
                {"total_value", entity.totalValue},
                {"assets", holdings}
            };
        }

        nlohmann::ordered_json assets = nlohmann::ordered_json::object();
        for (const auto& asset : index.assets()) {
            assets[asset.symbol] = {
                {"name", asset.name},
                {"entities", asset.entities},
                {"total_quantity", asset.totalQuantity},
                {"total_value", asset.totalValue}
            };
        }

        nlohmann::ordered_json j;
        j["entities"] = entities;
        j["assets"] = assets;
        return j;
    }
};

} // namespace holdings::adapters::primary
