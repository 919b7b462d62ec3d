#pragma once

#include "domain/RawHoldings.hpp"
#include "domain/HoldingsContractError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>

namespace holdings::adapters::secondary {

/**
 * @brief Разбор JSON-снимка в RawHoldingsSnapshot
 *
 * Формат:
 * ```json
 * { "binance": { "assets": { "BTC": {"name": "Bitcoin", "quantity": 1.5, "value_usd": 90000} } } }
 * ```
 *
 * Используется ordered_json: порядок ключей задаёт порядок первого появления.
 * Ошибка в записи одного участника не мешает разбору остальных.
 */
class RawHoldingsMapper {
public:
    /**
     * @throws domain::HoldingsContractError если корень не объект
     */
    static domain::RawHoldingsSnapshot fromJson(const nlohmann::ordered_json& root) {
        if (!root.is_object()) {
            throw domain::HoldingsContractError(
                "holdings snapshot must be a JSON object keyed by entity, got " +
                std::string(root.type_name()));
        }

        domain::RawHoldingsSnapshot snapshot;
        for (const auto& item : root.items()) {
            auto record = parseEntity(item.key(), item.value());
            if (record) {
                snapshot.add(item.key(), std::move(*record));
            }
        }
        return snapshot;
    }

private:
    static std::optional<domain::RawEntityRecord> parseEntity(const std::string& entityId,
                                                              const nlohmann::ordered_json& j) {
        if (!j.is_object()) {
            std::cerr << "[RawHoldingsMapper] Skipping entity '" << entityId
                      << "': record is " << j.type_name() << ", expected object" << std::endl;
            return std::nullopt;
        }

        domain::RawEntityRecord record;
        auto it = j.find("assets");
        if (it == j.end() || it->is_null()) {
            return record;
        }
        if (!it->is_object()) {
            std::cerr << "[RawHoldingsMapper] Entity '" << entityId
                      << "': 'assets' is not an object, treated as empty" << std::endl;
            return record;
        }

        for (const auto& item : it->items()) {
            const std::string symbol = item.key();
            if (!item.value().is_object()) {
                std::cerr << "[RawHoldingsMapper] Entity '" << entityId << "': skipping asset '"
                          << symbol << "', record is " << item.value().type_name() << std::endl;
                continue;
            }
            record.add(symbol, parseAsset(entityId, symbol, item.value()));
        }
        return record;
    }

    static domain::RawAssetRecord parseAsset(const std::string& entityId,
                                             const std::string& symbol,
                                             const nlohmann::ordered_json& j) {
        domain::RawAssetRecord asset;

        auto name = j.find("name");
        if (name != j.end() && name->is_string()) {
            asset.name = name->get<std::string>();
        }
        asset.quantity = readNumber(entityId, symbol, j, "quantity");
        asset.valueUsd = readNumber(entityId, symbol, j, "value_usd");
        return asset;
    }

    /// nullopt для отсутствующего или нечислового поля (агрегатор подставит 0)
    static std::optional<double> readNumber(const std::string& entityId,
                                            const std::string& symbol,
                                            const nlohmann::ordered_json& j,
                                            const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_number()) {
            std::cerr << "[RawHoldingsMapper] Entity '" << entityId << "', asset '" << symbol
                      << "': '" << key << "' is not a number, treated as 0" << std::endl;
            return std::nullopt;
        }
        return it->get<double>();
    }
};

} // namespace holdings::adapters::secondary
