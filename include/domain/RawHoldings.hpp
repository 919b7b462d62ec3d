#pragma once

#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace holdings::domain {

/**
 * @brief Сырые данные об одном активе участника
 *
 * Отсутствующие поля остаются пустыми; значения по умолчанию
 * подставляет агрегатор.
 */
struct RawAssetRecord {
    std::optional<std::string> name;
    std::optional<double> quantity;
    std::optional<double> valueUsd;
};

/**
 * @brief Сырые данные участника: symbol -> запись, в порядке источника
 */
struct RawEntityRecord {
    std::vector<std::pair<std::string, RawAssetRecord>> assets;

    RawEntityRecord& add(std::string symbol, RawAssetRecord record) {
        assets.emplace_back(std::move(symbol), std::move(record));
        return *this;
    }
};

/**
 * @brief Снимок сырых данных от источника
 *
 * Порядок участников и активов сохраняется: он определяет
 * порядок "первого появления" в индексе.
 */
struct RawHoldingsSnapshot {
    std::vector<std::pair<std::string, RawEntityRecord>> entities;
    Timestamp fetchedAt;

    RawHoldingsSnapshot& add(std::string entity, RawEntityRecord record) {
        entities.emplace_back(std::move(entity), std::move(record));
        return *this;
    }

    bool empty() const {
        return entities.empty();
    }
};

} // namespace holdings::domain
