#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace holdings::domain {

/**
 * @brief Матрица "актив x участник" со стоимостью позиций
 *
 * values[i][j] - стоимость assets[i] у entities[j], 0 если позиции нет.
 */
struct OverlapMatrix {
    std::vector<std::string> entities;
    std::vector<std::string> assets;
    std::vector<std::vector<double>> values;

    double at(std::size_t assetRow, std::size_t entityColumn) const {
        return values.at(assetRow).at(entityColumn);
    }
};

/**
 * @brief Строка сводной таблицы по активу
 */
struct HoldingsTableRow {
    std::string symbol;
    std::string name;
    double totalValue = 0.0;
    double totalQuantity = 0.0;
    double marketShare = 0.0;          ///< % от суммы выбранных активов
    std::vector<std::string> holders;  ///< Только выбранные участники
};

/**
 * @brief Итоговые показатели выборки
 */
struct HoldingsSummary {
    std::size_t assetCount = 0;
    double totalValue = 0.0;
    double averageHolders = 0.0;
};

} // namespace holdings::domain
