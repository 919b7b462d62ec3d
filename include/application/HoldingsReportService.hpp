#pragma once

#include "ports/input/IReportService.hpp"
#include "application/SelectionFilter.hpp"
#include <algorithm>
#include <iostream>

namespace holdings::application {

/**
 * @brief Табличные отчёты по индексу
 *
 * Доля в таблице считается от суммы выбранных активов, в отличие
 * от сцены, где знаменатель - сумма выбранных участников.
 */
class HoldingsReportService : public ports::input::IReportService {
public:
    HoldingsReportService() {
        std::cout << "[HoldingsReportService] Created" << std::endl;
    }

    /**
     * @brief Матрица стоимости: строка на актив, столбец на участника
     */
    domain::OverlapMatrix overlapMatrix(const domain::HoldingsIndex& index,
                                        const domain::Selection& selection) const override {
        auto entities = SelectionFilter::entities(index, selection.entities);
        auto assets = SelectionFilter::assets(index, selection.assets);

        domain::OverlapMatrix matrix;
        for (const auto* entity : entities) {
            matrix.entities.push_back(entity->name);
        }
        for (const auto* asset : assets) {
            matrix.assets.push_back(asset->symbol);

            std::vector<double> row;
            row.reserve(entities.size());
            for (const auto* entity : entities) {
                row.push_back(entity->valueOf(asset->symbol));
            }
            matrix.values.push_back(std::move(row));
        }
        return matrix;
    }

    /**
     * @brief Сводная таблица, отсортирована по totalValue по убыванию
     */
    std::vector<domain::HoldingsTableRow> holdingsTable(const domain::HoldingsIndex& index,
                                                        const domain::Selection& selection) const override {
        auto entities = SelectionFilter::entities(index, selection.entities);
        auto assets = SelectionFilter::assets(index, selection.assets);

        double selectedAssetTotal = 0.0;
        for (const auto* asset : assets) {
            selectedAssetTotal += asset->totalValue;
        }

        std::vector<domain::HoldingsTableRow> rows;
        rows.reserve(assets.size());
        for (const auto* asset : assets) {
            domain::HoldingsTableRow row;
            row.symbol = asset->symbol;
            row.name = asset->name;
            row.totalValue = asset->totalValue;
            row.totalQuantity = asset->totalQuantity;
            row.marketShare = selectedAssetTotal > 0.0
                ? asset->totalValue / selectedAssetTotal * 100.0
                : 0.0;
            for (const auto* entity : entities) {
                if (entity->holds(asset->symbol)) {
                    row.holders.push_back(entity->name);
                }
            }
            rows.push_back(std::move(row));
        }

        std::stable_sort(rows.begin(), rows.end(),
                         [](const domain::HoldingsTableRow& a, const domain::HoldingsTableRow& b) {
                             return a.totalValue > b.totalValue;
                         });
        return rows;
    }

    domain::HoldingsSummary summary(const domain::HoldingsIndex& index,
                                    const domain::Selection& selection) const override {
        auto assets = SelectionFilter::assets(index, selection.assets);

        domain::HoldingsSummary result;
        result.assetCount = assets.size();
        std::size_t holderCount = 0;
        for (const auto* asset : assets) {
            result.totalValue += asset->totalValue;
            holderCount += asset->entities.size();
        }
        if (!assets.empty()) {
            result.averageHolders = static_cast<double>(holderCount) / static_cast<double>(assets.size());
        }
        return result;
    }

    domain::Selection defaultSelection(const domain::HoldingsIndex& index,
                                       std::size_t entityCount,
                                       std::size_t assetCount) const override {
        domain::Selection selection;

        const auto& entities = index.entities();
        for (std::size_t i = 0; i < entities.size() && i < entityCount; ++i) {
            selection.entities.push_back(entities[i].name);
        }

        // Активы в индексе уже отсортированы по стоимости
        const auto& assets = index.assets();
        for (std::size_t i = 0; i < assets.size() && i < assetCount; ++i) {
            selection.assets.push_back(assets[i].symbol);
        }
        return selection;
    }
};

} // namespace holdings::application
