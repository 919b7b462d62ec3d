#pragma once

#include "domain/HoldingsReport.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace holdings::adapters::primary {

/**
 * @brief Отчёты (матрица, таблица, сводка) -> JSON
 */
class ReportJsonPresenter {
public:
    static nlohmann::ordered_json toJson(const domain::OverlapMatrix& matrix,
                                         const std::vector<domain::HoldingsTableRow>& table,
                                         const domain::HoldingsSummary& summary) {
        nlohmann::ordered_json j;
        j["overlap_matrix"] = matrixToJson(matrix);

        nlohmann::ordered_json rows = nlohmann::ordered_json::array();
        for (const auto& row : table) {
            rows.push_back({
                {"asset", row.symbol},
                {"name", row.name},
                {"total_value", row.totalValue},
                {"total_quantity", row.totalQuantity},
                {"market_share", row.marketShare},
                {"holders", row.holders}
            });
        }
        j["table"] = rows;

        j["summary"] = {
            {"total_assets", summary.assetCount},
            {"total_value", summary.totalValue},
            {"avg_holders_per_asset", summary.averageHolders}
        };
        return j;
    }

    static nlohmann::ordered_json matrixToJson(const domain::OverlapMatrix& matrix) {
        nlohmann::ordered_json rows = nlohmann::ordered_json::array();
        for (std::size_t i = 0; i < matrix.assets.size(); ++i) {
            nlohmann::ordered_json row;
            row["asset"] = matrix.assets[i];
            for (std::size_t k = 0; k < matrix.entities.size(); ++k) {
                row[matrix.entities[k]] = matrix.at(i, k);
            }
            rows.push_back(row);
        }
        return rows;
    }
};

} // namespace holdings::adapters::primary
