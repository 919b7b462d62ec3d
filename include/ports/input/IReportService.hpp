#pragma once

#include "domain/HoldingsIndex.hpp"
#include "domain/HoldingsReport.hpp"
#include "domain/Selection.hpp"
#include <cstddef>
#include <vector>

namespace holdings::ports::input {

/**
 * @brief Интерфейс табличных отчётов по индексу
 */
class IReportService {
public:
    virtual ~IReportService() = default;

    virtual domain::OverlapMatrix overlapMatrix(const domain::HoldingsIndex& index,
                                                const domain::Selection& selection) const = 0;

    virtual std::vector<domain::HoldingsTableRow> holdingsTable(const domain::HoldingsIndex& index,
                                                                const domain::Selection& selection) const = 0;

    virtual domain::HoldingsSummary summary(const domain::HoldingsIndex& index,
                                            const domain::Selection& selection) const = 0;

    /**
     * @brief Выбор по умолчанию: первые entityCount участников
     *        и assetCount самых дорогих активов
     */
    virtual domain::Selection defaultSelection(const domain::HoldingsIndex& index,
                                               std::size_t entityCount,
                                               std::size_t assetCount) const = 0;
};

} // namespace holdings::ports::input
