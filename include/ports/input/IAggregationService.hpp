#pragma once

#include "domain/HoldingsIndex.hpp"
#include "domain/RawHoldings.hpp"

namespace holdings::ports::input {

/**
 * @brief Интерфейс агрегации сырых данных в индекс
 */
class IAggregationService {
public:
    virtual ~IAggregationService() = default;

    /**
     * @brief Построить нормализованный индекс
     *
     * Чистая функция входа: повторный вызов на тех же данных
     * даёт структурно идентичный индекс.
     */
    virtual domain::HoldingsIndex aggregate(const domain::RawHoldingsSnapshot& raw) const = 0;
};

} // namespace holdings::ports::input
