#pragma once

#include "ports/input/IAggregationService.hpp"
#include <optional>
#include <string>

namespace holdings::application {

/**
 * @brief Агрегатор сырых позиций в нормализованный индекс
 *
 * Для каждого участника строит Entity с суммой стоимости, для каждого
 * встреченного актива лениво создаёт Asset и накапливает итоги.
 * После свёртки активы сортируются по totalValue по убыванию (стабильно).
 *
 * Некорректные числа (NaN, бесконечность, отрицательные) заменяются нулём.
 * Повторный участник пропускается, повторный символ внутри записи
 * участника сливается в одну позицию.
 *
 * @note Символы и имена сравниваются точно, без нормализации регистра
 *       и пробелов.
 */
class HoldingsAggregator : public ports::input::IAggregationService {
public:
    HoldingsAggregator();

    domain::HoldingsIndex aggregate(const domain::RawHoldingsSnapshot& raw) const override;

private:
    /// Значение или 0; invalid выставляется, если значение было, но некорректно
    static double sanitize(const std::optional<double>& value, bool& invalid);
};

} // namespace holdings::application
