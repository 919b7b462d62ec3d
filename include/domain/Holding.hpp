#pragma once

namespace holdings::domain {

/**
 * @brief Доля одного актива у одного участника
 *
 * valueUsd >= 0. Если цена недоступна, позиция хранится только
 * стоимостью, quantity = 0.
 */
struct Holding {
    double quantity = 0.0;
    double valueUsd = 0.0;

    Holding() = default;
    Holding(double q, double v) : quantity(q), valueUsd(v) {}

    bool operator==(const Holding& other) const {
        return quantity == other.quantity && valueUsd == other.valueUsd;
    }
};

} // namespace holdings::domain
