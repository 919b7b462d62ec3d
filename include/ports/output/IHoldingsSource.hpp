#pragma once

#include "domain/RawHoldings.hpp"

namespace holdings::ports::output {

/**
 * @brief Источник сырых данных о позициях участников
 *
 * Реализации могут читать файл, ходить в сеть или оценивать данные;
 * ядро обрабатывает все снимки одинаково.
 */
class IHoldingsSource {
public:
    virtual ~IHoldingsSource() = default;

    /**
     * @brief Получить снимок с меткой времени получения
     *
     * @throws domain::HoldingsContractError если данные вне контракта
     */
    virtual domain::RawHoldingsSnapshot fetchSnapshot() = 0;
};

} // namespace holdings::ports::output
