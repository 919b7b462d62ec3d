#pragma once

#include <stdexcept>
#include <string>

namespace holdings::domain {

/**
 * @brief Нарушение контракта входных данных
 *
 * Бросается, когда форма данных целиком вне документированного контракта
 * (корень снимка не объект, невалидный JSON, файл недоступен).
 * Разреженные и частично некорректные данные так не сигнализируются.
 */
class HoldingsContractError : public std::runtime_error {
public:
    explicit HoldingsContractError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace holdings::domain
