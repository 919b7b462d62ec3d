#pragma once

#include <string>
#include <vector>

namespace holdings::domain {

/**
 * @brief Выбор участников и активов для отображения
 *
 * Неизвестные идентификаторы игнорируются потребителями,
 * повторы учитываются один раз.
 */
struct Selection {
    std::vector<std::string> entities;
    std::vector<std::string> assets;

    bool empty() const {
        return entities.empty() || assets.empty();
    }
};

} // namespace holdings::domain
