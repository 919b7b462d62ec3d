#pragma once

#include "domain/HoldingsIndex.hpp"
#include "domain/LayoutScene.hpp"
#include "domain/Selection.hpp"

namespace holdings::ports::input {

/**
 * @brief Интерфейс построения сцены пересечений
 */
class ILayoutService {
public:
    virtual ~ILayoutService() = default;

    /**
     * @brief Построить сцену для выбранных участников и активов
     *
     * Пустой выбор или пустой индекс дают пустую сцену, не ошибку.
     */
    virtual domain::LayoutScene layout(const domain::HoldingsIndex& index,
                                       const domain::Selection& selection) const = 0;
};

} // namespace holdings::ports::input
