#pragma once

#include "domain/RawHoldings.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace holdings::ports::output {

/**
 * @brief Кэш снимков, ключ - метка обновления (мс с эпохи)
 *
 * Принадлежит вызывающей стороне и передаётся явно; ядро
 * не держит состояния между вызовами.
 */
class ISnapshotCache {
public:
    virtual ~ISnapshotCache() = default;

    virtual void put(const domain::RawHoldingsSnapshot& snapshot) = 0;

    /// nullptr, если кэш пуст
    virtual std::shared_ptr<const domain::RawHoldingsSnapshot> latest() const = 0;

    /// nullptr, если снимка с таким ключом нет
    virtual std::shared_ptr<const domain::RawHoldingsSnapshot> find(int64_t refreshKey) const = 0;

    /// false, если снимка с таким ключом не было
    virtual bool remove(int64_t refreshKey) = 0;

    virtual std::size_t size() const = 0;
};

} // namespace holdings::ports::output
