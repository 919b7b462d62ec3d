#pragma once

#include "ports/output/IHoldingsSource.hpp"
#include "ports/output/ISnapshotCache.hpp"
#include "adapters/secondary/JsonFileHoldingsSource.hpp"
#include <iostream>
#include <memory>

namespace holdings::adapters::secondary {

/**
 * @brief Декоратор IHoldingsSource с кэшированием снимков
 *
 * Отдаёт последний снимок из кэша, пока кэш его держит (TTL и вытеснение
 * задаёт кэш). Иначе запрашивает делегата и кладёт новый снимок в кэш.
 * Снимок с меткой из будущего (часы переведены назад) считается устаревшим.
 */
class CachedHoldingsSource : public ports::output::IHoldingsSource {
public:
    CachedHoldingsSource(
        std::shared_ptr<JsonFileHoldingsSource> delegate,
        std::shared_ptr<ports::output::ISnapshotCache> cache
    ) : delegate_(std::move(delegate))
      , cache_(std::move(cache))
    {
        std::cout << "[CachedHoldingsSource] Created" << std::endl;
    }

    domain::RawHoldingsSnapshot fetchSnapshot() override {
        auto cached = cache_->latest();
        if (cached) {
            if (!isFromFuture(*cached)) {
                return *cached;
            }
            std::cerr << "[CachedHoldingsSource] Cached snapshot stamped "
                      << cached->fetchedAt.toString() << " is in the future, refreshing" << std::endl;
            cache_->remove(cached->fetchedAt.epochMillis());
        }

        auto snapshot = delegate_->fetchSnapshot();
        cache_->put(snapshot);
        return snapshot;
    }

private:
    std::shared_ptr<JsonFileHoldingsSource> delegate_;
    std::shared_ptr<ports::output::ISnapshotCache> cache_;

    static bool isFromFuture(const domain::RawHoldingsSnapshot& snapshot) {
        return domain::Timestamp::now() < snapshot.fetchedAt;
    }
};

} // namespace holdings::adapters::secondary
