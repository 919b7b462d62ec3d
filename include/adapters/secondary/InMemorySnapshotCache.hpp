#pragma once

#include "ports/output/ISnapshotCache.hpp"
#include "settings/ISourceSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>

namespace holdings::adapters::secondary {

/**
 * @brief Кэш снимков в памяти на основе cpp-cache
 *
 * LRU на HOLDINGS_CACHE_CAPACITY снимков, глобальный TTL из
 * HOLDINGS_CACHE_TTL_SECONDS (0 = без TTL). Ключ - метка обновления.
 *
 * Сама библиотека не знает, какой ключ самый свежий, поэтому
 * наибольшая метка хранится отдельно. После remove() самого свежего
 * снимка latest() пуст до следующего put().
 */
class InMemorySnapshotCache : public ports::output::ISnapshotCache {
public:
    explicit InMemorySnapshotCache(std::shared_ptr<settings::ISourceSettings> settings)
        : capacity_(settings->getCacheCapacity() > 0 ? settings->getCacheCapacity() : 1)
        , ttlSeconds_(settings->getCacheTtlSeconds())
    {
        std::unique_ptr<CacheType> inner;
        if (ttlSeconds_ > 0) {
            inner = std::make_unique<CacheType>(
                capacity_,
                std::make_unique<LRUPolicy<int64_t>>(),
                std::make_unique<GlobalTTL<int64_t>>(std::chrono::seconds(ttlSeconds_)));
        } else {
            inner = std::make_unique<CacheType>(
                capacity_,
                std::make_unique<LRUPolicy<int64_t>>());
        }
        cache_ = std::make_unique<ThreadSafeCacheType>(std::move(inner));

        std::cout << "[InMemorySnapshotCache] Created, capacity: " << capacity_
                  << ", ttl: " << ttlSeconds_ << "s" << std::endl;
    }

    void put(const domain::RawHoldingsSnapshot& snapshot) override {
        const int64_t key = snapshot.fetchedAt.epochMillis();
        cache_->put(key, snapshot);

        std::lock_guard<std::mutex> lock(latestMutex_);
        if (!latestKey_ || key >= *latestKey_) {
            latestKey_ = key;
        }
    }

    std::shared_ptr<const domain::RawHoldingsSnapshot> latest() const override {
        std::optional<int64_t> key;
        {
            std::lock_guard<std::mutex> lock(latestMutex_);
            key = latestKey_;
        }
        return key ? find(*key) : nullptr;
    }

    /// nullptr, если снимка нет, он вытеснен или истёк
    std::shared_ptr<const domain::RawHoldingsSnapshot> find(int64_t refreshKey) const override {
        auto cached = cache_->get(refreshKey);
        if (!cached) {
            return nullptr;
        }
        return std::make_shared<const domain::RawHoldingsSnapshot>(std::move(*cached));
    }

    bool remove(int64_t refreshKey) override {
        const bool removed = cache_->remove(refreshKey);

        std::lock_guard<std::mutex> lock(latestMutex_);
        if (latestKey_ && *latestKey_ == refreshKey) {
            latestKey_.reset();
        }
        return removed;
    }

    std::size_t size() const override {
        return cache_->size();
    }

private:
    using CacheType = Cache<int64_t, domain::RawHoldingsSnapshot>;
    using ThreadSafeCacheType = ThreadSafeCache<int64_t, domain::RawHoldingsSnapshot>;

    std::size_t capacity_;
    int ttlSeconds_;
    std::unique_ptr<ICache<int64_t, domain::RawHoldingsSnapshot>> cache_;

    mutable std::mutex latestMutex_;
    std::optional<int64_t> latestKey_;
};

} // namespace holdings::adapters::secondary
