#pragma once

#include "ISourceSettings.hpp"
#include <cstdlib>
#include <string>

namespace holdings::settings {

/**
 * @brief Настройки источника и вывода
 *
 * Читает из ENV:
 * - HOLDINGS_SNAPSHOT_PATH (default: holdings.json)
 * - HOLDINGS_CACHE_TTL_SECONDS (default: 3600, данные обновляются раз в час)
 * - HOLDINGS_CACHE_CAPACITY (default: 4)
 * - HOLDINGS_OUTPUT_PATH (default: scene.json, "-" = stdout)
 */
class SourceSettings : public ISourceSettings {
public:
    SourceSettings() {
        if (const char* val = std::getenv("HOLDINGS_SNAPSHOT_PATH")) {
            snapshotPath_ = val;
        }
        if (const char* val = std::getenv("HOLDINGS_CACHE_TTL_SECONDS")) {
            cacheTtlSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("HOLDINGS_CACHE_CAPACITY")) {
            cacheCapacity_ = static_cast<std::size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("HOLDINGS_OUTPUT_PATH")) {
            outputPath_ = val;
        }
    }

    std::string getSnapshotPath() const override { return snapshotPath_; }
    int getCacheTtlSeconds() const override { return cacheTtlSeconds_; }
    std::size_t getCacheCapacity() const override { return cacheCapacity_; }
    std::string getOutputPath() const override { return outputPath_; }

private:
    std::string snapshotPath_ = "holdings.json";
    int cacheTtlSeconds_ = 3600;
    std::size_t cacheCapacity_ = 4;
    std::string outputPath_ = "scene.json";
};

} // namespace holdings::settings
