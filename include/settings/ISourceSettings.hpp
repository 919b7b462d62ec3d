#pragma once

#include <cstddef>
#include <string>

namespace holdings::settings {

/**
 * @brief Интерфейс настроек источника снимков
 */
class ISourceSettings {
public:
    virtual ~ISourceSettings() = default;

    virtual std::string getSnapshotPath() const = 0;
    virtual int getCacheTtlSeconds() const = 0;
    virtual std::size_t getCacheCapacity() const = 0;
    virtual std::string getOutputPath() const = 0;
};

} // namespace holdings::settings
