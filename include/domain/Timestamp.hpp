#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace holdings::domain {

/**
 * @brief Временная метка снимка данных
 *
 * Миллисекунды с эпохи служат ключом обновления в кэше снимков.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromEpochMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t epochMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Возраст метки относительно now (отрицательный для будущих меток)
     */
    std::chrono::seconds ageAt(const Timestamp& now) const {
        return std::chrono::duration_cast<std::chrono::seconds>(now.value - value);
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace holdings::domain
