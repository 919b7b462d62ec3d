#pragma once

#include <array>
#include <string>

namespace holdings::domain {

/**
 * @brief Диапазон доли рынка актива
 *
 * Пять непересекающихся полуинтервалов: [0,1), [1,5), [5,10), [10,20), [20,∞).
 */
enum class PercentageTier {
    BELOW_1,
    FROM_1_TO_5,
    FROM_5_TO_10,
    FROM_10_TO_20,
    FROM_20
};

constexpr std::array<PercentageTier, 5> kAllPercentageTiers = {
    PercentageTier::BELOW_1,
    PercentageTier::FROM_1_TO_5,
    PercentageTier::FROM_5_TO_10,
    PercentageTier::FROM_10_TO_20,
    PercentageTier::FROM_20
};

inline PercentageTier tierForPercentage(double percentage) {
    if (percentage < 1.0) return PercentageTier::BELOW_1;
    if (percentage < 5.0) return PercentageTier::FROM_1_TO_5;
    if (percentage < 10.0) return PercentageTier::FROM_5_TO_10;
    if (percentage < 20.0) return PercentageTier::FROM_10_TO_20;
    return PercentageTier::FROM_20;
}

inline std::string tierColor(PercentageTier tier) {
    switch (tier) {
        case PercentageTier::BELOW_1: return "#CCCCCC";
        case PercentageTier::FROM_1_TO_5: return "#92D050";
        case PercentageTier::FROM_5_TO_10: return "#00B0F0";
        case PercentageTier::FROM_10_TO_20: return "#FFC000";
        case PercentageTier::FROM_20: return "#FF0000";
        default: return "#CCCCCC";
    }
}

inline std::string tierLabel(PercentageTier tier) {
    switch (tier) {
        case PercentageTier::BELOW_1: return "<1%";
        case PercentageTier::FROM_1_TO_5: return "1-5%";
        case PercentageTier::FROM_5_TO_10: return "5-10%";
        case PercentageTier::FROM_10_TO_20: return "10-20%";
        case PercentageTier::FROM_20: return ">20%";
        default: return "";
    }
}

inline std::string toString(PercentageTier tier) {
    switch (tier) {
        case PercentageTier::BELOW_1: return "below-1";
        case PercentageTier::FROM_1_TO_5: return "1-5";
        case PercentageTier::FROM_5_TO_10: return "5-10";
        case PercentageTier::FROM_10_TO_20: return "10-20";
        case PercentageTier::FROM_20: return "20-plus";
        default: return "unknown";
    }
}

} // namespace holdings::domain
