#pragma once

#include <optional>
#include <string>

namespace holdings::utils {

/**
 * @brief Цвет RGB, компоненты в диапазоне [0, 1]
 */
struct Rgb {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

/**
 * @brief Цвет в пространстве HLS (оттенок, светлота, насыщенность), всё в [0, 1]
 */
struct Hls {
    double h = 0.0;
    double l = 0.0;
    double s = 0.0;
};

/**
 * @brief Разобрать "#RRGGBB", "RRGGBB" или "#RGB"
 *
 * @return std::nullopt для некорректной строки
 */
std::optional<Rgb> parseHexColor(const std::string& hex);

/**
 * @brief "#rrggbb" в нижнем регистре, компоненты усекаются (int(c * 255))
 */
std::string toHexColor(const Rgb& color);

Hls rgbToHls(const Rgb& color);
Rgb hlsToRgb(const Hls& color);

/**
 * @brief Осветлить цвет в пространстве HLS
 *
 * Светлота сдвигается к белому: l' = l + amount * (1 - l).
 * Оттенок и насыщенность сохраняются (это не альфа-смешивание).
 *
 * @param hex Исходный цвет "#RRGGBB"
 * @param amount Доля в [0, 1]
 * @throws std::invalid_argument если hex некорректен
 */
std::string lightenColor(const std::string& hex, double amount);

} // namespace holdings::utils
