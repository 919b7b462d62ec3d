#pragma once

#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace holdings::utils {

constexpr double kPi = 3.14159265358979323846;

/**
 * @brief Точка сцены (единицы сцены, не пиксели)
 */
struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double px, double py) : x(px), y(py) {}

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point& other) const {
        return !(*this == other);
    }
};

inline double distance(const Point& a, const Point& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

/**
 * @brief Точка на окружности радиуса radius с центром в начале координат
 */
inline Point pointOnCircle(double radius, double angle) {
    return Point(radius * std::cos(angle), radius * std::sin(angle));
}

/**
 * @brief Якорь i-го из n участников: угол 2π·i/n
 */
inline Point anchorOnCircle(std::size_t rank, std::size_t count, double radius) {
    if (count == 0) {
        return Point();
    }
    double angle = 2.0 * kPi * static_cast<double>(rank) / static_cast<double>(count);
    return pointOnCircle(radius, angle);
}

/**
 * @brief Среднее арифметическое точек
 *
 * @return std::nullopt для пустого набора
 */
inline std::optional<Point> mean(const std::vector<Point>& points) {
    if (points.empty()) {
        return std::nullopt;
    }
    if (points.size() == 1) {
        return points.front();
    }
    double sx = 0.0;
    double sy = 0.0;
    for (const auto& p : points) {
        sx += p.x;
        sy += p.y;
    }
    double n = static_cast<double>(points.size());
    return Point(sx / n, sy / n);
}

/**
 * @brief Взвешенный центр масс
 *
 * Единственная точка возвращается как есть (без деления, чтобы совпадение
 * было точным). Отрицательные веса считаются нулевыми.
 *
 * @return std::nullopt, если набор пуст, размеры не совпадают
 *         или сумма весов равна нулю
 */
inline std::optional<Point> weightedCentroid(const std::vector<Point>& points,
                                             const std::vector<double>& weights) {
    if (points.empty() || points.size() != weights.size()) {
        return std::nullopt;
    }

    double sx = 0.0;
    double sy = 0.0;
    double total = 0.0;
    for (std::size_t i = 0; i < points.size(); ++i) {
        double w = weights[i] > 0.0 ? weights[i] : 0.0;
        sx += points[i].x * w;
        sy += points[i].y * w;
        total += w;
    }

    if (total <= 0.0) {
        return std::nullopt;
    }
    if (points.size() == 1) {
        return points.front();
    }
    return Point(sx / total, sy / total);
}

} // namespace holdings::utils
