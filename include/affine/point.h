#pragma once

#include "types.h"
#include <ostream>

namespace Affine {

/**
 * @brief 二维坐标点（值类型）
 *
 * x 为水平轴，y 为垂直轴。两个点当且仅当 x、y 都相等时相等（精确比较）。
 */
struct Point {
    Real x;
    Real y;

    Point() : x(0), y(0) {}
    Point(Real x, Real y) : x(x), y(y) {}

    /**
     * @brief 设置坐标
     */
    void Set(Real newX, Real newY) {
        x = newX;
        y = newY;
    }

    /**
     * @brief 两个分量设置为同一个值
     */
    void Set(Real value) {
        Set(value, value);
    }

    void CopyFrom(const Point& p) {
        Set(p.x, p.y);
    }

    void CopyTo(Point& p) const {
        p.Set(x, y);
    }

    Point Clone() const { return Point(x, y); }

    Vector2 ToVector() const { return Vector2(x, y); }

    static Point FromVector(const Vector2& v) { return Point(v.x(), v.y()); }

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const Point& p) {
    return os << "(" << p.x << ", " << p.y << ")";
}

} // namespace Affine
