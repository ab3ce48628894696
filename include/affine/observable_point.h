#pragma once

#include "point.h"

namespace Affine {

class ObservablePoint;

/**
 * @brief ObservablePoint 的观察者接口
 *
 * 由拥有 ObservablePoint 的对象（通常是 Transform）实现。
 * ObservablePoint 只持有观察指针（non-owning），观察者必须比点活得更久。
 */
class PointObserver {
public:
    virtual ~PointObserver() = default;

    /**
     * @brief 点的值发生了实际变化
     * @param point 发生变化的点
     */
    virtual void OnPointChanged(const ObservablePoint& point) = 0;
};

/**
 * @class ObservablePoint
 * @brief 值变化时通知观察者的二维点
 *
 * 所有修改操作都先逐分量比较新旧值，只有至少一个分量变化时才写入，
 * 并且每次调用最多通知一次。写入相同的值不会通知。
 *
 * 观察者通常会递增 Transform 的版本号，多余的通知会导致整棵子树重新计算矩阵。
 *
 * @note 不可拷贝、不可移动：点与它的观察者绑定，需要副本时使用 Clone()
 */
class ObservablePoint {
public:
    /**
     * @brief 构造函数
     * @param observer 观察者（不能为 nullptr）
     * @param x 初始 x 坐标（必须是有限值）
     * @param y 初始 y 坐标（必须是有限值）
     * @throws AffineError observer 为空（PointObserverMissing）或坐标非有限值（InvalidArgument）
     */
    explicit ObservablePoint(PointObserver* observer, Real x = 0, Real y = 0);

    ObservablePoint(const ObservablePoint&) = delete;
    ObservablePoint& operator=(const ObservablePoint&) = delete;
    ObservablePoint(ObservablePoint&&) = delete;
    ObservablePoint& operator=(ObservablePoint&&) = delete;

    /**
     * @brief 创建绑定到另一个观察者的副本
     */
    ObservablePoint Clone(PointObserver* observer) const;

    /**
     * @brief 设置坐标，任一分量变化时通知一次
     */
    void Set(Real x, Real y);

    /**
     * @brief 两个分量都设置为 value
     */
    void Set(Real value) { Set(value, value); }

    void CopyFrom(const Point& p) { Set(p.x, p.y); }
    void CopyFrom(const ObservablePoint& p) { Set(p.m_x, p.m_y); }

    /**
     * @brief 把坐标写入目标点
     *
     * 目标是 ObservablePoint 时，由目标按自己的规则决定是否通知
     */
    void CopyTo(Point& p) const { p.Set(m_x, m_y); }
    void CopyTo(ObservablePoint& p) const { p.Set(m_x, m_y); }

    Real GetX() const { return m_x; }
    Real GetY() const { return m_y; }

    void SetX(Real value);
    void SetY(Real value);

    Point ToPoint() const { return Point(m_x, m_y); }

    bool operator==(const Point& p) const { return m_x == p.x && m_y == p.y; }
    bool operator!=(const Point& p) const { return !(*this == p); }

private:
    void Notify() const { m_observer->OnPointChanged(*this); }

    PointObserver* m_observer;  // 观察指针（non-owning）
    Real m_x;
    Real m_y;
};

} // namespace Affine
