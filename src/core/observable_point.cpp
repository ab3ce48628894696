#include "affine/observable_point.h"
#include "affine/error.h"
#include "affine/math_utils.h"

namespace Affine {

ObservablePoint::ObservablePoint(PointObserver* observer, Real x, Real y)
    : m_observer(observer)
    , m_x(x)
    , m_y(y)
{
    if (observer == nullptr) {
        throw AFFINE_ERROR(ErrorCode::PointObserverMissing,
            "ObservablePoint: 观察者不能为空");
    }
    AFFINE_ASSERT(MathUtils::IsFinite(x, y), "ObservablePoint: 初始坐标必须是有限值");
}

ObservablePoint ObservablePoint::Clone(PointObserver* observer) const {
    return ObservablePoint(observer, m_x, m_y);
}

void ObservablePoint::Set(Real x, Real y) {
    if (m_x != x || m_y != y) {
        m_x = x;
        m_y = y;
        Notify();
    }
}

void ObservablePoint::SetX(Real value) {
    if (m_x != value) {
        m_x = value;
        Notify();
    }
}

void ObservablePoint::SetY(Real value) {
    if (m_y != value) {
        m_y = value;
        Notify();
    }
}

} // namespace Affine
