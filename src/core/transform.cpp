/*
 * Copyright (c) 2025 Li Chaoyu
 * 
 * This file is part of Affine.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 *
 * For commercial licensing, please contact: 2052046346@qq.com
 */
#include "affine/transform.h"
#include "affine/math_utils.h"
#include <cmath>
#include <sstream>

namespace Affine {

// ============================================================================
// 构造
// ============================================================================

Transform::Transform()
    : m_worldMatrix()
    , m_localMatrix()
    , m_position(this, 0, 0)
    , m_scale(this, 1, 1)
    , m_pivot(this, 0, 0)
    , m_skew(this, 0, 0)
{
}

const Transform& Transform::Identity() {
    static const Transform identity;
    return identity;
}

// ============================================================================
// 变化通知
// ============================================================================

void Transform::OnPointChanged(const ObservablePoint& point) {
    if (&point == &m_skew) {
        UpdateSkew();
    } else {
        ++m_localID;
    }
}

void Transform::UpdateSkew() {
    m_cx = std::cos(m_rotation + m_skew.GetY());
    m_sx = std::sin(m_rotation + m_skew.GetY());
    m_cy = -std::sin(m_rotation - m_skew.GetX());  // cos，加了 PI/2
    m_sy = std::cos(m_rotation - m_skew.GetX());   // sin，加了 PI/2

    ++m_localID;
}

void Transform::SetRotation(Real rotation) {
    if (m_rotation != rotation) {
        m_rotation = rotation;
        UpdateSkew();
    }
}

// ============================================================================
// 矩阵更新
// ============================================================================

void Transform::UpdateLocalTransform() {
    if (m_localID == m_currentLocalID) {
        return;
    }

    Matrix& lt = m_localMatrix;

    lt.a = m_cx * m_scale.GetX();
    lt.b = m_sx * m_scale.GetX();
    lt.c = m_cy * m_scale.GetY();
    lt.d = m_sy * m_scale.GetY();

    lt.tx = m_position.GetX() - ((m_pivot.GetX() * lt.a) + (m_pivot.GetY() * lt.c));
    lt.ty = m_position.GetY() - ((m_pivot.GetX() * lt.b) + (m_pivot.GetY() * lt.d));
    m_currentLocalID = m_localID;

    // 强制下一次重算世界矩阵
    m_parentID = -1;
}

void Transform::UpdateTransform(const Transform& parent) {
    if (&parent == this) {
        throw AFFINE_ERROR(ErrorCode::InvalidArgument,
            "Transform::UpdateTransform: 不能以自身作为父变换");
    }

    UpdateLocalTransform();

    if (m_parentID != parent.m_worldID) {
        // 组合父节点的世界矩阵与本地矩阵
        const Matrix& lt = m_localMatrix;
        const Matrix& pt = parent.m_worldMatrix;
        Matrix& wt = m_worldMatrix;

        wt.a = (lt.a * pt.a) + (lt.b * pt.c);
        wt.b = (lt.a * pt.b) + (lt.b * pt.d);
        wt.c = (lt.c * pt.a) + (lt.d * pt.c);
        wt.d = (lt.c * pt.b) + (lt.d * pt.d);
        wt.tx = (lt.tx * pt.a) + (lt.ty * pt.c) + pt.tx;
        wt.ty = (lt.tx * pt.b) + (lt.ty * pt.d) + pt.ty;

        m_parentID = parent.m_worldID;

        ++m_worldID;
    }
}

void Transform::UpdateTransform(const Transform* parent) {
    if (parent == nullptr) {
        throw AFFINE_ERROR(ErrorCode::TransformMissingParent,
            "Transform::UpdateTransform: 父变换为空，根节点应使用 Transform::Identity()");
    }
    UpdateTransform(*parent);
}

void Transform::SetFromMatrix(const Matrix& matrix) {
    matrix.Decompose(*this);
    ++m_localID;
}

Result Transform::TrySetFromMatrix(const Matrix& matrix) {
    const bool finite = std::isfinite(matrix.a) && std::isfinite(matrix.b) &&
                        std::isfinite(matrix.c) && std::isfinite(matrix.d) &&
                        std::isfinite(matrix.tx) && std::isfinite(matrix.ty);
    if (!finite) {
        std::string message = "Transform::TrySetFromMatrix: 矩阵包含 NaN 或 Inf " + matrix.DebugString();
        HANDLE_ERROR(AFFINE_WARNING(ErrorCode::TransformInvalidMatrix, message));
        return Result::Failure(ErrorCode::TransformInvalidMatrix, message);
    }

    SetFromMatrix(matrix);
    return Result::Success();
}

// ============================================================================
// 调试和诊断
// ============================================================================

std::string Transform::DebugString() const {
    std::ostringstream oss;
    oss << "Transform {\n";
    oss << "  Position: (" << m_position.GetX() << ", " << m_position.GetY() << ")\n";
    oss << "  Scale: (" << m_scale.GetX() << ", " << m_scale.GetY() << ")\n";
    oss << "  Pivot: (" << m_pivot.GetX() << ", " << m_pivot.GetY() << ")\n";
    oss << "  Skew: (" << m_skew.GetX() << ", " << m_skew.GetY() << ")\n";
    oss << "  Rotation: " << m_rotation << "\n";
    oss << "  Local: " << m_localMatrix.DebugString() << "\n";
    oss << "  World: " << m_worldMatrix.DebugString() << "\n";
    oss << "  Versions: local=" << m_localID << " currentLocal=" << m_currentLocalID
        << " parent=" << m_parentID << " world=" << m_worldID << "\n";
    oss << "}";
    return oss.str();
}

bool Transform::Validate() const {
    auto finitePoint = [](const ObservablePoint& p) {
        return MathUtils::IsFinite(p.GetX(), p.GetY());
    };
    auto finiteMatrix = [](const Matrix& m) {
        return MathUtils::IsFinite(m.a, m.b) && MathUtils::IsFinite(m.c, m.d) &&
               MathUtils::IsFinite(m.tx, m.ty);
    };

    // 1. 输入属性
    if (!finitePoint(m_position) || !finitePoint(m_scale) ||
        !finitePoint(m_pivot) || !finitePoint(m_skew) || !std::isfinite(m_rotation)) {
        return false;
    }

    // 2. 缓存的三角函数值
    if (!MathUtils::IsFinite(m_cx, m_sx) || !MathUtils::IsFinite(m_cy, m_sy)) {
        return false;
    }

    // 3. 矩阵
    return finiteMatrix(m_localMatrix) && finiteMatrix(m_worldMatrix);
}

} // namespace Affine
