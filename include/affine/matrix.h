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
#pragma once

#include "types.h"
#include "point.h"
#include "error.h"
#include <array>
#include <string>
#include <ostream>

namespace Affine {

class Transform;

/**
 * @class Matrix
 * @brief 二维仿射变换矩阵
 *
 * 6 个标量按如下方式表示 3x3 齐次矩阵：
 * @code
 * | a | c | tx |
 * | b | d | ty |
 * | 0 | 0 | 1  |
 * @endcode
 * 即 x' = a*x + c*y + tx，y' = b*x + d*y + ty。
 *
 * Matrix 是值类型。修改操作都原地进行并返回自身引用，方便链式调用。
 * Transform 持有两个固定的 Matrix（本地、世界），每帧原地更新，不会重新分配。
 *
 * @section errors 错误处理
 * - Invert()/ApplyInverse() 在行列式为 0 时抛出 AffineError（TransformDegenerateMatrix），
 *   矩阵保持不变
 * - TryInvert() 不抛出异常，返回 Result 并把失败交给 ErrorHandler 记录
 */
class Matrix {
public:
    Real a;   // x 缩放
    Real b;   // x 斜切
    Real c;   // y 斜切
    Real d;   // y 缩放
    Real tx;  // x 平移
    Real ty;  // y 平移

    /**
     * @brief 默认构造为单位矩阵
     */
    Matrix() : a(1), b(0), c(0), d(1), tx(0), ty(0) {}

    Matrix(Real a, Real b, Real c, Real d, Real tx, Real ty)
        : a(a), b(b), c(c), d(d), tx(tx), ty(ty) {}

    /**
     * @brief 从数组创建矩阵
     *
     * 映射关系：a = array[0], b = array[1], c = array[3], d = array[4], tx = array[2], ty = array[5]
     */
    static Matrix FromArray(const Real* array);

    /**
     * @brief 从 Eigen 齐次矩阵创建（只使用上面两行）
     */
    static Matrix FromEigen(const Matrix3& m);

    /**
     * @brief 共享的单位矩阵（只读）
     */
    static const Matrix& IdentityMatrix();

    /**
     * @brief 设置全部 6 个分量
     */
    Matrix& Set(Real a, Real b, Real c, Real d, Real tx, Real ty);

    // ========================================================================
    // 导出
    // ========================================================================

    /**
     * @brief 导出为 3x3 数组，用于上传 uniform
     * @param transpose false 为行主序 [a c tx; b d ty; 0 0 1]，true 为列主序 [a b 0; c d 0; tx ty 1]
     * @param out 输出缓冲区，至少 9 个元素，原地写入
     */
    void ToArray(bool transpose, float* out) const;

    void ToArray(bool transpose, std::array<float, 9>& out) const {
        ToArray(transpose, out.data());
    }

    std::array<float, 9> ToArray(bool transpose = false) const {
        std::array<float, 9> out;
        ToArray(transpose, out.data());
        return out;
    }

    Matrix3 ToEigen() const;
    AffineTransform2 ToEigenAffine() const;

    // ========================================================================
    // 点变换
    // ========================================================================

    /**
     * @brief 对点应用变换（子空间 -> 世界空间，例如渲染）
     */
    Point Apply(const Point& pos) const;

    /**
     * @brief 对点应用变换，结果写入 out（out 可以与 pos 相同）
     */
    void Apply(const Point& pos, Point& out) const;

    /**
     * @brief 对点应用逆变换（世界空间 -> 子空间，例如输入）
     * @throws AffineError 行列式为 0（TransformDegenerateMatrix）
     */
    Point ApplyInverse(const Point& pos) const;

    void ApplyInverse(const Point& pos, Point& out) const;

    // ========================================================================
    // 原地修改
    // ========================================================================

    /**
     * @brief 平移：tx += x, ty += y
     */
    Matrix& Translate(Real x, Real y);

    /**
     * @brief 逐分量缩放，平移分量也一起缩放
     */
    Matrix& Scale(Real x, Real y);

    /**
     * @brief 旋转（弧度）
     */
    Matrix& Rotate(Real angle);

    /**
     * @brief 追加矩阵：先应用 matrix，再应用当前矩阵已有的变换
     *
     * world.CopyFrom(parentWorld).Append(local) 与 Transform::UpdateTransform 计算的世界矩阵相同
     */
    Matrix& Append(const Matrix& matrix);

    /**
     * @brief 前置矩阵：先应用当前矩阵已有的变换，再应用 matrix
     *
     * matrix 的线性部分为单位阵时只更新平移分量
     */
    Matrix& Prepend(const Matrix& matrix);

    /**
     * @brief 由分解后的参数构建矩阵
     * @param x, y 位置（pivot 映射到的位置）
     * @param pivotX, pivotY 轴心
     * @param scaleX, scaleY 缩放
     * @param rotation 旋转（弧度）
     * @param skewX, skewY 斜切（弧度）
     */
    Matrix& SetTransform(Real x, Real y, Real pivotX, Real pivotY,
                         Real scaleX, Real scaleY, Real rotation,
                         Real skewX, Real skewY);

    /**
     * @brief 把矩阵分解为位置、缩放、旋转、斜切，写入 transform
     *
     * skewX + skewY 在 0 或 2PI 附近（阈值 1e-5）时视为无斜切，全部归入旋转；
     * 否则旋转置 0，斜切原样保存。缩放总是非负，负缩放的符号会被旋转/斜切吸收。
     * pivot 不会被修改。
     */
    void Decompose(Transform& transform) const;

    /**
     * @brief 求逆
     * @throws AffineError 行列式为 0（TransformDegenerateMatrix），矩阵保持不变
     */
    Matrix& Invert();

    /**
     * @brief 求逆（显式错误检查，不抛出异常）
     */
    Result TryInvert();

    Matrix& SetIdentity();

    // ========================================================================
    // 复制与比较
    // ========================================================================

    Matrix Clone() const { return *this; }

    void CopyTo(Matrix& matrix) const;
    Matrix& CopyFrom(const Matrix& matrix);

    Real Determinant() const { return a * d - b * c; }

    bool IsIdentity() const {
        return a == 1 && b == 0 && c == 0 && d == 1 && tx == 0 && ty == 0;
    }

    bool IsApprox(const Matrix& other, Real epsilon) const;

    bool operator==(const Matrix& other) const {
        return a == other.a && b == other.b && c == other.c &&
               d == other.d && tx == other.tx && ty == other.ty;
    }

    bool operator!=(const Matrix& other) const { return !(*this == other); }

    std::string DebugString() const;
};

inline std::ostream& operator<<(std::ostream& os, const Matrix& m) {
    return os << m.DebugString();
}

} // namespace Affine
