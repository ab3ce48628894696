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
#include "affine/matrix.h"
#include "affine/transform.h"
#include "affine/math_utils.h"
#include <cmath>
#include <sstream>

namespace Affine {

namespace {

[[noreturn]] void ThrowDegenerate(const char* where, Real determinant) {
    std::ostringstream oss;
    oss << where << ": 矩阵不可逆（行列式 = " << determinant << "）";
    throw AFFINE_ERROR(ErrorCode::TransformDegenerateMatrix, oss.str());
}

} // namespace

// ============================================================================
// 构造
// ============================================================================

Matrix Matrix::FromArray(const Real* array) {
    if (array == nullptr) {
        throw AFFINE_ERROR(ErrorCode::NullPointer, "Matrix::FromArray: 数组不能为空");
    }
    return Matrix(array[0], array[1], array[3], array[4], array[2], array[5]);
}

Matrix Matrix::FromEigen(const Matrix3& m) {
    return Matrix(m(0, 0), m(1, 0), m(0, 1), m(1, 1), m(0, 2), m(1, 2));
}

const Matrix& Matrix::IdentityMatrix() {
    static const Matrix identity;
    return identity;
}

Matrix& Matrix::Set(Real newA, Real newB, Real newC, Real newD, Real newTx, Real newTy) {
    a = newA;
    b = newB;
    c = newC;
    d = newD;
    tx = newTx;
    ty = newTy;
    return *this;
}

// ============================================================================
// 导出
// ============================================================================

void Matrix::ToArray(bool transpose, float* out) const {
    if (out == nullptr) {
        throw AFFINE_ERROR(ErrorCode::NullPointer, "Matrix::ToArray: 输出缓冲区不能为空");
    }

    if (transpose) {
        out[0] = static_cast<float>(a);
        out[1] = static_cast<float>(b);
        out[2] = 0.0f;
        out[3] = static_cast<float>(c);
        out[4] = static_cast<float>(d);
        out[5] = 0.0f;
        out[6] = static_cast<float>(tx);
        out[7] = static_cast<float>(ty);
        out[8] = 1.0f;
    } else {
        out[0] = static_cast<float>(a);
        out[1] = static_cast<float>(c);
        out[2] = static_cast<float>(tx);
        out[3] = static_cast<float>(b);
        out[4] = static_cast<float>(d);
        out[5] = static_cast<float>(ty);
        out[6] = 0.0f;
        out[7] = 0.0f;
        out[8] = 1.0f;
    }
}

Matrix3 Matrix::ToEigen() const {
    Matrix3 m;
    m << a, c, tx,
         b, d, ty,
         0, 0, 1;
    return m;
}

AffineTransform2 Matrix::ToEigenAffine() const {
    AffineTransform2 t;
    t.matrix() = ToEigen();
    return t;
}

// ============================================================================
// 点变换
// ============================================================================

Point Matrix::Apply(const Point& pos) const {
    Point out;
    Apply(pos, out);
    return out;
}

void Matrix::Apply(const Point& pos, Point& out) const {
    // 先取出输入，允许 out 与 pos 是同一个对象
    const Real x = pos.x;
    const Real y = pos.y;
    out.Set((a * x) + (c * y) + tx, (b * x) + (d * y) + ty);
}

Point Matrix::ApplyInverse(const Point& pos) const {
    Point out;
    ApplyInverse(pos, out);
    return out;
}

void Matrix::ApplyInverse(const Point& pos, Point& out) const {
    const Real n = Determinant();
    if (n == 0) {
        ThrowDegenerate("Matrix::ApplyInverse", n);
    }

    const Real id = 1.0 / n;
    const Real x = pos.x;
    const Real y = pos.y;

    out.Set((d * id * x) + (-c * id * y) + (((ty * c) - (tx * d)) * id),
            (a * id * y) + (-b * id * x) + (((-ty * a) + (tx * b)) * id));
}

// ============================================================================
// 原地修改
// ============================================================================

Matrix& Matrix::Translate(Real x, Real y) {
    tx += x;
    ty += y;
    return *this;
}

Matrix& Matrix::Scale(Real x, Real y) {
    a *= x;
    d *= y;
    c *= x;
    b *= y;
    tx *= x;
    ty *= y;
    return *this;
}

Matrix& Matrix::Rotate(Real angle) {
    const Real cos = std::cos(angle);
    const Real sin = std::sin(angle);

    // b、d、ty 的新值依赖旋转前的 a、c、tx
    const Real a1 = a;
    const Real c1 = c;
    const Real tx1 = tx;

    a = (a1 * cos) - (b * sin);
    b = (a1 * sin) + (b * cos);
    c = (c1 * cos) - (d * sin);
    d = (c1 * sin) + (d * cos);
    tx = (tx1 * cos) - (ty * sin);
    ty = (tx1 * sin) + (ty * cos);
    return *this;
}

Matrix& Matrix::Append(const Matrix& matrix) {
    const Real a1 = a;
    const Real b1 = b;
    const Real c1 = c;
    const Real d1 = d;

    a = (matrix.a * a1) + (matrix.b * c1);
    b = (matrix.a * b1) + (matrix.b * d1);
    c = (matrix.c * a1) + (matrix.d * c1);
    d = (matrix.c * b1) + (matrix.d * d1);

    tx = (matrix.tx * a1) + (matrix.ty * c1) + tx;
    ty = (matrix.tx * b1) + (matrix.ty * d1) + ty;
    return *this;
}

Matrix& Matrix::Prepend(const Matrix& matrix) {
    const Real tx1 = tx;

    if (matrix.a != 1 || matrix.b != 0 || matrix.c != 0 || matrix.d != 1) {
        const Real a1 = a;
        const Real c1 = c;

        a = (a1 * matrix.a) + (b * matrix.c);
        b = (a1 * matrix.b) + (b * matrix.d);
        c = (c1 * matrix.a) + (d * matrix.c);
        d = (c1 * matrix.b) + (d * matrix.d);
    }

    tx = (tx1 * matrix.a) + (ty * matrix.c) + matrix.tx;
    ty = (tx1 * matrix.b) + (ty * matrix.d) + matrix.ty;
    return *this;
}

Matrix& Matrix::SetTransform(Real x, Real y, Real pivotX, Real pivotY,
                             Real scaleX, Real scaleY, Real rotation,
                             Real skewX, Real skewY) {
    a = std::cos(rotation + skewY) * scaleX;
    b = std::sin(rotation + skewY) * scaleX;
    c = -std::sin(rotation - skewX) * scaleY;
    d = std::cos(rotation - skewX) * scaleY;

    tx = x - ((pivotX * a) + (pivotY * c));
    ty = y - ((pivotX * b) + (pivotY * d));
    return *this;
}

void Matrix::Decompose(Transform& transform) const {
    // 先确定旋转 / 斜切
    const Real skewX = -std::atan2(-c, d);
    const Real skewY = std::atan2(b, a);

    const Real delta = std::abs(skewX + skewY);

    if (delta < MathUtils::DECOMPOSE_EPSILON ||
        std::abs(MathUtils::TWO_PI - delta) < MathUtils::DECOMPOSE_EPSILON) {
        Real rotation = skewY;

        if (a < 0 && d >= 0) {
            rotation += (rotation <= 0) ? MathUtils::PI : -MathUtils::PI;
        }

        transform.SetRotation(rotation);
        transform.GetSkew().Set(0, 0);
    } else {
        transform.SetRotation(0);
        transform.GetSkew().Set(skewX, skewY);
    }

    transform.GetScale().Set(std::sqrt((a * a) + (b * b)), std::sqrt((c * c) + (d * d)));
    transform.GetPosition().Set(tx, ty);
}

Matrix& Matrix::Invert() {
    const Real n = Determinant();
    if (n == 0) {
        ThrowDegenerate("Matrix::Invert", n);
    }

    const Real a1 = a;
    const Real b1 = b;
    const Real c1 = c;
    const Real d1 = d;
    const Real tx1 = tx;

    a = d1 / n;
    b = -b1 / n;
    c = -c1 / n;
    d = a1 / n;
    tx = ((c1 * ty) - (d1 * tx1)) / n;
    ty = -((a1 * ty) - (b1 * tx1)) / n;
    return *this;
}

Result Matrix::TryInvert() {
    const Real n = Determinant();
    if (n == 0 || !std::isfinite(n)) {
        std::ostringstream oss;
        oss << "Matrix::TryInvert: 矩阵不可逆（行列式 = " << n << "），矩阵保持不变";
        HANDLE_ERROR(AFFINE_WARNING(ErrorCode::TransformDegenerateMatrix, oss.str()));
        return Result::Failure(ErrorCode::TransformDegenerateMatrix, oss.str());
    }

    Invert();
    return Result::Success();
}

Matrix& Matrix::SetIdentity() {
    return Set(1, 0, 0, 1, 0, 0);
}

// ============================================================================
// 复制与比较
// ============================================================================

void Matrix::CopyTo(Matrix& matrix) const {
    matrix.a = a;
    matrix.b = b;
    matrix.c = c;
    matrix.d = d;
    matrix.tx = tx;
    matrix.ty = ty;
}

Matrix& Matrix::CopyFrom(const Matrix& matrix) {
    matrix.CopyTo(*this);
    return *this;
}

bool Matrix::IsApprox(const Matrix& other, Real epsilon) const {
    return MathUtils::NearlyEqual(a, other.a, epsilon) &&
           MathUtils::NearlyEqual(b, other.b, epsilon) &&
           MathUtils::NearlyEqual(c, other.c, epsilon) &&
           MathUtils::NearlyEqual(d, other.d, epsilon) &&
           MathUtils::NearlyEqual(tx, other.tx, epsilon) &&
           MathUtils::NearlyEqual(ty, other.ty, epsilon);
}

std::string Matrix::DebugString() const {
    std::ostringstream oss;
    oss << "Matrix {a: " << a << ", b: " << b << ", c: " << c << ", d: " << d
        << ", tx: " << tx << ", ty: " << ty << "}";
    return oss.str();
}

} // namespace Affine
