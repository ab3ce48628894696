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
#include <cmath>

namespace Affine {
namespace MathUtils {

// ============================================================================
// 常量
// ============================================================================

constexpr Real PI = 3.14159265358979323846;
constexpr Real TWO_PI = 6.28318530717958647692;
constexpr Real HALF_PI = 1.57079632679489661923;
constexpr Real EPSILON = 1e-9;

// 矩阵分解时判断 skewX + skewY 是否为 0 或 2PI 的阈值
// 与渲染端既有行为保持一致，不要改成"更精确"的值
constexpr Real DECOMPOSE_EPSILON = 0.00001;

// ============================================================================
// 数值工具
// ============================================================================

inline bool NearlyEqual(Real a, Real b, Real epsilon = EPSILON) {
    return std::abs(a - b) < epsilon;
}

inline bool IsFinite(Real x, Real y) {
    return std::isfinite(x) && std::isfinite(y);
}

} // namespace MathUtils
} // namespace Affine
