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

#include <cstdint>
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace Affine {

// ============================================================================
// 标量与版本号类型
// ============================================================================

// 变换计算统一使用双精度，上传 GPU 时再转换为 float
using Real = double;

// 版本号需要能表示 -1（强制刷新世界矩阵的哨兵值）
using VersionId = int64_t;

// ============================================================================
// 数学类型定义（使用 Eigen，用于与渲染端的数学类型互通）
// ============================================================================

using Vector2 = Eigen::Vector2d;
using Matrix3 = Eigen::Matrix3d;
using AffineTransform2 = Eigen::Affine2d;

} // namespace Affine
