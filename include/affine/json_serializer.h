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

#include <nlohmann/json.hpp>
#include "affine/types.h"
#include "affine/point.h"
#include "affine/matrix.h"
#include "affine/error.h"
#include <string>

/**
 * @file json_serializer.h
 * @brief 变换数据的 JSON 序列化/反序列化工具
 *
 * 场景描述、测试数据等都用 JSON 保存节点的变换参数。
 *
 * 格式：
 * - Point：[x, y]，也接受 {"x": .., "y": ..}
 * - Matrix：[a, b, c, d, tx, ty]，也接受 {"a": .., "b": .., ...}
 * - Transform：{"position": [..], "scale": [..], "pivot": [..], "skew": [..], "rotation": r}
 *   缺少的键保持原值；写入经过 ObservablePoint，版本号保持一致
 *
 * 使用示例：
 * @code
 * nlohmann::json j;
 * if (JsonSerializer::LoadFromFile("node.json", j)) {
 *     Transform t;
 *     auto result = JsonSerializer::ApplyToTransform(j, t);
 * }
 * @endcode
 */

namespace Affine {

class Transform;

/**
 * @brief JSON序列化工具类
 */
class JsonSerializer {
public:
    /**
     * @brief 从文件加载JSON
     * @param filepath JSON文件路径
     * @param outJson 输出的JSON对象
     * @return 是否成功加载；失败以 FileNotFound / JsonParseFailed 交给 ErrorHandler
     */
    static bool LoadFromFile(const std::string& filepath, nlohmann::json& outJson);

    /**
     * @brief 保存JSON到文件
     * @param indent 缩进空格数（默认4）
     */
    static bool SaveToFile(const nlohmann::json& json, const std::string& filepath, int indent = 4);

    static bool ParseFromString(const std::string& jsonStr, nlohmann::json& outJson);

    static std::string ToString(const nlohmann::json& json, int indent = 4);

    /**
     * @brief 把 JSON 描述写入 Transform
     * @return 格式错误时返回 JsonInvalidFormat，此时 Transform 可能已部分更新
     */
    static Result ApplyToTransform(const nlohmann::json& json, Transform& transform);
};

// ============================================================================
// 基础类型的JSON序列化支持
// ============================================================================

inline void to_json(nlohmann::json& j, const Point& p) {
    j = nlohmann::json::array({p.x, p.y});
}

inline void from_json(const nlohmann::json& j, Point& p) {
    if (j.is_array() && j.size() == 2) {
        p.x = j[0].get<Real>();
        p.y = j[1].get<Real>();
    } else if (j.is_object()) {
        p.x = j.value("x", 0.0);
        p.y = j.value("y", 0.0);
    } else {
        throw AFFINE_ERROR(ErrorCode::JsonInvalidFormat,
            "Point 需要 [x, y] 或 {\"x\", \"y\"}，实际为: " + j.dump());
    }
}

inline void to_json(nlohmann::json& j, const Matrix& m) {
    j = nlohmann::json::array({m.a, m.b, m.c, m.d, m.tx, m.ty});
}

inline void from_json(const nlohmann::json& j, Matrix& m) {
    if (j.is_array() && j.size() == 6) {
        m.Set(j[0].get<Real>(), j[1].get<Real>(), j[2].get<Real>(),
              j[3].get<Real>(), j[4].get<Real>(), j[5].get<Real>());
    } else if (j.is_object()) {
        // 缺少的键取单位矩阵的值
        m.Set(j.value("a", 1.0), j.value("b", 0.0), j.value("c", 0.0),
              j.value("d", 1.0), j.value("tx", 0.0), j.value("ty", 0.0));
    } else {
        throw AFFINE_ERROR(ErrorCode::JsonInvalidFormat,
            "Matrix 需要 6 个元素的数组或对象，实际为: " + j.dump());
    }
}

/**
 * @brief Transform 转 JSON（只包含输入属性，不包含矩阵和版本号）
 */
void to_json(nlohmann::json& j, const Transform& transform);

/**
 * @brief JSON 转 Transform，格式错误时抛出 AffineError 或 nlohmann::json::exception
 */
void from_json(const nlohmann::json& j, Transform& transform);

} // namespace Affine
