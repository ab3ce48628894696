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
#include "affine/json_serializer.h"
#include "affine/transform.h"
#include "affine/logger.h"
#include <fstream>

namespace Affine {

namespace {

// 失败统一交给 ErrorHandler，默认回调会写入日志
void ReportFailure(ErrorCode code, const std::string& message) {
    HANDLE_ERROR(AFFINE_ERROR(code, "[JsonSerializer] " + message));
}

} // namespace

bool JsonSerializer::LoadFromFile(const std::string& filepath, nlohmann::json& outJson) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        ReportFailure(ErrorCode::FileNotFound, "Failed to open file: " + filepath);
        return false;
    }

    try {
        file >> outJson;
    } catch (const nlohmann::json::parse_error& e) {
        ReportFailure(ErrorCode::JsonParseFailed, "JSON parse error in file " + filepath + ": " + e.what());
        return false;
    }

    Logger::GetInstance().DebugFormat("[JsonSerializer] Loaded JSON from: %s", filepath.c_str());
    return true;
}

bool JsonSerializer::SaveToFile(const nlohmann::json& json, const std::string& filepath, int indent) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        ReportFailure(ErrorCode::FileWriteFailed, "Failed to create file: " + filepath);
        return false;
    }

    try {
        file << json.dump(indent);
    } catch (const nlohmann::json::type_error& e) {
        // 非法 UTF-8 字符串
        ReportFailure(ErrorCode::JsonInvalidFormat, "Cannot serialize JSON to " + filepath + ": " + e.what());
        return false;
    }

    if (!file.good()) {
        ReportFailure(ErrorCode::FileWriteFailed, "Write failed: " + filepath);
        return false;
    }

    Logger::GetInstance().DebugFormat("[JsonSerializer] Saved JSON to: %s", filepath.c_str());
    return true;
}

bool JsonSerializer::ParseFromString(const std::string& jsonStr, nlohmann::json& outJson) {
    try {
        outJson = nlohmann::json::parse(jsonStr);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        ReportFailure(ErrorCode::JsonParseFailed, std::string("JSON parse error: ") + e.what());
        return false;
    }
}

std::string JsonSerializer::ToString(const nlohmann::json& json, int indent) {
    try {
        return json.dump(indent);
    } catch (const nlohmann::json::type_error& e) {
        ReportFailure(ErrorCode::JsonInvalidFormat, std::string("Error converting JSON to string: ") + e.what());
        return "{}";
    }
}

Result JsonSerializer::ApplyToTransform(const nlohmann::json& json, Transform& transform) {
    try {
        from_json(json, transform);
        return Result::Success();

    } catch (const AffineError& e) {
        HANDLE_ERROR(e);
        return Result::Failure(e.GetCode(), e.GetMessage());

    } catch (const nlohmann::json::exception& e) {
        AffineError error(ErrorCode::JsonInvalidFormat,
                          std::string("[JsonSerializer] Invalid transform description: ") + e.what());
        HANDLE_ERROR(error);
        return Result::Failure(error.GetCode(), error.GetMessage());
    }
}

// ============================================================================
// Transform 序列化
// ============================================================================

void to_json(nlohmann::json& j, const Transform& transform) {
    j = nlohmann::json{
        {"position", transform.GetPosition().ToPoint()},
        {"scale", transform.GetScale().ToPoint()},
        {"pivot", transform.GetPivot().ToPoint()},
        {"skew", transform.GetSkew().ToPoint()},
        {"rotation", transform.GetRotation()}
    };
}

void from_json(const nlohmann::json& j, Transform& transform) {
    if (!j.is_object()) {
        throw AFFINE_ERROR(ErrorCode::JsonInvalidFormat,
            "Transform 需要 JSON 对象，实际为: " + j.dump());
    }

    if (j.contains("position")) {
        transform.GetPosition().CopyFrom(j.at("position").get<Point>());
    }
    if (j.contains("scale")) {
        transform.GetScale().CopyFrom(j.at("scale").get<Point>());
    }
    if (j.contains("pivot")) {
        transform.GetPivot().CopyFrom(j.at("pivot").get<Point>());
    }
    if (j.contains("skew")) {
        transform.GetSkew().CopyFrom(j.at("skew").get<Point>());
    }
    if (j.contains("rotation")) {
        transform.SetRotation(j.at("rotation").get<Real>());
    }
}

} // namespace Affine
