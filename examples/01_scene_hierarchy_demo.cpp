#include "affine/transform.h"
#include "affine/json_serializer.h"
#include "affine/logger.h"
#include "affine/math_utils.h"
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace Affine;

// 演示用的最小场景节点：每个节点持有一个 Transform 和若干子节点
struct SceneNode {
    std::string name;
    Transform transform;
    std::vector<std::unique_ptr<SceneNode>> children;

    explicit SceneNode(std::string nodeName) : name(std::move(nodeName)) {}

    SceneNode* AddChild(const std::string& childName) {
        children.push_back(std::make_unique<SceneNode>(childName));
        return children.back().get();
    }
};

// 自顶向下更新，返回本次重算世界矩阵的节点数
int UpdateRecursive(SceneNode& node, const Transform& parent) {
    const VersionId before = node.transform.GetWorldID();
    node.transform.UpdateTransform(parent);
    int recomputed = node.transform.GetWorldID() != before ? 1 : 0;

    for (auto& child : node.children) {
        recomputed += UpdateRecursive(*child, node.transform);
    }
    return recomputed;
}

void PrintTree(const SceneNode& node, int depth) {
    const Matrix& wt = node.transform.GetWorldMatrix();
    Point origin = wt.Apply(Point(0, 0));
    LOG_INFO_F("%*s%s -> (%.2f, %.2f)", depth * 2, "", node.name.c_str(), origin.x, origin.y);
    for (const auto& child : node.children) {
        PrintTree(*child, depth + 1);
    }
}

int main() {
    Logger& logger = Logger::GetInstance();
    logger.SetLogLevel(LogLevel::Debug);
    logger.SetLogToConsole(true);
    logger.SetColorOutput(true);

    // ========== 构建场景 ==========
    SceneNode root("root");
    SceneNode* arm = root.AddChild("arm");
    SceneNode* hand = arm->AddChild("hand");
    SceneNode* finger = hand->AddChild("finger");
    SceneNode* tree = root.AddChild("tree");

    arm->transform.GetPosition().Set(100, 100);
    hand->transform.GetPosition().Set(50, 0);
    finger->transform.GetPosition().Set(10, 0);
    tree->transform.GetPosition().Set(-200, 0);
    tree->transform.GetScale().Set(2);

    // 节点属性也可以来自 JSON 描述
    nlohmann::json handDescription;
    if (JsonSerializer::ParseFromString(R"({"pivot": [5, 5], "rotation": 0.1})", handDescription)) {
        Result result = JsonSerializer::ApplyToTransform(handDescription, hand->transform);
        if (result.Failed()) {
            LOG_ERROR("hand 描述无效: " + result.message);
        }
    }

    // ========== 逐帧更新 ==========
    for (int frame = 0; frame < 5; ++frame) {
        if (frame == 2) {
            arm->transform.SetRotation(MathUtils::HALF_PI);
        }
        if (frame == 4) {
            tree->transform.GetPosition().SetX(-150);
        }

        int recomputed = UpdateRecursive(root, Transform::Identity());
        LOG_INFO_F("第 %d 帧: 重算 %d 个世界矩阵", frame, recomputed);
    }

    std::cout << "\n========== 最终世界坐标 ==========" << std::endl;
    PrintTree(root, 0);

    // ========== 不相交子树并发更新 ==========
    std::cout << "\n========== 并发更新 ==========" << std::endl;
    arm->transform.GetScale().Set(0.5);
    tree->transform.SetRotation(0.3);
    root.transform.UpdateTransform(Transform::Identity());

    int armCount = 0;
    int treeCount = 0;
    std::thread armThread([&]() { armCount = UpdateRecursive(*arm, root.transform); });
    std::thread treeThread([&]() { treeCount = UpdateRecursive(*tree, root.transform); });
    armThread.join();
    treeThread.join();
    LOG_INFO_F("arm 子树重算 %d 个节点，tree 子树重算 %d 个节点", armCount, treeCount);

    // ========== 上传给 GPU 的数据 ==========
    std::array<float, 9> upload = finger->transform.GetWorldMatrix().ToArray(true);
    LOG_DEBUG_F("finger 世界矩阵（列主序）: [%.3f %.3f %.3f | %.3f %.3f %.3f | %.3f %.3f %.3f]",
                upload[0], upload[1], upload[2], upload[3], upload[4], upload[5],
                upload[6], upload[7], upload[8]);

    // ========== 错误处理 ==========
    Matrix flat(1, 2, 2, 4, 0, 0);
    Result inverted = flat.TryInvert();
    if (inverted.Failed()) {
        LOG_WARNING("预期的失败: " + inverted.message);
    }

    auto stats = ErrorHandler::GetInstance().GetStats();
    LOG_INFO_F("错误统计: 警告 %zu，错误 %zu", stats.warningCount, stats.errorCount);
    return 0;
}
