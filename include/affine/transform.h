#pragma once

#include "types.h"
#include "matrix.h"
#include "observable_point.h"
#include "error.h"
#include <string>

namespace Affine {

/**
 * @class Transform
 * @brief 场景图节点的二维变换（位置、缩放、轴心、斜切、旋转）
 *
 * Transform 持有本地矩阵和世界矩阵，用版本号判断它们是否需要重新计算，
 * 而不是每帧重算所有节点。
 *
 * @section versions 版本号
 * - localID：任何输入（position/scale/pivot/skew/rotation）变化时递增
 * - currentLocalID：上次重算本地矩阵时的 localID
 * - parentID：上次重算世界矩阵时父变换的 worldID
 * - worldID：每次重算世界矩阵后递增
 *
 * 本地矩阵有效 <=> localID == currentLocalID；
 * 世界矩阵有效 <=> 本地矩阵有效且 parentID == parent.worldID。
 *
 * @section update 更新顺序
 * 场景遍历器每帧自顶向下、深度优先地调用 UpdateTransform(parent)，父节点一定先于子节点。
 * 根节点以 Transform::Identity() 作为父变换。未变化的子树每个节点只做两次整数比较。
 *
 * @section thread_safety 线程安全
 * - 不加锁。同一棵子树必须在一个线程内按父先子后的顺序更新
 * - 互不相交的子树可以并发更新（每个 Transform 独占自己的矩阵和版本号）
 * - Identity() 构造后不再修改，可以在线程间共享
 *
 * @example
 * @code
 * Transform root, child;
 * child.GetPosition().Set(10, 5);
 * root.UpdateTransform(Transform::Identity());
 * child.UpdateTransform(root);
 * const Matrix& wt = child.GetWorldMatrix();  // 上传 wt.ToArray(...)
 * @endcode
 */
class Transform : private PointObserver {
public:
    /**
     * @brief 默认构造函数
     * 位置 (0,0)，缩放 (1,1)，轴心 (0,0)，斜切 (0,0)，旋转 0，两个矩阵都为单位矩阵
     */
    Transform();

    ~Transform() override = default;

    // 禁用拷贝和移动（ObservablePoint 持有指向本对象的观察指针）
    Transform(const Transform&) = delete;
    Transform& operator=(const Transform&) = delete;
    Transform(Transform&&) = delete;
    Transform& operator=(Transform&&) = delete;

    /**
     * @brief 共享的单位变换，作为根节点的父变换
     *
     * 进程级单例，构造后不会被修改
     */
    static const Transform& Identity();

    // ========================================================================
    // 输入属性
    // ========================================================================

    ObservablePoint& GetPosition() { return m_position; }
    const ObservablePoint& GetPosition() const { return m_position; }

    ObservablePoint& GetScale() { return m_scale; }
    const ObservablePoint& GetScale() const { return m_scale; }

    ObservablePoint& GetPivot() { return m_pivot; }
    const ObservablePoint& GetPivot() const { return m_pivot; }

    /**
     * @brief 斜切（弧度），修改时会重新计算缓存的三角函数值
     */
    ObservablePoint& GetSkew() { return m_skew; }
    const ObservablePoint& GetSkew() const { return m_skew; }

    Real GetRotation() const { return m_rotation; }

    /**
     * @brief 设置旋转（弧度）
     *
     * 值变化时立即重新计算 cos/sin 缓存并递增 localID
     */
    void SetRotation(Real rotation);

    // ========================================================================
    // 矩阵
    // ========================================================================

    /**
     * @brief 本地矩阵，只在 UpdateLocalTransform/UpdateTransform 之后是最新的
     */
    const Matrix& GetLocalMatrix() const { return m_localMatrix; }

    /**
     * @brief 世界矩阵，只在本帧调用过 UpdateTransform 之后是最新的
     */
    const Matrix& GetWorldMatrix() const { return m_worldMatrix; }

    /**
     * @brief 只更新本地矩阵
     *
     * 本地矩阵重新计算时会把 parentID 置为 -1，保证下一次 UpdateTransform 一定重算世界矩阵
     */
    void UpdateLocalTransform();

    /**
     * @brief 更新本地矩阵（如有需要）并与父变换的世界矩阵组合
     * @param parent 父变换，根节点传 Transform::Identity()
     *
     * @note 调用前 parent 必须已经在本帧更新过
     * @throws AffineError parent 就是自己（InvalidArgument）
     */
    void UpdateTransform(const Transform& parent);

    /**
     * @brief 指针版本，parent 为空时抛出异常
     * @throws AffineError parent 为 nullptr（TransformMissingParent）
     */
    void UpdateTransform(const Transform* parent);

    /**
     * @brief 分解矩阵并设置 position/scale/rotation/skew（pivot 不变）
     *
     * 无论分解结果是否与原值相同，localID 都会递增
     */
    void SetFromMatrix(const Matrix& matrix);

    /**
     * @brief 从矩阵设置变换（显式错误检查）
     * @return 矩阵含 NaN/Inf 时返回 TransformInvalidMatrix，Transform 保持不变
     */
    Result TrySetFromMatrix(const Matrix& matrix);

    /**
     * @brief 父节点发生了变化（例如重新挂接到另一个父节点）
     *
     * 不同父节点的 worldID 可能恰好相同，挂接后必须调用，强制下一次更新重算世界矩阵
     */
    void MarkParentChanged() { m_parentID = -1; }

    // ========================================================================
    // 版本号
    // ========================================================================

    VersionId GetLocalID() const { return m_localID; }
    VersionId GetCurrentLocalID() const { return m_currentLocalID; }
    VersionId GetParentID() const { return m_parentID; }
    VersionId GetWorldID() const { return m_worldID; }

    [[nodiscard]] bool IsLocalDirty() const { return m_localID != m_currentLocalID; }

    // ========================================================================
    // 调试和诊断
    // ========================================================================

    std::string DebugString() const;

    /**
     * @brief 检查所有输入和矩阵都是有限值
     */
    bool Validate() const;

private:
    void OnPointChanged(const ObservablePoint& point) override;

    /**
     * @brief rotation 或 skew 变化后重新计算 cos/sin 缓存
     */
    void UpdateSkew();

    Matrix m_worldMatrix;
    Matrix m_localMatrix;

    ObservablePoint m_position;
    ObservablePoint m_scale;
    ObservablePoint m_pivot;
    ObservablePoint m_skew;

    Real m_rotation = 0;

    Real m_cx = 1;  // cos(rotation + skewY)
    Real m_sx = 0;  // sin(rotation + skewY)
    Real m_cy = 0;  // -sin(rotation - skewX)
    Real m_sy = 1;  // cos(rotation - skewX)

    VersionId m_localID = 0;
    VersionId m_currentLocalID = 0;
    VersionId m_worldID = 0;
    VersionId m_parentID = 0;
};

} // namespace Affine
