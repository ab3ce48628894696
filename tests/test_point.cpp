/**
 * @file test_point.cpp
 * @brief Point / ObservablePoint 单元测试
 *
 * - Point 值语义与相等比较
 * - ObservablePoint 只在值真正变化时通知观察者
 * - 构造时的前置条件检查
 */

#include "affine/point.h"
#include "affine/observable_point.h"
#include "affine/error.h"
#include <iostream>
#include <cmath>
#include <limits>

using namespace Affine;

// ============================================================================
// 测试框架
// ============================================================================

static int g_testCount = 0;
static int g_passedCount = 0;
static int g_failedCount = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        g_testCount++; \
        if (!(condition)) { \
            std::cerr << "❌ 测试失败: " << message << std::endl; \
            std::cerr << "   位置: " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::cerr << "   条件: " << #condition << std::endl; \
            g_failedCount++; \
            return false; \
        } \
        g_passedCount++; \
    } while(0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "运行测试: " << #test_func << "..." << std::endl; \
        if (test_func()) { \
            std::cout << "✓ " << #test_func << " 通过" << std::endl; \
        } else { \
            std::cout << "✗ " << #test_func << " 失败" << std::endl; \
        } \
    } while(0)

// 记录通知次数的观察者
class CountingObserver : public PointObserver {
public:
    void OnPointChanged(const ObservablePoint& point) override {
        count++;
        last = &point;
    }

    int count = 0;
    const ObservablePoint* last = nullptr;
};

// ============================================================================
// Point
// ============================================================================

bool Test_Point_DefaultIsOrigin() {
    Point p;
    TEST_ASSERT(p.x == 0.0 && p.y == 0.0, "默认构造应为原点");
    return true;
}

bool Test_Point_Equality() {
    Point a(1.5, -2.0);
    Point b(1.5, -2.0);
    Point c(1.5, 2.0);

    TEST_ASSERT(a == b, "分量相同的点应该相等");
    TEST_ASSERT(a != c, "y 不同的点不应该相等");
    TEST_ASSERT(!(a == Point(0.0, -2.0)), "x 不同的点不应该相等");
    return true;
}

bool Test_Point_SetSingleValue() {
    Point p;
    p.Set(3.0);
    TEST_ASSERT(p == Point(3.0, 3.0), "Set(v) 应该把两个分量都设为 v");
    return true;
}

bool Test_Point_CopyFromAndCopyTo() {
    Point source(4.0, 5.0);
    Point target;

    target.CopyFrom(source);
    TEST_ASSERT(target == source, "CopyFrom 后应该相等");

    Point other(-1.0, -1.0);
    source.CopyTo(other);
    TEST_ASSERT(other == source, "CopyTo 应该写入目标点");
    TEST_ASSERT(source == Point(4.0, 5.0), "CopyTo 不应该修改源点");
    return true;
}

bool Test_Point_CloneIsIndependent() {
    Point p(1.0, 2.0);
    Point q = p.Clone();
    q.Set(7.0, 8.0);
    TEST_ASSERT(p == Point(1.0, 2.0), "修改副本不应该影响原点");
    return true;
}

bool Test_Point_EigenInterop() {
    Point p(2.5, -3.5);
    Vector2 v = p.ToVector();
    TEST_ASSERT(v.x() == 2.5 && v.y() == -3.5, "ToVector 分量应该一致");
    TEST_ASSERT(Point::FromVector(v) == p, "FromVector 应该还原点");
    return true;
}

// ============================================================================
// ObservablePoint
// ============================================================================

bool Test_ObservablePoint_ConstructionDoesNotNotify() {
    CountingObserver observer;
    ObservablePoint p(&observer, 1.0, 2.0);

    TEST_ASSERT(observer.count == 0, "构造不应该触发通知");
    TEST_ASSERT(p.GetX() == 1.0 && p.GetY() == 2.0, "初始坐标应该正确");
    return true;
}

bool Test_ObservablePoint_SetTwiceNotifiesOnce() {
    CountingObserver observer;
    ObservablePoint p(&observer);

    p.Set(3.0, 4.0);
    TEST_ASSERT(observer.count == 1, "第一次设置应该通知");
    TEST_ASSERT(observer.last == &p, "通知应该携带发生变化的点");

    p.Set(3.0, 4.0);
    TEST_ASSERT(observer.count == 1, "设置相同值不应该通知");
    return true;
}

bool Test_ObservablePoint_SetSingleComponentChangeNotifiesOnce() {
    CountingObserver observer;
    ObservablePoint p(&observer, 1.0, 1.0);

    p.Set(1.0, 9.0);
    TEST_ASSERT(observer.count == 1, "只有 y 变化也应该通知一次");

    p.Set(5.0, 6.0);
    TEST_ASSERT(observer.count == 2, "两个分量都变化也只通知一次");
    return true;
}

bool Test_ObservablePoint_SetSingleValue() {
    CountingObserver observer;
    ObservablePoint p(&observer);

    p.Set(2.0);
    TEST_ASSERT(p == Point(2.0, 2.0), "省略 y 时两个分量都取 x 的值");
    TEST_ASSERT(observer.count == 1, "Set(v) 应该通知一次");

    p.Set(2.0);
    TEST_ASSERT(observer.count == 1, "Set(v) 相同值不应该通知");
    return true;
}

bool Test_ObservablePoint_ComponentSetters() {
    CountingObserver observer;
    ObservablePoint p(&observer, 1.0, 2.0);

    p.SetX(1.0);
    p.SetY(2.0);
    TEST_ASSERT(observer.count == 0, "写入相同分量不应该通知");

    p.SetX(10.0);
    TEST_ASSERT(observer.count == 1, "SetX 变化应该通知");
    TEST_ASSERT(p.GetX() == 10.0, "SetX 应该写入");

    p.SetY(20.0);
    TEST_ASSERT(observer.count == 2, "SetY 变化应该通知");
    TEST_ASSERT(p.GetY() == 20.0, "SetY 应该写入");
    return true;
}

bool Test_ObservablePoint_CopyFromUsesSameDedupRule() {
    CountingObserver observer;
    ObservablePoint p(&observer, 1.0, 2.0);

    p.CopyFrom(Point(1.0, 2.0));
    TEST_ASSERT(observer.count == 0, "CopyFrom 相同值不应该通知");

    p.CopyFrom(Point(3.0, 2.0));
    TEST_ASSERT(observer.count == 1, "CopyFrom 不同值应该通知");

    CountingObserver otherObserver;
    ObservablePoint source(&otherObserver, 3.0, 2.0);
    p.CopyFrom(source);
    TEST_ASSERT(observer.count == 1, "从相同值的 ObservablePoint 复制不应该通知");
    TEST_ASSERT(otherObserver.count == 0, "复制源的观察者不应该被通知");
    return true;
}

bool Test_ObservablePoint_CopyToPlainPoint() {
    CountingObserver observer;
    ObservablePoint p(&observer, 6.0, 7.0);
    Point target;

    p.CopyTo(target);
    TEST_ASSERT(target == Point(6.0, 7.0), "CopyTo 应该写入普通点");
    TEST_ASSERT(observer.count == 0, "CopyTo 不应该通知源点的观察者");
    return true;
}

bool Test_ObservablePoint_CopyToObservableTarget() {
    CountingObserver sourceObserver;
    CountingObserver targetObserver;
    ObservablePoint source(&sourceObserver, 1.0, 2.0);
    ObservablePoint target(&targetObserver, 1.0, 2.0);

    source.CopyTo(target);
    TEST_ASSERT(targetObserver.count == 0, "目标值未变化时目标不应该通知");

    source.Set(5.0, 2.0);
    source.CopyTo(target);
    TEST_ASSERT(targetObserver.count == 1, "目标值变化时由目标的观察者接收通知");
    TEST_ASSERT(target == Point(5.0, 2.0), "目标应该被写入");
    TEST_ASSERT(sourceObserver.count == 1, "CopyTo 不应该再次通知源点");
    return true;
}

bool Test_ObservablePoint_CloneBindsToNewObserver() {
    CountingObserver first;
    CountingObserver second;
    ObservablePoint p(&first, 1.0, 2.0);

    ObservablePoint copy = p.Clone(&second);
    TEST_ASSERT(copy == Point(1.0, 2.0), "Clone 应该复制坐标");
    TEST_ASSERT(second.count == 0, "Clone 不应该触发通知");

    copy.SetX(3.0);
    TEST_ASSERT(second.count == 1, "副本应该通知新的观察者");
    TEST_ASSERT(first.count == 0, "副本不应该通知原观察者");
    TEST_ASSERT(p.GetX() == 1.0, "修改副本不应该影响原点");
    return true;
}

bool Test_ObservablePoint_NullObserverRejected() {
    bool thrown = false;
    try {
        ObservablePoint p(nullptr, 0.0, 0.0);
        (void)p;
    } catch (const AffineError& e) {
        thrown = true;
        TEST_ASSERT(e.GetCode() == ErrorCode::PointObserverMissing, "错误码应该是 PointObserverMissing");
        TEST_ASSERT(e.GetCategory() == ErrorCategory::Transform, "类别应该是 Transform");
    }
    TEST_ASSERT(thrown, "空观察者应该抛出异常");
    return true;
}

bool Test_ObservablePoint_NonFiniteInitialValueRejected() {
    CountingObserver observer;
    bool thrown = false;
    try {
        ObservablePoint p(&observer, std::numeric_limits<Real>::quiet_NaN(), 0.0);
        (void)p;
    } catch (const AffineError& e) {
        thrown = true;
        TEST_ASSERT(e.GetCode() == ErrorCode::InvalidArgument, "错误码应该是 InvalidArgument");
    }
    TEST_ASSERT(thrown, "NaN 初始坐标应该抛出异常");
    return true;
}

// ============================================================================
// 主函数
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Point / ObservablePoint 测试" << std::endl;
    std::cout << "========================================" << std::endl;

    std::cout << "--- Point ---" << std::endl;
    RUN_TEST(Test_Point_DefaultIsOrigin);
    RUN_TEST(Test_Point_Equality);
    RUN_TEST(Test_Point_SetSingleValue);
    RUN_TEST(Test_Point_CopyFromAndCopyTo);
    RUN_TEST(Test_Point_CloneIsIndependent);
    RUN_TEST(Test_Point_EigenInterop);
    std::cout << std::endl;

    std::cout << "--- ObservablePoint ---" << std::endl;
    RUN_TEST(Test_ObservablePoint_ConstructionDoesNotNotify);
    RUN_TEST(Test_ObservablePoint_SetTwiceNotifiesOnce);
    RUN_TEST(Test_ObservablePoint_SetSingleComponentChangeNotifiesOnce);
    RUN_TEST(Test_ObservablePoint_SetSingleValue);
    RUN_TEST(Test_ObservablePoint_ComponentSetters);
    RUN_TEST(Test_ObservablePoint_CopyFromUsesSameDedupRule);
    RUN_TEST(Test_ObservablePoint_CopyToPlainPoint);
    RUN_TEST(Test_ObservablePoint_CopyToObservableTarget);
    RUN_TEST(Test_ObservablePoint_CloneBindsToNewObserver);
    RUN_TEST(Test_ObservablePoint_NullObserverRejected);
    RUN_TEST(Test_ObservablePoint_NonFiniteInitialValueRejected);
    std::cout << std::endl;

    std::cout << "========================================" << std::endl;
    std::cout << "总测试数: " << g_testCount << std::endl;
    std::cout << "通过: " << g_passedCount << std::endl;
    std::cout << "失败: " << g_failedCount << std::endl;
    std::cout << "========================================" << std::endl;

    return g_failedCount == 0 ? 0 : 1;
}
