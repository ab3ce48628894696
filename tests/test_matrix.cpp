/**
 * @file test_matrix.cpp
 * @brief Matrix 单元测试
 *
 * 运算结果与 Eigen 的 3x3 矩阵乘法对照
 */

#include "affine/matrix.h"
#include "affine/math_utils.h"
#include "affine/error.h"
#include "affine/logger.h"
#include <iostream>
#include <cmath>
#include <vector>

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

static bool PointNear(const Point& p, Real x, Real y, Real eps = 1e-9) {
    return MathUtils::NearlyEqual(p.x, x, eps) && MathUtils::NearlyEqual(p.y, y, eps);
}

static bool EigenNear(const Matrix3& lhs, const Matrix3& rhs, Real eps = 1e-9) {
    return (lhs - rhs).cwiseAbs().maxCoeff() <= eps;
}

static const std::vector<Matrix>& SampleMatrices() {
    static const std::vector<Matrix> samples = {
        Matrix(),
        Matrix(1, 2, 3, 4, 5, 6),
        Matrix(2, 0, 0, 0.5, -10, 20),
        Matrix(0.8, 0.6, -0.6, 0.8, 3, -7),
        Matrix(-1.5, 0.25, 0.75, 2, 100, 50)
    };
    return samples;
}

// ============================================================================
// 构造与应用
// ============================================================================

bool Test_DefaultIsIdentity() {
    Matrix m;
    TEST_ASSERT(m.IsIdentity(), "默认构造应为单位矩阵");
    TEST_ASSERT(Matrix::IdentityMatrix().IsIdentity(), "共享单位矩阵应为单位矩阵");
    TEST_ASSERT(m == Matrix::IdentityMatrix(), "两者应该相等");
    return true;
}

bool Test_IdentityApplyKeepsPoint() {
    Matrix m;
    const Point points[] = {Point(0, 0), Point(1.5, -2.5), Point(-1000, 1e6)};
    for (const Point& p : points) {
        TEST_ASSERT(m.Apply(p) == p, "单位矩阵应用后点不变");
    }
    return true;
}

bool Test_TranslateMovesOrigin() {
    Matrix m;
    m.Translate(10, 5);
    TEST_ASSERT(m.Apply(Point(0, 0)) == Point(10, 5), "原点应被平移到 (10, 5)");
    TEST_ASSERT(m.a == 1 && m.b == 0 && m.c == 0 && m.d == 1, "平移不改变线性部分");
    return true;
}

bool Test_RotateQuarterTurn() {
    Matrix m;
    m.Rotate(MathUtils::HALF_PI);
    TEST_ASSERT(PointNear(m.Apply(Point(1, 0)), 0, 1), "(1,0) 旋转 90 度应为 (0,1)");
    return true;
}

bool Test_ScaleAlsoScalesTranslation() {
    Matrix m(1, 0, 0, 1, 2, 3);
    m.Scale(2, 4);
    TEST_ASSERT(m == Matrix(2, 0, 0, 4, 4, 12), "缩放应同时作用于平移分量");
    return true;
}

bool Test_OperationsChain() {
    Matrix m;
    m.Translate(1, 2).Scale(2, 2);
    TEST_ASSERT(m.tx == 2 && m.ty == 4, "链式调用应按顺序生效");
    return true;
}

bool Test_RotateMatchesEigen() {
    const Real angle = 0.7;
    Matrix3 rotation;
    rotation << std::cos(angle), -std::sin(angle), 0,
                std::sin(angle),  std::cos(angle), 0,
                0, 0, 1;

    for (const Matrix& sample : SampleMatrices()) {
        Matrix m = sample.Clone();
        m.Rotate(angle);
        TEST_ASSERT(EigenNear(m.ToEigen(), rotation * sample.ToEigen()), "Rotate 应等价于左乘旋转矩阵");
    }
    return true;
}

bool Test_ApplyOutParameterAllowsAliasing() {
    Matrix m(2, 0, 0, 3, 1, 1);
    Point p(1, 1);
    m.Apply(p, p);
    TEST_ASSERT(p == Point(3, 4), "输入输出为同一个点时结果仍正确");

    m.ApplyInverse(p, p);
    TEST_ASSERT(PointNear(p, 1, 1), "逆变换也允许别名");
    return true;
}

// ============================================================================
// 组合
// ============================================================================

bool Test_AppendAppliesArgumentFirst() {
    for (const Matrix& lhs : SampleMatrices()) {
        for (const Matrix& rhs : SampleMatrices()) {
            Matrix m = lhs.Clone();
            m.Append(rhs);
            TEST_ASSERT(EigenNear(m.ToEigen(), lhs.ToEigen() * rhs.ToEigen()), "Append 应等价于 this * other");

            const Point p(3, -4);
            TEST_ASSERT(PointNear(m.Apply(p), lhs.Apply(rhs.Apply(p)).x, lhs.Apply(rhs.Apply(p)).y),
                        "Append 后应先应用参数矩阵");
        }
    }
    return true;
}

bool Test_PrependAppliesThisFirst() {
    for (const Matrix& lhs : SampleMatrices()) {
        for (const Matrix& rhs : SampleMatrices()) {
            Matrix m = lhs.Clone();
            m.Prepend(rhs);
            TEST_ASSERT(EigenNear(m.ToEigen(), rhs.ToEigen() * lhs.ToEigen()), "Prepend 应等价于 other * this");
        }
    }
    return true;
}

bool Test_PrependTranslationOnly() {
    Matrix m(1, 2, 3, 4, 5, 6);
    m.Prepend(Matrix(1, 0, 0, 1, 10, 20));
    TEST_ASSERT(m == Matrix(1, 2, 3, 4, 15, 26), "纯平移矩阵只影响 tx/ty");
    return true;
}

// ============================================================================
// 求逆
// ============================================================================

bool Test_ApplyInverseRoundTrip() {
    const Point points[] = {Point(0, 0), Point(12.5, -3), Point(-7, 42)};
    for (const Matrix& m : SampleMatrices()) {
        for (const Point& p : points) {
            Point back = m.ApplyInverse(m.Apply(p));
            TEST_ASSERT(PointNear(back, p.x, p.y, 1e-7), "ApplyInverse(Apply(p)) 应还原 p");
        }
    }
    return true;
}

bool Test_InvertTwiceRestores() {
    for (const Matrix& m : SampleMatrices()) {
        Matrix copy = m.Clone();
        copy.Invert().Invert();
        TEST_ASSERT(copy.IsApprox(m, 1e-9), "求逆两次应还原原矩阵");

        Matrix inverse = m.Clone();
        inverse.Invert();
        TEST_ASSERT(EigenNear(inverse.ToEigen() * m.ToEigen(), Matrix3::Identity()), "逆矩阵乘原矩阵应为单位矩阵");
    }
    return true;
}

bool Test_DegenerateInvertThrowsAndKeepsMatrix() {
    Matrix m(1, 2, 2, 4, 7, 8);
    TEST_ASSERT(m.Determinant() == 0, "测试矩阵应该是奇异的");

    bool thrown = false;
    try {
        m.Invert();
    } catch (const AffineError& e) {
        thrown = true;
        TEST_ASSERT(e.GetCode() == ErrorCode::TransformDegenerateMatrix, "错误码应该是 TransformDegenerateMatrix");
    }
    TEST_ASSERT(thrown, "奇异矩阵求逆应该抛出异常");
    TEST_ASSERT(m == Matrix(1, 2, 2, 4, 7, 8), "抛出异常后矩阵应保持不变");
    return true;
}

bool Test_DegenerateApplyInverseThrows() {
    Matrix m(0, 0, 0, 0, 1, 1);
    bool thrown = false;
    try {
        Point p = m.ApplyInverse(Point(1, 1));
        (void)p;
    } catch (const AffineError& e) {
        thrown = true;
        TEST_ASSERT(e.GetCategory() == ErrorCategory::Transform, "类别应该是 Transform");
    }
    TEST_ASSERT(thrown, "奇异矩阵的 ApplyInverse 应该抛出异常");
    return true;
}

bool Test_TryInvertReportsFailure() {
    auto& handler = ErrorHandler::GetInstance();
    handler.ResetStats();

    Matrix m(2, 4, 1, 2, 0, 0);
    Result result = m.TryInvert();
    TEST_ASSERT(result.Failed(), "奇异矩阵 TryInvert 应该失败");
    TEST_ASSERT(result.code == ErrorCode::TransformDegenerateMatrix, "错误码应该是 TransformDegenerateMatrix");
    TEST_ASSERT(m == Matrix(2, 4, 1, 2, 0, 0), "失败后矩阵保持不变");
    TEST_ASSERT(handler.GetStats().warningCount == 1, "失败应该作为警告上报");

    Matrix ok(2, 0, 0, 2, 4, 4);
    Result okResult = ok.TryInvert();
    TEST_ASSERT(okResult.Ok(), "可逆矩阵 TryInvert 应该成功");
    TEST_ASSERT(ok.IsApprox(Matrix(0.5, 0, 0, 0.5, -2, -2), 1e-12), "逆矩阵应该正确");
    return true;
}

// ============================================================================
// 数组与 Eigen 互操作
// ============================================================================

bool Test_ToArrayRowMajor() {
    Matrix m(1, 2, 3, 4, 5, 6);
    float out[9];
    for (float& v : out) {
        v = -1.0f;
    }
    m.ToArray(false, out);

    const float expected[9] = {1, 3, 5, 2, 4, 6, 0, 0, 1};
    for (int i = 0; i < 9; ++i) {
        TEST_ASSERT(out[i] == expected[i], "行主序布局应为 [a c tx; b d ty; 0 0 1]");
    }
    return true;
}

bool Test_ToArrayTransposed() {
    Matrix m(1, 2, 3, 4, 5, 6);
    std::array<float, 9> out = m.ToArray(true);

    const float expected[9] = {1, 2, 0, 3, 4, 0, 5, 6, 1};
    for (int i = 0; i < 9; ++i) {
        TEST_ASSERT(out[i] == expected[i], "转置布局应为列主序");
    }
    return true;
}

bool Test_ToArrayNullBufferThrows() {
    Matrix m;
    bool thrown = false;
    try {
        m.ToArray(false, static_cast<float*>(nullptr));
    } catch (const AffineError& e) {
        thrown = true;
        TEST_ASSERT(e.GetCode() == ErrorCode::NullPointer, "错误码应该是 NullPointer");
    }
    TEST_ASSERT(thrown, "空缓冲区应该抛出异常");
    return true;
}

bool Test_FromArrayMapping() {
    const Real array[6] = {1, 2, 5, 3, 4, 6};
    Matrix m = Matrix::FromArray(array);
    TEST_ASSERT(m == Matrix(1, 2, 3, 4, 5, 6), "FromArray 读取 a=[0] b=[1] tx=[2] c=[3] d=[4] ty=[5]");
    return true;
}

bool Test_EigenRoundTrip() {
    for (const Matrix& m : SampleMatrices()) {
        TEST_ASSERT(Matrix::FromEigen(m.ToEigen()) == m, "FromEigen(ToEigen()) 应还原矩阵");

        const Point p(2, -5);
        Vector2 v = m.ToEigenAffine() * p.ToVector();
        TEST_ASSERT(PointNear(Point::FromVector(v), m.Apply(p).x, m.Apply(p).y), "Eigen 仿射变换应与 Apply 一致");
    }
    return true;
}

// ============================================================================
// 辅助方法
// ============================================================================

bool Test_CopyAndIdentity() {
    Matrix source(1, 2, 3, 4, 5, 6);
    Matrix target;
    source.CopyTo(target);
    TEST_ASSERT(target == source, "CopyTo 应复制全部分量");

    Matrix other;
    other.CopyFrom(source);
    TEST_ASSERT(other == source, "CopyFrom 应复制全部分量");

    other.SetIdentity();
    TEST_ASSERT(other.IsIdentity(), "SetIdentity 后应为单位矩阵");
    TEST_ASSERT(source == Matrix(1, 2, 3, 4, 5, 6), "复制目标的修改不影响源矩阵");
    return true;
}

bool Test_DebugStringListsComponents() {
    Matrix m(1, 2, 3, 4, 5, 6);
    std::string text = m.DebugString();
    TEST_ASSERT(!text.empty(), "DebugString 不应为空");
    TEST_ASSERT(text.find('5') != std::string::npos, "DebugString 应包含 tx");
    return true;
}

// ============================================================================
// 主函数
// ============================================================================

int main() {
    Logger::GetInstance().SetLogLevel(LogLevel::Error);

    std::cout << "========================================" << std::endl;
    std::cout << "Matrix 测试" << std::endl;
    std::cout << "========================================" << std::endl;

    std::cout << "--- 构造与应用 ---" << std::endl;
    RUN_TEST(Test_DefaultIsIdentity);
    RUN_TEST(Test_IdentityApplyKeepsPoint);
    RUN_TEST(Test_TranslateMovesOrigin);
    RUN_TEST(Test_RotateQuarterTurn);
    RUN_TEST(Test_ScaleAlsoScalesTranslation);
    RUN_TEST(Test_OperationsChain);
    RUN_TEST(Test_RotateMatchesEigen);
    RUN_TEST(Test_ApplyOutParameterAllowsAliasing);
    std::cout << std::endl;

    std::cout << "--- 组合 ---" << std::endl;
    RUN_TEST(Test_AppendAppliesArgumentFirst);
    RUN_TEST(Test_PrependAppliesThisFirst);
    RUN_TEST(Test_PrependTranslationOnly);
    std::cout << std::endl;

    std::cout << "--- 求逆 ---" << std::endl;
    RUN_TEST(Test_ApplyInverseRoundTrip);
    RUN_TEST(Test_InvertTwiceRestores);
    RUN_TEST(Test_DegenerateInvertThrowsAndKeepsMatrix);
    RUN_TEST(Test_DegenerateApplyInverseThrows);
    RUN_TEST(Test_TryInvertReportsFailure);
    std::cout << std::endl;

    std::cout << "--- 数组与 Eigen ---" << std::endl;
    RUN_TEST(Test_ToArrayRowMajor);
    RUN_TEST(Test_ToArrayTransposed);
    RUN_TEST(Test_ToArrayNullBufferThrows);
    RUN_TEST(Test_FromArrayMapping);
    RUN_TEST(Test_EigenRoundTrip);
    std::cout << std::endl;

    std::cout << "--- 辅助方法 ---" << std::endl;
    RUN_TEST(Test_CopyAndIdentity);
    RUN_TEST(Test_DebugStringListsComponents);
    std::cout << std::endl;

    std::cout << "========================================" << std::endl;
    std::cout << "总测试数: " << g_testCount << std::endl;
    std::cout << "通过: " << g_passedCount << std::endl;
    std::cout << "失败: " << g_failedCount << std::endl;
    std::cout << "========================================" << std::endl;

    return g_failedCount == 0 ? 0 : 1;
}
