#pragma once

#include <string>
#include <exception>
#include <functional>
#include <source_location>
#include <atomic>
#include <mutex>
#include <vector>

namespace Affine {

/**
 * @brief 错误严重程度
 */
enum class ErrorSeverity {
    Info,       // 信息
    Warning,    // 警告（可恢复）
    Error,      // 错误（可能可恢复）
    Critical    // 严重错误（不可恢复）
};

/**
 * @brief 错误类别
 */
enum class ErrorCategory {
    // IO 错误 (5000-5999)
    IO = 5000,

    // 变换错误 (7000-7999)
    Transform = 7000,

    // 序列化错误 (8000-8999)
    Serialization = 8000,

    // 通用错误 (9000-9999)
    Generic = 9000
};

/**
 * @brief 错误码
 */
enum class ErrorCode {
    Success = 0,

    // IO 错误 (5000-5999)
    FileNotFound = 5000,
    FileWriteFailed,

    // 变换错误 (7000-7999)
    TransformDegenerateMatrix = 7000,   // 行列式为 0，无法求逆
    TransformMissingParent,             // 非根节点更新时没有父变换
    TransformInvalidMatrix,             // 矩阵包含 NaN 或 Inf
    PointObserverMissing,               // ObservablePoint 没有观察者

    // 序列化错误 (8000-8999)
    JsonParseFailed = 8000,
    JsonInvalidFormat,

    // 通用错误 (9000-9999)
    InvalidArgument = 9000,
    NullPointer,
    InvalidState,
    OperationFailed,
    Unknown = 9999
};

/**
 * @brief 变换库错误基类
 *
 * 包含错误码、消息、严重程度和源位置信息
 */
class AffineError : public std::exception {
public:
    /**
     * @brief 构造错误
     * @param code 错误码
     * @param message 错误消息
     * @param severity 严重程度（默认为 Error）
     * @param location 源代码位置（自动捕获）
     */
    AffineError(ErrorCode code,
                const std::string& message,
                ErrorSeverity severity = ErrorSeverity::Error,
                std::source_location location = std::source_location::current());

    const char* what() const noexcept override {
        return m_fullMessage.c_str();
    }

    ErrorCode GetCode() const { return m_code; }
    ErrorCategory GetCategory() const { return m_category; }
    ErrorSeverity GetSeverity() const { return m_severity; }

    /**
     * @brief 获取用户消息
     */
    const std::string& GetMessage() const { return m_message; }

    /**
     * @brief 获取完整消息（包含位置信息）
     */
    const std::string& GetFullMessage() const { return m_fullMessage; }

    const std::string& GetFile() const { return m_file; }
    int GetLine() const { return m_line; }
    const std::string& GetFunction() const { return m_function; }

    /**
     * @brief 从错误码获取类别（按数值区间划分）
     */
    static ErrorCategory GetCategoryFromCode(ErrorCode code);

private:
    ErrorCode m_code;
    ErrorCategory m_category;
    ErrorSeverity m_severity;
    std::string m_message;       // 用户消息
    std::string m_fullMessage;   // 完整消息（包含位置信息）
    std::string m_file;
    std::string m_function;
    int m_line;

    static std::string FormatMessage(ErrorCode code,
                                     const std::string& message,
                                     ErrorSeverity severity,
                                     const std::string& file,
                                     const std::string& function,
                                     int line);
};

/**
 * @brief 显式错误检查接口的结果类型
 *
 * Try* 系列函数不抛出异常，而是返回 Result
 */
struct Result {
    ErrorCode code;
    std::string message;

    explicit operator bool() const { return code == ErrorCode::Success; }

    bool Ok() const { return code == ErrorCode::Success; }
    bool Failed() const { return code != ErrorCode::Success; }

    static Result Success() {
        return {ErrorCode::Success, ""};
    }

    static Result Failure(ErrorCode errorCode, const std::string& errorMessage) {
        return {errorCode, errorMessage};
    }
};

/**
 * @brief 错误处理回调函数类型
 */
using ErrorCallback = std::function<void(const AffineError&)>;

/**
 * @brief 错误处理器（单例）
 *
 * 提供全局错误处理机制：
 * - 错误回调系统（默认回调写入 Logger）
 * - 错误统计
 * - 最大错误数限制
 */
class ErrorHandler {
public:
    static ErrorHandler& GetInstance();

    // 禁止拷贝和移动
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;
    ErrorHandler(ErrorHandler&&) = delete;
    ErrorHandler& operator=(ErrorHandler&&) = delete;

    /**
     * @brief 处理错误
     *
     * 更新统计，并按添加顺序调用所有回调
     * @param error 错误对象
     */
    void Handle(const AffineError& error);

    /**
     * @brief 添加错误回调
     * @param callback 回调函数
     * @return 回调ID（用于移除）
     */
    size_t AddCallback(ErrorCallback callback);

    void RemoveCallback(size_t id);

    void SetEnabled(bool enable) {
        m_enabled.store(enable, std::memory_order_release);
    }

    bool IsEnabled() const {
        return m_enabled.load(std::memory_order_acquire);
    }

    struct ErrorStats {
        size_t infoCount = 0;
        size_t warningCount = 0;
        size_t errorCount = 0;
        size_t criticalCount = 0;
        size_t totalCount = 0;
    };

    ErrorStats GetStats() const;

    void ResetStats();

    /**
     * @brief 设置最大错误数量
     *
     * 当错误数量超过此值时，停止处理新错误
     * @param maxErrors 最大错误数量（0 = 无限制）
     */
    void SetMaxErrors(size_t maxErrors) {
        m_maxErrors.store(maxErrors, std::memory_order_release);
    }

private:
    ErrorHandler();
    ~ErrorHandler() = default;

    struct CallbackEntry {
        size_t id;
        ErrorCallback callback;
    };
    std::vector<CallbackEntry> m_callbacks;
    size_t m_nextCallbackId = 1;
    mutable std::mutex m_callbackMutex;

    // 错误统计
    std::atomic<size_t> m_infoCount{0};
    std::atomic<size_t> m_warningCount{0};
    std::atomic<size_t> m_errorCount{0};
    std::atomic<size_t> m_criticalCount{0};
    std::atomic<size_t> m_totalCount{0};

    // 配置
    std::atomic<bool> m_enabled{true};
    std::atomic<size_t> m_maxErrors{1000};

    void UpdateStats(ErrorSeverity severity);
};

// ============================================================================
// 便捷宏
// ============================================================================

/**
 * @brief 创建错误对象
 *
 * 使用方法：
 * throw AFFINE_ERROR(ErrorCode::TransformDegenerateMatrix, "行列式为 0");
 */
#define AFFINE_ERROR(code, msg) \
    Affine::AffineError(code, msg, Affine::ErrorSeverity::Error)

#define AFFINE_WARNING(code, msg) \
    Affine::AffineError(code, msg, Affine::ErrorSeverity::Warning)

#define AFFINE_CRITICAL(code, msg) \
    Affine::AffineError(code, msg, Affine::ErrorSeverity::Critical)

/**
 * @brief 前置条件检查宏（条件不满足时抛出异常）
 *
 * 使用方法：
 * AFFINE_ASSERT(std::isfinite(x), "坐标必须是有限值");
 */
#define AFFINE_ASSERT(condition, msg) \
    do { \
        if (!(condition)) { \
            throw AFFINE_ERROR(Affine::ErrorCode::InvalidArgument, \
                             std::string("断言失败: ") + #condition + " - " + (msg)); \
        } \
    } while(0)

/**
 * @brief 处理错误（不抛出异常，只记录）
 */
#define HANDLE_ERROR(error) \
    Affine::ErrorHandler::GetInstance().Handle(error)

// ============================================================================
// 辅助函数
// ============================================================================

const char* ErrorCodeToString(ErrorCode code);
const char* ErrorSeverityToString(ErrorSeverity severity);
const char* ErrorCategoryToString(ErrorCategory category);

} // namespace Affine
