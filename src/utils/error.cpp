#include "affine/error.h"
#include "affine/logger.h"
#include <sstream>
#include <algorithm>

namespace Affine {

// ============================================================================
// AffineError 实现
// ============================================================================

AffineError::AffineError(ErrorCode code,
                         const std::string& message,
                         ErrorSeverity severity,
                         std::source_location location)
    : m_code(code)
    , m_category(GetCategoryFromCode(code))
    , m_severity(severity)
    , m_message(message)
    , m_file(location.file_name())
    , m_function(location.function_name())
    , m_line(static_cast<int>(location.line()))
{
    m_fullMessage = FormatMessage(code, message, severity, m_file, m_function, m_line);
}

ErrorCategory AffineError::GetCategoryFromCode(ErrorCode code) {
    int codeValue = static_cast<int>(code);

    if (codeValue >= 5000 && codeValue < 6000) {
        return ErrorCategory::IO;
    } else if (codeValue >= 7000 && codeValue < 8000) {
        return ErrorCategory::Transform;
    } else if (codeValue >= 8000 && codeValue < 9000) {
        return ErrorCategory::Serialization;
    } else {
        return ErrorCategory::Generic;
    }
}

std::string AffineError::FormatMessage(ErrorCode code,
                                       const std::string& message,
                                       ErrorSeverity severity,
                                       const std::string& file,
                                       const std::string& function,
                                       int line)
{
    std::ostringstream oss;

    // [严重程度] [类别] (错误码): 消息
    oss << "[" << ErrorSeverityToString(severity) << "] ";
    oss << "[" << ErrorCategoryToString(GetCategoryFromCode(code)) << "] ";
    oss << "(" << static_cast<int>(code) << "): ";
    oss << message;

    oss << " [" << file << ":" << line << " in " << function << "]";

    return oss.str();
}

// ============================================================================
// ErrorHandler 实现
// ============================================================================

ErrorHandler& ErrorHandler::GetInstance() {
    static ErrorHandler instance;
    return instance;
}

ErrorHandler::ErrorHandler() {
    // 默认添加一个日志回调
    AddCallback([](const AffineError& error) {
        auto& logger = Logger::GetInstance();

        switch (error.GetSeverity()) {
            case ErrorSeverity::Info:
                logger.Info(error.GetFullMessage());
                break;
            case ErrorSeverity::Warning:
                logger.Warning(error.GetFullMessage());
                break;
            case ErrorSeverity::Error:
                logger.Error(error.GetFullMessage());
                break;
            case ErrorSeverity::Critical:
                logger.Error("[CRITICAL] " + error.GetFullMessage());
                break;
        }
    });
}

void ErrorHandler::Handle(const AffineError& error) {
    if (!m_enabled.load(std::memory_order_acquire)) {
        return;
    }

    size_t maxErrors = m_maxErrors.load(std::memory_order_acquire);
    if (maxErrors > 0 && m_totalCount.load(std::memory_order_acquire) >= maxErrors) {
        return;
    }

    UpdateStats(error.GetSeverity());

    // 复制回调列表后再调用，回调内部可以安全地增删回调
    std::vector<CallbackEntry> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callbacks = m_callbacks;
    }

    for (const auto& entry : callbacks) {
        if (!entry.callback) {
            continue;
        }
        try {
            entry.callback(error);
        } catch (const std::exception& e) {
            // 不能再调用 Handle，否则可能无限递归
            Logger::GetInstance().ErrorFormat("[ErrorHandler] Callback %zu threw: %s",
                                              entry.id, e.what());
        }
    }
}

size_t ErrorHandler::AddCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);

    size_t id = m_nextCallbackId++;
    m_callbacks.push_back({id, std::move(callback)});

    return id;
}

void ErrorHandler::RemoveCallback(size_t id) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);

    m_callbacks.erase(
        std::remove_if(m_callbacks.begin(), m_callbacks.end(),
            [id](const CallbackEntry& entry) { return entry.id == id; }),
        m_callbacks.end()
    );
}

ErrorHandler::ErrorStats ErrorHandler::GetStats() const {
    ErrorStats stats;
    stats.infoCount = m_infoCount.load(std::memory_order_acquire);
    stats.warningCount = m_warningCount.load(std::memory_order_acquire);
    stats.errorCount = m_errorCount.load(std::memory_order_acquire);
    stats.criticalCount = m_criticalCount.load(std::memory_order_acquire);
    stats.totalCount = m_totalCount.load(std::memory_order_acquire);
    return stats;
}

void ErrorHandler::ResetStats() {
    m_infoCount.store(0, std::memory_order_release);
    m_warningCount.store(0, std::memory_order_release);
    m_errorCount.store(0, std::memory_order_release);
    m_criticalCount.store(0, std::memory_order_release);
    m_totalCount.store(0, std::memory_order_release);
}

void ErrorHandler::UpdateStats(ErrorSeverity severity) {
    m_totalCount.fetch_add(1, std::memory_order_acq_rel);

    switch (severity) {
        case ErrorSeverity::Info:
            m_infoCount.fetch_add(1, std::memory_order_acq_rel);
            break;
        case ErrorSeverity::Warning:
            m_warningCount.fetch_add(1, std::memory_order_acq_rel);
            break;
        case ErrorSeverity::Error:
            m_errorCount.fetch_add(1, std::memory_order_acq_rel);
            break;
        case ErrorSeverity::Critical:
            m_criticalCount.fetch_add(1, std::memory_order_acq_rel);
            break;
    }
}

// ============================================================================
// 辅助函数实现
// ============================================================================

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // IO 错误
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileWriteFailed: return "FileWriteFailed";

        // 变换错误
        case ErrorCode::TransformDegenerateMatrix: return "TransformDegenerateMatrix";
        case ErrorCode::TransformMissingParent: return "TransformMissingParent";
        case ErrorCode::TransformInvalidMatrix: return "TransformInvalidMatrix";
        case ErrorCode::PointObserverMissing: return "PointObserverMissing";

        // 序列化错误
        case ErrorCode::JsonParseFailed: return "JsonParseFailed";
        case ErrorCode::JsonInvalidFormat: return "JsonInvalidFormat";

        // 通用错误
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NullPointer: return "NullPointer";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::OperationFailed: return "OperationFailed";
        case ErrorCode::Unknown: return "Unknown";

        default: return "UnknownErrorCode";
    }
}

const char* ErrorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::Info: return "Info";
        case ErrorSeverity::Warning: return "Warning";
        case ErrorSeverity::Error: return "Error";
        case ErrorSeverity::Critical: return "Critical";
        default: return "Unknown";
    }
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::IO: return "IO";
        case ErrorCategory::Transform: return "Transform";
        case ErrorCategory::Serialization: return "Serialization";
        case ErrorCategory::Generic: return "Generic";
        default: return "Unknown";
    }
}

} // namespace Affine
