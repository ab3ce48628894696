#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <functional>
#include <atomic>
#include <cstdarg>

namespace Affine {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief 日志回调函数类型
 * @param level 日志级别
 * @param message 格式化后的完整日志行
 */
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/**
 * @brief 线程安全的日志系统（单例）
 *
 * 每一行格式为 "[YYYY-mm-dd HH:MM:SS.mmm] [LEVEL] message"，写入：
 * - 控制台（Error 写 stderr，其余写 stdout，可选 ANSI 颜色）
 * - 日志文件（可选），超过最大大小后轮转到 <name>_<序号><扩展名>
 * - 用户回调（可选）
 *
 * 回调在释放内部锁之后调用，回调中可以再次写日志；
 * 这些日志同样会触发回调，回调需要自己避免无限递归。
 */
class Logger {
public:
    static Logger& GetInstance();

    // ========== 配置 ==========
    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;
    void SetLogToConsole(bool enable);

    /**
     * @brief 启用/禁用控制台颜色输出（默认启用）
     */
    void SetColorOutput(bool enable);

    /**
     * @brief 设置日志目录（默认 "logs"），下一次 SetLogToFile 时生效
     */
    void SetLogDirectory(const std::string& directory);

    /**
     * @brief 启用/禁用文件输出
     * @param filename 日志目录下的文件名，为空时使用 affine_<时间戳>.log
     */
    void SetLogToFile(bool enable, const std::string& filename = "");

    /**
     * @brief 设置日志文件最大大小（字节），超过后轮转
     * @param maxSize 最大字节数，0表示不限制（默认0）
     */
    void SetMaxFileSize(size_t maxSize);

    /**
     * @brief 设置日志回调函数
     * @param callback 回调函数，nullptr表示取消回调
     */
    void SetLogCallback(LogCallback callback);

    /**
     * @brief 当前写入的日志文件路径，未启用文件输出时为空
     */
    std::string GetCurrentLogFile() const;

    // ========== 日志方法 ==========
    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message) { Log(LogLevel::Debug, message); }
    void Info(const std::string& message) { Log(LogLevel::Info, message); }
    void Warning(const std::string& message) { Log(LogLevel::Warning, message); }
    void Error(const std::string& message) { Log(LogLevel::Error, message); }

    // ========== 格式化日志方法（printf 风格） ==========
    void LogFormat(LogLevel level, const char* format, ...);
    void DebugFormat(const char* format, ...);
    void InfoFormat(const char* format, ...);
    void WarningFormat(const char* format, ...);
    void ErrorFormat(const char* format, ...);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool IsEnabled(LogLevel level) const {
        return level >= m_logLevel.load(std::memory_order_acquire);
    }

    void LogV(LogLevel level, const char* format, va_list args);

    // 以下函数要求调用者已持有 m_mutex
    void WriteLine(LogLevel level, const std::string& line);
    void OpenLogFile(const std::string& path);
    void RotateIfNeeded();

    std::atomic<LogLevel> m_logLevel{LogLevel::Info};
    std::atomic<bool> m_logToConsole{true};
    std::atomic<bool> m_colorOutput{true};
    std::atomic<size_t> m_maxFileSize{0};

    // 需要锁保护的资源
    std::ofstream m_fileStream;
    std::string m_logDirectory = "logs";
    std::string m_baseLogFile;      // SetLogToFile 打开的文件
    std::string m_currentLogFile;   // 轮转后的当前文件
    size_t m_currentFileSize = 0;
    int m_rotationIndex = 0;
    LogCallback m_callback;

    mutable std::mutex m_mutex;
};

// ========== 便捷宏 ==========
#define LOG_DEBUG(msg) Affine::Logger::GetInstance().Debug(msg)
#define LOG_INFO(msg) Affine::Logger::GetInstance().Info(msg)
#define LOG_WARNING(msg) Affine::Logger::GetInstance().Warning(msg)
#define LOG_ERROR(msg) Affine::Logger::GetInstance().Error(msg)

// ========== 格式化日志宏 ==========
#define LOG_DEBUG_F(fmt, ...) Affine::Logger::GetInstance().DebugFormat(fmt, ##__VA_ARGS__)
#define LOG_INFO_F(fmt, ...) Affine::Logger::GetInstance().InfoFormat(fmt, ##__VA_ARGS__)
#define LOG_WARNING_F(fmt, ...) Affine::Logger::GetInstance().WarningFormat(fmt, ##__VA_ARGS__)
#define LOG_ERROR_F(fmt, ...) Affine::Logger::GetInstance().ErrorFormat(fmt, ##__VA_ARGS__)

} // namespace Affine
