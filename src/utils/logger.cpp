#include "affine/logger.h"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <vector>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace Affine {

namespace {

std::tm LocalTime(std::time_t time) {
    std::tm timeInfo;
#ifdef _WIN32
    localtime_s(&timeInfo, &time);
#else
    localtime_r(&time, &timeInfo);
#endif
    return timeInfo;
}

// pattern 为 put_time 格式，separator 之后追加毫秒
std::string Timestamp(const char* pattern, char separator) {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm timeInfo = LocalTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream oss;
    oss << std::put_time(&timeInfo, pattern)
        << separator << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

const char* ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "\033[36m";  // 青色
        case LogLevel::Info:    return "\033[32m";  // 绿色
        case LogLevel::Warning: return "\033[33m";  // 黄色
        case LogLevel::Error:   return "\033[31m";  // 红色
    }
    return "";
}

std::string FormatArgs(const char* format, va_list args) {
    char buffer[512];
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = vsnprintf(buffer, sizeof(buffer), format, argsCopy);
    va_end(argsCopy);

    if (size < 0) {
        return "[格式化错误]";
    }
    if (size < static_cast<int>(sizeof(buffer))) {
        return std::string(buffer, size);
    }

    std::vector<char> dynamicBuffer(size + 1);
    vsnprintf(dynamicBuffer.data(), dynamicBuffer.size(), format, args);
    return std::string(dynamicBuffer.data(), size);
}

// logs/app.log 第 n 次轮转 -> logs/app_n.log
std::string RotatedName(const std::string& base, int index) {
    std::filesystem::path path(base);
    std::filesystem::path rotated = path.parent_path() /
        (path.stem().string() + "_" + std::to_string(index) + path.extension().string());
    return rotated.string();
}

} // namespace

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
}

// ============================================================================
// 配置
// ============================================================================

void Logger::SetLogLevel(LogLevel level) {
    m_logLevel.store(level, std::memory_order_release);
}

LogLevel Logger::GetLogLevel() const {
    return m_logLevel.load(std::memory_order_acquire);
}

void Logger::SetLogToConsole(bool enable) {
    m_logToConsole.store(enable, std::memory_order_release);
}

void Logger::SetColorOutput(bool enable) {
    m_colorOutput.store(enable, std::memory_order_release);
}

void Logger::SetLogDirectory(const std::string& directory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_logDirectory = directory;
}

void Logger::SetMaxFileSize(size_t maxSize) {
    m_maxFileSize.store(maxSize, std::memory_order_release);
}

void Logger::SetLogCallback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback = std::move(callback);
}

void Logger::SetLogToFile(bool enable, const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
    m_rotationIndex = 0;
    m_currentFileSize = 0;
    m_baseLogFile.clear();
    m_currentLogFile.clear();

    if (!enable) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_logDirectory, ec);
    if (ec) {
        std::cerr << "[Logger] Failed to create log directory " << m_logDirectory
                  << ": " << ec.message() << std::endl;
        return;
    }

    const std::string name = filename.empty()
        ? "affine_" + Timestamp("%Y%m%d_%H%M%S", '_') + ".log"
        : filename;
    m_baseLogFile = (std::filesystem::path(m_logDirectory) / name).string();
    OpenLogFile(m_baseLogFile);
}

std::string Logger::GetCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_currentLogFile;
}

// ============================================================================
// 输出
// ============================================================================

void Logger::Log(LogLevel level, const std::string& message) {
    if (!IsEnabled(level)) {
        return;
    }

    std::string line = "[" + Timestamp("%Y-%m-%d %H:%M:%S", '.') + "] [" + LevelName(level) + "] " + message;

    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        WriteLine(level, line);
        callback = m_callback;
    }

    // 不持有锁，回调可以再次写日志
    if (callback) {
        try {
            callback(level, line);
        } catch (const std::exception& e) {
            std::cerr << "[Logger] Log callback threw: " << e.what() << std::endl;
        }
    }
}

void Logger::LogV(LogLevel level, const char* format, va_list args) {
    if (!IsEnabled(level)) {
        return;
    }
    Log(level, FormatArgs(format, args));
}

void Logger::LogFormat(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(level, format, args);
    va_end(args);
}

void Logger::DebugFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Debug, format, args);
    va_end(args);
}

void Logger::InfoFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Info, format, args);
    va_end(args);
}

void Logger::WarningFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Warning, format, args);
    va_end(args);
}

void Logger::ErrorFormat(const char* format, ...) {
    va_list args;
    va_start(args, format);
    LogV(LogLevel::Error, format, args);
    va_end(args);
}

void Logger::WriteLine(LogLevel level, const std::string& line) {
    if (m_logToConsole.load(std::memory_order_acquire)) {
        const bool color = m_colorOutput.load(std::memory_order_acquire);
        std::ostream& out = (level == LogLevel::Error) ? std::cerr : std::cout;
        if (color) {
            out << ColorCode(level) << line << "\033[0m" << std::endl;
        } else {
            out << line << std::endl;
        }
    }

    if (!m_fileStream.is_open()) {
        return;
    }

    RotateIfNeeded();
    if (m_fileStream.is_open()) {
        m_fileStream << line << '\n';
        m_fileStream.flush();
        m_currentFileSize += line.size() + 1;
    }
}

void Logger::OpenLogFile(const std::string& path) {
    m_fileStream.open(path, std::ios::out | std::ios::trunc);
    if (!m_fileStream.is_open()) {
        std::cerr << "[Logger] Failed to open log file " << path << std::endl;
        m_currentLogFile.clear();
        m_currentFileSize = 0;
        return;
    }

    m_currentLogFile = path;
    const std::string header = "# Affine log " + Timestamp("%Y-%m-%d %H:%M:%S", '.');
    m_fileStream << header << '\n';
    m_fileStream.flush();
    m_currentFileSize = header.size() + 1;
}

void Logger::RotateIfNeeded() {
    const size_t maxSize = m_maxFileSize.load(std::memory_order_acquire);
    if (maxSize == 0 || m_currentFileSize < maxSize) {
        return;
    }

    m_fileStream.close();
    // 序号递增，轮转不会覆盖本次会话已写过的文件
    OpenLogFile(RotatedName(m_baseLogFile, ++m_rotationIndex));
}

} // namespace Affine
