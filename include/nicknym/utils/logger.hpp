#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <fstream>
#include <mutex>
#include <map>
#include <memory>
#include <vector>
#include <chrono>
#include <iomanip>
#include <nlohmann/json.hpp>

namespace nicknym {
namespace utils {

// 日志级别
enum class LogLevel : int {
    Fatal = 0,
    Error = 1,
    Warn  = 2,
    Info  = 3,
    Debug = 4
};

// 日志配置
struct LoggingConfig {
    std::string level  = "info";
    std::string format = "text";     // json 或 text
    std::string output = "console";  // console 或 file
    std::string file   = "nicknym.log";
};

// 获取当前时间字符串
std::string GetTimeString();

// 日志条目
struct LogEntry {
    LogLevel level;
    std::string message;
    std::string time;
    std::map<std::string, std::string> fields;
};

// 日志格式化器接口
class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string Format(const LogEntry& entry) = 0;
};

class JSONFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

class TextFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

// 日志输出接口
class LogOutput {
public:
    virtual ~LogOutput() = default;
    virtual void Write(const std::string& message) = 0;
};

// 输出到stderr，stdout留给命令的结果
class ConsoleOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
};

class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    void Write(const std::string& message) override;

private:
    std::ofstream file_;
};

// 内存输出，测试中用来检查日志内容
class MemoryOutput : public LogOutput {
public:
    void Write(const std::string& message) override;
    std::vector<std::string> Lines() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// 日志上下文字段
class LogContext {
public:
    LogContext() = default;

    const std::map<std::string, std::string>& Fields() const { return fields_; }

    // 返回带新字段的副本，便于链式调用
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

class Logger {
public:
    static Logger& GetInstance();

    void Initialize(const LoggingConfig& config);

    void SetLevel(LogLevel level);
    void SetLevel(const std::string& level);
    LogLevel GetLevel() const;

    // 替换所有输出
    void SetOutput(std::unique_ptr<LogOutput> output);
    void AddOutput(std::unique_ptr<LogOutput> output);
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Log(LogLevel level, const std::string& message, const LogContext& ctx = LogContext());

    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());
    void Fatal(const std::string& message, const LogContext& ctx = LogContext());

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool shouldLog(LogLevel level) const;

    LogLevel level_ = LogLevel::Info;
    std::vector<std::unique_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    mutable std::mutex mutex_;
};

inline Logger& GetLogger() {
    return Logger::GetInstance();
}

LogLevel ParseLogLevel(const std::string& level);
std::string LogLevelToString(LogLevel level);

} // namespace utils
} // namespace nicknym
