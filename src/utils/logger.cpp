#include "nicknym/utils/logger.hpp"
#include <ctime>

namespace nicknym {
namespace utils {

std::string GetTimeString() {
    auto now = std::chrono::system_clock::now();
    auto nowTime = std::chrono::system_clock::to_time_t(now);
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm nowTm;
    localtime_r(&nowTime, &nowTm);

    std::stringstream ss;
    ss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
    return ss.str();
}

LogLevel ParseLogLevel(const std::string& level) {
    if (level == "debug" || level == "DEBUG") return LogLevel::Debug;
    if (level == "info" || level == "INFO") return LogLevel::Info;
    if (level == "warn" || level == "WARN" || level == "warning" || level == "WARNING") return LogLevel::Warn;
    if (level == "error" || level == "ERROR") return LogLevel::Error;
    if (level == "fatal" || level == "FATAL") return LogLevel::Fatal;

    // 默认为Info级别
    return LogLevel::Info;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string JSONFormatter::Format(const LogEntry& entry) {
    nlohmann::json j = {
        {"level", LogLevelToString(entry.level)},
        {"time", entry.time},
        {"msg", entry.message}
    };

    for (const auto& field : entry.fields) {
        j[field.first] = field.second;
    }

    return j.dump();
}

std::string TextFormatter::Format(const LogEntry& entry) {
    std::stringstream ss;
    ss << "[" << entry.time << "] "
       << "[" << LogLevelToString(entry.level) << "] "
       << entry.message;

    if (!entry.fields.empty()) {
        ss << " {";
        bool first = true;
        for (const auto& field : entry.fields) {
            if (!first) ss << ", ";
            ss << field.first << "=" << field.second;
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void ConsoleOutput::Write(const std::string& message) {
    std::cerr << message << std::endl;
}

FileOutput::FileOutput(const std::string& filename) {
    file_.open(filename, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "无法打开日志文件: " << filename << std::endl;
    }
}

void FileOutput::Write(const std::string& message) {
    if (file_.is_open()) {
        file_ << message << std::endl;
        file_.flush();
    }
}

void MemoryOutput::Write(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(message);
}

std::vector<std::string> MemoryOutput::Lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

LogContext LogContext::With(const std::string& key, const std::string& value) const {
    LogContext ctx = *this;
    ctx.fields_[key] = value;
    return ctx;
}

Logger::Logger() {
    outputs_.push_back(std::make_unique<ConsoleOutput>());
    formatter_ = std::make_unique<TextFormatter>();
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize(const LoggingConfig& config) {
    SetLevel(config.level);

    if (config.format == "json") {
        SetFormatter(std::make_unique<JSONFormatter>());
    } else {
        SetFormatter(std::make_unique<TextFormatter>());
    }

    if (config.output == "file" && !config.file.empty()) {
        SetOutput(std::make_unique<FileOutput>(config.file));
    } else {
        SetOutput(std::make_unique<ConsoleOutput>());
    }
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetLevel(const std::string& level) {
    SetLevel(ParseLogLevel(level));
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::SetOutput(std::unique_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.clear();
    outputs_.push_back(std::move(output));
}

void Logger::AddOutput(std::unique_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.push_back(std::move(output));
}

void Logger::SetFormatter(std::unique_ptr<LogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

void Logger::Log(LogLevel level, const std::string& message, const LogContext& ctx) {
    if (!shouldLog(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.time = GetTimeString();
    entry.fields = ctx.Fields();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!formatter_) return;
    std::string formatted = formatter_->Format(entry);
    for (auto& output : outputs_) {
        output->Write(formatted);
    }
}

void Logger::Debug(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Debug, message, ctx);
}

void Logger::Info(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Info, message, ctx);
}

void Logger::Warn(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Warn, message, ctx);
}

void Logger::Error(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Error, message, ctx);
}

void Logger::Fatal(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Fatal, message, ctx);
}

bool Logger::shouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) <= static_cast<int>(level_);
}

} // namespace utils
} // namespace nicknym
