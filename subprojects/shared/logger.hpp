#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <optional>

// Fix Windows macro conflicts
#ifdef min
#undef min
#endif
#ifdef max
#undef max
#endif

// Usage:
//   auto logger = std::make_shared<Logger>("Coordinator");
//   logger->add_sink(std::make_shared<StdoutSink>());
//   logger->info("Task submitted: " + task_id);
// Every line is prefixed with the logger name so components sharing a sink
// remain distinguishable.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

/// Parse a case-insensitive level name ("debug", "info", "warn", ...).
inline std::optional<LogLevel> parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& source, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

protected:
    static std::string format(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << to_string(level) << "]";
        if (!source.empty()) oss << "[" << source << "]";
        oss << " " << message;
        return oss.str();
    }

    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO
};

class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (level < min_level_) return;
        // Loop, scheduler and health threads share this sink
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << format(level, source, message) << std::endl;
    }
private:
    std::mutex mutex_;
};

/// Captures formatted lines in memory; tests attach one to inspect output.
class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(format(level, source, message));
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    /// True if any captured line contains \p needle.
    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(lines_.begin(), lines_.end(),
                           [&](const std::string& line) { return line.find(needle) != std::string::npos; });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

class Logger {
public:
    Logger() : name_("Default") {}

    Logger(const std::string& name) : name_(name) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    void log(LogLevel level, const std::string& message) {
        std::vector<std::shared_ptr<LogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(sinks_mutex_);
            sinks = sinks_;
        }
        for (const auto& sink : sinks) {
            sink->log(level, name_, message);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    const std::string& name() const { return name_; }

    /// Apply \p level to every attached sink.
    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (const auto& sink : sinks_) {
            sink->set_level(level);
        }
    }

private:
    std::string name_;
    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
