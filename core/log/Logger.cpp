#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

namespace {

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

} // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : out_(&std::cerr), level_(Level::Info) {}

void Logger::setLevel(Level level) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

Level Logger::level() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::setOutput(std::ostream* out) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out;
}

void Logger::log(Level level, const std::string& message) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_ || out_ == nullptr) {
        return;
    }

    // Neither a failing sink nor allocation failure may escape into the transport.
    try {
        *out_ << timestamp() << " [" << levelName(level) << "] " << message << std::endl;
    } catch (const std::exception&) {
        out_->clear();
    }
}

const char* Logger::levelName(Level level) noexcept {
    switch (level) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warning:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "?";
}

void trace(const std::string& message) noexcept { Logger::instance().log(Level::Trace, message); }
void debug(const std::string& message) noexcept { Logger::instance().log(Level::Debug, message); }
void info(const std::string& message) noexcept { Logger::instance().log(Level::Info, message); }
void warning(const std::string& message) noexcept { Logger::instance().log(Level::Warning, message); }
void error(const std::string& message) noexcept { Logger::instance().log(Level::Error, message); }

} // namespace logging
