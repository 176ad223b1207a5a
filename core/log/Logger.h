#pragma once

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace logging {

enum class Level : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warning,
    Error
};

// Process-wide leveled log sink. Writing never reports failure to the caller.
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(Level level) noexcept;
    Level level() const noexcept;

    void setOutput(std::ostream* out) noexcept;

    void log(Level level, const std::string& message) noexcept;

    static const char* levelName(Level level) noexcept;

private:
    Logger();

    mutable std::mutex mutex_;
    std::ostream* out_;
    Level level_;
};

void trace(const std::string& message) noexcept;
void debug(const std::string& message) noexcept;
void info(const std::string& message) noexcept;
void warning(const std::string& message) noexcept;
void error(const std::string& message) noexcept;

} // namespace logging
