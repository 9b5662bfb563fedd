#ifndef PVSIGNAL_LOGGER_HPP
#define PVSIGNAL_LOGGER_HPP

#include <mutex>
#include <ostream>
#include <string>

namespace pvsignal {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4
};

/**
 * @brief Process-wide logger
 *
 * Messages are tagged with a source name and written with a timestamp.
 * Safe to call from inside OpenMP parallel regions.
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    /**
     * @brief Redirect output (defaults to std::cerr)
     * @param stream Stream that must outlive all further logging
     */
    void setOutputStream(std::ostream& stream);

    void debug(const std::string& source, const std::string& message);
    void info(const std::string& source, const std::string& message);
    void warning(const std::string& source, const std::string& message);
    void error(const std::string& source, const std::string& message);

private:
    Logger();

    void log(LogLevel level, const std::string& source, const std::string& message);
    static const char* levelName(LogLevel level);

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::INFO;
    std::ostream* out_;
};

} // namespace pvsignal

#endif // PVSIGNAL_LOGGER_HPP
