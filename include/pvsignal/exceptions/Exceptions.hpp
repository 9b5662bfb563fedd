#ifndef PVSIGNAL_EXCEPTIONS_HPP
#define PVSIGNAL_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace pvsignal {

/**
 * @brief Base class for all engine errors
 *
 * Carries the name of the component that raised the error so that
 * per-pair error markers can report where a computation stopped.
 */
class PvSignalException : public std::runtime_error {
public:
    PvSignalException(const std::string& source, const std::string& message)
        : std::runtime_error(source + ": " + message), source_(source), message_(message) {}

    const std::string& source() const noexcept { return source_; }
    const std::string& detail() const noexcept { return message_; }

private:
    std::string source_;
    std::string message_;
};

/**
 * @brief Not enough data for a requested analysis
 *
 * Non-fatal. The affected sub-result is reported as not computed.
 */
class InsufficientDataException : public PvSignalException {
public:
    InsufficientDataException(const std::string& source, const std::string& message)
        : PvSignalException(source, "Insufficient data: " + message) {}
};

/**
 * @brief Configuration rejected before any scoring starts
 */
class InvalidConfigurationException : public PvSignalException {
public:
    InvalidConfigurationException(const std::string& source, const std::string& message)
        : PvSignalException(source, "Invalid configuration: " + message) {}
};

/**
 * @brief A computation produced a non-finite value
 *
 * Fatal for the pair being scored only.
 */
class NumericOverflowException : public PvSignalException {
public:
    NumericOverflowException(const std::string& source, const std::string& message)
        : PvSignalException(source, "Numeric overflow: " + message) {}
};

} // namespace pvsignal

#define PVSIGNAL_THROW_INVALID_CONFIG(source, msg) \
    throw ::pvsignal::InvalidConfigurationException((source), (msg))

#endif // PVSIGNAL_EXCEPTIONS_HPP
