#ifndef GYRATION_ERRORS_HPP
#define GYRATION_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gyr {

class GyrationError : public std::runtime_error {
public:
    explicit GyrationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Input source missing or unreadable.
class SourceNotFoundError : public GyrationError {
public:
    explicit SourceNotFoundError(const std::string& source)
        : GyrationError("Source not found or unreadable: " + source)
        , source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

// Source exists but is not a uniform numeric table. line() is 1-based, 0 when
// the error is not tied to a particular line.
class DataFormatError : public GyrationError {
public:
    DataFormatError(const std::string& source, size_t line, const std::string& reason)
        : GyrationError(format_message(source, line, reason))
        , source_(source)
        , line_(line) {}

    const std::string& source() const { return source_; }
    size_t line() const { return line_; }

private:
    std::string source_;
    size_t line_;

    static std::string format_message(const std::string& source, size_t line,
                                      const std::string& reason) {
        std::string message = "Malformed data in " + source;
        if (line > 0) {
            message += " at line " + std::to_string(line);
        }
        return message + ": " + reason;
    }
};

class InsufficientDataError : public GyrationError {
public:
    InsufficientDataError(const std::string& what, size_t available, size_t required)
        : GyrationError(what + " requires at least " + std::to_string(required) +
                        " samples, got " + std::to_string(available))
        , available_(available)
        , required_(required) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

// A source that parsed cleanly but held no data rows.
class EmptySeriesError : public InsufficientDataError {
public:
    explicit EmptySeriesError(const std::string& source)
        : InsufficientDataError("Series from " + source, 0, 1) {}
};

class ConfigurationError : public GyrationError {
public:
    explicit ConfigurationError(const std::string& message)
        : GyrationError("Invalid configuration: " + message) {}
};

} // namespace gyr

#endif // GYRATION_ERRORS_HPP
