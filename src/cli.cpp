#include "gyration/cli.hpp"
#include "gyration/errors.hpp"
#include <cstddef>
#include <limits>
#include <new>

namespace gyr {

ExitCode analysisExitCode(const std::exception& error) {
    if (dynamic_cast<const ConfigurationError*>(&error)) return EXIT_CONFIGURATION;
    if (dynamic_cast<const SourceNotFoundError*>(&error)) return EXIT_SOURCE_NOT_FOUND;
    if (dynamic_cast<const DataFormatError*>(&error)) return EXIT_DATA_FORMAT;
    if (dynamic_cast<const InsufficientDataError*>(&error)) return EXIT_INSUFFICIENT_DATA;
    return EXIT_INTERNAL;
}

ExitCode outputExitCode(const std::exception& error) {
    if (dynamic_cast<const ConfigurationError*>(&error)) return EXIT_CONFIGURATION;
    if (dynamic_cast<const std::bad_alloc*>(&error)) return EXIT_INTERNAL;
    return EXIT_OUTPUT;
}

double parseNumberArg(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    double parsed = 0;
    try {
        parsed = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw ConfigurationError(flag + " expects a number, got '" + value + "'");
    }
    if (pos != value.size()) {
        throw ConfigurationError(flag + " expects a number, got '" + value + "'");
    }
    return parsed;
}

size_t parseCountArg(const std::string& flag, const std::string& value) {
    const std::string message = flag + " expects a positive integer, got '" + value + "'";
    // stoull accepts a sign and wraps negative input.
    if (value.empty() || value[0] < '0' || value[0] > '9') {
        throw ConfigurationError(message);
    }

    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw ConfigurationError(message);
    }
    if (pos != value.size() || parsed == 0 ||
        parsed > std::numeric_limits<size_t>::max()) {
        throw ConfigurationError(message);
    }
    return static_cast<size_t>(parsed);
}

} // namespace gyr
