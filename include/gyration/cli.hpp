#ifndef GYRATION_CLI_HPP
#define GYRATION_CLI_HPP

#include <cstddef>
#include <exception>
#include <string>

namespace gyr {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_CONFIGURATION = 1,
    EXIT_SOURCE_NOT_FOUND = 2,
    EXIT_DATA_FORMAT = 3,
    EXIT_INSUFFICIENT_DATA = 4,
    EXIT_OUTPUT = 5,
    EXIT_INTERNAL = 6
};

// Exit code for a failure raised while loading or analysing the input.
ExitCode analysisExitCode(const std::exception& error);

// Exit code for a failure raised while writing the report files.
ExitCode outputExitCode(const std::exception& error);

// Flag value parsers; malformed values throw ConfigurationError naming the flag.
double parseNumberArg(const std::string& flag, const std::string& value);
size_t parseCountArg(const std::string& flag, const std::string& value);

} // namespace gyr

#endif // GYRATION_CLI_HPP
