#include "gyration/series.hpp"
#include "gyration/errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace gyr {

namespace {

bool is_separator(char c, char delimiter) {
    return std::isspace(static_cast<unsigned char>(c)) || (delimiter != '\0' && c == delimiter);
}

bool parse_number(const std::string& token, double& value) {
    const char* begin = token.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0';
}

} // namespace

SeriesLoader::SeriesLoader(LoaderOptions options)
    : options_(options) {
    if (std::isspace(static_cast<unsigned char>(options_.commentMarker)) ||
        options_.commentMarker == '\0') {
        throw ConfigurationError("comment marker must be a visible character");
    }
    if (options_.delimiter != '\0' && options_.delimiter == options_.commentMarker) {
        throw ConfigurationError("delimiter and comment marker must differ");
    }
}

Series SeriesLoader::load(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || std::filesystem::is_directory(path, ec)) {
        throw SourceNotFoundError(path.string());
    }

    std::ifstream input(path);
    if (!input) {
        throw SourceNotFoundError(path.string());
    }
    return parse(input, path.string());
}

Series SeriesLoader::parse(std::istream& input, const std::string& source_name) const {
    Series series;
    std::string line;
    size_t line_number = 0;
    size_t expected_columns = 0;

    while (std::getline(input, line)) {
        ++line_number;

        size_t first = 0;
        while (first < line.size() && std::isspace(static_cast<unsigned char>(line[first]))) {
            ++first;
        }
        if (first == line.size() || line[first] == options_.commentMarker) {
            continue;
        }

        auto fields = split_fields(line);
        if (fields.size() < 2) {
            throw DataFormatError(source_name, line_number,
                                  "expected at least 2 columns, found " +
                                  std::to_string(fields.size()));
        }
        if (expected_columns == 0) {
            expected_columns = fields.size();
        } else if (fields.size() != expected_columns) {
            throw DataFormatError(source_name, line_number,
                                  "expected " + std::to_string(expected_columns) +
                                  " columns, found " + std::to_string(fields.size()));
        }

        double timestep = 0;
        double value = 0;
        if (!parse_number(fields[0], timestep)) {
            throw DataFormatError(source_name, line_number,
                                  "timestep '" + fields[0] + "' is not a number");
        }
        if (!parse_number(fields[1], value)) {
            throw DataFormatError(source_name, line_number,
                                  "Rg value '" + fields[1] + "' is not a number");
        }
        if (!std::isfinite(timestep) || !std::isfinite(value)) {
            throw DataFormatError(source_name, line_number, "non-finite value");
        }

        series.push_back(timestep, value);
    }

    if (input.bad()) {
        throw SourceNotFoundError(source_name);
    }
    if (series.empty()) {
        throw EmptySeriesError(source_name);
    }
    return series;
}

std::vector<std::string> SeriesLoader::split_fields(const std::string& line) const {
    std::vector<std::string> fields;
    size_t i = 0;
    const size_t n = line.size();
    while (i < n) {
        while (i < n && is_separator(line[i], options_.delimiter)) ++i;
        if (i >= n) break;
        // Trailing comment on a data row.
        if (line[i] == options_.commentMarker) break;
        size_t j = i;
        while (j < n && !is_separator(line[j], options_.delimiter) &&
               line[j] != options_.commentMarker) ++j;
        fields.push_back(line.substr(i, j - i));
        i = j;
    }
    return fields;
}

} // namespace gyr
