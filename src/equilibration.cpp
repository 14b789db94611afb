#include "gyration/equilibration.hpp"
#include "gyration/errors.hpp"

namespace gyr {

SelectionWindow selectWindow(size_t series_length, SelectionPolicy policy) {
    SelectionWindow window;
    window.policy = policy;
    window.end = series_length;

    switch (policy) {
        case SelectionPolicy::HALF_TAIL:
            // A single sample would otherwise give a window made of the whole series.
            if (series_length < 2) {
                throw InsufficientDataError("half-tail equilibration window", series_length, 2);
            }
            window.begin = series_length / 2;
            return window;
        case SelectionPolicy::FULL_SERIES:
            if (series_length == 0) {
                throw InsufficientDataError("full-series window", series_length, 1);
            }
            window.begin = 0;
            return window;
    }
    throw ConfigurationError("unknown selection policy");
}

std::vector<double> windowValues(const Series& series, const SelectionWindow& window) {
    if (window.end > series.size() || window.begin > window.end) {
        throw std::out_of_range("Selection window exceeds series bounds");
    }
    return std::vector<double>(series.values.begin() + window.begin,
                               series.values.begin() + window.end);
}

SelectionPolicy parsePolicy(const std::string& name) {
    if (name == "half-tail") {
        return SelectionPolicy::HALF_TAIL;
    }
    if (name == "full-series") {
        return SelectionPolicy::FULL_SERIES;
    }
    throw ConfigurationError("unknown selection policy '" + name +
                             "' (expected half-tail or full-series)");
}

std::string policyName(SelectionPolicy policy) {
    switch (policy) {
        case SelectionPolicy::HALF_TAIL:
            return "half-tail";
        case SelectionPolicy::FULL_SERIES:
            return "full-series";
    }
    throw ConfigurationError("unknown selection policy");
}

} // namespace gyr
