#ifndef GYRATION_EQUILIBRATION_HPP
#define GYRATION_EQUILIBRATION_HPP

#include "gyration/series.hpp"
#include <string>
#include <vector>

namespace gyr {

enum class SelectionPolicy {
    HALF_TAIL,    // [n/2, n): discard the first half as equilibration transient
    FULL_SERIES   // [0, n)
};

// Half-open index range [begin, end) into a Series.
struct SelectionWindow {
    size_t begin = 0;
    size_t end = 0;
    SelectionPolicy policy = SelectionPolicy::FULL_SERIES;

    size_t size() const { return end - begin; }
    bool empty() const { return end == begin; }
};

SelectionWindow selectWindow(size_t series_length, SelectionPolicy policy);

inline SelectionWindow selectWindow(const Series& series, SelectionPolicy policy) {
    return selectWindow(series.size(), policy);
}

std::vector<double> windowValues(const Series& series, const SelectionWindow& window);

SelectionPolicy parsePolicy(const std::string& name);
std::string policyName(SelectionPolicy policy);

} // namespace gyr

#endif // GYRATION_EQUILIBRATION_HPP
