#ifndef GYRATION_SERIES_HPP
#define GYRATION_SERIES_HPP

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace gyr {

// Radius of gyration sampled over a trajectory, in file order.
struct Series {
    std::vector<double> timesteps;
    std::vector<double> values;

    void push_back(double timestep, double value) {
        timesteps.push_back(timestep);
        values.push_back(value);
    }

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};

struct LoaderOptions {
    char commentMarker = '#';
    char delimiter = '\0';  // '\0' = whitespace only
};

class SeriesLoader {
public:
    explicit SeriesLoader(LoaderOptions options = LoaderOptions{});

    Series load(const std::filesystem::path& path) const;
    Series parse(std::istream& input, const std::string& source_name) const;

    const LoaderOptions& options() const { return options_; }

private:
    LoaderOptions options_;

    std::vector<std::string> split_fields(const std::string& line) const;
};

inline Series loadSeries(const std::filesystem::path& path,
                         const LoaderOptions& options = LoaderOptions{}) {
    return SeriesLoader(options).load(path);
}

inline Series parseSeries(std::istream& input, const std::string& source_name,
                          const LoaderOptions& options = LoaderOptions{}) {
    return SeriesLoader(options).parse(input, source_name);
}

} // namespace gyr

#endif // GYRATION_SERIES_HPP
