#include "gyration/report.hpp"
#include "gyration/errors.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace gyr {

namespace fs = std::filesystem;

Histogram::Histogram(const std::vector<double>& data, size_t n_bins)
    : total_(data.size()) {
    if (data.empty()) {
        throw InsufficientDataError("Histogram", 0, 1);
    }
    if (n_bins == 0) {
        throw ConfigurationError("histogram bin count must be positive");
    }

    auto extrema = std::minmax_element(data.begin(), data.end());
    min_ = *extrema.first;
    max_ = *extrema.second;

    if (max_ > min_) {
        counts_.assign(n_bins, 0);
        width_ = (max_ - min_) / static_cast<double>(n_bins);
    } else {
        // Constant data: one unit-width bin centred on the value.
        counts_.assign(1, 0);
        min_ -= 0.5;
        max_ += 0.5;
        width_ = 1.0;
    }

    for (double x : data) {
        size_t i = static_cast<size_t>((x - min_) / width_);
        counts_[std::min(i, counts_.size() - 1)] += 1;
    }
}

double Histogram::center(size_t i) const {
    if (i >= counts_.size()) throw std::out_of_range("Histogram: bin index out of range");
    return min_ + (static_cast<double>(i) + 0.5) * width_;
}

double Histogram::density(size_t i) const {
    if (i >= counts_.size()) throw std::out_of_range("Histogram: bin index out of range");
    return static_cast<double>(counts_[i]) / (static_cast<double>(total_) * width_);
}

void writeSummary(std::ostream& out, const AnalysisResult& result) {
    const auto& stats = result.statistics;
    const auto& g = result.gFactor;
    const std::string rule(50, '=');

    out << "RADIUS OF GYRATION AND G-FACTOR ANALYSIS\n"
        << rule << "\n"
        << std::fixed << std::setprecision(6)
        << "Source:                   " << result.sourceName << "\n"
        << "Simulation timesteps:     " << std::setprecision(0) << result.lastTimestep() << "\n"
        << "Total data points:        " << result.series.size() << "\n"
        << "Selection policy:         " << policyName(result.window.policy) << "\n"
        << "Equilibrated region:      points [" << result.window.begin << ", "
        << result.window.end << "), from timestep "
        << result.equilibrationStartTimestep() << std::setprecision(6) << "\n"
        << "Data points analyzed:     " << stats.sampleSize << "\n"
        << "\n"
        << "Mean Rg:                  " << stats.mean << " +/- " << stats.standardDeviation << "\n"
        << "Minimum Rg:               " << stats.minimum << "\n"
        << "Maximum Rg:               " << stats.maximum << "\n"
        << std::setprecision(0) << stats.confidenceLevel * 100 << std::setprecision(6)
        << "% confidence interval:  [" << stats.confidenceLow << ", " << stats.confidenceHigh << "]\n"
        << "\n"
        << "Average Rg (topology):    " << g.measuredRg << "\n"
        << "Theoretical Rg (linear):  " << g.linearRg << "\n"
        << "Calculated g-factor:      " << g.gFactor << "\n"
        << "Expected g-factor:        " << g.expectedGFactor << "\n"
        << "Difference:               " << g.difference << "\n"
        << "Classification:           " << g.label() << "\n";
}

void writeTimeSeries(std::ostream& out, const AnalysisResult& result) {
    out << "# timestep\trg\tin_window\n" << std::setprecision(10);
    for (size_t i = 0; i < result.series.size(); ++i) {
        bool in_window = i >= result.window.begin && i < result.window.end;
        out << result.series.timesteps[i] << '\t' << result.series.values[i] << '\t'
            << (in_window ? 1 : 0) << '\n';
    }
}

void writeRunningAverage(std::ostream& out, const AnalysisResult& result) {
    out << "# timestep\trunning_average_rg\n" << std::setprecision(10);
    for (size_t i = 0; i < result.runningAverage.size(); ++i) {
        out << result.series.timesteps[i] << '\t' << result.runningAverage[i] << '\n';
    }
}

void writeHistogram(std::ostream& out, const AnalysisResult& result, size_t n_bins) {
    Histogram histogram(result.windowValues, n_bins);
    out << "# bin_center\tcount\tdensity\n" << std::setprecision(10);
    for (size_t i = 0; i < histogram.binCount(); ++i) {
        out << histogram.center(i) << '\t' << histogram.counts()[i] << '\t'
            << histogram.density(i) << '\n';
    }
}

void commitFiles(const std::vector<FilePayload>& files) {
    auto remove_quietly = [](const fs::path& path) {
        std::error_code ignored;
        fs::remove(path, ignored);
    };

    std::vector<fs::path> tmp_paths;
    tmp_paths.reserve(files.size());
    try {
        for (const auto& file : files) {
            fs::path tmp = file.path;
            tmp += ".tmp";
            tmp_paths.push_back(tmp);

            std::ofstream out(tmp, std::ios::binary);
            if (!out) {
                throw std::runtime_error("Failed to open for writing: " + tmp.string());
            }
            out << file.contents;
            out.flush();
            if (!out) {
                throw std::runtime_error("Failed while writing: " + tmp.string());
            }
        }
    } catch (...) {
        for (const auto& tmp : tmp_paths) remove_quietly(tmp);
        throw;
    }

    // Every payload is on disk; now move them into place, undoing on failure.
    for (size_t i = 0; i < files.size(); ++i) {
        std::error_code ec;
        fs::rename(tmp_paths[i], files[i].path, ec);
        if (ec) {
            for (size_t j = 0; j < i; ++j) remove_quietly(files[j].path);
            for (size_t j = i; j < files.size(); ++j) remove_quietly(tmp_paths[j]);
            throw std::runtime_error("Failed to rename " + tmp_paths[i].string() + " -> " +
                                     files[i].path.string() + " (" + ec.message() + ")");
        }
    }
}

ReportWriter::ReportWriter(fs::path output_dir, std::string prefix, size_t histogram_bins)
    : output_dir_(std::move(output_dir))
    , prefix_(std::move(prefix))
    , histogram_bins_(histogram_bins) {
    if (prefix_.empty()) {
        throw ConfigurationError("output prefix must not be empty");
    }
    if (histogram_bins_ == 0) {
        throw ConfigurationError("histogram bin count must be positive");
    }
}

std::vector<fs::path> ReportWriter::write(const AnalysisResult& result) const {
    std::error_code ec;
    if (!fs::is_directory(output_dir_, ec)) {
        throw std::runtime_error("Output directory does not exist: " + output_dir_.string());
    }

    auto render = [&](const fs::path& path, const std::function<void(std::ostream&)>& fn) {
        std::ostringstream out;
        fn(out);
        return FilePayload{path, out.str()};
    };

    // Render everything first so formatting errors leave the directory untouched.
    std::vector<FilePayload> files;
    files.push_back(render(summaryPath(), [&](std::ostream& out) { writeSummary(out, result); }));
    files.push_back(render(timeSeriesPath(), [&](std::ostream& out) { writeTimeSeries(out, result); }));
    files.push_back(render(runningAveragePath(), [&](std::ostream& out) {
        writeRunningAverage(out, result);
    }));
    files.push_back(render(histogramPath(), [&](std::ostream& out) {
        writeHistogram(out, result, histogram_bins_);
    }));

    commitFiles(files);

    std::vector<fs::path> written;
    for (const auto& file : files) {
        written.push_back(file.path);
    }
    return written;
}

} // namespace gyr
