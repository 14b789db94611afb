#ifndef GYRATION_REPORT_HPP
#define GYRATION_REPORT_HPP

#include "gyration/analysis_result.hpp"
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace gyr {

// Equal-width bins spanning [min, max] of the data, density normalised.
class Histogram {
public:
    Histogram(const std::vector<double>& data, size_t n_bins);

    size_t binCount() const { return counts_.size(); }
    double lower() const { return min_; }
    double upper() const { return max_; }
    double binWidth() const { return width_; }
    double center(size_t i) const;
    double density(size_t i) const;
    const std::vector<size_t>& counts() const { return counts_; }

private:
    double min_;
    double max_;
    double width_;
    size_t total_;
    std::vector<size_t> counts_;
};

void writeSummary(std::ostream& out, const AnalysisResult& result);
void writeTimeSeries(std::ostream& out, const AnalysisResult& result);
void writeRunningAverage(std::ostream& out, const AnalysisResult& result);
void writeHistogram(std::ostream& out, const AnalysisResult& result, size_t n_bins);

struct FilePayload {
    std::filesystem::path path;
    std::string contents;
};

// Writes each payload to "<path>.tmp", then renames all of them into place.
// On any failure no target from this call is left behind.
void commitFiles(const std::vector<FilePayload>& files);

class ReportWriter {
public:
    ReportWriter(std::filesystem::path output_dir, std::string prefix, size_t histogram_bins = 50);

    // Returns the paths written, in order.
    std::vector<std::filesystem::path> write(const AnalysisResult& result) const;

    std::filesystem::path summaryPath() const { return path_for("summary.txt"); }
    std::filesystem::path timeSeriesPath() const { return path_for("timeseries.dat"); }
    std::filesystem::path runningAveragePath() const { return path_for("running_average.dat"); }
    std::filesystem::path histogramPath() const { return path_for("histogram.dat"); }

private:
    std::filesystem::path output_dir_;
    std::string prefix_;
    size_t histogram_bins_;

    std::filesystem::path path_for(const std::string& suffix) const {
        return output_dir_ / (prefix_ + "_" + suffix);
    }
};

} // namespace gyr

#endif // GYRATION_REPORT_HPP
