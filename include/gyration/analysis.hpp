#ifndef GYRATION_ANALYSIS_HPP
#define GYRATION_ANALYSIS_HPP

#include "gyration/analysis_result.hpp"
#include "gyration/equilibration.hpp"
#include "gyration/errors.hpp"
#include "gyration/g_factor.hpp"
#include "gyration/series.hpp"
#include "gyration/statistics.hpp"
#include <cmath>
#include <filesystem>
#include <string>
#include <utility>

namespace gyr {

class GyrationAnalysis {
public:
    struct Parameters {
        SelectionPolicy policy = SelectionPolicy::HALF_TAIL;
        double expected_g_factor = DEFAULT_EXPECTED_G_FACTOR;
        double confidence_level = DEFAULT_CONFIDENCE_LEVEL;
        ClassificationThresholds thresholds;
        LoaderOptions loader;
        size_t histogram_bins = 50;
    };

    GyrationAnalysis()
        : GyrationAnalysis(Parameters()) {}

    explicit GyrationAnalysis(Parameters params)
        : params_(std::move(params)) {
        validate_parameters(params_);
    }

    // Reads the source, then runs the pipeline on it.
    AnalysisResult runFile(const std::filesystem::path& path) const {
        Series series = SeriesLoader(params_.loader).load(path);
        return run(std::move(series), path.string());
    }

    AnalysisResult run(Series series, const std::string& source_name) const {
        if (series.empty()) {
            throw EmptySeriesError(source_name);
        }
        if (series.timesteps.size() != series.values.size()) {
            throw DataFormatError(source_name, 0, "timestep and value columns differ in length");
        }

        SelectionWindow window = selectWindow(series, params_.policy);
        std::vector<double> values = windowValues(series, window);
        auto stats = StatisticalAnalysis<double>::analyze(values, params_.confidence_level);
        GFactorResult g_factor = GFactorCalculator(params_.expected_g_factor, params_.thresholds)
                                     .compute(stats.mean, source_name);

        AnalysisResult result;
        result.sourceName = source_name;
        result.runningAverage = RunningAverage<double>(series.values).toVector();
        result.series = std::move(series);
        result.window = window;
        result.windowValues = std::move(values);
        result.statistics = stats;
        result.gFactor = g_factor;
        return result;
    }

    const Parameters& parameters() const { return params_; }

    static void validate_parameters(const Parameters& params) {
        if (params.policy != SelectionPolicy::HALF_TAIL &&
            params.policy != SelectionPolicy::FULL_SERIES) {
            throw ConfigurationError("unknown selection policy");
        }
        if (!std::isfinite(params.expected_g_factor) || params.expected_g_factor <= 0) {
            throw ConfigurationError("expected g-factor must be positive");
        }
        StatisticalAnalysis<double>::validate_confidence_level(params.confidence_level);
        if (!(params.thresholds.excellent > 0 &&
              params.thresholds.excellent < params.thresholds.good)) {
            throw ConfigurationError("classification thresholds must satisfy 0 < excellent < good");
        }
        if (params.histogram_bins == 0) {
            throw ConfigurationError("histogram bin count must be positive");
        }
    }

private:
    Parameters params_;
};

} // namespace gyr

#endif // GYRATION_ANALYSIS_HPP
