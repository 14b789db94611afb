#ifndef GYRATION_ANALYSIS_RESULT_HPP
#define GYRATION_ANALYSIS_RESULT_HPP

#include "gyration/equilibration.hpp"
#include "gyration/g_factor.hpp"
#include "gyration/series.hpp"
#include "gyration/statistics.hpp"
#include <string>
#include <vector>

namespace gyr {

struct AnalysisResult {
    std::string sourceName;
    Series series;
    SelectionWindow window;
    std::vector<double> windowValues;
    StatisticalAnalysis<double>::Statistics statistics;
    std::vector<double> runningAverage;  // over the full series
    GFactorResult gFactor;

    double lastTimestep() const { return series.timesteps.back(); }
    double equilibrationStartTimestep() const { return series.timesteps[window.begin]; }
};

} // namespace gyr

#endif // GYRATION_ANALYSIS_RESULT_HPP
