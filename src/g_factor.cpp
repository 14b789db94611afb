#include "gyration/g_factor.hpp"
#include "gyration/errors.hpp"
#include <cmath>

namespace gyr {

std::string classificationLabel(GFactorClass classification) {
    switch (classification) {
        case GFactorClass::EXCELLENT:
            return "excellent";
        case GFactorClass::GOOD:
            return "good";
        case GFactorClass::NEEDS_REVIEW:
            return "needs_review";
    }
    throw std::runtime_error("Unknown g-factor classification");
}

GFactorCalculator::GFactorCalculator(double expected_g, ClassificationThresholds thresholds)
    : expected_g_(expected_g)
    , thresholds_(thresholds) {
    if (!std::isfinite(expected_g_) || expected_g_ <= 0) {
        throw ConfigurationError("expected g-factor must be positive");
    }
    if (!(thresholds_.excellent > 0 && thresholds_.excellent < thresholds_.good) ||
        !std::isfinite(thresholds_.good)) {
        throw ConfigurationError("classification thresholds must satisfy 0 < excellent < good");
    }
}

GFactorResult GFactorCalculator::compute(double measured_rg, const std::string& source_name) const {
    if (!std::isfinite(measured_rg) || measured_rg <= 0) {
        throw DataFormatError(source_name, 0, "measured Rg must be positive");
    }

    GFactorResult result;
    result.measuredRg = measured_rg;
    result.expectedGFactor = expected_g_;
    result.linearRg = measured_rg / std::sqrt(expected_g_);
    result.gFactor = (measured_rg * measured_rg) / (result.linearRg * result.linearRg);
    result.difference = std::abs(result.gFactor - expected_g_);
    result.classification = classify(result.difference);
    return result;
}

GFactorClass GFactorCalculator::classify(double difference) const {
    if (difference < thresholds_.excellent) {
        return GFactorClass::EXCELLENT;
    }
    if (difference < thresholds_.good) {
        return GFactorClass::GOOD;
    }
    return GFactorClass::NEEDS_REVIEW;
}

} // namespace gyr
