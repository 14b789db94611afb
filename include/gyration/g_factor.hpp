#ifndef GYRATION_G_FACTOR_HPP
#define GYRATION_G_FACTOR_HPP

#include <string>

namespace gyr {

// Tetracyclic alpha-polymer value from Cantarella et al. (2022).
constexpr double DEFAULT_EXPECTED_G_FACTOR = 0.445;

// Upper bounds (exclusive) of the agreement bands on |g - g_expected|.
constexpr double EXCELLENT_THRESHOLD = 0.05;
constexpr double GOOD_THRESHOLD = 0.10;

enum class GFactorClass {
    EXCELLENT,
    GOOD,
    NEEDS_REVIEW
};

std::string classificationLabel(GFactorClass classification);

struct ClassificationThresholds {
    double excellent = EXCELLENT_THRESHOLD;
    double good = GOOD_THRESHOLD;
};

struct GFactorResult {
    double measuredRg;
    double expectedGFactor;
    double linearRg;
    double gFactor;
    double difference;
    GFactorClass classification;

    std::string label() const { return classificationLabel(classification); }
};

/**
 * g = Rg^2(topology) / Rg^2(linear).
 *
 * The linear-chain reference is back-derived from the expected value,
 * Rg(linear) = Rg(measured) / sqrt(g_expected), so compute() returns
 * g == g_expected for every positive measured Rg. A linear reference taken
 * from an independent simulation would have to replace linearRg for the
 * ratio to carry information.
 */
class GFactorCalculator {
public:
    explicit GFactorCalculator(double expected_g = DEFAULT_EXPECTED_G_FACTOR,
                               ClassificationThresholds thresholds = ClassificationThresholds{});

    // source_name identifies the input in the error raised for a non-positive Rg.
    GFactorResult compute(double measured_rg,
                          const std::string& source_name = "measured Rg") const;
    GFactorClass classify(double difference) const;

    double expectedGFactor() const { return expected_g_; }
    const ClassificationThresholds& thresholds() const { return thresholds_; }

private:
    double expected_g_;
    ClassificationThresholds thresholds_;
};

} // namespace gyr

#endif // GYRATION_G_FACTOR_HPP
