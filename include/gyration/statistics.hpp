#ifndef GYRATION_STATISTICS_HPP
#define GYRATION_STATISTICS_HPP

#include "gyration/errors.hpp"
#include <vector>
#include <cmath>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace gyr {

constexpr double DEFAULT_CONFIDENCE_LEVEL = 0.95;

namespace detail {
    // Continued fraction for the incomplete beta function (modified Lentz)
    inline double beta_continued_fraction(double a, double b, double x) {
        const int max_iterations = 100000;
        const double eps = 1e-15;
        const double tiny = 1e-300;

        double qab = a + b;
        double qap = a + 1.0;
        double qam = a - 1.0;
        double c = 1.0;
        double d = 1.0 - qab * x / qap;
        if (std::abs(d) < tiny) d = tiny;
        d = 1.0 / d;
        double h = d;

        for (int m = 1; m <= max_iterations; ++m) {
            int m2 = 2 * m;
            double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
            d = 1.0 + aa * d;
            if (std::abs(d) < tiny) d = tiny;
            c = 1.0 + aa / c;
            if (std::abs(c) < tiny) c = tiny;
            d = 1.0 / d;
            h *= d * c;

            aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
            d = 1.0 + aa * d;
            if (std::abs(d) < tiny) d = tiny;
            c = 1.0 + aa / c;
            if (std::abs(c) < tiny) c = tiny;
            d = 1.0 / d;
            double delta = d * c;
            h *= delta;
            if (std::abs(delta - 1.0) < eps) {
                return h;
            }
        }
        throw std::runtime_error("Incomplete beta continued fraction did not converge");
    }

    // Regularized incomplete beta function I_x(a, b)
    inline double incomplete_beta(double a, double b, double x) {
        if (a <= 0 || b <= 0) {
            throw std::domain_error("incomplete_beta requires a > 0 and b > 0");
        }
        if (x < 0 || x > 1) {
            throw std::domain_error("incomplete_beta requires 0 <= x <= 1");
        }
        if (x == 0 || x == 1) return x;

        double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                           a * std::log(x) + b * std::log1p(-x);
        double front = std::exp(log_front);

        if (x < (a + 1.0) / (a + b + 2.0)) {
            return front * beta_continued_fraction(a, b, x) / a;
        }
        return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
    }

    inline double student_t_cdf(double t, double dof) {
        if (!(dof > 0)) {
            throw std::domain_error("student_t_cdf requires dof > 0");
        }
        if (t == 0) return 0.5;

        double x = dof / (dof + t * t);
        double tail = 0.5 * incomplete_beta(0.5 * dof, 0.5, x);
        return t > 0 ? 1.0 - tail : tail;
    }

    // Inverse of student_t_cdf by bracketed bisection.
    inline double student_t_quantile(double p, double dof) {
        if (!(p > 0 && p < 1)) {
            throw std::domain_error("student_t_quantile requires 0 < p < 1");
        }
        if (!(dof > 0)) {
            throw std::domain_error("student_t_quantile requires dof > 0");
        }
        if (p == 0.5) return 0.0;
        if (p < 0.5) return -student_t_quantile(1.0 - p, dof);

        double lo = 0.0;
        double hi = 1.0;
        while (student_t_cdf(hi, dof) < p) {
            lo = hi;
            hi *= 2.0;
            if (hi > 1e12) {
                throw std::domain_error("student_t_quantile: p too close to 1");
            }
        }

        for (int i = 0; i < 200 && (hi - lo) > 1e-13 * std::max(1.0, hi); ++i) {
            double mid = 0.5 * (lo + hi);
            if (student_t_cdf(mid, dof) < p) {
                lo = mid;
            } else {
                hi = mid;
            }
        }
        return 0.5 * (lo + hi);
    }
}

template<typename T>
class StatisticalAnalysis {
public:
    struct Statistics {
        T mean;
        T variance;            // population (denominator n)
        T standardDeviation;   // population (denominator n)
        T standardError;
        T minimum;
        T maximum;
        size_t sampleSize;
        double confidenceLevel;
        T confidenceLow;
        T confidenceHigh;
    };

    // Two-sided Student-t interval around the mean with n-1 degrees of freedom.
    static Statistics analyze(const std::vector<T>& data,
                              double confidence_level = DEFAULT_CONFIDENCE_LEVEL) {
        validate_confidence_level(confidence_level);
        if (data.size() < 2) {
            throw InsufficientDataError("Confidence interval", data.size(), 2);
        }

        Statistics stats;
        stats.sampleSize = data.size();
        stats.mean = calculate_mean(data);
        stats.variance = calculate_population_variance(data, stats.mean);
        stats.standardDeviation = std::sqrt(stats.variance);
        stats.standardError = stats.standardDeviation / std::sqrt(static_cast<T>(data.size()));

        auto extrema = std::minmax_element(data.begin(), data.end());
        stats.minimum = *extrema.first;
        stats.maximum = *extrema.second;

        stats.confidenceLevel = confidence_level;
        T t_critical = static_cast<T>(detail::student_t_quantile(
            0.5 * (1.0 + confidence_level), static_cast<double>(data.size() - 1)));
        stats.confidenceLow = stats.mean - t_critical * stats.standardError;
        stats.confidenceHigh = stats.mean + t_critical * stats.standardError;

        return stats;
    }

    static T mean(const std::vector<T>& data) {
        if (data.empty()) {
            throw InsufficientDataError("Mean", 0, 1);
        }
        return calculate_mean(data);
    }

    static T populationStandardDeviation(const std::vector<T>& data) {
        if (data.size() < 2) {
            throw InsufficientDataError("Standard deviation", data.size(), 2);
        }
        return std::sqrt(calculate_population_variance(data, calculate_mean(data)));
    }

    static void validate_confidence_level(double confidence_level) {
        if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
            throw ConfigurationError("confidence level must be between 0 and 1");
        }
    }

private:
    static T calculate_mean(const std::vector<T>& data) {
        return std::accumulate(data.begin(), data.end(), T(0)) / static_cast<T>(data.size());
    }

    static T calculate_population_variance(const std::vector<T>& data, T mean) {
        T sum_sq_diff = 0;
        for (const auto& x : data) {
            T diff = x - mean;
            sum_sq_diff += diff * diff;
        }
        return sum_sq_diff / static_cast<T>(data.size());
    }
};

// Cumulative mean of values[0..i] for each i, computed on iteration.
template<typename T = double>
class RunningAverage {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = T;

        const_iterator() = default;

        const_iterator(const std::vector<T>* data, size_t index)
            : data_(data), index_(index) {
            if (index_ < data_->size()) {
                sum_ = (*data_)[index_];
            }
        }

        T operator*() const { return sum_ / static_cast<T>(index_ + 1); }

        const_iterator& operator++() {
            ++index_;
            if (index_ < data_->size()) {
                sum_ += (*data_)[index_];
            }
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(const const_iterator& other) const { return index_ == other.index_; }
        bool operator!=(const const_iterator& other) const { return index_ != other.index_; }

    private:
        const std::vector<T>* data_ = nullptr;
        size_t index_ = 0;
        T sum_ = 0;
    };

    // The referenced values must outlive the range.
    explicit RunningAverage(const std::vector<T>& values)
        : values_(&values) {}

    const_iterator begin() const { return const_iterator(values_, 0); }
    const_iterator end() const { return const_iterator(values_, values_->size()); }

    size_t size() const { return values_->size(); }
    bool empty() const { return values_->empty(); }

    std::vector<T> toVector() const {
        std::vector<T> result;
        result.reserve(values_->size());
        std::copy(begin(), end(), std::back_inserter(result));
        return result;
    }

private:
    const std::vector<T>* values_;
};

} // namespace gyr

#endif // GYRATION_STATISTICS_HPP
