#include "graphembed/elbow_finder.hpp"
#include "graphembed/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <iterator>

namespace graphembed {

namespace {

constexpr double INV_SQRT_2PI = 0.39894228040143267794;

double normal_pdf(double x, double mean, double scale) {
    const double z = (x - mean) / scale;
    return std::exp(-0.5 * z * z) * INV_SQRT_2PI / scale;
}

double mean_of(const double* first, const double* last) {
    double sum = 0.0;
    for (const double* p = first; p != last; ++p) sum += *p;
    return sum / static_cast<double>(last - first);
}

double sample_standard_deviation(const std::vector<double>& values) {
    const double mean = mean_of(values.data(), values.data() + values.size());
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

} // namespace

std::vector<size_t> find_elbows(const std::vector<double>& values, size_t num_elbows, double threshold) {
    std::vector<size_t> elbows;
    if (num_elbows == 0) {
        return elbows;
    }

    std::vector<double> remaining;
    remaining.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(remaining),
                 [threshold](double v) { return v > threshold; });

    if (remaining.empty()) {
        return elbows;
    }
    if (remaining.size() == 1) {
        elbows.push_back(1);
        return elbows;
    }

    std::sort(remaining.begin(), remaining.end(), std::greater<double>());
    const size_t n = remaining.size();

    while (elbows.size() < num_elbows && remaining.size() > 1) {
        const size_t length = remaining.size();
        const double scale = sample_standard_deviation(remaining);
        if (!(scale > 0.0) || !std::isfinite(scale)) {
            // Constant tail: no split is better than another
            LOG_DEBUG("Elbow search stopped on a constant sequence of length ", length);
            break;
        }

        size_t elbow = 0;
        double likelihood_elbow = 0.0;
        const double* data = remaining.data();

        for (size_t d = 1; d < length; ++d) {
            const double mean_signal = mean_of(data, data + d);
            const double mean_noise = mean_of(data + d, data + length);

            double signal_likelihood = 0.0;
            double noise_likelihood = 0.0;
            for (size_t i = 0; i < d; ++i) {
                signal_likelihood += normal_pdf(data[i], mean_signal, scale);
            }
            for (size_t i = d; i < length; ++i) {
                noise_likelihood += normal_pdf(data[i], mean_noise, scale);
            }

            const double likelihood = noise_likelihood + signal_likelihood;
            if (likelihood > likelihood_elbow) {
                likelihood_elbow = likelihood;
                elbow = d;
            }
        }

        if (elbow == 0) {
            // Every density underflowed; further rounds would not advance
            LOG_DEBUG("Elbow search found no split with positive likelihood");
            break;
        }

        elbows.push_back(elbows.empty() ? elbow : elbow + elbows.back());
        remaining.erase(remaining.begin(), remaining.begin() + static_cast<std::ptrdiff_t>(elbow));
    }

    if (elbows.size() < num_elbows) {
        elbows.push_back(n);
    }
    return elbows;
}

std::vector<size_t> find_elbows(const Eigen::MatrixXd& values, size_t num_elbows, double threshold) {
    std::vector<double> deviations(static_cast<size_t>(values.cols()));
    for (Eigen::Index c = 0; c < values.cols(); ++c) {
        const auto column = values.col(c);
        const double mean = column.mean();
        deviations[static_cast<size_t>(c)] =
            std::sqrt((column.array() - mean).square().sum() / static_cast<double>(values.rows()));
    }
    return find_elbows(deviations, num_elbows, threshold);
}

} // namespace graphembed
