#include "percentile.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

#include <opencv2/imgproc.hpp>

#include "detectlight.h"

namespace  {

/**
 * @brief valueAtRank returns the value of the rank'th smallest sample (zero-based) of a 256-bin histogram.
 */
double valueAtRank(std::array<size_t, 256> const& hist, size_t const rank) {
    size_t cumulative = 0;
    for (size_t ii = 0; ii < hist.size(); ++ii) {
        cumulative += hist[ii];
        if (cumulative > rank) {
            return double(ii);
        }
    }
    return 255;
}

double percentile8U(cv::Mat const& mat, double const rank) {
    std::array<size_t, 256> hist;
    hist.fill(0);
    size_t const row_length = size_t(mat.cols) * size_t(mat.channels());
    for (int ii = 0; ii < mat.rows; ++ii) {
        uint8_t const * row = mat.ptr<uint8_t>(ii);
        for (size_t jj = 0; jj < row_length; ++jj) {
            hist[row[jj]]++;
        }
    }
    size_t const lower = size_t(std::floor(rank));
    double const fraction = rank - double(lower);
    double const lower_value = valueAtRank(hist, lower);
    if (fraction <= 0) {
        return lower_value;
    }
    double const upper_value = valueAtRank(hist, lower + 1);
    return lower_value + fraction * (upper_value - lower_value);
}

double percentileGeneric(cv::Mat const& mat, double const rank) {
    cv::Mat const continuous = mat.isContinuous() ? mat : mat.clone();
    cv::Mat_<double> converted;
    continuous.reshape(1, 1).convertTo(converted, CV_64F);
    std::vector<double> values(converted.begin(), converted.end());
    size_t const lower = size_t(std::floor(rank));
    double const fraction = rank - double(lower);
    std::nth_element(values.begin(), values.begin() + lower, values.end());
    double const lower_value = values[lower];
    if (fraction <= 0 || lower + 1 >= values.size()) {
        return lower_value;
    }
    // After nth_element every element behind position "lower" is >= lower_value,
    // the smallest of them is the next order statistic.
    double const upper_value = *std::min_element(values.begin() + lower + 1, values.end());
    return lower_value + fraction * (upper_value - lower_value);
}

} // anonymous namespace

namespace detectlight {

cv::Mat toIntensity(const cv::Mat &frame, const bool grayscale) {
    if (!grayscale || frame.channels() == 1) {
        return frame;
    }
    cv::Mat result;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, result, cv::COLOR_BGR2GRAY);
    }
    else if (frame.channels() == 4) {
        cv::cvtColor(frame, result, cv::COLOR_BGRA2GRAY);
    }
    else {
        throw DecodeError("Can't convert frame with " + std::to_string(frame.channels()) + " channels to intensity");
    }
    return result;
}

double percentileRank(const size_t n, const double p) {
    if (n < 2) {
        return 0;
    }
    double const rank = p * double(n - 1) / 100.0;
    return std::min(std::max(rank, 0.0), double(n - 1));
}

double percentile(const cv::Mat &frame, const double p) {
    if (!std::isfinite(p) || p < 0 || p > 100) {
        throw InputError("Percentile must be in [0, 100], got " + std::to_string(p));
    }
    if (frame.empty()) {
        throw DecodeError("Can't compute a percentile of an empty frame");
    }
    size_t const n = frame.total() * size_t(frame.channels());
    double const rank = percentileRank(n, p);
    if (frame.depth() == CV_8U) {
        return percentile8U(frame, rank);
    }
    return percentileGeneric(frame, rank);
}

} // namespace detectlight
