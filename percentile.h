#ifndef DETECTLIGHT_PERCENTILE_H
#define DETECTLIGHT_PERCENTILE_H

#include <opencv2/core.hpp>

namespace detectlight {

/**
 * @brief toIntensity reduces a frame to the samples the percentile is computed on.
 * If grayscale is true, 3- and 4-channel frames are converted from BGR(A) to luma
 * using the BT.601 weights of cv::cvtColor (0.299 R + 0.587 G + 0.114 B).
 * If grayscale is false the channels are kept and all samples are pooled,
 * which means percentile() sees width*height*channels values.
 *
 * @param frame decoded frame, single or multi-channel.
 * @param grayscale
 * @return single or multi-channel matrix, sharing data with the input if no conversion was necessary.
 */
cv::Mat toIntensity(cv::Mat const& frame, bool const grayscale);

/**
 * @brief percentile computes the value below which p percent of the samples fall.
 * The rank p*(n-1)/100 is interpolated linearly between the two neighbouring order statistics,
 * so p=0 gives the minimum, p=100 the maximum and p=50 the median.
 * All channels of the matrix are treated as one pool of samples.
 *
 * @param frame non-empty matrix of any depth.
 * @param p percentile in [0, 100]
 * @throws InputError if p is outside [0, 100]
 * @throws DecodeError if the frame is empty.
 */
double percentile(cv::Mat const& frame, double const p);

/**
 * @brief percentileRank returns the (fractional) zero-based rank p*(n-1)/100.
 */
double percentileRank(size_t const n, double const p);

} // namespace detectlight

#endif // DETECTLIGHT_PERCENTILE_H
