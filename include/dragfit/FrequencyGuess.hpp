#pragma once
#include "Types.hpp"

namespace dragfit {

/*  Savitzky–Golay smoothing (odd window, polynomial order < window).  The
 *  first and last half-window are taken from the polynomial fitted to the
 *  first and last full window.  Returns the input when it is too short.
 */
Vector savgol_filter(const Vector& y, int window, int polyorder);

/*  Dominant oscillation frequency of y(x) from the peak of the FFT power
 *  spectrum.  x need not be sorted or uniformly spaced (the data are
 *  linearly resampled on the finest interval when it is not).  Never
 *  fails: degenerate input returns 0.
 */
double guess_frequency(const Vector& x,
                       const Vector& y,
                       int filter_window = 5,
                       int filter_dim    = 2);

} // namespace dragfit
