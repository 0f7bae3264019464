#include "dragfit/FrequencyGuess.hpp"
#include <unsupported/Eigen/FFT>
#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <numeric>
#include <vector>

namespace dragfit {

static constexpr int kMaxOversampling = 16;

/* ------------------------------------------------------------------ */
/*  helpers                                                           */
/* ------------------------------------------------------------------ */
static void sort_by_x(Vector& x, Vector& y)
{
    std::vector<Eigen::Index> order(x.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](Eigen::Index a, Eigen::Index b) { return x[a] < x[b]; });

    Vector xs(x.size()), ys(y.size());
    for (Eigen::Index i = 0; i < x.size(); ++i) {
        xs[i] = x[order[i]];
        ys[i] = y[order[i]];
    }
    x.swap(xs);
    y.swap(ys);
}

/* piecewise-linear interpolation, x sorted ascending */
static double interp(double xq, const Vector& x, const Vector& y)
{
    const double* first = x.data();
    const double* last  = x.data() + x.size();
    const double* it    = std::upper_bound(first, last, xq);

    if (it == first) return y[0];
    if (it == last)  return y[x.size() - 1];

    const Eigen::Index hi = it - first;
    const Eigen::Index lo = hi - 1;
    const double t = (xq - x[lo]) / (x[hi] - x[lo]);
    return y[lo] + t * (y[hi] - y[lo]);
}

Vector savgol_filter(const Vector& y, int window, int polyorder)
{
    const int n = static_cast<int>(y.size());
    if (window % 2 == 0 || window <= polyorder || n < window)
        return y;

    const int half = window / 2;

    /* design matrix on the window offsets -half … +half */
    Matrix A(window, polyorder + 1);
    for (int r = 0; r < window; ++r) {
        const double t = r - half;
        double v = 1.0;
        for (int c = 0; c <= polyorder; ++c) {
            A(r, c) = v;
            v *= t;
        }
    }
    /* least-squares projector: coefficients = P * y_window */
    const Matrix P = A.colPivHouseholderQr().solve(Matrix::Identity(window, window));

    Vector out(n);

    /* interior: value of the local fit at the window centre */
    const Eigen::RowVectorXd centre = P.row(0);
    for (int i = half; i < n - half; ++i)
        out[i] = centre.dot(y.segment(i - half, window));

    /* edges: evaluate the fit of the first/last window ("interp" mode) */
    const Vector c_lo = P * y.head(window);
    const Vector c_hi = P * y.tail(window);
    for (int k = 0; k < half; ++k) {
        const double t_lo = k - half;
        const double t_hi = half - k;
        double v_lo = 0.0, v_hi = 0.0, p_lo = 1.0, p_hi = 1.0;
        for (int c = 0; c <= polyorder; ++c) {
            v_lo += c_lo[c] * p_lo;
            v_hi += c_hi[c] * p_hi;
            p_lo *= t_lo;
            p_hi *= t_hi;
        }
        out[k]         = v_lo;
        out[n - 1 - k] = v_hi;
    }
    return out;
}

/* ------------------------------------------------------------------ */
/*  frequency of the dominant oscillation                             */
/* ------------------------------------------------------------------ */
double guess_frequency(const Vector& x_in, const Vector& y_in,
                       int filter_window, int filter_dim)
{
    if (x_in.size() != y_in.size() || x_in.size() < 3)
        return 0.0;

    Vector x = x_in, y = y_in;
    sort_by_x(x, y);

    /* smallest positive sampling interval, uniform grid check */
    double dt_min = std::numeric_limits<double>::infinity();
    double dt_max = 0.0;
    bool   repeated_x = false;
    for (Eigen::Index i = 1; i < x.size(); ++i) {
        const double d = x[i] - x[i - 1];
        if (d > 0.0) dt_min = std::min(dt_min, d);
        else         repeated_x = true;
        dt_max = std::max(dt_max, d);
    }
    if (!std::isfinite(dt_min))
        return 0.0;                              // zero span

    const bool uniform = !repeated_x && (dt_max - dt_min) <= 1e-9 * dt_max;

    /* sampling step of the spectrum; widened below for clustered x */
    double dt = dt_min;

    std::vector<double> samples;
    if (uniform) {
        samples.assign(y.data(), y.data() + y.size());
    } else {
        /* resample on the finest interval over [x0, xN), at most
           kMaxOversampling points per input sample */
        const double span = x[x.size() - 1] - x[0];
        const double max_len = static_cast<double>(kMaxOversampling) * x.size();
        double n_new = std::ceil(span / dt);
        if (n_new > max_len) {
            n_new = max_len;
            dt    = span / max_len;
        }
        const auto len = static_cast<Eigen::Index>(n_new);
        samples.reserve(len);
        for (Eigen::Index i = 0; i < len; ++i)
            samples.push_back(interp(x[0] + i * dt, x, y));
    }

    const int n = static_cast<int>(samples.size());
    if (n < 3)
        return 0.0;

    const double mean = std::accumulate(samples.begin(), samples.end(), 0.0) / n;
    std::vector<double> centred(samples);
    for (auto& v : centred) v -= mean;

    Eigen::FFT<double> fft;
    std::vector<std::complex<double>> spectrum;
    fft.fwd(spectrum, centred);

    /* non-negative bins of numpy's fftfreq: k = 0 … (n+1)/2 − 1 */
    const int n_pos = (n + 1) / 2;
    int k_best = 0;
    double p_best = -1.0;
    for (int k = 0; k < n_pos; ++k) {
        const double p = std::abs(spectrum[k]);
        if (p > p_best) {
            p_best = p;
            k_best = k;
        }
    }
    double freq = k_best / (n * dt);

    if (freq < 1.5 / (dt * n)) {
        /* low frequency: less than ~1.5 periods in the scan, refine from the
           steepest slope of the smoothed signal */
        Vector ys = Eigen::Map<const Vector>(samples.data(), n);
        Vector smooth = savgol_filter(ys, filter_window, filter_dim);

        const double amp = smooth.cwiseAbs().maxCoeff();
        if (amp < 1e-8)
            return 0.0;                          // no oscillation at all

        double slope = 0.0;
        for (int i = 1; i < n; ++i)
            slope = std::max(slope, std::abs(smooth[i] - smooth[i - 1]) / dt);
        freq = slope / (amp * 2.0 * M_PI);
    }
    return freq;
}

} // namespace dragfit
