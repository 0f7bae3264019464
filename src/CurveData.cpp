#include "dragfit/CurveData.hpp"
#include "dragfit/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <stdexcept>

namespace dragfit {

/* ------------------------------------------------------------------ */
/*  accessors                                                         */
/* ------------------------------------------------------------------ */
int CurveData::series_size(int s) const
{
    return static_cast<int>(std::count(series.begin(), series.end(), s));
}

Vector CurveData::series_x(int s) const
{
    Vector out(series_size(s));
    int k = 0;
    for (int i = 0; i < n_points(); ++i)
        if (series[i] == s) out[k++] = x[i];
    return out;
}

Vector CurveData::series_y(int s) const
{
    Vector out(series_size(s));
    int k = 0;
    for (int i = 0; i < n_points(); ++i)
        if (series[i] == s) out[k++] = y[i];
    return out;
}

std::pair<double,double> CurveData::x_range() const
{
    return { x.minCoeff(), x.maxCoeff() };
}

std::pair<double,double> CurveData::y_range() const
{
    return { y.minCoeff(), y.maxCoeff() };
}

double CurveData::ptp_y() const
{
    return y.maxCoeff() - y.minCoeff();
}

/* ------------------------------------------------------------------ */
/*  formatting                                                        */
/* ------------------------------------------------------------------ */
namespace {

struct Point {
    double y_sum   = 0.0;
    double var_sum = 0.0;
    int    n       = 0;
};

void check_shape(const SeriesData& s)
{
    if (s.x.size() != s.y.size())
        throw std::invalid_argument("series '" + s.name + "': x and y differ in length");
    if (!s.sigma.empty() && s.sigma.size() != s.y.size())
        throw std::invalid_argument("series '" + s.name + "': sigma and y differ in length");

    for (std::size_t i = 0; i < s.x.size(); ++i) {
        if (!std::isfinite(s.x[i]) || !std::isfinite(s.y[i]))
            throw std::invalid_argument("series '" + s.name + "': non-finite sample");
        if (!s.sigma.empty() && !(std::isfinite(s.sigma[i]) && s.sigma[i] > 0.0))
            throw std::invalid_argument("series '" + s.name + "': sigma must be finite and positive");
    }
}

} // namespace

CurveData format_curve_data(const std::vector<SeriesData>& raw,
                            const DragModel&               model,
                            int                            n_free,
                            bool                           normalize)
{
    const int n_series = model.n_series();

    /* ---- route every raw series to its definition ----------------- */
    std::vector<const SeriesData*> by_index(n_series, nullptr);
    bool any_sigma = false, all_sigma = true;

    for (const auto& s : raw) {
        const int idx = model.index_of(s.name);
        if (idx < 0)
            throw std::invalid_argument("data for undefined series '" + s.name + "'");
        if (by_index[idx])
            throw std::invalid_argument("series '" + s.name + "' given twice");
        check_shape(s);
        by_index[idx] = &s;
        any_sigma |= !s.sigma.empty();
        all_sigma &= !s.sigma.empty();
    }
    if (any_sigma && !all_sigma)
        throw std::invalid_argument("sigma must be given for all series or for none");

    /* ---- average repeated x, sort by x ---------------------------- */
    std::vector<std::map<double, Point>> grouped(n_series);
    for (int s = 0; s < n_series; ++s) {
        if (!by_index[s])
            throw InsufficientDataError("no data for series '" + model.series()[s].name + "'");

        const SeriesData& d = *by_index[s];
        for (std::size_t i = 0; i < d.x.size(); ++i) {
            Point& pt = grouped[s][d.x[i]];
            pt.y_sum += d.y[i];
            if (any_sigma) pt.var_sum += d.sigma[i] * d.sigma[i];
            ++pt.n;
        }

        const int n_unique = static_cast<int>(grouped[s].size());
        if (n_unique < n_free)
            throw InsufficientDataError(
                "series '" + d.name + "' has " + std::to_string(n_unique) +
                " distinct points but " + std::to_string(n_free) +
                " parameters are free");
    }

    const int n_total = std::accumulate(grouped.begin(), grouped.end(), 0,
        [](int acc, const auto& g) { return acc + static_cast<int>(g.size()); });
    if (n_total <= n_free)
        throw InsufficientDataError("no degrees of freedom left: " +
                                    std::to_string(n_total) + " points for " +
                                    std::to_string(n_free) + " free parameters");

    CurveData out;
    out.x.resize(n_total);
    out.y.resize(n_total);
    out.sigma.setOnes(n_total);
    out.series.resize(n_total);
    out.has_sigma = any_sigma;

    int row = 0;
    for (int s = 0; s < n_series; ++s) {
        for (const auto& [xv, pt] : grouped[s]) {
            out.x[row]      = xv;
            out.y[row]      = pt.y_sum / pt.n;
            if (any_sigma)
                out.sigma[row] = std::sqrt(pt.var_sum) / pt.n;
            out.series[row] = s;
            ++row;
        }
    }

    /* ---- normalisation to max |y| = 1 ----------------------------- */
    if (normalize) {
        const double ymax = out.y.cwiseAbs().maxCoeff();
        if (ymax > 0.0) {
            out.norm_factor = ymax;
            out.y     /= ymax;
            if (any_sigma) out.sigma /= ymax;
        }
    }
    return out;
}

} // namespace dragfit
