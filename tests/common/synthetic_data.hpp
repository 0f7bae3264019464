#pragma once
#include "dragfit/CurveData.hpp"
#include "dragfit/DragModel.hpp"
#include "dragfit/Types.hpp"
#include <random>
#include <utility>
#include <vector>

namespace dragfit::testing {

inline Vector drag_params(double amp, double freq, double beta, double base)
{
    Vector p(kNParams);
    p[AMP]  = amp;
    p[FREQ] = freq;
    p[BETA] = beta;
    p[BASE] = base;
    return p;
}

inline std::vector<double> linspace(double lo, double hi, int n)
{
    std::vector<double> out(n);
    for (int i = 0; i < n; ++i)
        out[i] = (n == 1) ? lo : lo + (hi - lo) * i / (n - 1);
    return out;
}

/* one SeriesData per model series, sampled on xs; noise_sigma > 0 adds
   seeded Gaussian noise, and with_sigma stores it as the point error */
inline std::vector<SeriesData> make_drag_series(const DragModel&           model,
                                                const Vector&              p,
                                                const std::vector<double>& xs,
                                                double                     noise_sigma = 0.0,
                                                bool                       with_sigma  = false,
                                                unsigned                   seed        = 7)
{
    std::mt19937 rng(seed);
    std::normal_distribution<> gauss(0.0, noise_sigma > 0.0 ? noise_sigma : 1.0);

    std::vector<SeriesData> out;
    for (int s = 0; s < model.n_series(); ++s) {
        SeriesData d;
        d.name = model.series()[s].name;
        d.x    = xs;
        for (double x : xs) {
            double y = model.evaluate(s, x, p);
            if (noise_sigma > 0.0) y += gauss(rng);
            d.y.push_back(y);
        }
        if (with_sigma)
            d.sigma.assign(xs.size(), noise_sigma);
        out.push_back(std::move(d));
    }
    return out;
}

/* flat signal plus noise: nothing oscillates */
inline std::vector<SeriesData> make_noise_series(const DragModel&           model,
                                                 const std::vector<double>& xs,
                                                 double                     level,
                                                 double                     noise_sigma,
                                                 double                     point_sigma,
                                                 unsigned                   seed = 11)
{
    std::mt19937 rng(seed);
    std::normal_distribution<> gauss(0.0, noise_sigma);

    std::vector<SeriesData> out;
    for (int s = 0; s < model.n_series(); ++s) {
        SeriesData d;
        d.name = model.series()[s].name;
        d.x    = xs;
        for (std::size_t i = 0; i < xs.size(); ++i)
            d.y.push_back(level + gauss(rng));
        d.sigma.assign(xs.size(), point_sigma);
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace dragfit::testing
