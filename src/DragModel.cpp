#include "dragfit/DragModel.hpp"
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace dragfit {

static constexpr double kTwoPi = 2.0 * M_PI;

std::vector<SeriesDef> default_series()
{
    return { {"series-0", 1}, {"series-1", 3}, {"series-2", 5} };
}

DragModel::DragModel(std::vector<SeriesDef> defs)
    : defs_(std::move(defs))
{
    if (defs_.empty())
        throw std::invalid_argument("DragModel: no series defined");

    std::unordered_set<std::string> seen;
    for (const auto& d : defs_) {
        if (d.reps <= 0)
            throw std::invalid_argument("DragModel: series '" + d.name +
                                        "' needs a positive repetition count");
        if (!seen.insert(d.name).second)
            throw std::invalid_argument("DragModel: duplicate series '" + d.name + "'");
    }
}

int DragModel::index_of(const std::string& name) const
{
    for (int s = 0; s < n_series(); ++s)
        if (defs_[s].name == name) return s;
    return -1;
}

int DragModel::highest_reps_series() const
{
    int best = 0;
    for (int s = 1; s < n_series(); ++s)
        if (defs_[s].reps > defs_[best].reps) best = s;
    return best;
}

double DragModel::evaluate(int s, double x, const Vector& p) const
{
    const double w = kTwoPi * defs_[s].reps * p[FREQ];
    return p[AMP] * std::cos(w * (x - p[BETA])) + p[BASE];
}

Eigen::RowVector4d DragModel::gradient(int s, double x, const Vector& p) const
{
    const double rw    = kTwoPi * defs_[s].reps;
    const double dx    = x - p[BETA];
    const double phase = rw * p[FREQ] * dx;
    const double c     = std::cos(phase);
    const double sn    = std::sin(phase);

    Eigen::RowVector4d g;
    g[AMP]  = c;
    g[FREQ] = -p[AMP] * sn * rw * dx;
    g[BETA] =  p[AMP] * sn * rw * p[FREQ];
    g[BASE] = 1.0;
    return g;
}

} // namespace dragfit
