#pragma once
#include "Types.hpp"
#include "DragModel.hpp"
#include <string>
#include <utility>
#include <vector>

namespace dragfit {

// Raw measurement of one series as handed over by the experiment layer
struct SeriesData {
    std::string         name;
    std::vector<double> x;        // scanned beta
    std::vector<double> y;        // measured signal
    std::vector<double> sigma;    // optional 1-sigma errors (empty = unweighted)
};

/*
 *  All series merged into one set of flat vectors.  Points are grouped by
 *  series (definition order) and sorted by x inside each group.
 */
struct CurveData {
    Vector           x;
    Vector           y;
    Vector           sigma;            // all ones when no errors were given
    std::vector<int> series;           // series index of every point
    bool             has_sigma   = false;
    double           norm_factor = 1.0;   // y_raw = y * norm_factor

    int n_points() const { return static_cast<int>(x.size()); }
    int series_size(int s) const;

    Vector series_x(int s) const;
    Vector series_y(int s) const;

    std::pair<double,double> x_range() const;
    std::pair<double,double> y_range() const;
    double ptp_y() const;
};

/*
 *  Validate, average and merge the raw series.
 *
 *  Throws std::invalid_argument for malformed input and
 *  InsufficientDataError when a series holds fewer than n_free points
 *  or the merged data leaves no degree of freedom.
 */
CurveData format_curve_data(const std::vector<SeriesData>& raw,
                            const DragModel&               model,
                            int                            n_free,
                            bool                           normalize = true);

} // namespace dragfit
