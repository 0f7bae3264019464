#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace dragfit {

/* One curve of the experiment: its label and the (fixed) number of
   DRAG plus/minus pulse pairs played before the measurement. */
struct SeriesDef {
    std::string name;
    int         reps = 1;
};

/* series-0/1/2 with 1, 3 and 5 repetitions */
std::vector<SeriesDef> default_series();

/*
 *  y_s(x) = amp * cos( 2 pi reps_s freq (x - beta) ) + base
 *
 *  All series share amp, freq, beta and base; the series index only selects
 *  the repetition count that multiplies the frequency.
 */
class DragModel {
public:
    explicit DragModel(std::vector<SeriesDef> defs = default_series());

    const std::vector<SeriesDef>& series() const { return defs_; }
    int n_series() const { return static_cast<int>(defs_.size()); }
    int reps(int s) const { return defs_[s].reps; }

    /* -1 if no series carries this name */
    int index_of(const std::string& name) const;

    /* series with the most repetitions (first one on ties) */
    int highest_reps_series() const;

    double evaluate(int s, double x, const Vector& p) const;

    /* d y / d (amp, freq, beta, base) */
    Eigen::RowVector4d gradient(int s, double x, const Vector& p) const;

private:
    std::vector<SeriesDef> defs_;
};

} // namespace dragfit
