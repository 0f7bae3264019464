#pragma once
#include "Types.hpp"
#include "Uncertainty.hpp"
#include <string>
#include <utility>
#include <vector>

namespace dragfit {

/* Outcome of the multi-start fit (best candidate only). */
struct FitData {
    Vector                   popt;          // amp, freq, beta, base
    std::vector<std::string> popt_keys;
    Vector                   perr;          // 1-σ, 0 for fixed parameters
    Matrix                   pcov;

    double chisq         = 0.0;
    double reduced_chisq = 0.0;
    int    dof           = 0;
    int    n_points      = 0;

    /* constant-signal model y = base, the reference for the F test */
    double null_chisq     = 0.0;
    int    null_dof       = 0;
    double signal_p_value = 1.0;   // P(F >= observed) if no oscillation exists

    std::pair<double,double> x_range;
    std::pair<double,double> y_range;

    double norm_factor = 1.0;    // amp, base and chisq refer to y / norm_factor

    int candidate_index = -1;     // position in the guess list
    int n_candidates    = 0;      // distinct candidates that were tried
    int n_successful    = 0;
    int iterations      = 0;

    /* throws std::out_of_range for unknown names */
    UFloat fitval(const std::string& name) const;
};

} // namespace dragfit
