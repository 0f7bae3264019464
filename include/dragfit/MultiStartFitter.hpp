#pragma once
#include "CurveData.hpp"
#include "DragModel.hpp"
#include "FitData.hpp"
#include "FitOptions.hpp"
#include "SimpleLM.hpp"
#include <vector>

namespace dragfit {

/*
 *  Runs the bounded Levenberg–Marquardt solver once per distinct candidate
 *  and keeps the converged fit with the lowest reduced χ².  Candidates are
 *  independent and are spread over a ThreadPool; the winner does not depend
 *  on completion order (ties go to the earlier candidate).
 */
class MultiStartFitter {
public:
    struct Config {
        unsigned n_threads      = 0;      // 0 = hardware concurrency
        int      max_iterations = 200;
        bool     verbose        = false;
    };

    explicit MultiStartFitter(const Config& config) : config_(config) {}

    /* throws FitFailedError when no candidate converges */
    FitData fit(const CurveData&               data,
                const DragModel&               model,
                const std::vector<FitOptions>& candidates) const;

private:
    struct Attempt {
        bool            ok            = false;
        Vector          popt;
        LMSolverSummary summary;
        double          reduced_chisq = 0.0;
        int             dof           = 0;
    };

    Attempt fit_candidate(const CurveData&  data,
                          const DragModel&  model,
                          const FitOptions& candidate) const;

    Config config_;
};

} // namespace dragfit
