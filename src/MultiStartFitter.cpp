#include "dragfit/MultiStartFitter.hpp"
#include "dragfit/Chi2Utils.hpp"
#include "dragfit/Errors.hpp"
#include "dragfit/MultiSeriesCost.hpp"
#include "dragfit/ThreadPool.hpp"
#include <cmath>
#include <future>
#include <iostream>
#include <limits>

namespace dragfit {

MultiStartFitter::Attempt
MultiStartFitter::fit_candidate(const CurveData&  data,
                                const DragModel&  model,
                                const FitOptions& candidate) const
{
    const FinalizedOptions fin = candidate.finalize();
    MultiSeriesCost cost(data, model);

    LMSolverOptions lm_opt;
    lm_opt.max_iterations = config_.max_iterations;
    lm_opt.absolute_sigma = data.has_sigma;
    lm_opt.verbose        = false;

    Attempt att;
    att.popt    = fin.x0;
    att.summary = levenberg_marquardt(cost, att.popt, fin.free_mask,
                                      fin.lower, fin.upper, lm_opt);

    Vector resid;
    cost(att.popt, &resid, nullptr);
    att.dof           = degrees_of_freedom(data.n_points(), candidate.n_free());
    att.reduced_chisq = reduced_chi_squared(resid, candidate.n_free());
    att.ok = att.summary.converged &&
             std::isfinite(att.reduced_chisq) &&
             att.popt.allFinite();
    return att;
}

FitData MultiStartFitter::fit(const CurveData&               data,
                              const DragModel&               model,
                              const std::vector<FitOptions>& candidates) const
{
    if (candidates.empty())
        throw FitFailedError("no fit candidates were supplied");

    /* ---- skip duplicates (user guesses collapse the fan out) ---------- */
    std::vector<int> distinct;
    for (int i = 0; i < static_cast<int>(candidates.size()); ++i) {
        bool seen = false;
        for (int j : distinct)
            if (candidates[j] == candidates[i]) { seen = true; break; }
        if (!seen) distinct.push_back(i);
    }

    if (config_.verbose)
        std::cout << "[Fit] " << distinct.size() << " distinct of "
                  << candidates.size() << " candidates, "
                  << data.n_points() << " points\n";

    /* ---- run every candidate ----------------------------------------- */
    std::vector<Attempt> attempts(distinct.size());
    {
        ThreadPool pool(config_.n_threads);
        auto futures = pool.enqueue_each(static_cast<int>(distinct.size()),
            [this, &data, &model, &candidates, &distinct](int k) {
                return fit_candidate(data, model, candidates[distinct[k]]);
            });

        for (std::size_t k = 0; k < futures.size(); ++k) {
            try {
                attempts[k] = futures[k].get();
            } catch (const std::exception& e) {
                if (config_.verbose)
                    std::cout << "[Fit]  candidate " << distinct[k]
                              << " threw: " << e.what() << "\n";
                attempts[k].ok = false;
            }
        }
    }

    /* ---- deterministic reduction: min χ²_red, first wins on ties ------ */
    int best = -1;
    int n_ok = 0;
    for (std::size_t k = 0; k < attempts.size(); ++k) {
        const Attempt& a = attempts[k];
        if (config_.verbose)
            std::cout << "[Fit]  candidate " << distinct[k]
                      << (a.ok ? "  ok " : "  failed ")
                      << " χ²_red=" << a.reduced_chisq
                      << " (" << a.summary.stop_reason << ")\n";
        if (!a.ok) continue;
        ++n_ok;
        if (best < 0 || a.reduced_chisq < attempts[best].reduced_chisq)
            best = static_cast<int>(k);
    }

    if (best < 0)
        throw FitFailedError("none of the " + std::to_string(distinct.size()) +
                             " fit candidates converged");

    const Attempt& win = attempts[best];

    FitData fd;
    fd.popt      = win.popt;
    fd.popt_keys.assign(kParamNames.begin(), kParamNames.end());
    fd.perr      = Eigen::Map<const Vector>(win.summary.param_uncertainties.data(),
                                            kNParams);
    fd.pcov      = win.summary.covariance;
    fd.chisq         = win.summary.final_chi2;
    fd.reduced_chisq = win.reduced_chisq;
    fd.dof           = win.dof;
    fd.n_points      = data.n_points();
    fd.norm_factor   = data.norm_factor;

    /* does the oscillation beat a flat line? */
    const auto fixed_base = candidates[distinct[best]].fixed.get("base");
    fd.null_chisq = constant_chi_squared(data.y, data.sigma, fixed_base);
    fd.null_dof   = degrees_of_freedom(data.n_points(), fixed_base ? 0 : 1);
    fd.signal_p_value = fd.null_dof > fd.dof
        ? f_test_p_value(fd.null_chisq, fd.null_dof, fd.chisq, fd.dof)
        : 0.0;     // amp, freq and beta all frozen: nothing to test
    fd.x_range       = data.x_range();
    fd.y_range       = data.y_range();
    fd.candidate_index = distinct[best];
    fd.n_candidates    = static_cast<int>(distinct.size());
    fd.n_successful    = n_ok;
    fd.iterations      = win.summary.iterations;

    if (config_.verbose) {
        const FinalizedOptions fin = candidates[fd.candidate_index].finalize();
        for (int i = 0; i < kNParams; ++i)
            if (fin.free_mask[i] &&
                (fd.popt[i] == fin.lower[i] || fd.popt[i] == fin.upper[i]))
                std::cout << "[Fit]  Warning: '" << kParamNames[i]
                          << "' ended on its bound " << fd.popt[i] << "\n";
    }

    if (config_.verbose)
        std::cout << "[Fit] best candidate " << fd.candidate_index
                  << " of " << fd.n_candidates << " (" << n_ok
                  << " converged), χ²_red = " << fd.reduced_chisq << "\n";
    return fd;
}

} // namespace dragfit
