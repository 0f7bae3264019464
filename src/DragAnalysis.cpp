#include "dragfit/DragAnalysis.hpp"
#include "dragfit/DragGuess.hpp"
#include "dragfit/Errors.hpp"
#include "dragfit/MultiStartFitter.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace dragfit {

const char* to_string(Quality q)
{
    return q == Quality::Good ? "good" : "bad";
}

DragAnalysis::DragAnalysis(AnalysisConfig config)
    : config_(std::move(config))
    , model_(config_.series)
{
    if (!(config_.signal_p_value > 0.0 && config_.signal_p_value <= 1.0))
        throw std::invalid_argument("signal_p_value must lie in (0, 1]");
    if (config_.max_iterations <= 0)
        throw std::invalid_argument("max_iterations must be positive");
    if (config_.user_options.n_free() <= 0)
        throw std::invalid_argument("all fit parameters are fixed");
}

/* ------------------------------------------------------------------------- */
/*  stages                                                                   */
/* ------------------------------------------------------------------------- */
CurveData DragAnalysis::format_data(const std::vector<SeriesData>& series) const
{
    return format_curve_data(series, model_,
                             config_.user_options.n_free(),
                             config_.normalization);
}

std::vector<FitOptions> DragAnalysis::generate_guesses(const CurveData& data) const
{
    return generate_fit_guesses(data, model_, config_.user_options, config_.verbose);
}

FitData DragAnalysis::fit(const CurveData& data,
                          const std::vector<FitOptions>& candidates) const
{
    MultiStartFitter::Config fc;
    fc.n_threads      = config_.n_threads;
    fc.max_iterations = config_.max_iterations;
    fc.verbose        = config_.verbose;
    return MultiStartFitter(fc).fit(data, model_, candidates);
}

double DragAnalysis::canonical_beta(double beta, double freq)
{
    if (!(freq > 0.0) || !std::isfinite(freq)) {
        std::ostringstream msg;
        msg << "cannot map beta onto its first period: freq = " << freq;
        throw InvalidFitResultError(msg.str());
    }
    if (!std::isfinite(beta))
        throw InvalidFitResultError("fitted beta is not finite");

    const double period  = 1.0 / freq;
    const double shifted = beta + 0.5 * period;
    const double wrapped = shifted - period * std::floor(shifted / period);   // floor modulo
    return wrapped - 0.5 * period;
}

void DragAnalysis::post_process(FitData& fit_data) const
{
    const double beta = fit_data.popt[BETA];
    const double freq = fit_data.popt[FREQ];
    fit_data.popt[BETA] = canonical_beta(beta, freq);

    if (config_.verbose && fit_data.popt[BETA] != beta)
        std::cout << "[Drag] beta " << beta << " -> " << fit_data.popt[BETA]
                  << " (period " << 1.0 / freq << ")\n";
}

Quality DragAnalysis::evaluate_quality(const FitData& fit_data) const
{
    const UFloat fit_beta = fit_data.fitval("beta");
    const UFloat fit_freq = fit_data.fitval("freq");

    const bool chi2_ok  = fit_data.reduced_chisq < config_.reduced_chi2_threshold;
    const bool beta_ok  = fit_freq.nominal > 0.0 &&
                          std::abs(fit_beta.nominal) < 0.5 / fit_freq.nominal;
    const bool error_ok = is_error_not_significant(fit_beta,
                                                   config_.beta_error_fraction);
    /* noise fits itself with any chi2 once sigma is estimated from the
       scatter; the cosine must clearly beat a constant signal */
    const bool signal_ok = fit_data.signal_p_value < config_.signal_p_value;

    if (config_.verbose)
        std::cout << "[Drag] quality: χ²_red " << (chi2_ok ? "ok" : "too large")
                  << ", beta in first period " << (beta_ok ? "yes" : "no")
                  << ", beta error " << (error_ok ? "ok" : "significant")
                  << ", oscillation p = " << fit_data.signal_p_value << "\n";

    return (chi2_ok && beta_ok && error_ok && signal_ok) ? Quality::Good : Quality::Bad;
}

/* ------------------------------------------------------------------------- */
/*  full pipeline                                                            */
/* ------------------------------------------------------------------------- */
AnalysisResult DragAnalysis::run(const std::vector<SeriesData>& series) const
{
    const CurveData data = format_data(series);
    const std::vector<FitOptions> candidates = generate_guesses(data);

    AnalysisResult res;
    res.fit = fit(data, candidates);
    post_process(res.fit);
    res.beta    = res.fit.fitval("beta");
    res.quality = evaluate_quality(res.fit);

    if (config_.verbose)
        std::cout << "[Drag] beta = " << res.beta << "  ("
                  << to_string(res.quality) << ")\n";
    return res;
}

} // namespace dragfit
