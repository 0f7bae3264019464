#pragma once
#include "CurveData.hpp"
#include "DragModel.hpp"
#include "FitData.hpp"
#include "FitOptions.hpp"
#include "Uncertainty.hpp"
#include <string>
#include <vector>

namespace dragfit {

enum class Quality { Good, Bad };

const char* to_string(Quality q);

/* Everything that steers one analysis run. */
struct AnalysisConfig {
    std::vector<SeriesDef> series = default_series();

    /* user guesses / bounds / frozen parameters, never overwritten */
    FitOptions user_options;

    bool     normalization          = true;
    unsigned n_threads              = 0;      // 0 = hardware concurrency
    int      max_iterations         = 200;    // per candidate
    double   reduced_chi2_threshold = 3.0;
    double   beta_error_fraction    = 1.0;
    double   signal_p_value         = 1e-6;   // F test against a flat line
    bool     verbose                = false;
};

struct AnalysisResult {
    FitData fit;           // beta already mapped closest to zero
    UFloat  beta;
    Quality quality = Quality::Bad;
};

/*
 *  DRAG calibration analysis.
 *
 *  Three (or more) series measured with different numbers of DRAG pulse
 *  repetitions are fitted jointly with
 *
 *      y_i = amp cos(2 pi reps_i freq (x - beta)) + base
 *
 *  sharing amp, freq, beta and base.  The calibrated beta is where every
 *  curve sits at its minimum, which requires amp < 0; the amplitude is
 *  therefore bounded above by zero.  Since beta is only defined modulo
 *  1/freq, the fitted value is mapped onto the representative closest to
 *  zero before the fit quality is judged.
 */
class DragAnalysis {
public:
    explicit DragAnalysis(AnalysisConfig config);

    const AnalysisConfig& config() const { return config_; }
    const DragModel&      model()  const { return model_; }

    /* data formatting -> guesses -> multi-start fit -> post-processing ->
       quality; throws an AnalysisError subclass naming the failed stage */
    AnalysisResult run(const std::vector<SeriesData>& series) const;

    /* individual stages, exposed for callers that drive them separately */
    CurveData               format_data(const std::vector<SeriesData>& series) const;
    std::vector<FitOptions> generate_guesses(const CurveData& data) const;
    FitData                 fit(const CurveData& data,
                                const std::vector<FitOptions>& candidates) const;
    void                    post_process(FitData& fit_data) const;
    Quality                 evaluate_quality(const FitData& fit_data) const;

    /* ((beta + p/2) mod p) - p/2 with p = 1/freq; throws
       InvalidFitResultError for freq <= 0 */
    static double canonical_beta(double beta, double freq);

private:
    AnalysisConfig config_;
    DragModel      model_;
};

} // namespace dragfit
