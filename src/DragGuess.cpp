#include "dragfit/DragGuess.hpp"
#include "dragfit/FrequencyGuess.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace dragfit {

std::vector<FitOptions> generate_fit_guesses(const CurveData& data,
                                             const DragModel& model,
                                             FitOptions       user_opt,
                                             bool             verbose)
{
    const auto [min_beta, max_beta] = data.x_range();
    const auto [min_y, max_y]       = data.y_range();
    const double ptp_y              = data.ptp_y();

    /* ---- frequency from the curve with the most repetitions ---------- */
    const int    s_freq = model.highest_reps_series();
    const double freq_guess =
        guess_frequency(data.series_x(s_freq), data.series_y(s_freq))
        / model.reps(s_freq);
    user_opt.p0.set_if_empty("freq", freq_guess);

    if (verbose)
        std::cout << "[Guess] freq = " << freq_guess << " from '"
                  << model.series()[s_freq].name << "' (reps = "
                  << model.reps(s_freq) << ")\n";

    /* ---- bounds ------------------------------------------------------- */
    const double avg_x  = 0.5 * (max_beta + min_beta);
    const double span_x = max_beta - min_beta;
    const double freq0  = user_opt.fixed.get("freq").value_or(user_opt.p0.at("freq"));
    const double beta_bound = std::max(5.0 / freq0, span_x);   // 5/0 = inf
    const double inf = std::numeric_limits<double>::infinity();

    /* the optimum is a minimum of all curves only for amp < 0 */
    user_opt.bounds.set_if_empty("amp",  { -2.0 * ptp_y, 0.0 });
    user_opt.bounds.set_if_empty("freq", { 0.0, inf });
    user_opt.bounds.set_if_empty("beta", { avg_x - beta_bound, avg_x + beta_bound });
    user_opt.bounds.set_if_empty("base", { min_y - ptp_y, max_y + ptp_y });

    /* a non-zero user amplitude doubles as the base line seed */
    const double base_guess = 0.5 * (max_y - min_y);
    const double user_amp   = user_opt.p0.get("amp").value_or(0.0);
    user_opt.p0.set_if_empty("base", user_amp != 0.0 ? user_amp : base_guess);

    /* ---- multi-start fan out ------------------------------------------ */
    /* flat curves make the y-range a poor amplitude estimate, hence the
       three scales */
    std::vector<FitOptions> options;
    options.reserve(kAmpFactors.size() * kNBetaGuesses);

    for (double amp_factor : kAmpFactors) {
        for (int k = 0; k < kNBetaGuesses; ++k) {
            const double beta_guess =
                min_beta + (max_beta - min_beta) * k / (kNBetaGuesses - 1);

            FitOptions opt = user_opt;
            opt.p0.set_if_empty("amp",  ptp_y * amp_factor);
            opt.p0.set_if_empty("beta", beta_guess);
            options.push_back(std::move(opt));
        }
    }

    if (verbose)
        std::cout << "[Guess] " << options.size() << " candidates, beta window ±"
                  << beta_bound << " around " << avg_x << "\n";
    return options;
}

} // namespace dragfit
