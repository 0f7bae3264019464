#pragma once
#include "CurveData.hpp"
#include "DragModel.hpp"
#include "FitOptions.hpp"
#include <array>
#include <vector>

namespace dragfit {

/* amplitude seeds as a fraction of the peak-to-peak signal */
inline constexpr std::array<double, 3> kAmpFactors = { -1.0, -0.5, -0.25 };
/* beta seeds, evenly spaced over the scanned range */
inline constexpr int kNBetaGuesses = 20;

/*
 *  Data-driven initial guesses and bounds for the DRAG model, fanned out
 *  into kAmpFactors.size() × kNBetaGuesses multi-start candidates.
 *
 *  Every value already present in `user_opt` (p0, bounds, fixed) is kept;
 *  the generator only fills the gaps.
 */
std::vector<FitOptions> generate_fit_guesses(const CurveData& data,
                                             const DragModel& model,
                                             FitOptions       user_opt,
                                             bool             verbose = false);

} // namespace dragfit
