#include <catch2/catch.hpp>
#include "dragfit/DragGuess.hpp"
#include "dragfit/Errors.hpp"
#include "dragfit/MultiStartFitter.hpp"
#include "common/synthetic_data.hpp"

using namespace dragfit;
using namespace dragfit::testing;

namespace {

struct Setup {
	DragModel               model;
	CurveData               data;
	std::vector<FitOptions> guesses;
};

Setup noisy_scan(double noise) {
	Setup s;
	const auto raw = make_drag_series(s.model, drag_params(-0.5, 0.5, 0.02, 0.5),
	                                  linspace(-2, 2, 51), noise);
	s.data    = format_curve_data(raw, s.model, kNParams, false);
	s.guesses = generate_fit_guesses(s.data, s.model, FitOptions{});
	return s;
}

} // namespace

TEST_CASE("MultiStartFitter picks the lowest reduced chi2", "[fitter]") {
	const Setup s = noisy_scan(0.0);
	MultiStartFitter::Config cfg;
	cfg.n_threads = 2;

	const FitData fd = MultiStartFitter(cfg).fit(s.data, s.model, s.guesses);
	CHECK(fd.reduced_chisq < 1e-12);
	CHECK(fd.n_candidates == 60);
	CHECK(fd.n_successful >= 1);
	CHECK(fd.dof == 153 - 4);
	CHECK(fd.null_dof == 153 - 1);
	CHECK(fd.signal_p_value < 1e-12);
	CHECK(fd.norm_factor == 1.0);
	CHECK(fd.popt[AMP] == Approx(-0.5).margin(1e-6));
	CHECK(fd.popt[FREQ] == Approx(0.5).margin(1e-6));
	CHECK(fd.popt[BASE] == Approx(0.5).margin(1e-6));
	// beta is only fixed up to one period of 1/freq
	const double wraps = (fd.popt[BETA] - 0.02) / 2.0;
	CHECK(wraps == Approx(std::round(wraps)).margin(1e-6));
	CHECK(fd.popt_keys == std::vector<std::string>(kParamNames.begin(), kParamNames.end()));
}

TEST_CASE("MultiStartFitter result does not depend on the thread count", "[fitter]") {
	const Setup s = noisy_scan(0.02);
	MultiStartFitter::Config one, four;
	one.n_threads  = 1;
	four.n_threads = 4;

	const FitData a = MultiStartFitter(one).fit(s.data, s.model, s.guesses);
	const FitData b = MultiStartFitter(four).fit(s.data, s.model, s.guesses);
	CHECK(a.candidate_index == b.candidate_index);
	CHECK(a.n_successful == b.n_successful);
	for (int k = 0; k < kNParams; ++k)
		CHECK(a.popt[k] == Approx(b.popt[k]).epsilon(1e-12));
}

TEST_CASE("MultiStartFitter skips duplicate candidates", "[fitter]") {
	const Setup s = noisy_scan(0.0);
	FitOptions user;
	user.p0.set("beta", 0.1);
	const auto guesses = generate_fit_guesses(s.data, s.model, user);

	const FitData fd = MultiStartFitter(MultiStartFitter::Config{}).fit(s.data, s.model, guesses);
	CHECK(fd.n_candidates == 3);
	CHECK(fd.candidate_index % kNBetaGuesses == 0);
}

TEST_CASE("MultiStartFitter fails when nothing converges", "[fitter]") {
	const Setup s = noisy_scan(0.0);
	MultiStartFitter::Config cfg;
	cfg.max_iterations = 1;

	CHECK_THROWS_AS(MultiStartFitter(cfg).fit(s.data, s.model, s.guesses), FitFailedError);
	CHECK_THROWS_AS(MultiStartFitter(MultiStartFitter::Config{}).fit(s.data, s.model, {}), FitFailedError);
}
