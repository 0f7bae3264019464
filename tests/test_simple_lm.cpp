#include <catch2/catch.hpp>
#include "dragfit/Chi2Utils.hpp"
#include "dragfit/SimpleLM.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace dragfit;

namespace {

/* y = a * exp(-b x), optional per-point sigma */
struct ExpDecay {
	std::vector<double> x, y;
	double sigma = 1.0;

	void operator()(const Eigen::VectorXd& p, Eigen::VectorXd* r, Eigen::MatrixXd* J) const {
		const int n = static_cast<int>(x.size());
		r->resize(n);
		if (J) J->resize(n, 2);
		for (int i = 0; i < n; ++i) {
			const double e = std::exp(-p[1] * x[i]);
			(*r)[i] = (p[0] * e - y[i]) / sigma;
			if (J) {
				(*J)(i, 0) = e / sigma;
				(*J)(i, 1) = -p[0] * x[i] * e / sigma;
			}
		}
	}
};

ExpDecay make_decay(double a, double b) {
	ExpDecay f;
	for (int i = 0; i < 30; ++i) {
		f.x.push_back(0.1 * i);
		f.y.push_back(a * std::exp(-b * 0.1 * i));
	}
	return f;
}

} // namespace

TEST_CASE("LM recovers an exponential decay", "[lm]") {
	const ExpDecay f = make_decay(2.0, 1.3);
	Eigen::VectorXd x(2);
	x << 1.0, 0.5;

	const LMSolverSummary s = levenberg_marquardt(f, x, {}, {}, {});
	REQUIRE(s.converged);
	CHECK(x[0] == Approx(2.0).epsilon(1e-8));
	CHECK(x[1] == Approx(1.3).epsilon(1e-8));
	CHECK(s.final_chi2 < 1e-16);
	CHECK(s.n_residuals == 30);
	CHECK(s.n_free == 2);
}

TEST_CASE("LM keeps the solution inside the bounds", "[lm]") {
	const ExpDecay f = make_decay(2.0, 1.3);
	Eigen::VectorXd x(2);
	x << 1.0, 0.5;

	const std::vector<double> lower = {0.0, 0.0};
	const std::vector<double> upper = {1.5, 10.0};
	levenberg_marquardt(f, x, {}, lower, upper);

	CHECK(x[0] <= 1.5);
	CHECK(x[0] == Approx(1.5).margin(1e-4));
	CHECK(x[1] >= 0.0);
}

TEST_CASE("LM leaves frozen parameters untouched", "[lm]") {
	const ExpDecay f = make_decay(2.0, 1.3);
	Eigen::VectorXd x(2);
	x << 1.0, 1.3;

	const LMSolverSummary s = levenberg_marquardt(f, x, {true, false}, {}, {});
	REQUIRE(s.converged);
	CHECK(s.n_free == 1);
	CHECK(x[1] == 1.3);
	CHECK(x[0] == Approx(2.0).epsilon(1e-8));
	CHECK(s.param_uncertainties[1] == 0.0);
	CHECK(s.covariance(1, 1) == 0.0);
}

TEST_CASE("LM covariance of a straight line with known sigma", "[lm]") {
	/* r_i = (a + b x_i - y_i) / sigma with x = 0..4 */
	const double sigma = 0.2;
	const std::vector<double> xs = {0, 1, 2, 3, 4};
	const std::vector<double> ys = {1.1, 2.9, 5.2, 6.8, 9.1};
	auto line = [&](const Eigen::VectorXd& p, Eigen::VectorXd* r, Eigen::MatrixXd* J) {
		r->resize(5);
		if (J) J->resize(5, 2);
		for (int i = 0; i < 5; ++i) {
			(*r)[i] = (p[0] + p[1] * xs[i] - ys[i]) / sigma;
			if (J) {
				(*J)(i, 0) = 1.0 / sigma;
				(*J)(i, 1) = xs[i] / sigma;
			}
		}
	};

	Eigen::VectorXd p = Eigen::VectorXd::Zero(2);
	LMSolverOptions opt;
	opt.absolute_sigma = true;
	const LMSolverSummary s = levenberg_marquardt(line, p, {}, {}, {}, opt);
	REQUIRE(s.converged);

	/* (JᵀJ)⁻¹ = σ² [[Σx², -Σx], [-Σx, n]] / (n Σx² - (Σx)²) with n=5, Σx=10, Σx²=30 */
	const double det = 5.0 * 30.0 - 100.0;
	CHECK(s.covariance(0, 0) == Approx(sigma * sigma * 30.0 / det));
	CHECK(s.covariance(1, 1) == Approx(sigma * sigma * 5.0 / det));
	CHECK(s.covariance(0, 1) == Approx(-sigma * sigma * 10.0 / det));
	CHECK(s.param_uncertainties[1] == Approx(std::sqrt(sigma * sigma * 5.0 / det)));

	/* relative errors scale the covariance by χ²/dof */
	Eigen::VectorXd q = Eigen::VectorXd::Zero(2);
	const LMSolverSummary rel = levenberg_marquardt(line, q, {}, {}, {});
	CHECK(rel.covariance(1, 1) == Approx(s.covariance(1, 1) * rel.final_chi2 / 3.0));
}

TEST_CASE("LM reports the iteration limit as not converged", "[lm]") {
	const ExpDecay f = make_decay(2.0, 1.3);
	Eigen::VectorXd x(2);
	x << 50.0, 20.0;

	LMSolverOptions opt;
	opt.max_iterations = 1;
	const LMSolverSummary s = levenberg_marquardt(f, x, {}, {}, {}, opt);
	CHECK_FALSE(s.converged);
	CHECK(s.iterations == 1);
	CHECK(s.stop_reason == "maximum number of iterations");
}

TEST_CASE("Constant model chi2", "[lm][chi2]") {
	Vector y(4), sigma(4);
	y << 1.0, 2.0, 3.0, 4.0;
	sigma << 1.0, 1.0, 1.0, 1.0;
	CHECK(constant_chi_squared(y, sigma) == Approx(5.0));          // mean 2.5
	CHECK(constant_chi_squared(y, sigma, 0.0) == Approx(30.0));

	// the weighted mean is the best constant
	sigma << 0.01, 1.0, 1.0, 1.0;
	CHECK(constant_chi_squared(y, sigma) <= constant_chi_squared(y, sigma, 1.0));
	CHECK(constant_chi_squared(y, sigma) < constant_chi_squared(y, sigma, 2.5));
	CHECK_THROWS_AS(constant_chi_squared(y, Vector(2)), std::invalid_argument);
}

TEST_CASE("F test of nested models", "[lm][chi2]") {
	// F(2, 2) has survival 1 / (1 + F)
	CHECK(f_test_p_value(4.0, 4, 2.0, 2) == Approx(0.5));
	CHECK(f_test_p_value(10.0, 4, 2.0, 2) == Approx(1.0 / 5.0));
	CHECK(f_test_p_value(2.0, 4, 2.0, 2) == 1.0);
	CHECK(f_test_p_value(2.0, 4, 0.0, 2) == 0.0);
	CHECK(f_test_p_value(300.0, 152, 100.0, 149) < f_test_p_value(120.0, 152, 100.0, 149));
	CHECK_THROWS_AS(f_test_p_value(4.0, 2, 2.0, 2), std::invalid_argument);
}

TEST_CASE("Chi2 helpers", "[lm][chi2]") {
	Vector r(5);
	r << 1, -1, 2, 0, 0;
	CHECK(chi_squared(r) == 6.0);
	CHECK(degrees_of_freedom(5, 2) == 3);
	CHECK(degrees_of_freedom(3, 4) == 1);
	CHECK(reduced_chi_squared(r, 2) == Approx(2.0));
}
