#pragma once
#include <Eigen/Dense>
#include <array>
#include <string>

namespace dragfit {
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	/* order of the shared fit parameters in every parameter vector */
	enum ParamIndex { AMP = 0, FREQ = 1, BETA = 2, BASE = 3 };
	constexpr int kNParams = 4;
	inline const std::array<std::string, kNParams> kParamNames =
		{ "amp", "freq", "beta", "base" };

	int param_index(const std::string& name);   // -1 if unknown
} // namespace dragfit
