#include <catch2/catch.hpp>
#include "dragfit/JsonUtils.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>

using namespace dragfit;
using nlohmann::json;

TEST_CASE("Analysis settings are read from JSON", "[json]") {
	const json j = json::parse(R"({
		"series": [ {"name": "a", "reps": 1}, {"name": "b", "reps": 4} ],
		"initialGuess": { "beta": 0.1 },
		"bounds": { "amp": [-1.0, 0.0], "freq": [0.0, "inf"], "base": [null, 2.0] },
		"fixed": { "freq": 0.25 },
		"normalization": false,
		"threads": 3,
		"maxIterations": 50,
		"chi2Threshold": 2.0,
		"betaErrorFraction": 0.5,
		"signalPValue": 0.001,
		"verbose": true
	})");

	const AnalysisConfig cfg = analysis_config_from_json(j);
	REQUIRE(cfg.series.size() == 2);
	CHECK(cfg.series[1].name == "b");
	CHECK(cfg.series[1].reps == 4);
	CHECK(cfg.user_options.p0.at("beta") == 0.1);
	CHECK(cfg.user_options.bounds.at("amp") == Bounds{-1.0, 0.0});
	CHECK(std::isinf(cfg.user_options.bounds.at("freq").upper));
	CHECK(std::isinf(cfg.user_options.bounds.at("base").lower));
	CHECK(cfg.user_options.bounds.at("base").upper == 2.0);
	CHECK(cfg.user_options.fixed.at("freq") == 0.25);
	CHECK_FALSE(cfg.normalization);
	CHECK(cfg.n_threads == 3);
	CHECK(cfg.max_iterations == 50);
	CHECK(cfg.reduced_chi2_threshold == 2.0);
	CHECK(cfg.beta_error_fraction == 0.5);
	CHECK(cfg.signal_p_value == 0.001);
	CHECK(cfg.verbose);
}

TEST_CASE("Missing JSON settings keep their defaults", "[json]") {
	const AnalysisConfig cfg = analysis_config_from_json(json::object());
	CHECK(cfg.series.size() == 3);
	CHECK(cfg.normalization);
	CHECK(cfg.reduced_chi2_threshold == 3.0);
	CHECK(cfg.user_options.p0.empty());
	CHECK(cfg.n_threads == 0);
}

TEST_CASE("Malformed JSON settings are rejected", "[json]") {
	CHECK_THROWS_AS(analysis_config_from_json(json::parse(R"({"initialGuess": {"gamma": 1}})")),
	                std::invalid_argument);
	CHECK_THROWS_AS(analysis_config_from_json(json::parse(R"({"bounds": {"amp": [0]}})")),
	                std::invalid_argument);
	CHECK_THROWS_AS(analysis_config_from_json(json::parse(R"({"bounds": {"amp": [1, 0]}})")),
	                std::invalid_argument);
	CHECK_THROWS_AS(analysis_config_from_json(json::parse(R"({"bounds": {"amp": ["big", 0]}})")),
	                std::invalid_argument);
	CHECK_THROWS_AS(analysis_config_from_json(json::parse(R"({"threads": -2})")),
	                std::invalid_argument);
}

TEST_CASE("Series measurements are read from JSON", "[json]") {
	const json j = json::parse(R"({
		"series": [
			{"name": "series-0", "x": [0, 1, 2], "y": [0.1, 0.2, 0.3]},
			{"name": "series-1", "x": [0, 1], "y": [0.5, 0.6], "sigma": [0.01, 0.02]}
		]
	})");
	const auto series = series_from_json(j);
	REQUIRE(series.size() == 2);
	CHECK(series[0].x.size() == 3);
	CHECK(series[0].sigma.empty());
	CHECK(series[1].sigma[1] == 0.02);

	CHECK_THROWS_AS(series_from_json(json::object()), std::invalid_argument);
}

TEST_CASE("Environment variables are expanded in strings", "[json]") {
	setenv("DRAGFIT_TEST_DIR", "/data/run7", 1);
	json j = json::parse(R"({"path": "${DRAGFIT_TEST_DIR}/scan.json", "list": ["${DRAGFIT_TEST_DIR}"], "n": 1})");
	expand_env(j);
	CHECK(j["path"] == "/data/run7/scan.json");
	CHECK(j["list"][0] == "/data/run7");
	CHECK(j["n"] == 1);
}

TEST_CASE("Loading a missing file throws", "[json]") {
	CHECK_THROWS_AS(load_json("/nonexistent/dragfit.json"), std::runtime_error);
}
