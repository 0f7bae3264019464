#pragma once
#include "CurveData.hpp"
#include "DragAnalysis.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dragfit {
nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

/* "series", "initialGuess", "bounds", "fixed", "normalization", "threads",
   "maxIterations", "chi2Threshold", "betaErrorFraction", "signalPValue",
   "verbose" */
AnalysisConfig analysis_config_from_json(const nlohmann::json& j);

/* measurement arrays of every entry in "series" */
std::vector<SeriesData> series_from_json(const nlohmann::json& j);
} // namespace dragfit
