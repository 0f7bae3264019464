#pragma once
#include "DragAnalysis.hpp"
#include <ostream>

namespace dragfit {

/* parameter table, fit statistics and quality label in plain text */
void print_fit_report(std::ostream& os, const AnalysisResult& result);

} // namespace dragfit
