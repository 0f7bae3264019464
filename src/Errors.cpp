#include "dragfit/Errors.hpp"

namespace dragfit {

const char* to_string(AnalysisStage stage)
{
    switch (stage) {
        case AnalysisStage::DataFormatting: return "data formatting";
        case AnalysisStage::Fitting:        return "fitting";
        case AnalysisStage::PostProcessing: return "post-processing";
    }
    return "unknown";
}

AnalysisError::AnalysisError(AnalysisStage stage, const std::string& what)
    : std::runtime_error(std::string("[") + to_string(stage) + "] " + what)
    , stage_(stage)
{
}

} // namespace dragfit
