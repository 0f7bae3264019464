#pragma once
#include <stdexcept>
#include <string>

namespace dragfit {

enum class AnalysisStage { DataFormatting, Fitting, PostProcessing };

const char* to_string(AnalysisStage stage);

/*  Base of every failure that aborts an analysis run.  The stage tells the
 *  caller where the pipeline stopped; a "bad" quality label is *not* an
 *  error and never ends up here.
 */
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(AnalysisStage stage, const std::string& what);
    AnalysisStage stage() const noexcept { return stage_; }

private:
    AnalysisStage stage_;
};

class InsufficientDataError : public AnalysisError {
public:
    explicit InsufficientDataError(const std::string& what)
        : AnalysisError(AnalysisStage::DataFormatting, what) {}
};

class FitFailedError : public AnalysisError {
public:
    explicit FitFailedError(const std::string& what)
        : AnalysisError(AnalysisStage::Fitting, what) {}
};

class InvalidFitResultError : public AnalysisError {
public:
    explicit InvalidFitResultError(const std::string& what)
        : AnalysisError(AnalysisStage::PostProcessing, what) {}
};

} // namespace dragfit
