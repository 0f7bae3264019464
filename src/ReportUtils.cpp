#include "dragfit/ReportUtils.hpp"
#include <iomanip>
#include <sstream>

namespace dragfit {

static std::string description(const std::string& tag)
{
    if (tag == "amp")  return "Amplitude of all series";
    if (tag == "freq") return "Frequency of one DRAG +/- pair";
    if (tag == "beta") return "Calibrated DRAG parameter beta";
    if (tag == "base") return "Base line of all series";
    return tag;
}

static std::string fmt_number(double v, int prec = 6)
{
    std::ostringstream s;
    s << std::setprecision(prec) << v;
    return s.str();
}

void print_fit_report(std::ostream& os, const AnalysisResult& result)
{
    const FitData& fd = result.fit;

    os << "\n=== DRAG fit ===\n";
    if (fd.norm_factor != 1.0)
        os << "(fitted on y / " << fmt_number(fd.norm_factor)
           << "; amp and base below are rescaled to the input signal)\n";

    for (std::size_t i = 0; i < fd.popt_keys.size(); ++i) {
        const std::string& key = fd.popt_keys[i];
        const double scale = (key == "amp" || key == "base") ? fd.norm_factor : 1.0;
        os << std::left  << std::setw(6)  << key
           << std::right << std::setw(14) << fmt_number(fd.popt[i] * scale)
           << " +/- "    << std::left << std::setw(12) << fmt_number(fd.perr[i] * scale, 3)
           << description(key) << '\n';
    }

    os << "\nreduced chi2 : " << fmt_number(fd.reduced_chisq)
       << "  (chi2 = " << fmt_number(fd.chisq) << ", dof = " << fd.dof << ")\n"
       << "flat signal  : chi2 = " << fmt_number(fd.null_chisq)
       << ", p(no oscillation) = " << fmt_number(fd.signal_p_value, 3) << "\n"
       << "candidates   : " << fd.n_successful << " of " << fd.n_candidates
       << " converged, best #" << fd.candidate_index
       << " after " << fd.iterations << " iterations\n"
       << "beta         : " << result.beta << '\n'
       << "quality      : " << to_string(result.quality) << '\n';
}

} // namespace dragfit
