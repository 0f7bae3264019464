#include "dragfit/FitOptions.hpp"
#include <algorithm>
#include <cmath>

namespace dragfit {

int param_index(const std::string& name)
{
    for (int i = 0; i < kNParams; ++i)
        if (kParamNames[i] == name) return i;
    return -1;
}

static void require_known(const std::string& name)
{
    if (param_index(name) < 0)
        throw std::invalid_argument("unknown fit parameter '" + name + "'");
}

void validate_entry(const std::string& name, double value)
{
    require_known(name);
    if (!std::isfinite(value))
        throw std::invalid_argument("non-finite value for parameter '" + name + "'");
}

void validate_entry(const std::string& name, const Bounds& b)
{
    require_known(name);
    if (std::isnan(b.lower) || std::isnan(b.upper) || b.lower > b.upper)
        throw std::invalid_argument("invalid bounds for parameter '" + name + "'");
}

FinalizedOptions FitOptions::finalize() const
{
    FinalizedOptions out;
    out.x0.resize(kNParams);
    out.lower.resize(kNParams);
    out.upper.resize(kNParams);
    out.free_mask.assign(kNParams, true);

    for (int i = 0; i < kNParams; ++i) {
        const std::string& name = kParamNames[i];

        if (auto v = fixed.get(name)) {
            out.x0[i]        = *v;
            out.lower[i]     = *v;
            out.upper[i]     = *v;
            out.free_mask[i] = false;
            continue;
        }

        const Bounds b = bounds.get(name).value_or(Bounds{});
        out.lower[i] = b.lower;
        out.upper[i] = b.upper;
        out.x0[i]    = std::clamp(p0.get(name).value_or(0.0), b.lower, b.upper);
    }
    return out;
}

} // namespace dragfit
