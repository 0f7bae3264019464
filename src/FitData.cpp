#include "dragfit/FitData.hpp"
#include <algorithm>
#include <stdexcept>

namespace dragfit {

UFloat FitData::fitval(const std::string& name) const
{
    auto it = std::find(popt_keys.begin(), popt_keys.end(), name);
    if (it == popt_keys.end())
        throw std::out_of_range("no fit parameter named '" + name + "'");

    const auto i = std::distance(popt_keys.begin(), it);
    return { popt[i], perr[i] };
}

} // namespace dragfit
