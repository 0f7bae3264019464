#include "dragfit/Uncertainty.hpp"
#include <cmath>

namespace dragfit {

std::ostream& operator<<(std::ostream& os, const UFloat& v)
{
    return os << v.nominal << " +/- " << v.std_dev;
}

bool is_error_not_significant(const UFloat&         value,
                              double                fraction,
                              std::optional<double> absolute)
{
    const double error = value.std_dev;
    if (!std::isfinite(error) || !std::isfinite(value.nominal))
        return false;

    if (error == 0.0)
        return true;

    if (absolute && error < *absolute)
        return true;

    return error < fraction * std::abs(value.nominal);
}

} // namespace dragfit
