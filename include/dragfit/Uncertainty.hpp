#pragma once
#include <optional>
#include <ostream>

namespace dragfit {

/* value with its 1-σ standard error */
struct UFloat {
    double nominal = 0.0;
    double std_dev = 0.0;
};

std::ostream& operator<<(std::ostream& os, const UFloat& v);

/*
 *  True if the standard error of `value` does not overwhelm its magnitude:
 *  the error must be finite and either zero, below `absolute` (when given)
 *  or below `fraction` times |nominal|.
 */
bool is_error_not_significant(const UFloat&         value,
                              double                fraction = 1.0,
                              std::optional<double> absolute = std::nullopt);

} // namespace dragfit
