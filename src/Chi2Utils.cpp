#include "dragfit/Chi2Utils.hpp"
#include <boost/math/distributions/fisher_f.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace dragfit {

double chi_squared(const Vector& r)
{
    return r.squaredNorm();
}

int degrees_of_freedom(int n_points, int n_free)
{
    return std::max(n_points - n_free, 1);
}

double reduced_chi_squared(const Vector& r, int n_free)
{
    const int dof = degrees_of_freedom(static_cast<int>(r.size()), n_free);
    return chi_squared(r) / dof;
}

double constant_chi_squared(const Vector& y, const Vector& sigma,
                            std::optional<double> level)
{
    if (y.size() != sigma.size() || y.size() == 0)
        throw std::invalid_argument("constant_chi_squared: y and sigma must be non-empty and equal in size");

    const Vector w = sigma.array().square().inverse().matrix();
    const double c = level.value_or(w.dot(y) / w.sum());
    return chi_squared(((y.array() - c) / sigma.array()).matrix());
}

double f_test_p_value(double chi2_null, int dof_null,
                      double chi2_fit,  int dof_fit)
{
    const int d1 = dof_null - dof_fit;
    if (d1 <= 0 || dof_fit <= 0)
        throw std::invalid_argument("f_test_p_value: models are not nested");
    if (!std::isfinite(chi2_null) || !std::isfinite(chi2_fit))
        return 1.0;
    if (chi2_fit >= chi2_null)
        return 1.0;
    if (chi2_fit <= 0.0)
        return 0.0;

    const double F = ((chi2_null - chi2_fit) / d1) / (chi2_fit / dof_fit);
    if (!std::isfinite(F))
        return 0.0;

    const boost::math::fisher_f dist(d1, dof_fit);
    return boost::math::cdf(boost::math::complement(dist, F));
}

} // namespace dragfit
