#include "dragfit/MultiSeriesCost.hpp"
#include <stdexcept>

namespace dragfit {

MultiSeriesCost::MultiSeriesCost(const CurveData& data, const DragModel& model)
    : data_(data)
    , model_(model)
{
    for (int s : data_.series)
        if (s < 0 || s >= model_.n_series())
            throw std::invalid_argument("MultiSeriesCost: point refers to an unknown series");
}

void MultiSeriesCost::operator()(const Eigen::VectorXd& p,
                                 Eigen::VectorXd*       residuals,
                                 Eigen::MatrixXd*       jacobians) const
{
    const int np = data_.n_points();

    if (residuals) {
        residuals->resize(np);
        for (int i = 0; i < np; ++i) {
            const double model = model_.evaluate(data_.series[i], data_.x[i], p);
            (*residuals)[i]    = (model - data_.y[i]) / data_.sigma[i];
        }
    }

    if (!jacobians) return;                       // user wants resid only

    /* analytic: every column is d(model)/dp / sigma */
    jacobians->resize(np, kNParams);
    for (int i = 0; i < np; ++i)
        jacobians->row(i) = model_.gradient(data_.series[i], data_.x[i], p)
                            / data_.sigma[i];
}

} // namespace dragfit
