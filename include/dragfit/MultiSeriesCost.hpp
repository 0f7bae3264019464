#pragma once
#include "Types.hpp"
#include "CurveData.hpp"
#include "DragModel.hpp"
#include <Eigen/Core>

namespace dragfit {

/* ------------------------------------------------------------------------- */
/*  Residual functor for ALL series at once                                  */
/*                                                                           */
/*      r_i = ( model_{s_i}(x_i; p) - y_i ) / sigma_i                        */
/*                                                                           */
/*  The series index of every point selects the repetition count; the four  */
/*  parameters are shared by every row.                                      */
/* ------------------------------------------------------------------------- */
class MultiSeriesCost {
public:
    MultiSeriesCost(const CurveData& data, const DragModel& model);

    int numResiduals() const { return data_.n_points(); }

    /* main entry: returns residuals and (optionally) full Jacobian */
    void operator()(const Eigen::VectorXd& parameters,
                    Eigen::VectorXd*       residuals,
                    Eigen::MatrixXd*       jacobians) const;

private:
    const CurveData& data_;
    const DragModel& model_;
};

} // namespace dragfit
