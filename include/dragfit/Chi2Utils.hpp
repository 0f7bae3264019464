#pragma once
#include "Types.hpp"
#include <optional>

namespace dragfit {

/*  χ² of σ-weighted residuals  r_i = (model_i − y_i) / σ_i  */
double chi_squared(const Vector& resid);

/*  DoF = number of points − number of free parameters (never below 1) */
int degrees_of_freedom(int n_points, int n_free);

/*  χ² / DoF, the statistic the quality check compares against 3 */
double reduced_chi_squared(const Vector& resid, int n_free);

/*  χ² of the best constant y = c (weighted mean), or of y = level when the
    level is given */
double constant_chi_squared(const Vector& y, const Vector& sigma,
                            std::optional<double> level = std::nullopt);

/*
 *  Upper-tail probability of the F statistic comparing a nested model
 *  (chi2_null, dof_null) with the fuller one (chi2_fit, dof_fit).  Small
 *  values mean the extra parameters explain real structure.  1 when the
 *  fit does not improve on the null model, 0 for a perfect fit.
 */
double f_test_p_value(double chi2_null, int dof_null,
                      double chi2_fit,  int dof_fit);

} // namespace dragfit
