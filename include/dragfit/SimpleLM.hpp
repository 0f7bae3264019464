#pragma once
#include <Eigen/Core>
#include <Eigen/Dense>
#include <algorithm>
#include <vector>
#include <iostream>
#include <iomanip>
#include <limits>
#include <cmath>
#include <string>

namespace dragfit {

/* ---------------------------  user visible bits  --------------------------- */
/*  A value ≤ 0 means "determine automatically".                              */

struct LMSolverOptions {
    int    max_iterations        = 200;      // hard upper limit
    double gradient_tolerance    = 0;        // auto
    double step_tolerance        = 0;        // auto
    double chi2_tolerance        = 0;        // auto, relative to current χ²
    double initial_lambda        = 0;        // auto
    bool   absolute_sigma        = false;    // residuals already carry true σ
    bool   verbose               = false;    // chatty?
};

struct LMSolverSummary {
    int    iterations         = 0;
    int    n_residuals        = 0;
    int    n_free             = 0;
    double initial_chi2       = 0.0;
    double final_chi2         = 0.0;
    bool   converged          = false;
    std::string stop_reason;
    std::vector<double> param_uncertainties;   // 1-σ; 0 = fixed
    Eigen::MatrixXd     covariance;            // full size, zero rows for fixed
};

/* --------------------  internal helper (column selection)  ----------------- */

inline
void build_free_index(const std::vector<bool>& mask,
                      int                      n,
                      Eigen::VectorXi&         map_full_to_reduced,
                      int&                     n_free)
{
    map_full_to_reduced.resize(n);
    n_free = 0;
    for (int j = 0; j < n; ++j) {
        if (mask.empty() || mask[j])
            map_full_to_reduced[j] = n_free++;
        else
            map_full_to_reduced[j] = -1;
    }
}

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  Functor signature:   void (const VectorXd& p, VectorXd* r, MatrixXd* J)
 *  The solver minimises  χ² = |r|²  subject to  lower ≤ p ≤ upper  by
 *  projecting every trial step onto the box.
 */
template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                    func,
                    Eigen::VectorXd&             x,
                    const std::vector<bool>&     free_mask,
                    const std::vector<double>&   lower,
                    const std::vector<double>&   upper,
                    const LMSolverOptions&       user_opt = {})
{
    LMSolverSummary summ;
    const int n = static_cast<int>(x.size());
    LMSolverOptions opt = user_opt;               // mutable copy

    /* --------------------------------------------------------------- */
    /*  map full parameter vector  ->  free (variable) parameters      */
    /* --------------------------------------------------------------- */
    Eigen::VectorXi col_index;
    int n_free = 0;
    build_free_index(free_mask, n, col_index, n_free);
    summ.n_free = n_free;
    summ.param_uncertainties.assign(n, 0.0);
    summ.covariance = Eigen::MatrixXd::Zero(n, n);

    /* --------------------------------------------------------------- */
    /*  first model evaluation                                         */
    /* --------------------------------------------------------------- */
    Eigen::VectorXd r;
    Eigen::MatrixXd J;
    func(x, &r, &J);

    const int m = static_cast<int>(r.size());
    summ.n_residuals = m;
    double chi2 = r.squaredNorm();
    summ.initial_chi2 = chi2;

    if (n_free == 0) {                            // nothing to fit
        if (opt.verbose)
            std::cout << "[LM]  Warning: All parameters are frozen! There is nothing to fit..." << std::endl;
        summ.converged   = std::isfinite(chi2);
        summ.final_chi2  = chi2;
        summ.stop_reason = "all parameters frozen";
        return summ;
    }

    if (!std::isfinite(chi2)) {
        summ.final_chi2  = chi2;
        summ.stop_reason = "non-finite χ² at the initial point";
        return summ;
    }

    /* --------------------------------------------------------------- */
    /*  automatic tolerances and initial λ                             */
    /* --------------------------------------------------------------- */
    Eigen::VectorXd g0 = J.transpose() * r;
    for (int j = 0; j < n; ++j)
        if (col_index[j] < 0) g0[j] = 0.0;
    double gmax0       = g0.cwiseAbs().maxCoeff();
    const double eps   = std::numeric_limits<double>::epsilon();

    if (opt.gradient_tolerance <= 0.0)
        opt.gradient_tolerance = 1e-10 * std::max(1.0, gmax0);

    double xnorm = x.lpNorm<Eigen::Infinity>();
    if (opt.step_tolerance <= 0.0)
        opt.step_tolerance = 1e-10 * std::max(1.0, xnorm);

    if (opt.chi2_tolerance  <= 0.0)
        opt.chi2_tolerance  = 1e-10;

    if (opt.initial_lambda  <= 0.0) {
        Eigen::VectorXd diag = (J.transpose() * J).diagonal();
        opt.initial_lambda   = 1e-3 * diag.maxCoeff();
        if (!(opt.initial_lambda > 0.0)) opt.initial_lambda = 1e-3;
    }
    double lambda = opt.initial_lambda;

    /* --------------------------------------------------------------- */
    /*  one-time allocations                                           */
    /* --------------------------------------------------------------- */
    Eigen::MatrixXd Jf(m, n_free), JTJ(n_free, n_free);
    Eigen::VectorXd diag_JTJ(n_free), g(n_free), dx_free(n_free), dx(n);

    auto reduce_jacobian = [&](const Eigen::MatrixXd& Jfull) {
        for (int j = 0; j < n; ++j) {
            int col = col_index[j];
            if (col >= 0) Jf.col(col).noalias() = Jfull.col(j);
        }
    };

    auto normal_matrix = [&]() {
        JTJ.setZero();
        JTJ.selfadjointView<Eigen::Lower>().rankUpdate(Jf.adjoint(), 1.0);
        JTJ.template triangularView<Eigen::StrictlyUpper>() =
            JTJ.transpose();                       // copy to upper
    };

    /* --------------------------------------------------------------- */
    /*  main iteration loop                                            */
    /* --------------------------------------------------------------- */
    bool tightened = false;
    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        reduce_jacobian(J);

        /* ---------------------- g = Jᵀ r --------------------------- */
        g.noalias() = Jf.transpose() * r;
        double gmax = g.cwiseAbs().maxCoeff();
        if (gmax < opt.gradient_tolerance) {       // gradient small
            summ.converged   = true;
            summ.stop_reason = "gradient tolerance";
            break;
        }

        /* ---------- JTJ = JᵀJ  (use rank-update, lower triangle) ---- */
        normal_matrix();
        diag_JTJ = JTJ.diagonal();

        /* ------- (JTJ + λ D) Δx = −g   (D = diag(JTJ)) -------------- */
        JTJ.diagonal().array() +=
            lambda * (diag_JTJ.array() + 1e-20);   // Fletcher scaling

        dx_free = -JTJ.ldlt().solve(g);            // SPD solve

        if (dx_free.hasNaN() || !dx_free.allFinite()) {   // numerical failure
            if (opt.verbose)
                std::cout << "[LM]  Warning: numerical failure! Inf/NaN in solver. Aborting iteration...\n";
            summ.stop_reason = "numerical failure";
            break;
        }

        /* --------------- copy step into full parameter vector ------- */
        dx.setZero();
        for (int j = 0; j < n; ++j) {
            int col = col_index[j];
            if (col >= 0) dx[j] = dx_free[col];
        }

        if (dx.cwiseAbs().maxCoeff() < opt.step_tolerance) {
            if (summ.iterations == 1 && !tightened) {
                if (opt.verbose)
                    std::cout << "[LM]  Warning: step tolerance too large – "
                                 "tightening it once.\n";
                opt.step_tolerance *= 0.01;    // tighten and try again
                tightened = true;
            }
            else {
                summ.converged   = true;       // genuine convergence
                summ.stop_reason = "step tolerance";
                break;
            }
        }

        /* --------------------- candidate point ---------------------- */
        Eigen::VectorXd x_try = x + dx;

        /* ---------- simple bound constraints (project) -------------- */
        for (int j = 0; j < n; ++j) {
            if (!lower.empty()) x_try[j] = std::max(x_try[j], lower[j]);
            if (!upper.empty()) x_try[j] = std::min(x_try[j], upper[j]);
        }

        /* -------- recompute dx_free based on actual step taken ------ */
        Eigen::VectorXd dx_actual = x_try - x;
        for (int j = 0; j < n; ++j) {
            int col = col_index[j];
            if (col >= 0) dx_free[col] = dx_actual[j];
        }

        Eigen::VectorXd r_try;
        Eigen::MatrixXd J_try;
        func(x_try, &r_try, &J_try);
        double chi2_try = r_try.squaredNorm();

        /* ------------------- Powell's ρ test ------------------------ */
        Eigen::VectorXd tmp = lambda * (diag_JTJ.array() * dx_free.array()).matrix() - g;
        double pred_red = 0.5 * dx_free.dot(tmp);
        if (pred_red <= 0.0) pred_red = eps;

        double rho     = (chi2 - chi2_try) / pred_red;
        bool   accept  = std::isfinite(chi2_try) && rho > 0.0 && chi2_try < chi2;

        if (accept) {
            /* --------------- successful iteration ------------------ */
            x.swap(x_try);
            r.swap(r_try);
            J.swap(J_try);
            chi2 = chi2_try;

            /* adaptive λ (MINPACK style) ---------------------------- */
            double fac = std::max(1.0/3.0,
                                  1.0 - std::pow(2.0*rho - 1.0, 3.0));
            lambda *= fac;
            lambda  = std::max(lambda, 1e-18);

            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  ρ="  << std::fixed << std::setprecision(2) << rho
                          << "  χ²=" << std::scientific << std::setprecision(4) << chi2
                          << "  λ="  << std::scientific << std::setprecision(2) << lambda
                          << "  (accepted)\n";

            if (std::abs(pred_red) < opt.chi2_tolerance * chi2) {
                summ.converged   = true;
                summ.stop_reason = "χ² tolerance";
                break;
            }
        } else {
            /* ------------------- rejected step --------------------- */
            lambda *= 2.0;
            if (opt.verbose)
                std::cout << "[LM]  iter " << it
                          << "  ρ="  << std::fixed << std::setprecision(2) << rho
                          << "  χ²=" << std::scientific << std::setprecision(4) << chi2_try
                          << "  λ="  << std::scientific << std::setprecision(2) << lambda
                          << "  (rejected)\n";
        }
    }

    summ.final_chi2 = chi2;
    if (!summ.converged && summ.stop_reason.empty())
        summ.stop_reason = "maximum number of iterations";

    /* ---------------------  propagate uncertainties  ---------------- */
    reduce_jacobian(J);
    normal_matrix();

    const double dof = std::max(m - n_free, 1);
    const double var = opt.absolute_sigma ? 1.0 : chi2 / dof;   // σ² ≈ χ²/dof

    Eigen::MatrixXd cov =
        JTJ.ldlt().solve(Eigen::MatrixXd::Identity(n_free, n_free));
    cov *= var;

    for (int a = 0; a < n; ++a) {
        const int ca = col_index[a];
        if (ca < 0) continue;
        for (int b = 0; b < n; ++b) {
            const int cb = col_index[b];
            if (cb >= 0) summ.covariance(a, b) = cov(ca, cb);
        }
        summ.param_uncertainties[a] = std::sqrt(std::max(0.0, cov(ca, ca)));
        if (!std::isfinite(cov(ca, ca)))
            summ.param_uncertainties[a] = std::numeric_limits<double>::quiet_NaN();
    }

    if (opt.verbose)
        std::cout << "[LM] done after " << summ.iterations << " iterations ("
                  << summ.stop_reason << ")" << std::endl;
    return summ;
}

} // namespace dragfit
