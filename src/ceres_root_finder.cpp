#include "ceres_root_finder.hpp"

#include <cmath>     // For std::sqrt on the final cost
#include <iostream>  // For std::cout progress reports
#include <stdexcept> // For std::invalid_argument

namespace par_trafo {

CeresRootFinder::SystemCostFunction::SystemCostFunction(const ResidualSystem &system)
  : system_(system) {
    set_num_residuals(static_cast<int>(system.dimension()));
    mutable_parameter_block_sizes()->push_back(static_cast<int>(system.dimension()));
}

bool
CeresRootFinder::SystemCostFunction::Evaluate(double const *const *parameters,
                                              double *residuals,
                                              double **jacobians) const {
    Eigen::Index const n = system_.dimension();
    Eigen::VectorXd const x = Eigen::Map<const Eigen::VectorXd>(parameters[0], n);

    Eigen::VectorXd F;
    try {
        F = system_.residuals(x);
    } catch (const std::exception &) {
        // Ceres doesn't like exceptions during evaluation
        return false;
    }
    if (!F.allFinite()) { return false; }
    Eigen::Map<Eigen::VectorXd>(residuals, n) = F;

    if (jacobians != nullptr && jacobians[0] != nullptr) {
        Eigen::MatrixXd J;
        try {
            J = system_.jacobian(x);
        } catch (const std::exception &) {
            return false;
        }
        // Ceres expects row-major storage
        Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>(jacobians[0], n, n) = J;
    }
    return true;
}

std::string
CeresRootFinder::name() const {
    return "CeresRootFinder";
}

RootResult
CeresRootFinder::solve(const ResidualSystem &system, const Eigen::VectorXd &start, const RootFinderOptions &options) {
    RootResult result;
    Eigen::Index const n = system.dimension();
    if (start.size() != n) {
        throw std::invalid_argument("[CeresRootFinder] Start vector has " + std::to_string(start.size()) +
                                    " entries, system has dimension " + std::to_string(n) + ".");
    }

    result.root = start;
    if (options.positive) { result.root = result.root.cwiseMax(0.0); }
    if (n == 0) {
        result.converged = true;
        result.message = "Empty system";
        return result;
    }

    if (options.verbose) {
        std::cout << "  [CeresRootFinder] Starting solve with " << n << " unknown(s)." << std::endl;
    }

    ceres::Problem problem;
    // Problem takes ownership of the cost function
    problem.AddResidualBlock(new SystemCostFunction(system), nullptr, result.root.data());
    if (options.positive) {
        for (int i = 0; i < static_cast<int>(n); ++i) { problem.SetParameterLowerBound(result.root.data(), i, 0.0); }
    }

    ceres::Solver::Options solver_options;
    solver_options.linear_solver_type = ceres::DENSE_QR;
    solver_options.minimizer_progress_to_stdout = options.verbose;
    solver_options.max_num_iterations = options.max_iterations;
    solver_options.function_tolerance = 1e-16;
    solver_options.gradient_tolerance = 1e-16;
    solver_options.parameter_tolerance = options.ctol;
    solver_options.logging_type = options.verbose ? ceres::PER_MINIMIZER_ITERATION : ceres::SILENT;

    ceres::Solver::Summary summary;
    ceres::Solve(solver_options, &problem, &summary);

    if (options.verbose) { std::cout << "  [CeresRootFinder] Ceres Summary: " << summary.BriefReport() << std::endl; }

    // Iteration 0 is the evaluation at the start point
    result.iterations = summary.iterations.empty() ? 0 : static_cast<int>(summary.iterations.size()) - 1;

    Eigen::VectorXd F;
    try {
        F = system.residuals(result.root);
    } catch (const std::exception &e) {
        result.message = std::string("Error evaluating residuals at Ceres solution: ") + e.what();
        return result;
    }
    result.residual_norm = F.lpNorm<Eigen::Infinity>();

    if (!summary.IsSolutionUsable()) {
        result.message = "Ceres did not find a usable solution: " + summary.message;
    } else if (!std::isfinite(result.residual_norm) || result.residual_norm >= std::sqrt(options.atol)) {
        result.message = "Ceres stopped at a point that is not a root (residual norm " +
                         std::to_string(result.residual_norm) + ")";
    } else {
        result.converged = true;
        result.message = summary.BriefReport();
    }
    return result;
}

} // namespace par_trafo
