#include "newton_root_finder.hpp"

#include <cmath>     // For std::sqrt stall tolerance
#include <iostream>  // For verbose iteration log
#include <stdexcept> // For std::invalid_argument

namespace par_trafo {

std::string
NewtonRootFinder::name() const {
    return "NewtonRootFinder";
}

RootResult
NewtonRootFinder::solve(const ResidualSystem &system, const Eigen::VectorXd &start, const RootFinderOptions &options) {
    RootResult result;
    result.root = start;

    Eigen::Index const n = system.dimension();
    if (start.size() != n) {
        throw std::invalid_argument("[NewtonRootFinder] Start vector has " + std::to_string(start.size()) +
                                    " entries, system has dimension " + std::to_string(n) + ".");
    }

    Eigen::VectorXd &x = result.root;
    if (options.positive) { x = x.cwiseMax(0.0); }

    if (n == 0) {
        result.converged = true;
        result.message = "Empty system";
        return result;
    }

    Eigen::VectorXd F;
    for (int iter = 0; iter <= options.max_iterations; ++iter) {
        try {
            F = system.residuals(x);
        } catch (const std::exception &e) {
            result.message = std::string("Error evaluating residuals: ") + e.what();
            return result;
        }
        result.residual_norm = F.lpNorm<Eigen::Infinity>();
        if (!std::isfinite(result.residual_norm)) {
            result.message = "Residuals are not finite";
            return result;
        }
        if (options.verbose) {
            std::cout << "  [NewtonRootFinder Iter " << iter << "] Residual norm: " << result.residual_norm
                      << std::endl;
        }
        if (result.residual_norm < options.atol) {
            result.converged = true;
            result.message = "Converged in " + std::to_string(iter) + " iteration(s)";
            return result;
        }
        if (iter == options.max_iterations) { break; }

        Eigen::MatrixXd J;
        try {
            J = system.jacobian(x);
        } catch (const std::exception &e) {
            result.message = std::string("Error evaluating Jacobian: ") + e.what();
            return result;
        }

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> dec(J);
        if (dec.rank() < n) {
            result.message = "Jacobian singular or rank-deficient (rank " + std::to_string(dec.rank()) + " of " +
                             std::to_string(n) + ")";
            return result;
        }
        Eigen::VectorXd const delta = dec.solve(-F);

        x += delta;
        if (options.positive) { x = x.cwiseMax(0.0); }
        result.iterations = iter + 1;

        bool stalled = true;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (std::abs(delta(i)) > options.ctol + options.rtol * std::abs(x(i))) {
                stalled = false;
                break;
            }
        }
        if (stalled) {
            try {
                F = system.residuals(x);
            } catch (const std::exception &e) {
                result.message = std::string("Error evaluating residuals: ") + e.what();
                return result;
            }
            result.residual_norm = F.lpNorm<Eigen::Infinity>();
            result.converged = result.residual_norm < std::sqrt(options.atol);
            result.message = result.converged ? "Step size below tolerance after " + std::to_string(iter + 1) +
                                                  " iteration(s)"
                                              : "Stalled with residual norm " + std::to_string(result.residual_norm);
            return result;
        }
    }

    result.message = "Did not converge after " + std::to_string(options.max_iterations) + " iteration(s)";
    if (options.verbose) { std::cerr << "[NewtonRootFinder] " << result.message << std::endl; }
    return result;
}

} // namespace par_trafo
