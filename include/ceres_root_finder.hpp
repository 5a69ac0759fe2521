#ifndef CERES_ROOT_FINDER_HPP
#define CERES_ROOT_FINDER_HPP

#include "root_finder.hpp"

#include <ceres/ceres.h>
#include <string>
#include <vector>

namespace par_trafo {

/**
 * @brief Finds a root by minimizing the sum of squared residuals with Ceres Solver.
 *
 * The residual Jacobian is supplied analytically. With options.positive every
 * unknown gets a lower bound of 0.
 */
class CeresRootFinder : public RootFinder {
  public:
    CeresRootFinder() = default;
    ~CeresRootFinder() override = default;

    RootResult solve(const ResidualSystem &system, const Eigen::VectorXd &start, const RootFinderOptions &options) override;

    [[nodiscard]] std::string name() const override;

  private:
    // One residual block holding the whole system
    class SystemCostFunction : public ceres::CostFunction {
      public:
        explicit SystemCostFunction(const ResidualSystem &system);

        bool Evaluate(double const *const *parameters, double *residuals, double **jacobians) const override;

      private:
        const ResidualSystem &system_;
    };
};

} // namespace par_trafo

#endif // CERES_ROOT_FINDER_HPP
