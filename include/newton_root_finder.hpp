#ifndef NEWTON_ROOT_FINDER_HPP
#define NEWTON_ROOT_FINDER_HPP

#include "root_finder.hpp"

#include <Eigen/Dense>
#include <string>

namespace par_trafo {

/**
 * @brief Full-step Newton iteration with column-pivoting QR for the step.
 *
 * Converged when max |F_i| < atol, or when a step is below
 * ctol + rtol * |x_i| in every component and max |F_i| < sqrt(atol).
 * A rank-deficient Jacobian ends the search unconverged.
 */
class NewtonRootFinder : public RootFinder {
  public:
    NewtonRootFinder() = default;
    ~NewtonRootFinder() override = default;

    RootResult solve(const ResidualSystem &system, const Eigen::VectorXd &start, const RootFinderOptions &options) override;

    [[nodiscard]] std::string name() const override;
};

} // namespace par_trafo

#endif // NEWTON_ROOT_FINDER_HPP
