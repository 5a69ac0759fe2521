#ifndef ROOT_FINDER_HPP
#define ROOT_FINDER_HPP

#include <Eigen/Dense>
#include <memory>
#include <string>

namespace par_trafo {

/**
 * @brief Square nonlinear system F(x) = 0 with an analytic Jacobian.
 */
class ResidualSystem {
  public:
    virtual ~ResidualSystem() = default;

    [[nodiscard]] virtual Eigen::Index dimension() const = 0;
    [[nodiscard]] virtual Eigen::VectorXd residuals(const Eigen::VectorXd &x) const = 0;
    // J_ij = dF_i / dx_j
    [[nodiscard]] virtual Eigen::MatrixXd jacobian(const Eigen::VectorXd &x) const = 0;
};

struct RootFinderOptions {
    int max_iterations = 100;
    double atol = 1e-8; // max |F_i| accepted as a root
    double rtol = 1e-6; // relative step size regarded as stalled
    double ctol = 1e-8; // absolute step size regarded as stalled
    bool positive = false; // keep iterates in x >= 0
    bool verbose = false;
};

struct RootResult {
    Eigen::VectorXd root;
    bool converged = false;
    int iterations = 0;
    double residual_norm = 0.0; // max |F_i| at root
    std::string message;
};

/**
 * @brief Abstract base class for iterative root finders.
 */
class RootFinder {
  public:
    virtual ~RootFinder() = default;

    /**
     * @brief Searches a root of `system` starting from `start`.
     *
     * Never throws for numerical trouble; a failed search is reported through
     * RootResult::converged and RootResult::message.
     */
    virtual RootResult solve(const ResidualSystem &system,
                             const Eigen::VectorXd &start,
                             const RootFinderOptions &options) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

enum class RootFinderKind { Newton, Ceres };

std::shared_ptr<RootFinder>
make_root_finder(RootFinderKind kind);

/**
 * @brief Parses "newton" or "ceres".
 * @throws std::invalid_argument for other names.
 */
RootFinderKind
root_finder_kind_from_string(const std::string &name);

} // namespace par_trafo

#endif // ROOT_FINDER_HPP
