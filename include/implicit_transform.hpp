#ifndef IMPLICIT_TRANSFORM_HPP
#define IMPLICIT_TRANSFORM_HPP

#include "compiled_evaluator.hpp"
#include "parameter_transform.hpp"
#include "root_finder.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace par_trafo {

/**
 * @brief Last accepted root of an implicit transformation, used as the next start point.
 *
 * Private to one ImplicitTransform. Not synchronized: concurrent calls on the
 * same transformation must be serialized by the caller.
 */
class GuessCache {
  public:
    [[nodiscard]] const std::optional<NamedValues> &get() const { return guess_; }
    void set(NamedValues solution) { guess_ = std::move(solution); }
    void reset() { guess_.reset(); }
    [[nodiscard]] bool empty() const { return !guess_.has_value(); }

  private:
    std::optional<NamedValues> guess_;
};

// Diagnostics of the most recent successful call
struct SolveReport {
    NamedValues start;         // dependent values handed to the root finder (accepted attempt)
    NamedValues root;          // accepted root, after clamping
    int iterations = 0;        // root finder iterations of the accepted attempt
    int attempts = 0;          // 2 if the positivity repair re-solved
    bool warm_started = false; // the first attempt started from the guess cache
    bool repaired = false;     // negative entries were clamped to zero
};

using WarningHandler = std::function<void(const std::string &)>;

/**
 * @brief Transformation defined by a root: the dependent variables solve equations(x, p) = 0.
 *
 * Every equation is a residual named after a state. States not listed as free
 * parameters are solved for (the dependent variables); all other symbols are
 * parameters of the system. The outer parameters must contain values for the
 * dependent variables too; they are the initial guess. The Jacobian of the
 * root with respect to the other parameters follows from the implicit function
 * theorem, dx/dp = -(dF/dx)^-1 dF/dp, computed by a linear solve.
 */
class ImplicitTransform : public ParameterTransform {
  public:
    /**
     * @param equations Residuals, one per state.
     * @param free_parameters States (or other symbols) that are given rather than solved for.
     * @throws ConstructionError if no dependent variable remains.
     */
    ImplicitTransform(const EquationSet &equations,
                      const std::vector<std::string> &free_parameters,
                      const TransformOptions &options = {},
                      std::shared_ptr<RootFinder> root_finder = nullptr);

    /**
     * @throws std::invalid_argument if `outer` lacks a value the residuals need.
     * @throws RootNotFoundError if the root finder does not converge.
     * @throws SingularJacobianError if dF/dx is singular at the root.
     */
    ParameterVector apply(const ParameterVector &outer, const NamedValues &fixed, bool deriv) override;

    [[nodiscard]] TransformMethod method() const override { return TransformMethod::Implicit; }

    [[nodiscard]] const std::vector<std::string> &states() const { return states_; }
    [[nodiscard]] const std::vector<std::string> &dependent() const { return dependent_; }
    [[nodiscard]] const std::vector<std::string> &nonstates() const { return nonstates_; }

    [[nodiscard]] GuessCache &guess_cache() { return guess_; }
    [[nodiscard]] const GuessCache &guess_cache() const { return guess_; }
    [[nodiscard]] const SolveReport &last_solve() const { return report_; }

    void set_keep_root(bool keep) { keep_root_ = keep; }
    [[nodiscard]] bool keep_root() const { return keep_root_; }
    void set_positive(bool positive) { positive_ = positive; }
    [[nodiscard]] bool positive() const { return positive_; }

    void set_warning_handler(WarningHandler handler);
    [[nodiscard]] const std::shared_ptr<RootFinder> &root_finder() const { return root_finder_; }
    void set_root_options(const RootFinderOptions &options) { root_options_ = options; }

  private:
    RootResult find_root(const NamedValues &point) const;
    // d(dependent)/d(sensitivity parameters) at the root; throws SingularJacobianError
    Eigen::MatrixXd root_sensitivities(const NamedValues &solution) const;
    Jacobian root_jacobian(const Eigen::MatrixXd &dxdp,
                           const NamedValues &solution,
                           const NamedValues &point,
                           const std::vector<std::string> &pass_through) const;

    std::vector<std::string> states_;
    std::vector<std::string> dependent_;
    std::vector<std::string> nonstates_;
    std::vector<std::string> sensitivity_parameters_; // nonstates, then free parameters

    std::unique_ptr<CompiledEvaluator> residual_evaluator_;
    std::unique_ptr<CompiledEvaluator> dfdx_evaluator_;
    std::unique_ptr<CompiledEvaluator> dfdp_evaluator_;

    std::shared_ptr<RootFinder> root_finder_;
    RootFinderOptions root_options_;
    GuessCache guess_;
    SolveReport report_;
    WarningHandler warning_handler_;
    bool keep_root_ = true;
    bool positive_ = true;
    bool verbose_ = false;
};

std::shared_ptr<ImplicitTransform>
build_implicit(const EquationSet &equations,
               const std::vector<std::string> &free_parameters,
               const TransformOptions &options = {});

} // namespace par_trafo

#endif // IMPLICIT_TRANSFORM_HPP
