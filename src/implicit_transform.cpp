#include "implicit_transform.hpp"
#include "transform_errors.hpp"

#include <iostream>  // For std::cout, std::cerr
#include <set>
#include <stdexcept> // For std::invalid_argument

namespace par_trafo {

namespace {

std::vector<std::string>
unique_names(const std::vector<std::string> &a, const std::vector<std::string> &b = {}) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto *list : { &a, &b }) {
        for (const auto &name : *list) {
            if (seen.insert(name).second) { out.push_back(name); }
        }
    }
    return out;
}

// Residuals of the dependent equations as a function of the dependent variables,
// all other values held at `point`. Values are matched by name.
class DependentResidualSystem : public ResidualSystem {
  public:
    DependentResidualSystem(const CompiledEvaluator &residuals,
                            const CompiledEvaluator &dfdx,
                            const std::vector<std::string> &dependent,
                            NamedValues point)
      : residuals_(residuals)
      , dfdx_(dfdx)
      , dependent_(dependent)
      , point_(std::move(point)) {}

    [[nodiscard]] Eigen::Index dimension() const override { return static_cast<Eigen::Index>(dependent_.size()); }

    [[nodiscard]] Eigen::VectorXd residuals(const Eigen::VectorXd &x) const override {
        return residuals_.evaluate_vector(at(x));
    }

    [[nodiscard]] Eigen::MatrixXd jacobian(const Eigen::VectorXd &x) const override {
        Eigen::Index const n = dimension();
        Eigen::VectorXd const flat = dfdx_.evaluate_vector(at(x));
        // Variable-major: column j holds d(F_0..F_n-1)/dx_j
        return Eigen::Map<const Eigen::MatrixXd>(flat.data(), n, n);
    }

  private:
    NamedValues at(const Eigen::VectorXd &x) const {
        NamedValues p = point_;
        for (std::size_t i = 0; i < dependent_.size(); ++i) { p.set(dependent_[i], x(static_cast<Eigen::Index>(i))); }
        return p;
    }

    const CompiledEvaluator &residuals_;
    const CompiledEvaluator &dfdx_;
    const std::vector<std::string> &dependent_;
    NamedValues point_;
};

} // namespace

ImplicitTransform::ImplicitTransform(const EquationSet &equations,
                                     const std::vector<std::string> &free_parameters,
                                     const TransformOptions &options,
                                     std::shared_ptr<RootFinder> root_finder)
  : ParameterTransform(equations, unique_names(free_parameters), options.condition, qualified_model_name(options))
  , states_(equations.names())
  , nonstates_(equations.symbols(equations.names()))
  , root_finder_(root_finder ? std::move(root_finder) : make_root_finder(options.root_finder))
  , root_options_(options.root_options)
  , keep_root_(options.keep_root)
  , positive_(options.positive)
  , verbose_(options.verbose) {
    if (equations.empty()) { throw ConstructionError("Implicit transformation needs at least one equation."); }

    std::set<std::string> const free_set(parameters().begin(), parameters().end());
    for (const auto &s : states_) {
        if (free_set.count(s) == 0) { dependent_.push_back(s); }
    }
    if (dependent_.empty()) {
        throw ConstructionError("All states are declared free; the implicit transformation has nothing to solve for.");
    }
    sensitivity_parameters_ = unique_names(nonstates_, parameters());

    EquationSet const residuals = equations.subset(dependent_);
    EquationSet const dfdx = residuals.jacobian(dependent_);
    EquationSet const dfdp = residuals.jacobian(sensitivity_parameters_);
    std::vector<std::string> const eval_parameters = unique_names(states_, nonstates_);

    EvaluatorOptions eval_options;
    eval_options.compile = options.compile;
    eval_options.verbose = options.verbose;
    eval_options.model_name = model_name();
    residual_evaluator_ = std::make_unique<CompiledEvaluator>(residuals, eval_parameters, eval_options);
    eval_options.model_name = artifact_name(options, "dfdx");
    dfdx_evaluator_ = std::make_unique<CompiledEvaluator>(dfdx, eval_parameters, eval_options);
    eval_options.model_name = artifact_name(options, "dfdp");
    dfdp_evaluator_ = std::make_unique<CompiledEvaluator>(dfdp, eval_parameters, eval_options);

    set_warning_handler(nullptr);

    if (verbose_) {
        std::cout << "[ImplicitTransform] " << dependent_.size() << " dependent variable(s), "
                  << sensitivity_parameters_.size() << " sensitivity parameter(s), root finder "
                  << root_finder_->name() << std::endl;
    }
}

void
ImplicitTransform::set_warning_handler(WarningHandler handler) {
    if (handler) {
        warning_handler_ = std::move(handler);
        return;
    }
    warning_handler_ = [](const std::string &message) {
        std::cerr << "[ImplicitTransform] Warning: " << message << std::endl;
    };
}

RootResult
ImplicitTransform::find_root(const NamedValues &point) const {
    DependentResidualSystem const system(*residual_evaluator_, *dfdx_evaluator_, dependent_, point);
    RootResult result = root_finder_->solve(system, point.to_eigen(dependent_), root_options_);
    if (!result.converged) {
        std::string msg = "[ImplicitTransform] " + root_finder_->name() + " failed";
        if (!model_name().empty()) { msg += " for '" + model_name() + "'"; }
        throw RootNotFoundError(msg + ": " + result.message, result.iterations, result.residual_norm);
    }
    if (verbose_) {
        std::cout << "[ImplicitTransform] Root found after " << result.iterations
                  << " iteration(s), residual norm " << result.residual_norm << std::endl;
    }
    return result;
}

Eigen::MatrixXd
ImplicitTransform::root_sensitivities(const NamedValues &solution) const {
    auto const n = static_cast<Eigen::Index>(dependent_.size());
    auto const m = static_cast<Eigen::Index>(sensitivity_parameters_.size());

    Eigen::VectorXd const flat_dx = dfdx_evaluator_->evaluate_vector(solution);
    Eigen::VectorXd const flat_dp = dfdp_evaluator_->evaluate_vector(solution);
    Eigen::MatrixXd const dfdx = Eigen::Map<const Eigen::MatrixXd>(flat_dx.data(), n, n);
    Eigen::MatrixXd const dfdp = Eigen::Map<const Eigen::MatrixXd>(flat_dp.data(), n, m);

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> dec(dfdx);
    if (dec.rank() < n) {
        throw SingularJacobianError("[ImplicitTransform] Residual Jacobian with respect to the dependent variables "
                                    "is singular at the root (rank " +
                                      std::to_string(dec.rank()) + " of " + std::to_string(n) + ").",
                                    static_cast<long>(dec.rank()),
                                    static_cast<long>(n));
    }
    return dec.solve(-dfdp);
}

Jacobian
ImplicitTransform::root_jacobian(const Eigen::MatrixXd &dxdp,
                                 const NamedValues &solution,
                                 const NamedValues &point,
                                 const std::vector<std::string> &pass_through) const {
    Jacobian jacobian = Jacobian::zeros(solution.names(), point.names());
    for (const auto &name : pass_through) { jacobian.set(name, name, 1.0); }
    for (Eigen::Index j = 0; j < dxdp.cols(); ++j) {
        long const col = jacobian.col_index(sensitivity_parameters_[static_cast<std::size_t>(j)]);
        if (col < 0) { continue; }
        for (Eigen::Index i = 0; i < dxdp.rows(); ++i) {
            long const row = jacobian.row_index(dependent_[static_cast<std::size_t>(i)]);
            jacobian.matrix()(row, col) = dxdp(i, j);
        }
    }
    return jacobian;
}

ParameterVector
ImplicitTransform::apply(const ParameterVector &outer, const NamedValues &fixed, bool deriv) {
    // Fixed values replace outer ones and are moved to the end
    NamedValues point = outer.values;
    if (!fixed.empty()) { point = point.without(fixed.names()).merged_with(fixed); }

    std::vector<std::string> missing;
    for (const auto &name : residual_evaluator_->parameters()) {
        if (!point.contains(name)) { missing.push_back(name); }
    }
    if (!missing.empty()) {
        std::string msg = "[ImplicitTransform] Missing value(s) for";
        for (const auto &name : missing) { msg += " '" + name + "'"; }
        throw std::invalid_argument(msg + "; dependent variables need an initial guess.");
    }

    std::set<std::string> const dependent_set(dependent_.begin(), dependent_.end());
    std::vector<std::string> pass_through;
    for (const auto &name : point.names()) {
        if (dependent_set.count(name) == 0 && !fixed.contains(name)) { pass_through.push_back(name); }
    }

    SolveReport report;
    NamedValues const fresh_start = point;
    if (const auto &guess = guess_.get()) {
        for (const auto &name : dependent_) {
            if (guess->contains(name)) {
                point.set(name, guess->at(name));
                report.warm_started = true;
            }
        }
    }
    if (verbose_) {
        std::cout << "[ImplicitTransform] Solving " << dependent_.size() << " dependent variable(s)"
                  << (report.warm_started ? " (warm start)" : "") << std::endl;
    }

    RootResult root = find_root(point);
    report.attempts = 1;
    report.start = point.subset(dependent_);

    if (positive_ && (root.root.array() < 0.0).any()) {
        point = fresh_start;
        root = find_root(point);
        report.attempts = 2;
        report.start = point.subset(dependent_);
        root.root = root.root.cwiseMax(0.0);
        report.repaired = true;
        warning_handler_("Found negative steady state. Negative elements have been set to 0.");
    }

    NamedValues solution;
    for (std::size_t i = 0; i < dependent_.size(); ++i) {
        solution.set(dependent_[i], root.root(static_cast<Eigen::Index>(i)));
    }
    for (const auto &name : point.names()) {
        if (dependent_set.count(name) == 0) { solution.set(name, point.at(name)); }
    }

    // A singular root is rejected whether or not derivatives were requested
    Eigen::MatrixXd const dxdp = root_sensitivities(solution);

    std::optional<Jacobian> jacobian;
    if (deriv) {
        Jacobian local = root_jacobian(dxdp, solution, point, pass_through).drop_cols(fixed.names());
        if (outer.has_jacobian()) { local = chain(local, *outer.jacobian); }
        jacobian = std::move(local);
    }

    // Only a completed call touches the cache
    if (report.repaired) {
        guess_.reset();
    } else if (keep_root_) {
        guess_.set(solution);
    }
    report.root = solution.subset(dependent_);
    report.iterations = root.iterations;
    report_ = std::move(report);

    return ParameterVector(std::move(solution), std::move(jacobian));
}

std::shared_ptr<ImplicitTransform>
build_implicit(const EquationSet &equations,
               const std::vector<std::string> &free_parameters,
               const TransformOptions &options) {
    return std::make_shared<ImplicitTransform>(equations, free_parameters, options);
}

} // namespace par_trafo
