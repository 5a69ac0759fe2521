#include "explicit_transform.hpp"

#include <iostream> // For std::cout
#include <set>

namespace par_trafo {

namespace {

std::vector<std::string>
declared_parameters(const EquationSet &equations, const std::optional<std::vector<std::string>> &parameters) {
    if (!parameters) { return equations.symbols(); }
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto &p : *parameters) {
        if (seen.insert(p).second) { out.push_back(p); }
    }
    return out;
}

// Declared parameters the equations never mention map to themselves
EquationSet
with_identity_equations(const EquationSet &equations, const std::optional<std::vector<std::string>> &parameters) {
    if (!parameters) { return equations; }
    std::vector<std::string> const used = equations.symbols();
    std::set<std::string> const used_set(used.begin(), used.end());

    EquationSet out = equations;
    for (const auto &p : declared_parameters(equations, parameters)) {
        if (used_set.count(p) == 0) { out.add(p, Expression::symbol(p)); }
    }
    return out;
}

} // namespace

ExplicitTransform::ExplicitTransform(const EquationSet &equations,
                                     const std::optional<std::vector<std::string>> &parameters,
                                     const TransformOptions &options)
  : ParameterTransform(with_identity_equations(equations, parameters),
                       declared_parameters(equations, parameters),
                       options.condition,
                       qualified_model_name(options))
  , jacobian_equations_(this->equations().jacobian(this->parameters()))
  , attach_input_(options.attach_input) {
    if (options.verbose) {
        std::cout << "[ExplicitTransform] " << this->equations().size() << " equation(s) in "
                  << this->parameters().size() << " parameter(s)";
        if (!model_name().empty()) { std::cout << ", model '" << model_name() << "'"; }
        std::cout << std::endl;
    }

    EvaluatorOptions eval_options;
    eval_options.compile = options.compile;
    eval_options.verbose = options.verbose;
    eval_options.model_name = model_name();
    evaluator_ = std::make_unique<CompiledEvaluator>(this->equations(), this->parameters(), eval_options);

    eval_options.model_name = artifact_name(options, "deriv");
    deriv_evaluator_ = std::make_unique<CompiledEvaluator>(jacobian_equations_, this->parameters(), eval_options);
}

ParameterVector
ExplicitTransform::apply(const ParameterVector &outer, const NamedValues &fixed, bool deriv) {
    NamedValues const args = outer.values.merged_with(fixed);

    Eigen::VectorXd const inner_values = evaluator_->evaluate_vector(args);
    const std::vector<std::string> &outputs = evaluator_->outputs();
    NamedValues inner;
    for (std::size_t i = 0; i < outputs.size(); ++i) { inner.set(outputs[i], inner_values(static_cast<Eigen::Index>(i))); }

    // Columns: outer parameters without the fixed ones, in outer order
    std::vector<std::string> columns;
    for (const auto &name : outer.values.names()) {
        if (!fixed.contains(name)) { columns.push_back(name); }
    }

    std::optional<Jacobian> jacobian;
    if (deriv) {
        Eigen::VectorXd const flat = deriv_evaluator_->evaluate_vector(args);
        Jacobian local = Jacobian::zeros(outputs, args.names());
        auto const n_out = static_cast<Eigen::Index>(outputs.size());
        const std::vector<std::string> &pars = parameters();
        for (std::size_t j = 0; j < pars.size(); ++j) {
            long const col = local.col_index(pars[j]);
            local.matrix().col(col) = flat.segment(static_cast<Eigen::Index>(j) * n_out, n_out);
        }
        local = local.select_cols(columns);

        if (outer.has_jacobian()) { local = chain(local, *outer.jacobian); }
        jacobian = std::move(local);
    }

    ParameterVector result(std::move(inner), std::move(jacobian));

    if (attach_input_) {
        std::vector<std::string> extra;
        for (const auto &name : outer.values.names()) {
            if (!result.values.contains(name)) { extra.push_back(name); }
        }
        if (!extra.empty()) {
            for (const auto &name : extra) { result.values.set(name, outer.values.at(name)); }
            if (result.jacobian) {
                Jacobian rows;
                if (outer.has_jacobian()) {
                    rows = outer.jacobian->select_rows(extra);
                } else {
                    rows = Jacobian::zeros(extra, columns);
                    for (const auto &name : extra) {
                        if (rows.has_col(name)) { rows.set(name, name, 1.0); }
                    }
                }
                result.jacobian = result.jacobian->append_rows(rows);
            }
        }
    }

    return result;
}

std::shared_ptr<ExplicitTransform>
build_explicit(const EquationSet &equations,
               const std::optional<std::vector<std::string>> &parameters,
               const TransformOptions &options) {
    return std::make_shared<ExplicitTransform>(equations, parameters, options);
}

} // namespace par_trafo
