#ifndef PARAMETER_TRANSFORM_HPP
#define PARAMETER_TRANSFORM_HPP

#include "equation_set.hpp"
#include "parameter_vector.hpp"
#include "transform_options.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace par_trafo {

/**
 * @brief A parameter transformation outer -> inner together with its Jacobian.
 *
 * Calling a transformation evaluates the inner parameters for the given outer
 * ones. If derivatives are requested the result carries the Jacobian of the
 * inner parameters; when the input already carried a Jacobian with respect to
 * some reference parameterization, the two are multiplied so the result is
 * again relative to that reference.
 */
class ParameterTransform {
  public:
    virtual ~ParameterTransform() = default;

    /**
     * @param outer Outer parameter values, optionally with their own Jacobian.
     * @param fixed Values overriding or extending `outer`. Fixed parameters never
     *              get a Jacobian column.
     * @param deriv Whether the result should carry a Jacobian.
     */
    virtual ParameterVector apply(const ParameterVector &outer, const NamedValues &fixed, bool deriv) = 0;

    ParameterVector operator()(const ParameterVector &outer, const NamedValues &fixed = {}, bool deriv = true) {
        return apply(outer, fixed, deriv);
    }

    [[nodiscard]] virtual TransformMethod method() const = 0;

    [[nodiscard]] const EquationSet &equations() const { return equations_; }
    [[nodiscard]] const std::vector<std::string> &parameters() const { return parameters_; }
    [[nodiscard]] const std::string &condition() const { return condition_; }
    [[nodiscard]] const std::string &model_name() const { return model_name_; }

  protected:
    ParameterTransform(EquationSet equations,
                       std::vector<std::string> parameters,
                       std::string condition,
                       std::string model_name)
      : equations_(std::move(equations))
      , parameters_(std::move(parameters))
      , condition_(std::move(condition))
      , model_name_(std::move(model_name)) {}

  private:
    EquationSet equations_;
    std::vector<std::string> parameters_;
    std::string condition_;
    std::string model_name_;
};

/**
 * @brief outer(inner(p)). Declared parameters are those of `inner`.
 */
class ComposedTransform : public ParameterTransform {
  public:
    ComposedTransform(std::shared_ptr<ParameterTransform> outer, std::shared_ptr<ParameterTransform> inner);

    ParameterVector apply(const ParameterVector &pars, const NamedValues &fixed, bool deriv) override;

    [[nodiscard]] TransformMethod method() const override { return outer_->method(); }

    [[nodiscard]] const std::shared_ptr<ParameterTransform> &outer() const { return outer_; }
    [[nodiscard]] const std::shared_ptr<ParameterTransform> &inner() const { return inner_; }

  private:
    std::shared_ptr<ParameterTransform> outer_;
    std::shared_ptr<ParameterTransform> inner_;
};

/**
 * @brief Sequences two transformations: apply `inner`, feed its result to `outer`.
 *
 * `fixed` is handed to `inner` only; the composed Jacobian is relative to the
 * input of `inner`.
 * @throws std::invalid_argument if either argument is null.
 */
std::shared_ptr<ComposedTransform>
compose(std::shared_ptr<ParameterTransform> outer, std::shared_ptr<ParameterTransform> inner);

/**
 * @brief Builds an explicit or implicit transformation.
 *
 * @param parameters Explicit: declared outer parameters (defaults to the
 *                   symbols of `equations`). Implicit: the free parameters,
 *                   i.e. states that are not solved for.
 */
std::shared_ptr<ParameterTransform>
make_transform(const EquationSet &equations,
               const std::optional<std::vector<std::string>> &parameters,
               TransformMethod method,
               const TransformOptions &options = {});

} // namespace par_trafo

#endif // PARAMETER_TRANSFORM_HPP
