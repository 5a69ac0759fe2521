#include "parameter_transform.hpp"
#include "explicit_transform.hpp"
#include "implicit_transform.hpp"

#include <stdexcept> // For std::invalid_argument

namespace par_trafo {

namespace {

const ParameterTransform &
checked(const std::shared_ptr<ParameterTransform> &transform, const char *role) {
    if (!transform) { throw std::invalid_argument(std::string("compose: ") + role + " transformation is null."); }
    return *transform;
}

} // namespace

ComposedTransform::ComposedTransform(std::shared_ptr<ParameterTransform> outer,
                                     std::shared_ptr<ParameterTransform> inner)
  : ParameterTransform(checked(outer, "outer").equations(),
                       checked(inner, "inner").parameters(),
                       checked(outer, "outer").condition(),
                       checked(outer, "outer").model_name())
  , outer_(std::move(outer))
  , inner_(std::move(inner)) {}

ParameterVector
ComposedTransform::apply(const ParameterVector &pars, const NamedValues &fixed, bool deriv) {
    ParameterVector const intermediate = inner_->apply(pars, fixed, deriv);
    return outer_->apply(intermediate, NamedValues(), deriv);
}

std::shared_ptr<ComposedTransform>
compose(std::shared_ptr<ParameterTransform> outer, std::shared_ptr<ParameterTransform> inner) {
    return std::make_shared<ComposedTransform>(std::move(outer), std::move(inner));
}

std::shared_ptr<ParameterTransform>
make_transform(const EquationSet &equations,
               const std::optional<std::vector<std::string>> &parameters,
               TransformMethod method,
               const TransformOptions &options) {
    switch (method) {
    case TransformMethod::Explicit:
        return build_explicit(equations, parameters, options);
    case TransformMethod::Implicit:
        return build_implicit(equations, parameters.value_or(std::vector<std::string>{}), options);
    }
    throw std::invalid_argument("make_transform: unknown transformation method.");
}

} // namespace par_trafo
