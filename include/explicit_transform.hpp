#ifndef EXPLICIT_TRANSFORM_HPP
#define EXPLICIT_TRANSFORM_HPP

#include "compiled_evaluator.hpp"
#include "parameter_transform.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace par_trafo {

/**
 * @brief Transformation by direct substitution, inner_i = f_i(outer).
 *
 * Declared parameters not defined by an equation are passed through by an
 * identity equation, so every declared parameter has a value in the result.
 */
class ExplicitTransform : public ParameterTransform {
  public:
    /**
     * @throws DuplicateEquationError if an identity equation would redefine an output.
     * @throws UnresolvedSymbolError if an equation uses an undeclared symbol.
     */
    ExplicitTransform(const EquationSet &equations,
                      const std::optional<std::vector<std::string>> &parameters,
                      const TransformOptions &options = {});

    ParameterVector apply(const ParameterVector &outer, const NamedValues &fixed, bool deriv) override;

    [[nodiscard]] TransformMethod method() const override { return TransformMethod::Explicit; }

    [[nodiscard]] const EquationSet &jacobian_equations() const { return jacobian_equations_; }

    void set_attach_input(bool attach) { attach_input_ = attach; }
    [[nodiscard]] bool attach_input() const { return attach_input_; }

  private:
    EquationSet jacobian_equations_;
    std::unique_ptr<CompiledEvaluator> evaluator_;
    std::unique_ptr<CompiledEvaluator> deriv_evaluator_;
    bool attach_input_ = false;
};

std::shared_ptr<ExplicitTransform>
build_explicit(const EquationSet &equations,
               const std::optional<std::vector<std::string>> &parameters = std::nullopt,
               const TransformOptions &options = {});

} // namespace par_trafo

#endif // EXPLICIT_TRANSFORM_HPP
