#ifndef COMPILED_EVALUATOR_HPP
#define COMPILED_EVALUATOR_HPP

#include "equation_set.hpp"
#include "parameter_vector.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace par_trafo {

struct EvaluatorOptions {
    // Flatten every expression into a postfix instruction tape once, instead of
    // walking the expression trees on every call. Results are identical.
    bool compile = false;
    // Used in log output and as name()
    std::string model_name;
    bool verbose = false;
};

/**
 * @brief Numeric evaluator for an EquationSet over a declared parameter list.
 *
 * Input values are selected by name, so the order of the input vector does
 * not matter. Every symbol used by the equations must be declared.
 */
class CompiledEvaluator {
  public:
    /**
     * @param equations The equations to evaluate, in output order.
     * @param parameters The symbols values will be supplied for. Duplicates are ignored.
     * @throws UnresolvedSymbolError if an equation references an undeclared symbol.
     */
    CompiledEvaluator(const EquationSet &equations,
                      const std::vector<std::string> &parameters,
                      const EvaluatorOptions &options = {});

    /**
     * @brief Evaluates all equations at one point.
     * @return 1 x size() matrix, columns in equation order.
     * @throws std::invalid_argument if a declared parameter has no value in `input`.
     */
    [[nodiscard]] Eigen::MatrixXd evaluate(const NamedValues &input) const;

    // Same as evaluate() but returns the single row as a vector
    [[nodiscard]] Eigen::VectorXd evaluate_vector(const NamedValues &input) const;

    /**
     * @brief Vectorized evaluation, one output row per input row.
     * @param inputs n x parameters().size(), columns in parameters() order.
     */
    [[nodiscard]] Eigen::MatrixXd evaluate_rows(const Eigen::MatrixXd &inputs) const;

    [[nodiscard]] const std::vector<std::string> &outputs() const { return outputs_; }
    [[nodiscard]] const std::vector<std::string> &parameters() const { return parameters_; }
    [[nodiscard]] std::size_t size() const { return outputs_.size(); }
    [[nodiscard]] const std::string &name() const { return options_.model_name; }
    [[nodiscard]] bool is_compiled() const { return options_.compile; }

  private:
    enum class OpCode { Constant, Load, Negate, Add, Subtract, Multiply, Divide, Power, Call };

    struct Instruction {
        OpCode op;
        double constant = 0.0;
        std::size_t index = 0;    // parameter slot for Load
        std::string function;     // Call
        std::size_t arity = 0;    // Call
    };

    void compile_expression(const Expression &expr, std::vector<Instruction> &tape) const;
    double run_tape(const std::vector<Instruction> &tape, const double *slots) const;
    double walk(const Expression &expr, const double *slots) const;
    void evaluate_into(const double *slots, double *out) const;

    EquationSet equations_;
    std::vector<std::string> outputs_;
    std::vector<std::string> parameters_;
    std::map<std::string, std::size_t> slot_of_;
    std::vector<std::vector<Instruction>> tapes_;
    EvaluatorOptions options_;
};

} // namespace par_trafo

#endif // COMPILED_EVALUATOR_HPP
