#include "compiled_evaluator.hpp"
#include "transform_errors.hpp"

#include <cmath>     // For std::pow
#include <iostream>  // For std::cout compile report
#include <set>
#include <stdexcept> // For std::invalid_argument

namespace par_trafo {

CompiledEvaluator::CompiledEvaluator(const EquationSet &equations,
                                     const std::vector<std::string> &parameters,
                                     const EvaluatorOptions &options)
  : equations_(equations)
  , outputs_(equations.names())
  , options_(options) {
    for (const auto &p : parameters) {
        if (slot_of_.count(p) > 0) { continue; }
        slot_of_[p] = parameters_.size();
        parameters_.push_back(p);
    }

    std::vector<std::string> missing;
    for (const auto &s : equations_.symbols()) {
        if (slot_of_.count(s) == 0) { missing.push_back(s); }
    }
    if (!missing.empty()) {
        std::string context = "equations";
        if (!options_.model_name.empty()) { context += " of '" + options_.model_name + "'"; }
        throw UnresolvedSymbolError(missing, context);
    }

    if (options_.compile) {
        tapes_.reserve(equations_.size());
        std::size_t total = 0;
        for (const auto &eq : equations_) {
            std::vector<Instruction> tape;
            compile_expression(eq.rhs, tape);
            total += tape.size();
            tapes_.push_back(std::move(tape));
        }
        if (options_.verbose) {
            std::cout << "[CompiledEvaluator] Compiled '" << options_.model_name << "': " << equations_.size()
                      << " equation(s), " << parameters_.size() << " parameter(s), " << total << " instruction(s)."
                      << std::endl;
        }
    } else if (options_.verbose) {
        std::cout << "[CompiledEvaluator] Prepared '" << options_.model_name << "' for tree evaluation: "
                  << equations_.size() << " equation(s), " << parameters_.size() << " parameter(s)." << std::endl;
    }
}

void
CompiledEvaluator::compile_expression(const Expression &expr, std::vector<Instruction> &tape) const {
    for (const auto &a : expr.args()) { compile_expression(a, tape); }

    Instruction ins{ OpCode::Constant };
    switch (expr.kind()) {
        case ExprKind::Number:
            ins.constant = expr.value();
            break;
        case ExprKind::Symbol:
            ins.op = OpCode::Load;
            ins.index = slot_of_.at(expr.name());
            break;
        case ExprKind::Negate:
            ins.op = OpCode::Negate;
            break;
        case ExprKind::Add:
            ins.op = OpCode::Add;
            break;
        case ExprKind::Subtract:
            ins.op = OpCode::Subtract;
            break;
        case ExprKind::Multiply:
            ins.op = OpCode::Multiply;
            break;
        case ExprKind::Divide:
            ins.op = OpCode::Divide;
            break;
        case ExprKind::Power:
            ins.op = OpCode::Power;
            break;
        case ExprKind::Call:
            ins.op = OpCode::Call;
            ins.function = expr.name();
            ins.arity = expr.args().size();
            break;
    }
    tape.push_back(std::move(ins));
}

double
CompiledEvaluator::run_tape(const std::vector<Instruction> &tape, const double *slots) const {
    std::vector<double> stack;
    stack.reserve(tape.size());
    for (const auto &ins : tape) {
        switch (ins.op) {
            case OpCode::Constant:
                stack.push_back(ins.constant);
                break;
            case OpCode::Load:
                stack.push_back(slots[ins.index]);
                break;
            case OpCode::Negate:
                stack.back() = -stack.back();
                break;
            case OpCode::Call: {
                std::vector<double> args(stack.end() - static_cast<std::ptrdiff_t>(ins.arity), stack.end());
                stack.resize(stack.size() - ins.arity);
                stack.push_back(apply_function(ins.function, args));
                break;
            }
            default: {
                double const rhs = stack.back();
                stack.pop_back();
                double &lhs = stack.back();
                if (ins.op == OpCode::Add) {
                    lhs += rhs;
                } else if (ins.op == OpCode::Subtract) {
                    lhs -= rhs;
                } else if (ins.op == OpCode::Multiply) {
                    lhs *= rhs;
                } else if (ins.op == OpCode::Divide) {
                    lhs /= rhs;
                } else {
                    lhs = std::pow(lhs, rhs);
                }
                break;
            }
        }
    }
    return stack.back();
}

double
CompiledEvaluator::walk(const Expression &expr, const double *slots) const {
    const auto &a = expr.args();
    switch (expr.kind()) {
        case ExprKind::Number:
            return expr.value();
        case ExprKind::Symbol:
            return slots[slot_of_.at(expr.name())];
        case ExprKind::Negate:
            return -walk(a[0], slots);
        case ExprKind::Add:
            return walk(a[0], slots) + walk(a[1], slots);
        case ExprKind::Subtract:
            return walk(a[0], slots) - walk(a[1], slots);
        case ExprKind::Multiply:
            return walk(a[0], slots) * walk(a[1], slots);
        case ExprKind::Divide:
            return walk(a[0], slots) / walk(a[1], slots);
        case ExprKind::Power:
            return std::pow(walk(a[0], slots), walk(a[1], slots));
        case ExprKind::Call: {
            std::vector<double> args;
            args.reserve(a.size());
            for (const auto &arg : a) { args.push_back(walk(arg, slots)); }
            return apply_function(expr.name(), args);
        }
    }
    return 0.0;
}

void
CompiledEvaluator::evaluate_into(const double *slots, double *out) const {
    for (std::size_t i = 0; i < equations_.size(); ++i) {
        out[i] = options_.compile ? run_tape(tapes_[i], slots) : walk(equations_[i].rhs, slots);
    }
}

Eigen::MatrixXd
CompiledEvaluator::evaluate(const NamedValues &input) const {
    std::vector<double> slots(parameters_.size());
    for (std::size_t k = 0; k < parameters_.size(); ++k) {
        if (!input.contains(parameters_[k])) {
            std::string msg = "No value supplied for parameter '" + parameters_[k] + "'";
            if (!options_.model_name.empty()) { msg += " of '" + options_.model_name + "'"; }
            throw std::invalid_argument(msg + ".");
        }
        slots[k] = input.at(parameters_[k]);
    }

    Eigen::MatrixXd result(1, static_cast<Eigen::Index>(equations_.size()));
    std::vector<double> row(equations_.size());
    evaluate_into(slots.data(), row.data());
    for (std::size_t i = 0; i < row.size(); ++i) { result(0, static_cast<Eigen::Index>(i)) = row[i]; }
    return result;
}

Eigen::VectorXd
CompiledEvaluator::evaluate_vector(const NamedValues &input) const {
    return evaluate(input).row(0).transpose();
}

Eigen::MatrixXd
CompiledEvaluator::evaluate_rows(const Eigen::MatrixXd &inputs) const {
    if (inputs.cols() != static_cast<Eigen::Index>(parameters_.size())) {
        throw std::invalid_argument("Expected " + std::to_string(parameters_.size()) + " input column(s), got " +
                                    std::to_string(inputs.cols()) + ".");
    }
    Eigen::MatrixXd result(inputs.rows(), static_cast<Eigen::Index>(equations_.size()));
    std::vector<double> slots(parameters_.size());
    std::vector<double> row(equations_.size());
    for (Eigen::Index r = 0; r < inputs.rows(); ++r) {
        for (std::size_t k = 0; k < parameters_.size(); ++k) { slots[k] = inputs(r, static_cast<Eigen::Index>(k)); }
        evaluate_into(slots.data(), row.data());
        for (std::size_t i = 0; i < row.size(); ++i) { result(r, static_cast<Eigen::Index>(i)) = row[i]; }
    }
    return result;
}

} // namespace par_trafo
