#ifndef TRANSFORM_ERRORS_HPP
#define TRANSFORM_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace par_trafo {

//-----------------------------------------------------------------------------
// Construction-time errors: a builder rejects its input, nothing is returned.
//-----------------------------------------------------------------------------
class ConstructionError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

class ExpressionParseError : public ConstructionError {
  public:
    ExpressionParseError(const std::string &message, std::size_t position)
      : ConstructionError(message + " (at position " + std::to_string(position) + ")")
      , position_(position) {}

    [[nodiscard]] std::size_t position() const { return position_; }

  private:
    std::size_t position_;
};

class UnresolvedSymbolError : public ConstructionError {
  public:
    explicit UnresolvedSymbolError(std::vector<std::string> symbols, const std::string &context = "")
      : ConstructionError(make_message(symbols, context))
      , symbols_(std::move(symbols)) {}

    [[nodiscard]] const std::vector<std::string> &symbols() const { return symbols_; }

  private:
    static std::string make_message(const std::vector<std::string> &symbols, const std::string &context) {
        std::string msg = "Unresolved symbol(s)";
        if (!context.empty()) { msg += " in " + context; }
        msg += ":";
        for (const auto &s : symbols) { msg += " '" + s + "'"; }
        return msg;
    }

    std::vector<std::string> symbols_;
};

class DuplicateEquationError : public ConstructionError {
  public:
    explicit DuplicateEquationError(const std::string &name)
      : ConstructionError("Equation '" + name + "' is defined more than once.")
      , name_(name) {}

    [[nodiscard]] const std::string &name() const { return name_; }

  private:
    std::string name_;
};

//-----------------------------------------------------------------------------
// Call-time errors: abort the single call, cached state is left untouched.
//-----------------------------------------------------------------------------
class TransformError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class NumericalError : public TransformError {
  public:
    using TransformError::TransformError;
};

class RootNotFoundError : public NumericalError {
  public:
    RootNotFoundError(const std::string &message, int iterations, double residual_norm)
      : NumericalError(message)
      , iterations_(iterations)
      , residual_norm_(residual_norm) {}

    [[nodiscard]] int iterations() const { return iterations_; }
    [[nodiscard]] double residual_norm() const { return residual_norm_; }

  private:
    int iterations_;
    double residual_norm_;
};

class SingularJacobianError : public NumericalError {
  public:
    SingularJacobianError(const std::string &message, long rank, long dimension)
      : NumericalError(message)
      , rank_(rank)
      , dimension_(dimension) {}

    [[nodiscard]] long rank() const { return rank_; }
    [[nodiscard]] long dimension() const { return dimension_; }

  private:
    long rank_;
    long dimension_;
};

} // namespace par_trafo

#endif // TRANSFORM_ERRORS_HPP
