#ifndef EXPRESSION_HPP
#define EXPRESSION_HPP

#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace par_trafo {

//-----------------------------------------------------------------------------
// Expression
//-----------------------------------------------------------------------------
// Immutable expression tree over named symbols. Nodes are shared, so copying an
// Expression is cheap. The arithmetic operators below fold constants and drop
// neutral elements, which keeps symbolic derivatives small (d/dx of an
// expression without x is the literal 0).

enum class ExprKind { Number, Symbol, Negate, Add, Subtract, Multiply, Divide, Power, Call };

struct ExprNode;

class Expression {
  public:
    // Zero
    Expression();
    Expression(double value);

    static Expression symbol(const std::string &name);
    static Expression call(const std::string &function, std::vector<Expression> args);

    [[nodiscard]] ExprKind kind() const;
    [[nodiscard]] double value() const;             // Number only
    [[nodiscard]] const std::string &name() const;  // Symbol or function name
    [[nodiscard]] const std::vector<Expression> &args() const;

    [[nodiscard]] bool is_number() const { return kind() == ExprKind::Number; }
    [[nodiscard]] bool is_number(double v) const { return is_number() && value() == v; }
    [[nodiscard]] bool is_zero() const { return is_number(0.0); }
    [[nodiscard]] bool is_symbol() const { return kind() == ExprKind::Symbol; }

    bool operator==(const Expression &other) const;
    bool operator!=(const Expression &other) const { return !(*this == other); }

  private:
    explicit Expression(std::shared_ptr<const ExprNode> node);
    static Expression make(ExprKind kind, std::vector<Expression> args);

    friend Expression operator-(const Expression &a);
    friend Expression operator+(const Expression &a, const Expression &b);
    friend Expression operator-(const Expression &a, const Expression &b);
    friend Expression operator*(const Expression &a, const Expression &b);
    friend Expression operator/(const Expression &a, const Expression &b);
    friend Expression pow(const Expression &base, const Expression &exponent);

    std::shared_ptr<const ExprNode> node_;
};

struct ExprNode {
    ExprKind kind = ExprKind::Number;
    double value = 0.0;
    std::string name;
    std::vector<Expression> args;
};

// Simplifying constructors
Expression
operator-(const Expression &a);
Expression
operator+(const Expression &a, const Expression &b);
Expression
operator-(const Expression &a, const Expression &b);
Expression
operator*(const Expression &a, const Expression &b);
Expression
operator/(const Expression &a, const Expression &b);
Expression
pow(const Expression &base, const Expression &exponent);

//-----------------------------------------------------------------------------
// Function vocabulary
//-----------------------------------------------------------------------------

/**
 * @brief Number of arguments taken by a vocabulary function, or -1 if the name is unknown.
 */
int
function_arity(const std::string &function);

/**
 * @brief Applies a vocabulary function to numeric arguments.
 * @throws std::invalid_argument for unknown functions or a wrong argument count.
 */
double
apply_function(const std::string &function, const std::vector<double> &args);

//-----------------------------------------------------------------------------
// Parsing and printing
//-----------------------------------------------------------------------------

/**
 * @brief Parses an infix expression such as "k1*exp(-logA) + 2^x".
 *
 * Precedence, from tightest: function call and parentheses, '^' (right
 * associative, "**" is accepted as an alias), unary minus, '*' '/', '+' '-'.
 *
 * @throws ExpressionParseError on malformed input.
 */
Expression
parse_expression(const std::string &text);

std::string
to_string(const Expression &expr);

std::ostream &
operator<<(std::ostream &os, const Expression &expr);

//-----------------------------------------------------------------------------
// Symbolic operations
//-----------------------------------------------------------------------------

// Free symbols in order of first appearance
std::vector<std::string>
symbols(const Expression &expr);

bool
depends_on(const Expression &expr, const std::string &symbol);

/**
 * @brief Partial derivative of expr with respect to a symbol.
 *
 * All other symbols are treated as independent of `symbol`.
 */
Expression
differentiate(const Expression &expr, const std::string &symbol);

Expression
substitute(const Expression &expr, const std::map<std::string, Expression> &replacements);

/**
 * @brief Evaluates an expression against named values.
 * @throws UnresolvedSymbolError if a symbol has no value.
 */
double
evaluate(const Expression &expr, const std::map<std::string, double> &values);

} // namespace par_trafo

#endif // EXPRESSION_HPP
