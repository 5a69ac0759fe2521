#include "expression.hpp"
#include "transform_errors.hpp"

#include <cctype>  // For std::isdigit, std::isalpha in the parser
#include <cmath>   // For std::exp, std::log, std::pow
#include <iomanip> // For std::setprecision
#include <limits>  // For std::numeric_limits
#include <sstream> // For std::ostringstream
#include <stdexcept>

namespace par_trafo {

//-----------------------------------------------------------------------------
// Node access
//-----------------------------------------------------------------------------

Expression::Expression()
  : Expression(0.0) {}

Expression::Expression(double value) {
    auto node = std::make_shared<ExprNode>();
    node->kind = ExprKind::Number;
    node->value = value;
    node_ = std::move(node);
}

Expression::Expression(std::shared_ptr<const ExprNode> node)
  : node_(std::move(node)) {}

Expression
Expression::symbol(const std::string &name) {
    if (name.empty()) { throw std::invalid_argument("Symbol name must not be empty."); }
    auto node = std::make_shared<ExprNode>();
    node->kind = ExprKind::Symbol;
    node->name = name;
    return Expression(std::shared_ptr<const ExprNode>(std::move(node)));
}

Expression
Expression::make(ExprKind kind, std::vector<Expression> args) {
    auto node = std::make_shared<ExprNode>();
    node->kind = kind;
    node->args = std::move(args);
    return Expression(std::shared_ptr<const ExprNode>(std::move(node)));
}

Expression
Expression::call(const std::string &function, std::vector<Expression> args) {
    int const arity = function_arity(function);
    if (arity < 0) { throw std::invalid_argument("Unknown function '" + function + "'."); }
    if (static_cast<int>(args.size()) != arity) {
        throw std::invalid_argument("Function '" + function + "' expects " + std::to_string(arity) +
                                    " argument(s), got " + std::to_string(args.size()) + ".");
    }
    if (function == "pow") { return par_trafo::pow(args[0], args[1]); }

    // Fold calls on numbers as long as the result stays finite
    bool all_numbers = true;
    std::vector<double> numeric_args;
    for (const auto &a : args) {
        if (!a.is_number()) {
            all_numbers = false;
            break;
        }
        numeric_args.push_back(a.value());
    }
    if (all_numbers) {
        double const folded = apply_function(function, numeric_args);
        if (std::isfinite(folded)) { return Expression(folded); }
    }

    auto node = std::make_shared<ExprNode>();
    node->kind = ExprKind::Call;
    node->name = function;
    node->args = std::move(args);
    return Expression(std::shared_ptr<const ExprNode>(std::move(node)));
}

ExprKind
Expression::kind() const {
    return node_->kind;
}

double
Expression::value() const {
    return node_->value;
}

const std::string &
Expression::name() const {
    return node_->name;
}

const std::vector<Expression> &
Expression::args() const {
    return node_->args;
}

bool
Expression::operator==(const Expression &other) const {
    if (node_ == other.node_) { return true; }
    if (kind() != other.kind()) { return false; }
    switch (kind()) {
        case ExprKind::Number:
            return value() == other.value();
        case ExprKind::Symbol:
            return name() == other.name();
        case ExprKind::Call:
            if (name() != other.name()) { return false; }
            break;
        default:
            break;
    }
    return args() == other.args();
}

//-----------------------------------------------------------------------------
// Simplifying constructors
//-----------------------------------------------------------------------------

Expression
operator-(const Expression &a) {
    if (a.is_number()) { return Expression(-a.value()); }
    if (a.kind() == ExprKind::Negate) { return a.args()[0]; }
    return Expression::make(ExprKind::Negate, { a });
}

Expression
operator+(const Expression &a, const Expression &b) {
    if (a.is_number() && b.is_number()) { return Expression(a.value() + b.value()); }
    if (a.is_zero()) { return b; }
    if (b.is_zero()) { return a; }
    if (b.kind() == ExprKind::Negate) { return a - b.args()[0]; }
    return Expression::make(ExprKind::Add, { a, b });
}

Expression
operator-(const Expression &a, const Expression &b) {
    if (a.is_number() && b.is_number()) { return Expression(a.value() - b.value()); }
    if (b.is_zero()) { return a; }
    if (a.is_zero()) { return -b; }
    if (a == b) { return Expression(0.0); }
    if (b.kind() == ExprKind::Negate) { return a + b.args()[0]; }
    return Expression::make(ExprKind::Subtract, { a, b });
}

Expression
operator*(const Expression &a, const Expression &b) {
    if (a.is_number() && b.is_number()) { return Expression(a.value() * b.value()); }
    if (a.is_zero() || b.is_zero()) { return Expression(0.0); }
    if (a.is_number(1.0)) { return b; }
    if (b.is_number(1.0)) { return a; }
    if (a.is_number(-1.0)) { return -b; }
    if (b.is_number(-1.0)) { return -a; }
    if (a.kind() == ExprKind::Negate) { return -(a.args()[0] * b); }
    if (b.kind() == ExprKind::Negate) { return -(a * b.args()[0]); }
    return Expression::make(ExprKind::Multiply, { a, b });
}

Expression
operator/(const Expression &a, const Expression &b) {
    if (a.is_zero()) { return Expression(0.0); }
    if (b.is_number(1.0)) { return a; }
    if (b.is_number(-1.0)) { return -a; }
    if (a.is_number() && b.is_number() && b.value() != 0.0) { return Expression(a.value() / b.value()); }
    if (a.kind() == ExprKind::Negate) { return -(a.args()[0] / b); }
    return Expression::make(ExprKind::Divide, { a, b });
}

Expression
pow(const Expression &base, const Expression &exponent) {
    if (exponent.is_zero()) { return Expression(1.0); }
    if (exponent.is_number(1.0)) { return base; }
    if (base.is_number(1.0)) { return Expression(1.0); }
    if (base.is_number() && exponent.is_number()) {
        double const folded = std::pow(base.value(), exponent.value());
        if (std::isfinite(folded)) { return Expression(folded); }
    }
    return Expression::make(ExprKind::Power, { base, exponent });
}

//-----------------------------------------------------------------------------
// Function vocabulary
//-----------------------------------------------------------------------------

int
function_arity(const std::string &function) {
    static const std::map<std::string, int> arities = {
        { "exp", 1 },  { "log", 1 },  { "sqrt", 1 }, { "sin", 1 },  { "cos", 1 },
        { "tan", 1 },  { "sinh", 1 }, { "cosh", 1 }, { "tanh", 1 }, { "abs", 1 },
        { "asin", 1 }, { "acos", 1 }, { "atan", 1 }, { "pow", 2 },
    };
    auto it = arities.find(function);
    return it == arities.end() ? -1 : it->second;
}

double
apply_function(const std::string &function, const std::vector<double> &args) {
    int const arity = function_arity(function);
    if (arity < 0) { throw std::invalid_argument("Unknown function '" + function + "'."); }
    if (static_cast<int>(args.size()) != arity) {
        throw std::invalid_argument("Function '" + function + "' called with wrong number of arguments.");
    }
    double const x = args[0];
    if (function == "exp") { return std::exp(x); }
    if (function == "log") { return std::log(x); }
    if (function == "sqrt") { return std::sqrt(x); }
    if (function == "sin") { return std::sin(x); }
    if (function == "cos") { return std::cos(x); }
    if (function == "tan") { return std::tan(x); }
    if (function == "sinh") { return std::sinh(x); }
    if (function == "cosh") { return std::cosh(x); }
    if (function == "tanh") { return std::tanh(x); }
    if (function == "abs") { return std::abs(x); }
    if (function == "asin") { return std::asin(x); }
    if (function == "acos") { return std::acos(x); }
    if (function == "atan") { return std::atan(x); }
    return std::pow(x, args[1]); // pow
}

//-----------------------------------------------------------------------------
// Parser
//-----------------------------------------------------------------------------

namespace {

class ExpressionParser {
  public:
    explicit ExpressionParser(const std::string &text)
      : text_(text) {}

    Expression parse() {
        skip_space();
        if (pos_ >= text_.size()) { throw ExpressionParseError("Empty expression", pos_); }
        Expression result = parse_sum();
        skip_space();
        if (pos_ < text_.size()) {
            throw ExpressionParseError(std::string("Unexpected character '") + text_[pos_] + "'", pos_);
        }
        return result;
    }

  private:
    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) { ++pos_; }
    }

    bool accept(char c) {
        skip_space();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    // '^' or its alias "**"; must not consume a lone '*'
    bool accept_power() {
        skip_space();
        if (pos_ < text_.size() && text_[pos_] == '^') {
            ++pos_;
            return true;
        }
        if (pos_ + 1 < text_.size() && text_[pos_] == '*' && text_[pos_ + 1] == '*') {
            pos_ += 2;
            return true;
        }
        return false;
    }

    bool peek_multiply() {
        skip_space();
        return pos_ < text_.size() && text_[pos_] == '*' && !(pos_ + 1 < text_.size() && text_[pos_ + 1] == '*');
    }

    Expression parse_sum() {
        Expression lhs = parse_product();
        while (true) {
            if (accept('+')) {
                lhs = lhs + parse_product();
            } else if (accept('-')) {
                lhs = lhs - parse_product();
            } else {
                return lhs;
            }
        }
    }

    Expression parse_product() {
        Expression lhs = parse_unary();
        while (true) {
            if (peek_multiply()) {
                ++pos_;
                lhs = lhs * parse_unary();
            } else if (accept('/')) {
                lhs = lhs / parse_unary();
            } else {
                return lhs;
            }
        }
    }

    Expression parse_unary() {
        if (accept('-')) { return -parse_unary(); }
        if (accept('+')) { return parse_unary(); }
        return parse_power();
    }

    Expression parse_power() {
        Expression base = parse_primary();
        if (accept_power()) { return pow(base, parse_unary()); }
        return base;
    }

    Expression parse_primary() {
        skip_space();
        if (pos_ >= text_.size()) { throw ExpressionParseError("Unexpected end of expression", pos_); }

        char const c = text_[pos_];
        if (c == '(') {
            std::size_t const open = pos_;
            ++pos_;
            Expression inner = parse_sum();
            if (!accept(')')) { throw ExpressionParseError("Unbalanced parenthesis", open); }
            return inner;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') { return parse_number(); }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') { return parse_identifier(); }

        throw ExpressionParseError(std::string("Unexpected character '") + c + "'", pos_);
    }

    Expression parse_number() {
        std::size_t const start = pos_;
        while (pos_ < text_.size() && (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
            ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            std::size_t exp_pos = pos_ + 1;
            if (exp_pos < text_.size() && (text_[exp_pos] == '+' || text_[exp_pos] == '-')) { ++exp_pos; }
            if (exp_pos < text_.size() && std::isdigit(static_cast<unsigned char>(text_[exp_pos]))) {
                pos_ = exp_pos;
                while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) { ++pos_; }
            }
        }
        std::string const literal = text_.substr(start, pos_ - start);
        std::size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(literal, &consumed);
        } catch (const std::exception &) {
            throw ExpressionParseError("Invalid number '" + literal + "'", start);
        }
        if (consumed != literal.size()) { throw ExpressionParseError("Invalid number '" + literal + "'", start); }
        return Expression(value);
    }

    Expression parse_identifier() {
        std::size_t const start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_' || text_[pos_] == '.')) {
            ++pos_;
        }
        std::string const ident = text_.substr(start, pos_ - start);

        if (!accept('(')) { return Expression::symbol(ident); }

        int const arity = function_arity(ident);
        if (arity < 0) { throw ExpressionParseError("Unknown function '" + ident + "'", start); }

        std::vector<Expression> args;
        if (!accept(')')) {
            do { args.push_back(parse_sum()); } while (accept(','));
            if (!accept(')')) { throw ExpressionParseError("Unbalanced parenthesis in call to '" + ident + "'", start); }
        }
        if (static_cast<int>(args.size()) != arity) {
            throw ExpressionParseError("Function '" + ident + "' expects " + std::to_string(arity) + " argument(s)",
                                       start);
        }
        return Expression::call(ident, std::move(args));
    }

    const std::string &text_;
    std::size_t pos_ = 0;
};

} // namespace

Expression
parse_expression(const std::string &text) {
    return ExpressionParser(text).parse();
}

//-----------------------------------------------------------------------------
// Printing
//-----------------------------------------------------------------------------

namespace {

int
precedence(const Expression &e) {
    switch (e.kind()) {
        case ExprKind::Add:
        case ExprKind::Subtract:
            return 1;
        case ExprKind::Multiply:
        case ExprKind::Divide:
            return 2;
        case ExprKind::Negate:
            return 3;
        case ExprKind::Power:
            return 4;
        case ExprKind::Number:
            return e.value() < 0.0 ? 3 : 5;
        default:
            return 5;
    }
}

std::string
format_number(double v) {
    if (std::isinf(v)) { return v > 0 ? "1e999" : "-1e999"; }
    std::ostringstream os;
    os << std::setprecision(15) << v;
    if (std::stod(os.str()) != v) {
        os.str("");
        os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    }
    return os.str();
}

void
print(std::ostream &os, const Expression &e);

void
print_operand(std::ostream &os, const Expression &e, bool parenthesize) {
    if (parenthesize) { os << "("; }
    print(os, e);
    if (parenthesize) { os << ")"; }
}

void
print(std::ostream &os, const Expression &e) {
    int const prec = precedence(e);
    switch (e.kind()) {
        case ExprKind::Number:
            os << format_number(e.value());
            return;
        case ExprKind::Symbol:
            os << e.name();
            return;
        case ExprKind::Negate:
            os << "-";
            print_operand(os, e.args()[0], precedence(e.args()[0]) < prec);
            return;
        case ExprKind::Add:
        case ExprKind::Multiply:
            print_operand(os, e.args()[0], precedence(e.args()[0]) < prec);
            os << (e.kind() == ExprKind::Add ? " + " : "*");
            print_operand(os, e.args()[1], precedence(e.args()[1]) < prec);
            return;
        case ExprKind::Subtract:
        case ExprKind::Divide:
            print_operand(os, e.args()[0], precedence(e.args()[0]) < prec);
            os << (e.kind() == ExprKind::Subtract ? " - " : "/");
            print_operand(os, e.args()[1], precedence(e.args()[1]) <= prec);
            return;
        case ExprKind::Power:
            // Base must be a primary, exponent may be any unary
            print_operand(os, e.args()[0], precedence(e.args()[0]) <= prec);
            os << "^";
            print_operand(os, e.args()[1], precedence(e.args()[1]) < 3);
            return;
        case ExprKind::Call:
            os << e.name() << "(";
            for (std::size_t i = 0; i < e.args().size(); ++i) {
                if (i > 0) { os << ", "; }
                print(os, e.args()[i]);
            }
            os << ")";
            return;
    }
}

} // namespace

std::ostream &
operator<<(std::ostream &os, const Expression &expr) {
    print(os, expr);
    return os;
}

std::string
to_string(const Expression &expr) {
    std::ostringstream os;
    os << expr;
    return os.str();
}

//-----------------------------------------------------------------------------
// Symbolic operations
//-----------------------------------------------------------------------------

namespace {

void
collect_symbols(const Expression &e, std::vector<std::string> &out, std::set<std::string> &seen) {
    if (e.is_symbol()) {
        if (seen.insert(e.name()).second) { out.push_back(e.name()); }
        return;
    }
    for (const auto &a : e.args()) { collect_symbols(a, out, seen); }
}

} // namespace

std::vector<std::string>
symbols(const Expression &expr) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    collect_symbols(expr, out, seen);
    return out;
}

bool
depends_on(const Expression &expr, const std::string &symbol) {
    if (expr.is_symbol()) { return expr.name() == symbol; }
    for (const auto &a : expr.args()) {
        if (depends_on(a, symbol)) { return true; }
    }
    return false;
}

Expression
differentiate(const Expression &expr, const std::string &symbol) {
    if (!depends_on(expr, symbol)) { return Expression(0.0); }

    const auto &a = expr.args();
    switch (expr.kind()) {
        case ExprKind::Number:
            return Expression(0.0);
        case ExprKind::Symbol:
            return Expression(1.0);
        case ExprKind::Negate:
            return -differentiate(a[0], symbol);
        case ExprKind::Add:
            return differentiate(a[0], symbol) + differentiate(a[1], symbol);
        case ExprKind::Subtract:
            return differentiate(a[0], symbol) - differentiate(a[1], symbol);
        case ExprKind::Multiply:
            return differentiate(a[0], symbol) * a[1] + a[0] * differentiate(a[1], symbol);
        case ExprKind::Divide: {
            Expression const du = differentiate(a[0], symbol);
            Expression const dv = differentiate(a[1], symbol);
            if (dv.is_zero()) { return du / a[1]; }
            return (du * a[1] - a[0] * dv) / pow(a[1], Expression(2.0));
        }
        case ExprKind::Power: {
            const Expression &u = a[0];
            const Expression &v = a[1];
            if (!depends_on(v, symbol)) {
                return v * pow(u, v - Expression(1.0)) * differentiate(u, symbol);
            }
            // d(u^v) = u^v * (v' log(u) + v u'/u)
            return expr * (differentiate(v, symbol) * Expression::call("log", { u }) +
                           v * differentiate(u, symbol) / u);
        }
        case ExprKind::Call:
            break;
    }

    const std::string &f = expr.name();
    const Expression &u = a[0];
    Expression const du = differentiate(u, symbol);
    Expression outer;
    if (f == "exp") {
        outer = expr;
    } else if (f == "log") {
        return du / u;
    } else if (f == "sqrt") {
        return du / (Expression(2.0) * expr);
    } else if (f == "sin") {
        outer = Expression::call("cos", { u });
    } else if (f == "cos") {
        outer = -Expression::call("sin", { u });
    } else if (f == "tan") {
        return du / pow(Expression::call("cos", { u }), Expression(2.0));
    } else if (f == "sinh") {
        outer = Expression::call("cosh", { u });
    } else if (f == "cosh") {
        outer = Expression::call("sinh", { u });
    } else if (f == "tanh") {
        outer = Expression(1.0) - pow(expr, Expression(2.0));
    } else if (f == "abs") {
        outer = u / expr;
    } else if (f == "asin") {
        return du / Expression::call("sqrt", { Expression(1.0) - pow(u, Expression(2.0)) });
    } else if (f == "acos") {
        return -du / Expression::call("sqrt", { Expression(1.0) - pow(u, Expression(2.0)) });
    } else if (f == "atan") {
        return du / (Expression(1.0) + pow(u, Expression(2.0)));
    } else {
        throw std::invalid_argument("No derivative rule for function '" + f + "'.");
    }
    return outer * du;
}

Expression
substitute(const Expression &expr, const std::map<std::string, Expression> &replacements) {
    switch (expr.kind()) {
        case ExprKind::Number:
            return expr;
        case ExprKind::Symbol: {
            auto it = replacements.find(expr.name());
            return it == replacements.end() ? expr : it->second;
        }
        default:
            break;
    }

    std::vector<Expression> args;
    args.reserve(expr.args().size());
    for (const auto &a : expr.args()) { args.push_back(substitute(a, replacements)); }

    switch (expr.kind()) {
        case ExprKind::Negate:
            return -args[0];
        case ExprKind::Add:
            return args[0] + args[1];
        case ExprKind::Subtract:
            return args[0] - args[1];
        case ExprKind::Multiply:
            return args[0] * args[1];
        case ExprKind::Divide:
            return args[0] / args[1];
        case ExprKind::Power:
            return pow(args[0], args[1]);
        default:
            return Expression::call(expr.name(), std::move(args));
    }
}

double
evaluate(const Expression &expr, const std::map<std::string, double> &values) {
    const auto &a = expr.args();
    switch (expr.kind()) {
        case ExprKind::Number:
            return expr.value();
        case ExprKind::Symbol: {
            auto it = values.find(expr.name());
            if (it == values.end()) { throw UnresolvedSymbolError({ expr.name() }, "expression evaluation"); }
            return it->second;
        }
        case ExprKind::Negate:
            return -evaluate(a[0], values);
        case ExprKind::Add:
            return evaluate(a[0], values) + evaluate(a[1], values);
        case ExprKind::Subtract:
            return evaluate(a[0], values) - evaluate(a[1], values);
        case ExprKind::Multiply:
            return evaluate(a[0], values) * evaluate(a[1], values);
        case ExprKind::Divide:
            return evaluate(a[0], values) / evaluate(a[1], values);
        case ExprKind::Power:
            return std::pow(evaluate(a[0], values), evaluate(a[1], values));
        case ExprKind::Call: {
            std::vector<double> args;
            args.reserve(a.size());
            for (const auto &arg : a) { args.push_back(evaluate(arg, values)); }
            return apply_function(expr.name(), args);
        }
    }
    return 0.0;
}

} // namespace par_trafo
