#ifndef EQUATION_SET_HPP
#define EQUATION_SET_HPP

#include "expression.hpp"

#include <initializer_list>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace par_trafo {

/**
 * @brief Ordered set of named equations, output name -> expression.
 *
 * Used both for explicit transformations (inner parameter = expression in the
 * outer parameters) and for implicit ones (each equation is a residual that
 * vanishes at the solution). Names are unique; insertion order is kept.
 */
class EquationSet {
  public:
    struct Equation {
        std::string name;
        Expression rhs;
    };

    EquationSet() = default;

    // {"A", "-k1*A + k2*B"}, ... ; expressions are parsed
    EquationSet(std::initializer_list<std::pair<std::string, std::string>> equations);
    explicit EquationSet(const std::vector<std::pair<std::string, std::string>> &equations);

    /**
     * @brief Appends an equation.
     * @throws DuplicateEquationError if `name` is already defined.
     */
    void add(const std::string &name, const Expression &rhs);
    void add(const std::string &name, const std::string &rhs);

    /**
     * @brief Replaces the right-hand side of an existing equation, keeping its position.
     * @throws std::out_of_range if `name` is not defined.
     */
    void replace(const std::string &name, const Expression &rhs);
    void replace(const std::string &name, const std::string &rhs);

    [[nodiscard]] bool contains(const std::string &name) const { return index_.count(name) > 0; }
    [[nodiscard]] const Expression &at(const std::string &name) const;
    [[nodiscard]] std::size_t size() const { return equations_.size(); }
    [[nodiscard]] bool empty() const { return equations_.empty(); }
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::vector<Equation>::const_iterator begin() const { return equations_.begin(); }
    [[nodiscard]] std::vector<Equation>::const_iterator end() const { return equations_.end(); }
    [[nodiscard]] const Equation &operator[](std::size_t i) const { return equations_[i]; }

    // Symbols referenced on the right-hand sides, first appearance first
    [[nodiscard]] std::vector<std::string> symbols(const std::vector<std::string> &exclude = {}) const;

    // Equations listed in `names`, in that order
    [[nodiscard]] EquationSet subset(const std::vector<std::string> &names) const;

    /**
     * @brief Symbolic Jacobian with respect to `variables`.
     *
     * Variable-major: all outputs for variables[0], then variables[1], ...
     * Each entry is named by derivative_name(output, variable) and may be the literal 0.
     */
    [[nodiscard]] EquationSet jacobian(const std::vector<std::string> &variables) const;

    [[nodiscard]] nlohmann::ordered_json to_json() const;

    bool operator==(const EquationSet &other) const;

  private:
    std::vector<Equation> equations_;
    std::map<std::string, std::size_t> index_;
};

std::ostream &
operator<<(std::ostream &os, const EquationSet &equations);

// Name of the Jacobian entry d(output)/d(variable)
std::string
derivative_name(const std::string &output, const std::string &variable);

/**
 * @brief Reads the wire form {"name": "expression", ...}.
 * @throws std::invalid_argument if the document is not an object of strings.
 */
EquationSet
equation_set_from_json(const nlohmann::ordered_json &json);

EquationSet
load_equation_set(const std::string &path);

} // namespace par_trafo

#endif // EQUATION_SET_HPP
