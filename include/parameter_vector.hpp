#ifndef PARAMETER_VECTOR_HPP
#define PARAMETER_VECTOR_HPP

#include <Eigen/Dense>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace par_trafo {

//-----------------------------------------------------------------------------
// NamedValues
//-----------------------------------------------------------------------------
// Insertion-ordered name -> value map. Names are the key; order is only kept
// for display and for the column order of Jacobians built from it.
class NamedValues {
  public:
    NamedValues() = default;
    NamedValues(std::initializer_list<std::pair<std::string, double>> values);

    // Overwrites in place if present, appends otherwise
    void set(const std::string &name, double value);
    void erase(const std::string &name);

    [[nodiscard]] bool contains(const std::string &name) const { return index_.count(name) > 0; }
    [[nodiscard]] double at(const std::string &name) const;
    [[nodiscard]] double operator[](const std::string &name) const { return at(name); }

    [[nodiscard]] std::size_t size() const { return names_.size(); }
    [[nodiscard]] bool empty() const { return names_.empty(); }
    [[nodiscard]] const std::vector<std::string> &names() const { return names_; }
    [[nodiscard]] const std::vector<double> &values() const { return values_; }

    // Values of `other` override, new names are appended
    [[nodiscard]] NamedValues merged_with(const NamedValues &other) const;
    [[nodiscard]] NamedValues subset(const std::vector<std::string> &names) const;
    [[nodiscard]] NamedValues without(const std::vector<std::string> &names) const;

    [[nodiscard]] Eigen::VectorXd to_eigen(const std::vector<std::string> &order) const;
    [[nodiscard]] std::map<std::string, double> to_map() const;

    bool operator==(const NamedValues &other) const;

  private:
    std::vector<std::string> names_;
    std::vector<double> values_;
    std::map<std::string, std::size_t> index_;
};

std::ostream &
operator<<(std::ostream &os, const NamedValues &values);

//-----------------------------------------------------------------------------
// Jacobian
//-----------------------------------------------------------------------------
// Dense matrix with labelled rows (outputs of a step) and columns (names of the
// reference parameterization the sensitivities are taken against).
class Jacobian {
  public:
    Jacobian() = default;
    Jacobian(std::vector<std::string> rows, std::vector<std::string> cols, Eigen::MatrixXd values);

    static Jacobian identity(const std::vector<std::string> &names);
    static Jacobian zeros(const std::vector<std::string> &rows, const std::vector<std::string> &cols);

    [[nodiscard]] const std::vector<std::string> &rows() const { return rows_; }
    [[nodiscard]] const std::vector<std::string> &cols() const { return cols_; }
    [[nodiscard]] const Eigen::MatrixXd &matrix() const { return values_; }
    [[nodiscard]] Eigen::MatrixXd &matrix() { return values_; }

    // -1 if absent
    [[nodiscard]] long row_index(const std::string &name) const;
    [[nodiscard]] long col_index(const std::string &name) const;
    [[nodiscard]] bool has_row(const std::string &name) const { return row_index(name) >= 0; }
    [[nodiscard]] bool has_col(const std::string &name) const { return col_index(name) >= 0; }

    /**
     * @brief Entry by labels.
     * @throws std::out_of_range if either label is absent.
     */
    [[nodiscard]] double at(const std::string &row, const std::string &col) const;
    void set(const std::string &row, const std::string &col, double value);

    // Rows in the requested order; throws std::out_of_range on an absent row
    [[nodiscard]] Jacobian select_rows(const std::vector<std::string> &names) const;
    // Columns in the requested order; throws std::out_of_range on an absent column
    [[nodiscard]] Jacobian select_cols(const std::vector<std::string> &names) const;
    // Removes the listed columns if present, keeping the order of the rest
    [[nodiscard]] Jacobian drop_cols(const std::vector<std::string> &names) const;

    /**
     * @brief Stacks the rows of `other` below these rows.
     *
     * Columns are aligned by label; the result has the union of both column
     * sets (this one's first) with zeros where a side has no entry.
     */
    [[nodiscard]] Jacobian append_rows(const Jacobian &other) const;

  private:
    std::vector<std::string> rows_;
    std::vector<std::string> cols_;
    Eigen::MatrixXd values_;
};

/**
 * @brief Chain rule: local * upstream restricted to the rows named by local's columns.
 *
 * The result has local's rows and upstream's columns.
 * @throws std::out_of_range if upstream has no row for one of local's columns.
 */
Jacobian
chain(const Jacobian &local, const Jacobian &upstream);

std::ostream &
operator<<(std::ostream &os, const Jacobian &jacobian);

//-----------------------------------------------------------------------------
// ParameterVector
//-----------------------------------------------------------------------------
// Values plus the optional Jacobian with respect to some upstream reference.
// No Jacobian means no known upstream sensitivity.
struct ParameterVector {
    NamedValues values;
    std::optional<Jacobian> jacobian;

    ParameterVector() = default;
    ParameterVector(NamedValues v)
      : values(std::move(v)) {}
    ParameterVector(NamedValues v, std::optional<Jacobian> j)
      : values(std::move(v))
      , jacobian(std::move(j)) {}
    ParameterVector(std::initializer_list<std::pair<std::string, double>> v)
      : values(v) {}

    [[nodiscard]] bool has_jacobian() const { return jacobian.has_value(); }
    [[nodiscard]] double operator[](const std::string &name) const { return values.at(name); }
    [[nodiscard]] std::size_t size() const { return values.size(); }
    [[nodiscard]] const std::vector<std::string> &names() const { return values.names(); }
};

/**
 * @brief Appends the entries of `b` that `a` does not have.
 *
 * If both carry Jacobians the rows of b's Jacobian are appended. If only one
 * does, the result carries none, since the other side's sensitivity is unknown.
 */
ParameterVector
concatenate(const ParameterVector &a, const ParameterVector &b);

std::ostream &
operator<<(std::ostream &os, const ParameterVector &parameters);

} // namespace par_trafo

#endif // PARAMETER_VECTOR_HPP
