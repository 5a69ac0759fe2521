#include "parameter_vector.hpp"

#include <iomanip>   // For std::setw when printing
#include <set>
#include <stdexcept> // For std::out_of_range

namespace par_trafo {

//-----------------------------------------------------------------------------
// NamedValues
//-----------------------------------------------------------------------------

NamedValues::NamedValues(std::initializer_list<std::pair<std::string, double>> values) {
    for (const auto &p : values) { set(p.first, p.second); }
}

void
NamedValues::set(const std::string &name, double value) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        values_[it->second] = value;
        return;
    }
    index_[name] = names_.size();
    names_.push_back(name);
    values_.push_back(value);
}

void
NamedValues::erase(const std::string &name) {
    auto it = index_.find(name);
    if (it == index_.end()) { return; }
    std::size_t const pos = it->second;
    names_.erase(names_.begin() + static_cast<std::ptrdiff_t>(pos));
    values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(pos));
    index_.erase(it);
    for (auto &entry : index_) {
        if (entry.second > pos) { --entry.second; }
    }
}

double
NamedValues::at(const std::string &name) const {
    auto it = index_.find(name);
    if (it == index_.end()) { throw std::out_of_range("No value for parameter '" + name + "'."); }
    return values_[it->second];
}

NamedValues
NamedValues::merged_with(const NamedValues &other) const {
    NamedValues out = *this;
    for (std::size_t i = 0; i < other.size(); ++i) { out.set(other.names_[i], other.values_[i]); }
    return out;
}

NamedValues
NamedValues::subset(const std::vector<std::string> &names) const {
    NamedValues out;
    for (const auto &n : names) { out.set(n, at(n)); }
    return out;
}

NamedValues
NamedValues::without(const std::vector<std::string> &names) const {
    std::set<std::string> const drop(names.begin(), names.end());
    NamedValues out;
    for (std::size_t i = 0; i < size(); ++i) {
        if (drop.count(names_[i]) == 0) { out.set(names_[i], values_[i]); }
    }
    return out;
}

Eigen::VectorXd
NamedValues::to_eigen(const std::vector<std::string> &order) const {
    Eigen::VectorXd v(static_cast<Eigen::Index>(order.size()));
    for (std::size_t i = 0; i < order.size(); ++i) { v(static_cast<Eigen::Index>(i)) = at(order[i]); }
    return v;
}

std::map<std::string, double>
NamedValues::to_map() const {
    std::map<std::string, double> out;
    for (std::size_t i = 0; i < size(); ++i) { out[names_[i]] = values_[i]; }
    return out;
}

bool
NamedValues::operator==(const NamedValues &other) const {
    return names_ == other.names_ && values_ == other.values_;
}

std::ostream &
operator<<(std::ostream &os, const NamedValues &values) {
    os << "{";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) { os << ", "; }
        os << values.names()[i] << ": " << values.values()[i];
    }
    os << "}";
    return os;
}

//-----------------------------------------------------------------------------
// Jacobian
//-----------------------------------------------------------------------------

Jacobian::Jacobian(std::vector<std::string> rows, std::vector<std::string> cols, Eigen::MatrixXd values)
  : rows_(std::move(rows))
  , cols_(std::move(cols))
  , values_(std::move(values)) {
    if (values_.rows() != static_cast<Eigen::Index>(rows_.size()) ||
        values_.cols() != static_cast<Eigen::Index>(cols_.size())) {
        throw std::invalid_argument("Jacobian labels (" + std::to_string(rows_.size()) + " x " +
                                    std::to_string(cols_.size()) + ") do not match matrix dimensions (" +
                                    std::to_string(values_.rows()) + " x " + std::to_string(values_.cols()) + ").");
    }
}

Jacobian
Jacobian::identity(const std::vector<std::string> &names) {
    auto const n = static_cast<Eigen::Index>(names.size());
    return Jacobian(names, names, Eigen::MatrixXd::Identity(n, n));
}

Jacobian
Jacobian::zeros(const std::vector<std::string> &rows, const std::vector<std::string> &cols) {
    return Jacobian(rows,
                    cols,
                    Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(cols.size())));
}

long
Jacobian::row_index(const std::string &name) const {
    for (std::size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i] == name) { return static_cast<long>(i); }
    }
    return -1;
}

long
Jacobian::col_index(const std::string &name) const {
    for (std::size_t j = 0; j < cols_.size(); ++j) {
        if (cols_[j] == name) { return static_cast<long>(j); }
    }
    return -1;
}

double
Jacobian::at(const std::string &row, const std::string &col) const {
    long const i = row_index(row);
    long const j = col_index(col);
    if (i < 0) { throw std::out_of_range("Jacobian has no row '" + row + "'."); }
    if (j < 0) { throw std::out_of_range("Jacobian has no column '" + col + "'."); }
    return values_(i, j);
}

void
Jacobian::set(const std::string &row, const std::string &col, double value) {
    long const i = row_index(row);
    long const j = col_index(col);
    if (i < 0) { throw std::out_of_range("Jacobian has no row '" + row + "'."); }
    if (j < 0) { throw std::out_of_range("Jacobian has no column '" + col + "'."); }
    values_(i, j) = value;
}

Jacobian
Jacobian::select_rows(const std::vector<std::string> &names) const {
    Eigen::MatrixXd out(static_cast<Eigen::Index>(names.size()), values_.cols());
    for (std::size_t k = 0; k < names.size(); ++k) {
        long const i = row_index(names[k]);
        if (i < 0) { throw std::out_of_range("Jacobian has no row '" + names[k] + "'."); }
        out.row(static_cast<Eigen::Index>(k)) = values_.row(i);
    }
    return Jacobian(names, cols_, std::move(out));
}

Jacobian
Jacobian::select_cols(const std::vector<std::string> &names) const {
    Eigen::MatrixXd out(values_.rows(), static_cast<Eigen::Index>(names.size()));
    for (std::size_t k = 0; k < names.size(); ++k) {
        long const j = col_index(names[k]);
        if (j < 0) { throw std::out_of_range("Jacobian has no column '" + names[k] + "'."); }
        out.col(static_cast<Eigen::Index>(k)) = values_.col(j);
    }
    return Jacobian(rows_, names, std::move(out));
}

Jacobian
Jacobian::drop_cols(const std::vector<std::string> &names) const {
    std::set<std::string> const drop(names.begin(), names.end());
    std::vector<std::string> keep;
    for (const auto &c : cols_) {
        if (drop.count(c) == 0) { keep.push_back(c); }
    }
    return select_cols(keep);
}

Jacobian
Jacobian::append_rows(const Jacobian &other) const {
    std::vector<std::string> cols = cols_;
    for (const auto &c : other.cols_) {
        if (col_index(c) < 0) { cols.push_back(c); }
    }
    std::vector<std::string> rows = rows_;
    rows.insert(rows.end(), other.rows_.begin(), other.rows_.end());

    Jacobian out = zeros(rows, cols);
    out.values_.topLeftCorner(values_.rows(), values_.cols()) = values_;
    for (std::size_t j = 0; j < other.cols_.size(); ++j) {
        long const target = out.col_index(other.cols_[j]);
        out.values_.block(values_.rows(), target, other.values_.rows(), 1) =
          other.values_.col(static_cast<Eigen::Index>(j));
    }
    return out;
}

Jacobian
chain(const Jacobian &local, const Jacobian &upstream) {
    Jacobian const restricted = upstream.select_rows(local.cols());
    return Jacobian(local.rows(), upstream.cols(), local.matrix() * restricted.matrix());
}

std::ostream &
operator<<(std::ostream &os, const Jacobian &jacobian) {
    os << std::setw(12) << " ";
    for (const auto &c : jacobian.cols()) { os << std::setw(12) << c; }
    os << "\n";
    for (std::size_t i = 0; i < jacobian.rows().size(); ++i) {
        os << std::setw(12) << jacobian.rows()[i];
        for (Eigen::Index j = 0; j < jacobian.matrix().cols(); ++j) {
            os << std::setw(12) << jacobian.matrix()(static_cast<Eigen::Index>(i), j);
        }
        os << "\n";
    }
    return os;
}

//-----------------------------------------------------------------------------
// ParameterVector
//-----------------------------------------------------------------------------

ParameterVector
concatenate(const ParameterVector &a, const ParameterVector &b) {
    ParameterVector out = a;
    std::vector<std::string> added;
    for (std::size_t i = 0; i < b.values.size(); ++i) {
        const std::string &name = b.values.names()[i];
        if (!a.values.contains(name)) {
            out.values.set(name, b.values.values()[i]);
            added.push_back(name);
        }
    }
    if (a.has_jacobian() && b.has_jacobian()) {
        out.jacobian = a.jacobian->append_rows(b.jacobian->select_rows(added));
    } else {
        out.jacobian.reset();
    }
    return out;
}

std::ostream &
operator<<(std::ostream &os, const ParameterVector &parameters) {
    os << parameters.values;
    if (parameters.has_jacobian()) { os << "\nJacobian:\n" << *parameters.jacobian; }
    return os;
}

} // namespace par_trafo
