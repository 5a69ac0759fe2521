#include "equation_set.hpp"
#include "transform_errors.hpp"

#include <fstream>   // For std::ifstream
#include <set>       // For symbol de-duplication
#include <stdexcept> // For std::out_of_range

namespace par_trafo {

EquationSet::EquationSet(std::initializer_list<std::pair<std::string, std::string>> equations) {
    for (const auto &eq : equations) { add(eq.first, eq.second); }
}

EquationSet::EquationSet(const std::vector<std::pair<std::string, std::string>> &equations) {
    for (const auto &eq : equations) { add(eq.first, eq.second); }
}

void
EquationSet::add(const std::string &name, const Expression &rhs) {
    if (name.empty()) { throw ConstructionError("Equation name must not be empty."); }
    if (contains(name)) { throw DuplicateEquationError(name); }
    index_[name] = equations_.size();
    equations_.push_back({ name, rhs });
}

void
EquationSet::add(const std::string &name, const std::string &rhs) {
    add(name, parse_expression(rhs));
}

void
EquationSet::replace(const std::string &name, const Expression &rhs) {
    auto it = index_.find(name);
    if (it == index_.end()) { throw std::out_of_range("Equation '" + name + "' not found."); }
    equations_[it->second].rhs = rhs;
}

void
EquationSet::replace(const std::string &name, const std::string &rhs) {
    replace(name, parse_expression(rhs));
}

const Expression &
EquationSet::at(const std::string &name) const {
    auto it = index_.find(name);
    if (it == index_.end()) { throw std::out_of_range("Equation '" + name + "' not found."); }
    return equations_[it->second].rhs;
}

std::vector<std::string>
EquationSet::names() const {
    std::vector<std::string> out;
    out.reserve(equations_.size());
    for (const auto &eq : equations_) { out.push_back(eq.name); }
    return out;
}

std::vector<std::string>
EquationSet::symbols(const std::vector<std::string> &exclude) const {
    std::set<std::string> seen(exclude.begin(), exclude.end());
    std::vector<std::string> out;
    for (const auto &eq : equations_) {
        for (const auto &s : par_trafo::symbols(eq.rhs)) {
            if (seen.insert(s).second) { out.push_back(s); }
        }
    }
    return out;
}

EquationSet
EquationSet::subset(const std::vector<std::string> &names) const {
    EquationSet out;
    for (const auto &n : names) { out.add(n, at(n)); }
    return out;
}

std::string
derivative_name(const std::string &output, const std::string &variable) {
    return "d(" + output + ")/d(" + variable + ")";
}

EquationSet
EquationSet::jacobian(const std::vector<std::string> &variables) const {
    EquationSet out;
    for (const auto &var : variables) {
        for (const auto &eq : equations_) { out.add(derivative_name(eq.name, var), differentiate(eq.rhs, var)); }
    }
    return out;
}

nlohmann::ordered_json
EquationSet::to_json() const {
    nlohmann::ordered_json json = nlohmann::ordered_json::object();
    for (const auto &eq : equations_) { json[eq.name] = to_string(eq.rhs); }
    return json;
}

bool
EquationSet::operator==(const EquationSet &other) const {
    if (size() != other.size()) { return false; }
    for (std::size_t i = 0; i < size(); ++i) {
        if (equations_[i].name != other.equations_[i].name || equations_[i].rhs != other.equations_[i].rhs) {
            return false;
        }
    }
    return true;
}

std::ostream &
operator<<(std::ostream &os, const EquationSet &equations) {
    for (const auto &eq : equations) { os << eq.name << " = " << eq.rhs << "\n"; }
    return os;
}

EquationSet
equation_set_from_json(const nlohmann::ordered_json &json) {
    if (!json.is_object()) { throw std::invalid_argument("Equation set must be a JSON object of name: expression."); }
    EquationSet out;
    for (const auto &item : json.items()) {
        if (!item.value().is_string()) {
            throw std::invalid_argument("Equation '" + item.key() + "' must be given as a string.");
        }
        out.add(item.key(), item.value().get<std::string>());
    }
    return out;
}

EquationSet
load_equation_set(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Could not open equation file '" + path + "'."); }
    nlohmann::ordered_json json;
    try {
        json = nlohmann::ordered_json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::invalid_argument("Failed to parse equation file '" + path + "': " + e.what());
    }
    return equation_set_from_json(json);
}

} // namespace par_trafo
