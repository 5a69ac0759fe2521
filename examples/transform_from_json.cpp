#include "par_trafo.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace par_trafo;

namespace {

NamedValues
load_values(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Could not open parameter file '" + path + "'."); }
    nlohmann::ordered_json const json = nlohmann::ordered_json::parse(file);
    if (!json.is_object()) { throw std::invalid_argument("Parameter file must be a JSON object of name: number."); }

    NamedValues values;
    for (const auto &item : json.items()) {
        if (!item.value().is_number()) {
            throw std::invalid_argument("Parameter '" + item.key() + "' must be a number.");
        }
        values.set(item.key(), item.value().get<double>());
    }
    return values;
}

} // namespace

// Usage: transform_from_json <equations.json> <options.json> <parameters.json> [free1,free2,...]
int
main(int argc, char *argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <equations.json> <options.json> <parameters.json> [free,...]"
                  << std::endl;
        return 1;
    }

    try {
        EquationSet const equations = load_equation_set(argv[1]);
        TransformConfig const config = load_transform_config(argv[2]);
        NamedValues const pouter = load_values(argv[3]);

        std::optional<std::vector<std::string>> parameters;
        if (argc > 4) {
            std::vector<std::string> names;
            std::string const list = argv[4];
            std::size_t start = 0;
            while (start <= list.size()) {
                std::size_t const comma = std::min(list.find(',', start), list.size());
                if (comma > start) { names.push_back(list.substr(start, comma - start)); }
                start = comma + 1;
            }
            parameters = names;
        }

        auto trafo = make_transform(equations, parameters, config.method, config.options);
        std::cout << "[transform_from_json] " << to_string(trafo->method()) << " transformation with "
                  << equations.size() << " equation(s)" << std::endl;

        ParameterVector const pinner = (*trafo)(pouter);
        std::cout << pinner << std::endl;
    } catch (const ConstructionError &e) {
        std::cerr << "Invalid transformation: " << e.what() << std::endl;
        return 2;
    } catch (const TransformError &e) {
        std::cerr << "Evaluation failed: " << e.what() << std::endl;
        return 3;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
