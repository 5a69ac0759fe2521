#include "transform_options.hpp"

#include <algorithm> // For std::transform
#include <cctype>    // For std::tolower
#include <fstream>   // For std::ifstream
#include <stdexcept>

namespace par_trafo {

std::string
to_string(TransformMethod method) {
    return method == TransformMethod::Explicit ? "explicit" : "implicit";
}

TransformMethod
transform_method_from_string(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "explicit") { return TransformMethod::Explicit; }
    if (lower == "implicit") { return TransformMethod::Implicit; }
    throw std::invalid_argument("Unknown transformation method '" + name +
                                "' (expected \"explicit\" or \"implicit\").");
}

namespace {

template<typename T>
T
read_value(const nlohmann::ordered_json &value, const std::string &key) {
    try {
        return value.get<T>();
    } catch (const nlohmann::json::type_error &e) {
        throw std::invalid_argument("Option '" + key + "' has the wrong type: " + e.what());
    }
}

bool
read_bool(const nlohmann::ordered_json &value, const std::string &key) {
    if (!value.is_boolean()) { throw std::invalid_argument("Option '" + key + "' must be a boolean."); }
    return value.get<bool>();
}

} // namespace

TransformConfig
transform_config_from_json(const nlohmann::ordered_json &json) {
    if (!json.is_object()) { throw std::invalid_argument("Transformation options must be a JSON object."); }

    TransformConfig config;
    TransformOptions &opt = config.options;
    for (const auto &item : json.items()) {
        const std::string &key = item.key();
        const auto &value = item.value();
        if (key == "method") {
            config.method = transform_method_from_string(read_value<std::string>(value, key));
        } else if (key == "attach_input") {
            opt.attach_input = read_bool(value, key);
        } else if (key == "keep_root") {
            opt.keep_root = read_bool(value, key);
        } else if (key == "positive") {
            opt.positive = read_bool(value, key);
        } else if (key == "compile") {
            opt.compile = read_bool(value, key);
        } else if (key == "verbose") {
            opt.verbose = read_bool(value, key);
        } else if (key == "model_name") {
            opt.model_name = read_value<std::string>(value, key);
        } else if (key == "condition") {
            opt.condition = read_value<std::string>(value, key);
        } else if (key == "root_finder") {
            opt.root_finder = root_finder_kind_from_string(read_value<std::string>(value, key));
        } else if (key == "max_iterations") {
            opt.root_options.max_iterations = read_value<int>(value, key);
        } else if (key == "atol") {
            opt.root_options.atol = read_value<double>(value, key);
        } else if (key == "rtol") {
            opt.root_options.rtol = read_value<double>(value, key);
        } else if (key == "ctol") {
            opt.root_options.ctol = read_value<double>(value, key);
        } else {
            throw std::invalid_argument("Unknown transformation option '" + key + "'.");
        }
    }
    if (opt.root_options.max_iterations < 1) { throw std::invalid_argument("max_iterations must be positive."); }
    return config;
}

TransformConfig
load_transform_config(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) { throw std::runtime_error("Could not open options file '" + path + "'."); }
    nlohmann::ordered_json json;
    try {
        json = nlohmann::ordered_json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::invalid_argument("Failed to parse options file '" + path + "': " + e.what());
    }
    return transform_config_from_json(json);
}

std::string
sanitize_condition(const std::string &condition) {
    std::string out = condition;
    for (auto &c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c))) { c = '_'; }
    }
    return out;
}

std::string
qualified_model_name(const TransformOptions &options) {
    if (options.model_name.empty() || options.condition.empty()) { return options.model_name; }
    return options.model_name + "_" + sanitize_condition(options.condition);
}

std::string
artifact_name(const TransformOptions &options, const std::string &suffix) {
    std::string const base = qualified_model_name(options);
    if (base.empty()) { return base; }
    return base + "_" + suffix;
}

} // namespace par_trafo
