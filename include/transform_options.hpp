#ifndef TRANSFORM_OPTIONS_HPP
#define TRANSFORM_OPTIONS_HPP

#include "root_finder.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace par_trafo {

enum class TransformMethod { Explicit, Implicit };

std::string
to_string(TransformMethod method);

/**
 * @brief Parses "explicit" or "implicit".
 * @throws std::invalid_argument for other names.
 */
TransformMethod
transform_method_from_string(const std::string &name);

/**
 * @brief Builder configuration shared by the explicit and implicit builders.
 *
 * Options that do not apply to a method are ignored by its builder.
 */
struct TransformOptions {
    // Explicit: pass incoming parameters not produced by the equations through
    bool attach_input = false;
    // Implicit: seed the next solve with the last accepted root
    bool keep_root = true;
    // Implicit: re-solve and clamp when a negative root is found
    bool positive = true;
    // Evaluators flatten the equations into instruction tapes
    bool compile = false;
    std::string model_name;
    std::string condition;
    bool verbose = false;

    RootFinderKind root_finder = RootFinderKind::Newton;
    RootFinderOptions root_options;
};

struct TransformConfig {
    TransformMethod method = TransformMethod::Explicit;
    TransformOptions options;
};

/**
 * @brief Reads builder configuration from a JSON object.
 *
 * Recognized keys: method, attach_input, keep_root, positive, compile,
 * model_name, condition, verbose, root_finder, max_iterations, atol, rtol, ctol.
 *
 * @throws std::invalid_argument on unknown keys or values of the wrong type.
 */
TransformConfig
transform_config_from_json(const nlohmann::ordered_json &json);

TransformConfig
load_transform_config(const std::string &path);

// Replaces every character that is not alphanumeric by '_'
std::string
sanitize_condition(const std::string &condition);

// model_name, suffixed by the sanitized condition when both are given
std::string
qualified_model_name(const TransformOptions &options);

// Name for a derived artifact, e.g. "<model>_deriv"; empty if there is no model name
std::string
artifact_name(const TransformOptions &options, const std::string &suffix);

} // namespace par_trafo

#endif // TRANSFORM_OPTIONS_HPP
