#ifndef PAR_TRAFO_HPP
#define PAR_TRAFO_HPP

// Include all library headers here
#include "ceres_root_finder.hpp"
#include "compiled_evaluator.hpp"
#include "equation_set.hpp"
#include "explicit_transform.hpp"
#include "expression.hpp"
#include "implicit_transform.hpp"
#include "newton_root_finder.hpp"
#include "parameter_transform.hpp"
#include "parameter_vector.hpp"
#include "root_finder.hpp"
#include "transform_errors.hpp"
#include "transform_options.hpp"

// This is the main header file for the par_trafo library
// Include this single header to access all functionality

#endif // PAR_TRAFO_HPP
