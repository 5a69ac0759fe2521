#include "compiled_evaluator.hpp"
#include "transform_errors.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace par_trafo;

class CompiledEvaluatorTest : public ::testing::Test {
  protected:
    EquationSet equations{ { "f", "a*exp(-b*x) + c" }, { "g", "x^2/(1 + a)" }, { "h", "-sqrt(x) + pow(a, 2)" } };
    std::vector<std::string> parameters{ "x", "a", "b", "c" };
};

TEST_F(CompiledEvaluatorTest, TapeAndTreeAgree) {
    EvaluatorOptions tree_options;
    EvaluatorOptions tape_options;
    tape_options.compile = true;
    CompiledEvaluator const tree(equations, parameters, tree_options);
    CompiledEvaluator const tape(equations, parameters, tape_options);
    EXPECT_FALSE(tree.is_compiled());
    EXPECT_TRUE(tape.is_compiled());

    NamedValues const input{ { "c", 0.5 }, { "b", 2.0 }, { "a", 3.0 }, { "x", 1.5 } };
    Eigen::MatrixXd const r_tree = tree.evaluate(input);
    Eigen::MatrixXd const r_tape = tape.evaluate(input);
    ASSERT_EQ(r_tree.rows(), 1);
    ASSERT_EQ(r_tree.cols(), 3);
    EXPECT_NEAR(r_tree(0, 0), 3.0 * std::exp(-3.0) + 0.5, 1e-14);
    EXPECT_NEAR(r_tree(0, 1), 2.25 / 4.0, 1e-14);
    EXPECT_NEAR(r_tree(0, 2), -std::sqrt(1.5) + 9.0, 1e-14);
    for (Eigen::Index j = 0; j < 3; ++j) { EXPECT_DOUBLE_EQ(r_tree(0, j), r_tape(0, j)); }
}

TEST_F(CompiledEvaluatorTest, SelectsInputsByName) {
    CompiledEvaluator const eval(equations, parameters);
    NamedValues const ordered{ { "x", 1.0 }, { "a", 1.0 }, { "b", 0.0 }, { "c", 0.0 } };
    NamedValues shuffled{ { "c", 0.0 }, { "b", 0.0 }, { "a", 1.0 }, { "x", 1.0 } };
    shuffled.set("unused", 42.0);
    EXPECT_TRUE(eval.evaluate_vector(ordered).isApprox(eval.evaluate_vector(shuffled)));
}

TEST_F(CompiledEvaluatorTest, EvaluateRows) {
    EvaluatorOptions options;
    options.compile = true;
    CompiledEvaluator const eval(equations, parameters, options);
    Eigen::MatrixXd inputs(2, 4);
    inputs << 1.0, 1.0, 0.0, 0.0, 4.0, 0.0, 1.0, 1.0;
    Eigen::MatrixXd const out = eval.evaluate_rows(inputs);
    ASSERT_EQ(out.rows(), 2);
    EXPECT_NEAR(out(0, 0), 1.0, 1e-14);
    EXPECT_NEAR(out(1, 1), 16.0, 1e-14);
    EXPECT_NEAR(out(1, 2), -2.0, 1e-14);
    EXPECT_THROW((void)eval.evaluate_rows(Eigen::MatrixXd::Zero(1, 3)), std::invalid_argument);
}

TEST_F(CompiledEvaluatorTest, Errors) {
    EXPECT_THROW(CompiledEvaluator const bad(equations, { "x", "a" }), UnresolvedSymbolError);

    CompiledEvaluator const eval(equations, parameters);
    EXPECT_THROW((void)eval.evaluate(NamedValues{ { "x", 1.0 } }), std::invalid_argument);
}

TEST_F(CompiledEvaluatorTest, DuplicateParametersAreIgnored) {
    CompiledEvaluator const eval(equations, { "x", "a", "x", "b", "c", "a" });
    EXPECT_EQ(eval.parameters().size(), 4u);
    std::vector<std::string> const outputs = { "f", "g", "h" };
    EXPECT_EQ(eval.outputs(), outputs);
}
