#include "explicit_transform.hpp"
#include "implicit_transform.hpp"
#include "newton_root_finder.hpp"
#include "test_utils.hpp"
#include "transform_errors.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace par_trafo;

namespace {

// Forwards to Newton and remembers every start point
class RecordingRootFinder : public RootFinder {
  public:
    RootResult solve(const ResidualSystem &system, const Eigen::VectorXd &start, const RootFinderOptions &options) override {
        starts.push_back(start);
        return newton_.solve(system, start, options);
    }

    [[nodiscard]] std::string name() const override { return "RecordingRootFinder"; }

    std::vector<Eigen::VectorXd> starts;

  private:
    NewtonRootFinder newton_;
};

} // namespace

// Reversible reaction A <-> B. The steady-state equation of B is replaced by
// the conservation law A + B = total, which makes the root unique.
class SteadyStateTest : public ::testing::Test {
  protected:
    void SetUp() override {
        equations = EquationSet{ { "A", "-k1*A + k2*B" }, { "B", "k1*A - k2*B" } };
        equations.replace("B", "A + B - total");
        options.keep_root = false;
    }

    EquationSet equations;
    TransformOptions options;
    NamedValues start{ { "k1", 1.0 }, { "k2", 0.1 }, { "A", 10.0 }, { "B", 1.0 }, { "total", 11.0 } };
};

TEST_F(SteadyStateTest, Classification) {
    ImplicitTransform const trafo(equations, {}, options);
    std::vector<std::string> const states = { "A", "B" };
    std::vector<std::string> const nonstates = { "k1", "k2", "total" };
    EXPECT_EQ(trafo.states(), states);
    EXPECT_EQ(trafo.dependent(), states);
    EXPECT_EQ(trafo.nonstates(), nonstates);
    EXPECT_EQ(trafo.method(), TransformMethod::Implicit);
}

TEST_F(SteadyStateTest, RootAndSensitivities) {
    ImplicitTransform trafo(equations, {}, options);
    ParameterVector const out = trafo(start);

    EXPECT_NEAR(out["A"], 1.0, 1e-8);
    EXPECT_NEAR(out["B"], 10.0, 1e-8);
    EXPECT_DOUBLE_EQ(out["k1"], 1.0);
    EXPECT_DOUBLE_EQ(out["total"], 11.0);
    std::vector<std::string> const names = { "A", "B", "k1", "k2", "total" };
    EXPECT_EQ(out.values.names(), names);

    // A = k2 total / (k1 + k2), B = k1 total / (k1 + k2)
    double const k1 = 1.0;
    double const k2 = 0.1;
    double const total = 11.0;
    double const s = k1 + k2;
    const Jacobian &jac = *out.jacobian;
    EXPECT_NEAR(jac.at("A", "k1"), -k2 * total / (s * s), 1e-8);
    EXPECT_NEAR(jac.at("A", "k2"), k1 * total / (s * s), 1e-8);
    EXPECT_NEAR(jac.at("A", "total"), k2 / s, 1e-8);
    EXPECT_NEAR(jac.at("B", "k1"), k2 * total / (s * s), 1e-8);
    EXPECT_NEAR(jac.at("B", "k2"), -k1 * total / (s * s), 1e-8);
    EXPECT_NEAR(jac.at("B", "total"), k1 / s, 1e-8);

    // The root does not depend on its initial guess
    EXPECT_DOUBLE_EQ(jac.at("A", "A"), 0.0);
    EXPECT_DOUBLE_EQ(jac.at("B", "B"), 0.0);
    // Everything else passes through
    EXPECT_DOUBLE_EQ(jac.at("k2", "k2"), 1.0);
    EXPECT_DOUBLE_EQ(jac.at("k2", "k1"), 0.0);
    EXPECT_DOUBLE_EQ(jac.at("total", "total"), 1.0);
}

TEST_F(SteadyStateTest, SensitivitiesMatchLinearSolve) {
    ImplicitTransform trafo(equations, {}, options);
    ParameterVector const out = trafo(start);
    double const A = out["A"];
    double const B = out["B"];

    // dF/dx and dF/dp at the root, p = (k1, k2, total)
    Eigen::Matrix2d dfdx;
    dfdx << -1.0, 0.1, 1.0, 1.0;
    Eigen::Matrix<double, 2, 3> dfdp;
    dfdp << -A, B, 0.0, 0.0, 0.0, -1.0;
    Eigen::Matrix<double, 2, 3> const expected = dfdx.colPivHouseholderQr().solve(-dfdp);

    Eigen::MatrixXd const actual = out.jacobian->select_rows({ "A", "B" }).select_cols({ "k1", "k2", "total" }).matrix();
    EXPECT_TRUE(actual.isApprox(expected, 1e-10)) << actual << "\nvs\n" << expected;
}

TEST_F(SteadyStateTest, SensitivitiesMatchFiniteDifferences) {
    ImplicitTransform trafo(equations, {}, options);
    ParameterVector const out = trafo(start);
    EXPECT_JACOBIAN_NEAR(*out.jacobian, finite_difference_jacobian(trafo, start), 1e-6);
}

TEST_F(SteadyStateTest, ConservedAmountAsConstant) {
    // Rates declared free, total amount written into the equation
    EquationSet rates{ { "A", "-k1*A + k2*B" }, { "B", "k1*A - k2*B" } };
    EquationSet conserved = rates;
    conserved.replace("B", "A + B - 11");
    ImplicitTransform trafo(conserved, { "k1", "k2" }, options);
    std::vector<std::string> const dependent = { "A", "B" };
    EXPECT_EQ(trafo.dependent(), dependent);

    ParameterVector const out = trafo(NamedValues{ { "k1", 1.0 }, { "k2", 0.1 }, { "A", 10.0 }, { "B", 1.0 } });

    // Both original rate equations vanish at the root
    for (const auto &eq : rates) { EXPECT_NEAR(evaluate(eq.rhs, out.values.to_map()), 0.0, 1e-8) << eq.name; }

    // Direct solve of -k1 A + k2 B = 0, A + B = 11
    Eigen::Matrix2d m;
    m << -1.0, 0.1, 1.0, 1.0;
    Eigen::Vector2d const direct = m.colPivHouseholderQr().solve(Eigen::Vector2d(0.0, 11.0));
    EXPECT_NEAR(out["A"], direct(0), 1e-8);
    EXPECT_NEAR(out["B"], direct(1), 1e-8);
    EXPECT_NEAR(out.jacobian->at("A", "k2"), 11.0 / 1.21, 1e-8);
}

TEST_F(SteadyStateTest, FreeStateIsNotSolvedFor) {
    // A given, B from the equation of B
    ImplicitTransform trafo(EquationSet{ { "A", "-k1*A + k2*B" }, { "B", "k1*A - k2*B" } }, { "A" }, options);
    std::vector<std::string> const dependent = { "B" };
    EXPECT_EQ(trafo.dependent(), dependent);

    ParameterVector const out = trafo(NamedValues{ { "k1", 1.0 }, { "k2", 0.5 }, { "A", 2.0 }, { "B", 1.0 } });
    EXPECT_NEAR(out["B"], 4.0, 1e-8);
    EXPECT_DOUBLE_EQ(out["A"], 2.0);
    // B = k1 A / k2
    EXPECT_NEAR(out.jacobian->at("B", "A"), 2.0, 1e-8);
    EXPECT_NEAR(out.jacobian->at("B", "k1"), 4.0, 1e-8);
    EXPECT_NEAR(out.jacobian->at("B", "k2"), -8.0, 1e-8);
    EXPECT_DOUBLE_EQ(out.jacobian->at("A", "A"), 1.0);
}

TEST_F(SteadyStateTest, FixedParametersHaveNoColumn) {
    ImplicitTransform trafo(equations, {}, options);
    ParameterVector const out = trafo(start, { { "total", 22.0 } });

    EXPECT_NEAR(out["A"], 2.0, 1e-8);
    EXPECT_NEAR(out["B"], 20.0, 1e-8);
    EXPECT_FALSE(out.jacobian->has_col("total"));
    EXPECT_TRUE(out.jacobian->has_row("total"));
    std::vector<std::string> const cols = { "k1", "k2", "A", "B" };
    EXPECT_EQ(out.jacobian->cols(), cols);
    // A fixed parameter does not pass through with a unit sensitivity
    EXPECT_DOUBLE_EQ(out.jacobian->matrix().row(out.jacobian->row_index("total")).sum(), 0.0);
}

TEST_F(SteadyStateTest, ChainsUpstreamJacobian) {
    auto log_trafo = build_explicit(EquationSet{ { "k1", "exp(logk1)" },
                                                 { "k2", "exp(logk2)" },
                                                 { "A", "exp(logA)" },
                                                 { "B", "exp(logB)" },
                                                 { "total", "exp(logtotal)" } });
    auto steady = std::make_shared<ImplicitTransform>(equations, std::vector<std::string>{}, options);
    auto composed = compose(steady, log_trafo);

    NamedValues const point{
        { "logk1", 0.0 }, { "logk2", std::log(0.1) }, { "logA", std::log(10.0) }, { "logB", 0.0 }, { "logtotal", std::log(11.0) }
    };
    ParameterVector const out = (*composed)(point);
    EXPECT_NEAR(out["A"], 1.0, 1e-8);
    std::vector<std::string> const cols = { "logk1", "logk2", "logA", "logB", "logtotal" };
    EXPECT_EQ(out.jacobian->cols(), cols);
    // dA/dlogk1 = dA/dk1 * k1
    EXPECT_NEAR(out.jacobian->at("A", "logk1"), -0.1 * 11.0 / 1.21, 1e-8);
    EXPECT_JACOBIAN_NEAR(*out.jacobian, finite_difference_jacobian(*composed, point), 1e-6);
}

TEST_F(SteadyStateTest, NoDerivatives) {
    ImplicitTransform trafo(equations, {}, options);
    ParameterVector const out = trafo(start, {}, false);
    EXPECT_FALSE(out.has_jacobian());
    EXPECT_NEAR(out["B"], 10.0, 1e-8);
}

TEST_F(SteadyStateTest, MissingInitialGuess) {
    ImplicitTransform trafo(equations, {}, options);
    NamedValues const no_guess = start.without({ "B" });
    EXPECT_THROW(trafo(no_guess), std::invalid_argument);
}

TEST_F(SteadyStateTest, CeresRootFinder) {
    options.root_finder = RootFinderKind::Ceres;
    ImplicitTransform trafo(equations, {}, options);
    EXPECT_EQ(trafo.root_finder()->name(), "CeresRootFinder");
    ParameterVector const out = trafo(start);
    EXPECT_NEAR(out["A"], 1.0, 1e-6);
    EXPECT_NEAR(out["B"], 10.0, 1e-6);
}

TEST(ImplicitTransformTest, AllStatesFreeIsRejected) {
    EquationSet const eqs{ { "x", "x - a" } };
    EXPECT_THROW(ImplicitTransform const t(eqs, { "x" }), ConstructionError);
    EXPECT_THROW(ImplicitTransform const t(EquationSet(), {}), ConstructionError);
}

//-----------------------------------------------------------------------------
// Guess cache
//-----------------------------------------------------------------------------

class GuessCacheTest : public SteadyStateTest {
  protected:
    std::shared_ptr<RecordingRootFinder> recorder = std::make_shared<RecordingRootFinder>();
};

TEST_F(GuessCacheTest, WarmStartFromPreviousRoot) {
    options.keep_root = true;
    ImplicitTransform trafo(equations, {}, options, recorder);
    EXPECT_TRUE(trafo.guess_cache().empty());

    (void)trafo(start);
    ASSERT_FALSE(trafo.guess_cache().empty());
    EXPECT_NEAR(trafo.guess_cache().get()->at("A"), 1.0, 1e-8);
    EXPECT_FALSE(trafo.last_solve().warm_started);

    (void)trafo(start);
    ASSERT_EQ(recorder->starts.size(), 2u);
    EXPECT_DOUBLE_EQ(recorder->starts[0](0), 10.0);
    EXPECT_DOUBLE_EQ(recorder->starts[0](1), 1.0);
    EXPECT_NEAR(recorder->starts[1](0), 1.0, 1e-8);
    EXPECT_NEAR(recorder->starts[1](1), 10.0, 1e-8);
    EXPECT_TRUE(trafo.last_solve().warm_started);
    EXPECT_EQ(trafo.last_solve().attempts, 1);
}

TEST_F(GuessCacheTest, PerturbedCallsAgreeWithAndWithoutCache) {
    auto cached_recorder = std::make_shared<RecordingRootFinder>();
    TransformOptions cached_options = options;
    cached_options.keep_root = true;
    ImplicitTransform cached(equations, {}, cached_options, cached_recorder);
    ImplicitTransform uncached(equations, {}, options, recorder);

    NamedValues perturbed = start;
    perturbed.set("k1", 1.05);

    ParameterVector const first = cached(start);
    ParameterVector const second_cached = cached(perturbed);
    (void)uncached(start);
    ParameterVector const second_uncached = uncached(perturbed);

    EXPECT_NEAR(second_cached["A"], second_uncached["A"], 1e-10);
    EXPECT_NEAR(second_cached["B"], second_uncached["B"], 1e-10);
    EXPECT_NEAR(second_cached.jacobian->at("A", "k1"), second_uncached.jacobian->at("A", "k1"), 1e-10);

    // Only the cached transformation started from the previous root
    EXPECT_NEAR(cached_recorder->starts[1](0), first["A"], 1e-12);
    EXPECT_NEAR(cached_recorder->starts[1](1), first["B"], 1e-12);
    EXPECT_DOUBLE_EQ(recorder->starts[1](0), 10.0);
    EXPECT_TRUE(cached.last_solve().warm_started);
    EXPECT_FALSE(uncached.last_solve().warm_started);
}

TEST_F(GuessCacheTest, NoCachingWithoutKeepRoot) {
    ImplicitTransform trafo(equations, {}, options, recorder);
    (void)trafo(start);
    (void)trafo(start);
    EXPECT_TRUE(trafo.guess_cache().empty());
    ASSERT_EQ(recorder->starts.size(), 2u);
    EXPECT_DOUBLE_EQ(recorder->starts[1](0), 10.0);
    EXPECT_DOUBLE_EQ(recorder->starts[1](1), 1.0);
}

TEST_F(GuessCacheTest, CacheCanBeResetAndSeeded) {
    options.keep_root = true;
    ImplicitTransform trafo(equations, {}, options, recorder);
    (void)trafo(start);
    trafo.guess_cache().reset();
    (void)trafo(start);
    EXPECT_DOUBLE_EQ(recorder->starts[1](0), 10.0);

    trafo.guess_cache().set(NamedValues{ { "A", 3.0 }, { "B", 8.0 } });
    (void)trafo(start);
    EXPECT_DOUBLE_EQ(recorder->starts[2](0), 3.0);
    EXPECT_DOUBLE_EQ(recorder->starts[2](1), 8.0);
}

//-----------------------------------------------------------------------------
// Positivity repair
//-----------------------------------------------------------------------------

class PositivityTest : public ::testing::Test {
  protected:
    EquationSet equations{ { "x", "x - a" } };
    std::vector<std::string> warnings;

    void capture(ImplicitTransform &trafo) {
        trafo.set_warning_handler([this](const std::string &message) { warnings.push_back(message); });
    }
};

TEST_F(PositivityTest, NegativeRootIsClampedAndCacheCleared) {
    auto recorder = std::make_shared<RecordingRootFinder>();
    ImplicitTransform trafo(equations, {}, TransformOptions(), recorder);
    capture(trafo);
    ASSERT_TRUE(trafo.keep_root());
    ASSERT_TRUE(trafo.positive());

    (void)trafo(NamedValues{ { "x", 1.0 }, { "a", 3.0 } });
    EXPECT_FALSE(trafo.guess_cache().empty());

    ParameterVector const out = trafo(NamedValues{ { "x", 1.0 }, { "a", -2.0 } });
    EXPECT_DOUBLE_EQ(out["x"], 0.0);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("negative"), std::string::npos);
    EXPECT_TRUE(trafo.guess_cache().empty());

    // Warm start from 3, then the repair solves again from the caller's guess
    ASSERT_EQ(recorder->starts.size(), 3u);
    EXPECT_DOUBLE_EQ(recorder->starts[1](0), 3.0);
    EXPECT_DOUBLE_EQ(recorder->starts[2](0), 1.0);
    EXPECT_EQ(trafo.last_solve().attempts, 2);
    EXPECT_TRUE(trafo.last_solve().repaired);
    EXPECT_DOUBLE_EQ(out.jacobian->at("x", "a"), 1.0);
}

TEST_F(PositivityTest, RepairDisabledReturnsNegativeRoot) {
    TransformOptions options;
    options.positive = false;
    ImplicitTransform trafo(equations, {}, options);
    capture(trafo);

    ParameterVector const out = trafo(NamedValues{ { "x", 1.0 }, { "a", -2.0 } });
    EXPECT_NEAR(out["x"], -2.0, 1e-10);
    EXPECT_TRUE(warnings.empty());
    EXPECT_FALSE(trafo.guess_cache().empty());

    trafo.set_positive(true);
    ParameterVector const clamped = trafo(NamedValues{ { "x", 1.0 }, { "a", -2.0 } });
    EXPECT_DOUBLE_EQ(clamped["x"], 0.0);
    EXPECT_EQ(warnings.size(), 1u);
}

//-----------------------------------------------------------------------------
// Failures leave the cache untouched
//-----------------------------------------------------------------------------

TEST(ImplicitTransformFailureTest, RootNotFound) {
    ImplicitTransform trafo(EquationSet{ { "x", "x^2 + c" } }, {});
    RootFinderOptions root_options;
    root_options.max_iterations = 25;
    trafo.set_root_options(root_options);

    ParameterVector const ok = trafo(NamedValues{ { "x", 1.0 }, { "c", -4.0 } });
    EXPECT_NEAR(ok["x"], 2.0, 1e-8);

    try {
        (void)trafo(NamedValues{ { "x", 1.0 }, { "c", 1.0 } });
        FAIL() << "Expected RootNotFoundError";
    } catch (const RootNotFoundError &e) {
        EXPECT_GE(e.residual_norm(), 1.0);
        EXPECT_NE(std::string(e.what()).find("NewtonRootFinder"), std::string::npos);
    }
    ASSERT_FALSE(trafo.guess_cache().empty());
    EXPECT_NEAR(trafo.guess_cache().get()->at("x"), 2.0, 1e-8);
}

TEST(ImplicitTransformFailureTest, DottedNamesAreDistinct) {
    ImplicitTransform trafo(EquationSet{ { "a", "a - b.c" }, { "a.b", "a.b - c" } }, {});
    ParameterVector const out = trafo(NamedValues{ { "a", 0.0 }, { "a.b", 0.0 }, { "b.c", 2.0 }, { "c", 5.0 } });
    EXPECT_NEAR(out["a"], 2.0, 1e-10);
    EXPECT_NEAR(out["a.b"], 5.0, 1e-10);
    EXPECT_NEAR(out.jacobian->at("a", "b.c"), 1.0, 1e-12);
    EXPECT_NEAR(out.jacobian->at("a", "c"), 0.0, 1e-12);
    EXPECT_NEAR(out.jacobian->at("a.b", "c"), 1.0, 1e-12);
}

TEST(ImplicitTransformFailureTest, SingularJacobianAtRoot) {
    // Every x is a root when k = 0
    ImplicitTransform trafo(EquationSet{ { "x", "k*(x - 1)" } }, {});
    NamedValues const point{ { "x", 2.0 }, { "k", 0.0 } };

    try {
        (void)trafo(point);
        FAIL() << "Expected SingularJacobianError";
    } catch (const SingularJacobianError &e) {
        EXPECT_EQ(e.rank(), 0);
        EXPECT_EQ(e.dimension(), 1);
    }
    EXPECT_TRUE(trafo.guess_cache().empty());

    // Same failure when only values are requested
    EXPECT_THROW((void)trafo(point, {}, false), SingularJacobianError);
    EXPECT_TRUE(trafo.guess_cache().empty());
}

TEST(ImplicitTransformFailureTest, WarningGoesToStderrByDefault) {
    ImplicitTransform trafo(EquationSet{ { "x", "x - a" } }, {});
    ::testing::internal::CaptureStderr();
    (void)trafo(NamedValues{ { "x", 1.0 }, { "a", -1.0 } });
    std::string const err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[ImplicitTransform] Warning"), std::string::npos);
}
