// -*- c++ -*-
// Unit tests for RelaxationSolver

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "../src/relaxation_solver.hpp"

using namespace Bn;

class RelaxationSolverTest : public ::testing::Test {
   protected:
    void SetUp() override {
        network_.add_node(Node("A", "", 1.0));
        network_.add_node(Node("B"));
        network_.add_edge(Edge("A", "B", 1.0));
    }

    Network network_;
};

TEST_F(RelaxationSolverTest, ResponseIsLogistic) {
    RelaxationOptions options;
    options.noise = 0.5;
    EXPECT_DOUBLE_EQ(RelaxationSolver::response(0.0, options), 0.5);
    EXPECT_NEAR(RelaxationSolver::response(1.0, options), 1.0 / (1.0 + std::exp(-2.0)), 1e-12);
    EXPECT_NEAR(RelaxationSolver::response(-1.0, options), 1.0 / (1.0 + std::exp(2.0)), 1e-12);
}

TEST_F(RelaxationSolverTest, ResponseSaturatesWithoutOverflow) {
    RelaxationOptions options;
    options.noise = 1e-9;
    EXPECT_DOUBLE_EQ(RelaxationSolver::response(10.0, options), 1.0);
    EXPECT_DOUBLE_EQ(RelaxationSolver::response(-10.0, options), 0.0);
}

TEST_F(RelaxationSolverTest, PotentialEnergy) {
    EXPECT_DOUBLE_EQ(RelaxationSolver::potential_energy(1.0), 0.0);
    EXPECT_NEAR(RelaxationSolver::potential_energy(0.5), std::log(2.0), 1e-12);
    EXPECT_NEAR(RelaxationSolver::potential_energy(0.0), -std::log(1e-9), 1e-9);
}

TEST_F(RelaxationSolverTest, LowNoiseApproachesThresholdRule) {
    RelaxationOptions options;
    options.noise = 1e-6;
    options.self_degradation = 0.0;
    options.threshold_multiplier = 0.5;
    ProbabilisticResult result = RelaxationSolver(options).solve(network_);

    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.probabilities.at("A"), 1.0, 1e-3);
    EXPECT_NEAR(result.probabilities.at("B"), 1.0, 1e-3);
}

TEST_F(RelaxationSolverTest, HighNoiseFlattensToOneHalf) {
    RelaxationOptions options;
    options.noise = 1e9;
    options.initial_probability = 0.9;
    ProbabilisticResult result = RelaxationSolver(options).solve(network_);

    EXPECT_TRUE(result.converged);
    for (const auto& id : result.node_order) {
        EXPECT_NEAR(result.probabilities.at(id), 0.5, 1e-3) << id;
    }
}

TEST_F(RelaxationSolverTest, UnstimulatedNodeHoldsWithoutDegradation) {
    Network single;
    single.add_node(Node("X"));
    RelaxationOptions options;
    options.self_degradation = 0.0;
    options.initial_probability = 0.7;
    ProbabilisticResult result = RelaxationSolver(options).solve(single);
    EXPECT_TRUE(result.converged);
    EXPECT_DOUBLE_EQ(result.probabilities.at("X"), 0.7);
}

TEST_F(RelaxationSolverTest, SelfDegradationDecaysUnstimulatedNode) {
    Network single;
    single.add_node(Node("X"));
    for (double c : {0.1, 0.5, 1.0}) {
        RelaxationOptions options;
        options.self_degradation = c;
        ProbabilisticResult result = RelaxationSolver(options).solve(single);
        EXPECT_TRUE(result.converged) << "c = " << c;
        EXPECT_LT(result.probabilities.at("X"), 0.01) << "c = " << c;
        EXPECT_GT(result.potential_energies.at("X"), 4.0) << "c = " << c;
    }
}

TEST_F(RelaxationSolverTest, DegradationDoesNotDependOnNoise) {
    Network single;
    single.add_node(Node("X"));
    RelaxationOptions options;
    options.self_degradation = 0.5;
    options.noise = 1e9;
    ProbabilisticResult result = RelaxationSolver(options).solve(single);
    EXPECT_LT(result.probabilities.at("X"), 0.01);
}

TEST_F(RelaxationSolverTest, SilencedInputLetsTargetDecay) {
    // B's only input is pinned off, so B has no stimulus and degrades
    network_.fix("A", false);
    RelaxationOptions options;
    options.self_degradation = 0.2;
    ProbabilisticResult result = RelaxationSolver(options).solve(network_);
    EXPECT_LT(result.probabilities.at("B"), 0.01);
}

TEST_F(RelaxationSolverTest, TargetBranches) {
    RelaxationOptions options;
    options.self_degradation = 0.25;
    options.noise = 0.5;
    EXPECT_DOUBLE_EQ(RelaxationSolver::target(0.8, 0.0, options), 0.6);
    EXPECT_DOUBLE_EQ(RelaxationSolver::target(0.8, 1e-12, options), 0.6);
    EXPECT_DOUBLE_EQ(RelaxationSolver::target(0.8, 1.0, options),
                     RelaxationSolver::response(1.0 - 0.25 * 0.8, options));

    options.threshold_multiplier = 0.3;
    EXPECT_DOUBLE_EQ(RelaxationSolver::target(0.4, -1.0, options),
                     RelaxationSolver::response(-1.0 - 0.3 - 0.25 * 0.4, options));
}

TEST_F(RelaxationSolverTest, ProbabilitiesStayInUnitInterval) {
    network_.add_node(Node("C", "", -3.0));
    network_.add_edge(Edge("B", "C", 4.0));
    network_.add_edge(Edge("C", "A", -2.0));
    ProbabilisticResult result = RelaxationSolver().solve(network_);
    ASSERT_EQ(result.node_order.size(), 3u);
    for (const auto& id : result.node_order) {
        EXPECT_GE(result.probabilities.at(id), 0.0);
        EXPECT_LE(result.probabilities.at(id), 1.0);
        EXPECT_GE(result.potential_energies.at(id), 0.0);
    }
}

TEST_F(RelaxationSolverTest, IterationsAreBounded) {
    RelaxationOptions options;
    options.max_iterations = 1;
    options.initial_probability = 0.0;
    ProbabilisticResult result = RelaxationSolver(options).solve(network_);
    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 1);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("did not converge"), std::string::npos);
}

TEST_F(RelaxationSolverTest, RepeatedRunsAgree) {
    RelaxationOptions options;
    RelaxationSolver solver(options);
    ProbabilisticResult first = solver.solve(network_);
    ProbabilisticResult second = solver.solve(network_);
    EXPECT_TRUE(first.converged);
    EXPECT_LE(first.iterations, options.max_iterations);
    for (const auto& id : first.node_order) {
        EXPECT_NEAR(first.probabilities.at(id), second.probabilities.at(id), 1e-4);
    }
}

TEST_F(RelaxationSolverTest, FixedNodesArePinned) {
    network_.fix("A", false);
    ProbabilisticResult result = RelaxationSolver().solve(network_);
    EXPECT_DOUBLE_EQ(result.probabilities.at("A"), 0.0);
    EXPECT_NEAR(result.potential_energies.at("A"), -std::log(1e-9), 1e-9);
}

TEST_F(RelaxationSolverTest, PerNodeOverrides) {
    RelaxationOptions options;
    options.noise = 1e-6;
    options.self_degradation = 0.0;
    options.threshold_multiplier = 0.5;
    options.biases["A"] = -1.0;
    options.basal_activity["B"] = 2.0;
    options.initial_probabilities["A"] = 0.0;
    ProbabilisticResult result = RelaxationSolver(options).solve(network_);
    EXPECT_NEAR(result.probabilities.at("A"), 0.0, 1e-3);
    EXPECT_NEAR(result.probabilities.at("B"), 1.0, 1e-3);
}

TEST_F(RelaxationSolverTest, OverridesMustNameNodes) {
    RelaxationOptions options;
    options.basal_activity["ghost"] = 1.0;
    EXPECT_THROW((void)RelaxationSolver(options).solve(network_), ConfigurationException);
}

TEST_F(RelaxationSolverTest, EmptyNetwork) {
    ProbabilisticResult result = RelaxationSolver().solve(Network());
    EXPECT_TRUE(result.converged);
    EXPECT_TRUE(result.probabilities.empty());
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(RelaxationSolverTest, InvalidOptions) {
    auto rejects = [](void (*tweak)(RelaxationOptions&)) {
        RelaxationOptions options;
        tweak(options);
        EXPECT_THROW(RelaxationSolver::check(options), ConfigurationException);
    };
    rejects([](RelaxationOptions& o) { o.noise = 0.0; });
    rejects([](RelaxationOptions& o) { o.noise = -1.0; });
    rejects([](RelaxationOptions& o) { o.noise = std::numeric_limits<double>::infinity(); });
    rejects([](RelaxationOptions& o) { o.self_degradation = -0.1; });
    rejects([](RelaxationOptions& o) { o.self_degradation = 1.1; });
    rejects([](RelaxationOptions& o) { o.max_iterations = 0; });
    rejects([](RelaxationOptions& o) { o.tolerance = 0.0; });
    rejects([](RelaxationOptions& o) { o.initial_probability = 1.5; });
    rejects([](RelaxationOptions& o) { o.initial_probabilities["A"] = -0.2; });
    rejects([](RelaxationOptions& o) { o.noise = std::nan(""); });
    EXPECT_NO_THROW(RelaxationSolver::check(RelaxationOptions()));
}
