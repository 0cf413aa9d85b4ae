// -*- c++ -*-
// Unit tests for RuleUpdate and ThresholdUpdate

#include <gtest/gtest.h>

#include "../src/rule_compiler.hpp"
#include "../src/update_function.hpp"

using namespace Bn;

class RuleUpdateTest : public ::testing::Test {
   protected:
    RuleUpdate make(const RuleLines& lines, const Nodes& nodes,
                    UnruledPolicy unruled = UnruledPolicy::Hold,
                    const Perturbations& perturbations = Perturbations()) {
        std::vector<std::string> declared;
        for (const auto& n : nodes) {
            declared.push_back(n.id);
            declared.push_back(n.display_label());
        }
        CompiledRules rules = RuleCompiler(declared).compile(lines);
        codec_ = std::make_unique<StateCodec>(nodes);
        RuleOptions options;
        options.unruled = unruled;
        return RuleUpdate(rules, *codec_, options, perturbations);
    }

    State state(const std::string& binary) const {
        return codec_->parse(binary);
    }
    std::string format(State s) const {
        return codec_->format(s);
    }

    std::unique_ptr<StateCodec> codec_;
};

TEST_F(RuleUpdateTest, SwapRules) {
    RuleUpdate update = make({"a = b", "b = a"}, {Node("a"), Node("b")});
    EXPECT_EQ(update.size(), 2u);
    EXPECT_EQ(format(update.next(state("10"))), "01");
    EXPECT_EQ(format(update.next(state("11"))), "11");
}

TEST_F(RuleUpdateTest, EveryNodeReadsTheSameCurrentState) {
    // Synchronous update: b sees the old a, not the new one
    RuleUpdate update = make({"a = !a", "b = a"}, {Node("a"), Node("b")});
    EXPECT_EQ(format(update.next(state("00"))), "10");
    EXPECT_EQ(format(update.next(state("10"))), "01");
}

TEST_F(RuleUpdateTest, UnruledNodeHoldsByDefault) {
    RuleUpdate update = make({"b = a"}, {Node("a"), Node("b")});
    EXPECT_EQ(format(update.next(state("10"))), "11");
    EXPECT_EQ(format(update.next(state("01"))), "00");
}

TEST_F(RuleUpdateTest, UnruledNodeOff) {
    RuleUpdate update = make({"b = a"}, {Node("a"), Node("b")}, UnruledPolicy::Off);
    EXPECT_EQ(format(update.next(state("10"))), "01");
}

TEST_F(RuleUpdateTest, UnruledNodeRejected) {
    EXPECT_THROW(make({"b = a"}, {Node("a"), Node("b")}, UnruledPolicy::Reject),
                 ConfigurationException);
}

TEST_F(RuleUpdateTest, LeavesResolveThroughLabels) {
    RuleUpdate update = make({"b = GENE_A"}, {Node("a", "Gene_A"), Node("b")});
    EXPECT_EQ(format(update.next(state("10"))), "11");
}

TEST_F(RuleUpdateTest, UnknownTargetIsDiagnosed) {
    try {
        (void)make({"a = a", "q = a"}, {Node("a")});
        FAIL() << "expected CompilationException";
    } catch (const CompilationException& e) {
        ASSERT_EQ(e.diagnostics().size(), 1u);
        EXPECT_EQ(e.diagnostics()[0].kind, RuleDiagnostic::Kind::UnknownNode);
        EXPECT_EQ(e.diagnostics()[0].identifiers, std::vector<std::string>{"q"});
    }
}

TEST_F(RuleUpdateTest, TargetAndLabelNamingTheSameNodeCollide) {
    try {
        (void)make({"a = true", "Alpha = false"}, {Node("a", "Alpha")});
        FAIL() << "expected CompilationException";
    } catch (const CompilationException& e) {
        ASSERT_EQ(e.diagnostics().size(), 1u);
        EXPECT_EQ(e.diagnostics()[0].kind, RuleDiagnostic::Kind::DuplicateTarget);
    }
}

TEST_F(RuleUpdateTest, PerturbationPinsNode) {
    RuleUpdate update = make({"a = b", "b = a"}, {Node("a"), Node("b")}, UnruledPolicy::Hold,
                             {{"a", false}});
    EXPECT_EQ(format(update.next(state("01"))), "00");
    EXPECT_EQ(format(update.next(state("11"))), "01");
}

TEST_F(RuleUpdateTest, PerturbationOfUnknownNodeIsRejected) {
    EXPECT_THROW(make({"a = a"}, {Node("a")}, UnruledPolicy::Hold, {{"zz", true}}),
                 ConfigurationException);
}

class ThresholdUpdateTest : public ::testing::Test {
   protected:
    void SetUp() override {
        network_.add_node(Node("A"));
        network_.add_node(Node("B"));
        network_.add_edge(Edge("A", "B", 1.0));
    }

    ThresholdUpdate make(const WeightedOptions& options = WeightedOptions()) {
        codec_ = std::make_unique<StateCodec>(network_.nodes());
        return ThresholdUpdate(network_, *codec_, options);
    }

    std::string step(const ThresholdUpdate& update, const std::string& binary) const {
        return codec_->format(update.next(codec_->parse(binary)));
    }

    Network network_;
    std::unique_ptr<StateCodec> codec_;
};

TEST_F(ThresholdUpdateTest, SingleEdgeActivatesTarget) {
    ThresholdUpdate update = make();
    EXPECT_EQ(step(update, "10"), "11");
    EXPECT_EQ(step(update, "11"), "11");
}

TEST_F(ThresholdUpdateTest, InputNodeHoldsItsValue) {
    ThresholdUpdate update = make();
    EXPECT_EQ(step(update, "00"), "00");
    EXPECT_EQ(step(update, "01"), "00");
}

TEST_F(ThresholdUpdateTest, TieBehaviors) {
    WeightedOptions options;
    options.threshold_multiplier = 1.0;  // score of B equals the threshold when A = 1

    options.tie = TieBehavior::Hold;
    ThresholdUpdate hold = make(options);
    EXPECT_EQ(step(hold, "10"), "10");
    EXPECT_EQ(step(hold, "11"), "11");

    options.tie = TieBehavior::Off;
    ThresholdUpdate off = make(options);
    EXPECT_EQ(step(off, "11"), "10");

    options.tie = TieBehavior::On;
    ThresholdUpdate on = make(options);
    EXPECT_EQ(step(on, "10"), "11");
}

TEST_F(ThresholdUpdateTest, NegativeWeightInhibits) {
    network_.add_node(Node("C", "", 1.0));
    network_.add_edge(Edge("B", "C", -2.0));
    ThresholdUpdate update = make();
    EXPECT_DOUBLE_EQ(update.score(codec_->parse("010"), 2), -1.0);
    EXPECT_EQ(step(update, "010"), "000");
    EXPECT_EQ(step(update, "000"), "001");
}

TEST_F(ThresholdUpdateTest, BiasOverrideWins) {
    network_.add_node(Node("C", "", -5.0));
    WeightedOptions options;
    options.biases["C"] = 1.0;
    ThresholdUpdate update = make(options);
    EXPECT_DOUBLE_EQ(update.bias(2), 1.0);
    EXPECT_EQ(step(update, "000"), "001");
}

TEST_F(ThresholdUpdateTest, BiasOverrideForUnknownNode) {
    WeightedOptions options;
    options.biases["nope"] = 1.0;
    EXPECT_THROW(make(options), ConfigurationException);
}

TEST_F(ThresholdUpdateTest, InDegreeThreshold) {
    network_.add_node(Node("C"));
    network_.add_edge(Edge("A", "C", 2.0));
    network_.add_edge(Edge("B", "C", -1.0));
    WeightedOptions options;
    options.threshold_mode = ThresholdMode::InDegree;
    ThresholdUpdate update = make(options);
    EXPECT_DOUBLE_EQ(update.threshold(1), 0.5);  // max(1, 1) * 0.5
    EXPECT_DOUBLE_EQ(update.threshold(2), 1.5);  // (2 + 1) * 0.5
    EXPECT_EQ(step(update, "100"), "111");
    EXPECT_EQ(step(update, "110"), "110");
}

TEST_F(ThresholdUpdateTest, ZeroWeightEdgeIsIgnored) {
    network_.add_node(Node("C"));
    network_.add_edge(Edge("A", "C", 0.0));
    ThresholdUpdate update = make();
    // C has no effective input and no bias, so it keeps its value
    EXPECT_EQ(step(update, "101"), "111");
    EXPECT_EQ(step(update, "100"), "110");
}

TEST_F(ThresholdUpdateTest, FixedNodeIsPinned) {
    network_.fix("B", false);
    ThresholdUpdate update = make();
    EXPECT_EQ(step(update, "10"), "10");
}
