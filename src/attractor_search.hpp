// -*- c++ -*-
//
// AttractorSearch: classifies the synchronous dynamics of an UpdateFunction
// into fixed points and cycles, with basin sizes
//
// Every state reached is recorded in a StateMemo owned by one run() call, so
// each state is evaluated once: the work is linear in the number of explored
// states. Initial states come from an ExplorationStrategy: all 2^n states
// when the space is small enough, a seeded sample of distinct states
// otherwise.

#ifndef BN_ATTRACTOR_SEARCH__H
#define BN_ATTRACTOR_SEARCH__H

#include <boolnet/analysis_results.hpp>
#include <boolnet/options.hpp>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "update_function.hpp"

namespace Bn {

class ExplorationStrategy {
   public:
    virtual ~ExplorationStrategy() = default;

    // Produces the next initial state; false when exhausted
    virtual bool next(State& state) = 0;
    // Number of initial states this strategy will produce
    [[nodiscard]] virtual std::uint64_t planned() const = 0;
    [[nodiscard]] virtual bool exhaustive() const = 0;
};

class ExhaustiveExploration : public ExplorationStrategy {
   public:
    explicit ExhaustiveExploration(size_t num_nodes);

    bool next(State& state) override;
    [[nodiscard]] std::uint64_t planned() const override {
        return count_;
    }
    [[nodiscard]] bool exhaustive() const override {
        return true;
    }

   private:
    std::uint64_t count_;
    std::uint64_t cursor_ = 0;
};

class SampledExploration : public ExplorationStrategy {
   public:
    // count must not exceed 2^num_nodes
    SampledExploration(size_t num_nodes, std::uint64_t count, std::uint64_t seed);

    bool next(State& state) override;
    [[nodiscard]] std::uint64_t planned() const override {
        return count_;
    }
    [[nodiscard]] bool exhaustive() const override {
        return false;
    }

   private:
    State mask_;
    std::uint64_t count_;
    std::mt19937_64 engine_;
    std::unordered_set<State> drawn_;
};

// State -> attractor id. Dense (one slot per state) when the space has at
// most 2^MAX_EXHAUSTIVE_NODES states, hashed otherwise.
class StateMemo {
   public:
    static constexpr std::int32_t UNVISITED = -1;
    static constexpr std::int32_t ON_PATH = -2;

    explicit StateMemo(size_t num_nodes);

    [[nodiscard]] std::int32_t find(State state) const;
    void mark_on_path(State state);
    void assign(State state, std::int32_t attractor_id);
    void clear(State state);

    // States assigned to an attractor
    [[nodiscard]] std::uint64_t classified() const {
        return classified_;
    }
    [[nodiscard]] bool dense() const {
        return !dense_.empty();
    }

   private:
    void set(State state, std::int32_t value);

    std::vector<std::int32_t> dense_;
    std::unordered_map<State, std::int32_t> sparse_;
    std::uint64_t classified_ = 0;
};

class AttractorSearch {
   public:
    explicit AttractorSearch(const SearchOptions& options = SearchOptions());

    // Fills attractors, counts and warnings; node_order, node_labels and
    // snapshots are left to the caller, who owns the StateCodec
    [[nodiscard]] AnalysisResult run(const UpdateFunction& update) const;

    [[nodiscard]] std::unique_ptr<ExplorationStrategy> select_strategy(size_t num_nodes) const;

   private:
    SearchOptions options_;
};

}  // namespace Bn

#endif  // BN_ATTRACTOR_SEARCH__H
