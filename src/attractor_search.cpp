// -*- c++ -*-
//
// AttractorSearch: synchronous attractor enumeration with memoized basins

#include "attractor_search.hpp"

#include <boolnet/cancellation.hpp>
#include <boolnet/exception.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace Bn {

// The cancellation token is polled once per this many initial states,
// and once per this many steps of a single trajectory
static constexpr std::uint64_t CANCEL_POLL_INTERVAL = 1024;
static constexpr size_t STEP_POLL_INTERVAL = 4096;

static State state_mask(size_t num_nodes) {
    return num_nodes >= 64 ? ~State{0} : ((State{1} << num_nodes) - 1);
}

//// strategies ////

ExhaustiveExploration::ExhaustiveExploration(size_t num_nodes)
    : count_(0) {
    if (num_nodes >= 64) {
        throw RuntimeException("exhaustive exploration of " + std::to_string(num_nodes) +
                               " nodes is not supported");
    }
    count_ = std::uint64_t{1} << num_nodes;
}

bool ExhaustiveExploration::next(State& state) {
    if (cursor_ >= count_) {
        return false;
    }
    state = cursor_++;
    return true;
}

SampledExploration::SampledExploration(size_t num_nodes, std::uint64_t count, std::uint64_t seed)
    : mask_(state_mask(num_nodes))
    , count_(count)
    , engine_(seed) {
    if (num_nodes < 64 && count > (std::uint64_t{1} << num_nodes)) {
        throw RuntimeException("cannot sample more distinct states than the state space holds");
    }
}

bool SampledExploration::next(State& state) {
    if (drawn_.size() >= count_) {
        return false;
    }
    while (true) {
        State candidate = engine_() & mask_;
        if (drawn_.insert(candidate).second) {
            state = candidate;
            return true;
        }
    }
}

//// memo ////

StateMemo::StateMemo(size_t num_nodes) {
    if (num_nodes <= MAX_EXHAUSTIVE_NODES) {
        dense_.assign(size_t{1} << num_nodes, UNVISITED);
    }
}

std::int32_t StateMemo::find(State state) const {
    if (!dense_.empty()) {
        return dense_[state];
    }
    auto it = sparse_.find(state);
    return it == sparse_.end() ? UNVISITED : it->second;
}

void StateMemo::set(State state, std::int32_t value) {
    if (!dense_.empty()) {
        dense_[state] = value;
    } else if (value == UNVISITED) {
        sparse_.erase(state);
    } else {
        sparse_[state] = value;
    }
}

void StateMemo::mark_on_path(State state) {
    set(state, ON_PATH);
}

void StateMemo::assign(State state, std::int32_t attractor_id) {
    if (find(state) < 0) {
        classified_++;
    }
    set(state, attractor_id);
}

void StateMemo::clear(State state) {
    if (find(state) >= 0) {
        classified_--;
    }
    set(state, UNVISITED);
}

//// search ////

AttractorSearch::AttractorSearch(const SearchOptions& options)
    : options_(options) {
    if (options_.state_cap == 0) {
        throw ConfigurationException("state cap must be at least 1");
    }
    if (options_.step_cap == 0) {
        throw ConfigurationException("step cap must be at least 1");
    }
}

std::unique_ptr<ExplorationStrategy> AttractorSearch::select_strategy(size_t num_nodes) const {
    if (num_nodes < 64 && (std::uint64_t{1} << num_nodes) <= options_.state_cap) {
        return std::make_unique<ExhaustiveExploration>(num_nodes);
    }
    std::uint64_t count = options_.state_cap;
    if (num_nodes < 64) {
        count = std::min(count, std::uint64_t{1} << num_nodes);
    }
    return std::make_unique<SampledExploration>(num_nodes, count, options_.seed);
}

AnalysisResult AttractorSearch::run(const UpdateFunction& update) const {
    AnalysisResult result;
    const size_t n = update.size();
    if (n > 64) {
        throw ConfigurationException("attractor search supports at most 64 nodes");
    }
    result.total_state_space = std::ldexp(1.0, static_cast<int>(n));
    if (n == 0) {
        result.warnings.emplace_back("No nodes supplied; analysis skipped.");
        return result;
    }

    std::unique_ptr<ExplorationStrategy> strategy = select_strategy(n);
    const CancellationToken* token = options_.cancellation;

    StateMemo memo(n);
    std::vector<std::uint64_t> basins;
    std::vector<State> path;
    std::uint64_t started = 0;
    std::uint64_t abandoned = 0;

    State start = 0;
    while (strategy->next(start)) {
        if (token != nullptr && started % CANCEL_POLL_INTERVAL == 0 && token->cancelled()) {
            result.cancelled = true;
            break;
        }
        started++;
        if (memo.find(start) >= 0) {
            continue;
        }

        // Follow the trajectory until it closes on itself or joins a known basin
        path.clear();
        std::int32_t id = StateMemo::UNVISITED;
        bool interrupted = false;
        State current = start;
        while (true) {
            std::int32_t mark = memo.find(current);
            if (mark >= 0) {
                id = mark;
                break;
            }
            if (mark == StateMemo::ON_PATH) {
                auto first = std::find(path.begin(), path.end(), current);
                Attractor attractor;
                attractor.id = result.attractors.size();
                attractor.states.assign(first, path.end());
                attractor.period = attractor.states.size();
                attractor.kind =
                    attractor.period == 1 ? AttractorKind::FixedPoint : AttractorKind::Cycle;
                id = static_cast<std::int32_t>(attractor.id);
                result.attractors.push_back(std::move(attractor));
                basins.push_back(0);
                break;
            }
            if (path.size() >= options_.step_cap) {
                break;
            }
            if (token != nullptr && path.size() % STEP_POLL_INTERVAL == STEP_POLL_INTERVAL - 1 &&
                token->cancelled()) {
                interrupted = true;
                break;
            }
            memo.mark_on_path(current);
            path.push_back(current);
            current = update.next(current);
        }

        if (id < 0) {
            for (State s : path) {
                memo.clear(s);
            }
            if (interrupted) {
                result.cancelled = true;
                break;
            }
            abandoned++;
            result.unresolved_states += path.size();
            continue;
        }

        for (State s : path) {
            memo.assign(s, id);
        }
        basins[static_cast<size_t>(id)] += path.size();
    }

    result.explored_state_count = memo.classified();
    for (auto& attractor : result.attractors) {
        attractor.basin_size = basins[attractor.id];
        attractor.basin_share =
            result.explored_state_count > 0
                ? static_cast<double>(attractor.basin_size) /
                      static_cast<double>(result.explored_state_count)
                : 0.0;
    }

    const double covered =
        100.0 * static_cast<double>(result.explored_state_count) / result.total_state_space;

    if (!strategy->exhaustive()) {
        result.truncated = true;
        std::ostringstream what;
        what << "State space (2^" << n << " states) exceeds the exhaustive search bound; sampled "
             << started << " initial states and explored " << result.explored_state_count
             << " states, omitting " << std::setprecision(6) << (100.0 - covered)
             << "% of the space.";
        result.warnings.push_back(what.str());
    }
    if (abandoned > 0) {
        result.truncated = true;
        std::ostringstream what;
        what << abandoned << " trajectories exceeded the step cap (" << options_.step_cap << "); "
             << result.unresolved_states << " states left unresolved.";
        result.warnings.push_back(what.str());
    }
    if (result.cancelled) {
        result.truncated = true;
        std::ostringstream what;
        what << "Analysis cancelled after exploring " << result.explored_state_count << " states ("
             << std::setprecision(6) << covered << "% of the space).";
        result.warnings.push_back(what.str());
    }

    return result;
}

}  // namespace Bn
