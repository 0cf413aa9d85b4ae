// -*- c++ -*-
//
// boolnet command-line driver

#include <boolnet/analyzer.hpp>
#include <boolnet/cancellation.hpp>
#include <boolnet/exception.hpp>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

struct CommandLine {
    Bn::Mode mode = Bn::Mode::None;
    std::string rules_file;
    std::string network_file;
    Bn::RuleOptions rule_options;
    Bn::WeightedOptions weighted_options;
    Bn::SearchOptions search_options;
    Bn::RelaxationOptions relaxation_options;
    double timeout = 0.0;  // seconds; 0 means none
};

[[noreturn]] void usage() {
    std::cerr << "usage: boolnet [options]" << std::endl;
    std::cerr << " -r, --rules FILE        rule file (\"target = expression\" per line)" << std::endl;
    std::cerr << " -n, --network FILE      node/edge file" << std::endl;
    std::cerr << " -m, --mode MODE         rules | weighted | probabilistic" << std::endl;
    std::cerr << " -t, --threshold X       threshold multiplier" << std::endl;
    std::cerr << "     --threshold-mode M  absolute | indegree" << std::endl;
    std::cerr << "     --tie P             hold | off | on" << std::endl;
    std::cerr << "     --unruled P         hold | off | reject" << std::endl;
    std::cerr << "     --state-cap N       maximum initial states" << std::endl;
    std::cerr << "     --step-cap N        maximum trajectory length" << std::endl;
    std::cerr << "     --seed N            sampling seed" << std::endl;
    std::cerr << "     --timeout SEC       cancel the search after SEC seconds" << std::endl;
    std::cerr << "     --noise X           relaxation noise (> 0)" << std::endl;
    std::cerr << "     --degradation X     self-degradation in [0, 1]" << std::endl;
    std::cerr << "     --iterations N      maximum relaxation sweeps" << std::endl;
    std::cerr << "     --tolerance X       convergence tolerance" << std::endl;
    std::cerr << "     --initial X         initial probability in [0, 1]" << std::endl;
    std::cerr << " -h, --help              gives this help" << std::endl;
    throw Bn::RuntimeException("Invalid command-line arguments");
}

double parse_double(const std::string& option, const std::string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size() || !std::isfinite(value)) {
        throw Bn::ConfigurationException(option + " expects a number, got \"" + text + "\"");
    }
    return value;
}

std::uint64_t parse_count(const std::string& option, const std::string& text) {
    size_t used = 0;
    std::uint64_t value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size() || text[0] == '-') {
        throw Bn::ConfigurationException(option + " expects a non-negative integer, got \"" +
                                         text + "\"");
    }
    return value;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
std::string option_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        usage();
    }
    return std::string(argv[++i]);
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
void set_option(int argc, char* argv[], CommandLine* cl) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // Short options map onto their long form
        if (arg == "-h") {
            arg = "--help";
        } else if (arg == "-r") {
            arg = "--rules";
        } else if (arg == "-n") {
            arg = "--network";
        } else if (arg == "-m") {
            arg = "--mode";
        } else if (arg == "-t") {
            arg = "--threshold";
        }

        if (arg == "--help") {
            usage();
        } else if (arg == "--rules") {
            cl->rules_file = option_value(argc, argv, i);
        } else if (arg == "--network") {
            cl->network_file = option_value(argc, argv, i);
        } else if (arg == "--mode") {
            cl->mode = Bn::parse_mode(option_value(argc, argv, i));
        } else if (arg == "--threshold") {
            double t = parse_double(arg, option_value(argc, argv, i));
            cl->weighted_options.threshold_multiplier = t;
            cl->relaxation_options.threshold_multiplier = t;
        } else if (arg == "--threshold-mode") {
            cl->weighted_options.threshold_mode =
                Bn::parse_threshold_mode(option_value(argc, argv, i));
        } else if (arg == "--tie") {
            cl->weighted_options.tie = Bn::parse_tie_behavior(option_value(argc, argv, i));
        } else if (arg == "--unruled") {
            cl->rule_options.unruled = Bn::parse_unruled_policy(option_value(argc, argv, i));
        } else if (arg == "--state-cap") {
            cl->search_options.state_cap = parse_count(arg, option_value(argc, argv, i));
        } else if (arg == "--step-cap") {
            cl->search_options.step_cap = parse_count(arg, option_value(argc, argv, i));
        } else if (arg == "--seed") {
            cl->search_options.seed = parse_count(arg, option_value(argc, argv, i));
        } else if (arg == "--timeout") {
            cl->timeout = parse_double(arg, option_value(argc, argv, i));
            if (cl->timeout < 0.0) {
                throw Bn::ConfigurationException("--timeout must not be negative");
            }
        } else if (arg == "--noise") {
            cl->relaxation_options.noise = parse_double(arg, option_value(argc, argv, i));
        } else if (arg == "--degradation") {
            cl->relaxation_options.self_degradation =
                parse_double(arg, option_value(argc, argv, i));
        } else if (arg == "--iterations") {
            std::uint64_t n = parse_count(arg, option_value(argc, argv, i));
            if (n > 1000000000) {
                throw Bn::ConfigurationException("--iterations is too large");
            }
            cl->relaxation_options.max_iterations = static_cast<int>(n);
        } else if (arg == "--tolerance") {
            cl->relaxation_options.tolerance = parse_double(arg, option_value(argc, argv, i));
        } else if (arg == "--initial") {
            cl->relaxation_options.initial_probability =
                parse_double(arg, option_value(argc, argv, i));
        } else {
            usage();
        }
    }
}

std::string get_version_string() {
    auto now = std::time(nullptr);
    std::tm timeinfo{};
    localtime_r(&now, &timeinfo);

    std::ostringstream oss;
    oss << "boolnet 0.1.0 (";
    oss << std::put_time(&timeinfo, "%a %b %d %H:%M:%S %Y");
    oss << ")";
    return oss.str();
}

std::string formatAttractors(const Bn::AnalysisResult& result) {
    std::ostringstream oss;
    oss << "#" << std::endl;
    oss << "# attractors" << std::endl;
    oss << "#" << std::endl;
    oss << "# node order:";
    for (const auto& id : result.node_order) {
        oss << " " << id;
    }
    oss << std::endl;
    oss << "#---------------------------------" << std::endl;

    for (const auto& attractor : result.attractors) {
        oss << "# Attractor " << attractor.id << ": ";
        if (attractor.is_fixed_point()) {
            oss << "fixed point";
        } else {
            oss << "cycle of period " << attractor.period;
        }
        oss << " (basin " << attractor.basin_size << ", share " << std::fixed
            << std::setprecision(3) << attractor.basin_share << ")" << std::endl;
        for (const auto& snapshot : attractor.snapshots) {
            oss << snapshot.binary << std::endl;
        }
    }

    oss << "#---------------------------------" << std::endl;
    oss << "# explored " << result.explored_state_count << " of " << std::fixed
        << std::setprecision(0) << result.total_state_space << " states";
    if (result.truncated) {
        oss << " (truncated)";
    }
    oss << std::endl;
    return oss.str();
}

std::string formatProbabilities(const Bn::ProbabilisticResult& result) {
    std::ostringstream oss;
    oss << "#" << std::endl;
    oss << "# steady-state probabilities" << std::endl;
    oss << "#" << std::endl;
    oss << std::left << std::setw(15) << "#node" << std::right << std::setw(10) << "p"
        << std::setw(10) << "PE" << std::endl;
    oss << "#-----------------------------------" << std::endl;

    for (const auto& id : result.node_order) {
        oss << std::left << std::setw(15) << id;
        oss << std::right << std::setw(10) << std::fixed << std::setprecision(4)
            << result.probabilities.at(id);
        oss << std::right << std::setw(10) << std::fixed << std::setprecision(4)
            << result.potential_energies.at(id) << std::endl;
    }

    oss << "#-----------------------------------" << std::endl;
    oss << "# " << (result.converged ? "converged" : "not converged") << " after "
        << result.iterations << " iterations" << std::endl;
    return oss.str();
}

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "warning: " << w << std::endl;
    }
}

int main(int argc, char* argv[]) {
    try {
        std::cerr << get_version_string() << std::endl;

        CommandLine cl;
        set_option(argc, argv, &cl);

        Bn::CancellationToken cancellation;
        if (cl.timeout > 0.0) {
            cancellation.set_timeout(
                std::chrono::milliseconds(static_cast<long long>(cl.timeout * 1000.0)));
            cl.search_options.cancellation = &cancellation;
        }

        Bn::Analyzer analyzer;
        analyzer.set_mode(cl.mode);
        analyzer.set_rules_file(cl.rules_file);
        analyzer.set_network_file(cl.network_file);
        analyzer.set_rule_options(cl.rule_options);
        analyzer.set_weighted_options(cl.weighted_options);
        analyzer.set_search_options(cl.search_options);
        analyzer.set_relaxation_options(cl.relaxation_options);
        analyzer.check();
        analyzer.read_network();
        analyzer.read_rules();

        std::cout << std::endl;
        switch (analyzer.mode()) {
            case Bn::Mode::Rules: {
                Bn::AnalysisResult result = analyzer.getRuleAnalysis();
                print_warnings(result.warnings);
                std::cout << formatAttractors(result);
                break;
            }
            case Bn::Mode::Weighted: {
                Bn::AnalysisResult result = analyzer.getWeightedAnalysis();
                print_warnings(result.warnings);
                std::cout << formatAttractors(result);
                break;
            }
            case Bn::Mode::Probabilistic: {
                Bn::ProbabilisticResult result = analyzer.getProbabilisticAnalysis();
                print_warnings(result.warnings);
                std::cout << formatProbabilities(result);
                break;
            }
            case Bn::Mode::None:
                usage();
        }

        std::cerr << "OK" << std::endl;

    } catch (Bn::CompilationException& e) {
        for (const auto& d : e.diagnostics()) {
            std::cerr << "error: " << d.message << std::endl;
        }
        return 1;

    } catch (Bn::Exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;

    } catch (std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;

    } catch (...) {
        std::cerr << "error: unknown error" << std::endl;
        return 3;
    }

    return 0;
}
