// -*- c++ -*-
//
// Option name conversions

#include <boolnet/analyzer.hpp>
#include <boolnet/exception.hpp>
#include <boolnet/options.hpp>
#include <cctype>

namespace Bn {

static std::string lower(const std::string& name) {
    std::string s = name;
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

UnruledPolicy parse_unruled_policy(const std::string& name) {
    std::string s = lower(name);
    if (s == "hold") {
        return UnruledPolicy::Hold;
    } else if (s == "off") {
        return UnruledPolicy::Off;
    } else if (s == "reject") {
        return UnruledPolicy::Reject;
    }
    throw ConfigurationException("unknown unruled policy \"" + name +
                                 "\" (expected hold, off or reject)");
}

TieBehavior parse_tie_behavior(const std::string& name) {
    std::string s = lower(name);
    if (s == "hold") {
        return TieBehavior::Hold;
    } else if (s == "off" || s == "zero-as-zero") {
        return TieBehavior::Off;
    } else if (s == "on" || s == "zero-as-one") {
        return TieBehavior::On;
    }
    throw ConfigurationException("unknown tie behavior \"" + name +
                                 "\" (expected hold, off or on)");
}

ThresholdMode parse_threshold_mode(const std::string& name) {
    std::string s = lower(name);
    if (s == "absolute") {
        return ThresholdMode::Absolute;
    } else if (s == "indegree") {
        return ThresholdMode::InDegree;
    }
    throw ConfigurationException("unknown threshold mode \"" + name +
                                 "\" (expected absolute or indegree)");
}

Mode parse_mode(const std::string& name) {
    std::string s = lower(name);
    if (s == "rules") {
        return Mode::Rules;
    } else if (s == "weighted") {
        return Mode::Weighted;
    } else if (s == "probabilistic") {
        return Mode::Probabilistic;
    }
    throw ConfigurationException("unknown mode \"" + name +
                                 "\" (expected rules, weighted or probabilistic)");
}

std::string to_string(UnruledPolicy policy) {
    switch (policy) {
        case UnruledPolicy::Hold:
            return "hold";
        case UnruledPolicy::Off:
            return "off";
        case UnruledPolicy::Reject:
            return "reject";
    }
    return "hold";
}

std::string to_string(TieBehavior tie) {
    switch (tie) {
        case TieBehavior::Hold:
            return "hold";
        case TieBehavior::Off:
            return "off";
        case TieBehavior::On:
            return "on";
    }
    return "hold";
}

std::string to_string(ThresholdMode mode) {
    switch (mode) {
        case ThresholdMode::Absolute:
            return "absolute";
        case ThresholdMode::InDegree:
            return "indegree";
    }
    return "absolute";
}

}  // namespace Bn
