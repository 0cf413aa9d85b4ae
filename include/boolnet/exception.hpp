// -*- c++ -*-
//
// Unified exception classes for boolnet

#ifndef BN_EXCEPTION__H
#define BN_EXCEPTION__H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Bn {

// Base exception class for all boolnet exceptions
class Exception : public std::exception {
   public:
    explicit Exception(const std::string& message)
        : message_(message) {}
    Exception(const std::string& context, const std::string& message)
        : message_(context + ": " + message) {}

    ~Exception() noexcept override = default;

    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

    [[nodiscard]] const std::string& message() const {
        return message_;
    }

   protected:
    std::string message_;
};

class FileException : public Exception {
   public:
    FileException(const std::string& filename, const std::string& message)
        : Exception("File error", filename + ": " + message) {}
};

class ParseException : public Exception {
   public:
    ParseException(const std::string& filename, int line, const std::string& message)
        : Exception("Parse error", filename + ":" + std::to_string(line) + ": " + message) {}
};

class ConfigurationException : public Exception {
   public:
    explicit ConfigurationException(const std::string& message)
        : Exception("Configuration error", message) {}
};

class RuntimeException : public Exception {
   public:
    explicit RuntimeException(const std::string& message)
        : Exception("Runtime error", message) {}
};

// One problem found while compiling a rule set.
// line is 1-based; 0 means the problem concerns the rule set as a whole.
struct RuleDiagnostic {
    enum class Kind {
        MissingSeparator,
        MissingTarget,
        MissingExpression,
        InvalidTarget,
        ReservedTarget,
        ReservedVariable,
        DuplicateTarget,
        SyntaxError,
        UndefinedVariable,
        UnknownNode
    };

    int line = 0;
    Kind kind = Kind::SyntaxError;
    std::string message;
    std::vector<std::string> identifiers;

    RuleDiagnostic() = default;
    RuleDiagnostic(int l, Kind k, const std::string& msg, std::vector<std::string> ids = {})
        : line(l)
        , kind(k)
        , message(msg)
        , identifiers(std::move(ids)) {}
};

using RuleDiagnostics = std::vector<RuleDiagnostic>;

// Thrown when a rule set fails validation. Carries every diagnostic
// collected for the rule set, not just the first one.
class CompilationException : public Exception {
   public:
    explicit CompilationException(RuleDiagnostics diagnostics)
        : Exception("Compilation error", join(diagnostics))
        , diagnostics_(std::move(diagnostics)) {}

    [[nodiscard]] const RuleDiagnostics& diagnostics() const {
        return diagnostics_;
    }

   private:
    static std::string join(const RuleDiagnostics& diagnostics) {
        std::string what;
        for (const auto& d : diagnostics) {
            if (!what.empty()) {
                what += "; ";
            }
            what += d.message;
        }
        return what;
    }

    RuleDiagnostics diagnostics_;
};

}  // namespace Bn

#endif  // BN_EXCEPTION__H
