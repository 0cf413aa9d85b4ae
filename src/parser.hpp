// -*- c++ -*-
//
// Parser: line-oriented token reader for network files
//
// getLine() skips blank lines and lines whose first token starts with the
// comment character. Every error is reported as a ParseException carrying
// the file name and line number.

#ifndef BN_PARSER__H
#define BN_PARSER__H

#include <boolnet/exception.hpp>
#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "tokenizer.hpp"

namespace Bn {

class Parser {
   private:
    using Token = Tokenizer::iterator;

   public:
    Parser(const std::string& file, char begin_comment, const char* keep_separator,
           const char* drop_separator = " \t\r");

    ~Parser() = default;

    // Throws FileException when the file could not be opened
    void checkFile();

    // false at end of file
    bool getLine();

    template <class U>
    void getToken(U& u) {
        checkTermination();
        try {
            u = convertToken<U>(*token_);
        } catch (std::invalid_argument&) {
            unexpectedToken_(*token_);
        } catch (std::out_of_range&) {
            unexpectedToken_(*token_);
        }
        pre_ = *token_;
        ++token_;
    }

    void checkSeparator(char separator);
    void checkEnd();
    [[noreturn]] void unexpectedToken();
    [[noreturn]] void error(const std::string& message) const;

    [[nodiscard]] bool atEnd() const {
        return !tokenizer_ || token_ == tokenizer_->end();
    }
    // Next token without consuming it; empty at end of line
    [[nodiscard]] std::string peekToken() const {
        return atEnd() ? std::string() : *token_;
    }

    [[nodiscard]] const std::string& getFileName() const {
        return file_;
    }
    [[nodiscard]] int getNumLine() const {
        return line_number_;
    }

   private:
    // Numeric conversions must consume the whole token
    template <typename T>
    T convertToken(const std::string& token) {
        size_t used = 0;
        if constexpr (std::is_same_v<T, std::string>) {
            return token;
        } else if constexpr (std::is_same_v<T, int>) {
            int value = std::stoi(token, &used);
            checkConsumed(token, used);
            return value;
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            if (!token.empty() && token[0] == '-') {
                throw std::invalid_argument("negative count");
            }
            std::uint64_t value = std::stoull(token, &used);
            checkConsumed(token, used);
            return value;
        } else if constexpr (std::is_same_v<T, double>) {
            double value = std::stod(token, &used);
            checkConsumed(token, used);
            return value;
        } else if constexpr (std::is_same_v<T, char>) {
            if (token.length() != 1) {
                throw std::invalid_argument("char token must be single character");
            }
            return token[0];
        } else {
            static_assert(std::is_convertible_v<std::string, T>,
                          "Type must be convertible from string");
            return static_cast<T>(token);
        }
    }

    static void checkConsumed(const std::string& token, size_t used) {
        if (used != token.size()) {
            throw std::invalid_argument("trailing characters in \"" + token + "\"");
        }
    }

    [[noreturn]] void unexpectedToken_(const std::string& token) const;
    void checkTermination() const;

    int line_number_ = 0;
    std::string file_;
    std::string line_;
    std::ifstream infile_;
    std::string drop_separator_;
    std::string keep_separator_;
    const char begin_comment_;
    std::unique_ptr<Tokenizer> tokenizer_;
    std::string pre_;
    Token token_;
};

}  // namespace Bn

#endif  // BN_PARSER__H
