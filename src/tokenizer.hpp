// -*- c++ -*-
//
// Tokenizer: splits one line into tokens
//
// Characters in drop_separator end a token and are discarded. Characters in
// keep_separator end a token and become one-character tokens themselves.
// A double-quoted run is one token (without the quotes), so labels may
// contain blanks.

#ifndef BN_TOKENIZER__H
#define BN_TOKENIZER__H

#include <string>
#include <vector>

namespace Bn {

class Tokenizer {
   public:
    using iterator = std::vector<std::string>::const_iterator;

    Tokenizer(const std::string& line, const std::string& drop_separator,
              const std::string& keep_separator) {
        tokenize(line, drop_separator, keep_separator);
    }

    [[nodiscard]] iterator begin() const {
        return tokens_.begin();
    }
    [[nodiscard]] iterator end() const {
        return tokens_.end();
    }
    [[nodiscard]] size_t size() const {
        return tokens_.size();
    }
    // True when a quoted token was never closed
    [[nodiscard]] bool unterminated() const {
        return unterminated_;
    }

   private:
    void tokenize(const std::string& line, const std::string& drop_separator,
                  const std::string& keep_separator) {
        std::string current;
        bool quoted = false;
        bool has_token = false;

        auto flush = [&]() {
            if (has_token) {
                tokens_.push_back(current);
                current.clear();
                has_token = false;
            }
        };

        for (char c : line) {
            if (quoted) {
                if (c == '"') {
                    quoted = false;
                } else {
                    current += c;
                }
            } else if (c == '"') {
                quoted = true;
                has_token = true;
            } else if (keep_separator.find(c) != std::string::npos) {
                flush();
                tokens_.emplace_back(1, c);
            } else if (drop_separator.find(c) != std::string::npos) {
                flush();
            } else {
                current += c;
                has_token = true;
            }
        }
        unterminated_ = quoted;
        flush();
    }

    std::vector<std::string> tokens_;
    bool unterminated_ = false;
};

}  // namespace Bn

#endif  // BN_TOKENIZER__H
