// -*- c++ -*-
//
// Parser: line-oriented token reader for network files

#include "parser.hpp"

namespace Bn {

Parser::Parser(const std::string& file, const char begin_comment, const char* keep_separator,
               const char* drop_separator)
    : file_(file)
    , infile_(file)
    , drop_separator_(drop_separator != nullptr ? drop_separator : "")
    , keep_separator_(keep_separator != nullptr ? keep_separator : "")
    , begin_comment_(begin_comment) {}

bool Parser::getLine() {
    while (std::getline(infile_, line_)) {
        line_number_++;
        tokenizer_ = std::make_unique<Tokenizer>(line_, drop_separator_, keep_separator_);
        if (tokenizer_->unterminated()) {
            error("missing closing quote");
        }
        token_ = tokenizer_->begin();
        pre_.clear();
        if (token_ != tokenizer_->end() && (*token_)[0] != begin_comment_) {
            return true;
        }
    }
    // Leave an empty line behind so that atEnd() holds after the last line
    line_.clear();
    tokenizer_ = std::make_unique<Tokenizer>(line_, drop_separator_, keep_separator_);
    token_ = tokenizer_->begin();
    return false;
}

void Parser::checkTermination() const {
    if (atEnd()) {
        error("unexpected termination");
    }
}

void Parser::unexpectedToken() {
    unexpectedToken_(pre_);
}

void Parser::unexpectedToken_(const std::string& token) const {
    error("unexpected token \"" + token + "\"");
}

void Parser::error(const std::string& message) const {
    throw ParseException(getFileName(), getNumLine(), message);
}

void Parser::checkFile() {
    if (infile_.fail()) {
        throw FileException(getFileName(), "failed to open file");
    }
}

void Parser::checkSeparator(char separator) {
    checkTermination();
    if (*token_ != std::string(1, separator)) {
        unexpectedToken_(*token_);
    }
    pre_ = *token_;
    ++token_;
}

void Parser::checkEnd() {
    if (!atEnd()) {
        unexpectedToken_(*token_);
    }
}

}  // namespace Bn
