// -*- c++ -*-
//
// NetworkReader: node/edge file reader

#include "network_reader.hpp"

#include <boolnet/exception.hpp>
#include <cctype>
#include <fstream>

#include "parser.hpp"

namespace Bn {

static std::string lower(std::string token) {
    for (char& c : token) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return token;
}

NetworkReader::NetworkReader(const std::string& network_file)
    : network_file_(network_file) {}

void NetworkReader::parse() {
    Parser parser(network_file_, '#', "=", " \t\r(),");
    parser.checkFile();

    while (parser.getLine()) {
        std::string keyword;
        parser.getToken(keyword);
        keyword = lower(keyword);

        if (keyword == "node") {
            parse_node(parser);
        } else if (keyword == "edge") {
            parse_edge(parser);
        } else if (keyword == "fix") {
            parse_fix(parser);
        } else {
            parser.unexpectedToken();
        }
    }
}

void NetworkReader::parse_node(Parser& parser) {
    std::string id;
    parser.getToken(id);
    if (network_.has_node(id)) {
        parser.error("node \"" + id + "\" is multiply defined");
    }

    Node node(id);
    while (!parser.atEnd()) {
        std::string token;
        parser.getToken(token);
        if (lower(token) == "bias" && parser.peekToken() == "=") {
            if (node.has_bias) {
                parser.error("bias of node \"" + id + "\" given twice");
            }
            parser.checkSeparator('=');
            parser.getToken(node.bias);
            node.has_bias = true;
        } else if (node.label.empty() && !node.has_bias && token != "=") {
            node.label = token;
        } else {
            parser.unexpectedToken();
        }
    }

    network_.add_node(node);
}

void NetworkReader::parse_edge(Parser& parser) {
    std::string source;
    std::string target;
    parser.getToken(source);
    check_node(parser, source);
    parser.getToken(target);
    check_node(parser, target);

    double weight = 1.0;
    if (!parser.atEnd()) {
        parser.getToken(weight);
    }
    parser.checkEnd();

    network_.add_edge(Edge(source, target, weight));
}

void NetworkReader::parse_fix(Parser& parser) {
    std::string id;
    parser.getToken(id);
    check_node(parser, id);

    int value = 0;
    parser.getToken(value);
    if (value != 0 && value != 1) {
        parser.unexpectedToken();
    }
    parser.checkEnd();

    network_.fix(id, value == 1);
}

void NetworkReader::check_node(Parser& parser, const std::string& id) const {
    if (!network_.has_node(id)) {
        parser.error("unknown node \"" + id + "\"");
    }
}

RuleLines read_rule_lines(const std::string& rules_file) {
    std::ifstream infile(rules_file);
    if (infile.fail()) {
        throw FileException(rules_file, "failed to open file");
    }
    RuleLines lines;
    std::string line;
    while (std::getline(infile, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

}  // namespace Bn
