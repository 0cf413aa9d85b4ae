// -*- c++ -*-
//
// NetworkReader: node/edge file reader
//
//   # comment
//   node ID [LABEL] [bias=X]
//   edge SOURCE TARGET [WEIGHT]
//   fix ID 0|1
//
// Nodes must be declared before edges or fixes refer to them. Keywords are
// case-insensitive; ids are not.

#ifndef BN_NETWORK_READER__H
#define BN_NETWORK_READER__H

#include <boolnet/network.hpp>
#include <string>

namespace Bn {

class Parser;

class NetworkReader {
   public:
    explicit NetworkReader(const std::string& network_file);

    // Throws FileException or ParseException
    void parse();

    [[nodiscard]] const Network& network() const {
        return network_;
    }

   private:
    void parse_node(Parser& parser);
    void parse_edge(Parser& parser);
    void parse_fix(Parser& parser);
    void check_node(Parser& parser, const std::string& id) const;

    std::string network_file_;
    Network network_;
};

// Reads a rules file line by line; blank and comment lines are kept so that
// line numbers in diagnostics match the file. Throws FileException.
RuleLines read_rule_lines(const std::string& rules_file);

}  // namespace Bn

#endif  // BN_NETWORK_READER__H
