// console.hpp - Terminal implementation of the operator interface
#pragma once

#include "core/operator.hpp"
#include <iostream>

namespace uuidfix {

class ConsoleOperator : public Operator {
public:
  ConsoleOperator(std::istream &in = std::cin, std::ostream &out = std::cout)
      : in_(in), out_(out) {}

  std::optional<size_t> select(const std::vector<std::string> &options,
                               const std::string &hint) override;
  std::optional<std::string> read_line(const std::string &hint) override;

  bool at_eof() const override { return eof_; }

private:
  std::istream &in_;
  std::ostream &out_;
  bool eof_ = false;
};

} // namespace uuidfix
