// core/operator.hpp - Operator interaction interface
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace uuidfix {

// The core asks the operator through this interface and never touches the
// console itself.
class Operator {
public:
  virtual ~Operator() = default;

  // Index into options, or nullopt when the answer was not a valid choice.
  virtual std::optional<size_t> select(const std::vector<std::string> &options,
                                       const std::string &hint) = 0;

  // nullopt at end of input.
  virtual std::optional<std::string> read_line(const std::string &hint) = 0;

  // True once no further answers can be read.
  virtual bool at_eof() const = 0;
};

} // namespace uuidfix
