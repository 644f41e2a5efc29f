#ifndef SYNTAX_SYNTAX_GATE_HPP
#define SYNTAX_SYNTAX_GATE_HPP

#include <string>

#include "absl/types/optional.h"

namespace syntax {

struct ValidationOutcome {
  bool valid = true;
  // 1-based line where the problem was detected, if the compiler reported
  // one.
  absl::optional<int> line;
  std::string message;

  // "Syntax error at line N: <message>", or an empty string if valid.
  std::string Describe() const;

  bool operator==(const ValidationOutcome& other) const {
    return valid == other.valid && line == other.line &&
           message == other.message;
  }
};

// Static check of Python source. The source is compiled, not run, by an
// interpreter embedded in this process, so it is rejected exactly when the
// interpreter would refuse to start it. No process or environment is created
// and no code of the program is executed. Safe to call from any thread.
class SyntaxGate {
 public:
  static ValidationOutcome Validate(const std::string& source);
};

}  // namespace syntax

#endif
