#include "syntax/syntax_gate.hpp"

#include <mutex>
#include <utility>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <pybind11/embed.h>
#include <pybind11/pybind11.h>
#pragma GCC diagnostic pop

#include "absl/strings/str_cat.h"

namespace syntax {
namespace {

// Starts the embedded interpreter once per process and releases the GIL, so
// that any thread can acquire it afterwards. The interpreter is never
// finalized.
void EnsureInterpreter() {
  static std::once_flag started;
  std::call_once(started, []() {
    // Signals belong to the host process.
    pybind11::initialize_interpreter(/*init_signal_handlers=*/false);
    PyEval_SaveThread();
  });
}

ValidationOutcome Invalid(absl::optional<int> line, std::string message) {
  ValidationOutcome outcome;
  outcome.valid = false;
  outcome.line = line;
  outcome.message = std::move(message);
  return outcome;
}

}  // namespace

std::string ValidationOutcome::Describe() const {
  if (valid) return "";
  if (!line) return absl::StrCat("Syntax error: ", message);
  return absl::StrCat("Syntax error at line ", *line, ": ", message);
}

ValidationOutcome SyntaxGate::Validate(const std::string& source) {
  EnsureInterpreter();
  pybind11::gil_scoped_acquire acquire;
  try {
    // Bytes, so that coding declarations are honoured as when running a file.
    pybind11::module_::import("builtins")
        .attr("compile")(pybind11::bytes(source), "<program>", "exec", 0,
                         true);
  } catch (pybind11::error_already_set& exc) {
    // IndentationError and TabError are SyntaxErrors too.
    if (exc.matches(PyExc_SyntaxError)) {
      pybind11::object lineno = exc.value().attr("lineno");
      pybind11::object msg = exc.value().attr("msg");
      absl::optional<int> line;
      if (!lineno.is_none()) line = lineno.cast<int>();
      return Invalid(line, msg.is_none()
                               ? std::string(pybind11::str(exc.value()))
                               : std::string(pybind11::str(msg)));
    }
    // Null bytes (ValueError on older interpreters) or sources too deeply
    // nested to compile: the interpreter would not run them either.
    return Invalid(absl::nullopt, std::string(pybind11::str(exc.value())));
  }
  return ValidationOutcome();
}

}  // namespace syntax
