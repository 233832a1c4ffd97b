#pragma once

#include <cstddef>

// Config: floating-point parsing backend.
// Override by defining JSTREAM_USE_FROM_CHARS_DOUBLE to 0/1 before including jstream headers.
#ifndef JSTREAM_USE_FROM_CHARS_DOUBLE
  #define JSTREAM_USE_FROM_CHARS_DOUBLE 0
#endif

namespace jstream {

struct decode_options {
  // Accept unquoted string literals and keys.
  bool is_lenient{false};
  // Skip object members whose key the descriptor does not know instead of failing.
  bool ignore_unknown_keys{false};
  // Treat `null` for a non-nullable element, or an unknown enum constant, as an absent member.
  bool coerce_input_values{false};
  // Accept NaN and infinities for float/double elements.
  bool allow_special_floating_point_values{false};

  std::size_t max_depth{256};
  bool require_eof{true};
};

} // namespace jstream
