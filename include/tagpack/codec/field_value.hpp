#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "tagpack/catalog/atomic_kind.hpp"
#include "tagpack/common/error.hpp"

namespace tagpack::codec {

// Decoded field value. Integer kinds decode to int64_t (sign-extended),
// Real32 to the double holding the exact float, Bool to bool.
using FieldValue = std::variant<bool, int64_t, double>;

// Parse controller value text for a field of the given kind.
//
// Bool: 0, 1, true, false (any case).
// Integers: [+-]digits, or a radix literal 2#..., 8#..., 16#... (underscores
//   allowed) read as the field's bit pattern, so SINT 16#FF is -1.
// Real32: decimal or exponent notation, inf and nan.
auto ParseValue(catalog::AtomicKind kind, std::string_view text)
    -> Result<FieldValue>;

// Bool as 0/1, integers in decimal, Real32 as the shortest text that
// round-trips the float.
auto FormatValue(const FieldValue& value) -> std::string;

}  // namespace tagpack::codec
