#pragma once

#include <string>
#include <string_view>

#include "tagpack/catalog/type_catalog.hpp"
#include "tagpack/common/error.hpp"
#include "tagpack/layout/layout.hpp"

namespace tagpack::synth {

// Zero literal of a REAL member.
enum class RealLiteralFormat {
  kDecimal,   // 0.0
  kExponent,  // 0.00000000e+000, the controller export form
};

struct SynthesisOptions {
  RealLiteralFormat real_format = RealLiteralFormat::kDecimal;
  int max_nesting_depth = layout::kDefaultMaxNestingDepth;
};

// Default (all-zero) literal text of a type, e.g. "[0,0.0,[0,0,0]]".
//
// Composites are bracketed lists of their storage members in declaration
// order. Within one composite only the first BOOL of every 32-bit group
// contributes an entry; the group's later booleans share it. A composite
// at `depth` >= max_nesting_depth fails with MaxNestingDepthExceeded.
auto SynthesizeDefault(
    const catalog::TypeCatalog& catalog, std::string_view type_name,
    const SynthesisOptions& options = {}, int depth = 0)
    -> Result<std::string>;

// Literal of one member, repeating the element literal for arrays.
// `depth` is the nesting level of the member's own type, so a standalone
// tag of a composite type is synthesized at depth 0.
auto SynthesizeMemberDefault(
    const catalog::TypeCatalog& catalog, const catalog::FieldDescriptor& field,
    const SynthesisOptions& options = {}, int depth = 0)
    -> Result<std::string>;

auto ToString(RealLiteralFormat format) -> const char*;

}  // namespace tagpack::synth
