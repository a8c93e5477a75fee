#ifndef BOOTSTREAM_CORE_JSON_WRITER_HPP_
#define BOOTSTREAM_CORE_JSON_WRITER_HPP_

#include "core/json_dom.hpp"

#include <string>

namespace bootstream::core::json {

// Deterministic serializer for stream documents.
//
// Contract:
// - object keys are emitted in sorted order (std::map order)
// - nested containers are indented by `indent` spaces per level
// - integral numbers up to 2^53 print without fraction or exponent
// - empty containers print as `{}` / `[]`
// - no trailing newline; callers append one when writing files
std::string Serialize(const Value& value, int indent = 1);

} // namespace bootstream::core::json

#endif // BOOTSTREAM_CORE_JSON_WRITER_HPP_
