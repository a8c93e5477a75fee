#include "core/json_writer.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string_view>

namespace bootstream::core::json {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0;

void AppendNumber(double number, std::string& out) {
  if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) <= kMaxExactInteger) {
    out += std::to_string(static_cast<std::int64_t>(number));
    return;
  }
  if (!std::isfinite(number)) {
    out += "null";
    return;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.17g", number);
  out += buffer;
}

// Quoted JSON string. Bytes at or above 0x80 pass through untouched.
void AppendQuoted(std::string_view text, std::string& out) {
  out.push_back('"');
  for (const char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned>(c));
        out += escaped;
      } else {
        out.push_back(c);
      }
    }
  }
  out.push_back('"');
}

void AppendNewline(int indent, int depth, std::string& out) {
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent * depth), ' ');
}

void AppendValue(const Value& value, int indent, int depth, std::string& out) {
  switch (value.type) {
  case Value::Type::kNull:
    out += "null";
    return;
  case Value::Type::kBool:
    out += value.bool_value ? "true" : "false";
    return;
  case Value::Type::kNumber:
    AppendNumber(value.number_value, out);
    return;
  case Value::Type::kString:
    AppendQuoted(value.string_value, out);
    return;
  case Value::Type::kArray: {
    if (value.array_value.empty()) {
      out += "[]";
      return;
    }
    out.push_back('[');
    bool first = true;
    for (const auto& item : value.array_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendNewline(indent, depth + 1, out);
      AppendValue(item, indent, depth + 1, out);
    }
    AppendNewline(indent, depth, out);
    out.push_back(']');
    return;
  }
  case Value::Type::kObject: {
    if (value.object_value.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    bool first = true;
    for (const auto& [key, item] : value.object_value) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      AppendNewline(indent, depth + 1, out);
      AppendQuoted(key, out);
      out += ": ";
      AppendValue(item, indent, depth + 1, out);
    }
    AppendNewline(indent, depth, out);
    out.push_back('}');
    return;
  }
  }
}

} // namespace

std::string Serialize(const Value& value, int indent) {
  std::string out;
  AppendValue(value, indent, 0, out);
  return out;
}

} // namespace bootstream::core::json
