#include "stream/filter.hpp"

#include <cctype>

namespace bootstream::stream {

namespace {

using core::errors::Error;
using core::errors::ErrorKind;

bool IsFieldChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' || c == '-';
}

bool MatchesOne(const AttributeMap& attributes, const Filter& filter) {
  const auto it = attributes.find(filter.field);
  if (it == attributes.end()) {
    return false;
  }
  if (filter.op == FilterOperator::kEquals) {
    return it->second == filter.value;
  }
  return filter.pattern != nullptr && std::regex_search(it->second, *filter.pattern);
}

} // namespace

std::string Filter::ToString() const {
  return field + (op == FilterOperator::kEquals ? "=" : "~") + value;
}

bool ParseFilter(std::string_view text, Filter& filter, Error& error) {
  const std::size_t split = text.find_first_of("=~");
  if (split == std::string_view::npos) {
    return error.Set(ErrorKind::kFilterSyntaxError,
                     "filter '" + std::string(text) + "' has no '=' or '~' operator");
  }

  const std::string_view field = text.substr(0, split);
  if (field.empty()) {
    return error.Set(ErrorKind::kFilterSyntaxError,
                     "filter '" + std::string(text) + "' has an empty field name");
  }
  for (const char c : field) {
    if (!IsFieldChar(c)) {
      return error.Set(ErrorKind::kFilterSyntaxError,
                       "filter '" + std::string(text) + "' has invalid field name '" +
                           std::string(field) + "'");
    }
  }

  Filter parsed;
  parsed.field = std::string(field);
  parsed.op = text[split] == '=' ? FilterOperator::kEquals : FilterOperator::kRegexSearch;
  parsed.value = std::string(text.substr(split + 1));

  if (parsed.op == FilterOperator::kRegexSearch) {
    try {
      parsed.pattern = std::make_shared<const std::regex>(parsed.value, std::regex::ECMAScript);
    } catch (const std::regex_error& ex) {
      return error.Set(ErrorKind::kFilterSyntaxError,
                       "filter '" + std::string(text) + "' has invalid pattern: " + ex.what());
    }
  }

  filter = std::move(parsed);
  return true;
}

bool ParseFilters(const std::vector<std::string>& texts, std::vector<Filter>& filters,
                  Error& error) {
  std::vector<Filter> parsed;
  parsed.reserve(texts.size());
  for (const auto& text : texts) {
    Filter filter;
    if (!ParseFilter(text, filter, error)) {
      return false;
    }
    parsed.push_back(std::move(filter));
  }
  filters = std::move(parsed);
  return true;
}

bool Matches(const AttributeMap& attributes, const std::vector<Filter>& filters) {
  for (const auto& filter : filters) {
    if (!MatchesOne(attributes, filter)) {
      return false;
    }
  }
  return true;
}

} // namespace bootstream::stream
