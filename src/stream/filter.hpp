#pragma once

#include "core/errors/error.hpp"
#include "stream/model.hpp"

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace bootstream::stream {

enum class FilterOperator {
  kEquals,
  kRegexSearch,
};

// One parsed `field=value` or `field~pattern` predicate.
struct Filter {
  std::string field;
  FilterOperator op = FilterOperator::kEquals;
  std::string value;
  // Compiled once at parse time; shared so Filter stays copyable.
  std::shared_ptr<const std::regex> pattern;

  std::string ToString() const;
};

// Splits at the first '=' or '~'. Field names are [A-Za-z0-9_.-]+.
bool ParseFilter(std::string_view text, Filter& filter, core::errors::Error& error);

// Parses every filter before any product is inspected; the first bad one
// fails the whole set with kFilterSyntaxError.
bool ParseFilters(const std::vector<std::string>& texts, std::vector<Filter>& filters,
                  core::errors::Error& error);

// AND of all filters. An empty set matches everything; a filter naming an
// attribute the product lacks never matches.
bool Matches(const AttributeMap& attributes, const std::vector<Filter>& filters);

} // namespace bootstream::stream
