#include "stream/filter.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using bootstream::core::errors::Error;
using bootstream::core::errors::ErrorKind;
using bootstream::stream::AttributeMap;
using bootstream::stream::Filter;
using bootstream::stream::FilterOperator;
using bootstream::stream::Matches;
using bootstream::stream::ParseFilters;

namespace {

std::vector<Filter> MustParse(const std::vector<std::string>& texts) {
  std::vector<Filter> filters;
  Error error;
  REQUIRE(ParseFilters(texts, filters, error));
  return filters;
}

const AttributeMap kBionicAmd64 = {{"release", "bionic"}, {"arch", "amd64"}, {"os", "ubuntu"}};
const AttributeMap kFocalArm64 = {{"release", "focal"}, {"arch", "arm64"}, {"os", "ubuntu"}};

} // namespace

TEST_CASE("Filters split at the first operator", "[stream][filter]") {
  const auto filters = MustParse({"label=a=b", "release~^(bionic|xenial)$", "kflavor=a~b"});
  REQUIRE(filters[0].field == "label");
  REQUIRE(filters[0].op == FilterOperator::kEquals);
  REQUIRE(filters[0].value == "a=b");
  REQUIRE(filters[1].op == FilterOperator::kRegexSearch);
  REQUIRE(filters[1].pattern != nullptr);
  REQUIRE(filters[2].value == "a~b");
  REQUIRE(filters[1].ToString() == "release~^(bionic|xenial)$");
}

TEST_CASE("Empty filter set matches every product", "[stream][filter]") {
  REQUIRE(Matches(kBionicAmd64, {}));
  REQUIRE(Matches(AttributeMap{}, {}));
}

TEST_CASE("Equality is exact and case sensitive", "[stream][filter]") {
  REQUIRE(Matches(kBionicAmd64, MustParse({"arch=amd64"})));
  REQUIRE_FALSE(Matches(kBionicAmd64, MustParse({"arch=AMD64"})));
  REQUIRE_FALSE(Matches(kBionicAmd64, MustParse({"arch=amd"})));
}

TEST_CASE("Regex filters search within the value", "[stream][filter]") {
  REQUIRE(Matches(kBionicAmd64, MustParse({"release~(bionic|xenial)"})));
  REQUIRE(Matches(kBionicAmd64, MustParse({"release~oni"})));
  REQUIRE_FALSE(Matches(kFocalArm64, MustParse({"release~(bionic|xenial)"})));
}

TEST_CASE("Filters combine with AND", "[stream][filter]") {
  const auto filters = MustParse({"release~(bionic|focal)", "arch=amd64"});
  REQUIRE(Matches(kBionicAmd64, filters));
  REQUIRE_FALSE(Matches(kFocalArm64, filters));
}

TEST_CASE("Unknown fields match nothing", "[stream][filter]") {
  REQUIRE_FALSE(Matches(kBionicAmd64, MustParse({"kflavor=generic"})));
  REQUIRE_FALSE(Matches(kBionicAmd64, MustParse({"kflavor~.*"})));
}

TEST_CASE("Malformed filters fail with FilterSyntaxError", "[stream][filter]") {
  const std::vector<std::vector<std::string>> bad = {
      {"release"},
      {"=bionic"},
      {"rel ease=bionic"},
      {"release~(bionic"},
      {"arch=amd64", "release~[z-a]"},
  };
  for (const auto& texts : bad) {
    std::vector<Filter> filters;
    Error error;
    REQUIRE_FALSE(ParseFilters(texts, filters, error));
    REQUIRE(error.kind == ErrorKind::kFilterSyntaxError);
    REQUIRE(filters.empty());
  }
}
