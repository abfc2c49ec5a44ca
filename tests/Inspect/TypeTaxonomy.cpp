// TypeTaxonomy.cpp - tests for TypeDescriptor classification and rendering

#include <catch2/catch_test_macros.hpp>

#include "Examples.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace
{
  using NGIN::Inspect::ChoiceValue;

  ChoiceValue Str(const char *s) { return ChoiceValue{std::string{s}}; }
  ChoiceValue Int(std::int64_t v) { return ChoiceValue{v}; }
} // namespace

TEST_CASE("FlattenUnionIsIdempotentAndOrderPreserving", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto i = DescribeType<int>();
  const auto s = DescribeType<std::string>();
  const auto d = DescribeType<double>();
  const auto inner = TypeDescriptor::MakeUnion({s, i});
  const auto nested = TypeDescriptor::MakeUnion({i, inner, TypeDescriptor::MakeUnion({d, s})});

  const auto once = FlattenUnion(nested);
  REQUIRE(IsUnion(once));
  REQUIRE(once.Branches().size() == 3);
  CHECK(once.Branches()[0] == i);
  CHECK(once.Branches()[1] == s);
  CHECK(once.Branches()[2] == d);
  for (const auto &b : once.Branches())
    CHECK_FALSE(IsUnion(b));

  CHECK(FlattenUnion(once) == once);
  CHECK(FlattenUnion(i) == i);
}

TEST_CASE("SingleBranchUnionIsStillAUnionUntilTheCallerCollapses", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto i = DescribeType<int>();
  const auto u = UnionOf({i, i});
  CHECK(IsUnion(u));
  CHECK(u.Branches().size() == 1);

  // std::variant normalizes X | X to X before classification.
  const auto v = DescribeType<std::variant<int, int>>();
  CHECK_FALSE(IsUnion(v));
  CHECK(v == i);
}

TEST_CASE("OptionalLiteralContainsButIsNotADirectLiteral", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto t = DescribeType<std::optional<Literal<"a", "b">>>();
  REQUIRE(IsUnion(t));
  CHECK(IsOrContainsLiteral(t));
  CHECK_FALSE(IsDirectLiteral(t));

  const auto choices = GetChoices(t);
  REQUIRE(choices.has_value());
  CHECK(*choices == std::vector<ChoiceValue>{Str("a"), Str("b")});
  CHECK(RenderName(t) == "Literal['a', 'b'] | None");
  CHECK(SimplifiedTypeName(RenderName(t)) == "Literal['a', 'b']?");
}

TEST_CASE("GetChoicesConcatenatesLiteralAndEnumBranches", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;
  using InspectExamples::Color;

  const auto lit = DescribeType<Literal<"Red", 7, true>>();
  const auto en = DescribeType<Color>();
  const auto u = UnionOf({lit, DescribeType<int>(), en});

  const auto choices = GetChoices(u);
  REQUIRE(choices.has_value());
  const std::vector<ChoiceValue> want{Str("Red"), Int(7), ChoiceValue{true}, Str("Green"), Str("Blue")};
  CHECK(*choices == want);

  CHECK(IsEnum(en));
  CHECK(GetChoices(en)->size() == 3);
  CHECK(GetEnumChoices(en).value() == std::vector<std::string>{"Red", "Green", "Blue"});
  CHECK(GetEnumChoices(lit).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("GetChoicesIsEmptyForUnionsWithoutChoicesAndAbsentOtherwise", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto u = DescribeType<std::variant<int, std::string>>();
  REQUIRE(GetChoices(u).has_value());
  CHECK(GetChoices(u)->empty());
  CHECK_FALSE(GetChoices(DescribeType<int>()).has_value());
  CHECK_FALSE(GetChoices(TypeDescriptor{}).has_value());
}

TEST_CASE("UnparametrizedLiteralMarkerIsNotADirectLiteral", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto marker = DescribeType<Literal<>>();
  CHECK_FALSE(IsDirectLiteral(marker));
  CHECK_FALSE(IsOrContainsLiteral(marker));
  CHECK(RenderName(marker) == "Literal");
}

TEST_CASE("LiteralContainsAndLiteralChoicesReportMisuse", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto lit = DescribeType<Literal<1, 2, 3>>();
  CHECK(LiteralContains(lit, Int(2)).value());
  CHECK_FALSE(LiteralContains(lit, Int(5)).value());
  CHECK(LiteralContains(DescribeType<int>(), Int(1)).error().code == ErrorCode::InvalidArgument);
  CHECK(LiteralContains(TypeDescriptor::MakeLiteral({}), Int(1)).error().code == ErrorCode::InvalidArgument);

  CHECK(GetLiteralChoices(DescribeType<std::optional<Literal<1, 2, 3>>>()).value().size() == 3);
  CHECK_FALSE(GetLiteralChoices(DescribeType<double>()).has_value());
}

TEST_CASE("GenericContainersExposeOriginAndArguments", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto t = DescribeType<std::map<std::string, std::vector<int>>>();
  REQUIRE(IsGenericContainer(t));
  CHECK(t.QualifiedName() == "std::map");
  REQUIRE(TypeArgs(t).size() == 2);
  CHECK(TypeArgs(t)[1] == DescribeType<std::vector<int>>());
  CHECK(TypeOrigin(t)->QualifiedName() == "std::map");
  CHECK(RenderName(t) == "map<string, vector<int>>");

  CHECK(IsMappingType(t));
  CHECK(IsIterableType(t));
  CHECK(IsIterableType(DescribeType<std::vector<int>>()));
  CHECK(IsIterableType(DescribeType<std::string>()));
  CHECK_FALSE(IsMappingType(DescribeType<std::vector<int>>()));
  CHECK_FALSE(IsIterableType(DescribeType<int>()));
  CHECK_FALSE(TypeOrigin(DescribeType<int>()).has_value());
}

TEST_CASE("SimplifyCollapsesToOrigins", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto list = Simplify(DescribeType<std::vector<int>>());
  REQUIRE(list.size() == 1);
  CHECK(list[0].QualifiedName() == "std::vector");
  CHECK_FALSE(IsGenericContainer(list[0]));

  const auto tuple = Simplify(DescribeType<std::variant<std::vector<int>, std::map<int, int>, double>>());
  REQUIRE(tuple.size() == 3);
  CHECK(tuple[0].QualifiedName() == "std::vector");
  CHECK(tuple[1].QualifiedName() == "std::map");
  CHECK(tuple[2] == DescribeType<double>());
}

TEST_CASE("NoneIsDistinctFromUnset", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const TypeDescriptor unset{};
  const auto none = DescribeType<std::nullptr_t>();
  CHECK(unset.IsUnset());
  CHECK_FALSE(none.IsUnset());
  CHECK(none.IsNone());
  CHECK(DescribeType<void>() == none);
  CHECK_FALSE(unset == none);
  CHECK(RenderName(unset) == Unset::DisplayName);
  CHECK(DescribeType<Any>().IsUnset());
}

TEST_CASE("RenderNameStripsQualification", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  CHECK(StripQualification("InspectExamples::ExampleClassA") == "ExampleClassA");
  CHECK(StripQualification("std::vector<ns::Thing>") == "vector<Thing>");
  CHECK(RenderName(DescribeType<InspectExamples::ExampleClassA>()) == "ExampleClassA");
  CHECK(RenderName(DescribeType<std::optional<int>>()) == "int | None");
  CHECK(SimplifiedTypeName("int | None") == "int?");
  CHECK(SimplifiedTypeName("std::string") == "string");
}

TEST_CASE("TypeDescriptorDataProjection", "[inspect][TypeTaxonomy]")
{
  using namespace NGIN::Inspect;

  const auto j = ToData(DescribeType<std::optional<Literal<"x">>>());
  CHECK(j["kind"] == "union");
  REQUIRE(j["branches"].size() == 2);
  CHECK(j["branches"][0]["kind"] == "literal");
  CHECK(j["branches"][0]["values"][0] == "x");
  CHECK(j["display"] == "Literal['x'] | None");
}
