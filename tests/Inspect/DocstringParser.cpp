// DocstringParser.cpp - tests for the stock Google-style docstring parser

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Inspect/Docstring.hpp>

TEST_CASE("EmptyDocstringParsesToEmptyResult", "[inspect][Docstring]")
{
  using namespace NGIN::Inspect;

  const auto &parser = DefaultDocstringParser();
  CHECK(parser.Parse("").Empty());
  CHECK(parser.Parse("  \n\n \t\n").Empty());
}

TEST_CASE("DocstringSplitsSummaryAndLongDescription", "[inspect][Docstring]")
{
  using namespace NGIN::Inspect;

  const auto doc = GoogleDocstringParser{}.Parse(R"(
    Fetch rows from a table.

    Rows are returned in key order.
    Missing keys are skipped.
  )");
  CHECK(doc.shortDescription == "Fetch rows from a table.");
  CHECK(doc.longDescription == "Rows are returned in key order. Missing keys are skipped.");
  CHECK(doc.Description() == doc.shortDescription);
  CHECK(doc.params.empty());
}

TEST_CASE("DocstringSummaryIsOnlyTheFirstLine", "[inspect][Docstring]")
{
  using namespace NGIN::Inspect;

  const auto doc = GoogleDocstringParser{}.Parse(R"(Fetch rows
from a table.

Rows are returned in key order.

Args:
    table: Source table.
)");
  CHECK(doc.shortDescription == "Fetch rows");
  CHECK(doc.longDescription == "from a table.\nRows are returned in key order.");
  CHECK(doc.Description() == "Fetch rows");
  REQUIRE(doc.params.size() == 1);
  CHECK(doc.params[0].name == "table");
}

TEST_CASE("DocstringCollectsParameterEntries", "[inspect][Docstring]")
{
  using namespace NGIN::Inspect;

  const auto doc = GoogleDocstringParser{}.Parse(R"(Summary.

Args:
    path (str): Where to read from.
    retries (int, optional): How many attempts.
        Continues on the next line.
    *rest: Extra values.
    flag:

Returns:
    The payload.

Raises:
    IOError: Never listed as a parameter.
)");
  REQUIRE(doc.params.size() == 4);
  CHECK(doc.params[0].name == "path");
  CHECK(doc.params[0].typeName == "str");
  CHECK(doc.params[0].description == "Where to read from.");
  CHECK_FALSE(doc.params[0].isOptional);
  CHECK(doc.params[1].name == "retries");
  CHECK(doc.params[1].typeName == "int");
  CHECK(doc.params[1].isOptional);
  CHECK(doc.params[1].description == "How many attempts.\nContinues on the next line.");
  CHECK(doc.params[2].name == "rest");
  CHECK(doc.params[3].name == "flag");
  CHECK(doc.params[3].description.empty());
  CHECK(doc.returns == "The payload.");
}

TEST_CASE("DocstringWithOnlySectionsHasNoDescription", "[inspect][Docstring]")
{
  using namespace NGIN::Inspect;

  const auto doc = GoogleDocstringParser{}.Parse("Args:\n  x: The x.\n");
  CHECK(doc.Description().empty());
  REQUIRE(doc.params.size() == 1);
  CHECK(doc.params[0].description == "The x.");
}
