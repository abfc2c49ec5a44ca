// SignatureExtraction.cpp - tests for signature extraction, lookup and argument binding

#include <catch2/catch_test_macros.hpp>

#include "Examples.hpp"

#include <climits>
#include <cstddef>
#include <limits>
#include <string>

namespace
{
  NGIN::Inspect::FunctionInfo InfoOf(std::string_view name)
  {
    InspectExamples::RegisterFunctions();
    return NGIN::Inspect::FunctionInfo::Create(NGIN::Inspect::GetFunction(name).value()).value();
  }

  struct FixedParser final : NGIN::Inspect::DocstringParser
  {
    NGIN::Inspect::ParsedDocstring Parse(std::string_view) const override
    {
      NGIN::Inspect::ParsedDocstring d;
      d.longDescription = "From the custom parser.";
      d.params.push_back({"a", "", "", false});
      d.params.push_back({"c", "", "First c.", false});
      d.params.push_back({"c", "", "Second c.", false});
      return d;
    }
  };
} // namespace

TEST_CASE("SignatureMergesDefaultsTypesAndDocstring", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("example_function");
  REQUIRE(fi.Parameters().size() == 3);
  CHECK(fi.Parameters()[0].Name() == "a");
  CHECK(fi.Parameters()[1].Name() == "b");
  CHECK(fi.Parameters()[2].Name() == "c");

  CHECK(fi.GetParam("a")->Type().IsUnset());
  CHECK(fi.GetParam("b")->Type().IsNone());
  CHECK(fi.GetParam("c")->Type() == DescribeType<int>());

  CHECK(fi.GetParam("a")->Description().value() == "First argument.");
  CHECK(fi.GetParam("b")->Description().value() == "Second argument.");
  CHECK(fi.GetParam("c")->Description().value() == "Third argument.");

  CHECK(fi.Description() == "Example function.");
  CHECK(fi.ReturnType() == DescribeType<int>());
  CHECK(fi.HasDocstring());
  CHECK_FALSE(fi.IsAwaitable());
  CHECK(fi.ToString() == "example_function(a, b: None = None, c: int = 4) -> int");
}

TEST_CASE("SignatureParameterLookupByKey", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("example_function");
  const auto &sig = fi.GetSignature();
  CHECK(sig.GetParam(0)->Name() == "a");
  CHECK(sig.GetParam(-1)->Name() == "c");
  CHECK(sig.GetParam(Any{std::string{"b"}})->Name() == "b");
  CHECK(sig.GetParam(Any{-3})->Name() == "a");
  CHECK(sig.GetParam(Any{2u})->Name() == "c");

  CHECK(sig.GetParam("missing").error().code == ErrorCode::NotFound);
  CHECK(sig.GetParam(3).error().code == ErrorCode::IndexOutOfRange);
  CHECK(sig.GetParam(-4).error().code == ErrorCode::IndexOutOfRange);
  CHECK(sig.GetParam(Any{1.5}).error().code == ErrorCode::InvalidKeyType);
}

TEST_CASE("HugeUnsignedPositionsAreOutOfRange", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("example_function");
  const auto &sig = fi.GetSignature();
  CHECK(sig.GetParam(std::numeric_limits<std::size_t>::max()).error().code == ErrorCode::IndexOutOfRange);
  CHECK(sig.GetParam(std::numeric_limits<std::size_t>::max() - 1).error().code == ErrorCode::IndexOutOfRange);
  CHECK(sig.GetParam(Any{ULLONG_MAX}).error().code == ErrorCode::IndexOutOfRange);
  CHECK(sig.GetParam(Any{ULONG_MAX}).error().code == ErrorCode::IndexOutOfRange);
  CHECK(sig.GetParam(std::size_t{2})->Name() == "c");
  CHECK(sig.GetParam(Any{2ull})->Name() == "c");
}

TEST_CASE("BoolIsNotAPositionKey", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  STATIC_CHECK_FALSE(detail::PositionType<bool>);
  STATIC_CHECK(detail::PositionType<std::size_t>);

  const auto fi = InfoOf("example_function");
  CHECK(fi.GetSignature().GetParam(Any{true}).error().code == ErrorCode::InvalidKeyType);
}

TEST_CASE("FunctionCallFillsDefaults", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("example_function");
  const Any one[] = {Any{1}};
  CHECK(fi.Call(one).value().Cast<int>() == 4);

  const Any all[] = {Any{1}, Any{nullptr}, Any{9}};
  CHECK(fi.Call(all).value().Cast<int>() == 9);

  const Any tooMany[] = {Any{1}, Any{2}, Any{3}, Any{4}};
  CHECK(fi.Call(tooMany).error().code == ErrorCode::InvalidArgument);
  CHECK(fi.Call({}).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("FunctionCallNamedRoutesByName", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("example_function");
  CHECK(fi.CallNamed({{"c", Any{7}}, {"a", Any{0}}}).value().Cast<int>() == 7);
  CHECK(fi.CallNamed({{"a", Any{0}}, {"z", Any{1}}}).error().code == ErrorCode::InvalidArgument);
  CHECK(fi.CallNamed({{"c", Any{7}}}).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("RepeatedKeywordIsRejected", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("example_function");
  const auto out = fi.CallNamed({{"a", Any{0}}, {"c", Any{7}}, {"a", Any{1}}});
  REQUIRE_FALSE(out.has_value());
  CHECK(out.error().code == ErrorCode::InvalidArgument);
  CHECK(out.error().message == "multiple values for keyword argument");
}

TEST_CASE("KeywordOnlyParametersBindByName", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("greet");
  CHECK(fi.GetParam("times")->Kind() == ParameterKind::KeywordOnly);
  CHECK(fi.Description() == "Say hi.");

  const Any name[] = {Any{std::string{"bob"}}};
  CHECK(fi.Call(name).value().Cast<std::string>() == "hi bob;");

  const Any both[] = {Any{std::string{"bob"}}, Any{2}};
  CHECK(fi.Call(both).error().code == ErrorCode::InvalidArgument);

  const auto out = fi.CallNamed({{"name", Any{std::string{"ann"}}}, {"times", Any{2}}});
  CHECK(out.value().Cast<std::string>() == "hi ann;hi ann;");
}

TEST_CASE("ArgSpecAnnotationOverridesCxxType", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("pick_mode");
  const auto type = fi.GetParam("mode")->Type();
  CHECK(IsUnion(type));
  CHECK(IsOrContainsLiteral(type));
  CHECK(GetChoices(type)->size() == 2);
  CHECK_FALSE(fi.HasDocstring());
  CHECK(fi.Description().empty());
  CHECK_FALSE(fi.GetParam("mode")->Description().has_value());
}

TEST_CASE("EnumDefaultsRenderWithTheirValueName", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("paint");
  const auto c = fi.GetParam("c").value();
  CHECK(IsEnum(c.Type()));
  CHECK(c.Default()->display == "Color.Green");
  CHECK(fi.Call({}).value().Cast<InspectExamples::Color>() == InspectExamples::Color::Green);
}

TEST_CASE("AwaitableFunctionsReportTheAwaitedType", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto fi = InfoOf("double_later");
  CHECK(fi.IsAwaitable());
  CHECK(fi.ReturnType() == DescribeType<int>());

  const Any v[] = {Any{21}};
  CHECK(fi.CallAwaitIfNeeded(v).value().Cast<int>() == 42);

  auto pending = fi.Call(v).value();
  CHECK(pending.Cast<std::shared_future<int>>().get() == 42);

  // Plain results pass straight through.
  const Any one[] = {Any{1}};
  CHECK(InfoOf("example_function").CallAwaitIfNeeded(one).value().Cast<int>() == 4);
}

TEST_CASE("ExtractSignatureRejectsInconsistentRecords", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  detail::CallableRuntimeDesc desc{};
  desc.name = "broken";
  desc.paramTypes.PushBack(DescribeType<int>());
  desc.argSpecs.PushBack(Arg("x"));
  desc.argSpecs.PushBack(Arg("y"));
  CHECK(ExtractSignature(desc).error().code == ErrorCode::InvalidArgument);

  detail::CallableRuntimeDesc dup{};
  dup.name = "dup";
  dup.paramTypes.PushBack(DescribeType<int>());
  dup.paramTypes.PushBack(DescribeType<int>());
  dup.argSpecs.PushBack(Arg("x"));
  dup.argSpecs.PushBack(Arg("x"));
  CHECK(ExtractSignature(dup).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("UnnamedParametersArePositionallyNamed", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  detail::CallableRuntimeDesc desc{};
  desc.name = "partial";
  desc.paramTypes.PushBack(DescribeType<int>());
  desc.paramTypes.PushBack(DescribeType<double>());
  desc.argSpecs.PushBack(Arg("first"));
  const auto sig = ExtractSignature(desc).value();
  REQUIRE(sig.ParameterCount() == 2);
  CHECK(sig.Parameters()[1].Name() == "arg1");
  CHECK(sig.Parameters()[1].Type() == DescribeType<double>());
  CHECK(sig.ReturnType().IsUnset());
  CHECK(sig.ToString() == "partial(first: int, arg1: double)");
}

TEST_CASE("CustomDocstringParserFirstNonEmptyEntryWins", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;
  InspectExamples::RegisterFunctions();

  const FixedParser parser;
  SignatureOptions options{};
  options.parser = &parser;
  const auto fi = FunctionInfo::Create(GetFunction("example_function").value(), options).value();
  CHECK(fi.Description() == "From the custom parser.");
  CHECK_FALSE(fi.GetParam("a")->Description().has_value());
  CHECK_FALSE(fi.GetParam("b")->Description().has_value());
  CHECK(fi.GetParam("c")->Description().value() == "First c.");
}

TEST_CASE("SignatureDataProjection", "[inspect][Signature]")
{
  using namespace NGIN::Inspect;

  const auto j = InfoOf("example_function").ToData();
  CHECK(j["name"] == "example_function");
  CHECK(j["kind"] == "function");
  REQUIRE(j["parameters"].size() == 3);
  CHECK(j["parameters"][2]["default"] == 4);
  CHECK(j["return_type"]["display"] == "int");
}
