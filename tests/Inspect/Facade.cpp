// Facade.cpp - tests for the Inspect entry points

#include <catch2/catch_test_macros.hpp>

#include "Examples.hpp"

#include <variant>

TEST_CASE("InspectByNameFindsClassesAndFunctions", "[inspect][Facade]")
{
  using namespace NGIN::Inspect;
  InspectExamples::RegisterFunctions();
  (void)GetType<InspectExamples::ExampleClassA>();

  const auto cls = Inspect("InspectExamples::ExampleClassA");
  REQUIRE(cls.has_value());
  REQUIRE(std::holds_alternative<ClassInfo>(*cls));
  CHECK(std::get<ClassInfo>(*cls).HasMethod("method_1"));

  const auto fn = Inspect("example_function");
  REQUIRE(fn.has_value());
  REQUIRE(std::holds_alternative<FunctionInfo>(*fn));
  CHECK(std::get<FunctionInfo>(*fn).Parameters().size() == 3);

  CHECK(Inspect("does::not::exist").error().code == ErrorCode::UnsupportedObject);
}

TEST_CASE("InspectHandlesAndInstances", "[inspect][Facade]")
{
  using namespace NGIN::Inspect;
  InspectExamples::RegisterFunctions();

  CHECK(Inspect(GetFunction("greet").value())->Name() == "greet");
  CHECK(Inspect(Function{}).error().code == ErrorCode::UnsupportedObject);
  CHECK(Inspect(Type{}).error().code == ErrorCode::UnsupportedObject);

  CHECK(Inspect<InspectExamples::Opaque>()->HasMethod("answer"));

  InspectExamples::ExampleDerived obj{2};
  auto info = Inspect(obj).value();
  CHECK(info.IsInitialized());
  CHECK(info.CallMethod("value").value().Cast<int>() == 2);
}

TEST_CASE("InspectOptionsReachTheBuiltMetadata", "[inspect][Facade]")
{
  using namespace NGIN::Inspect;
  (void)GetType<InspectExamples::ExampleDerived>();

  InspectOptions options{};
  options.classes.filter.privateMembers = true;
  const auto r = Inspect("InspectExamples::ExampleDerived", options);
  REQUIRE(r.has_value());
  CHECK(std::get<ClassInfo>(*r).HasMethod("_ExampleDerived__private_method"));
  CHECK(LibraryName() == "NGIN.Inspect");
  STATIC_CHECK(LibraryName() == "NGIN.Inspect");
}
