// Examples.hpp - shared fixtures for the inspection tests
#pragma once

#include <NGIN/Inspect/Inspect.hpp>

#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace InspectExamples
{
  using NGIN::Inspect::Any;
  using NGIN::Inspect::Arg;
  using NGIN::Inspect::Literal;
  using NGIN::Inspect::Tag;
  using NGIN::Inspect::TypeBuilder;

  inline constexpr std::string_view ExampleFunctionDoc = R"(Example function.

Longer text that goes past the summary.

Args:
    a: First argument.
    b (optional): Second argument.
    c (int): Third argument.

Returns:
    The third argument.
)";

  inline int ExampleFunction(Any a, Any b, int c)
  {
    (void)a;
    (void)b;
    return c;
  }

  inline std::string Greet(const std::string &name, int times)
  {
    std::string out;
    for (int i = 0; i < times; ++i)
      out += "hi " + name + ";";
    return out;
  }

  inline std::string PickMode(std::string mode)
  {
    return mode;
  }

  inline std::shared_future<int> DoubleLater(int v)
  {
    std::promise<int> p;
    p.set_value(v * 2);
    return p.get_future().share();
  }

  enum class Color : int
  {
    Red = 1,
    Green = 2,
    Blue = 3,
  };

  inline void NginInspect(Tag<Color>, TypeBuilder<Color> &b)
  {
    b.set_name("InspectExamples::Color");
    b.enum_value("Red", Color::Red);
    b.enum_value("Green", Color::Green);
    b.enum_value("Blue", Color::Blue);
  }

  inline Color Paint(Color c)
  {
    return c;
  }

  struct ExampleClassA
  {
    std::string a;
    int b{0};

    ExampleClassA(std::string a_, int b_) : a(std::move(a_)), b(b_) {}

    std::string method_1() const { return a + std::to_string(b); }

    friend void NginInspect(Tag<ExampleClassA>, TypeBuilder<ExampleClassA> &t)
    {
      t.set_name("InspectExamples::ExampleClassA");
      t.doc("Example class A.\n\nIt joins its two constructor arguments.");
      t.constructor<std::string, int>({Arg("a"), Arg("b")}, R"(Build an A.

Args:
    a: The text part.
    b: The number part.
)");
      t.method<&ExampleClassA::method_1>();
    }
  };

  struct ExampleBase
  {
    int seed{1};

    int inherited_method() const { return seed; }
    int overridden() const { return 10; }

    friend void NginInspect(Tag<ExampleBase>, TypeBuilder<ExampleBase> &t)
    {
      t.set_name("InspectExamples::ExampleBase");
      t.method<&ExampleBase::inherited_method>();
      t.method<&ExampleBase::overridden>();
    }
  };

  struct ExampleDerived : ExampleBase
  {
    int value{5};

    ExampleDerived() = default;
    explicit ExampleDerived(int v) : value(v) {}

    static int static_method(int x) { return x * 2; }
    static std::string class_method(NGIN::Inspect::Type cls, std::string suffix) { return std::string{cls.Name()} + suffix; }
    int ProtectedMethod() const { return value + 1; }
    int PrivateMethod() const { return value + 2; }
    int overridden() const { return 20; }
    int Value() const { return value; }
    std::string Scale(int factor, std::string unit) const { return std::to_string(value * factor) + unit; }

    friend void NginInspect(Tag<ExampleDerived>, TypeBuilder<ExampleDerived> &t)
    {
      t.set_name("InspectExamples::ExampleDerived");
      t.base<ExampleBase>();
      t.constructor<int>({Arg("value", 5)});
      t.static_method<&ExampleDerived::static_method>("static_method", {Arg("x")});
      t.class_method<&ExampleDerived::class_method>("class_method", {Arg("suffix", "")});
      t.method<&ExampleDerived::ProtectedMethod>("_protected_method");
      t.method<&ExampleDerived::PrivateMethod>("__private_method");
      t.method<&ExampleDerived::overridden>();
      t.method<&ExampleDerived::Scale>("scale", {Arg("factor"), Arg("unit", "px")}, R"(Scale the value.

Args:
    factor: Multiplier.
    unit: Suffix appended to the result.
)");
      t.property<&ExampleDerived::Value>("value", "Current value.");
    }
  };

  // No constructor registered and not default-constructible.
  struct Opaque
  {
    explicit Opaque(int) {}

    static int answer() { return 42; }

    friend void NginInspect(Tag<Opaque>, TypeBuilder<Opaque> &t)
    {
      t.set_name("InspectExamples::Opaque");
      t.static_method<&Opaque::answer>("answer");
    }
  };

  struct AsyncWorker
  {
    int base{3};

    std::shared_future<int> compute(int x) const
    {
      std::promise<int> p;
      p.set_value(base + x);
      return p.get_future().share();
    }

    friend void NginInspect(Tag<AsyncWorker>, TypeBuilder<AsyncWorker> &t)
    {
      t.set_name("InspectExamples::AsyncWorker");
      t.constructor<>();
      t.method<&AsyncWorker::compute>("compute", {Arg("x")});
    }
  };

  // Diamond: MRO is Bottom, Left, Right, Top.
  struct Top
  {
    int top() const { return 0; }
    friend void NginInspect(Tag<Top>, TypeBuilder<Top> &t)
    {
      t.set_name("InspectExamples::Top");
      t.method<&Top::top>();
    }
  };
  struct Left : Top
  {
    int side() const { return 1; }
    friend void NginInspect(Tag<Left>, TypeBuilder<Left> &t)
    {
      t.set_name("InspectExamples::Left");
      t.base<Top>();
      t.method<&Left::side>();
    }
  };
  struct Right : Top
  {
    int side() const { return 2; }
    int right() const { return 3; }
    friend void NginInspect(Tag<Right>, TypeBuilder<Right> &t)
    {
      t.set_name("InspectExamples::Right");
      t.base<Top>();
      t.method<&Right::side>();
      t.method<&Right::right>();
    }
  };
  struct Bottom : Left, Right
  {
    friend void NginInspect(Tag<Bottom>, TypeBuilder<Bottom> &t)
    {
      t.set_name("InspectExamples::Bottom");
      t.base<Left>();
      t.base<Right>();
    }
  };

  // X(A, B) and Y(B, A) cannot be merged under Z.
  struct OrderA
  {
    friend void NginInspect(Tag<OrderA>, TypeBuilder<OrderA> &t) { t.set_name("InspectExamples::OrderA"); }
  };
  struct OrderB
  {
    friend void NginInspect(Tag<OrderB>, TypeBuilder<OrderB> &t) { t.set_name("InspectExamples::OrderB"); }
  };
  struct OrderX : OrderA, OrderB
  {
    friend void NginInspect(Tag<OrderX>, TypeBuilder<OrderX> &t)
    {
      t.set_name("InspectExamples::OrderX");
      t.base<OrderA>();
      t.base<OrderB>();
    }
  };
  struct OrderY : OrderB, OrderA
  {
    friend void NginInspect(Tag<OrderY>, TypeBuilder<OrderY> &t)
    {
      t.set_name("InspectExamples::OrderY");
      t.base<OrderB>();
      t.base<OrderA>();
    }
  };
  struct OrderZ : OrderX, OrderY
  {
    friend void NginInspect(Tag<OrderZ>, TypeBuilder<OrderZ> &t)
    {
      t.set_name("InspectExamples::OrderZ");
      t.base<OrderX>();
      t.base<OrderY>();
    }
  };

  inline void RegisterFunctions()
  {
    static bool registered = false;
    if (registered)
      return;
    using namespace NGIN::Inspect;
    RegisterFunction<&ExampleFunction>("example_function", {Arg("a"), Arg("b", nullptr), Arg("c", 4)}, ExampleFunctionDoc);
    RegisterFunction<&Greet>("greet", {Arg("name"), KeywordOnly("times", 1)}, "Say hi.");
    RegisterFunction<&PickMode>("pick_mode", {Arg("mode").Typed<std::optional<Literal<"a", "b">>>()});
    RegisterFunction<&DoubleLater>("double_later", {Arg("v")});
    RegisterFunction<&Paint>("paint", {Arg("c", Color::Green)});
    registered = true;
  }
} // namespace InspectExamples
