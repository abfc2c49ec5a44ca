#include <NGIN/Inspect/Inspect.hpp>
#include <iostream>

namespace Demo
{
  struct Shape
  {
    double Area() const { return 0.0; }

    friend void NginInspect(NGIN::Inspect::Tag<Shape>, NGIN::Inspect::TypeBuilder<Shape> &b)
    {
      b.set_name("Demo::Shape");
      b.method<&Shape::Area>("area");
    }
  };

  struct Rect : Shape
  {
    double w{1.0};
    double h{1.0};

    Rect(double w_, double h_) : w(w_), h(h_) {}

    double Area() const { return w * h; }
    double Scaled(double k) const { return Area() * k; }
    static Rect Unit() { return Rect{1.0, 1.0}; }

    friend void NginInspect(NGIN::Inspect::Tag<Rect>, NGIN::Inspect::TypeBuilder<Rect> &b)
    {
      using NGIN::Inspect::Arg;
      b.set_name("Demo::Rect");
      b.doc("Axis-aligned rectangle.");
      b.base<Shape>();
      b.constructor<double, double>({Arg("w"), Arg("h", 1.0)});
      b.method<&Rect::Area>("area");
      b.method<&Rect::Scaled>("scaled", {Arg("k", 2.0)});
      b.static_method<&Rect::Unit>("unit");
    }
  };
}

int main()
{
  using namespace NGIN::Inspect;

  auto info = ClassInfo::Of<Demo::Rect>().value();
  std::cout << info.ToString() << "\n";

  if (auto r = info.CallMethod("area"); !r)
    std::cout << "area before init: " << r.error().message << "\n";

  const Any ctor[] = {Any{3.0}, Any{4.0}};
  if (auto ok = info.Init(ctor); !ok)
  {
    std::cerr << "init failed: " << ok.error().message << "\n";
    return 1;
  }
  std::cout << "area() => " << info.CallMethod("area").value().Cast<double>() << "\n";
  std::cout << "scaled() => " << info.CallMethod("scaled").value().Cast<double>() << "\n";
  std::cout << "scaled(k=0.5) => " << info.CallMethodNamed("scaled", {{"k", Any{0.5}}}).value().Cast<double>() << "\n";
  return 0;
}
