#include <NGIN/Inspect/Inspect.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace Demo
{
  std::string Fetch(std::string url, int retries, std::optional<std::string> proxy)
  {
    return url + " x" + std::to_string(retries) + (proxy ? " via " + *proxy : "");
  }
} // namespace Demo

int main()
{
  using namespace NGIN::Inspect;
  std::cout << "Library: " << LibraryName() << "\n";

  RegisterFunction<&Demo::Fetch>("fetch",
                                 {Arg("url"), Arg("retries", 3), Arg("proxy", nullptr).Typed<std::optional<std::string>>()},
                                 R"(Fetch a resource.

Args:
    url: Address to read.
    retries: Attempts before giving up.
    proxy (optional): Forwarding host.
)");

  auto result = Inspect("fetch");
  if (!result)
  {
    std::cerr << "inspect failed: " << result.error().message << "\n";
    return 1;
  }
  const auto &fn = std::get<FunctionInfo>(*result);
  std::cout << fn.ToString() << "\n";
  std::cout << "  " << fn.Description() << "\n";
  for (const auto &p : fn.Parameters())
    std::cout << "  " << p.ToString() << " : " << p.Description().value_or("") << "\n";

  const Any args[] = {Any{std::string{"https://example.org"}}};
  auto out = fn.Call(args);
  if (!out)
  {
    std::cerr << "call failed: " << out.error().message << "\n";
    return 1;
  }
  std::cout << "fetch(...) => " << out->Cast<std::string>() << "\n";
  std::cout << fn.ToData().dump(2) << "\n";
  return 0;
}
