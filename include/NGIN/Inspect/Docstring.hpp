// Docstring.hpp
// Docstring parser collaborator: raw text in, descriptions and per-parameter entries out
#pragma once

#include <NGIN/Inspect/Export.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace NGIN::Inspect
{

  struct DocstringParam
  {
    std::string name;
    std::string typeName;
    std::string description;
    bool isOptional{false};
  };

  struct ParsedDocstring
  {
    std::string shortDescription;
    std::string longDescription;
    std::vector<DocstringParam> params;
    std::string returns;

    [[nodiscard]] bool Empty() const noexcept
    {
      return shortDescription.empty() && longDescription.empty() && params.empty() && returns.empty();
    }

    // Short description, else long description, else empty.
    [[nodiscard]] const std::string &Description() const noexcept
    {
      return shortDescription.empty() ? longDescription : shortDescription;
    }
  };

  class NGIN_INSPECT_API DocstringParser
  {
  public:
    virtual ~DocstringParser() = default;

    // Never fails; empty or blank input yields an empty result.
    [[nodiscard]] virtual ParsedDocstring Parse(std::string_view raw) const = 0;
  };

  // Google style: summary line, free text, then "Args:" / "Returns:" style sections.
  class NGIN_INSPECT_API GoogleDocstringParser final : public DocstringParser
  {
  public:
    [[nodiscard]] ParsedDocstring Parse(std::string_view raw) const override;
  };

  [[nodiscard]] NGIN_INSPECT_API const DocstringParser &DefaultDocstringParser() noexcept;

} // namespace NGIN::Inspect
