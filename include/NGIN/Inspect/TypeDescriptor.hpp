// TypeDescriptor.hpp
// Closed, tagged representation of a type annotation and the taxonomy queries over it
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace NGIN::Inspect
{

  enum class TypeKind : NGIN::UInt8
  {
    Unset = 0,
    Plain = 1,
    Union = 2,
    Generic = 3,
    Literal = 4,
    Enum = 5,
  };

  // A literal value or an enum member name.
  using ChoiceValue = std::variant<bool, std::int64_t, std::string>;

  class NGIN_INSPECT_API TypeDescriptor
  {
  public:
    // Default-constructed descriptors are Unset.
    TypeDescriptor() = default;

    [[nodiscard]] static TypeDescriptor MakePlain(std::string_view qualifiedName, NGIN::UInt64 typeId = 0);
    [[nodiscard]] static TypeDescriptor MakeNone();
    // Branches are flattened and de-duplicated in first-seen order. A single surviving
    // branch still yields a Union; collapsing X | X to X is the caller's job.
    [[nodiscard]] static TypeDescriptor MakeUnion(const std::vector<TypeDescriptor> &branches);
    [[nodiscard]] static TypeDescriptor MakeGeneric(std::string_view originName, std::vector<TypeDescriptor> args);
    [[nodiscard]] static TypeDescriptor MakeLiteral(std::vector<ChoiceValue> values);
    [[nodiscard]] static TypeDescriptor MakeEnum(std::string_view qualifiedName, NGIN::UInt64 typeId, std::vector<std::string> names);

    [[nodiscard]] TypeKind Kind() const noexcept { return m_kind; }
    [[nodiscard]] bool IsUnset() const noexcept { return m_kind == TypeKind::Unset; }
    [[nodiscard]] bool IsNone() const noexcept;

    // Plain/Enum: the type name. Generic: the origin name. Empty otherwise.
    [[nodiscard]] std::string_view QualifiedName() const noexcept { return m_name; }
    [[nodiscard]] NGIN::UInt64 TypeId() const noexcept { return m_typeId; }

    [[nodiscard]] const std::vector<TypeDescriptor> &Branches() const noexcept { return m_children; }
    [[nodiscard]] const std::vector<TypeDescriptor> &Args() const noexcept { return m_children; }
    [[nodiscard]] const std::vector<ChoiceValue> &LiteralValues() const noexcept { return m_values; }
    [[nodiscard]] const std::vector<std::string> &EnumNames() const noexcept { return m_enumNames; }

    [[nodiscard]] bool operator==(const TypeDescriptor &other) const;

  private:
    TypeKind m_kind{TypeKind::Unset};
    std::string m_name{};
    NGIN::UInt64 m_typeId{0};
    std::vector<TypeDescriptor> m_children{};
    std::vector<ChoiceValue> m_values{};
    std::vector<std::string> m_enumNames{};
  };

  inline constexpr std::string_view NoneTypeName{"None"};
  inline constexpr std::string_view LiteralMarkerName{"Literal"};

  // ---- Taxonomy ----

  [[nodiscard]] NGIN_INSPECT_API bool IsUnion(const TypeDescriptor &t) noexcept;
  [[nodiscard]] NGIN_INSPECT_API TypeDescriptor UnionOf(const std::vector<TypeDescriptor> &branches);
  [[nodiscard]] NGIN_INSPECT_API TypeDescriptor FlattenUnion(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API bool IsGenericContainer(const TypeDescriptor &t) noexcept;
  [[nodiscard]] NGIN_INSPECT_API bool IsDirectLiteral(const TypeDescriptor &t) noexcept;
  [[nodiscard]] NGIN_INSPECT_API bool IsOrContainsLiteral(const TypeDescriptor &t) noexcept;
  [[nodiscard]] NGIN_INSPECT_API bool IsEnum(const TypeDescriptor &t) noexcept;
  [[nodiscard]] NGIN_INSPECT_API bool IsIterableType(const TypeDescriptor &t) noexcept;
  [[nodiscard]] NGIN_INSPECT_API bool IsMappingType(const TypeDescriptor &t) noexcept;

  [[nodiscard]] NGIN_INSPECT_API std::optional<std::vector<ChoiceValue>> GetChoices(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API std::expected<std::vector<ChoiceValue>, Error> GetLiteralChoices(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API std::expected<std::vector<std::string>, Error> GetEnumChoices(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API std::expected<bool, Error> LiteralContains(const TypeDescriptor &t, const ChoiceValue &value);

  // Parametrized types collapse to their origin; a union yields one entry per branch.
  [[nodiscard]] NGIN_INSPECT_API std::vector<TypeDescriptor> Simplify(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API std::optional<TypeDescriptor> TypeOrigin(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API std::vector<TypeDescriptor> TypeArgs(const TypeDescriptor &t);

  [[nodiscard]] NGIN_INSPECT_API std::string StripQualification(std::string_view name);
  [[nodiscard]] NGIN_INSPECT_API std::string RenderName(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API std::string SimplifiedTypeName(std::string_view renderedName);
  [[nodiscard]] NGIN_INSPECT_API std::string RenderChoice(const ChoiceValue &value);

  [[nodiscard]] NGIN_INSPECT_API nlohmann::json ToData(const TypeDescriptor &t);
  [[nodiscard]] NGIN_INSPECT_API nlohmann::json ToData(const ChoiceValue &value);

  // ---- Compile-time literal sets ----

  // Structural literal argument: Literal<"fast", "slow">, Literal<1, 2, 3>, Literal<true>.
  struct LiteralArg
  {
    static constexpr NGIN::UIntSize MaxText = 64;

    NGIN::UInt8 kind{0}; // 0 = bool, 1 = integer, 2 = string
    bool boolean{false};
    std::int64_t integer{0};
    char text[MaxText]{};
    NGIN::UIntSize length{0};

    template <class I>
    requires std::is_integral_v<I>
    constexpr LiteralArg(I v)
    {
      if constexpr (std::is_same_v<I, bool>)
      {
        kind = 0;
        boolean = v;
      }
      else
      {
        kind = 1;
        integer = static_cast<std::int64_t>(v);
      }
    }

    template <NGIN::UIntSize N>
    constexpr LiteralArg(const char (&s)[N])
    {
      static_assert(N <= MaxText, "literal string too long");
      kind = 2;
      for (NGIN::UIntSize i = 0; i + 1 < N; ++i)
        text[i] = s[i];
      length = N - 1;
    }

    [[nodiscard]] ChoiceValue ToChoice() const
    {
      switch (kind)
      {
        case 0: return ChoiceValue{boolean};
        case 1: return ChoiceValue{integer};
        default: return ChoiceValue{std::string{text, length}};
      }
    }
  };

  template <LiteralArg... Values>
  struct Literal
  {
  };

  // Customization point: specialize to describe a type not covered by the built-in mapping.
  // template<> struct TypeDescriptorTraits<MyType> { static TypeDescriptor Describe(); };
  template <class T, class = void>
  struct TypeDescriptorTraits;

  template <class T>
  TypeDescriptor DescribeType();

} // namespace NGIN::Inspect
