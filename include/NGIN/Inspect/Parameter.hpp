// Parameter.hpp
// One parameter of a callable: identity, type, default and description
#pragma once

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/TypeDescriptor.hpp>
#include <NGIN/Inspect/Types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace NGIN::Inspect
{

  // A boxed default together with the descriptor of its runtime type.
  struct DefaultValue
  {
    Any value{};
    TypeDescriptor type{};
    std::string display{};
    nlohmann::json data{};
  };

  namespace detail
  {
    // Defined in DescribeType.hpp once the registry is visible.
    template <class V>
    DefaultValue MakeDefaultValue(V &&v);
  } // namespace detail

  // Registration-time description of one parameter.
  struct ArgSpec
  {
    std::string_view name{};
    ParameterKind kind{ParameterKind::PositionalOrKeyword};
    std::optional<DefaultValue> defaultValue{};
    std::optional<TypeDescriptor> annotation{};

    // Override the annotation derived from the C++ parameter type.
    template <class T>
    [[nodiscard]] ArgSpec Typed() const
    {
      ArgSpec copy = *this;
      copy.annotation = DescribeType<T>();
      return copy;
    }
  };

  [[nodiscard]] inline ArgSpec Arg(std::string_view name)
  {
    return ArgSpec{name};
  }

  template <class V>
  [[nodiscard]] ArgSpec Arg(std::string_view name, V &&defaultValue)
  {
    return ArgSpec{name, ParameterKind::PositionalOrKeyword, detail::MakeDefaultValue(std::forward<V>(defaultValue))};
  }

  [[nodiscard]] inline ArgSpec PositionalOnly(std::string_view name)
  {
    return ArgSpec{name, ParameterKind::PositionalOnly};
  }

  template <class V>
  [[nodiscard]] ArgSpec PositionalOnly(std::string_view name, V &&defaultValue)
  {
    return ArgSpec{name, ParameterKind::PositionalOnly, detail::MakeDefaultValue(std::forward<V>(defaultValue))};
  }

  [[nodiscard]] inline ArgSpec KeywordOnly(std::string_view name)
  {
    return ArgSpec{name, ParameterKind::KeywordOnly};
  }

  template <class V>
  [[nodiscard]] ArgSpec KeywordOnly(std::string_view name, V &&defaultValue)
  {
    return ArgSpec{name, ParameterKind::KeywordOnly, detail::MakeDefaultValue(std::forward<V>(defaultValue))};
  }

  [[nodiscard]] inline ArgSpec VarPositional(std::string_view name)
  {
    return ArgSpec{name, ParameterKind::VarPositional};
  }

  [[nodiscard]] inline ArgSpec VarKeyword(std::string_view name)
  {
    return ArgSpec{name, ParameterKind::VarKeyword};
  }

  class NGIN_INSPECT_API Parameter
  {
  public:
    // When no explicit type is given and a default is present, the type is taken from the
    // default's runtime type. This happens here, once.
    explicit Parameter(std::string name,
                       ParameterKind kind = ParameterKind::PositionalOrKeyword,
                       TypeDescriptor type = {},
                       std::optional<DefaultValue> defaultValue = std::nullopt,
                       std::optional<std::string> description = std::nullopt,
                       bool inferType = true);

    [[nodiscard]] const std::string &Name() const noexcept { return m_name; }
    [[nodiscard]] ParameterKind Kind() const noexcept { return m_kind; }
    [[nodiscard]] const TypeDescriptor &Type() const noexcept { return m_type; }
    [[nodiscard]] const std::optional<DefaultValue> &Default() const noexcept { return m_default; }
    [[nodiscard]] const std::optional<std::string> &Description() const noexcept { return m_description; }

    [[nodiscard]] bool IsTyped() const noexcept { return !m_type.IsUnset(); }
    [[nodiscard]] bool HasDefault() const noexcept { return m_default.has_value(); }
    [[nodiscard]] bool IsRequired() const noexcept { return !HasDefault(); }
    [[nodiscard]] bool IsOptional() const noexcept { return HasDefault(); }

    [[nodiscard]] Parameter WithDescription(std::string description) const;

    // name: type = default
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] nlohmann::json ToData() const;

  private:
    std::string m_name;
    ParameterKind m_kind;
    TypeDescriptor m_type;
    std::optional<DefaultValue> m_default;
    std::optional<std::string> m_description;
  };

} // namespace NGIN::Inspect
