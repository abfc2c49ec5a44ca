#include <NGIN/Inspect/TypeDescriptor.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace NGIN::Inspect
{

  namespace
  {
    void AppendFlattened(std::vector<TypeDescriptor> &out, const TypeDescriptor &t)
    {
      if (t.Kind() == TypeKind::Union)
      {
        for (const auto &b : t.Branches())
          AppendFlattened(out, b);
        return;
      }
      if (std::find(out.begin(), out.end(), t) == out.end())
        out.push_back(t);
    }

    void AppendChoices(std::vector<ChoiceValue> &out, const std::vector<ChoiceValue> &src)
    {
      for (const auto &v : src)
      {
        if (std::find(out.begin(), out.end(), v) == out.end())
          out.push_back(v);
      }
    }

    bool IsIdentChar(char c) noexcept
    {
      return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    std::string_view BareOrigin(const TypeDescriptor &t)
    {
      std::string_view name = t.QualifiedName();
      const auto lt = name.find('<');
      if (lt != std::string_view::npos)
        name = name.substr(0, lt);
      const auto dc = name.rfind("::");
      if (dc != std::string_view::npos)
        name = name.substr(dc + 2);
      return name;
    }

    constexpr std::array<std::string_view, 16> kIterableOrigins{
        "vector", "deque", "list", "forward_list", "array", "span", "set", "multiset",
        "unordered_set", "unordered_multiset", "map", "multimap", "unordered_map",
        "unordered_multimap", "tuple", "basic_string",
    };

    constexpr std::array<std::string_view, 4> kMappingOrigins{
        "map", "multimap", "unordered_map", "unordered_multimap",
    };

    template <std::size_t N>
    bool OriginIn(const TypeDescriptor &t, const std::array<std::string_view, N> &set)
    {
      if (t.Kind() != TypeKind::Plain && t.Kind() != TypeKind::Generic)
        return false;
      const auto origin = BareOrigin(t);
      if (origin == "string")
        return std::find(set.begin(), set.end(), std::string_view{"basic_string"}) != set.end();
      return std::find(set.begin(), set.end(), origin) != set.end();
    }
  } // namespace

  TypeDescriptor TypeDescriptor::MakePlain(std::string_view qualifiedName, NGIN::UInt64 typeId)
  {
    TypeDescriptor t;
    t.m_kind = TypeKind::Plain;
    t.m_name = std::string{qualifiedName};
    t.m_typeId = typeId;
    return t;
  }

  TypeDescriptor TypeDescriptor::MakeNone()
  {
    return MakePlain(NoneTypeName);
  }

  TypeDescriptor TypeDescriptor::MakeUnion(const std::vector<TypeDescriptor> &branches)
  {
    TypeDescriptor t;
    t.m_kind = TypeKind::Union;
    for (const auto &b : branches)
      AppendFlattened(t.m_children, b);
    return t;
  }

  TypeDescriptor TypeDescriptor::MakeGeneric(std::string_view originName, std::vector<TypeDescriptor> args)
  {
    TypeDescriptor t;
    t.m_kind = TypeKind::Generic;
    t.m_name = std::string{originName};
    t.m_children = std::move(args);
    return t;
  }

  TypeDescriptor TypeDescriptor::MakeLiteral(std::vector<ChoiceValue> values)
  {
    TypeDescriptor t;
    t.m_kind = TypeKind::Literal;
    t.m_name = std::string{LiteralMarkerName};
    t.m_values = std::move(values);
    return t;
  }

  TypeDescriptor TypeDescriptor::MakeEnum(std::string_view qualifiedName, NGIN::UInt64 typeId, std::vector<std::string> names)
  {
    TypeDescriptor t;
    t.m_kind = TypeKind::Enum;
    t.m_name = std::string{qualifiedName};
    t.m_typeId = typeId;
    t.m_enumNames = std::move(names);
    return t;
  }

  bool TypeDescriptor::IsNone() const noexcept
  {
    return m_kind == TypeKind::Plain && m_name == NoneTypeName;
  }

  bool TypeDescriptor::operator==(const TypeDescriptor &other) const
  {
    if (m_kind != other.m_kind)
      return false;
    switch (m_kind)
    {
      case TypeKind::Unset:
        return true;
      case TypeKind::Plain:
      case TypeKind::Enum:
        if (m_typeId != 0 && other.m_typeId != 0)
          return m_typeId == other.m_typeId;
        return m_name == other.m_name;
      case TypeKind::Union:
      case TypeKind::Generic:
        return m_name == other.m_name && m_children == other.m_children;
      case TypeKind::Literal:
        return m_values == other.m_values;
    }
    return false;
  }

  bool IsUnion(const TypeDescriptor &t) noexcept
  {
    return t.Kind() == TypeKind::Union;
  }

  TypeDescriptor UnionOf(const std::vector<TypeDescriptor> &branches)
  {
    return TypeDescriptor::MakeUnion(branches);
  }

  TypeDescriptor FlattenUnion(const TypeDescriptor &t)
  {
    if (!IsUnion(t))
      return t;
    return TypeDescriptor::MakeUnion(t.Branches());
  }

  bool IsGenericContainer(const TypeDescriptor &t) noexcept
  {
    return t.Kind() == TypeKind::Generic;
  }

  bool IsDirectLiteral(const TypeDescriptor &t) noexcept
  {
    return t.Kind() == TypeKind::Literal;
  }

  bool IsOrContainsLiteral(const TypeDescriptor &t) noexcept
  {
    if (IsDirectLiteral(t))
      return true;
    if (!IsUnion(t))
      return false;
    for (const auto &b : t.Branches())
    {
      if (IsOrContainsLiteral(b))
        return true;
    }
    return false;
  }

  bool IsEnum(const TypeDescriptor &t) noexcept
  {
    return t.Kind() == TypeKind::Enum;
  }

  bool IsIterableType(const TypeDescriptor &t) noexcept
  {
    return OriginIn(t, kIterableOrigins);
  }

  bool IsMappingType(const TypeDescriptor &t) noexcept
  {
    return OriginIn(t, kMappingOrigins);
  }

  std::optional<std::vector<ChoiceValue>> GetChoices(const TypeDescriptor &t)
  {
    if (IsDirectLiteral(t))
      return t.LiteralValues();
    if (IsEnum(t))
    {
      std::vector<ChoiceValue> out;
      out.reserve(t.EnumNames().size());
      for (const auto &n : t.EnumNames())
        out.emplace_back(n);
      return out;
    }
    if (!IsUnion(t))
      return std::nullopt;

    std::vector<ChoiceValue> out;
    for (const auto &b : t.Branches())
    {
      if (!IsDirectLiteral(b) && !IsEnum(b))
        continue;
      AppendChoices(out, *GetChoices(b));
    }
    return out;
  }

  std::expected<std::vector<ChoiceValue>, Error> GetLiteralChoices(const TypeDescriptor &t)
  {
    if (IsDirectLiteral(t))
      return t.LiteralValues();
    if (IsUnion(t))
    {
      for (const auto &b : t.Branches())
      {
        if (IsDirectLiteral(b))
          return b.LiteralValues();
      }
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "type is not a literal"});
  }

  std::expected<std::vector<std::string>, Error> GetEnumChoices(const TypeDescriptor &t)
  {
    if (!IsEnum(t))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "type is not an enum"});
    return t.EnumNames();
  }

  std::expected<bool, Error> LiteralContains(const TypeDescriptor &t, const ChoiceValue &value)
  {
    if (!IsDirectLiteral(t))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "type is not a literal"});
    const auto &values = t.LiteralValues();
    if (values.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "literal has no values"});
    return std::find(values.begin(), values.end(), value) != values.end();
  }

  std::vector<TypeDescriptor> Simplify(const TypeDescriptor &t)
  {
    std::vector<TypeDescriptor> out;
    if (IsUnion(t))
    {
      for (const auto &b : t.Branches())
      {
        auto s = Simplify(b);
        out.push_back(std::move(s.front()));
      }
      return out;
    }
    if (IsGenericContainer(t))
    {
      out.push_back(TypeDescriptor::MakePlain(t.QualifiedName()));
      return out;
    }
    if (IsDirectLiteral(t))
    {
      out.push_back(TypeDescriptor::MakePlain(LiteralMarkerName));
      return out;
    }
    out.push_back(t);
    return out;
  }

  std::optional<TypeDescriptor> TypeOrigin(const TypeDescriptor &t)
  {
    switch (t.Kind())
    {
      case TypeKind::Generic: return TypeDescriptor::MakePlain(t.QualifiedName());
      case TypeKind::Union: return TypeDescriptor::MakePlain("Union");
      case TypeKind::Literal: return TypeDescriptor::MakePlain(LiteralMarkerName);
      default: return std::nullopt;
    }
  }

  std::vector<TypeDescriptor> TypeArgs(const TypeDescriptor &t)
  {
    if (IsGenericContainer(t) || IsUnion(t))
      return t.Args();
    return {};
  }

  std::string StripQualification(std::string_view name)
  {
    std::string out;
    out.reserve(name.size());
    NGIN::UIntSize segStart = 0;
    for (NGIN::UIntSize i = 0; i < name.size(); ++i)
    {
      if (name[i] == ':' && i + 1 < name.size() && name[i + 1] == ':')
      {
        out.erase(segStart);
        ++i;
        continue;
      }
      out.push_back(name[i]);
      if (!IsIdentChar(name[i]))
        segStart = out.size();
    }
    return out;
  }

  std::string RenderChoice(const ChoiceValue &value)
  {
    if (const auto *b = std::get_if<bool>(&value))
      return *b ? "true" : "false";
    if (const auto *i = std::get_if<std::int64_t>(&value))
      return std::to_string(*i);
    return "'" + std::get<std::string>(value) + "'";
  }

  std::string RenderName(const TypeDescriptor &t)
  {
    switch (t.Kind())
    {
      case TypeKind::Unset:
        return std::string{Unset::DisplayName};
      case TypeKind::Plain:
      case TypeKind::Enum:
        return StripQualification(t.QualifiedName());
      case TypeKind::Union:
      {
        std::string out;
        for (NGIN::UIntSize i = 0; i < t.Branches().size(); ++i)
        {
          if (i != 0)
            out += " | ";
          out += RenderName(t.Branches()[i]);
        }
        return out;
      }
      case TypeKind::Generic:
      {
        std::string out = StripQualification(t.QualifiedName());
        if (t.Args().empty())
          return out;
        out += '<';
        for (NGIN::UIntSize i = 0; i < t.Args().size(); ++i)
        {
          if (i != 0)
            out += ", ";
          out += RenderName(t.Args()[i]);
        }
        out += '>';
        return out;
      }
      case TypeKind::Literal:
      {
        std::string out{LiteralMarkerName};
        out += '[';
        for (NGIN::UIntSize i = 0; i < t.LiteralValues().size(); ++i)
        {
          if (i != 0)
            out += ", ";
          out += RenderChoice(t.LiteralValues()[i]);
        }
        out += ']';
        return out;
      }
    }
    return {};
  }

  std::string SimplifiedTypeName(std::string_view renderedName)
  {
    std::string name = StripQualification(renderedName);
    constexpr std::string_view noneBranch{"| None"};
    const auto pos = name.find(noneBranch);
    if (pos == std::string::npos)
      return name;
    name.erase(pos, noneBranch.size());
    while (!name.empty() && name.back() == ' ')
      name.pop_back();
    const auto dbl = name.find("  ");
    if (dbl != std::string::npos)
      name.erase(dbl, 1);
    name += '?';
    return name;
  }

  nlohmann::json ToData(const ChoiceValue &value)
  {
    return std::visit([](const auto &v) { return nlohmann::json(v); }, value);
  }

  nlohmann::json ToData(const TypeDescriptor &t)
  {
    nlohmann::json j;
    switch (t.Kind())
    {
      case TypeKind::Unset:
        j["kind"] = "unset";
        break;
      case TypeKind::Plain:
        j["kind"] = "plain";
        j["name"] = t.QualifiedName();
        break;
      case TypeKind::Union:
      {
        j["kind"] = "union";
        auto branches = nlohmann::json::array();
        for (const auto &b : t.Branches())
          branches.push_back(ToData(b));
        j["branches"] = std::move(branches);
        break;
      }
      case TypeKind::Generic:
      {
        j["kind"] = "generic";
        j["origin"] = t.QualifiedName();
        auto args = nlohmann::json::array();
        for (const auto &a : t.Args())
          args.push_back(ToData(a));
        j["args"] = std::move(args);
        break;
      }
      case TypeKind::Literal:
      {
        j["kind"] = "literal";
        auto values = nlohmann::json::array();
        for (const auto &v : t.LiteralValues())
          values.push_back(ToData(v));
        j["values"] = std::move(values);
        break;
      }
      case TypeKind::Enum:
        j["kind"] = "enum";
        j["name"] = t.QualifiedName();
        j["choices"] = t.EnumNames();
        break;
    }
    j["display"] = RenderName(t);
    return j;
  }

} // namespace NGIN::Inspect
