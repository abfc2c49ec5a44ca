// DescribeType.hpp
// Compile-time mapping from C++ types to TypeDescriptor, and boxing of parameter defaults
#pragma once

#include <NGIN/Inspect/Registry.hpp>

#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <deque>
#include <future>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace NGIN::Inspect
{

  namespace detail
  {
    template <class U>
    TypeDescriptor DescribeFallback()
    {
      if constexpr (std::is_same_v<U, Any>)
      {
        return TypeDescriptor{};
      }
      else if constexpr (std::is_void_v<U> || std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::monostate>)
      {
        return TypeDescriptor::MakeNone();
      }
      else if constexpr (std::is_enum_v<U>)
      {
        const auto idx = EnsureRegistered<U>();
        const auto &tdesc = GetRegistry().types[idx];
        std::vector<std::string> names;
        names.reserve(tdesc.enumInfo.values.Size());
        for (NGIN::UIntSize i = 0; i < tdesc.enumInfo.values.Size(); ++i)
          names.emplace_back(tdesc.enumInfo.values[i].name);
        return TypeDescriptor::MakeEnum(tdesc.qualifiedName, tdesc.typeId, std::move(names));
      }
      else if constexpr (Registrable<U>)
      {
        // Registered names win over compiler-derived ones.
        const auto idx = EnsureRegistered<U>();
        const auto &tdesc = GetRegistry().types[idx];
        return TypeDescriptor::MakePlain(tdesc.qualifiedName, tdesc.typeId);
      }
      else
      {
        return TypeDescriptor::MakePlain(NGIN::Meta::TypeName<U>::qualifiedName, TypeIdOf<U>());
      }
    }

    template <class... A>
    std::vector<TypeDescriptor> DescribeEach()
    {
      return std::vector<TypeDescriptor>{DescribeType<A>()...};
    }

    template <class... A>
    TypeDescriptor GenericOf(std::string_view origin)
    {
      return TypeDescriptor::MakeGeneric(origin, DescribeEach<A...>());
    }
  } // namespace detail

  template <class T, class Enable>
  struct TypeDescriptorTraits
  {
    static TypeDescriptor Describe() { return detail::DescribeFallback<T>(); }
  };

  template <>
  struct TypeDescriptorTraits<std::string>
  {
    static TypeDescriptor Describe() { return TypeDescriptor::MakePlain("std::string", detail::TypeIdOf<std::string>()); }
  };

  template <>
  struct TypeDescriptorTraits<std::string_view>
  {
    static TypeDescriptor Describe() { return TypeDescriptor::MakePlain("std::string_view", detail::TypeIdOf<std::string_view>()); }
  };

  template <class T>
  struct TypeDescriptorTraits<std::optional<T>>
  {
    static TypeDescriptor Describe() { return TypeDescriptor::MakeUnion({DescribeType<T>(), TypeDescriptor::MakeNone()}); }
  };

  template <class... A>
  struct TypeDescriptorTraits<std::variant<A...>>
  {
    static TypeDescriptor Describe()
    {
      auto u = TypeDescriptor::MakeUnion(detail::DescribeEach<A...>());
      if (u.Branches().size() == 1)
        return u.Branches().front();
      return u;
    }
  };

  template <class T, class Alloc>
  struct TypeDescriptorTraits<std::vector<T, Alloc>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<T>("std::vector"); }
  };

  template <class T, class Alloc>
  struct TypeDescriptorTraits<std::deque<T, Alloc>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<T>("std::deque"); }
  };

  template <class T, class Alloc>
  struct TypeDescriptorTraits<std::list<T, Alloc>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<T>("std::list"); }
  };

  template <class T, std::size_t N>
  struct TypeDescriptorTraits<std::array<T, N>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<T>("std::array"); }
  };

  template <class T, class Cmp, class Alloc>
  struct TypeDescriptorTraits<std::set<T, Cmp, Alloc>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<T>("std::set"); }
  };

  template <class T, class Hash, class Eq, class Alloc>
  struct TypeDescriptorTraits<std::unordered_set<T, Hash, Eq, Alloc>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<T>("std::unordered_set"); }
  };

  template <class K, class V, class Cmp, class Alloc>
  struct TypeDescriptorTraits<std::map<K, V, Cmp, Alloc>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<K, V>("std::map"); }
  };

  template <class K, class V, class Hash, class Eq, class Alloc>
  struct TypeDescriptorTraits<std::unordered_map<K, V, Hash, Eq, Alloc>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<K, V>("std::unordered_map"); }
  };

  template <class A, class B>
  struct TypeDescriptorTraits<std::pair<A, B>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<A, B>("std::pair"); }
  };

  template <class... A>
  struct TypeDescriptorTraits<std::tuple<A...>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<A...>("std::tuple"); }
  };

  template <class T>
  struct TypeDescriptorTraits<std::shared_future<T>>
  {
    static TypeDescriptor Describe() { return detail::GenericOf<T>("std::shared_future"); }
  };

  template <LiteralArg... Values>
  struct TypeDescriptorTraits<Literal<Values...>>
  {
    static TypeDescriptor Describe()
    {
      if constexpr (sizeof...(Values) == 0)
        return TypeDescriptor::MakePlain(LiteralMarkerName);
      else
        return TypeDescriptor::MakeLiteral(std::vector<ChoiceValue>{Values.ToChoice()...});
    }
  };

  template <class T>
  TypeDescriptor DescribeType()
  {
    return TypeDescriptorTraits<std::remove_cvref_t<T>>::Describe();
  }

  namespace detail
  {
    template <class V>
    DefaultValue MakeDefaultValue(V &&v)
    {
      using U = std::decay_t<V>;
      DefaultValue d{};
      if constexpr (std::is_same_v<U, std::nullptr_t>)
      {
        d.value = Any{nullptr};
        d.type = TypeDescriptor::MakeNone();
        d.display = "None";
        d.data = nullptr;
      }
      else if constexpr (std::is_same_v<U, const char *> || std::is_same_v<U, char *> ||
                         std::is_same_v<U, std::string_view> || std::is_same_v<U, std::string>)
      {
        std::string s{v};
        d.type = DescribeType<std::string>();
        d.display = fmt::format("'{}'", s);
        d.data = s;
        d.value = Any{std::move(s)};
      }
      else if constexpr (std::is_same_v<U, bool>)
      {
        d.value = Any{v};
        d.type = DescribeType<bool>();
        d.display = v ? "true" : "false";
        d.data = v;
      }
      else if constexpr (std::is_arithmetic_v<U>)
      {
        d.value = Any{static_cast<U>(v)};
        d.type = DescribeType<U>();
        d.display = fmt::format("{}", v);
        d.data = v;
      }
      else if constexpr (std::is_enum_v<U>)
      {
        d.value = Any{static_cast<U>(v)};
        d.type = DescribeType<U>();
        const auto name = GetType<U>().EnumName(d.value);
        const auto underlying = static_cast<std::int64_t>(static_cast<std::underlying_type_t<U>>(v));
        if (name.has_value())
        {
          d.display = fmt::format("{}.{}", StripQualification(d.type.QualifiedName()), *name);
          d.data = std::string{*name};
        }
        else
        {
          d.display = fmt::format("{}", underlying);
          d.data = underlying;
        }
      }
      else
      {
        d.type = DescribeType<U>();
        d.display = fmt::format("<{}>", RenderName(d.type));
        d.data = d.display;
        d.value = Any{U(std::forward<V>(v))};
      }
      return d;
    }
  } // namespace detail

} // namespace NGIN::Inspect
