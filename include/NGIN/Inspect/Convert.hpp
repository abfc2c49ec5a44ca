// Convert.hpp - Shared Any -> T conversion helpers used by the generated invokers
#pragma once

#include <NGIN/Primitives.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Types.hpp>

namespace NGIN::Inspect::detail
{

  template <class T>
  inline constexpr bool IsNumericV = std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

  template <class>
  struct IsOptional : std::false_type
  {
  };
  template <class T>
  struct IsOptional<std::optional<T>> : std::true_type
  {
  };

  // Try to convert Any -> To (exact match, arithmetic conversions, text, None into optional)
  template <class To>
  inline std::expected<std::remove_cv_t<std::remove_reference_t<To>>, Error>
  ConvertAny(const Any &src)
  {
    using Dest = std::remove_cv_t<std::remove_reference_t<To>>;
    if constexpr (std::is_same_v<Dest, Any>)
    {
      return src;
    }
    else
    {
      const auto tid = src.GetTypeId();
      if (tid == TypeIdOf<Dest>())
      {
        return src.template Cast<Dest>();
      }
      if constexpr (IsOptional<Dest>::value)
      {
        if (tid == TypeIdOf<std::nullptr_t>())
          return Dest{};
        auto inner = ConvertAny<typename Dest::value_type>(src);
        if (!inner)
          return std::unexpected(inner.error());
        return Dest{std::move(*inner)};
      }
      if constexpr (std::is_same_v<Dest, std::string>)
      {
        if (tid == TypeIdOf<const char *>())
          return std::string{src.template Cast<const char *>()};
        if (tid == TypeIdOf<std::string_view>())
          return std::string{src.template Cast<std::string_view>()};
      }
      if constexpr (IsNumericV<Dest>)
      {
        if (tid == TypeIdOf<bool>())
          return static_cast<Dest>(src.template Cast<bool>());
        if (tid == TypeIdOf<signed char>())
          return static_cast<Dest>(src.template Cast<signed char>());
        if (tid == TypeIdOf<unsigned char>())
          return static_cast<Dest>(src.template Cast<unsigned char>());
        if (tid == TypeIdOf<char>())
          return static_cast<Dest>(src.template Cast<char>());
        if (tid == TypeIdOf<short>())
          return static_cast<Dest>(src.template Cast<short>());
        if (tid == TypeIdOf<unsigned short>())
          return static_cast<Dest>(src.template Cast<unsigned short>());
        if (tid == TypeIdOf<int>())
          return static_cast<Dest>(src.template Cast<int>());
        if (tid == TypeIdOf<unsigned int>())
          return static_cast<Dest>(src.template Cast<unsigned int>());
        if (tid == TypeIdOf<long>())
          return static_cast<Dest>(src.template Cast<long>());
        if (tid == TypeIdOf<unsigned long>())
          return static_cast<Dest>(src.template Cast<unsigned long>());
        if (tid == TypeIdOf<long long>())
          return static_cast<Dest>(src.template Cast<long long>());
        if (tid == TypeIdOf<unsigned long long>())
          return static_cast<Dest>(src.template Cast<unsigned long long>());
        if (tid == TypeIdOf<float>())
          return static_cast<Dest>(src.template Cast<float>());
        if (tid == TypeIdOf<double>())
          return static_cast<Dest>(src.template Cast<double>());
        if (tid == TypeIdOf<long double>())
          return static_cast<Dest>(src.template Cast<long double>());
      }
      return std::unexpected(Error{ErrorCode::InvalidArgument, "argument type not convertible"});
    }
  }

} // namespace NGIN::Inspect::detail
