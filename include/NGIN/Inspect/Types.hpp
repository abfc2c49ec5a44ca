// Types.hpp
// Public-facing error codes, small handle types and the enumerations shared by the metadata models
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <NGIN/Inspect/Export.hpp>

#include <expected>
#include <string_view>
#include <utility>

namespace NGIN::Inspect
{

  using Any = NGIN::Utilities::Any<>;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    IndexOutOfRange = 3,
    InvalidKeyType = 4,
    AlreadyInitialized = 5,
    NotInitialized = 6,
    UnsupportedObject = 7,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
  };

  [[nodiscard]] NGIN_INSPECT_API std::string_view ToString(ErrorCode code) noexcept;

  // "No value was supplied or declared". Distinct from the None type.
  struct Unset
  {
    static constexpr std::string_view DisplayName{"<unset>"};
    constexpr bool operator==(const Unset &) const noexcept = default;
  };

  enum class ParameterKind : NGIN::UInt8
  {
    PositionalOnly = 0,
    PositionalOrKeyword = 1,
    VarPositional = 2,
    KeywordOnly = 3,
    VarKeyword = 4,
  };

  enum class MemberKind : NGIN::UInt8
  {
    Instance = 0,
    Static = 1,
    Class = 2,
    Property = 3,
  };

  enum class Visibility : NGIN::UInt8
  {
    Public = 0,
    Protected = 1,
    Private = 2,
  };

  [[nodiscard]] NGIN_INSPECT_API std::string_view ToString(ParameterKind kind) noexcept;
  [[nodiscard]] NGIN_INSPECT_API std::string_view ToString(MemberKind kind) noexcept;
  [[nodiscard]] NGIN_INSPECT_API std::string_view ToString(Visibility visibility) noexcept;

  // Small opaque handles (indices into registry tables).
  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 generation{0};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  struct FunctionHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  class Type;
  class Function;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedFunction = std::expected<Function, Error>;

} // namespace NGIN::Inspect
