#pragma once

#include <string_view>
#include <type_traits>
#include <variant>

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Types.hpp>
#include <NGIN/Inspect/TypeDescriptor.hpp>
#include <NGIN/Inspect/Docstring.hpp>
#include <NGIN/Inspect/Parameter.hpp>
#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/TypeBuilder.hpp>
#include <NGIN/Inspect/Signature.hpp>
#include <NGIN/Inspect/Member.hpp>
#include <NGIN/Inspect/ClassInfo.hpp>

namespace NGIN::Inspect
{

  struct InspectOptions
  {
    ClassOptions classes{};
    SignatureOptions functions{};
  };

  using InspectResult = std::variant<FunctionInfo, ClassInfo>;

  // Registered types win over functions of the same name; anything else is UnsupportedObject.
  [[nodiscard]] NGIN_INSPECT_API std::expected<InspectResult, Error> Inspect(std::string_view name, const InspectOptions &options = {});
  [[nodiscard]] NGIN_INSPECT_API std::expected<ClassInfo, Error> Inspect(Type type, const ClassOptions &options = {});
  [[nodiscard]] NGIN_INSPECT_API std::expected<FunctionInfo, Error> Inspect(Function fn, const SignatureOptions &options = {});

  template <class T>
  [[nodiscard]] std::expected<ClassInfo, Error> Inspect(const ClassOptions &options = {})
  {
    return ClassInfo::Of<T>(options);
  }

  template <class T>
  requires detail::Registrable<std::remove_cv_t<T>>
  [[nodiscard]] std::expected<ClassInfo, Error> Inspect(T &instance, const ClassOptions &options = {})
  {
    return ClassInfo::FromInstance(instance, options);
  }

  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Inspect"; }

} // namespace NGIN::Inspect
