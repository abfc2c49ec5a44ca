#include <NGIN/Inspect/Inspect.hpp>

namespace NGIN::Inspect
{

  std::expected<InspectResult, Error> Inspect(std::string_view name, const InspectOptions &options)
  {
    if (auto type = GetType(name))
    {
      auto info = ClassInfo::Create(*type, options.classes);
      if (!info)
        return std::unexpected(info.error());
      return InspectResult{std::move(*info)};
    }
    if (auto fn = GetFunction(name))
    {
      auto info = FunctionInfo::Create(*fn, options.functions);
      if (!info)
        return std::unexpected(info.error());
      return InspectResult{std::move(*info)};
    }
    return std::unexpected(Error{ErrorCode::UnsupportedObject, "neither a registered type nor a registered function"});
  }

  std::expected<ClassInfo, Error> Inspect(Type type, const ClassOptions &options)
  {
    return ClassInfo::Create(type, options);
  }

  std::expected<FunctionInfo, Error> Inspect(Function fn, const SignatureOptions &options)
  {
    if (!fn.IsValid())
      return std::unexpected(Error{ErrorCode::UnsupportedObject, "function not registered"});
    return FunctionInfo::Create(fn, options);
  }

} // namespace NGIN::Inspect
