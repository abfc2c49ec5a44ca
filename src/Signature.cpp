#include <NGIN/Inspect/Signature.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace NGIN::Inspect::detail
{

  std::optional<std::string_view> KeyAsName(const Any &key)
  {
    const auto tid = key.GetTypeId();
    if (tid == TypeIdOf<std::string>())
      return std::string_view{key.template Cast<std::string>()};
    if (tid == TypeIdOf<std::string_view>())
      return key.template Cast<std::string_view>();
    if (tid == TypeIdOf<const char *>())
      return std::string_view{key.template Cast<const char *>()};
    return std::nullopt;
  }

  std::optional<std::int64_t> KeyAsIndex(const Any &key)
  {
    const auto tid = key.GetTypeId();
    if (tid == TypeIdOf<short>())
      return key.template Cast<short>();
    if (tid == TypeIdOf<unsigned short>())
      return key.template Cast<unsigned short>();
    if (tid == TypeIdOf<int>())
      return key.template Cast<int>();
    if (tid == TypeIdOf<unsigned int>())
      return key.template Cast<unsigned int>();
    if (tid == TypeIdOf<long>())
      return key.template Cast<long>();
    if (tid == TypeIdOf<unsigned long>())
      return SaturatingIndex(key.template Cast<unsigned long>());
    if (tid == TypeIdOf<long long>())
      return key.template Cast<long long>();
    if (tid == TypeIdOf<unsigned long long>())
      return SaturatingIndex(key.template Cast<unsigned long long>());
    return std::nullopt;
  }

  std::expected<NGIN::UIntSize, Error> ResolveIndex(std::int64_t index, NGIN::UIntSize count)
  {
    const auto n = static_cast<std::int64_t>(count);
    const auto resolved = index < 0 ? n + index : index;
    if (resolved < 0 || resolved >= n)
      return std::unexpected(Error{ErrorCode::IndexOutOfRange, "index out of range"});
    return static_cast<NGIN::UIntSize>(resolved);
  }

} // namespace NGIN::Inspect::detail

namespace NGIN::Inspect
{

  namespace
  {
    std::string PositionalName(NGIN::UIntSize i)
    {
      return "arg" + std::to_string(i);
    }

    // Parameters the caller supplies; the synthesized receiver is excluded.
    std::span<const Parameter> Bindable(const Signature &signature)
    {
      std::span<const Parameter> params{signature.Parameters()};
      return signature.HasReceiverParam() ? params.subspan(1) : params;
    }
  } // namespace

  bool Signature::HasParam(std::string_view name) const noexcept
  {
    for (const auto &p : m_params)
    {
      if (p.Name() == name)
        return true;
    }
    return false;
  }

  std::expected<Parameter, Error> Signature::GetParam(std::string_view name) const
  {
    for (const auto &p : m_params)
    {
      if (p.Name() == name)
        return p;
    }
    return std::unexpected(Error{ErrorCode::NotFound, "parameter not found"});
  }

  std::expected<Parameter, Error> Signature::GetParamAt(std::int64_t index) const
  {
    auto i = detail::ResolveIndex(index, m_params.size());
    if (!i)
      return std::unexpected(i.error());
    return m_params[*i];
  }

  std::expected<Parameter, Error> Signature::GetParam(const Any &key) const
  {
    if (auto name = detail::KeyAsName(key))
      return GetParam(*name);
    if (auto index = detail::KeyAsIndex(key))
      return GetParamAt(*index);
    return std::unexpected(Error{ErrorCode::InvalidKeyType, "parameter key must be a string or an integer"});
  }

  std::string Signature::ToString() const
  {
    std::string out = m_name;
    out += '(';
    for (std::size_t i = 0; i < m_params.size(); ++i)
    {
      if (i != 0)
        out += ", ";
      out += m_params[i].ToString();
    }
    out += ')';
    if (!m_returnType.IsUnset())
    {
      out += " -> ";
      out += RenderName(m_returnType);
    }
    return out;
  }

  nlohmann::json Signature::ToData() const
  {
    nlohmann::json params = nlohmann::json::array();
    for (const auto &p : m_params)
      params.push_back(p.ToData());

    nlohmann::json j;
    j["name"] = m_name;
    j["parameters"] = std::move(params);
    j["return_type"] = NGIN::Inspect::ToData(m_returnType);
    j["description"] = m_description;
    j["docstring"] = std::string{m_docstring};
    j["is_awaitable"] = m_awaitable;
    return j;
  }

  std::expected<Signature, Error> ExtractSignature(const detail::CallableRuntimeDesc &desc,
                                                   const SignatureOptions &options,
                                                   std::string_view nameOverride)
  {
    const auto name = nameOverride.empty() ? desc.name : nameOverride;
    const auto declared = desc.paramTypes.Size();
    if (desc.argSpecs.Size() > declared)
    {
      spdlog::warn("inspect: '{}' registers {} argument specs for {} parameters", name, desc.argSpecs.Size(), declared);
      return std::unexpected(Error{ErrorCode::InvalidArgument, "more argument specs than parameters"});
    }

    std::vector<Parameter> params;
    params.reserve(declared + 1);
    const bool receiver = desc.hasReceiver && !options.skipSelf;
    if (receiver)
      params.emplace_back(std::string{ReceiverName});

    std::unordered_set<std::string> seen;
    for (NGIN::UIntSize i = 0; i < declared; ++i)
    {
      const ArgSpec *spec = i < desc.argSpecs.Size() ? &desc.argSpecs[i] : nullptr;
      std::string paramName = spec != nullptr && !spec->name.empty() ? std::string{spec->name} : PositionalName(i);
      if (!seen.insert(paramName).second || (receiver && paramName == ReceiverName))
      {
        spdlog::warn("inspect: '{}' declares parameter '{}' twice", name, paramName);
        return std::unexpected(Error{ErrorCode::InvalidArgument, "duplicate parameter name"});
      }
      if (spec == nullptr)
      {
        params.emplace_back(std::move(paramName), ParameterKind::PositionalOrKeyword, desc.paramTypes[i]);
        continue;
      }
      params.emplace_back(std::move(paramName),
                          spec->kind,
                          spec->annotation.value_or(desc.paramTypes[i]),
                          spec->defaultValue);
    }

    Signature sig;
    sig.m_name = std::string{name};
    sig.m_returnType = desc.returnType;
    sig.m_docstring = desc.docstring;
    sig.m_awaitable = desc.Await != nullptr;
    sig.m_receiverParam = receiver;

    if (!desc.docstring.empty())
    {
      const auto &parser = options.parser != nullptr ? *options.parser : DefaultDocstringParser();
      const auto parsed = parser.Parse(desc.docstring);
      sig.m_description = parsed.Description();

      std::unordered_map<std::string_view, std::string_view> descriptions;
      for (const auto &entry : parsed.params)
      {
        if (!entry.description.empty())
          descriptions.try_emplace(entry.name, entry.description);
      }
      for (auto &p : params)
      {
        if (auto it = descriptions.find(p.Name()); it != descriptions.end())
          p = p.WithDescription(std::string{it->second});
      }
    }

    sig.m_params = std::move(params);
    return sig;
  }

  std::expected<std::vector<Any>, Error> BindArguments(const Signature &signature, std::span<const Any> args)
  {
    const auto params = Bindable(signature);
    if (args.size() > params.size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "too many arguments"});

    std::vector<Any> bound;
    bound.reserve(params.size());
    for (std::size_t i = 0; i < params.size(); ++i)
    {
      const auto &p = params[i];
      if (i < args.size())
      {
        if (p.Kind() == ParameterKind::KeywordOnly)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "keyword-only parameter passed positionally"});
        bound.push_back(args[i]);
      }
      else if (p.HasDefault())
      {
        bound.push_back(p.Default()->value);
      }
      else
      {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "missing required argument"});
      }
    }
    return bound;
  }

  std::expected<std::vector<Any>, Error> BindNamedArguments(const Signature &signature, const ArgMap &args)
  {
    const auto params = Bindable(signature);
    std::unordered_set<std::string_view> given;
    for (const auto &[key, value] : args)
    {
      if (!given.insert(key).second)
      {
        spdlog::debug("inspect: keyword '{}' passed twice to '{}'", key, signature.Name());
        return std::unexpected(Error{ErrorCode::InvalidArgument, "multiple values for keyword argument"});
      }
      bool known = false;
      for (const auto &p : params)
        known = known || (p.Name() == key && p.Kind() != ParameterKind::PositionalOnly);
      if (!known)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "unexpected keyword argument"});
    }

    std::vector<Any> bound;
    bound.reserve(params.size());
    for (const auto &p : params)
    {
      const auto it = std::find_if(args.begin(), args.end(), [&p](const auto &kv) { return kv.first == p.Name(); });
      if (it != args.end())
        bound.push_back(it->second);
      else if (p.HasDefault())
        bound.push_back(p.Default()->value);
      else
        return std::unexpected(Error{ErrorCode::InvalidArgument, "missing required argument"});
    }
    return bound;
  }

  std::expected<FunctionInfo, Error> FunctionInfo::Create(Function fn, const SignatureOptions &options)
  {
    if (!fn.IsValid())
      return std::unexpected(Error{ErrorCode::NotFound, "function not registered"});
    auto sig = ExtractSignature(detail::GetRegistry().functions[fn.Handle().index], options);
    if (!sig)
      return std::unexpected(sig.error());
    return FunctionInfo{fn, std::move(*sig)};
  }

  std::expected<Any, Error> FunctionInfo::Call(std::span<const Any> args) const
  {
    auto bound = BindArguments(m_signature, args);
    if (!bound)
      return std::unexpected(bound.error());
    return m_function.Invoke(std::span<const Any>{*bound});
  }

  std::expected<Any, Error> FunctionInfo::CallNamed(const ArgMap &args) const
  {
    auto bound = BindNamedArguments(m_signature, args);
    if (!bound)
      return std::unexpected(bound.error());
    return m_function.Invoke(std::span<const Any>{*bound});
  }

  std::expected<Any, Error> FunctionInfo::CallAwaitIfNeeded(std::span<const Any> args) const
  {
    auto result = Call(args);
    if (!result || !m_function.IsValid())
      return result;
    const auto await = detail::GetRegistry().functions[m_function.Handle().index].Await;
    if (await == nullptr)
      return result;
    return await(*result);
  }

  nlohmann::json FunctionInfo::ToData() const
  {
    auto j = m_signature.ToData();
    j["kind"] = "function";
    return j;
  }

} // namespace NGIN::Inspect
