// Signature.hpp
// Ordered parameters and return type of one callable, and the free-function metadata built on it
#pragma once

#include <NGIN/Inspect/Docstring.hpp>
#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Parameter.hpp>
#include <NGIN/Inspect/Registry.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace NGIN::Inspect
{

  inline constexpr std::string_view ReceiverName{"self"};

  struct SignatureOptions
  {
    // Omit the synthesized receiver parameter of instance members.
    bool skipSelf{true};
    // nullptr selects DefaultDocstringParser().
    const DocstringParser *parser{nullptr};
  };

  // Name -> value pairs in caller order.
  using ArgMap = std::vector<std::pair<std::string, Any>>;

  namespace detail
  {
    // Selector keys: std::string, std::string_view or const char* name a member or
    // parameter; any built-in integer selects by position.
    NGIN_INSPECT_API std::optional<std::string_view> KeyAsName(const Any &key);
    NGIN_INSPECT_API std::optional<std::int64_t> KeyAsIndex(const Any &key);
    // Negative positions count from the end.
    NGIN_INSPECT_API std::expected<NGIN::UIntSize, Error> ResolveIndex(std::int64_t index, NGIN::UIntSize count);

    // Unsigned positions above INT64_MAX saturate so they stay out of range instead of wrapping negative.
    template <std::integral I>
    constexpr std::int64_t SaturatingIndex(I index) noexcept
    {
      if (std::cmp_greater(index, std::numeric_limits<std::int64_t>::max()))
        return std::numeric_limits<std::int64_t>::max();
      return static_cast<std::int64_t>(index);
    }

    template <class I>
    concept PositionType = std::integral<I> && !std::same_as<I, bool>;
  } // namespace detail

  class NGIN_INSPECT_API Signature
  {
  public:
    [[nodiscard]] const std::string &Name() const noexcept { return m_name; }
    [[nodiscard]] const std::vector<Parameter> &Parameters() const noexcept { return m_params; }
    [[nodiscard]] NGIN::UIntSize ParameterCount() const noexcept { return m_params.size(); }
    [[nodiscard]] bool HasParam(std::string_view name) const noexcept;

    [[nodiscard]] std::expected<Parameter, Error> GetParam(std::string_view name) const;
    [[nodiscard]] std::expected<Parameter, Error> GetParam(const char *name) const { return GetParam(std::string_view{name}); }
    [[nodiscard]] std::expected<Parameter, Error> GetParam(const std::string &name) const { return GetParam(std::string_view{name}); }
    template <detail::PositionType I>
    [[nodiscard]] std::expected<Parameter, Error> GetParam(I index) const
    {
      return GetParamAt(detail::SaturatingIndex(index));
    }
    // Negative positions count from the end.
    [[nodiscard]] std::expected<Parameter, Error> GetParamAt(std::int64_t index) const;
    // String keys look up by name, integral keys by position; anything else is InvalidKeyType.
    [[nodiscard]] std::expected<Parameter, Error> GetParam(const Any &key) const;

    [[nodiscard]] const TypeDescriptor &ReturnType() const noexcept { return m_returnType; }
    [[nodiscard]] const std::string &Description() const noexcept { return m_description; }
    [[nodiscard]] std::string_view Docstring() const noexcept { return m_docstring; }
    [[nodiscard]] bool HasDocstring() const noexcept { return !m_docstring.empty(); }
    [[nodiscard]] bool IsAwaitable() const noexcept { return m_awaitable; }
    // True when Parameters()[0] is the synthesized receiver.
    [[nodiscard]] bool HasReceiverParam() const noexcept { return m_receiverParam; }

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] nlohmann::json ToData() const;

  private:
    friend NGIN_INSPECT_API std::expected<Signature, Error>
    ExtractSignature(const detail::CallableRuntimeDesc &, const SignatureOptions &, std::string_view);

    std::string m_name;
    std::vector<Parameter> m_params;
    TypeDescriptor m_returnType;
    std::string m_description;
    std::string_view m_docstring;
    bool m_awaitable{false};
    bool m_receiverParam{false};
  };

  // Builds a Signature from a registration record. Either the whole Signature is
  // produced or an error is returned; `nameOverride` names anonymous records.
  [[nodiscard]] NGIN_INSPECT_API std::expected<Signature, Error>
  ExtractSignature(const detail::CallableRuntimeDesc &desc, const SignatureOptions &options = {}, std::string_view nameOverride = {});

  // Positional arguments, completed from defaults. The receiver parameter is never bound here.
  [[nodiscard]] NGIN_INSPECT_API std::expected<std::vector<Any>, Error>
  BindArguments(const Signature &signature, std::span<const Any> args);

  // Arguments routed by parameter name, completed from defaults; unknown names are rejected.
  [[nodiscard]] NGIN_INSPECT_API std::expected<std::vector<Any>, Error>
  BindNamedArguments(const Signature &signature, const ArgMap &args);

  class NGIN_INSPECT_API FunctionInfo
  {
  public:
    [[nodiscard]] static std::expected<FunctionInfo, Error> Create(Function fn, const SignatureOptions &options = {});

    [[nodiscard]] const std::string &Name() const noexcept { return m_signature.Name(); }
    [[nodiscard]] const Signature &GetSignature() const noexcept { return m_signature; }
    [[nodiscard]] const std::vector<Parameter> &Parameters() const noexcept { return m_signature.Parameters(); }
    [[nodiscard]] const TypeDescriptor &ReturnType() const noexcept { return m_signature.ReturnType(); }
    [[nodiscard]] const std::string &Description() const noexcept { return m_signature.Description(); }
    [[nodiscard]] std::string_view Docstring() const noexcept { return m_signature.Docstring(); }
    [[nodiscard]] bool HasDocstring() const noexcept { return m_signature.HasDocstring(); }
    [[nodiscard]] bool IsAwaitable() const noexcept { return m_signature.IsAwaitable(); }
    [[nodiscard]] Function Handle() const noexcept { return m_function; }

    template <class Key>
    [[nodiscard]] std::expected<Parameter, Error> GetParam(const Key &key) const
    {
      return m_signature.GetParam(key);
    }

    [[nodiscard]] std::expected<Any, Error> Call(std::span<const Any> args) const;
    [[nodiscard]] std::expected<Any, Error> CallNamed(const ArgMap &args) const;
    // Blocks on an awaitable result and returns the produced value; plain results pass through.
    [[nodiscard]] std::expected<Any, Error> CallAwaitIfNeeded(std::span<const Any> args) const;

    [[nodiscard]] std::string ToString() const { return m_signature.ToString(); }
    [[nodiscard]] nlohmann::json ToData() const;

  private:
    FunctionInfo(Function fn, Signature signature) : m_function(fn), m_signature(std::move(signature)) {}

    Function m_function;
    Signature m_signature;
  };

} // namespace NGIN::Inspect
