// ClassInfo.hpp
// Filtered member metadata of a registered class, with optional instance state for invocation
#pragma once

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Member.hpp>
#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Signature.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace NGIN::Inspect
{

  // Categories a ClassInfo lists. Every disabled flag removes its category.
  struct MemberFilter
  {
    bool init{true};
    bool publicMembers{true};
    bool inherited{true};
    bool staticMethods{true};
    bool protectedMembers{false};
    bool privateMembers{false};
    bool classMethods{false};
  };

  using MemberPredicate = bool (*)(const Member &);

  // One exclusion predicate per disabled flag.
  [[nodiscard]] NGIN_INSPECT_API std::vector<MemberPredicate> ExclusionPredicates(const MemberFilter &filter);
  // Included iff no exclusion predicate matches.
  [[nodiscard]] NGIN_INSPECT_API bool IsIncluded(const MemberFilter &filter, const Member &member);

  struct ClassOptions
  {
    MemberFilter filter{};
    bool skipSelf{true};
    const DocstringParser *parser{nullptr};
  };

  struct SplitArgs
  {
    ArgMap init;
    ArgMap method;
  };

  class NGIN_INSPECT_API ClassInfo
  {
  public:
    [[nodiscard]] static std::expected<ClassInfo, Error> Create(Type type, const ClassOptions &options = {});

    template <class T>
    [[nodiscard]] static std::expected<ClassInfo, Error> Of(const ClassOptions &options = {})
    {
      return Create(NGIN::Inspect::GetType<T>(), options);
    }

    // The instance is referenced, not owned, and must outlive the ClassInfo.
    template <class T>
    [[nodiscard]] static std::expected<ClassInfo, Error> FromInstance(T &instance, const ClassOptions &options = {})
    {
      auto info = Create(NGIN::Inspect::GetType<T>(), options);
      if (info)
        info->Bind(static_cast<void *>(&instance));
      return info;
    }

    [[nodiscard]] std::string_view Name() const { return m_type.Name(); }
    [[nodiscard]] std::string_view QualifiedName() const { return m_type.QualifiedName(); }
    [[nodiscard]] Type ClassType() const noexcept { return m_type; }
    [[nodiscard]] const std::string &Description() const noexcept { return m_description; }
    [[nodiscard]] std::string_view Docstring() const { return m_type.Docstring(); }
    [[nodiscard]] const MemberFilter &Filter() const noexcept { return m_options.filter; }
    [[nodiscard]] const HierarchySnapshot &Hierarchy() const noexcept { return m_hierarchy; }

    [[nodiscard]] const std::vector<Member> &Methods() const noexcept { return m_members; }
    [[nodiscard]] NGIN::UIntSize MethodCount() const noexcept { return m_members.size(); }
    [[nodiscard]] bool HasMethod(std::string_view name) const noexcept;

    [[nodiscard]] std::expected<Member, Error> GetMethod(std::string_view name) const;
    [[nodiscard]] std::expected<Member, Error> GetMethod(const char *name) const { return GetMethod(std::string_view{name}); }
    [[nodiscard]] std::expected<Member, Error> GetMethod(const std::string &name) const { return GetMethod(std::string_view{name}); }
    template <detail::PositionType I>
    [[nodiscard]] std::expected<Member, Error> GetMethod(I index) const
    {
      return GetMethodAt(detail::SaturatingIndex(index));
    }
    [[nodiscard]] std::expected<Member, Error> GetMethodAt(std::int64_t index) const;
    [[nodiscard]] std::expected<Member, Error> GetMethod(const Any &key) const;

    // True when the constructor survived the member filter. Init() constructs either way.
    [[nodiscard]] bool HasInit() const noexcept { return m_initListed; }
    [[nodiscard]] std::optional<Member> InitMethod() const;
    [[nodiscard]] std::vector<Parameter> InitArgs() const;
    [[nodiscard]] bool IsInitialized() const noexcept { return m_instantiated; }
    // Receiver for instance members; nullptr until initialized.
    [[nodiscard]] void *Instance() const noexcept;
    [[nodiscard]] const Any &OwnedInstance() const noexcept { return m_owned; }

    // Constructs and owns an instance.
    [[nodiscard]] std::expected<void, Error> Init(std::span<const Any> args = {});
    [[nodiscard]] std::expected<void, Error> InitNamed(const ArgMap &args);

    template <class Key>
    [[nodiscard]] std::expected<Any, Error> CallMethod(const Key &key, std::span<const Any> args = {})
    {
      auto member = GetMethod(key);
      if (!member)
        return std::unexpected(member.error());
      return CallMember(*member, args);
    }

    template <class Key>
    [[nodiscard]] std::expected<Any, Error> CallMethodAwaitIfNeeded(const Key &key, std::span<const Any> args = {})
    {
      auto member = GetMethod(key);
      if (!member)
        return std::unexpected(member.error());
      return CallMemberAwaitIfNeeded(*member, args);
    }

    template <class Key>
    [[nodiscard]] std::expected<Any, Error> CallMethodNamed(const Key &key, const ArgMap &args)
    {
      auto member = GetMethod(key);
      if (!member)
        return std::unexpected(member.error());
      return CallMemberNamed(*member, args);
    }

    [[nodiscard]] std::expected<Any, Error> CallMember(const Member &member, std::span<const Any> args);
    [[nodiscard]] std::expected<Any, Error> CallMemberAwaitIfNeeded(const Member &member, std::span<const Any> args);
    [[nodiscard]] std::expected<Any, Error> CallMemberNamed(const Member &member, const ArgMap &args);

    // Routes the keys naming constructor parameters to `init`, the rest to `method`.
    [[nodiscard]] SplitArgs SplitInitArgs(const ArgMap &args, const Member &method) const;

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] nlohmann::json ToData() const;

  private:
    ClassInfo(Type type, ClassOptions options, HierarchySnapshot hierarchy)
        : m_type(type), m_options(options), m_hierarchy(std::move(hierarchy))
    {
    }

    void Bind(void *instance) noexcept;
    [[nodiscard]] std::expected<void, Error> CheckCallable(const Member &member) const;
    [[nodiscard]] std::expected<void, Error> Adopt(std::expected<Any, Error> constructed);

    Type m_type;
    ClassOptions m_options;
    HierarchySnapshot m_hierarchy;
    std::string m_description;
    std::optional<Member> m_init;
    std::vector<Member> m_members;
    bool m_initListed{false};

    bool m_instantiated{false};
    bool m_owns{false};
    Any m_owned{};
    void *m_borrowed{nullptr};
  };

} // namespace NGIN::Inspect
