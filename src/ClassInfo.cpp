#include <NGIN/Inspect/ClassInfo.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace NGIN::Inspect
{

  std::vector<MemberPredicate> ExclusionPredicates(const MemberFilter &filter)
  {
    std::vector<MemberPredicate> out;
    if (!filter.init)
      out.push_back([](const Member &m) { return m.IsConstructor(); });
    if (!filter.publicMembers)
      out.push_back([](const Member &m) { return m.IsPublic(); });
    if (!filter.inherited)
      out.push_back([](const Member &m) { return m.IsInherited(); });
    if (!filter.staticMethods)
      out.push_back([](const Member &m) { return m.IsStatic(); });
    if (!filter.protectedMembers)
      out.push_back([](const Member &m) { return m.IsProtected(); });
    if (!filter.privateMembers)
      out.push_back([](const Member &m) { return m.IsPrivate(); });
    if (!filter.classMethods)
      out.push_back([](const Member &m) { return m.IsClassMethod(); });
    return out;
  }

  bool IsIncluded(const MemberFilter &filter, const Member &member)
  {
    const auto predicates = ExclusionPredicates(filter);
    return std::none_of(predicates.begin(), predicates.end(), [&member](MemberPredicate p) { return p(member); });
  }

  std::expected<ClassInfo, Error> ClassInfo::Create(Type type, const ClassOptions &options)
  {
    if (!type.IsValid())
      return std::unexpected(Error{ErrorCode::UnsupportedObject, "type not registered"});
    auto hierarchy = BuildHierarchy(type);
    if (!hierarchy)
      return std::unexpected(hierarchy.error());

    ClassInfo info{type, options, std::move(*hierarchy)};
    const SignatureOptions sigOptions{options.skipSelf, options.parser};

    if (!type.Docstring().empty())
    {
      const auto &parser = options.parser != nullptr ? *options.parser : DefaultDocstringParser();
      info.m_description = parser.Parse(type.Docstring()).Description();
    }

    if (type.HasInit())
    {
      auto init = Member::Create(info.m_hierarchy, type.Name(), sigOptions);
      if (!init)
        return std::unexpected(init.error());
      info.m_init = std::move(*init);
      if (IsIncluded(options.filter, *info.m_init))
      {
        info.m_members.push_back(*info.m_init);
        info.m_initListed = true;
      }
    }

    // Most-derived definition of each name wins.
    std::unordered_set<std::string_view> seen;
    for (const auto &level : info.m_hierarchy.levels)
    {
      for (NGIN::UIntSize i = 0; i < level.OwnMemberCount(); ++i)
      {
        const auto name = level.OwnMemberName(i);
        if (!seen.insert(name).second)
          continue;
        auto member = Member::Create(info.m_hierarchy, name, sigOptions);
        if (!member)
          return std::unexpected(member.error());
        if (IsIncluded(options.filter, *member))
          info.m_members.push_back(std::move(*member));
      }
    }

    spdlog::debug("inspect: class '{}' with {} members", type.QualifiedName(), info.m_members.size());
    return info;
  }

  bool ClassInfo::HasMethod(std::string_view name) const noexcept
  {
    return std::any_of(m_members.begin(), m_members.end(), [name](const Member &m) { return m.Name() == name; });
  }

  std::expected<Member, Error> ClassInfo::GetMethod(std::string_view name) const
  {
    for (const auto &m : m_members)
    {
      if (m.Name() == name)
        return m;
    }
    return std::unexpected(Error{ErrorCode::NotFound, "method not found"});
  }

  std::expected<Member, Error> ClassInfo::GetMethodAt(std::int64_t index) const
  {
    auto i = detail::ResolveIndex(index, m_members.size());
    if (!i)
      return std::unexpected(i.error());
    return m_members[*i];
  }

  std::expected<Member, Error> ClassInfo::GetMethod(const Any &key) const
  {
    if (auto name = detail::KeyAsName(key))
      return GetMethod(*name);
    if (auto index = detail::KeyAsIndex(key))
      return GetMethodAt(*index);
    return std::unexpected(Error{ErrorCode::InvalidKeyType, "method key must be a string or an integer"});
  }

  std::optional<Member> ClassInfo::InitMethod() const
  {
    if (!m_initListed)
      return std::nullopt;
    return m_init;
  }

  std::vector<Parameter> ClassInfo::InitArgs() const
  {
    if (!m_initListed)
      return {};
    return m_init->Parameters();
  }

  void *ClassInfo::Instance() const noexcept
  {
    if (!m_instantiated)
      return nullptr;
    if (!m_owns)
      return m_borrowed;
    // Resolved on demand: an inline-stored value moves with the ClassInfo.
    return const_cast<void *>(static_cast<const void *>(m_owned.Data()));
  }

  void ClassInfo::Bind(void *instance) noexcept
  {
    m_borrowed = instance;
    m_owns = false;
    m_instantiated = true;
  }

  std::expected<void, Error> ClassInfo::Adopt(std::expected<Any, Error> constructed)
  {
    if (!constructed)
      return std::unexpected(constructed.error());
    m_owned = std::move(*constructed);
    m_owns = true;
    m_instantiated = true;
    spdlog::debug("inspect: constructed an instance of '{}'", m_type.QualifiedName());
    return {};
  }

  std::expected<void, Error> ClassInfo::Init(std::span<const Any> args)
  {
    if (m_instantiated)
      return std::unexpected(Error{ErrorCode::AlreadyInitialized, "class is already initialized"});
    if (!m_type.IsConstructible())
      return std::unexpected(Error{ErrorCode::UnsupportedObject, "type cannot be constructed"});
    if (!m_init)
      return Adopt(m_type.Construct(args));

    return Adopt(m_init->Call(nullptr, args));
  }

  std::expected<void, Error> ClassInfo::InitNamed(const ArgMap &args)
  {
    if (m_instantiated)
      return std::unexpected(Error{ErrorCode::AlreadyInitialized, "class is already initialized"});
    if (!m_type.IsConstructible())
      return std::unexpected(Error{ErrorCode::UnsupportedObject, "type cannot be constructed"});
    if (!m_init)
    {
      if (!args.empty())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "unexpected keyword argument"});
      return Adopt(m_type.Construct(std::span<const Any>{}));
    }

    return Adopt(m_init->CallNamed(nullptr, args));
  }

  std::expected<void, Error> ClassInfo::CheckCallable(const Member &member) const
  {
    if (member.IsConstructor())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "the constructor runs through Init"});
    if (member.NeedsReceiver() && !m_instantiated)
      return std::unexpected(Error{ErrorCode::NotInitialized, "class is not initialized"});
    return {};
  }

  std::expected<Any, Error> ClassInfo::CallMember(const Member &member, std::span<const Any> args)
  {
    if (auto ok = CheckCallable(member); !ok)
      return std::unexpected(ok.error());
    spdlog::debug("inspect: calling '{}.{}'", Name(), member.Name());
    return member.Call(Instance(), args);
  }

  std::expected<Any, Error> ClassInfo::CallMemberAwaitIfNeeded(const Member &member, std::span<const Any> args)
  {
    if (auto ok = CheckCallable(member); !ok)
      return std::unexpected(ok.error());
    spdlog::debug("inspect: calling '{}.{}' (await if needed)", Name(), member.Name());
    return member.CallAwaitIfNeeded(Instance(), args);
  }

  std::expected<Any, Error> ClassInfo::CallMemberNamed(const Member &member, const ArgMap &args)
  {
    if (auto ok = CheckCallable(member); !ok)
      return std::unexpected(ok.error());
    spdlog::debug("inspect: calling '{}.{}' with named arguments", Name(), member.Name());
    return member.CallNamed(Instance(), args);
  }

  SplitArgs ClassInfo::SplitInitArgs(const ArgMap &args, const Member &method) const
  {
    SplitArgs out;
    if (!m_initListed || method.IsStatic() || method.IsClassMethod())
    {
      out.method = args;
      return out;
    }
    for (const auto &entry : args)
    {
      if (m_init->GetSignature().HasParam(entry.first))
        out.init.push_back(entry);
      else
        out.method.push_back(entry);
    }
    return out;
  }

  std::string ClassInfo::ToString() const
  {
    std::string out{Name()};
    if (m_instantiated)
      out += " instance";
    if (!m_description.empty())
    {
      out += ": ";
      out += m_description;
    }
    for (const auto &m : m_members)
    {
      out += "\n  ";
      out += m.ToString();
    }
    return out;
  }

  nlohmann::json ClassInfo::ToData() const
  {
    nlohmann::json members = nlohmann::json::array();
    for (const auto &m : m_members)
      members.push_back(m.ToData());

    nlohmann::json j;
    j["name"] = std::string{Name()};
    j["qualified_name"] = std::string{QualifiedName()};
    j["description"] = m_description;
    j["docstring"] = std::string{Docstring()};
    j["has_init"] = HasInit();
    j["is_initialized"] = m_instantiated;
    j["members"] = std::move(members);
    return j;
  }

} // namespace NGIN::Inspect
