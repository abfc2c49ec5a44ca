#include <NGIN/Inspect/Member.hpp>
#include <NGIN/Inspect/TypeBuilder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>

namespace NGIN::Inspect
{

  using detail::GetRegistry;

  namespace
  {
    using Sequence = std::deque<NGIN::UInt32>;

    bool InTail(const Sequence &seq, NGIN::UInt32 candidate)
    {
      return std::find(seq.begin() + 1, seq.end(), candidate) != seq.end();
    }

    // L[C] = C + merge(L[B1], ..., L[Bn], [B1, ..., Bn])
    std::expected<Sequence, Error> Linearize(NGIN::UInt32 index)
    {
      const auto &bases = GetRegistry().types[index].bases;
      std::vector<Sequence> pending;
      Sequence direct;
      for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
      {
        auto sub = Linearize(bases[i].baseTypeIndex);
        if (!sub)
          return sub;
        pending.push_back(std::move(*sub));
        direct.push_back(bases[i].baseTypeIndex);
      }
      if (!direct.empty())
        pending.push_back(std::move(direct));

      Sequence out{index};
      for (;;)
      {
        std::erase_if(pending, [](const Sequence &s) { return s.empty(); });
        if (pending.empty())
          return out;

        std::optional<NGIN::UInt32> next;
        for (const auto &seq : pending)
        {
          const auto head = seq.front();
          if (std::none_of(pending.begin(), pending.end(), [head](const Sequence &s) { return InTail(s, head); }))
          {
            next = head;
            break;
          }
        }
        if (!next)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "inconsistent base order"});

        out.push_back(*next);
        for (auto &seq : pending)
        {
          if (seq.front() == *next)
            seq.pop_front();
        }
      }
    }

    const detail::CallableRuntimeDesc *FindOwnMember(Type level, std::string_view name, NGIN::UInt32 *slot = nullptr)
    {
      NameId nid{};
      if (!level.IsValid() || !detail::FindNameId(name, nid))
        return nullptr;
      const auto &tdesc = GetRegistry().types[level.Handle().index];
      const auto *p = tdesc.memberIndex.GetPtr(nid);
      if (p == nullptr)
        return nullptr;
      if (slot != nullptr)
        *slot = *p;
      return &tdesc.members[*p];
    }

    MemberKind KindFromMarker(detail::AttributeMarker marker)
    {
      switch (marker)
      {
      case detail::AttributeMarker::StaticMethod:
        return MemberKind::Static;
      case detail::AttributeMarker::ClassMethod:
        return MemberKind::Class;
      case detail::AttributeMarker::Property:
        return MemberKind::Property;
      default:
        return MemberKind::Instance;
      }
    }
  } // namespace

  std::expected<HierarchySnapshot, Error> BuildHierarchy(Type type)
  {
    if (!type.IsValid())
      return std::unexpected(Error{ErrorCode::UnsupportedObject, "type not registered"});
    auto order = Linearize(type.Handle().index);
    if (!order)
    {
      spdlog::warn("inspect: cannot linearize the bases of '{}'", type.QualifiedName());
      return std::unexpected(order.error());
    }
    HierarchySnapshot snapshot;
    const auto &reg = GetRegistry();
    for (auto idx : *order)
      snapshot.levels.emplace_back(TypeHandle{idx, reg.types[idx].generation});
    return snapshot;
  }

  Visibility ClassifyVisibility(std::string_view name, std::string_view declaringShortName)
  {
    if (name.starts_with(detail::ManglingPrefix(declaringShortName)))
      return Visibility::Private;
    if (name.starts_with('_') && !detail::IsDunder(name))
      return Visibility::Protected;
    return Visibility::Public;
  }

  std::expected<MemberClassification, Error> ClassifyMember(std::string_view name, const HierarchySnapshot &snapshot)
  {
    const auto declaring = snapshot.Declaring();
    if (!declaring.IsValid())
      return std::unexpected(Error{ErrorCode::UnsupportedObject, "empty hierarchy"});

    MemberClassification c{};
    if (name == declaring.Name() && declaring.HasInit())
    {
      c.isConstructor = true;
      return c;
    }

    for (NGIN::UIntSize level = 0; level < snapshot.levels.size(); ++level)
    {
      const auto *desc = FindOwnMember(snapshot.levels[level], name);
      if (desc == nullptr)
        continue;
      c.kind = KindFromMarker(desc->marker);
      c.visibility = ClassifyVisibility(name, declaring.Name());
      c.inherited = !declaring.HasOwnMember(name);
      c.definingLevel = level;
      return c;
    }
    return std::unexpected(Error{ErrorCode::NotFound, "member not found"});
  }

  std::expected<Member, Error> Member::Create(const HierarchySnapshot &snapshot, std::string_view name, const SignatureOptions &options)
  {
    auto c = ClassifyMember(name, snapshot);
    if (!c)
      return std::unexpected(c.error());
    const auto declaring = snapshot.Declaring();

    if (c->isConstructor)
    {
      const auto &init = GetRegistry().types[declaring.Handle().index].init;
      auto sig = ExtractSignature(init, options, declaring.Name());
      if (!sig)
        return std::unexpected(sig.error());
      return Member{std::move(*sig), *c, declaring, declaring, 0};
    }

    const auto defining = snapshot.levels[c->definingLevel];
    NGIN::UInt32 slot{0};
    const auto *desc = FindOwnMember(defining, name, &slot);
    auto sig = ExtractSignature(*desc, options, name);
    if (!sig)
      return std::unexpected(sig.error());
    return Member{std::move(*sig), *c, declaring, defining, slot};
  }

  const detail::CallableRuntimeDesc &Member::Desc() const
  {
    const auto &tdesc = GetRegistry().types[m_defining.Handle().index];
    return m_class.isConstructor ? tdesc.init : tdesc.members[m_slot];
  }

  std::expected<Any, Error> Member::Dispatch(void *receiver, const std::vector<Any> &args) const
  {
    if (!m_defining.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    const auto &desc = Desc();
    if (!desc.Invoke)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "member has no invoker"});
    const auto count = static_cast<NGIN::UIntSize>(args.size());

    if (m_class.kind == MemberKind::Class && !m_class.isConstructor)
    {
      // Class methods observe the type they were resolved through.
      Type cls = m_declaring;
      return desc.Invoke(&cls, args.data(), count);
    }
    if (!NeedsReceiver())
      return desc.Invoke(nullptr, args.data(), count);

    if (receiver == nullptr)
      return std::unexpected(Error{ErrorCode::NotInitialized, "member needs an instance"});
    void *self = m_declaring.Upcast(receiver, m_defining);
    if (self == nullptr)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver does not derive from the defining type"});
    return desc.Invoke(self, args.data(), count);
  }

  std::expected<Any, Error> Member::Call(void *receiver, std::span<const Any> args) const
  {
    auto bound = BindArguments(m_signature, args);
    if (!bound)
      return std::unexpected(bound.error());
    return Dispatch(receiver, *bound);
  }

  std::expected<Any, Error> Member::CallNamed(void *receiver, const ArgMap &args) const
  {
    auto bound = BindNamedArguments(m_signature, args);
    if (!bound)
      return std::unexpected(bound.error());
    return Dispatch(receiver, *bound);
  }

  std::expected<Any, Error> Member::CallAwaitIfNeeded(void *receiver, std::span<const Any> args) const
  {
    auto result = Call(receiver, args);
    if (!result)
      return result;
    const auto await = Desc().Await;
    if (await == nullptr)
      return result;
    return await(*result);
  }

  std::string Member::ToString() const
  {
    if (m_class.isConstructor)
      return m_signature.ToString();
    std::string out;
    if (m_class.kind != MemberKind::Instance)
    {
      out += '[';
      out += NGIN::Inspect::ToString(m_class.kind);
      out += "] ";
    }
    out += m_signature.ToString();
    return out;
  }

  nlohmann::json Member::ToData() const
  {
    auto j = m_signature.ToData();
    j["kind"] = NGIN::Inspect::ToString(m_class.kind);
    j["visibility"] = NGIN::Inspect::ToString(m_class.visibility);
    j["inherited"] = m_class.inherited;
    j["is_constructor"] = m_class.isConstructor;
    j["declaring_type"] = std::string{m_declaring.QualifiedName()};
    j["defining_type"] = std::string{m_defining.QualifiedName()};
    return j;
  }

} // namespace NGIN::Inspect
