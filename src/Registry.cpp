#include <NGIN/Inspect/Registry.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace NGIN::Inspect::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  std::string_view InternName(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.Intern(s);
  }

  void *UpcastTo(NGIN::UInt32 fromIndex, void *obj, NGIN::UInt32 toIndex)
  {
    if (obj == nullptr)
      return nullptr;
    if (fromIndex == toIndex)
      return obj;
    const auto &reg = GetRegistry();
    if (fromIndex >= reg.types.Size())
      return nullptr;
    const auto &bases = reg.types[fromIndex].bases;
    for (NGIN::UIntSize i = 0; i < bases.Size(); ++i)
    {
      const auto &b = bases[i];
      if (!b.Upcast)
        continue;
      if (void *p = UpcastTo(b.baseTypeIndex, b.Upcast(obj), toIndex))
        return p;
    }
    return nullptr;
  }

  void AddMember(NGIN::UInt32 typeIndex, CallableRuntimeDesc desc)
  {
    auto &tdesc = GetRegistry().types[typeIndex];
    if (auto *existing = tdesc.memberIndex.GetPtr(desc.nameId))
    {
      tdesc.members[*existing] = std::move(desc);
      return;
    }
    const auto newIndex = static_cast<NGIN::UInt32>(tdesc.members.Size());
    const auto nameId = desc.nameId;
    tdesc.members.PushBack(std::move(desc));
    tdesc.memberIndex.Insert(nameId, newIndex);
  }

} // namespace NGIN::Inspect::detail

namespace NGIN::Inspect
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsTypeAlive(TypeHandle h)
    {
      if (!h.IsValid())
        return false;
      const auto &reg = GetRegistry();
      return h.index < reg.types.Size() && reg.types[h.index].generation == h.generation;
    }

    // Exact match, or a pair the argument conversion can bridge.
    bool ParamAccepts(NGIN::UInt64 have, NGIN::UInt64 want)
    {
      using detail::TypeIdOf;
      if (have == want || want == TypeIdOf<Any>() || have == TypeIdOf<std::nullptr_t>())
        return true;
      static const NGIN::UInt64 numeric[] = {
          TypeIdOf<bool>(), TypeIdOf<char>(), TypeIdOf<signed char>(), TypeIdOf<unsigned char>(),
          TypeIdOf<short>(), TypeIdOf<unsigned short>(), TypeIdOf<int>(), TypeIdOf<unsigned int>(),
          TypeIdOf<long>(), TypeIdOf<unsigned long>(), TypeIdOf<long long>(), TypeIdOf<unsigned long long>(),
          TypeIdOf<float>(), TypeIdOf<double>(), TypeIdOf<long double>(),
      };
      bool haveNum = false;
      bool wantNum = false;
      for (auto id : numeric)
      {
        haveNum = haveNum || id == have;
        wantNum = wantNum || id == want;
      }
      if (haveNum && wantNum)
        return true;
      const auto str = TypeIdOf<std::string>();
      return want == str && (have == TypeIdOf<const char *>() || have == TypeIdOf<std::string_view>());
    }
  } // namespace

  // Type
  std::string_view Type::QualifiedName() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    const auto &reg = GetRegistry();
    return reg.types[m_h.index].qualifiedName;
  }

  std::string_view Type::Name() const
  {
    auto qn = QualifiedName();
    const auto lt = qn.find('<');
    const auto dc = qn.rfind("::", lt);
    if (dc == std::string_view::npos)
      return qn;
    return qn.substr(dc + 2);
  }

  NGIN::UInt64 Type::GetTypeId() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    const auto &reg = GetRegistry();
    return reg.types[m_h.index].typeId;
  }

  std::string_view Type::Docstring() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    const auto &reg = GetRegistry();
    return reg.types[m_h.index].docstring;
  }

  bool Type::IsEnum() const
  {
    if (!IsTypeAlive(m_h))
      return false;
    const auto &reg = GetRegistry();
    return reg.types[m_h.index].enumInfo.isEnum;
  }

  NGIN::UIntSize Type::EnumValueCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    const auto &reg = GetRegistry();
    return reg.types[m_h.index].enumInfo.values.Size();
  }

  std::string_view Type::EnumValueName(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return {};
    const auto &values = GetRegistry().types[m_h.index].enumInfo.values;
    if (i >= values.Size())
      return {};
    return values[i].name;
  }

  std::expected<Any, Error> Type::ParseEnum(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &e = GetRegistry().types[m_h.index].enumInfo;
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = e.valueIndex.GetPtr(nid))
        return e.values[*p].value;
    }
    return std::unexpected(Error{ErrorCode::NotFound, "enum value not found"});
  }

  std::optional<std::string_view> Type::EnumName(const Any &value) const
  {
    if (!IsTypeAlive(m_h))
      return std::nullopt;
    const auto &e = GetRegistry().types[m_h.index].enumInfo;
    if (!e.ToSigned)
      return std::nullopt;
    auto v = e.ToSigned(value);
    if (!v)
      return std::nullopt;
    for (NGIN::UIntSize i = 0; i < e.values.Size(); ++i)
    {
      if (e.values[i].svalue == *v)
        return e.values[i].name;
    }
    return std::nullopt;
  }

  NGIN::UIntSize Type::BaseCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].bases.Size();
  }

  Type Type::BaseAt(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return Type{};
    const auto &reg = GetRegistry();
    const auto &bases = reg.types[m_h.index].bases;
    if (i >= bases.Size())
      return Type{};
    const auto bi = bases[i].baseTypeIndex;
    return Type{TypeHandle{bi, reg.types[bi].generation}};
  }

  bool Type::IsDerivedFrom(const Type &base) const
  {
    if (!IsTypeAlive(m_h) || !base.IsValid())
      return false;
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (tdesc.baseIndex.GetPtr(base.GetTypeId()) != nullptr)
      return true;
    for (NGIN::UIntSize i = 0; i < tdesc.bases.Size(); ++i)
    {
      if (BaseAt(i).IsDerivedFrom(base))
        return true;
    }
    return false;
  }

  void *Type::Upcast(void *obj, const Type &base) const
  {
    if (!IsTypeAlive(m_h) || !base.IsValid())
      return nullptr;
    return detail::UpcastTo(m_h.index, obj, base.m_h.index);
  }

  bool Type::HasInit() const
  {
    if (!IsTypeAlive(m_h))
      return false;
    return GetRegistry().types[m_h.index].hasInit;
  }

  bool Type::IsConstructible() const
  {
    if (!IsTypeAlive(m_h))
      return false;
    return GetRegistry().types[m_h.index].constructors.Size() != 0;
  }

  std::expected<Any, Error> Type::Construct(const Any *args, NGIN::UIntSize count) const
  {
    if (!IsTypeAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &tdesc = GetRegistry().types[m_h.index];
    if (tdesc.constructors.Size() == 0)
      return std::unexpected(Error{ErrorCode::UnsupportedObject, "type has no constructor"});

    // First registered constructor whose parameters accept every argument.
    for (NGIN::UIntSize i = 0; i < tdesc.constructors.Size(); ++i)
    {
      const auto &c = tdesc.constructors[i];
      if (c.paramTypeIds.Size() != count || !c.Construct)
        continue;
      bool ok = true;
      for (NGIN::UIntSize k = 0; k < count && ok; ++k)
        ok = ParamAccepts(args[k].GetTypeId(), c.paramTypeIds[k]);
      if (ok)
        return c.Construct(args, count);
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "no viable constructor"});
  }

  NGIN::UIntSize Type::OwnMemberCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].members.Size();
  }

  std::string_view Type::OwnMemberName(NGIN::UIntSize i) const
  {
    if (!IsTypeAlive(m_h))
      return {};
    const auto &members = GetRegistry().types[m_h.index].members;
    if (i >= members.Size())
      return {};
    return members[i].name;
  }

  bool Type::HasOwnMember(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return false;
    NameId nid{};
    if (!detail::FindNameId(name, nid))
      return false;
    return GetRegistry().types[m_h.index].memberIndex.GetPtr(nid) != nullptr;
  }

  // Function
  std::string_view Function::Name() const
  {
    if (!IsValid())
      return {};
    return GetRegistry().functions[m_h.index].name;
  }

  std::string_view Function::Docstring() const
  {
    if (!IsValid())
      return {};
    return GetRegistry().functions[m_h.index].docstring;
  }

  bool Function::IsAwaitable() const
  {
    if (!IsValid())
      return false;
    return GetRegistry().functions[m_h.index].Await != nullptr;
  }

  std::expected<Any, Error> Function::Invoke(const Any *args, NGIN::UIntSize count) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &f = GetRegistry().functions[m_h.index];
    if (!f.Invoke)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "function has no invoker"});
    return f.Invoke(nullptr, args, count);
  }

  NGIN::UIntSize FunctionCount()
  {
    return GetRegistry().functions.Size();
  }

  ExpectedFunction GetFunction(std::string_view name)
  {
    const auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.functionIndex.GetPtr(nid))
        return Function{FunctionHandle{*p}};
    }
    return std::unexpected(Error{ErrorCode::NotFound, "function not found"});
  }

  ExpectedType GetType(std::string_view name)
  {
    auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.byName.GetPtr(nid))
        return Type{TypeHandle{*p, reg.types[*p].generation}};
    }
    return std::unexpected(Error{ErrorCode::NotFound, "type not found"});
  }

  std::optional<Type> FindType(std::string_view name)
  {
    auto t = GetType(name);
    if (!t)
      return std::nullopt;
    return *t;
  }

} // namespace NGIN::Inspect
