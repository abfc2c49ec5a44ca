// Registry.hpp
// Process-wide registration records for types and free functions, and the handle API over them
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Parameter.hpp>
#include <NGIN/Inspect/TypeDescriptor.hpp>
#include <NGIN/Inspect/Types.hpp>

namespace NGIN::Inspect
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace NGIN::Inspect: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    // Convenience wrappers using the global registry interner
    NGIN_INSPECT_API NameId InternNameId(std::string_view s) noexcept;
    NGIN_INSPECT_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    NGIN_INSPECT_API std::string_view NameFromId(NameId id) noexcept;
    // Intern a string into the registry's string storage and return a stable view
    NGIN_INSPECT_API std::string_view InternName(std::string_view s) noexcept;

    // Compute FNV-based type id for a type
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    // target: the receiver for instance members, a Type* for class methods, unused otherwise.
    using InvokeFn = std::expected<Any, Error> (*)(void *target, const Any *args, NGIN::UIntSize count);
    // Blocks on an awaitable result and returns the produced value.
    using AwaitFn = std::expected<Any, Error> (*)(const Any &pending);

    // What was registered under a name, before any binding happens.
    enum class AttributeMarker : NGIN::UInt8
    {
      Function = 0,
      StaticMethod = 1,
      ClassMethod = 2,
      Property = 3,
      Constructor = 4,
    };

    struct CallableRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      AttributeMarker marker{AttributeMarker::Function};
      bool hasReceiver{false};
      // One entry per declared C++ parameter; excludes the receiver and a class method's Type.
      NGIN::Containers::Vector<TypeDescriptor> paramTypes;
      NGIN::Containers::Vector<ArgSpec> argSpecs;
      TypeDescriptor returnType;
      std::string_view docstring;
      InvokeFn Invoke{nullptr};
      AwaitFn Await{nullptr};
    };

    struct EnumValueRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      Any value{};
      std::int64_t svalue{0};
    };

    struct EnumRuntimeDesc
    {
      bool isEnum{false};
      NGIN::Containers::Vector<EnumValueRuntimeDesc> values;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> valueIndex;
      std::expected<std::int64_t, Error> (*ToSigned)(const Any &){nullptr};
    };

    struct BaseRuntimeDesc
    {
      NGIN::UInt32 baseTypeIndex{static_cast<NGIN::UInt32>(-1)};
      NGIN::UInt64 baseTypeId{0};
      void *(*Upcast)(void *){nullptr};
    };

    struct CtorRuntimeDesc
    {
      NGIN::Containers::Vector<NGIN::UInt64> paramTypeIds;
      std::expected<Any, Error> (*Construct)(const Any *, NGIN::UIntSize){nullptr};
    };

    struct TypeRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UInt64 typeId;
      NGIN::UInt32 generation{0};
      std::string_view docstring;
      EnumRuntimeDesc enumInfo;
      NGIN::Containers::Vector<BaseRuntimeDesc> bases;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> baseIndex;
      NGIN::Containers::Vector<CtorRuntimeDesc> constructors;
      // The explicitly registered constructor, surfaced as the init member.
      bool hasInit{false};
      CallableRuntimeDesc init;
      // The type's own member namespace, in registration order.
      NGIN::Containers::Vector<CallableRuntimeDesc> members;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> memberIndex;
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;
      NGIN::Containers::Vector<CallableRuntimeDesc> functions;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> functionIndex;

      StringInterner names;
    };

    NGIN_INSPECT_API Registry &GetRegistry() noexcept;

    // Walks registered bases from `fromIndex` to `toIndex`; nullptr when unrelated.
    NGIN_INSPECT_API void *UpcastTo(NGIN::UInt32 fromIndex, void *obj, NGIN::UInt32 toIndex);

    // Adds or replaces a member in a type's own namespace.
    NGIN_INSPECT_API void AddMember(NGIN::UInt32 typeIndex, CallableRuntimeDesc desc);

    template <class T>
    concept HasNginInspectWithTypeBuilder = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void NginInspect(Tag<T>, TypeBuilder<T>&)
      { NginInspect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    // Detection for Describe<T>::Do(TypeBuilder<T>&)
    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(NGIN::Inspect::Describe<T>::Do(std::declval<TypeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithTypeBuilder = HasDescribeImpl<T>::value;

    template <class T>
    concept Registrable = HasNginInspectWithTypeBuilder<T> || HasDescribeWithTypeBuilder<T> || std::is_enum_v<T>;

    // Ensure a type is present; returns the type index
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(NGIN::Meta::TypeName<U>::qualifiedName);
      rec.qualifiedName = NameFromId(rec.qualifiedNameId); // default name derived; user override optional
      rec.typeId = tid;

      if constexpr (std::is_default_constructible_v<U> && std::is_copy_constructible_v<U>)
      {
        CtorRuntimeDesc c{};
        c.Construct = [](const Any *, NGIN::UIntSize cnt) -> std::expected<Any, Error>
        {
          if (cnt != 0)
            return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
          return Any{U{}};
        };
        rec.constructors.PushBack(std::move(c));
      }

      const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
      reg.types.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      reg.byName.Insert(reg.types[idx].qualifiedNameId, idx);
      // MSVC prefixes qualified names with "class ", "struct ", etc.
#if defined(_MSC_VER)
      {
        auto qn = reg.types[idx].qualifiedName;
        auto addAlias = [&](std::string_view prefix) {
          if (qn.size() > prefix.size() && qn.substr(0, prefix.size()) == prefix)
            reg.byName.Insert(InternNameId(qn.substr(prefix.size())), idx);
        };
        addAlias("class ");
        addAlias("struct ");
        addAlias("enum ");
      }
#endif

      if constexpr (HasNginInspectWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NginInspect(Tag<U>{}, b); // ADL: user describes members
      }
      else if constexpr (HasDescribeWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NGIN::Inspect::Describe<U>::Do(b); // Trait fallback: public access only
      }
      return idx;
    }

  } // namespace detail

  class NGIN_INSPECT_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.index < reg.types.Size() && reg.types[m_h.index].generation == m_h.generation;
    }
    [[nodiscard]] TypeHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view QualifiedName() const;
    // Qualified name without its namespaces.
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] std::string_view Docstring() const;

    [[nodiscard]] bool IsEnum() const;
    [[nodiscard]] NGIN::UIntSize EnumValueCount() const;
    [[nodiscard]] std::string_view EnumValueName(NGIN::UIntSize i) const;
    [[nodiscard]] std::expected<Any, Error> ParseEnum(std::string_view name) const;
    [[nodiscard]] std::optional<std::string_view> EnumName(const Any &value) const;

    [[nodiscard]] NGIN::UIntSize BaseCount() const;
    [[nodiscard]] Type BaseAt(NGIN::UIntSize i) const;
    [[nodiscard]] bool IsDerivedFrom(const Type &base) const;
    // Converts a pointer to this type into a pointer to `base` (direct or indirect).
    [[nodiscard]] void *Upcast(void *obj, const Type &base) const;

    [[nodiscard]] bool HasInit() const;
    [[nodiscard]] bool IsConstructible() const;
    [[nodiscard]] std::expected<Any, Error> Construct(const Any *args, NGIN::UIntSize count) const;
    [[nodiscard]] std::expected<Any, Error> Construct(std::span<const Any> args) const
    {
      return Construct(args.data(), static_cast<NGIN::UIntSize>(args.size()));
    }

    [[nodiscard]] NGIN::UIntSize OwnMemberCount() const;
    [[nodiscard]] std::string_view OwnMemberName(NGIN::UIntSize i) const;
    [[nodiscard]] bool HasOwnMember(std::string_view name) const;

    [[nodiscard]] bool operator==(const Type &other) const noexcept
    {
      return m_h.index == other.m_h.index && m_h.generation == other.m_h.generation;
    }

  private:
    TypeHandle m_h{};
  };

  class NGIN_INSPECT_API Function
  {
  public:
    constexpr Function() = default;
    explicit constexpr Function(FunctionHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      return m_h.IsValid() && m_h.index < detail::GetRegistry().functions.Size();
    }
    [[nodiscard]] FunctionHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] std::string_view Docstring() const;
    [[nodiscard]] bool IsAwaitable() const;

    [[nodiscard]] std::expected<Any, Error> Invoke(const Any *args, NGIN::UIntSize count) const;
    [[nodiscard]] std::expected<Any, Error> Invoke(std::span<const Any> args) const
    {
      return Invoke(args.data(), static_cast<NGIN::UIntSize>(args.size()));
    }

  private:
    FunctionHandle m_h{};
  };

  // Function registry queries
  [[nodiscard]] NGIN_INSPECT_API NGIN::UIntSize FunctionCount();
  [[nodiscard]] NGIN_INSPECT_API ExpectedFunction GetFunction(std::string_view name);

  // Register a free or static function in the global registry
  template <auto Fn>
  Function RegisterFunction(std::string_view name, std::initializer_list<ArgSpec> args = {}, std::string_view doc = {});

  // Queries
  [[nodiscard]] NGIN_INSPECT_API ExpectedType GetType(std::string_view name);
  [[nodiscard]] NGIN_INSPECT_API std::optional<Type> FindType(std::string_view name);

  template <class T>
  Type GetType()
  {
    auto idx = detail::EnsureRegistered<T>();
    const auto &reg = detail::GetRegistry();
    return Type{TypeHandle{idx, reg.types[idx].generation}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    using U = std::remove_cvref_t<T>;
    auto &reg = detail::GetRegistry();
    const auto tid = detail::TypeIdOf<U>();
    if (auto *p = reg.byTypeId.GetPtr(tid))
      return Type{TypeHandle{*p, reg.types[*p].generation}};
    return std::nullopt;
  }

} // namespace NGIN::Inspect
