// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL hook to describe a type's members
#pragma once

#include <NGIN/Inspect/Convert.hpp>
#include <NGIN/Inspect/DescribeType.hpp>
#include <NGIN/Inspect/NameUtils.hpp>
#include <NGIN/Inspect/Registry.hpp>

#include <future>
#include <initializer_list>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Inspect
{

  using ArgList = std::initializer_list<ArgSpec>;

  template <class T>
  class TypeBuilder
  {
  public:
    // Note: constructed by the registry when invoking the ADL hook; binds to a specific type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    // Qualified name override. Call before registering members: private names are
    // mangled with the short name current at registration.
    TypeBuilder &set_name(std::string_view qualified)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(qualified);
      reg.types[m_index].qualifiedNameId = id;
      reg.types[m_index].qualifiedName = detail::NameFromId(id);
      reg.byName.Insert(id, m_index);
      return *this;
    }

    TypeBuilder &doc(std::string_view docstring)
    {
      detail::GetRegistry().types[m_index].docstring = detail::InternName(docstring);
      return *this;
    }

    template <class B>
    TypeBuilder &base();

    // The first registered constructor becomes the type's init member.
    template <class... A>
    TypeBuilder &constructor(ArgList args = {}, std::string_view docstring = {});

    // Instance method; name optional and auto-derived if omitted.
    template <auto MemFn>
    TypeBuilder &method(std::string_view name = {}, ArgList args = {}, std::string_view docstring = {});

    template <auto Fn>
    TypeBuilder &static_method(std::string_view name, ArgList args = {}, std::string_view docstring = {});

    // Fn's first parameter receives the Type the method was resolved through.
    template <auto Fn>
    TypeBuilder &class_method(std::string_view name, ArgList args = {}, std::string_view docstring = {});

    // Zero-argument const getter exposed as a computed accessor.
    template <auto Getter>
    TypeBuilder &property(std::string_view name = {}, std::string_view docstring = {});

    TypeBuilder &enum_value(std::string_view name, T v)
    requires std::is_enum_v<T>;

  private:
    [[nodiscard]] std::string_view MemberName(std::string_view name) const;

    NGIN::UInt32 m_index{0};
  };

  // ==== Invocation machinery ====
  namespace detail
  {
    template <class R>
    struct AwaitTraits
    {
      static constexpr bool IsAwaitable = false;
      using Value = R;
    };

    template <class R>
    struct AwaitTraits<std::shared_future<R>>
    {
      static constexpr bool IsAwaitable = true;
      using Value = R;

      static std::expected<Any, Error> Await(const Any &pending)
      {
        if (pending.GetTypeId() != TypeIdOf<std::shared_future<R>>())
          return std::unexpected(Error{ErrorCode::InvalidArgument, "result is not awaitable"});
        auto future = pending.template Cast<std::shared_future<R>>();
        if constexpr (std::is_void_v<R>)
        {
          future.get();
          return Any::MakeVoid();
        }
        else
        {
          R value = future.get();
          return Any{std::move(value)};
        }
      }
    };

    template <class... A, class Fn, std::size_t... I>
    std::expected<Any, Error> CallConverted(Fn &&fn, const Any *args, std::index_sequence<I...>)
    {
      std::tuple<std::expected<std::remove_cvref_t<A>, Error>...> converted{ConvertAny<A>(args[I])...};
      if (!(std::get<I>(converted).has_value() && ...))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "argument conversion failed"});
      using R = decltype(fn(*std::get<I>(converted)...));
      if constexpr (std::is_void_v<R>)
      {
        fn(*std::get<I>(converted)...);
        return Any::MakeVoid();
      }
      else
      {
        auto r = fn(*std::get<I>(converted)...);
        return Any{std::move(r)};
      }
    }

    template <typename>
    struct MethodTraits;

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      template <auto MemFn>
      static std::expected<Any, Error> Invoke(void *obj, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        if (obj == nullptr)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "missing receiver"});
        auto *c = static_cast<C *>(obj);
        return CallConverted<A...>([c](auto &&...a) -> decltype(auto) { return (c->*MemFn)(a...); },
                                   args, std::index_sequence_for<A...>{});
      }
      template <class Fn>
      static decltype(auto) Describe(Fn &&fn) { return fn.template operator()<R, A...>(); }
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const>
    {
      using Class = C;
      using Ret = R;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      template <auto MemFn>
      static std::expected<Any, Error> Invoke(void *obj, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        if (obj == nullptr)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "missing receiver"});
        const auto *c = static_cast<const C *>(obj);
        return CallConverted<A...>([c](auto &&...a) -> decltype(auto) { return (c->*MemFn)(a...); },
                                   args, std::index_sequence_for<A...>{});
      }
      template <class Fn>
      static decltype(auto) Describe(Fn &&fn) { return fn.template operator()<R, A...>(); }
    };

    template <typename>
    struct FunctionTraits;

    template <class R, class... A>
    struct FunctionTraits<R (*)(A...)>
    {
      using Ret = R;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      template <auto Fn>
      static std::expected<Any, Error> Invoke(void *, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        return CallConverted<A...>([](auto &&...a) -> decltype(auto) { return Fn(a...); },
                                   args, std::index_sequence_for<A...>{});
      }
      template <class Fn>
      static decltype(auto) Describe(Fn &&fn) { return fn.template operator()<R, A...>(); }
    };

    template <typename>
    struct ClassMethodTraits;

    template <class R, class First, class... A>
    struct ClassMethodTraits<R (*)(First, A...)>
    {
      static_assert(std::is_same_v<std::remove_cvref_t<First>, NGIN::Inspect::Type>,
                    "class methods take the resolving Type as their first parameter");
      using Ret = R;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      template <auto Fn>
      static std::expected<Any, Error> Invoke(void *cls, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        if (cls == nullptr)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "missing class"});
        const auto type = *static_cast<const NGIN::Inspect::Type *>(cls);
        return CallConverted<A...>([&type](auto &&...a) -> decltype(auto) { return Fn(type, a...); },
                                   args, std::index_sequence_for<A...>{});
      }
      template <class Fn>
      static decltype(auto) Describe(Fn &&fn) { return fn.template operator()<R, A...>(); }
    };

    // Builds the registration record shared by every callable flavour.
    struct CallableDescFactory
    {
      std::string_view name;
      AttributeMarker marker;
      bool hasReceiver;
      ArgList args;
      std::string_view doc;

      template <class R, class... A>
      CallableRuntimeDesc operator()() const
      {
        using Await = AwaitTraits<std::remove_cvref_t<R>>;
        CallableRuntimeDesc d{};
        if (!name.empty())
        {
          d.nameId = InternNameId(name);
          d.name = NameFromId(d.nameId);
        }
        d.marker = marker;
        d.hasReceiver = hasReceiver;
        (d.paramTypes.PushBack(DescribeType<A>()), ...);
        for (const auto &a : args)
        {
          ArgSpec copy = a;
          copy.name = InternName(a.name);
          d.argSpecs.PushBack(std::move(copy));
        }
        if constexpr (std::is_same_v<std::remove_cvref_t<typename Await::Value>, Any>)
          d.returnType = TypeDescriptor{};
        else
          d.returnType = DescribeType<typename Await::Value>();
        if constexpr (Await::IsAwaitable)
          d.Await = &Await::Await;
        if (!doc.empty())
          d.docstring = InternName(doc);
        return d;
      }
    };

    template <class T, class... A>
    std::expected<Any, Error> ConstructFrom(const Any *args, NGIN::UIntSize count)
    {
      if (count != sizeof...(A))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
      return CallConverted<A...>([](auto &&...v) { return T(v...); }, args, std::index_sequence_for<A...>{});
    }

    [[nodiscard]] inline bool IsDunder(std::string_view name) noexcept
    {
      return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
    }

    // "_<ShortName>__"
    [[nodiscard]] inline std::string ManglingPrefix(std::string_view shortName)
    {
      std::string prefix{"_"};
      prefix.append(shortName);
      prefix.append("__");
      return prefix;
    }
  } // namespace detail

  template <class T>
  inline std::string_view TypeBuilder<T>::MemberName(std::string_view name) const
  {
    if (!name.starts_with("__") || detail::IsDunder(name))
      return name;
    const auto &reg = detail::GetRegistry();
    const auto shortName = Type{TypeHandle{m_index, reg.types[m_index].generation}}.Name();
    auto mangled = detail::ManglingPrefix(shortName);
    mangled.append(name.substr(2));
    return detail::InternName(mangled);
  }

  template <class T>
  template <class B>
  inline TypeBuilder<T> &TypeBuilder<T>::base()
  {
    static_assert(std::is_base_of_v<B, T>, "B must be a base of T");
    const auto baseIndex = detail::EnsureRegistered<B>();
    auto &reg = detail::GetRegistry();
    detail::BaseRuntimeDesc b{};
    b.baseTypeIndex = baseIndex;
    b.baseTypeId = reg.types[baseIndex].typeId;
    b.Upcast = [](void *p) -> void * { return static_cast<B *>(static_cast<T *>(p)); };
    auto &tdesc = reg.types[m_index];
    const auto newIndex = static_cast<NGIN::UInt32>(tdesc.bases.Size());
    tdesc.bases.PushBack(b);
    tdesc.baseIndex.Insert(b.baseTypeId, newIndex);
    return *this;
  }

  template <class T>
  template <class... A>
  inline TypeBuilder<T> &TypeBuilder<T>::constructor(ArgList args, std::string_view docstring)
  {
    detail::CtorRuntimeDesc c{};
    (c.paramTypeIds.PushBack(detail::TypeIdOf<A>()), ...);
    c.Construct = &detail::ConstructFrom<T, A...>;

    auto init = detail::CallableDescFactory{{}, detail::AttributeMarker::Constructor, false, args, docstring}.template operator()<void, A...>();
    init.Invoke = [](void *, const Any *a, NGIN::UIntSize count) { return detail::ConstructFrom<T, A...>(a, count); };

    auto &tdesc = detail::GetRegistry().types[m_index];
    tdesc.constructors.PushBack(std::move(c));
    if (!tdesc.hasInit)
    {
      tdesc.hasInit = true;
      tdesc.init = std::move(init);
    }
    return *this;
  }

  template <class T>
  template <auto MemFn>
  inline TypeBuilder<T> &TypeBuilder<T>::method(std::string_view name, ArgList args, std::string_view docstring)
  {
    using Traits = detail::MethodTraits<decltype(MemFn)>;
    static_assert(std::is_base_of_v<typename Traits::Class, T>, "method must belong to T");
    const auto svName = MemberName(name.empty() ? detail::MemberNameFromPretty<MemFn>() : name);
    auto d = Traits::Describe(detail::CallableDescFactory{svName, detail::AttributeMarker::Function, true, args, docstring});
    // Receivers arrive as T*; adjust when the function is declared on a base of T.
    d.Invoke = [](void *obj, const Any *a, NGIN::UIntSize count) -> std::expected<Any, Error>
    {
      auto *self = static_cast<T *>(obj);
      return Traits::template Invoke<MemFn>(static_cast<typename Traits::Class *>(self), a, count);
    };
    detail::AddMember(m_index, std::move(d));
    return *this;
  }

  template <class T>
  template <auto Fn>
  inline TypeBuilder<T> &TypeBuilder<T>::static_method(std::string_view name, ArgList args, std::string_view docstring)
  {
    using Traits = detail::FunctionTraits<decltype(Fn)>;
    auto d = Traits::Describe(detail::CallableDescFactory{MemberName(name), detail::AttributeMarker::StaticMethod, false, args, docstring});
    d.Invoke = &Traits::template Invoke<Fn>;
    detail::AddMember(m_index, std::move(d));
    return *this;
  }

  template <class T>
  template <auto Fn>
  inline TypeBuilder<T> &TypeBuilder<T>::class_method(std::string_view name, ArgList args, std::string_view docstring)
  {
    using Traits = detail::ClassMethodTraits<decltype(Fn)>;
    auto d = Traits::Describe(detail::CallableDescFactory{MemberName(name), detail::AttributeMarker::ClassMethod, false, args, docstring});
    d.Invoke = &Traits::template Invoke<Fn>;
    detail::AddMember(m_index, std::move(d));
    return *this;
  }

  template <class T>
  template <auto Getter>
  inline TypeBuilder<T> &TypeBuilder<T>::property(std::string_view name, std::string_view docstring)
  {
    using Traits = detail::MethodTraits<decltype(Getter)>;
    static_assert(Traits::Arity == 0, "property getters take no arguments");
    static_assert(std::is_base_of_v<typename Traits::Class, T>, "property must belong to T");
    const auto svName = MemberName(name.empty() ? detail::MemberNameFromPretty<Getter>() : name);
    auto d = Traits::Describe(detail::CallableDescFactory{svName, detail::AttributeMarker::Property, true, {}, docstring});
    d.Invoke = [](void *obj, const Any *a, NGIN::UIntSize count) -> std::expected<Any, Error>
    {
      auto *self = static_cast<T *>(obj);
      return Traits::template Invoke<Getter>(static_cast<typename Traits::Class *>(self), a, count);
    };
    detail::AddMember(m_index, std::move(d));
    return *this;
  }

  template <class T>
  inline TypeBuilder<T> &TypeBuilder<T>::enum_value(std::string_view name, T v)
  requires std::is_enum_v<T>
  {
    auto &e = detail::GetRegistry().types[m_index].enumInfo;
    e.isEnum = true;
    e.ToSigned = [](const Any &value) -> std::expected<std::int64_t, Error>
    {
      if (value.GetTypeId() != detail::TypeIdOf<T>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "type-id mismatch"});
      return static_cast<std::int64_t>(static_cast<std::underlying_type_t<T>>(value.template Cast<T>()));
    };
    detail::EnumValueRuntimeDesc ev{};
    ev.nameId = detail::InternNameId(name);
    ev.name = detail::NameFromId(ev.nameId);
    ev.value = Any{v};
    ev.svalue = static_cast<std::int64_t>(static_cast<std::underlying_type_t<T>>(v));
    const auto newIndex = static_cast<NGIN::UInt32>(e.values.Size());
    const auto nameId = ev.nameId;
    e.values.PushBack(std::move(ev));
    e.valueIndex.Insert(nameId, newIndex);
    return *this;
  }

  template <auto Fn>
  Function RegisterFunction(std::string_view name, std::initializer_list<ArgSpec> args, std::string_view doc)
  {
    using Traits = detail::FunctionTraits<decltype(Fn)>;
    auto d = Traits::Describe(detail::CallableDescFactory{name, detail::AttributeMarker::Function, false, args, doc});
    d.Invoke = &Traits::template Invoke<Fn>;
    auto &reg = detail::GetRegistry();
    if (auto *existing = reg.functionIndex.GetPtr(d.nameId))
    {
      reg.functions[*existing] = std::move(d);
      return Function{FunctionHandle{*existing}};
    }
    const auto newIndex = static_cast<NGIN::UInt32>(reg.functions.Size());
    const auto nameId = d.nameId;
    reg.functions.PushBack(std::move(d));
    reg.functionIndex.Insert(nameId, newIndex);
    return Function{FunctionHandle{newIndex}};
  }

} // namespace NGIN::Inspect
