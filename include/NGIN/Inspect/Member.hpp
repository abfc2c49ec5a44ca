// Member.hpp
// Classification of one class member against an immutable snapshot of its declaring hierarchy
#pragma once

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Signature.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace NGIN::Inspect
{

  // Method resolution order of a type, most-derived first. levels[0] is the declaring type.
  struct HierarchySnapshot
  {
    std::vector<Type> levels;

    [[nodiscard]] Type Declaring() const { return levels.empty() ? Type{} : levels.front(); }
  };

  // C3 linearization over the registered bases.
  [[nodiscard]] NGIN_INSPECT_API std::expected<HierarchySnapshot, Error> BuildHierarchy(Type type);

  struct MemberClassification
  {
    MemberKind kind{MemberKind::Instance};
    Visibility visibility{Visibility::Public};
    bool inherited{false};
    bool isConstructor{false};
    // Index into HierarchySnapshot::levels of the type that defines the member.
    NGIN::UIntSize definingLevel{0};
  };

  [[nodiscard]] NGIN_INSPECT_API Visibility ClassifyVisibility(std::string_view name, std::string_view declaringShortName);

  // The constructor is found under the declaring type's short name.
  [[nodiscard]] NGIN_INSPECT_API std::expected<MemberClassification, Error>
  ClassifyMember(std::string_view name, const HierarchySnapshot &snapshot);

  class NGIN_INSPECT_API Member
  {
  public:
    [[nodiscard]] static std::expected<Member, Error>
    Create(const HierarchySnapshot &snapshot, std::string_view name, const SignatureOptions &options = {});

    [[nodiscard]] const std::string &Name() const noexcept { return m_signature.Name(); }
    [[nodiscard]] const Signature &GetSignature() const noexcept { return m_signature; }
    [[nodiscard]] const std::vector<Parameter> &Parameters() const noexcept { return m_signature.Parameters(); }
    [[nodiscard]] const TypeDescriptor &ReturnType() const noexcept { return m_signature.ReturnType(); }
    [[nodiscard]] const std::string &Description() const noexcept { return m_signature.Description(); }
    [[nodiscard]] std::string_view Docstring() const noexcept { return m_signature.Docstring(); }
    [[nodiscard]] bool IsAwaitable() const noexcept { return m_signature.IsAwaitable(); }

    template <class Key>
    [[nodiscard]] std::expected<Parameter, Error> GetParam(const Key &key) const
    {
      return m_signature.GetParam(key);
    }

    [[nodiscard]] const MemberClassification &Classification() const noexcept { return m_class; }
    [[nodiscard]] MemberKind Kind() const noexcept { return m_class.kind; }
    [[nodiscard]] Visibility GetVisibility() const noexcept { return m_class.visibility; }
    [[nodiscard]] bool IsInherited() const noexcept { return m_class.inherited; }
    [[nodiscard]] bool IsConstructor() const noexcept { return m_class.isConstructor; }
    [[nodiscard]] bool IsStatic() const noexcept { return m_class.kind == MemberKind::Static; }
    [[nodiscard]] bool IsClassMethod() const noexcept { return m_class.kind == MemberKind::Class; }
    [[nodiscard]] bool IsProperty() const noexcept { return m_class.kind == MemberKind::Property; }
    [[nodiscard]] bool IsPublic() const noexcept { return m_class.visibility == Visibility::Public; }
    [[nodiscard]] bool IsProtected() const noexcept { return m_class.visibility == Visibility::Protected; }
    [[nodiscard]] bool IsPrivate() const noexcept { return m_class.visibility == Visibility::Private; }
    // Static and class methods, and the constructor, run without an instance.
    [[nodiscard]] bool NeedsReceiver() const noexcept
    {
      return !m_class.isConstructor && (m_class.kind == MemberKind::Instance || m_class.kind == MemberKind::Property);
    }

    [[nodiscard]] Type DeclaringType() const noexcept { return m_declaring; }
    [[nodiscard]] Type DefiningType() const noexcept { return m_defining; }

    // `receiver` points at an object of the declaring type; it is upcast to the defining type.
    [[nodiscard]] std::expected<Any, Error> Call(void *receiver, std::span<const Any> args) const;
    [[nodiscard]] std::expected<Any, Error> CallNamed(void *receiver, const ArgMap &args) const;
    [[nodiscard]] std::expected<Any, Error> CallAwaitIfNeeded(void *receiver, std::span<const Any> args) const;

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] nlohmann::json ToData() const;

  private:
    Member(Signature signature, MemberClassification classification, Type declaring, Type defining, NGIN::UInt32 slot)
        : m_signature(std::move(signature)), m_class(classification), m_declaring(declaring), m_defining(defining), m_slot(slot)
    {
    }

    [[nodiscard]] const detail::CallableRuntimeDesc &Desc() const;
    [[nodiscard]] std::expected<Any, Error> Dispatch(void *receiver, const std::vector<Any> &args) const;

    Signature m_signature;
    MemberClassification m_class;
    Type m_declaring;
    Type m_defining;
    // Index into the defining type's member table; unused for the constructor.
    NGIN::UInt32 m_slot{0};
  };

} // namespace NGIN::Inspect
