#include <NGIN/Inspect/Types.hpp>

namespace NGIN::Inspect
{

  std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
      case ErrorCode::NotFound: return "NotFound";
      case ErrorCode::InvalidArgument: return "InvalidArgument";
      case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
      case ErrorCode::InvalidKeyType: return "InvalidKeyType";
      case ErrorCode::AlreadyInitialized: return "AlreadyInitialized";
      case ErrorCode::NotInitialized: return "NotInitialized";
      case ErrorCode::UnsupportedObject: return "UnsupportedObject";
    }
    return "Unknown";
  }

  std::string_view ToString(ParameterKind kind) noexcept
  {
    switch (kind)
    {
      case ParameterKind::PositionalOnly: return "positional_only";
      case ParameterKind::PositionalOrKeyword: return "positional_or_keyword";
      case ParameterKind::VarPositional: return "var_positional";
      case ParameterKind::KeywordOnly: return "keyword_only";
      case ParameterKind::VarKeyword: return "var_keyword";
    }
    return "unknown";
  }

  std::string_view ToString(MemberKind kind) noexcept
  {
    switch (kind)
    {
      case MemberKind::Instance: return "instance";
      case MemberKind::Static: return "static";
      case MemberKind::Class: return "class";
      case MemberKind::Property: return "property";
    }
    return "unknown";
  }

  std::string_view ToString(Visibility visibility) noexcept
  {
    switch (visibility)
    {
      case Visibility::Public: return "public";
      case Visibility::Protected: return "protected";
      case Visibility::Private: return "private";
    }
    return "unknown";
  }

} // namespace NGIN::Inspect
