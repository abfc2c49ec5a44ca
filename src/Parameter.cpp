#include <NGIN/Inspect/Parameter.hpp>

namespace NGIN::Inspect
{

  Parameter::Parameter(std::string name,
                       ParameterKind kind,
                       TypeDescriptor type,
                       std::optional<DefaultValue> defaultValue,
                       std::optional<std::string> description,
                       bool inferType)
      : m_name(std::move(name)),
        m_kind(kind),
        m_type(std::move(type)),
        m_default(std::move(defaultValue)),
        m_description(std::move(description))
  {
    if (inferType && m_type.IsUnset() && m_default.has_value())
      m_type = m_default->type;
  }

  Parameter Parameter::WithDescription(std::string description) const
  {
    Parameter copy = *this;
    copy.m_description = std::move(description);
    return copy;
  }

  std::string Parameter::ToString() const
  {
    std::string out;
    if (m_kind == ParameterKind::VarPositional)
      out += '*';
    else if (m_kind == ParameterKind::VarKeyword)
      out += "**";
    out += m_name;
    if (IsTyped())
    {
      out += ": ";
      out += RenderName(m_type);
    }
    if (m_default.has_value())
    {
      out += " = ";
      out += m_default->display;
    }
    return out;
  }

  nlohmann::json Parameter::ToData() const
  {
    nlohmann::json j;
    j["name"] = m_name;
    j["kind"] = NGIN::Inspect::ToString(m_kind);
    j["type"] = NGIN::Inspect::ToData(m_type);
    j["is_typed"] = IsTyped();
    j["is_required"] = IsRequired();
    j["has_default"] = HasDefault();
    j["default"] = m_default.has_value() ? m_default->data : nlohmann::json(nullptr);
    j["description"] = m_description.has_value() ? nlohmann::json(*m_description) : nlohmann::json(nullptr);
    return j;
  }

} // namespace NGIN::Inspect
