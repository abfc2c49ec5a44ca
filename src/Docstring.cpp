#include <NGIN/Inspect/Docstring.hpp>

#include <NGIN/Primitives.hpp>

#include <algorithm>
#include <array>

namespace NGIN::Inspect
{

  namespace
  {
    enum class SectionKind
    {
      None,
      Params,
      Returns,
      Other,
    };

    struct Line
    {
      std::string_view text;
      NGIN::UIntSize indent{0};
      bool blank{true};
    };

    constexpr std::array<std::string_view, 6> kParamSections{
        "Args", "Arguments", "Parameters", "Params", "Keyword Args", "Keyword Arguments",
    };
    constexpr std::array<std::string_view, 3> kReturnSections{"Returns", "Return", "Yields"};
    constexpr std::array<std::string_view, 13> kOtherSections{
        "Raises", "Exceptions", "Except", "Example", "Examples", "Attributes", "Note",
        "Notes", "See Also", "Todo", "Warning", "Warnings", "Other Parameters",
    };

    std::string_view Trim(std::string_view s) noexcept
    {
      while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r'))
        s.remove_prefix(1);
      while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
      return s;
    }

    std::vector<Line> SplitLines(std::string_view raw)
    {
      std::vector<Line> lines;
      NGIN::UIntSize start = 0;
      while (start <= raw.size())
      {
        auto end = raw.find('\n', start);
        if (end == std::string_view::npos)
          end = raw.size();
        std::string_view text = raw.substr(start, end - start);
        Line l{};
        l.text = Trim(text);
        l.blank = l.text.empty();
        while (l.indent < text.size() && (text[l.indent] == ' ' || text[l.indent] == '\t'))
          ++l.indent;
        lines.push_back(l);
        start = end + 1;
      }
      return lines;
    }

    template <std::size_t N>
    bool Contains(const std::array<std::string_view, N> &set, std::string_view title)
    {
      return std::find(set.begin(), set.end(), title) != set.end();
    }

    SectionKind SectionOf(const Line &l)
    {
      if (l.blank || l.text.back() != ':')
        return SectionKind::None;
      const auto title = Trim(l.text.substr(0, l.text.size() - 1));
      if (Contains(kParamSections, title))
        return SectionKind::Params;
      if (Contains(kReturnSections, title))
        return SectionKind::Returns;
      if (Contains(kOtherSections, title))
        return SectionKind::Other;
      return SectionKind::None;
    }

    void AppendText(std::string &dst, std::string_view text, char sep)
    {
      if (text.empty())
        return;
      if (!dst.empty())
        dst += sep;
      dst.append(text);
    }

    // "name (type, optional): description"
    DocstringParam ParseParamHead(std::string_view head)
    {
      DocstringParam p{};
      NGIN::UIntSize colon = std::string_view::npos;
      int depth = 0;
      for (NGIN::UIntSize i = 0; i < head.size(); ++i)
      {
        if (head[i] == '(')
          ++depth;
        else if (head[i] == ')')
          --depth;
        else if (head[i] == ':' && depth == 0)
        {
          colon = i;
          break;
        }
      }
      std::string_view spec = colon == std::string_view::npos ? head : head.substr(0, colon);
      if (colon != std::string_view::npos)
        p.description = std::string{Trim(head.substr(colon + 1))};

      const auto paren = spec.find('(');
      std::string_view name = Trim(paren == std::string_view::npos ? spec : spec.substr(0, paren));
      while (!name.empty() && name.front() == '*')
        name.remove_prefix(1);
      p.name = std::string{name};

      if (paren != std::string_view::npos)
      {
        auto close = spec.rfind(')');
        if (close == std::string_view::npos || close < paren)
          close = spec.size();
        std::string_view inner = Trim(spec.substr(paren + 1, close - paren - 1));
        constexpr std::string_view optionalTag{"optional"};
        if (inner.size() >= optionalTag.size() && inner.substr(inner.size() - optionalTag.size()) == optionalTag)
        {
          p.isOptional = true;
          inner = Trim(inner.substr(0, inner.size() - optionalTag.size()));
          if (!inner.empty() && inner.back() == ',')
            inner = Trim(inner.substr(0, inner.size() - 1));
        }
        p.typeName = std::string{inner};
      }
      return p;
    }
  } // namespace

  ParsedDocstring GoogleDocstringParser::Parse(std::string_view raw) const
  {
    ParsedDocstring out{};
    auto lines = SplitLines(raw);

    // Drop leading and trailing blank lines.
    NGIN::UIntSize first = 0;
    while (first < lines.size() && lines[first].blank)
      ++first;
    NGIN::UIntSize last = lines.size();
    while (last > first && lines[last - 1].blank)
      --last;
    if (first == last)
      return out;

    SectionKind section = SectionKind::None;
    NGIN::UIntSize entryIndent = 0;
    bool entryIndentKnown = false;
    bool seenBlankInDescription = false;
    bool summaryDone = false;
    DocstringParam *current = nullptr;

    for (NGIN::UIntSize i = first; i < last; ++i)
    {
      const auto &l = lines[i];
      if (const auto s = SectionOf(l); s != SectionKind::None)
      {
        section = s;
        entryIndentKnown = false;
        current = nullptr;
        continue;
      }

      switch (section)
      {
        case SectionKind::None:
          if (l.blank)
          {
            seenBlankInDescription = !out.longDescription.empty();
            break;
          }
          // Only the first line is the summary; any continuation starts the long description.
          if (!summaryDone)
          {
            out.shortDescription.assign(l.text);
            summaryDone = true;
            break;
          }
          AppendText(out.longDescription, l.text, seenBlankInDescription ? '\n' : ' ');
          seenBlankInDescription = false;
          break;

        case SectionKind::Params:
          if (l.blank)
            break;
          if (!entryIndentKnown)
          {
            entryIndent = l.indent;
            entryIndentKnown = true;
          }
          if (l.indent <= entryIndent)
          {
            out.params.push_back(ParseParamHead(l.text));
            current = &out.params.back();
          }
          else if (current != nullptr)
          {
            AppendText(current->description, l.text, '\n');
          }
          break;

        case SectionKind::Returns:
          if (!l.blank)
            AppendText(out.returns, l.text, '\n');
          break;

        case SectionKind::Other:
          break;
      }
    }
    return out;
  }

  const DocstringParser &DefaultDocstringParser() noexcept
  {
    static const GoogleDocstringParser parser{};
    return parser;
  }

} // namespace NGIN::Inspect
