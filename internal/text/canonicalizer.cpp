#include "internal/text/canonicalizer.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>

namespace tasktree::text {

namespace {

constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";
constexpr std::size_t      kMaxEntityLength = 12;

constexpr std::array<std::string_view, 2> kDelegationTags = {"new_task", "message"};

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsAsciiAlpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

char AsciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool StartsWithIgnoreCase(std::string_view text, std::size_t pos, std::string_view prefix) {
  if (text.size() - pos < prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (AsciiLower(text[pos + i]) != prefix[i]) {
      return false;
    }
  }
  return true;
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<std::uint32_t> ParseNumericEntity(std::string_view body) {
  // body excludes '&#' and ';'
  int base = 10;
  if (!body.empty() && (body.front() == 'x' || body.front() == 'X')) {
    base = 16;
    body.remove_prefix(1);
  }
  if (body.empty()) {
    return std::nullopt;
  }

  std::uint32_t value = 0;
  for (char c : body) {
    std::uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<std::uint32_t>(c - '0');
    } else if (base == 16 && AsciiLower(c) >= 'a' && AsciiLower(c) <= 'f') {
      digit = static_cast<std::uint32_t>(AsciiLower(c) - 'a' + 10);
    } else {
      return std::nullopt;
    }
    value = value * static_cast<std::uint32_t>(base) + digit;
    if (value > 0x10FFFF) {
      return std::nullopt;
    }
  }
  if (value == 0 || (value >= 0xD800 && value <= 0xDFFF)) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> DecodeNamedEntity(std::string_view name) {
  std::string lowered;
  for (char c : name) {
    lowered.push_back(AsciiLower(c));
  }
  if (lowered == "lt") return std::string("<");
  if (lowered == "gt") return std::string(">");
  if (lowered == "amp") return std::string("&");
  if (lowered == "quot") return std::string("\"");
  if (lowered == "apos") return std::string("'");
  if (lowered == "nbsp") return std::string(" ");
  return std::nullopt;
}

// Finds `<tag` (case-insensitive) followed by '>' or whitespace at or after `from`.
std::size_t FindOpenTag(std::string_view text, std::string_view tag, std::size_t from) {
  for (auto pos = text.find('<', from); pos != std::string_view::npos; pos = text.find('<', pos + 1)) {
    if (!StartsWithIgnoreCase(text, pos + 1, tag)) {
      continue;
    }
    const auto after = pos + 1 + tag.size();
    if (after < text.size() && (text[after] == '>' || IsSpace(text[after]))) {
      return pos;
    }
  }
  return std::string_view::npos;
}

std::size_t FindCloseTag(std::string_view text, std::string_view tag, std::size_t from) {
  for (auto pos = text.find("</", from); pos != std::string_view::npos; pos = text.find("</", pos + 2)) {
    if (StartsWithIgnoreCase(text, pos + 2, tag) && pos + 2 + tag.size() < text.size() && text[pos + 2 + tag.size()] == '>') {
      return pos;
    }
  }
  return std::string_view::npos;
}

struct TagBlock {
  std::size_t begin;         // '<' of the opening tag
  std::size_t content_begin; // after the opening '>'
  std::size_t content_end;   // '<' of the closing tag
  std::size_t end;           // past the closing '>'
};

std::optional<TagBlock> FindBlock(std::string_view text, std::string_view tag, std::size_t from) {
  const auto open = FindOpenTag(text, tag, from);
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  const auto open_end = text.find('>', open);
  if (open_end == std::string_view::npos) {
    return std::nullopt;
  }
  const auto close = FindCloseTag(text, tag, open_end + 1);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  return TagBlock{open, open_end + 1, close, close + tag.size() + 3};
}

std::string Lowercase(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = AsciiLower(c);
  }
  return out;
}

std::string TrimView(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end   = text.size();
  while (begin < end && IsSpace(text[begin])) ++begin;
  while (end > begin && IsSpace(text[end - 1])) --end;
  return std::string(text.substr(begin, end - begin));
}

// Truncates to at most `k` code points without splitting a UTF-8 sequence.
std::string TruncateCodePoints(std::string_view text, std::size_t k) {
  std::size_t count = 0;
  std::size_t pos   = 0;
  while (pos < text.size() && count < k) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t width = 1;
    if (lead >= 0xF0) width = 4;
    else if (lead >= 0xE0) width = 3;
    else if (lead >= 0xC0) width = 2;
    pos = std::min(text.size(), pos + width);
    ++count;
  }

  std::string out(text.substr(0, pos));
  while (!out.empty() && IsSpace(out.back())) {
    out.pop_back();
  }
  return out;
}

template <typename Step>
std::string ApplyUntilStable(std::string text, Step step) {
  for (;;) {
    auto next = step(text);
    if (next == text) {
      return next;
    }
    text = std::move(next);
  }
}

} // namespace

// ---------------------------------------------------------------------------
// Steps
// ---------------------------------------------------------------------------

std::string StripByteOrderMark(std::string_view text) {
  if (text.substr(0, kByteOrderMark.size()) == kByteOrderMark) {
    text.remove_prefix(kByteOrderMark.size());
  }
  return std::string(text);
}

std::string Unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c != '\\' || i + 1 >= text.size()) {
      out.push_back(c);
      continue;
    }

    const char next = text[i + 1];
    switch (next) {
      case 'n':
      case 'N':
        out.push_back('\n');
        break;
      case 'r':
      case 'R':
        out.push_back('\r');
        break;
      case 't':
      case 'T':
        out.push_back('\t');
        break;
      case '\\':
      case '"':
      case '\'':
        out.push_back(next);
        break;
      default:
        out.push_back(c);
        continue;
    }
    ++i;
  }
  return out;
}

std::string DecodeEntities(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out.push_back(text[i++]);
      continue;
    }

    const auto semi = text.find(';', i + 1);
    if (semi == std::string_view::npos || semi - i > kMaxEntityLength) {
      out.push_back(text[i++]);
      continue;
    }

    const auto body = text.substr(i + 1, semi - i - 1);
    if (!body.empty() && body.front() == '#') {
      if (auto cp = ParseNumericEntity(body.substr(1))) {
        AppendUtf8(out, *cp);
        i = semi + 1;
        continue;
      }
    } else if (auto decoded = DecodeNamedEntity(body)) {
      out += *decoded;
      i = semi + 1;
      continue;
    }

    out.push_back(text[i++]);
  }
  return out;
}

std::vector<std::string> ExtractDelegationBlocks(std::string& text) {
  std::vector<std::string> fragments;

  std::size_t from = 0;
  for (;;) {
    std::optional<TagBlock> earliest;
    std::string_view        earliest_tag;
    for (const auto tag : kDelegationTags) {
      auto block = FindBlock(text, tag, from);
      if (block && (!earliest || block->begin < earliest->begin)) {
        earliest     = block;
        earliest_tag = tag;
      }
    }
    if (!earliest) {
      break;
    }

    std::string_view content = std::string_view(text).substr(earliest->content_begin, earliest->content_end - earliest->content_begin);

    // A new_task block carries its directive in an inner <message>; the
    // remaining children (<mode>, ...) are routing metadata.
    if (earliest_tag == "new_task") {
      if (auto message = FindBlock(content, "message", 0)) {
        content = content.substr(message->content_begin, message->content_end - message->content_begin);
      }
    }

    auto fragment = CollapseWhitespace(StripTags(content));
    fragment      = TrimView(fragment);
    if (!fragment.empty()) {
      fragments.push_back(std::move(fragment));
    }

    text.replace(earliest->begin, earliest->end - earliest->begin, " ");
    from = earliest->begin + 1;
  }

  return fragments;
}

std::string StripTags(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c == '<' && i + 1 < text.size() && (IsAsciiAlpha(text[i + 1]) || text[i + 1] == '/' || text[i + 1] == '!')) {
      const auto close      = text.find('>', i + 1);
      const auto next_open  = text.find('<', i + 1);
      if (close != std::string_view::npos && (next_open == std::string_view::npos || close < next_open)) {
        out.push_back(' ');
        i = close + 1;
        continue;
      }
    }
    out.push_back(c);
    ++i;
  }
  return out;
}

std::string CollapseWhitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  bool in_space = false;
  for (char c : text) {
    if (IsSpace(c)) {
      if (!in_space) {
        out.push_back(' ');
      }
      in_space = true;
      continue;
    }
    in_space = false;
    out.push_back(c);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Full pipeline
// ---------------------------------------------------------------------------

std::string_view Utf8Prefix(std::string_view text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

std::string Canonicalize(std::string_view raw, std::size_t k) {
  // Decoding and stripping run to a fixed point so that Canonicalize is
  // idempotent: nothing in the output can decode or strip further.
  auto text = ApplyUntilStable(StripByteOrderMark(raw), [](const std::string& current) { return DecodeEntities(Unescape(current)); });

  std::vector<std::string> fragments;
  text = ApplyUntilStable(std::move(text), [&fragments](const std::string& current) {
    std::string working = current;
    auto        found   = ExtractDelegationBlocks(working);
    fragments.insert(fragments.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    return StripTags(working);
  });

  for (const auto& fragment : fragments) {
    text.push_back(' ');
    text += fragment;
  }

  return TruncateCodePoints(TrimView(CollapseWhitespace(Lowercase(text))), k);
}

} // namespace tasktree::text
