#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tasktree::text {

inline constexpr std::size_t kDefaultPrefixLength = 192;

/*
  Canonicalizer

  Turns raw instruction / delegation text into the comparable prefix used
  as a lookup key. Both the declaring side (parent fragments) and the
  searching side (child instructions) must go through Canonicalize with
  the same K.

  Pipeline:
    BOM strip -> unescape -> entity decode -> extract delegation tags ->
    strip markup -> re-append fragments -> lowercase -> collapse spaces ->
    trim -> truncate to K (trailing whitespace trimmed).

  Total and pure: never throws, same input always yields the same output.
*/
std::string Canonicalize(std::string_view raw, std::size_t k = kDefaultPrefixLength);

// ---------------------------------------------------------------------------
// Individual steps, exposed for the delegation extractor and for tests.
// ---------------------------------------------------------------------------

std::string StripByteOrderMark(std::string_view text);

// Undo one level of string escaping: \n \r \t \\ \" \'
std::string Unescape(std::string_view text);

// &lt; &gt; &amp; &quot; &apos; &#NN; &#xNN;
std::string DecodeEntities(std::string_view text);

// Replaces every <new_task>/<message> block with a single space and
// returns the block contents (markup stripped, whitespace collapsed).
std::vector<std::string> ExtractDelegationBlocks(std::string& text);

std::string StripTags(std::string_view text);

std::string CollapseWhitespace(std::string_view text);

// Longest prefix of at most max_bytes that does not split a UTF-8
// sequence.
std::string_view Utf8Prefix(std::string_view text, std::size_t max_bytes);

} // namespace tasktree::text
