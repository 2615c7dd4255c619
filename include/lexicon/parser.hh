#ifndef LEXICON_PARSER_HH
#define LEXICON_PARSER_HH

#include <lexicon/core.hh>

namespace lex {
/// Characters we treat as whitespace when trimming and splitting lines.
/// These are the ASCII whitespace characters, the Unicode space separators,
/// the line and paragraph separators, and the byte order mark.
constexpr str32 Whitespace =
    U" \t\n\v\f\r\u00A0\u1680\u2000\u2001\u2002\u2003\u2004\u2005"
    U"\u2006\u2007\u2008\u2009\u200A\u2028\u2029\u202F\u205F\u3000\uFEFF";

/// Line terminators; these may separate fields but never occur inside one.
constexpr str32 LineTerminators = U"\n\r\u2028\u2029";

/// Parse a single line in CC-CEDICT format:
///
///     <traditional> <simplified> [<pronunciation>] /<gloss>/<gloss>/.../
///
/// Comments, empty lines, and anything that doesn’t have this shape
/// are rejected by returning std::nullopt; this is not an error.
[[nodiscard]] auto ParseLine(str32 line, char32_t comment_marker = U'#') -> std::optional<Entry>;
[[nodiscard]] auto ParseLine(str line, char32_t comment_marker = U'#') -> std::optional<Entry>;
} // namespace lex

#endif // LEXICON_PARSER_HH
