#ifndef LEXICON_SEGMENT_HH
#define LEXICON_SEGMENT_HH

#include <lexicon/lexicon.hh>

namespace lex {
/// A span of segmented text.
struct Segment {
    /// The text of this segment; this is a view into the input.
    str32 text;

    /// Offset of the segment in the input, in code points.
    usz offset = 0;

    /// The entry this matched, or nullptr if this is a single
    /// character that isn’t in the dictionary.
    const Entry* entry = nullptr;

    [[nodiscard]] bool matched() const { return entry != nullptr; }
    [[nodiscard]] auto length() const -> usz { return text.size(); }
};

/// Split text into the longest dictionary words, left to right.
///
/// At each position, the longest key that matches there becomes a
/// segment; if nothing matches, the character on its own does. The
/// segments cover the entire input, in order.
[[nodiscard]] auto Split(const Lexicon& lexicon, str32 text) -> std::vector<Segment>;
} // namespace lex

#endif // LEXICON_SEGMENT_HH
