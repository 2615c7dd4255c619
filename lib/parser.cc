#include <lexicon/parser.hh>

using namespace lex;

namespace {
bool IsSpace(char32_t c) { return Whitespace.contains(c); }

bool HasLineTerminator(std::u32string_view s) {
    return s.find_first_of(LineTerminators.text()) != std::u32string_view::npos;
}

/// Parse the line given that the traditional headword ends at 'trad',
/// which must be a whitespace character.
auto ParseFields(std::u32string_view v, usz trad) -> std::optional<Entry> {
    auto rest = v.substr(trad + 1);

    // The simplified headword is the shortest non-empty run that is followed
    // by whitespace and '['. This means it can contain spaces itself.
    usz simp = 1;
    while (simp + 1 < rest.size() and not (IsSpace(rest[simp]) and rest[simp + 1] == U'[')) simp++;
    if (simp + 1 >= rest.size()) return std::nullopt;
    auto tail = rest.substr(simp + 2);

    // Same for the pronunciation, which is terminated by '] /'.
    usz pron = 1;
    while (pron + 2 < tail.size() and not (tail[pron] == U']' and IsSpace(tail[pron + 1]) and tail[pron + 2] == U'/')) pron++;
    if (pron + 2 >= tail.size()) return std::nullopt;

    // Whatever is left is the gloss list sans the outer slashes.
    auto simplified = rest.substr(0, simp);
    auto pronunciation = tail.substr(0, pron);
    auto glosses = tail.substr(pron + 3);
    if (glosses.empty()) return std::nullopt;

    // A longer simplified headword or pronunciation would still contain
    // the terminator, so there is nothing else to try here.
    if (HasLineTerminator(simplified) or HasLineTerminator(pronunciation) or HasLineTerminator(glosses))
        return std::nullopt;

    Entry entry;
    entry.traditional = text::ToUTF8(str32{v.substr(0, trad)});
    entry.simplified = text::ToUTF8(str32{simplified});
    entry.pronunciation = text::ToUTF8(str32{pronunciation});
    for (auto gloss : str32{glosses}.split(U"/"))
        if (not gloss.empty()) entry.definitions.push_back(text::ToUTF8(gloss));
    return entry;
}
} // namespace

auto lex::ParseLine(str32 line, char32_t comment_marker) -> std::optional<Entry> {
    while (line.starts_with_any(Whitespace)) line.drop();
    while (line.ends_with_any(Whitespace)) line.drop_back();
    if (line.empty() or line.starts_with(comment_marker)) return std::nullopt;

    // The gloss list must be terminated by a slash; drop it here so
    // the opening slash is the last thing we have to search for.
    if (not line.ends_with(U'/')) return std::nullopt;
    line.drop_back();
    std::u32string_view v = line.text();

    // The traditional headword normally extends up to the first whitespace
    // character. It only extends further if the rest of the line can’t be
    // parsed otherwise, e.g. because the simplified headword would contain
    // a line terminator; it can never contain one itself.
    for (usz trad = 1; trad < v.size(); trad++) {
        if (LineTerminators.contains(v[trad - 1])) break;
        if (not IsSpace(v[trad])) continue;
        if (auto entry = ParseFields(v, trad)) return entry;
    }

    return std::nullopt;
}

auto lex::ParseLine(str line, char32_t comment_marker) -> std::optional<Entry> {
    auto text = text::ToUTF32(line);
    return ParseLine(str32{text}, comment_marker);
}
