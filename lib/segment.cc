#include <lexicon/segment.hh>

using namespace lex;

auto lex::Split(const Lexicon& lexicon, str32 text) -> std::vector<Segment> {
    std::vector<Segment> segments;
    std::u32string_view v = text.text();
    if (not lexicon.ready()) Warning("Split(): dictionary accessed before it was loaded");
    for (usz i = 0; i < v.size();) {
        auto word = lexicon.ready() ? lexicon.longest_match(text, i) : std::nullopt;
        if (word) {
            segments.emplace_back(*word, i, lexicon.get(*word));
            i += word->size();
        } else {
            segments.emplace_back(str32{v.substr(i, 1)}, i, nullptr);
            i++;
        }
    }

    return segments;
}
