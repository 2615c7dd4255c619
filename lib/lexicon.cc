#include <algorithm>
#include <lexicon/lexicon.hh>
#include <lexicon/parser.hh>

using namespace lex;

auto Lexicon::Build(str raw_text, const LoadOptions& options) -> Lexicon {
    Lexicon lexicon;
    std::u32string text = text::ToUTF32(raw_text);

    i64 line_number = 0;
    for (auto line : str32(text).split(U"\n")) {
        line_number++;
        auto entry = ParseLine(line, options.comment_marker);
        if (not entry) {
            lexicon.statistics.rejected++;
            continue;
        }

        // Both headwords refer to the same entry; the traditional and simplified
        // forms share a key space, so one entry can shadow another here.
        entry->line = line_number;
        auto index = lexicon.entries.size();
        auto traditional = text::ToUTF32(entry->traditional);
        auto simplified = text::ToUTF32(entry->simplified);
        lexicon.entries.push_back(std::move(*entry));
        lexicon.Insert(std::move(traditional), index);
        lexicon.Insert(std::move(simplified), index);
    }

    for (const auto& [key, _] : lexicon.keys)
        lexicon.statistics.max_key_length = std::max(lexicon.statistics.max_key_length, key.size());

    lexicon.statistics.lines = usz(line_number);
    lexicon.statistics.entries = lexicon.entries.size();
    lexicon.statistics.keys = lexicon.keys.size();
    lexicon.built = true;

    if (options.verbose) Note(
        "loaded {} entries from {} lines ({} skipped), {} keys, max key length = {}",
        lexicon.statistics.entries,
        lexicon.statistics.lines,
        lexicon.statistics.rejected,
        lexicon.statistics.keys,
        lexicon.statistics.max_key_length
    );

    return lexicon;
}

bool Lexicon::CheckReady(std::string_view operation) const {
    if (built) return true;
    Warning("{}: dictionary accessed before it was loaded", operation);
    return false;
}

auto Lexicon::get(str32 key) const -> const Entry* {
    if (not CheckReady("get()")) return nullptr;
    auto it = keys.find(key.text());
    if (it == keys.end()) return nullptr;
    return &entries[it->second];
}

auto Lexicon::get(str key) const -> const Entry* {
    auto k = text::ToUTF32(key);
    return get(str32{k});
}

void Lexicon::Insert(std::u32string key, usz index) {
    Assert(not key.empty(), "Headwords must not be empty");
    keys.insert_or_assign(std::move(key), index);
}

auto Lexicon::longest_match(str32 text, usz start) const -> std::optional<str32> {
    if (not CheckReady("longest_match()")) return std::nullopt;
    std::u32string_view v = text.text();
    if (start >= v.size()) return std::nullopt;

    // Try the longest candidate first, then shorten it.
    auto available = v.size() - start;
    for (usz len = std::min(statistics.max_key_length, available); len > 0; len--) {
        auto candidate = v.substr(start, len);
        if (keys.contains(candidate)) return str32{candidate};
    }

    return std::nullopt;
}
