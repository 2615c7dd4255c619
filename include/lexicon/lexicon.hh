#ifndef LEXICON_LEXICON_HH
#define LEXICON_LEXICON_HH

#include <lexicon/core.hh>
#include <unordered_map>

namespace lex {
/// Counters collected while building a lexicon.
struct Stats {
    /// Lines in the source, including comments and blank lines.
    usz lines = 0;

    /// Lines that produced an entry.
    usz entries = 0;

    /// Lines that were skipped (comments, blank or malformed lines).
    usz rejected = 0;

    /// Distinct keys in the index.
    usz keys = 0;

    /// Length of the longest key, in code points.
    usz max_key_length = 0;
};

/// Dictionary index.
///
/// Every entry is reachable through both its traditional and simplified
/// headword. If several entries share a key, the one that comes last in
/// the source wins.
///
/// A lexicon is immutable once built and can be queried concurrently. A
/// default-constructed lexicon is not ready: all queries against it fail
/// and log a warning.
class Lexicon {
    struct KeyHash {
        using is_transparent = void;
        auto operator()(std::u32string_view key) const noexcept -> usz {
            return std::hash<std::u32string_view>{}(key);
        }
    };

    /// All entries, in source order. Entries that have been shadowed
    /// by a later entry with the same key are still kept here.
    std::vector<Entry> entries;

    /// Maps headwords to indices into 'entries'.
    std::unordered_map<std::u32string, usz, KeyHash, std::equal_to<>> keys;

    /// Build statistics.
    Stats statistics;

    /// Whether this has been built.
    bool built = false;

public:
    /// Create a lexicon that isn’t ready yet.
    Lexicon() = default;

    /// Build a lexicon from the contents of a dictionary file.
    ///
    /// Lines that can’t be parsed are skipped; this never fails.
    [[nodiscard]] static auto Build(str raw_text, const LoadOptions& options = {}) -> Lexicon;

    /// Look up an entry by headword. Returns nullptr if there is none.
    [[nodiscard]] auto get(str32 key) const -> const Entry*;
    [[nodiscard]] auto get(str key) const -> const Entry*;

    /// Find the longest key that occurs in 'text' at code point offset 'start'.
    ///
    /// The returned view points into 'text'.
    [[nodiscard]] auto longest_match(str32 text, usz start) const -> std::optional<str32>;

    /// Length of the longest key, in code points.
    [[nodiscard]] auto max_key_length() const -> usz { return statistics.max_key_length; }

    /// Whether the lexicon has been built.
    [[nodiscard]] bool ready() const { return built; }

    /// Get build statistics.
    [[nodiscard]] auto stats() const -> const Stats& { return statistics; }

private:
    bool CheckReady(std::string_view operation) const;
    void Insert(std::u32string key, usz index);
};
} // namespace lex

#endif // LEXICON_LEXICON_HH
