#ifndef LEXICON_JSON_HH
#define LEXICON_JSON_HH

#include <lexicon/segment.hh>
#include <nlohmann/json.hpp>
#include <span>

namespace lex {
using nlohmann::json;

/// Convert an entry to JSON.
auto ToJson(const Entry& entry) -> json;

/// Convert a segmentation to a JSON array; matched segments include their entry.
auto ToJson(std::span<const Segment> segments) -> json;

/// Convert build statistics to JSON.
auto ToJson(const Stats& stats) -> json;

/// Serialise a JSON value the way the command-line tool prints it.
auto Dump(const json& j, bool minify) -> std::string;
} // namespace lex

#endif // LEXICON_JSON_HH
