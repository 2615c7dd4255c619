#include <lexicon/json.hh>

using namespace lex;

auto lex::ToJson(const Entry& entry) -> json {
    json e = json::object();
    e["traditional"] = entry.traditional;
    e["simplified"] = entry.simplified;
    e["pronunciation"] = entry.pronunciation;
    e["definitions"] = entry.definitions;
    return e;
}

auto lex::ToJson(std::span<const Segment> segments) -> json {
    json out = json::array();
    for (const auto& s : segments) {
        json& j = out.emplace_back();
        j["text"] = text::ToUTF8(s.text);
        j["offset"] = s.offset;
        j["length"] = s.length();
        j["matched"] = s.matched();
        if (s.matched()) j["entry"] = ToJson(*s.entry);
    }
    return out;
}

auto lex::ToJson(const Stats& stats) -> json {
    json j = json::object();
    j["lines"] = stats.lines;
    j["entries"] = stats.entries;
    j["rejected"] = stats.rejected;
    j["keys"] = stats.keys;
    j["max-key-length"] = stats.max_key_length;
    return j;
}

auto lex::Dump(const json& j, bool minify) -> std::string {
    return minify ? j.dump() : j.dump(4);
}
