#include <clopts.hh>
#include <iostream>
#include <lexicon/json.hh>
#include <lexicon/loader.hh>
#include <lexicon/segment.hh>

using namespace lex;

namespace cmd {
using namespace command_line_options;
using options = clopts< // clang-format off
    positional<"dictionary", "Dictionary file in CC-CEDICT format", file<>>,
    option<"--lookup", "Print the entry for a word">,
    option<"--segment", "Split text into dictionary words">,
    option<"--comment-marker", "Character that starts a comment line (default: '#')">,
    flag<"--stdin", "Split each line read from standard input">,
    flag<"--stats", "Print dictionary statistics">,
    flag<"--minify", "Emit compact JSON">,
    flag<"--verbose", "Print a summary after loading the dictionary">,
    help<>
>; // clang-format on
}

namespace {
auto Main(int argc, char** argv) -> Result<int> {
    auto opts = cmd::options::parse(argc, argv);
    bool minify = opts.get<"--minify">();

    LoadOptions options;
    options.verbose = opts.get<"--verbose">();
    if (auto marker = opts.get<"--comment-marker">()) {
        auto m = text::ToUTF32(*marker);
        if (m.size() != 1) return Error("--comment-marker must be a single character, got '{}'", *marker);
        options.comment_marker = m.front();
    }

    auto dict = opts.get<"dictionary">();
    Loader loader{std::make_unique<StringSource>(std::string{dict->contents}, dict->path.string()), options};
    auto lexicon = Try(loader.get());

    if (opts.get<"--stats">())
        std::println("{}", Dump(ToJson(lexicon->stats()), minify));

    if (auto word = opts.get<"--lookup">()) {
        auto entry = lexicon->get(str{*word});
        if (not entry) {
            std::println(stderr, "No entry for '{}'", *word);
            return 1;
        }

        std::println("{}", Dump(ToJson(*entry), minify));
    }

    if (auto input = opts.get<"--segment">()) {
        auto text = text::ToUTF32(*input);
        std::println("{}", Dump(ToJson(Split(*lexicon, str32{text})), minify));
    }

    // One document per line here, so always minify.
    if (opts.get<"--stdin">()) {
        for (std::string line; std::getline(std::cin, line);) {
            auto text = text::ToUTF32(line);
            std::println("{}", Dump(ToJson(Split(*lexicon, str32{text})), true));
        }
    }

    return 0;
}
} // namespace

int main(int argc, char** argv) {
    auto res = Main(argc, argv);
    if (not res.has_value()) {
        std::println(stderr, "Error: {}", res.error());
        return 1;
    }

    return res.value();
}
