#ifndef LEXICON_CORE_HH
#define LEXICON_CORE_HH

#include <base/Base.hh>
#include <base/Macros.hh>
#include <base/Text.hh>
#include <functional>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace lex {
using namespace base;

/// A single dictionary entry.
struct Entry {
    /// Traditional-script headword.
    std::string traditional;

    /// Simplified-script headword; often identical to the traditional one.
    std::string simplified;

    /// Reading, e.g. 'jia1 ju4'. Not interpreted.
    std::string pronunciation;

    /// Glosses, primary sense first.
    std::vector<std::string> definitions;

    /// Line this entry was read from; 0 if it wasn’t read from a file.
    i64 line = 0;
};

/// Options that affect how a dictionary is loaded.
struct LoadOptions {
    /// Lines starting with this character are comments.
    char32_t comment_marker = U'#';

    /// Print a summary once the dictionary has been loaded.
    bool verbose = false;
};

/// Receives every diagnostic we emit, already formatted.
using DiagnosticHandler = std::function<void(std::string)>;

/// Replace the diagnostic handler and return the previous one. An empty
/// handler restores the default, which prints to stderr.
auto SetDiagnosticHandler(DiagnosticHandler handler) -> DiagnosticHandler;

namespace detail {
void EmitDiagnostic(std::string message);
}

template <typename... Args>
void Warning(std::format_string<Args...> fmt, Args&&... args) {
    detail::EmitDiagnostic(std::format("Warning: {}", std::format(fmt, LIBBASE_FWD(args)...)));
}

template <typename... Args>
void Note(std::format_string<Args...> fmt, Args&&... args) {
    detail::EmitDiagnostic(std::format("Note: {}", std::format(fmt, LIBBASE_FWD(args)...)));
}
} // namespace lex

#endif // LEXICON_CORE_HH
