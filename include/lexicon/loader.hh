#ifndef LEXICON_LOADER_HH
#define LEXICON_LOADER_HH

#include <base/Macros.hh>
#include <base/Result.hh>
#include <future>
#include <lexicon/lexicon.hh>
#include <memory>
#include <mutex>

namespace lex {
/// Supplies the raw dictionary text.
struct SourceFetcher {
    virtual ~SourceFetcher() = default;

    /// Get the entire contents of the dictionary.
    ///
    /// This is the only operation that is allowed to fail while loading
    /// a dictionary; it is called at most once per Loader.
    [[nodiscard]] virtual auto fetch() -> Result<std::string> = 0;

    /// Describe where the data comes from, for diagnostics.
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/// Dictionary data that is already in memory, e.g. a file that the
/// command-line parser has read for us.
class StringSource final : public SourceFetcher {
    std::string contents;
    std::string source_name;

public:
    explicit StringSource(std::string contents, std::string name = "<memory>")
        : contents(std::move(contents)), source_name(std::move(name)) {}

    auto fetch() -> Result<std::string> override { return contents; }
    auto name() const -> std::string override { return source_name; }
};

/// Loads a lexicon exactly once.
///
/// Callers that ask for the lexicon while it is still being built wait
/// for that build to finish instead of starting another one; everyone
/// gets the same instance. If the source can’t be fetched, the error is
/// handed to every caller; we don’t retry.
class Loader {
    LIBBASE_IMMOVABLE(Loader);
    using LoadResult = Result<std::shared_ptr<const Lexicon>>;

    std::unique_ptr<SourceFetcher> fetcher;
    LoadOptions options;
    std::mutex mutex;
    std::shared_future<LoadResult> pending;

public:
    explicit Loader(std::unique_ptr<SourceFetcher> fetcher, LoadOptions options = {})
        : fetcher(std::move(fetcher)), options(options) {}

    /// Get the lexicon, building it if this is the first call.
    ///
    /// Exceptions thrown while fetching or building are turned into
    /// an error, which is then handed to every caller.
    [[nodiscard]] auto get() -> LoadResult;

    /// Get the lexicon if it has been built already, without waiting.
    ///
    /// Returns nullptr if the build hasn’t started, is still in progress,
    /// or has failed.
    [[nodiscard]] auto peek() -> std::shared_ptr<const Lexicon>;

private:
    auto Load() -> LoadResult;
};
} // namespace lex

#endif // LEXICON_LOADER_HH
