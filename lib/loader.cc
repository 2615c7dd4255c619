#include <chrono>
#include <lexicon/loader.hh>

using namespace lex;

auto Loader::get() -> LoadResult {
    std::unique_lock lock{mutex};

    // Someone else has started loading; wait for them.
    if (pending.valid()) {
        auto f = pending;
        lock.unlock();
        return f.get();
    }

    // We’re first. Publish the future before releasing the lock so that
    // anyone who comes in after us waits on our build.
    std::promise<LoadResult> promise;
    pending = promise.get_future().share();
    lock.unlock();

    auto res = [&] -> LoadResult {
        try {
            return Load();
        } catch (const std::exception& e) {
            return Error("Failed to load dictionary from {}: {}", fetcher->name(), e.what());
        } catch (...) {
            return Error("Failed to load dictionary from {}: unknown exception", fetcher->name());
        }
    }();

    promise.set_value(res);
    return res;
}

auto Loader::Load() -> LoadResult {
    auto text = fetcher->fetch();
    if (not text) return Error("Failed to load dictionary from {}: {}", fetcher->name(), text.error());

    auto lexicon = std::make_shared<const Lexicon>(Lexicon::Build(text.value(), options));
    return lexicon;
}

auto Loader::peek() -> std::shared_ptr<const Lexicon> {
    std::shared_future<LoadResult> f;
    {
        std::unique_lock lock{mutex};
        if (not pending.valid()) return nullptr;
        f = pending;
    }

    if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return nullptr;
    const auto& res = f.get();
    return res ? res.value() : nullptr;
}
