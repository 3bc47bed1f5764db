#pragma once

#include "folio/core/loading/CancellationToken.hpp"
#include "folio/core/util/Logging.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace folio {

class CacheManager;
class ChapterSource;
class ImageResolver;

/**
 * @brief One-shot background load of a single chapter
 *
 * Looks the chapter up in the rendered cache, then the raw cache, then falls
 * back to the book and the image resolver, filling both caches on the way.
 * The result goes to exactly one of the callbacks, or to none if the load
 * was cancelled. Cancellation is checked before any work, after the rendered
 * lookup, before image resolution and before delivery; a step already in
 * progress always finishes, so caches may be warmed by a cancelled load.
 *
 * Failures are reported through errorOccurred; run() never throws.
 */
class ChapterLoader
{
public:
    enum class State { Created, Running, Completed, Cancelled, Failed };

    struct Callbacks {
        std::function<void(const std::string& html)> contentReady;
        std::function<void(const std::string& title, const std::string& message)> errorOccurred;
    };

    ChapterLoader(std::shared_ptr<const ChapterSource> book,
                  CacheManager& caches,
                  ImageResolver& resolver,
                  int chapterIndex,
                  Callbacks callbacks,
                  std::shared_ptr<MinimalLogger> log = nullptr,
                  CancellationTokenPtr token = nullptr);

    // Joins the worker thread if start() was called
    ~ChapterLoader();

    ChapterLoader(const ChapterLoader&) = delete;
    ChapterLoader& operator=(const ChapterLoader&) = delete;

    // Runs the load on the calling thread. Only the first call does anything.
    void run();

    // Runs the load on a new thread
    void start();
    void wait();

    void cancel() { _token->cancel(); }
    bool cancelled() const { return _token->cancelled(); }

    State state() const { return _state.load(); }
    int chapterIndex() const { return _chapterIndex; }
    const CancellationTokenPtr& token() const { return _token; }

    // "<book identity>:<chapter index>"
    static std::string cacheKey(const std::string& bookIdentity, int chapterIndex);

    static const char* stateName(State state);

private:
    struct Outcome {
        State state = State::Failed;
        std::string html;
        std::string errorTitle;
        std::string errorMessage;
    };

    Outcome load();
    void deliver(const Outcome& outcome);

    std::shared_ptr<const ChapterSource> _book;
    CacheManager& _caches;
    ImageResolver& _resolver;
    int _chapterIndex;
    Callbacks _callbacks;
    std::shared_ptr<MinimalLogger> _log;
    CancellationTokenPtr _token;

    std::atomic<State> _state{State::Created};
    std::thread _thread;
};

} // namespace folio
