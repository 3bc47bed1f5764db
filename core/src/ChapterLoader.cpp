#include "folio/core/loading/ChapterLoader.hpp"

#include "folio/core/book/ChapterSource.hpp"
#include "folio/core/book/ImageResolver.hpp"
#include "folio/core/cache/CacheManager.hpp"
#include "folio/core/util/Errors.hpp"

#include <optional>

namespace folio {

ChapterLoader::ChapterLoader(std::shared_ptr<const ChapterSource> book,
                             CacheManager& caches,
                             ImageResolver& resolver,
                             int chapterIndex,
                             Callbacks callbacks,
                             std::shared_ptr<MinimalLogger> log,
                             CancellationTokenPtr token)
    : _book(std::move(book)),
      _caches(caches),
      _resolver(resolver),
      _chapterIndex(chapterIndex),
      _callbacks(std::move(callbacks)),
      _log(LoggerOr(std::move(log))),
      _token(token ? std::move(token) : std::make_shared<CancellationToken>())
{
    if (!_book) {
        throw ConfigurationError("ChapterLoader requires a book");
    }
}

ChapterLoader::~ChapterLoader()
{
    if (_thread.joinable()) {
        _thread.join();
    }
}

std::string ChapterLoader::cacheKey(const std::string& bookIdentity, int chapterIndex)
{
    return bookIdentity + ":" + std::to_string(chapterIndex);
}

const char* ChapterLoader::stateName(State state)
{
    switch (state) {
        case State::Created: return "Created";
        case State::Running: return "Running";
        case State::Completed: return "Completed";
        case State::Cancelled: return "Cancelled";
        case State::Failed: return "Failed";
    }
    return "Unknown";
}

void ChapterLoader::start()
{
    if (_thread.joinable() || _state.load() != State::Created) {
        _log->warn("Chapter loader for chapter {} already started", _chapterIndex);
        return;
    }
    _thread = std::thread([this] { run(); });
}

void ChapterLoader::wait()
{
    if (_thread.joinable()) {
        _thread.join();
    }
}

void ChapterLoader::run()
{
    State expected = State::Created;
    if (!_state.compare_exchange_strong(expected, State::Running)) {
        return;
    }

    const Outcome outcome = load();
    _state = outcome.state;
    deliver(outcome);
}

ChapterLoader::Outcome ChapterLoader::load()
{
    const int number = _chapterIndex + 1;
    Outcome outcome;

    // Nothing, not even the book identity, is touched once cancelled up front
    if (_token->cancelled()) {
        _log->debug("Chapter loader: cancelled before start (chapter {})", _chapterIndex);
        outcome.state = State::Cancelled;
        return outcome;
    }

    try {
        const std::string key = cacheKey(_book->identity(), _chapterIndex);

        if (auto rendered = _caches.renderedChapters().get(key)) {
            _log->debug("Chapter loader: cache hit for chapter {}", _chapterIndex);
            outcome.state = State::Completed;
            outcome.html = std::move(*rendered);
            return outcome;
        }

        if (_token->cancelled()) {
            _log->debug("Chapter loader: cancelled after cache check (chapter {})", _chapterIndex);
            outcome.state = State::Cancelled;
            return outcome;
        }

        const std::string href = _book->chapterHref(_chapterIndex);

        std::string raw;
        if (auto cachedRaw = _caches.rawChapters().get(key)) {
            _log->debug("Chapter loader: raw cache hit for chapter {}", _chapterIndex);
            raw = std::move(*cachedRaw);
        } else {
            _log->debug("Chapter loader: loading chapter {} from book", _chapterIndex);
            raw = _book->chapterContent(_chapterIndex);
            _caches.rawChapters().set(key, raw);
        }

        if (_token->cancelled()) {
            _log->debug("Chapter loader: cancelled before image resolution (chapter {})", _chapterIndex);
            outcome.state = State::Cancelled;
            return outcome;
        }

        _log->debug("Chapter loader: resolving images for chapter {}", _chapterIndex);
        std::string html = _resolver.resolve(raw, *_book, href);
        _caches.renderedChapters().set(key, html);

        if (_token->cancelled()) {
            _log->debug("Chapter loader: cancelled before delivery (chapter {})", _chapterIndex);
            outcome.state = State::Cancelled;
            return outcome;
        }

        outcome.state = State::Completed;
        outcome.html = std::move(html);
    } catch (const NotFoundError&) {
        outcome.state = State::Failed;
        outcome.errorTitle = "Chapter Not Found";
        outcome.errorMessage = "Chapter " + std::to_string(number) + " does not exist";
    } catch (const CorruptedContentError& e) {
        outcome.state = State::Failed;
        outcome.errorTitle = "Chapter Load Error";
        outcome.errorMessage = "Failed to load chapter " + std::to_string(number) + ": " + e.what();
    } catch (const std::exception& e) {
        outcome.state = State::Failed;
        outcome.errorTitle = "Error";
        outcome.errorMessage = "Unexpected error loading chapter " + std::to_string(number) + ": " + e.what();
    } catch (...) {
        outcome.state = State::Failed;
        outcome.errorTitle = "Error";
        outcome.errorMessage = "Unexpected error loading chapter " + std::to_string(number);
    }

    if (outcome.state == State::Failed) {
        _log->error("Chapter loader error: {}", outcome.errorMessage);
    }
    return outcome;
}

void ChapterLoader::deliver(const Outcome& outcome)
{
    try {
        if (outcome.state == State::Completed) {
            _log->debug("Chapter loader: chapter {} ready", _chapterIndex);
            if (_callbacks.contentReady) {
                _callbacks.contentReady(outcome.html);
            }
        } else if (outcome.state == State::Failed) {
            if (_callbacks.errorOccurred) {
                _callbacks.errorOccurred(outcome.errorTitle, outcome.errorMessage);
            }
        }
    } catch (const std::exception& e) {
        // A callback failure must not take down the worker thread
        _log->error("Chapter loader: callback for chapter {} threw: {}", _chapterIndex, e.what());
    } catch (...) {
        _log->error("Chapter loader: callback for chapter {} threw a non-standard exception", _chapterIndex);
    }
}

} // namespace folio
