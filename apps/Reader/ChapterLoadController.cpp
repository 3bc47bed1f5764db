#include "ChapterLoadController.hpp"

#include "folio/core/book/ChapterSource.hpp"
#include "folio/core/book/ImageResolver.hpp"
#include "folio/core/cache/CacheManager.hpp"
#include "folio/core/loading/ChapterLoader.hpp"

#include <QLoggingCategory>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>

Q_LOGGING_CATEGORY(lcReaderLoader, "folio.reader.loader")

namespace folio::reader {

ChapterLoadController::ChapterLoadController(CacheManager& caches,
                                             ImageResolver& resolver,
                                             std::shared_ptr<MinimalLogger> log,
                                             QObject* parent)
    : QObject(parent), _caches(caches), _resolver(resolver), _log(LoggerOr(std::move(log)))
{
}

ChapterLoadController::~ChapterLoadController()
{
    cancel();
    for (auto* watcher : _inFlight) {
        watcher->disconnect(this);
        watcher->waitForFinished();
        delete watcher;
    }
    _inFlight.clear();
}

void ChapterLoadController::setBook(std::shared_ptr<const ChapterSource> book)
{
    cancel();
    const bool changed = !_book || !book || _book->identity() != book->identity();
    if (changed) {
        _caches.clearAll();
        qCInfo(lcReaderLoader) << "Opened book"
                               << (book ? QString::fromStdString(book->identity()) : QString("<none>"));
    }
    _book = std::move(book);
    _currentChapter = -1;
}

void ChapterLoadController::cancel()
{
    if (_activeToken) {
        _activeToken->cancel();
        _activeToken.reset();
    }
    // Anything still running belongs to an older generation now
    ++_generation;
}

bool ChapterLoadController::requestChapter(int index)
{
    if (!_book) {
        qCWarning(lcReaderLoader) << "Chapter" << index << "requested with no book open";
        return false;
    }

    cancel();
    _currentChapter = index;
    _activeToken = std::make_shared<CancellationToken>();

    const quint64 generation = _generation;
    auto book = _book;
    auto token = _activeToken;
    CacheManager* caches = &_caches;
    ImageResolver* resolver = &_resolver;
    auto log = _log;

    qCDebug(lcReaderLoader) << "Loading chapter" << index << "generation" << generation;

    auto future = QtConcurrent::run([book, caches, resolver, log, token, index, generation]() {
        LoadResult result;
        result.index = index;
        result.generation = generation;

        ChapterLoader::Callbacks callbacks;
        callbacks.contentReady = [&result](const std::string& html) {
            result.completed = true;
            result.html = QString::fromStdString(html);
        };
        callbacks.errorOccurred = [&result](const std::string& title, const std::string& message) {
            result.failed = true;
            result.errorTitle = QString::fromStdString(title);
            result.errorMessage = QString::fromStdString(message);
        };

        ChapterLoader loader(book, *caches, *resolver, index, std::move(callbacks), log, token);
        loader.run();
        return result;
    });

    auto* watcher = new QFutureWatcher<LoadResult>();
    connect(watcher, &QFutureWatcher<LoadResult>::finished, this, [this, watcher]() { onLoadFinished(watcher); });
    _inFlight.push_back(watcher);
    watcher->setFuture(future);
    return true;
}

void ChapterLoadController::onLoadFinished(QFutureWatcher<LoadResult>* watcher)
{
    _inFlight.erase(std::remove(_inFlight.begin(), _inFlight.end(), watcher), _inFlight.end());
    const LoadResult result = watcher->result();
    watcher->deleteLater();

    if (result.generation != _generation || result.index != _currentChapter) {
        qCDebug(lcReaderLoader) << "Dropping stale result for chapter" << result.index;
        return;
    }
    _activeToken.reset();

    if (result.failed) {
        qCWarning(lcReaderLoader) << result.errorTitle << result.errorMessage;
        emit errorOccurred(result.errorTitle, result.errorMessage);
        return;
    }
    if (!result.completed) {
        return;
    }

    emit contentReady(result.index, result.html);

    _caches.logStats();
    _caches.checkMemoryThreshold();
}

void ChapterLoadController::waitForIdle()
{
    const auto pending = _inFlight;
    for (auto* watcher : pending) {
        watcher->waitForFinished();
    }
}

} // namespace folio::reader
