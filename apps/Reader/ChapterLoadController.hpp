#pragma once

#include "folio/core/loading/CancellationToken.hpp"
#include "folio/core/util/Logging.hpp"

#include <QFutureWatcher>
#include <QObject>
#include <QString>

#include <memory>
#include <vector>

namespace folio {
class CacheManager;
class ChapterSource;
class ImageResolver;
}

namespace folio::reader {

// Runs chapter loads on the Qt thread pool and hands results back to the
// thread that owns the controller. Only the most recent request is ever
// delivered; older ones are cancelled and their completions dropped.
class ChapterLoadController : public QObject
{
    Q_OBJECT

public:
    ChapterLoadController(CacheManager& caches,
                          ImageResolver& resolver,
                          std::shared_ptr<MinimalLogger> log = nullptr,
                          QObject* parent = nullptr);
    ~ChapterLoadController() override;

    // Opening a different book empties every cache layer
    void setBook(std::shared_ptr<const ChapterSource> book);
    const std::shared_ptr<const ChapterSource>& book() const { return _book; }

    // Returns false if no book is open
    bool requestChapter(int index);

    void cancel();

    bool loading() const { return !_inFlight.empty(); }
    int currentChapter() const { return _currentChapter; }

    // Blocks until every started load has returned. Pending signals are
    // still delivered through the event loop.
    void waitForIdle();

signals:
    void contentReady(int index, const QString& html);
    void errorOccurred(const QString& title, const QString& message);

private:
    struct LoadResult
    {
        int index{-1};
        quint64 generation{0};
        bool completed{false};
        bool failed{false};
        QString html;
        QString errorTitle;
        QString errorMessage;
    };

    void onLoadFinished(QFutureWatcher<LoadResult>* watcher);

    CacheManager& _caches;
    ImageResolver& _resolver;
    std::shared_ptr<MinimalLogger> _log;
    std::shared_ptr<const ChapterSource> _book;

    quint64 _generation{0};
    int _currentChapter{-1};
    CancellationTokenPtr _activeToken;
    std::vector<QFutureWatcher<LoadResult>*> _inFlight;
};

} // namespace folio::reader
