#include "test.hpp"
#include "test_support.hpp"

#include "ChapterLoadController.hpp"
#include "ReaderSettings.hpp"
#include "folio/core/cache/CacheManager.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QSettings>
#include <QTemporaryDir>

using folio::CacheConfig;
using folio::CacheManager;
using folio::reader::ChapterLoadController;

namespace {

QCoreApplication& app()
{
    static int argc = 1;
    static char name[] = "test_chapter_load_controller";
    static char* argv[] = {name, nullptr};
    static QCoreApplication instance(argc, argv);
    return instance;
}

// Pumps the event loop until `done` holds or two seconds pass
template <typename Pred>
bool pumpUntil(Pred done)
{
    QElapsedTimer timer;
    timer.start();
    while (!done() && timer.elapsed() < 2000) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }
    return done();
}

struct Received {
    QList<int> indices;
    QStringList html;
    QStringList errors;
};

void track(ChapterLoadController& controller, Received& r)
{
    QObject::connect(&controller, &ChapterLoadController::contentReady, &controller,
                     [&r](int index, const QString& html) {
                         r.indices.append(index);
                         r.html.append(html);
                     });
    QObject::connect(&controller, &ChapterLoadController::errorOccurred, &controller,
                     [&r](const QString& title, const QString& message) {
                         r.errors.append(title + ": " + message);
                     });
}

} // namespace

TEST(ChapterLoadController, DeliversRequestedChapter)
{
    app();
    auto log = folio_test::quietLogger();
    CacheManager caches(CacheConfig{}, log, []() { return 1.0; });
    folio_test::CountingResolver resolver;
    ChapterLoadController controller(caches, resolver, log);
    Received r;
    track(controller, r);

    controller.setBook(std::make_shared<folio_test::FakeBook>("book.epub", 3));
    EXPECT_TRUE(controller.requestChapter(1));
    ASSERT_TRUE(pumpUntil([&] { return !r.indices.isEmpty(); }));

    EXPECT_EQ(r.indices.front(), 1);
    EXPECT_EQ(r.html.front(), QString("<rendered><p>chapter 1</p>"));
    EXPECT_TRUE(r.errors.isEmpty());
    EXPECT_TRUE(caches.renderedChapters().contains("book.epub:1"));
}

TEST(ChapterLoadController, OnlyLatestRequestIsDelivered)
{
    app();
    auto log = folio_test::quietLogger();
    CacheManager caches(CacheConfig{}, log, []() { return 1.0; });
    folio_test::CountingResolver resolver;
    ChapterLoadController controller(caches, resolver, log);
    Received r;
    track(controller, r);

    controller.setBook(std::make_shared<folio_test::FakeBook>("book.epub", 3));
    controller.requestChapter(0);
    controller.requestChapter(1);
    controller.requestChapter(2);
    controller.waitForIdle();
    ASSERT_TRUE(pumpUntil([&] { return !controller.loading(); }));

    ASSERT_EQ(r.indices.size(), 1);
    EXPECT_EQ(r.indices.front(), 2);
    EXPECT_EQ(controller.currentChapter(), 2);
}

TEST(ChapterLoadController, ErrorsAreForwarded)
{
    app();
    auto log = folio_test::quietLogger();
    CacheManager caches(CacheConfig{}, log, []() { return 1.0; });
    folio_test::CountingResolver resolver;
    ChapterLoadController controller(caches, resolver, log);
    Received r;
    track(controller, r);

    controller.setBook(std::make_shared<folio_test::FakeBook>("book.epub", 2));
    controller.requestChapter(5);
    ASSERT_TRUE(pumpUntil([&] { return !r.errors.isEmpty(); }));

    EXPECT_EQ(r.errors.front(), QString("Chapter Not Found: Chapter 6 does not exist"));
    EXPECT_TRUE(r.indices.isEmpty());
}

TEST(ChapterLoadController, OpeningAnotherBookClearsCaches)
{
    app();
    auto log = folio_test::quietLogger();
    CacheManager caches(CacheConfig{}, log, []() { return 1.0; });
    folio_test::CountingResolver resolver;
    ChapterLoadController controller(caches, resolver, log);

    controller.setBook(std::make_shared<folio_test::FakeBook>("first.epub", 2));
    caches.renderedChapters().set("first.epub:0", "x");

    // Reopening the same book keeps what is cached
    controller.setBook(std::make_shared<folio_test::FakeBook>("first.epub", 2));
    EXPECT_TRUE(caches.renderedChapters().contains("first.epub:0"));

    controller.setBook(std::make_shared<folio_test::FakeBook>("second.epub", 2));
    EXPECT_EQ(caches.combinedStats().totalItems, 0u);
}

TEST(ChapterLoadController, RequestWithoutBookIsRejected)
{
    app();
    auto log = folio_test::quietLogger();
    CacheManager caches(CacheConfig{}, log, []() { return 1.0; });
    folio_test::CountingResolver resolver;
    ChapterLoadController controller(caches, resolver, log);
    EXPECT_FALSE(controller.requestChapter(0));
    EXPECT_FALSE(controller.loading());
}

TEST(ReaderSettings, CacheConfigReadsIniKeys)
{
    app();
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QSettings settings(dir.filePath("Folio.ini"), QSettings::IniFormat);
    settings.setValue(folio::reader::settings::cache::RENDERED_MAX_CHAPTERS, 4);
    settings.setValue(folio::reader::settings::cache::MEMORY_THRESHOLD_MB, 256.5);
    settings.sync();

    const auto config = folio::reader::cacheConfigFromSettings(settings);
    EXPECT_EQ(config.renderedMaxChapters, 4);
    EXPECT_EQ(config.rawMaxChapters, 20);
    EXPECT_FLOAT_EQ(config.imageMaxMemoryMb, 50.0);
    EXPECT_FLOAT_EQ(config.memoryThresholdMb, 256.5);
}
