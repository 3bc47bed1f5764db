#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include <QTimer>

#include "ChapterLoadController.hpp"
#include "ReaderSettings.hpp"
#include "folio/core/Version.hpp"
#include "folio/core/book/DataUrlImageResolver.hpp"
#include "folio/core/book/DirectoryBook.hpp"
#include "folio/core/cache/CacheManager.hpp"
#include "folio/core/util/Errors.hpp"
#include "folio/core/util/Logging.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

auto main(int argc, char* argv[]) -> int
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Folio");
    QCoreApplication::setApplicationName("folio_read");
    QCoreApplication::setApplicationVersion(QString::fromStdString(ProjectInfo::VersionString()));

    QCommandLineParser parser;
    parser.setApplicationDescription("Folio - render one chapter of an extracted book");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("book", "Extracted book directory");

    QCommandLineOption chapterOption({"c", "chapter"}, "Chapter number, starting at 1", "number", "1");
    QCommandLineOption outputOption({"o", "output"}, "Write the rendered chapter to this file", "file");
    QCommandLineOption configOption("config", "Cache configuration JSON (overrides Folio.ini)", "file");
    QCommandLineOption logLevelOption("log-level", "debug, info, warn, error or off", "level", "warn");
    parser.addOption(chapterOption);
    parser.addOption(outputOption);
    parser.addOption(configOption);
    parser.addOption(logLevelOption);

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }

    bool numberOk = false;
    const int chapterNumber = parser.value(chapterOption).toInt(&numberOk);
    if (!numberOk || chapterNumber < 1) {
        std::cerr << "Invalid chapter number: " << parser.value(chapterOption).toStdString() << std::endl;
        return EXIT_FAILURE;
    }

    folio::SetLogLevel(parser.value(logLevelOption).toStdString());
    auto log = folio::Logger();

    std::unique_ptr<folio::CacheManager> caches;
    std::shared_ptr<folio::DirectoryBook> book;
    try {
        const folio::CacheConfig config = parser.isSet(configOption)
            ? folio::loadCacheConfig(parser.value(configOption).toStdString())
            : folio::reader::cacheConfigFromSettings();
        caches = std::make_unique<folio::CacheManager>(config, log);
        book = std::make_shared<folio::DirectoryBook>(positional.front().toStdString());
    } catch (const folio::Error& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    log->info("{} opened {} ({} chapters)", ProjectInfo::NameAndVersion(), book->identity(), book->chapterCount());

    folio::DataUrlImageResolver resolver(&caches->images(), log);
    folio::reader::ChapterLoadController controller(*caches, resolver, log);
    controller.setBook(book);

    const QString outputPath = parser.value(outputOption);
    int exitCode = EXIT_SUCCESS;

    QObject::connect(&controller, &folio::reader::ChapterLoadController::contentReady, &app,
                     [&](int, const QString& html) {
                         if (outputPath.isEmpty()) {
                             QTextStream(stdout) << html;
                         } else {
                             QFile file(outputPath);
                             if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
                                 std::cerr << "Cannot write " << outputPath.toStdString() << std::endl;
                                 exitCode = EXIT_FAILURE;
                             } else {
                                 file.write(html.toUtf8());
                             }
                         }
                         QCoreApplication::exit(exitCode);
                     });
    QObject::connect(&controller, &folio::reader::ChapterLoadController::errorOccurred, &app,
                     [&](const QString& title, const QString& message) {
                         std::cerr << title.toStdString() << ": " << message.toStdString() << std::endl;
                         QCoreApplication::exit(EXIT_FAILURE);
                     });

    QTimer::singleShot(0, &controller, [&]() { controller.requestChapter(chapterNumber - 1); });
    return QCoreApplication::exec();
}
