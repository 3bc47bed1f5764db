#include "folio/core/Version.hpp"
#include "folio/core/book/DataUrlImageResolver.hpp"
#include "folio/core/book/DirectoryBook.hpp"
#include "folio/core/cache/CacheManager.hpp"
#include "folio/core/loading/ChapterLoader.hpp"
#include "folio/core/util/Errors.hpp"
#include "folio/core/util/Logging.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;

int main(int argc, char** argv)
{
    po::options_description desc("Load every chapter of an extracted book and report cache behaviour.");
    desc.add_options()
        ("help,h", "Print help")
        ("version", "Print version")
        ("book", po::value<std::string>(), "Extracted book directory")
        ("config", po::value<std::string>(), "Cache configuration (.json)")
        ("passes", po::value<int>()->default_value(2), "Number of passes over all chapters")
        ("output", po::value<std::string>(), "Write the report to this file instead of stdout")
        ("log-level", po::value<std::string>()->default_value("warn"), "debug, info, warn, error or off")
        ("log-file", po::value<std::string>(), "Also write log messages to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }
    if (vm.count("version")) {
        std::cout << ProjectInfo::NameAndVersion() << std::endl;
        return 0;
    }
    if (!vm.count("book")) {
        std::cerr << "Error: --book is required." << std::endl;
        return 1;
    }

    const int passes = vm["passes"].as<int>();
    if (passes < 1) {
        std::cerr << "Error: --passes must be at least 1." << std::endl;
        return 1;
    }

    folio::SetLogLevel(vm["log-level"].as<std::string>());
    if (vm.count("log-file")) {
        folio::AddLogFile(vm["log-file"].as<std::string>());
    }
    auto log = folio::Logger();

    std::unique_ptr<folio::CacheManager> caches;
    std::shared_ptr<folio::DirectoryBook> book;
    try {
        folio::CacheConfig config;
        if (vm.count("config")) {
            config = folio::loadCacheConfig(vm["config"].as<std::string>());
        }
        caches = std::make_unique<folio::CacheManager>(config, log);
        book = std::make_shared<folio::DirectoryBook>(vm["book"].as<std::string>());
    } catch (const folio::Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    folio::DataUrlImageResolver resolver(&caches->images(), log);

    nlohmann::json report;
    report["version"] = ProjectInfo::VersionString();
    report["book"] = book->identity();
    report["chapter_count"] = book->chapterCount();
    report["config"] = caches->config();
    report["passes"] = nlohmann::json::array();

    int failures = 0;
    for (int pass = 0; pass < passes; ++pass) {
        nlohmann::json passReport;
        passReport["pass"] = pass + 1;
        passReport["chapters"] = nlohmann::json::array();
        double passMs = 0.0;

        for (int index = 0; index < book->chapterCount(); ++index) {
            std::string error;
            size_t htmlBytes = 0;
            folio::ChapterLoader::Callbacks callbacks;
            callbacks.contentReady = [&htmlBytes](const std::string& html) { htmlBytes = html.size(); };
            callbacks.errorOccurred = [&error](const std::string& title, const std::string& message) {
                error = title + ": " + message;
            };

            folio::ChapterLoader loader(book, *caches, resolver, index, std::move(callbacks), log);
            const auto start = std::chrono::steady_clock::now();
            loader.run();
            const double ms =
                std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            passMs += ms;

            nlohmann::json chapter = {{"index", index},
                                      {"href", book->chapterHref(index)},
                                      {"ms", ms},
                                      {"html_bytes", htmlBytes},
                                      {"state", folio::ChapterLoader::stateName(loader.state())}};
            if (!error.empty()) {
                chapter["error"] = error;
                ++failures;
            }
            passReport["chapters"].push_back(chapter);
        }

        passReport["total_ms"] = passMs;
        report["passes"].push_back(passReport);
        caches->checkMemoryThreshold();
    }

    report["cache_stats"] = caches->combinedStats();
    report["failures"] = failures;

    if (vm.count("output")) {
        const std::string outputPath = vm["output"].as<std::string>();
        std::ofstream o(outputPath);
        if (!o.is_open()) {
            std::cerr << "Error: Failed to open output file " << outputPath << std::endl;
            return 1;
        }
        o << report.dump(4);
    } else {
        std::cout << report.dump(4) << std::endl;
    }

    return failures ? 1 : 0;
}
