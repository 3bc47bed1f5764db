#pragma once

// Shared fakes for the core tests: a recording logger, an in-memory book
// and a resolver that counts its calls.

#include "folio/core/book/ChapterSource.hpp"
#include "folio/core/book/ImageResolver.hpp"
#include "folio/core/util/Errors.hpp"
#include "folio/core/util/Logging.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace folio_test {

struct LogRecorder {
    std::mutex mutex;
    std::vector<std::pair<folio::LogLevel, std::string>> events;

    std::size_t count(folio::LogLevel level, const std::string& needle)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& [lvl, msg] : events) {
            if (lvl == level && msg.find(needle) != std::string::npos) ++n;
        }
        return n;
    }
};

// Logger with console output off; every message at debug and above lands in `recorder`
inline std::shared_ptr<folio::MinimalLogger> quietLogger(std::shared_ptr<LogRecorder> recorder = nullptr)
{
    auto log = std::make_shared<folio::MinimalLogger>("test");
    log->set_console(false);
    log->set_level(folio::LogLevel::Debug);
    if (recorder) {
        log->add_sink([recorder](folio::LogLevel level, const std::string& msg) {
            std::lock_guard<std::mutex> lock(recorder->mutex);
            recorder->events.emplace_back(level, msg);
        });
    }
    return log;
}

class FakeBook final : public folio::ChapterSource
{
public:
    explicit FakeBook(std::string identity, int chapters = 3)
        : _identity(std::move(identity)), _chapters(chapters)
    {
    }

    std::string identity() const override
    {
        ++identityCalls;
        if (onIdentity) onIdentity();
        return _identity;
    }

    int chapterCount() const override { return _chapters; }

    std::string chapterContent(int index) const override
    {
        ++contentCalls;
        check(index);
        if (onContent) onContent();
        if (index == corruptIndex) {
            throw folio::CorruptedContentError("bad markup");
        }
        if (index == brokenIndex) {
            throw std::runtime_error("disk on fire");
        }
        return "<p>chapter " + std::to_string(index) + "</p>";
    }

    std::string chapterHref(int index) const override
    {
        ++hrefCalls;
        check(index);
        if (onHref) onHref();
        return "text/ch" + std::to_string(index) + ".xhtml";
    }

    std::vector<uint8_t> resource(const std::string& href, const std::string&) const override
    {
        ++resourceCalls;
        throw folio::CorruptedContentError("no resource " + href);
    }

    int totalCalls() const { return identityCalls + contentCalls + hrefCalls + resourceCalls; }

    mutable std::atomic<int> identityCalls{0};
    mutable std::atomic<int> contentCalls{0};
    mutable std::atomic<int> hrefCalls{0};
    mutable std::atomic<int> resourceCalls{0};
    int corruptIndex = -1;
    int brokenIndex = -1;

    // Run inside the matching call, after the counters are bumped
    std::function<void()> onIdentity;
    std::function<void()> onContent;
    std::function<void()> onHref;

private:
    void check(int index) const
    {
        if (index < 0 || index >= _chapters) {
            throw folio::NotFoundError("no chapter " + std::to_string(index));
        }
    }

    std::string _identity;
    int _chapters;
};

class CountingResolver final : public folio::ImageResolver
{
public:
    std::string resolve(const std::string& html, const folio::ChapterSource&, const std::string&) override
    {
        ++calls;
        return "<rendered>" + html;
    }

    std::atomic<int> calls{0};
};

} // namespace folio_test
