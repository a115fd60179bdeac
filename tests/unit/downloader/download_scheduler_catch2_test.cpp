#include <catch2/catch_test_macros.hpp>

#include <orderpix/downloader/download_scheduler.hpp>
#include <orderpix/downloader/file_writer.hpp>

#include "../../support/scripted_http_transport.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace orderpix::downloader;
using namespace orderpix::test_support;
using namespace std::chrono_literals;

namespace {

std::vector<ImageReference> refsFor(const std::vector<std::string>& urls) {
    std::vector<ImageReference> refs;
    for (const auto& u : urls)
        refs.push_back(ImageReference{u, ".jpg"});
    return refs;
}

SchedulerOptions fastOptions(int workers = 1) {
    SchedulerOptions opts;
    opts.workers = workers;
    opts.retry = RetryPolicy{3, 5ms, 2.0, 50ms};
    return opts;
}

// Writer that fails for one file name and delegates the rest.
class SelectiveFailingWriter final : public IFileWriter {
public:
    explicit SelectiveFailingWriter(std::string failName) : failName_(std::move(failName)) {}

    Expected<void> write(const fs::path& finalPath, std::span<const std::byte> bytes) override {
        if (finalPath.filename() == failName_)
            return Error{ErrorCode::FilesystemError, "No space left on device"};
        return inner_.write(finalPath, bytes);
    }

private:
    std::string failName_;
    FileWriter inner_;
};

} // namespace

TEST_CASE("targetFileName: derived from the original path", "[downloader][scheduler]") {
    CHECK(targetFileName("https://x.test/orderfiles/a.jpg?width=1") == "a.jpg");
    CHECK(targetFileName("https://x.test/orderfiles/my%20photo.jpg") == "my photo.jpg");
    CHECK(targetFileName("https://x.test/dir/a%2Fb.jpg") == "a_b.jpg");
    CHECK(targetFileName("https://x.test/dir/a%5Cb%0A.jpg") == "a_b_.jpg");
    CHECK(targetFileName("https://x.test/dir/", ".png") == "image.png");
}

TEST_CASE("FileNameAllocator: deterministic collision suffixes", "[downloader][scheduler]") {
    FileNameAllocator names;
    CHECK(names.claim("a.jpg") == "a.jpg");
    CHECK(names.claim("a.jpg") == "a_1.jpg");
    CHECK(names.claim("a_1.jpg") == "a_1_1.jpg");
    CHECK(names.claim("a.jpg") == "a_2.jpg");
    // Case-insensitive: "A.JPG" competes with "a.jpg", "a_1.jpg" and "a_2.jpg"
    CHECK(names.claim("A.JPG") == "A_3.JPG");
    CHECK(names.claim("noext") == "noext");
    CHECK(names.claim("noext") == "noext_1");
}

TEST_CASE("DownloadScheduler: plan", "[downloader][scheduler]") {
    auto transport = std::make_shared<ScriptedHttpTransport>();
    auto opts = fastOptions();
    opts.transform.removeWidthHeight = true;
    DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), opts);

    auto tasks = scheduler.plan(refsFor({
                                    "https://a.test/1/img.jpg?width=5&height=6&v=1",
                                    "https://b.test/2/img.jpg",
                                    "https://c.test/3/other.jpg",
                                    "https://d.test/4/img.jpg",
                                }),
                                "/out");
    REQUIRE(tasks.size() == 4);
    CHECK(tasks[0].sourceUrl == "https://a.test/1/img.jpg?v=1");
    CHECK(tasks[0].originalUrl == "https://a.test/1/img.jpg?width=5&height=6&v=1");
    CHECK(tasks[0].targetPath == fs::path("/out") / "img.jpg");
    CHECK(tasks[1].targetPath == fs::path("/out") / "img_1.jpg");
    CHECK(tasks[2].targetPath == fs::path("/out") / "other.jpg");
    CHECK(tasks[3].targetPath == fs::path("/out") / "img_2.jpg");
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        CHECK(tasks[i].index == i);
        CHECK(tasks[i].status == TaskStatus::Pending);
        CHECK(tasks[i].attempts == 0);
    }
}

TEST_CASE("DownloadScheduler: per-task retry", "[downloader][scheduler]") {
    auto tmp = TempDirScope::unique_under("orderpix-sched-retry");
    auto transport = std::make_shared<ScriptedHttpTransport>();
    RecordingSleeper sleeper;
    DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(),
                                sleeper.fn());
    const std::string url = "https://cdn.test/a.jpg";

    SECTION("Always transient: maxAttempts attempts then Failed") {
        transport->script(url, {network_error()});
        auto results = scheduler.run(refsFor({url}), tmp.path());
        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == Outcome::Failed);
        CHECK(results[0].task.status == TaskStatus::Failed);
        CHECK(results[0].task.attempts == 3);
        CHECK(transport->callsFor(url) == 3);
        REQUIRE(results[0].error.has_value());
        CHECK(results[0].error->code == ErrorCode::NetworkError);
        CHECK(sleeper.delays() == std::vector<std::chrono::milliseconds>{5ms, 10ms});
        CHECK_FALSE(fs::exists(tmp.path() / "a.jpg"));
    }

    SECTION("Success on attempt 2 of 3") {
        transport->script(url, {makeHttpStatusError(503, url), ok_response("IMG")});
        auto results = scheduler.run(refsFor({url}), tmp.path());
        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == Outcome::Succeeded);
        CHECK(results[0].task.status == TaskStatus::Succeeded);
        CHECK(results[0].task.attempts == 2);
        CHECK(results[0].bytes == 3);
        CHECK_FALSE(results[0].error.has_value());
        CHECK(read_file(tmp.path() / "a.jpg") == "IMG");
    }

    SECTION("429 is retried") {
        transport->script(url, {makeHttpStatusError(429, url), ok_response("IMG")});
        auto results = scheduler.run(refsFor({url}), tmp.path());
        CHECK(results[0].outcome == Outcome::Succeeded);
        CHECK(results[0].task.attempts == 2);
    }

    SECTION("404 is terminal without retry") {
        transport->script(url, {makeHttpStatusError(404, url)});
        auto results = scheduler.run(refsFor({url}), tmp.path());
        CHECK(results[0].outcome == Outcome::Failed);
        CHECK(results[0].task.attempts == 1);
        REQUIRE(results[0].error.has_value());
        CHECK(results[0].error->code == ErrorCode::HttpClientError);
        REQUIRE(results[0].error->httpStatus.has_value());
        CHECK(*results[0].error->httpStatus == 404);
        CHECK(sleeper.delays().empty());
    }
}

TEST_CASE("DownloadScheduler: failures are isolated", "[downloader][scheduler]") {
    auto tmp = TempDirScope::unique_under("orderpix-sched-isolation");
    auto transport = std::make_shared<ScriptedHttpTransport>();
    const std::vector<std::string> urls = {
        "https://cdn.test/ok1.jpg", "https://cdn.test/gone.jpg", "https://cdn.test/disk.jpg",
        "https://cdn.test/ok2.jpg"};
    transport->respond(urls[0], "1");
    transport->script(urls[1], {makeHttpStatusError(410, urls[1])});
    transport->respond(urls[2], "3");
    transport->respond(urls[3], "4");

    auto writer = std::make_shared<SelectiveFailingWriter>("disk.jpg");
    DownloadScheduler scheduler(transport, writer, fastOptions(2), [](auto) {});
    auto results = scheduler.run(refsFor(urls), tmp.path());

    REQUIRE(results.size() == 4);
    CHECK(results[0].outcome == Outcome::Succeeded);
    CHECK(results[1].outcome == Outcome::Failed);
    CHECK(results[2].outcome == Outcome::Failed);
    CHECK(results[3].outcome == Outcome::Succeeded);

    REQUIRE(results[2].error.has_value());
    CHECK(results[2].error->code == ErrorCode::FilesystemError);
    // A write failure is not retried
    CHECK(results[2].task.attempts == 1);
    CHECK(transport->callsFor(urls[2]) == 1);

    CHECK(read_file(tmp.path() / "ok1.jpg") == "1");
    CHECK(read_file(tmp.path() / "ok2.jpg") == "4");
}

TEST_CASE("DownloadScheduler: concurrent run", "[downloader][scheduler]") {
    auto tmp = TempDirScope::unique_under("orderpix-sched-parallel");
    auto transport = std::make_shared<ScriptedHttpTransport>();
    transport->setLatency(5ms);

    std::vector<std::string> urls;
    for (int i = 0; i < 20; ++i) {
        urls.push_back("https://cdn.test/p/" + std::to_string(i) + ".jpg");
        transport->respond(urls.back(), "payload-" + std::to_string(i));
    }
    // Same file name from another host collides with 0.jpg
    urls.push_back("https://mirror.test/p/0.jpg");
    transport->respond(urls.back(), "mirror");

    DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(4));

    std::mutex mu;
    std::vector<std::size_t> seen;
    std::size_t reportedTotal = 0;
    auto results = scheduler.run(refsFor(urls), tmp.path(),
                                 [&](std::size_t completed, std::size_t total) {
                                     std::lock_guard<std::mutex> lk(mu);
                                     seen.push_back(completed);
                                     reportedTotal = total;
                                 });

    REQUIRE(results.size() == urls.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        INFO(urls[i]);
        CHECK(results[i].task.index == i);
        CHECK(results[i].outcome == Outcome::Succeeded);
    }

    SECTION("Progress is strictly increasing and reaches the total") {
        REQUIRE(seen.size() == urls.size());
        for (std::size_t i = 0; i < seen.size(); ++i)
            CHECK(seen[i] == i + 1);
        CHECK(reportedTotal == urls.size());
    }

    SECTION("Every URL fetched exactly once") {
        auto requested = transport->requestedUrls();
        CHECK(requested.size() == urls.size());
        CHECK(std::set<std::string>(requested.begin(), requested.end()).size() == urls.size());
    }

    SECTION("Collision suffix follows discovery order") {
        CHECK(read_file(tmp.path() / "0.jpg") == "payload-0");
        CHECK(read_file(tmp.path() / "0_1.jpg") == "mirror");
    }
}

TEST_CASE("DownloadScheduler: cancellation", "[downloader][scheduler]") {
    auto tmp = TempDirScope::unique_under("orderpix-sched-cancel");
    auto transport = std::make_shared<ScriptedHttpTransport>();
    const std::vector<std::string> urls = {"https://cdn.test/1.jpg", "https://cdn.test/2.jpg",
                                           "https://cdn.test/3.jpg"};
    for (const auto& u : urls)
        transport->respond(u, "x");

    SECTION("Cancelled before start: nothing is fetched") {
        DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(2));
        auto results = scheduler.run(refsFor(urls), tmp.path(), {}, [] { return true; });
        REQUIRE(results.size() == 3);
        for (const auto& r : results) {
            CHECK(r.outcome == Outcome::Cancelled);
            CHECK(r.task.status == TaskStatus::Failed);
            REQUIRE(r.error.has_value());
            CHECK(r.error->code == ErrorCode::Cancelled);
        }
        CHECK(transport->requestedUrls().empty());
    }

    SECTION("Stop after the first completion: in-flight work finishes, the rest is cancelled") {
        DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(1));
        std::atomic<bool> stop{false};
        auto results = scheduler.run(
            refsFor(urls), tmp.path(), [&](std::size_t, std::size_t) { stop = true; },
            [&] { return stop.load(); });
        REQUIRE(results.size() == 3);
        CHECK(results[0].outcome == Outcome::Succeeded);
        CHECK(results[1].outcome == Outcome::Cancelled);
        CHECK(results[2].outcome == Outcome::Cancelled);
        CHECK(results[2].task.status == TaskStatus::Failed);
        CHECK(transport->requestedUrls() == std::vector<std::string>{urls[0]});
    }

    SECTION("Throwing cancellation check stops the run") {
        DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(2));
        auto results = scheduler.run(refsFor(urls), tmp.path(), {}, []() -> bool {
            throw std::runtime_error("signal state unavailable");
        });
        REQUIRE(results.size() == 3);
        for (const auto& r : results)
            CHECK(r.outcome == Outcome::Cancelled);
        CHECK(transport->requestedUrls().empty());
    }

    SECTION("Workers consult the cancellation check concurrently") {
        DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(3));
        std::atomic<int> inside{0};
        std::atomic<bool> overlapped{false};
        auto results = scheduler.run(refsFor(urls), tmp.path(), {}, [&] {
            if (++inside >= 2)
                overlapped = true;
            const auto deadline = std::chrono::steady_clock::now() + 1s;
            while (!overlapped && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(1ms);
            --inside;
            return false;
        });
        for (const auto& r : results)
            CHECK(r.outcome == Outcome::Succeeded);
        CHECK(overlapped.load());
    }
}

TEST_CASE("DownloadScheduler: progress callback errors", "[downloader][scheduler]") {
    auto tmp = TempDirScope::unique_under("orderpix-sched-progress");
    auto transport = std::make_shared<ScriptedHttpTransport>();
    const std::vector<std::string> urls = {"https://cdn.test/a.jpg", "https://cdn.test/b.jpg",
                                           "https://cdn.test/c.jpg", "https://cdn.test/d.jpg"};
    for (const auto& u : urls)
        transport->respond(u, "x");

    DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(2));
    std::atomic<int> calls{0};
    auto results = scheduler.run(refsFor(urls), tmp.path(), [&](std::size_t, std::size_t) {
        ++calls;
        throw std::runtime_error("display closed");
    });

    REQUIRE(results.size() == 4);
    for (const auto& r : results)
        CHECK(r.outcome == Outcome::Succeeded);
    CHECK(calls.load() == 4);
    CHECK(fs::exists(tmp.path() / "d.jpg"));
}

TEST_CASE("DownloadScheduler: skip existing", "[downloader][scheduler]") {
    auto tmp = TempDirScope::unique_under("orderpix-sched-skip");
    auto transport = std::make_shared<ScriptedHttpTransport>();
    const std::vector<std::string> urls = {"https://cdn.test/have.jpg", "https://cdn.test/new.jpg"};
    transport->respond(urls[0], "fresh");
    transport->respond(urls[1], "fresh");
    tmp.write("have.jpg", "kept");

    auto opts = fastOptions();
    opts.skipExisting = true;
    DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), opts);
    auto results = scheduler.run(refsFor(urls), tmp.path());

    REQUIRE(results.size() == 2);
    CHECK(results[0].outcome == Outcome::Skipped);
    CHECK(results[1].outcome == Outcome::Succeeded);
    CHECK(read_file(tmp.path() / "have.jpg") == "kept");
    CHECK(transport->requestedUrls() == std::vector<std::string>{urls[1]});
}

TEST_CASE("DownloadScheduler: empty input", "[downloader][scheduler]") {
    auto transport = std::make_shared<ScriptedHttpTransport>();
    DownloadScheduler scheduler(transport, std::make_shared<FileWriter>(), fastOptions(4));
    int calls = 0;
    auto results = scheduler.run({}, "/nonexistent", [&](std::size_t, std::size_t) { ++calls; });
    CHECK(results.empty());
    CHECK(calls == 0);
}
