#include <catch2/catch_test_macros.hpp>

#include <orderpix/downloader/file_writer.hpp>

#include "../../support/scripted_http_transport.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace orderpix::downloader;
using namespace orderpix::test_support;

namespace {

std::vector<std::string> listDir(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir))
        names.push_back(entry.path().filename().string());
    return names;
}

} // namespace

TEST_CASE("FileWriter: write", "[downloader][writer]") {
    auto tmp = TempDirScope::unique_under("orderpix-writer");
    FileWriter writer;

    SECTION("Writes the payload under the final name only") {
        auto target = tmp.path() / "a.jpg";
        auto bytes = to_bytes("JPEGDATA");
        auto r = writer.write(target, bytes);
        REQUIRE(r.ok());
        CHECK(read_file(target) == "JPEGDATA");
        CHECK(listDir(tmp.path()) == std::vector<std::string>{"a.jpg"});
    }

    SECTION("Replaces an existing file") {
        auto target = tmp.write("a.jpg", "old");
        REQUIRE(writer.write(target, to_bytes("new")).ok());
        CHECK(read_file(target) == "new");
    }

    SECTION("Empty payload produces an empty file") {
        auto target = tmp.path() / "empty.png";
        REQUIRE(writer.write(target, {}).ok());
        CHECK(fs::exists(target));
        CHECK(fs::file_size(target) == 0);
    }

    SECTION("Missing directory is a filesystem error") {
        auto r = writer.write(tmp.path() / "missing" / "a.jpg", to_bytes("x"));
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::FilesystemError);
        CHECK(listDir(tmp.path()).empty());
    }
}

TEST_CASE("FileWriter: pending file lifecycle", "[downloader][writer]") {
    auto tmp = TempDirScope::unique_under("orderpix-pending");
    FileWriter writer;
    auto target = tmp.path() / "photo.jpg";

    SECTION("Temporary file is hidden and lives beside the target") {
        auto opened = writer.open(target);
        REQUIRE(opened.ok());
        auto file = std::move(opened).value();
        CHECK(file.active());
        CHECK(file.tempPath().parent_path() == tmp.path());
        const auto tempName = file.tempPath().filename().string();
        CHECK(tempName.rfind(".photo.jpg.", 0) == 0);
        CHECK(tempName.size() > 5);
        CHECK(tempName.substr(tempName.size() - 5) == ".part");
        CHECK(fs::exists(file.tempPath()));
        CHECK_FALSE(fs::exists(target));
    }

    SECTION("Abandoned mid-stream leaves neither final nor temporary file") {
        fs::path tempPath;
        {
            auto opened = writer.open(target);
            REQUIRE(opened.ok());
            auto file = std::move(opened).value();
            tempPath = file.tempPath();
            REQUIRE(file.append(to_bytes("first half")).ok());
            CHECK(file.bytesWritten() == 10);
            CHECK_FALSE(fs::exists(target));
        }
        CHECK_FALSE(fs::exists(target));
        CHECK_FALSE(fs::exists(tempPath));
        CHECK(listDir(tmp.path()).empty());
    }

    SECTION("Commit publishes all appended chunks") {
        auto opened = writer.open(target);
        REQUIRE(opened.ok());
        auto file = std::move(opened).value();
        REQUIRE(file.append(to_bytes("ab")).ok());
        REQUIRE(file.append(to_bytes("cd")).ok());
        auto committed = file.commit();
        REQUIRE(committed.ok());
        CHECK(committed.value() == target);
        CHECK_FALSE(file.active());
        CHECK(read_file(target) == "abcd");
        CHECK(listDir(tmp.path()) == std::vector<std::string>{"photo.jpg"});
    }

    SECTION("Operations after discard fail") {
        auto opened = writer.open(target);
        REQUIRE(opened.ok());
        auto file = std::move(opened).value();
        file.discard();
        CHECK_FALSE(file.append(to_bytes("x")).ok());
        CHECK_FALSE(file.commit().ok());
        CHECK(listDir(tmp.path()).empty());
    }

    SECTION("Moving transfers ownership of the temporary file") {
        auto opened = writer.open(target);
        REQUIRE(opened.ok());
        PendingFile a = std::move(opened).value();
        PendingFile b = std::move(a);
        CHECK_FALSE(a.active());
        REQUIRE(b.active());
        REQUIRE(b.append(to_bytes("z")).ok());
        REQUIRE(b.commit().ok());
        CHECK(read_file(target) == "z");
    }
}

TEST_CASE("makeTempPath: unique per call", "[downloader][writer]") {
    auto a = makeTempPath("/out/x.jpg");
    auto b = makeTempPath("/out/x.jpg");
    CHECK(a != b);
    CHECK(a.parent_path() == fs::path("/out"));
}
