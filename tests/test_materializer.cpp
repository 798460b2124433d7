#include <catch2/catch_test_macros.hpp>
#include "overlay/materialized_memo.hpp"
#include "overlay/materializer.hpp"
#include "test_support.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace bpfs;
using namespace bpfs::overlay;
using bpfs::test::TempDir;

TEST_CASE("looks_like_file needs a stem and an extension", "[materializer]") {
    CHECK(Materializer::looks_like_file("budget.txt"));
    CHECK(Materializer::looks_like_file("archive.tar.gz"));
    CHECK_FALSE(Materializer::looks_like_file("finance"));
    CHECK_FALSE(Materializer::looks_like_file(".profile"));
    CHECK_FALSE(Materializer::looks_like_file("trailing."));
}

TEST_CASE("Materializer creates the directory chain and file leaf", "[materializer]") {
    TempDir tmp;
    test::make_dirs(tmp / "projects" / "acme");
    vfs::DirectoryStore store(tmp.path());
    Materializer materializer(store);

    auto born = materializer.materialize("projects/acme", "finance/2024/budget.txt");
    REQUIRE(born.ok());
    CHECK(born.value() == tmp / "projects/acme/finance/2024/budget.txt");
    CHECK(fs::is_directory(tmp / "projects/acme/finance/2024"));
    CHECK(fs::is_regular_file(born.value()));
    CHECK(fs::file_size(born.value()) == 0);
    CHECK(materializer.created_count() == 3);

    // Explicit kinds override the extension heuristic
    REQUIRE(materializer.materialize("projects/acme", "v1.0", LeafKind::Directory).ok());
    CHECK(fs::is_directory(tmp / "projects/acme/v1.0"));
    REQUIRE(materializer.materialize("projects/acme", "Makefile", LeafKind::File).ok());
    CHECK(fs::is_regular_file(tmp / "projects/acme/Makefile"));
}

TEST_CASE("Materializing an existing path is a no-op", "[materializer]") {
    TempDir tmp;
    test::make_dirs(tmp / "p");
    vfs::DirectoryStore store(tmp.path());
    Materializer materializer(store);

    REQUIRE(materializer.materialize("p", "finance/budget.txt").ok());
    test::write_file(tmp / "p/finance/budget.txt", "keep me");
    auto count = materializer.created_count();

    auto again = materializer.materialize("p", "finance/budget.txt");
    REQUIRE(again.ok());
    CHECK(materializer.created_count() == count);
    CHECK(test::read_file(tmp / "p/finance/budget.txt") == "keep me");
}

TEST_CASE("Materializer fails on an object in the way", "[materializer]") {
    TempDir tmp;
    test::make_dirs(tmp / "p");
    test::write_file(tmp / "p/finance/report", "a file, not a folder");
    vfs::DirectoryStore store(tmp.path());
    Materializer materializer(store);

    auto result = materializer.materialize("p", "finance/report/q1");
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::IOFailure);
    CHECK(result.error().sys_errno == ENOTDIR);

    auto dir_as_file = materializer.materialize("p", "finance", LeafKind::File);
    REQUIRE_FALSE(dir_as_file);
    CHECK(dir_as_file.error().sys_errno == EISDIR);

    auto file_as_dir = materializer.materialize("p", "finance/report",
                                                LeafKind::Directory);
    REQUIRE_FALSE(file_as_dir);
    CHECK(file_as_dir.error().sys_errno == ENOTDIR);
}

TEST_CASE("Materializer leaves earlier directories after a failure",
          "[materializer]") {
    TempDir tmp;
    test::make_dirs(tmp / "p");
    vfs::DirectoryStore store(tmp.path());
    Materializer materializer(store);

    // The base does not exist, so the very first mkdir fails
    auto missing_base = materializer.materialize("nope", "finance");
    REQUIRE_FALSE(missing_base);
    CHECK(missing_base.error().kind == ErrorKind::NotFound);

    test::write_file(tmp / "p/a/b", "blocker");
    auto blocked = materializer.materialize("p", "a/b/c/d");
    REQUIRE_FALSE(blocked);
    CHECK(fs::is_directory(tmp / "p/a"));
    CHECK_FALSE(fs::exists(tmp / "p/a/b/c"));
}

TEST_CASE("Concurrent materializations of one path create it once",
          "[materializer]") {
    TempDir tmp;
    test::make_dirs(tmp / "p");
    vfs::DirectoryStore store(tmp.path());
    MaterializedMemo memo(64);
    Materializer materializer(store, &memo);

    constexpr int N = 16;
    std::atomic<int> successes{0};
    std::atomic<int> already_exists{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < N; i++) {
        threads.emplace_back([&] {
            auto result = materializer.materialize("p", "finance/2024/budget.txt");
            if (result) {
                successes++;
            } else if (result.error().kind == ErrorKind::AlreadyExists) {
                already_exists++;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(successes == N);
    CHECK(already_exists == 0);
    CHECK(materializer.created_count() == 3);
    CHECK(fs::is_regular_file(tmp / "p/finance/2024/budget.txt"));
}

TEST_CASE("Concurrent materializations of different paths all succeed",
          "[materializer]") {
    TempDir tmp;
    test::make_dirs(tmp / "p");
    vfs::DirectoryStore store(tmp.path());
    Materializer materializer(store);

    constexpr int N = 8;
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < N; i++) {
        threads.emplace_back([&, i] {
            auto path = "shared/dept" + std::to_string(i) + "/notes.md";
            if (materializer.materialize("p", path)) successes++;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(successes == N);
    // "shared" once, plus one directory and one file per thread
    CHECK(materializer.created_count() == 1 + 2 * N);
}

TEST_CASE("PathLockTable drops entries once released", "[materializer]") {
    PathLockTable table;
    {
        auto a = table.lock("p/a");
        auto b = table.lock("p/b");
        CHECK(table.active_count() == 2);
    }
    CHECK(table.active_count() == 0);
}

TEST_CASE("MaterializedMemo is bounded and invalidation-aware", "[materializer]") {
    MaterializedMemo memo(2);
    memo.record("p/a");
    memo.record("p/b");
    memo.record("p/c");
    CHECK(memo.size() == 2);
    CHECK_FALSE(memo.contains("p/a")); // oldest evicted
    CHECK(memo.contains("p/c"));

    memo.record("p/c/d");
    memo.invalidate_prefix("p/c");
    CHECK_FALSE(memo.contains("p/c"));
    CHECK_FALSE(memo.contains("p/c/d"));

    memo.record("p/cc");
    memo.invalidate_prefix("p/c");
    CHECK(memo.contains("p/cc"));
}

TEST_CASE("A stale memo entry never hides an out-of-band deletion",
          "[materializer]") {
    TempDir tmp;
    test::make_dirs(tmp / "p");
    vfs::DirectoryStore store(tmp.path());
    MaterializedMemo memo(16);
    Materializer materializer(store, &memo);

    REQUIRE(materializer.materialize("p", "finance", LeafKind::Directory).ok());
    CHECK(memo.contains("p/finance"));

    fs::remove(tmp / "p/finance");
    REQUIRE(materializer.materialize("p", "finance/budget.txt").ok());
    CHECK(fs::is_regular_file(tmp / "p/finance/budget.txt"));
    CHECK(materializer.created_count() == 3);
}
