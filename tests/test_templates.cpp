#include <catch2/catch_test_macros.hpp>
#include "overlay/tree_builder.hpp"
#include "vfs/directory_template.hpp"
#include "vfs/zip_template.hpp"
#include "test_support.hpp"

#include <minizip/zip.h>

using namespace bpfs;
using namespace bpfs::overlay;
using bpfs::test::TempDir;

namespace {

/// Write a ZIP archive whose entries have the given names. Names ending
/// in '/' are directory entries.
void write_zip(const fs::path& path, const std::vector<std::string>& entries) {
    zipFile zip = zipOpen(path.string().c_str(), APPEND_STATUS_CREATE);
    REQUIRE(zip != nullptr);
    for (const auto& name : entries) {
        zip_fileinfo info{};
        REQUIRE(zipOpenNewFileInZip(zip, name.c_str(), &info, nullptr, 0,
                                    nullptr, 0, nullptr, Z_DEFLATED,
                                    Z_DEFAULT_COMPRESSION) == ZIP_OK);
        if (name.back() != '/') {
            const char data[] = "x";
            zipWriteInFileInZip(zip, data, 1);
        }
        zipCloseFileInZip(zip);
    }
    REQUIRE(zipClose(zip, nullptr) == ZIP_OK);
}

} // namespace

TEST_CASE("Template ids must be a single visible path component", "[templates]") {
    CHECK(vfs::is_valid_template_id("Standard"));
    CHECK(vfs::is_valid_template_id("client-v2.1"));
    CHECK_FALSE(vfs::is_valid_template_id(""));
    CHECK_FALSE(vfs::is_valid_template_id(".hidden"));
    CHECK_FALSE(vfs::is_valid_template_id("a/b"));
    CHECK_FALSE(vfs::is_valid_template_id("a\\b"));
    CHECK_FALSE(vfs::is_valid_template_id("x..y"));
}

TEST_CASE("DirectoryTemplate lists visible subdirectories only", "[templates]") {
    TempDir tmp;
    auto root = tmp / "Standard";
    test::make_dirs(root / "finance" / "2024");
    test::make_dirs(root / "admin");
    test::make_dirs(root / ".git" / "objects");
    test::write_file(root / "README.txt", "files are not tree nodes");
    fs::create_directory_symlink(root / "admin", root / "linked");

    vfs::DirectoryTemplate source("Standard", root);
    CHECK(source.list_directories("") ==
          std::vector<std::string>{"admin", "finance"});
    CHECK(source.list_directories("finance") == std::vector<std::string>{"2024"});
    CHECK(source.list_directories("missing").empty());

    auto tree = TreeBuilder::scan(source);
    CHECK(tree.names() == std::vector<std::string>{"admin", "finance"});
    CHECK(tree.find("finance/2024") != nullptr);
    CHECK_FALSE(tree.contains(".git"));
    CHECK_FALSE(tree.contains("linked"));
}

TEST_CASE("ZipTemplate indexes explicit and implied directories", "[templates]") {
    TempDir tmp;
    auto archive = tmp / "Client.zip";
    write_zip(archive, {"contracts/", "billing/2024/invoice.txt",
                        "notes.txt", ".meta/info", "billing/.cache/x"});

    vfs::ZipTemplate source("Client", archive);
    REQUIRE(source.is_open());
    CHECK(source.list_directories("") ==
          std::vector<std::string>{"billing", "contracts"});
    CHECK(source.list_directories("billing") == std::vector<std::string>{"2024"});
    CHECK(source.list_directories("billing/2024").empty());
}

TEST_CASE("ZipTemplate reads entry names longer than any fixed buffer",
          "[templates]") {
    TempDir tmp;
    // 80 components of 10 bytes each: an 800-byte directory entry
    std::string deep;
    for (int i = 0; i < 80; i++) deep += "level_" + std::to_string(100 + i) + "/";
    REQUIRE(deep.size() > 512);

    auto archive = tmp / "Deep.zip";
    write_zip(archive, {deep, "short/"});

    vfs::ZipTemplate source("Deep", archive);
    REQUIRE(source.is_open());
    CHECK(source.list_directories("") ==
          std::vector<std::string>{"level_100", "short"});

    auto parent = deep.substr(0, deep.size() - std::string("level_179/").size());
    parent.pop_back();
    CHECK(source.list_directories(parent) ==
          std::vector<std::string>{"level_179"});
}

TEST_CASE("open_template prefers a directory over an archive", "[templates]") {
    TempDir tmp;
    test::make_dirs(tmp / "Standard" / "admin");
    write_zip(tmp / "Standard.zip", {"ignored/"});
    write_zip(tmp / "Extra.zip", {"legal/"});

    auto standard = vfs::open_template("Standard", tmp.path());
    REQUIRE(standard != nullptr);
    CHECK(standard->list_directories("") == std::vector<std::string>{"admin"});

    auto extra = vfs::open_template("Extra", tmp.path());
    REQUIRE(extra != nullptr);
    CHECK(extra->list_directories("") == std::vector<std::string>{"legal"});

    CHECK(vfs::open_template("Nope", tmp.path()) == nullptr);
}

TEST_CASE("TreeBuilder merges templates and skips missing ones", "[templates]") {
    TempDir tmp;
    test::make_dirs(tmp / "Standard" / "admin");
    test::make_dirs(tmp / "Standard" / "finance" / "2024");
    test::make_dirs(tmp / "Extra" / "finance" / "reports");
    test::make_dirs(tmp / "Extra" / "legal");

    TreeBuilder builder(tmp.path());
    BuildReport report;
    auto tree = builder.build({"Standard", "Missing", "../escape", "Extra"},
                              &report);

    CHECK(tree.names() == std::vector<std::string>{"admin", "finance", "legal"});
    CHECK(tree.child("finance")->names() ==
          std::vector<std::string>{"2024", "reports"});
    CHECK(report.loaded == std::vector<std::string>{"Standard", "Extra"});
    CHECK(report.missing == std::vector<std::string>{"Missing"});
    CHECK(report.invalid == std::vector<std::string>{"../escape"});

    // Order of declaration does not change the result
    CHECK(builder.build({"Extra", "Standard"}) == tree);
}

TEST_CASE("TreeBuilder with no templates yields an empty tree", "[templates]") {
    TempDir tmp;
    TreeBuilder builder(tmp / "does-not-exist");
    CHECK(builder.build({}).empty());
    CHECK(builder.build({"Standard"}).empty());
}
