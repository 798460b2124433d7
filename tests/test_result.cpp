#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <cerrno>

using namespace bpfs;

TEST_CASE("Error::from_errno classifies system errors", "[errors]") {
    CHECK(Error::from_errno(ENOENT, "x").kind == ErrorKind::NotFound);
    CHECK(Error::from_errno(EEXIST, "x").kind == ErrorKind::AlreadyExists);

    auto full = Error::from_errno(ENOSPC, "disk full");
    CHECK(full.kind == ErrorKind::IOFailure);
    CHECK(full.sys_errno == ENOSPC);
    CHECK(full.message == "disk full");

    // Permission bits are an I/O failure, not an oracle veto
    CHECK(Error::from_errno(EACCES, "x").kind == ErrorKind::IOFailure);
}

TEST_CASE("Error::to_errno maps every kind", "[errors]") {
    CHECK(Error(ErrorKind::InvalidPath, "x").to_errno() == EINVAL);
    CHECK(Error(ErrorKind::NotFound, "x").to_errno() == ENOENT);
    CHECK(Error(ErrorKind::AlreadyExists, "x").to_errno() == EEXIST);
    CHECK(Error(ErrorKind::PermissionDenied, "x").to_errno() == EACCES);
    CHECK(Error(ErrorKind::IOFailure, "x").to_errno() == EIO);
    CHECK(Error(ErrorKind::IOFailure, "x", ENOTDIR).to_errno() == ENOTDIR);
    CHECK(Error::from_errno(ENOSPC, "x").to_errno() == ENOSPC);
}

TEST_CASE("Result holds a value or an error", "[errors]") {
    Result<int> good = 7;
    REQUIRE(good.ok());
    CHECK(good.value() == 7);

    Result<int> bad = Error(ErrorKind::NotFound, "missing");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().kind == ErrorKind::NotFound);
    CHECK(std::string(error_kind_name(bad.error().kind)) == "NotFound");

    Result<void> done;
    CHECK(done.ok());
    Result<void> failed = Error("boom");
    CHECK(failed.error().kind == ErrorKind::IOFailure);
}
