#include <gtest/gtest.h>

#include <cerrno>
#include "infra/error_handler/error.hpp"
#include "test_helpers.hpp"

using extsort::infra::ErrorCode;
using extsort::infra::ErrorKind;
using extsort::infra::code_from_errno;
using extsort::infra::kind_of;

TEST(ErrorTest, BusyErrnoIsLocked)
{
    EXPECT_EQ(code_from_errno(EBUSY), ErrorCode::Busy);
    EXPECT_EQ(code_from_errno(ETXTBSY), ErrorCode::Busy);
    EXPECT_EQ(kind_of(ErrorCode::Busy), ErrorKind::Locked);
    EXPECT_EQ(kind_of(ErrorCode::FileLocked), ErrorKind::Locked);
}

TEST(ErrorTest, ResourceExhaustionIsTransient)
{
    for (int err : {EAGAIN, EINTR, EMFILE, ENFILE, ENOMEM, ETIMEDOUT}) {
        EXPECT_EQ(kind_of(code_from_errno(err)), ErrorKind::TransientIO) << "errno " << err;
    }
}

TEST(ErrorTest, PermanentErrorsAreFatal)
{
    EXPECT_EQ(code_from_errno(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(code_from_errno(ENOSPC), ErrorCode::DiskFull);
    EXPECT_EQ(code_from_errno(EROFS), ErrorCode::ReadOnly);
    EXPECT_EQ(code_from_errno(ENOENT), ErrorCode::FileNotFound);
    EXPECT_EQ(code_from_errno(EEXIST), ErrorCode::AlreadyExists);

    for (int err : {EACCES, EPERM, ENOSPC, EROFS, ENOENT, ENAMETOOLONG}) {
        EXPECT_EQ(kind_of(code_from_errno(err)), ErrorKind::Fatal) << "errno " << err;
    }
}

TEST(ErrorTest, TransientAndFatalPredicates)
{
    const auto locked = extsort::infra::make_error(ErrorCode::FileLocked, "locked");
    EXPECT_TRUE(locked.is_locked());
    EXPECT_TRUE(locked.is_transient());
    EXPECT_FALSE(locked.is_fatal());

    const auto denied = extsort::infra::make_error(ErrorCode::PermissionDenied, "denied");
    EXPECT_FALSE(denied.is_transient());
    EXPECT_TRUE(denied.is_fatal());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(extsort::infra::make_error(ErrorCode::ConfigError, "bad").to_exit_code(), 2);
    EXPECT_EQ(extsort::infra::make_error(ErrorCode::Interrupted, "stop").to_exit_code(), 130);
    EXPECT_EQ(extsort::infra::make_error(ErrorCode::DiskFull, "full").to_exit_code(), 1);
}

TEST(ErrorTest, ErrnoMessageCarriesContext)
{
    const auto err = extsort::infra::error_from_errno(ENOENT, "Cannot open source /x");
    EXPECT_EQ(err.code, ErrorCode::FileNotFound);
    EXPECT_NE(err.message.find("Cannot open source /x"), std::string::npos);
    EXPECT_GT(err.line, 0);
}

TEST(ErrorTest, LogAndReturnLogsAndKeepsError)
{
    extsort::test::LogCapture capture;

    auto fatal = extsort::infra::log_and_return(
        extsort::infra::make_error(ErrorCode::PermissionDenied, "Cannot read /x"));
    EXPECT_EQ(fatal.code, ErrorCode::PermissionDenied);
    EXPECT_EQ(fatal.message, "Cannot read /x");
    EXPECT_TRUE(capture.contains("[error]"));
    EXPECT_TRUE(capture.contains("permission_denied: Cannot read /x"));

    auto locked = extsort::infra::log_and_return(
        extsort::infra::make_error(ErrorCode::FileLocked, "held"));
    EXPECT_EQ(locked.code, ErrorCode::FileLocked);
    EXPECT_TRUE(capture.contains("[warning]"));
}
