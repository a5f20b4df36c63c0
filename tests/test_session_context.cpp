#include <gtest/gtest.h>
#include "gate_error.hpp"
#include "session_context.hpp"
#include "test_support.hpp"

using namespace urgate;

namespace {

GateErrorCode resolve_error(const SessionOptions& options) {
    try {
        SessionContext::resolve(options);
    } catch (const GateError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected a GateError";
    return GateErrorCode::ExecFailure;
}

} // namespace

TEST(SessionContextTest, ReadOnlyAndWriteOnlyConflict) {
    test::TempDir dir;
    SessionOptions options;
    options.read_only = true;
    options.write_only = true;
    options.restricted_root = dir.path();
    EXPECT_EQ(resolve_error(options), GateErrorCode::ConfigError);
}

TEST(SessionContextTest, ReadOnlyImpliesNoDeleteAndNoLock) {
    test::TempDir dir;
    SessionContext session = test::make_session(dir.path(), true, false, false);
    EXPECT_TRUE(session.flags().restrict_to_read_only);
    EXPECT_TRUE(session.flags().suppress_delete_options);
    EXPECT_TRUE(session.flags().disable_locking);
    EXPECT_FALSE(session.flags().restrict_to_write_only);
}

TEST(SessionContextTest, WriteOnlyKeepsLocking) {
    test::TempDir dir;
    SessionContext session = test::make_session(dir.path(), false, true, false);
    EXPECT_TRUE(session.flags().restrict_to_write_only);
    EXPECT_FALSE(session.flags().suppress_delete_options);
    EXPECT_FALSE(session.flags().disable_locking);
}

TEST(SessionContextTest, RootIsCanonicalized) {
    test::TempDir dir;
    dir.make_dir("data/inner");
    dir.make_symlink("link", dir.path() + "/data");

    SessionContext session = test::make_session(dir.path() + "/link/inner/../inner/");
    EXPECT_EQ(session.restricted_root(), dir.path() + "/data/inner");
    EXPECT_EQ(session.root_with_slash(), dir.path() + "/data/inner/");
    EXPECT_FALSE(session.root_is_filesystem_root());
}

TEST(SessionContextTest, FilesystemRoot) {
    SessionContext session = test::make_session("/");
    EXPECT_TRUE(session.root_is_filesystem_root());
    EXPECT_EQ(session.root_with_slash(), "/");
}

TEST(SessionContextTest, RejectsBadRoots) {
    test::TempDir dir;
    SessionOptions options;
    EXPECT_EQ(resolve_error(options), GateErrorCode::ConfigError);

    options.restricted_root = dir.path() + "/missing";
    EXPECT_EQ(resolve_error(options), GateErrorCode::ConfigError);

    options.restricted_root = dir.make_file("plain");
    EXPECT_EQ(resolve_error(options), GateErrorCode::ConfigError);
}

TEST(SessionContextTest, PassesThroughOtherFlags) {
    test::TempDir dir;
    SessionOptions options;
    options.munge_links = true;
    options.no_delete = true;
    options.escalate = true;
    options.restricted_root = dir.path();
    SessionContext session = SessionContext::resolve(options);
    EXPECT_TRUE(session.flags().force_munge_links);
    EXPECT_TRUE(session.flags().suppress_delete_options);
    EXPECT_TRUE(session.flags().use_privilege_helper);
    EXPECT_FALSE(session.flags().disable_locking);
}
