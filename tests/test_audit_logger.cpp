#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include "audit_logger.hpp"
#include "test_support.hpp"

using namespace urgate;

namespace {

AuditRecord sample_record() {
    AuditRecord record;
    record.timestamp = "2026-01-02T03:04:05Z";
    record.client_identity = "192.0.2.7";
    record.restricted_root = "/srv/sync";
    record.session_flags.restrict_to_read_only = true;
    record.session_flags.suppress_delete_options = true;
    record.role_known = true;
    record.role = Role::Sender;
    record.outcome = "accepted";
    record.invocation = "rsync --server --sender -vlogDtpr -- . docs";
    return record;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(AuditLoggerTest, FormatsAcceptedRecord) {
    EXPECT_EQ(AuditLogger::format_record(sample_record()),
              "2026-01-02T03:04:05Z client=192.0.2.7 root=\"/srv/sync\" flags=ro,no-del role=sender"
              " outcome=accepted cmd=\"rsync --server --sender -vlogDtpr -- . docs\"");
}

TEST(AuditLoggerTest, FormatsRejectionWithoutRole) {
    AuditRecord record = sample_record();
    record.role_known = false;
    record.session_flags = SessionFlags{};
    record.outcome = "UnexpectedTool";
    record.invocation.clear();
    record.rejected = "scp -t /tmp";
    EXPECT_EQ(AuditLogger::format_record(record),
              "2026-01-02T03:04:05Z client=192.0.2.7 root=\"/srv/sync\" flags=none role=-"
              " outcome=UnexpectedTool rejected=\"scp -t /tmp\"");
}

TEST(AuditLoggerTest, MissingTimestampIsFilledIn) {
    AuditRecord record = sample_record();
    record.timestamp.clear();
    std::string line = AuditLogger::format_record(record);
    ASSERT_GE(line.size(), 20u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], 'T');
    EXPECT_EQ(line[19], 'Z');
}

TEST(AuditLoggerTest, QuoteEscapesControlCharacters) {
    EXPECT_EQ(AuditLogger::quote("plain"), "\"plain\"");
    EXPECT_EQ(AuditLogger::quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(AuditLogger::quote("line\nbreak"), "\"line\\x0abreak\"");
    EXPECT_EQ(AuditLogger::quote(std::string("\x1b[0m")), "\"\\x1b[0m\"");
}

TEST(AuditLoggerTest, SkipsWhenLogFileIsAbsent) {
    test::TempDir dir;
    std::string path = dir.path() + "/audit.log";
    AuditLogger logger(path);
    EXPECT_FALSE(logger.append(sample_record()));
    EXPECT_FALSE(std::ifstream(path).good());

    AuditLogger disabled("");
    EXPECT_FALSE(disabled.append(sample_record()));
}

TEST(AuditLoggerTest, AppendsToExistingFile) {
    test::TempDir dir;
    std::string path = dir.make_file("audit.log", "previous line\n");
    AuditLogger logger(path);

    ASSERT_TRUE(logger.append(sample_record()));
    ASSERT_TRUE(logger.append(sample_record()));

    std::string content = read_file(path);
    EXPECT_EQ(content.rfind("previous line\n", 0), 0u);
    std::string line = AuditLogger::format_record(sample_record()) + "\n";
    EXPECT_EQ(content, "previous line\n" + line + line);
}

TEST(AuditLoggerTest, DirectoryIsNotALogFile) {
    test::TempDir dir;
    AuditLogger logger(dir.path());
    EXPECT_FALSE(logger.append(sample_record()));
}

TEST(AuditLoggerTest, ClientIdentity) {
    EXPECT_EQ(AuditLogger::resolve_client_identity(std::nullopt), "unknown");
    EXPECT_EQ(AuditLogger::resolve_client_identity(std::string("")), "unknown");
    EXPECT_EQ(AuditLogger::resolve_client_identity(std::string("not-an-address 22 10.0.0.1 22")), "unknown");

    // Reverse lookup may or may not succeed on the test host
    std::string identity = AuditLogger::resolve_client_identity(std::string("127.0.0.1 51234 127.0.0.1 22"));
    EXPECT_NE(identity.find("127.0.0.1"), std::string::npos);

    std::string v6 = AuditLogger::resolve_client_identity(std::string("::1 51234 ::1 22"));
    EXPECT_NE(v6.find("::1"), std::string::npos);
}
