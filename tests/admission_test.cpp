// ---------------------------------------------------------------------------
// admission_test.cpp
//
// AdmissionFilter: trimming, single terminator strip, chaining rejection,
// and the case-insensitive keyword denylist (including its known
// over-blocking inside identifiers and string literals).
// ---------------------------------------------------------------------------

#include <sqlgate/validator/admission.hpp>

#include <gtest/gtest.h>
#include <cctype>
#include <string>
#include <vector>

using sqlgate::Admission;
using sqlgate::AdmissionFilter;

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

TEST(AdmissionFilter, PlainSelectPassesUnchanged) {
    const std::string sql = "SELECT x FROM t WHERE name = 'Bob' ORDER BY x";
    Admission a = AdmissionFilter::admit(sql);
    ASSERT_TRUE(a.allowed);
    EXPECT_EQ(a.query, sql);
}

TEST(AdmissionFilter, SurroundingWhitespaceIsTrimmed) {
    Admission a = AdmissionFilter::admit(" \t\n SELECT 1 \r\n ");
    ASSERT_TRUE(a.allowed);
    EXPECT_EQ(a.query, "SELECT 1");
}

TEST(AdmissionFilter, SingleTrailingTerminatorIsStripped) {
    Admission a = AdmissionFilter::admit("SELECT x FROM t ORDER BY x;");
    ASSERT_TRUE(a.allowed);
    EXPECT_EQ(a.query, "SELECT x FROM t ORDER BY x");
}

TEST(AdmissionFilter, TerminatorFollowedByWhitespaceIsStripped) {
    Admission a = AdmissionFilter::admit("SELECT 1 ;  \n");
    ASSERT_TRUE(a.allowed);
    EXPECT_EQ(a.query, "SELECT 1");
}

TEST(AdmissionFilter, EmptyQueryIsAllowed) {
    Admission a = AdmissionFilter::admit("   \n\t ");
    ASSERT_TRUE(a.allowed);
    EXPECT_EQ(a.query, "");
}

TEST(AdmissionFilter, LoneTerminatorIsAllowedAsEmpty) {
    Admission a = AdmissionFilter::admit(" ; ");
    ASSERT_TRUE(a.allowed);
    EXPECT_EQ(a.query, "");
}

// ---------------------------------------------------------------------------
// Statement chaining
// ---------------------------------------------------------------------------

TEST(AdmissionFilter, DoubleTrailingTerminatorIsRejected) {
    EXPECT_FALSE(AdmissionFilter::admit("SELECT 1;;").allowed);
    EXPECT_FALSE(AdmissionFilter::admit("SELECT 1; ;").allowed);
}

TEST(AdmissionFilter, ChainedReadOnlyStatementsAreRejected) {
    Admission a = AdmissionFilter::admit("SELECT 1; SELECT 2");
    EXPECT_FALSE(a.allowed);
    EXPECT_FALSE(a.reason.empty());
}

TEST(AdmissionFilter, ChainedMutationIsRejected) {
    EXPECT_FALSE(AdmissionFilter::admit("SELECT 1; DELETE FROM t;").allowed);
}

TEST(AdmissionFilter, TerminatorInsideLiteralIsRejected) {
    // Lexical check; literals are not distinguished
    EXPECT_FALSE(AdmissionFilter::admit("SELECT ';' AS semi").allowed);
}

// ---------------------------------------------------------------------------
// Keyword denylist
// ---------------------------------------------------------------------------

TEST(AdmissionFilter, EveryDeniedKeywordIsRejectedInAnyCase) {
    const std::vector<std::string>& keywords = AdmissionFilter::denied_keywords();
    ASSERT_FALSE(keywords.empty());

    for (const std::string& upper : keywords) {
        std::string lower;
        std::string mixed;
        for (size_t i = 0; i < upper.size(); ++i) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(upper[i])));
            lower += c;
            mixed += (i % 2 == 0) ? c : upper[i];
        }

        EXPECT_FALSE(AdmissionFilter::admit(upper + " something").allowed) << upper;
        EXPECT_FALSE(AdmissionFilter::admit(lower + " something").allowed) << lower;
        EXPECT_FALSE(AdmissionFilter::admit("SELECT 1 " + mixed).allowed) << mixed;
    }
}

TEST(AdmissionFilter, RequiredKeywordsAreDenied) {
    const char* required[] = {
        "INSERT INTO t VALUES (1)",
        "UPDATE t SET x = 2",
        "DELETE FROM t",
        "DROP TABLE t;",
        "ALTER TABLE t ADD COLUMN y INT",
        "ATTACH DATABASE 'x.db' AS x",
        "PRAGMA writable_schema = 1",
        "VACUUM INTO '/tmp/copy.db'",
    };
    for (const char* sql : required) {
        Admission a = AdmissionFilter::admit(sql);
        EXPECT_FALSE(a.allowed) << sql;
        EXPECT_NE(a.reason.find("denied keyword"), std::string::npos) << sql;
    }
}

TEST(AdmissionFilter, KeywordInsideIdentifierOverBlocks) {
    EXPECT_FALSE(AdmissionFilter::admit("SELECT updated_at FROM t").allowed);
    EXPECT_FALSE(AdmissionFilter::admit("SELECT * FROM dropbox_files").allowed);
}

TEST(AdmissionFilter, KeywordInsideStringLiteralOverBlocks) {
    EXPECT_FALSE(AdmissionFilter::admit("SELECT 'please insert coin'").allowed);
}

TEST(AdmissionFilter, NonDeniedStatementsAreLeftToTheEngine) {
    // CREATE and REPLACE are not on the list; the sandbox refuses them later
    EXPECT_TRUE(AdmissionFilter::admit("CREATE TABLE x(a INT)").allowed);
    EXPECT_TRUE(AdmissionFilter::admit("SELECT replace('abc', 'b', 'c')").allowed);
}

TEST(AdmissionFilter, RejectionMessageIsFixed) {
    EXPECT_STREQ(AdmissionFilter::rejection_message(), "forbidden keywords");
}
