// ==============================================================================
// test_problem_gtest.cpp - Тесты фатальных ошибок и кодов завершения
// ==============================================================================

#include "chatx/problem.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <optional>
#include <rapidjson/document.h>
#include <string>

namespace chatx::test {

namespace {

/// Временная подмена $HOME на время теста
class ScopedHome {
public:
    explicit ScopedHome(const char* value) {
        if (const char* old = std::getenv("HOME")) {
            saved_ = old;
        }
        setenv("HOME", value, 1);
    }
    ~ScopedHome() {
        if (saved_) {
            setenv("HOME", saved_->c_str(), 1);
        } else {
            unsetenv("HOME");
        }
    }

private:
    std::optional<std::string> saved_;
};

}  // namespace

TEST(ProblemTest, ExitCodes_ByCategory) {
    EXPECT_EQ(exit_code_for(ErrorCode::ConfigInvalid), 2);
    EXPECT_EQ(exit_code_for(ErrorCode::DbNotFound), 3);
    EXPECT_EQ(exit_code_for(ErrorCode::BackupDecryptFailed), 3);
    EXPECT_EQ(exit_code_for(ErrorCode::StagingTimeout), 3);
    EXPECT_EQ(exit_code_for(ErrorCode::NoValidRows), 4);
    EXPECT_EQ(exit_code_for(ErrorCode::OutputFailed), 5);
    EXPECT_EQ(exit_code_for(ErrorCode::Cancelled), 130);
}

TEST(ProblemTest, Names_AreSnakeCase) {
    EXPECT_STREQ(error_code_name(ErrorCode::BackupEncryptedNeedsPassword),
                 "backup_encrypted_needs_password");
    EXPECT_STREQ(error_code_name(ErrorCode::NoValidRows), "no_valid_rows");
}

TEST(ProblemTest, ToJson_FixedFieldOrder) {
    ScopedHome home("/home/analyst");
    Problem p = make_problem(ErrorCode::DbNotFound, "no such file",
                             "/home/analyst/Library/Messages/chat.db");

    rapidjson::Document doc;
    doc.Parse(p.to_json().c_str());
    ASSERT_FALSE(doc.HasParseError());

    const char* expected_order[] = {"type", "title", "status", "detail", "instance", "code"};
    auto it = doc.MemberBegin();
    for (const char* key : expected_order) {
        ASSERT_NE(it, doc.MemberEnd());
        EXPECT_STREQ(it->name.GetString(), key);
        ++it;
    }
    EXPECT_EQ(std::string(doc["type"].GetString()),
              "https://chatx.local/problems/db_not_found");
    EXPECT_EQ(doc["status"].GetInt(), 404);
    EXPECT_EQ(std::string(doc["instance"].GetString()), "~/Library/Messages/chat.db");
}

TEST(ProblemTest, MakeProblem_RedactsHomeInsideDetail) {
    ScopedHome home("/home/analyst");
    Problem p = make_problem(ErrorCode::StagingFailed,
                             "copy of /home/analyst/chat.db-wal failed: disk full");
    EXPECT_EQ(p.detail, "copy of ~/chat.db-wal failed: disk full");
    EXPECT_TRUE(p.instance.empty());
}

TEST(ProblemTest, PipelineError_CarriesProblem) {
    try {
        throw PipelineError(ErrorCode::Cancelled, "interrupted");
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Cancelled);
        EXPECT_EQ(e.problem().status, 499);
        EXPECT_STREQ(e.what(), "cancelled: interrupted");
    }
}

}  // namespace chatx::test
