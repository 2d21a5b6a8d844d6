// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include "chatx/cli.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace chatx::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

const ExtractCommand& extract_of(const ParseResult& result) {
    return std::get<ExtractCommand>(result.command);
}

// ==============================================================================
// help / version
// ==============================================================================

TEST(CliTest, Parse_NoArguments_IsUsageError) {
    Args args{"chatx"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("Usage: chatx"), std::string::npos);
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"chatx", "--help"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(std::get<HelpCommand>(result.command).command.has_value());
}

TEST(CliTest, Parse_ExtractHelp_ReturnsExtractHelp) {
    Args args{"chatx", "extract", "--db", "chat.db", "-h"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_EQ(std::get<HelpCommand>(result.command).command.value_or(""), "extract");
    EXPECT_NE(render_help(std::string("extract")).find("--from-backup"), std::string::npos);
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"chatx", "-V"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), std::string("chatx ") + VERSION + "\n");
}

// ==============================================================================
// extract
// ==============================================================================

TEST(CliTest, Parse_ExtractLive_AllFlags) {
    Args args{"chatx",          "-q",        "extract",       "--db",
              "~/chat.db",      "--out=res", "--conversation", "iMessage;-;+15550100",
              "--copy-binaries", "--transcribe", "fixed",     "--workers",
              "8",              "--keep-staging", "-v"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.quiet);
    EXPECT_EQ(result.global.verbose, 1);

    const ExtractCommand& cmd = extract_of(result);
    EXPECT_EQ(cmd.db.value_or(""), "~/chat.db");
    EXPECT_EQ(cmd.out.value_or(""), "res");
    EXPECT_EQ(cmd.conversation.value_or(""), "iMessage;-;+15550100");
    EXPECT_EQ(cmd.copy_binaries, std::optional<bool>(true));
    EXPECT_EQ(cmd.transcribe, std::optional<config::TranscriptionMode>(
                                  config::TranscriptionMode::Fixed));
    EXPECT_EQ(cmd.workers, std::optional<int>(8));
    EXPECT_EQ(cmd.keep_staging, std::optional<bool>(true));
    EXPECT_FALSE(cmd.include_attachments.has_value());
}

TEST(CliTest, Parse_ExtractBackup_WithPasswordEnv) {
    Args args{"chatx", "extract", "--from-backup", "/backups/0000-1111",
              "--backup-password-env", "BACKUP_PW", "--no-attachments"};
    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const ExtractCommand& cmd = extract_of(result);
    EXPECT_EQ(cmd.backup.value_or(""), "/backups/0000-1111");
    EXPECT_EQ(cmd.password_env.value_or(""), "BACKUP_PW");
    EXPECT_EQ(cmd.include_attachments, std::optional<bool>(false));
}

TEST(CliTest, Parse_DbAndBackupTogether_IsUsageError) {
    Args args{"chatx", "extract", "--db", "a.db", "--from-backup", "b"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("cannot be used with"), std::string::npos);
}

TEST(CliTest, Parse_InvalidTranscribeMode_IsUsageError) {
    Args args{"chatx", "extract", "--db", "a.db", "--transcribe", "cloud"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("'cloud'"), std::string::npos);
}

TEST(CliTest, Parse_InvalidWorkers_IsUsageError) {
    for (const char* bad : {"0", "-3", "many", "4x"}) {
        Args args{"chatx", "extract", "--db", "a.db", "--workers", bad};
        ParseResult result = parse(args.argc(), args.argv());
        EXPECT_FALSE(result.ok) << bad;
    }
}

TEST(CliTest, Parse_MissingValue_IsUsageError) {
    Args args{"chatx", "extract", "--db"};
    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("--db <DB>"), std::string::npos);
}

TEST(CliTest, Parse_UnknownSubcommandOrFlag_IsUsageError) {
    Args unknown_cmd{"chatx", "hunt"};
    EXPECT_FALSE(parse(unknown_cmd.argc(), unknown_cmd.argv()).ok);

    Args unknown_flag{"chatx", "extract", "--db", "a.db", "--bogus"};
    ParseResult result = parse(unknown_flag.argc(), unknown_flag.argv());
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("'--bogus'"), std::string::npos);
}

// ==============================================================================
// Наложение на конфигурацию
// ==============================================================================

TEST(CliTest, ApplyOverrides_OnlyTouchesGivenFlags) {
    config::ExtractConfig cfg;
    cfg.source.kind = config::SourceKind::Backup;
    cfg.source.backup_root = "/from/file";
    cfg.attachments.workers = 2;
    cfg.attachments.copy_binaries = true;
    cfg.output.dir = "file_out";

    ExtractCommand cmd;
    cmd.db = std::filesystem::path("/cli/chat.db");
    cmd.workers = 6;

    apply_overrides(cmd, cfg);

    EXPECT_EQ(cfg.source.kind, config::SourceKind::Live);
    EXPECT_EQ(cfg.source.db_path, "/cli/chat.db");
    EXPECT_TRUE(cfg.source.backup_root.empty());
    EXPECT_EQ(cfg.attachments.workers, 6);
    EXPECT_TRUE(cfg.attachments.copy_binaries);
    EXPECT_EQ(cfg.output.dir, "file_out");
}

}  // namespace chatx::cli::test
