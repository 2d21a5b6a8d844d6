// ==============================================================================
// chatx/pipeline.hpp - Прогон извлечения целиком
// ==============================================================================
//
// Порядок шагов (данные идут строго вниз по течению):
//
//   stage → schema → rows → decode → relations → attachments →
//   transcription → validate/quarantine → report
//
// Выходной каталог:
//   messages.jsonl                 - валидные записи
//   quarantine/messages_bad.jsonl  - отклонённые записи с причиной
//   missing_attachments.json       - вложения без источника байтов
//   run_report.json                - счётчики и разрывы
//   attachments/...                - копии при copy_binaries
//
// Фатальные условия бросаются как PipelineError. Отмена проверяется на
// границах строк и между шагами.
//
// ==============================================================================

#ifndef CHATX_PIPELINE_HPP
#define CHATX_PIPELINE_HPP

#include <chatx/config.hpp>
#include <chatx/report.hpp>

#include <atomic>
#include <filesystem>

namespace chatx::output {
class Writer;
}

namespace chatx::pipeline {

/// Имена артефактов относительно output.dir
constexpr const char* MESSAGES_FILE = "messages.jsonl";
constexpr const char* QUARANTINE_FILE = "quarantine/messages_bad.jsonl";
constexpr const char* MISSING_ATTACHMENTS_FILE = "missing_attachments.json";
constexpr const char* RUN_REPORT_FILE = "run_report.json";
constexpr const char* ATTACHMENTS_DIR = "attachments";

struct RunResult {
    report::RunReport report;
    std::filesystem::path out_dir;
};

/// Выполнить прогон. cfg должна пройти config::validate.
/// Бросает PipelineError; при no_valid_rows отчёт уже записан.
RunResult run(const config::ExtractConfig& cfg, output::Writer& writer,
              const std::atomic<bool>* cancel = nullptr);

}  // namespace chatx::pipeline

#endif  // CHATX_PIPELINE_HPP
