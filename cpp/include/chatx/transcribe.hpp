// ==============================================================================
// chatx/transcribe.hpp - Transcription Adapter: аудио вложения → текст
// ==============================================================================
//
// Назначение:
// - Transcriber: интерфейс локального движка распознавания речи
// - FixedTranscriber: детерминированная заглушка (mode: fixed)
// - LocalCommandTranscriber: локальный исполняемый файл (whisper.cpp и т.п.),
//   запускается с фиксированными аргументами и ограничен таймаутом
// - apply(): транскрипты в source_meta.transcript, text не меняется
//
// Аудио никогда не покидает устройство: поддерживаются только локальные
// процессы.
//
// ==============================================================================

#ifndef CHATX_TRANSCRIBE_HPP
#define CHATX_TRANSCRIBE_HPP

#include <chatx/config.hpp>
#include <chatx/message.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatx::output {
class Writer;
}

namespace chatx::transcribe {

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class TranscribeErrorKind {
    AudioMissing,  // файл недоступен
    SpawnFailed,   // fork/exec движка
    Timeout,       // движок не завершился вовремя
    ExitStatus,    // ненулевой код завершения
    EmptyOutput    // движок ничего не распознал
};

struct TranscribeError {
    TranscribeErrorKind kind = TranscribeErrorKind::SpawnFailed;
    std::string message;

    std::string format() const;
};

struct Transcript {
    std::string text;
    std::string engine;
};

// ----------------------------------------------------------------------------
// Transcriber
// ----------------------------------------------------------------------------

class Transcriber {
public:
    virtual ~Transcriber() = default;

    /// Имя движка для source_meta.transcript[].engine
    virtual std::string engine() const = 0;

    /// Распознать файл; std::nullopt при ошибке (error заполняется).
    /// Реализации должны быть потокобезопасны.
    virtual std::optional<Transcript> transcribe(const std::filesystem::path& audio,
                                                 TranscribeError* error) const = 0;
};

/// Возвращает один и тот же текст для любого файла
class FixedTranscriber : public Transcriber {
public:
    explicit FixedTranscriber(std::string text) : text_(std::move(text)) {}

    std::string engine() const override { return "fixed"; }
    std::optional<Transcript> transcribe(const std::filesystem::path& audio,
                                         TranscribeError* error) const override;

private:
    std::string text_;
};

struct LocalCommandOptions {
    std::filesystem::path engine_path;
    std::filesystem::path model_path;
    std::string language = "auto";
    std::chrono::seconds timeout{120};
};

/// Запуск локального движка: <engine> -m <model> -l <lang> -nt -np -f <audio>,
/// транскрипт читается из stdout
class LocalCommandTranscriber : public Transcriber {
public:
    explicit LocalCommandTranscriber(LocalCommandOptions options);

    std::string engine() const override;
    std::optional<Transcript> transcribe(const std::filesystem::path& audio,
                                         TranscribeError* error) const override;

    /// argv для файла (без запуска)
    std::vector<std::string> command_line(const std::filesystem::path& audio) const;

private:
    LocalCommandOptions options_;
};

/// nullptr для mode: off
std::unique_ptr<Transcriber> make_transcriber(const config::TranscriptionConfig& cfg);

// ----------------------------------------------------------------------------
// Применение к сообщениям
// ----------------------------------------------------------------------------

struct TranscriptionStats {
    std::size_t created = 0;
    std::size_t failed = 0;
};

/// Распознать разрешённые аудио вложения всех сообщений.
/// Результаты добавляются в source_meta.transcript в порядке вложений.
TranscriptionStats apply(std::vector<message::CanonicalMessage>& messages,
                         const Transcriber& transcriber, int workers, output::Writer& writer,
                         const std::atomic<bool>* cancel = nullptr);

}  // namespace chatx::transcribe

#endif  // CHATX_TRANSCRIBE_HPP
