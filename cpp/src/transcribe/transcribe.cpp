// ==============================================================================
// transcribe.cpp - Локальная транскрипция аудио вложений
// ==============================================================================

#include "chatx/transcribe.hpp"

#include "chatx/output.hpp"
#include "chatx/parallel.hpp"
#include "chatx/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace chatx::transcribe {

namespace {

void fail(TranscribeError* error, TranscribeErrorKind kind, std::string message) {
    if (error != nullptr) {
        *error = TranscribeError{kind, std::move(message)};
    }
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

/// Результат дочернего процесса
struct ChildResult {
    bool timed_out = false;
    int status = 0;
    std::string out;
};

/// fork/exec с захватом stdout; stderr уходит в /dev/null.
/// По таймауту процесс получает SIGKILL.
std::optional<ChildResult> run_child(const std::vector<std::string>& args,
                                     std::chrono::milliseconds timeout, std::string& error) {
    // argv собирается до fork: в дочернем процессе только async-signal-safe вызовы
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    // FD_CLOEXEC: параллельные воркеры не должны наследовать чужие каналы
    int fds[2];
    if (pipe(fds) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        return std::nullopt;
    }
    for (int fd : fds) {
        if (fcntl(fd, F_SETFD, FD_CLOEXEC) != 0) {
            error = std::string("fcntl: ") + std::strerror(errno);
            close(fds[0]);
            close(fds[1]);
            return std::nullopt;
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return std::nullopt;
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
        }
        close(fds[0]);
        close(fds[1]);
        execv(argv[0], argv.data());
        _exit(127);
    }

    close(fds[1]);
    ChildResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    bool eof = false;

    while (!eof) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(std::min<std::int64_t>(left.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.timed_out = true;
            break;
        }
        if (rc == 0) {
            continue;
        }
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.out.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR) {
            eof = true;
        }
    }
    close(fds[0]);

    // stdout закрыт, но процесс может ещё работать: ждём его до того же срока
    int status = 0;
    bool reaped = false;
    while (!result.timed_out) {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            reaped = true;
            break;
        }
        if (rc < 0 && errno != EINTR) {
            error = std::string("waitpid: ") + std::strerror(errno);
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!reaped) {
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    result.status = status;
    return result;
}

}  // namespace

std::string TranscribeError::format() const {
    switch (kind) {
    case TranscribeErrorKind::AudioMissing:
        return "audio not available: " + message;
    case TranscribeErrorKind::SpawnFailed:
        return "engine failed to start: " + message;
    case TranscribeErrorKind::Timeout:
        return "engine timed out: " + message;
    case TranscribeErrorKind::ExitStatus:
        return "engine failed: " + message;
    case TranscribeErrorKind::EmptyOutput:
        return "empty transcript: " + message;
    }
    return message;
}

// ----------------------------------------------------------------------------
// FixedTranscriber
// ----------------------------------------------------------------------------

std::optional<Transcript> FixedTranscriber::transcribe(const std::filesystem::path& audio,
                                                       TranscribeError* error) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(audio, ec)) {
        fail(error, TranscribeErrorKind::AudioMissing, platform::path_to_utf8(audio));
        return std::nullopt;
    }
    return Transcript{text_, engine()};
}

// ----------------------------------------------------------------------------
// LocalCommandTranscriber
// ----------------------------------------------------------------------------

LocalCommandTranscriber::LocalCommandTranscriber(LocalCommandOptions options)
    : options_(std::move(options)) {}

std::string LocalCommandTranscriber::engine() const {
    return "local:" + platform::path_to_utf8(options_.engine_path.filename());
}

std::vector<std::string> LocalCommandTranscriber::command_line(
    const std::filesystem::path& audio) const {
    std::vector<std::string> args{platform::path_to_utf8(options_.engine_path)};
    if (!options_.model_path.empty()) {
        args.push_back("-m");
        args.push_back(platform::path_to_utf8(options_.model_path));
    }
    args.push_back("-l");
    args.push_back(options_.language.empty() ? "auto" : options_.language);
    args.push_back("-nt");
    args.push_back("-np");
    args.push_back("-f");
    args.push_back(platform::path_to_utf8(audio));
    return args;
}

std::optional<Transcript> LocalCommandTranscriber::transcribe(const std::filesystem::path& audio,
                                                              TranscribeError* error) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(audio, ec)) {
        fail(error, TranscribeErrorKind::AudioMissing, platform::path_to_utf8(audio));
        return std::nullopt;
    }

    std::string spawn_error;
    auto child = run_child(command_line(audio), options_.timeout, spawn_error);
    if (!child) {
        fail(error, TranscribeErrorKind::SpawnFailed, spawn_error);
        return std::nullopt;
    }
    if (child->timed_out) {
        fail(error, TranscribeErrorKind::Timeout,
             std::to_string(options_.timeout.count()) + "s elapsed");
        return std::nullopt;
    }
    if (!WIFEXITED(child->status) || WEXITSTATUS(child->status) != 0) {
        int code = WIFEXITED(child->status) ? WEXITSTATUS(child->status) : -1;
        fail(error, code == 127 ? TranscribeErrorKind::SpawnFailed : TranscribeErrorKind::ExitStatus,
             "exit status " + std::to_string(code));
        return std::nullopt;
    }

    std::string text = trim(child->out);
    if (text.empty()) {
        fail(error, TranscribeErrorKind::EmptyOutput, platform::path_to_utf8(audio.filename()));
        return std::nullopt;
    }
    return Transcript{text, engine()};
}

std::unique_ptr<Transcriber> make_transcriber(const config::TranscriptionConfig& cfg) {
    switch (cfg.mode) {
    case config::TranscriptionMode::Off:
        return nullptr;
    case config::TranscriptionMode::Fixed:
        return std::make_unique<FixedTranscriber>(cfg.fixed_text);
    case config::TranscriptionMode::Local: {
        LocalCommandOptions options;
        options.engine_path = cfg.engine_path;
        options.model_path = cfg.model_path;
        options.language = cfg.language;
        options.timeout = std::chrono::seconds(cfg.timeout_seconds);
        return std::make_unique<LocalCommandTranscriber>(std::move(options));
    }
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// apply
// ----------------------------------------------------------------------------

TranscriptionStats apply(std::vector<message::CanonicalMessage>& messages,
                         const Transcriber& transcriber, int workers, output::Writer& writer,
                         const std::atomic<bool>* cancel) {
    // Только сообщения с разрешённым аудио
    std::vector<std::size_t> targets;
    for (std::size_t i = 0; i < messages.size(); ++i) {
        for (const auto& a : messages[i].attachments) {
            if (a.type == message::AttachmentType::Audio && a.local_path) {
                targets.push_back(i);
                break;
            }
        }
    }

    std::atomic<std::size_t> created{0};
    std::atomic<std::size_t> failed{0};

    parallel_for(
        targets.size(), workers,
        [&](std::size_t n) {
            message::CanonicalMessage& msg = messages[targets[n]];
            Value transcripts = Value::make_array();
            for (const auto& a : msg.attachments) {
                if (a.type != message::AttachmentType::Audio || !a.local_path) {
                    continue;
                }
                TranscribeError error;
                auto result = transcriber.transcribe(platform::path_from_utf8(*a.local_path), &error);
                if (!result) {
                    ++failed;
                    writer.warn(msg.msg_id + ": " + error.format());
                    continue;
                }
                Value entry = Value::make_object();
                entry.set("filename", Value(a.filename));
                entry.set("text", Value(result->text));
                entry.set("engine", Value(result->engine));
                transcripts.push_back(std::move(entry));
                ++created;
            }
            if (transcripts.array_size() > 0) {
                msg.source_meta.set("transcript", std::move(transcripts));
            }
        },
        cancel);

    TranscriptionStats stats;
    stats.created = created.load();
    stats.failed = failed.load();
    return stats;
}

}  // namespace chatx::transcribe
