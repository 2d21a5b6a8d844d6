// ==============================================================================
// chatx/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - std::filesystem::path <-> UTF-8 с явными преобразованиями
// - Детект TTY для цветного вывода
// - Временные файлы и приватные каталоги (0700)
// - Домашний каталог: раскрытие "~" и редактирование путей в сообщениях
//
// ==============================================================================

#ifndef CHATX_PLATFORM_HPP
#define CHATX_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chatx::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Временные каталоги
// ----------------------------------------------------------------------------

/// Создать приватный каталог (mkdtemp, права 0700) внутри parent.
/// При пустом parent используется $TMPDIR или /tmp.
/// Бросает std::runtime_error при ошибке.
std::filesystem::path make_private_dir(std::string_view prefix,
                                       const std::filesystem::path& parent = {});

// ----------------------------------------------------------------------------
// Домашний каталог
// ----------------------------------------------------------------------------

/// $HOME (или запись passwd); std::nullopt если определить нельзя
std::optional<std::filesystem::path> home_dir();

/// Раскрыть ведущий "~" или "~/" относительно home
std::filesystem::path expand_home(std::string_view path, const std::filesystem::path& home);

/// Заменить префикс домашнего каталога на "~" (для сообщений об ошибках)
std::string redact_path(std::string_view path, const std::filesystem::path& home);

/// redact_path с текущим home_dir()
std::string redact_path(std::string_view path);

// ----------------------------------------------------------------------------
// Прочее
// ----------------------------------------------------------------------------

/// Значение переменной окружения (пустая строка считается отсутствующей)
std::optional<std::string> get_env(const std::string& name);

std::string os_name();

}  // namespace chatx::platform

#endif  // CHATX_PLATFORM_HPP
