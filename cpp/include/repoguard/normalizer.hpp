// ==============================================================================
// repoguard/normalizer.hpp - Нормализация окончаний строк
// ==============================================================================
//
// Назначение:
// - Перезапись файла на месте в целевой стиль окончаний строк
// - Все прочие байты (табуляции, хвостовые пробелы) сохраняются как есть
// - Запись атомарна: временный файл + rename (platform::replace_file_atomic)
//
// Вызывается только при ScanConfig::normalizes(). NoNewlines, NotText и файлы,
// уже совпадающие с target, не трогаются.
//
// ==============================================================================

#ifndef REPOGUARD_NORMALIZER_HPP
#define REPOGUARD_NORMALIZER_HPP

#include "repoguard/config.hpp"
#include "repoguard/error.hpp"
#include "repoguard/inspector.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace repoguard::check {

/// Привести все терминаторы к target
///
/// Unix: "\r\n" -> "\n", вместе со всей серией '\r' перед '\n'
/// ("a\r\r\n" -> "a\n"), так что в выводе не остаётся ни одного "\r\n".
/// Windows: одиночный "\n" -> "\r\n".
/// '\r', за которым не следует '\n', терминатором не считается и не меняется.
/// target=None возвращает bytes без изменений. Функция идемпотентна.
std::string normalize_line_endings(std::string_view bytes, config::LineEndingTarget target);

/// Отличается ли стиль файла от target так, что файл нужно переписать
bool needs_rewrite(const FileRecord& record, config::LineEndingTarget target);

/// Результат нормализации одного файла
struct NormalizeResult {
    bool rewritten = false;
    std::optional<Error> error;  // ErrorKind::Write

    bool ok() const { return !error.has_value(); }
};

/// Переписать файл записи в стиль cfg.line_ending_target
///
/// Не бросает: ошибки возвращаются как ErrorKind::Write.
NormalizeResult normalize_file(const FileRecord& record, const config::ScanConfig& cfg);

/// Нормализовать (если нужно) и вернуть запись, заменяющую исходную
///
/// - Перезапись не нужна: возвращается исходная запись
/// - Успех: файл проверяется заново, rewrite=Rewritten
/// - Ошибка: копия исходной записи с rewrite=Failed и WriteError
FileRecord apply_normalization(const FileRecord& record, const config::ScanConfig& cfg);

}  // namespace repoguard::check

#endif  // REPOGUARD_NORMALIZER_HPP
