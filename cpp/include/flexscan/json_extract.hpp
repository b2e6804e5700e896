// ==============================================================================
// flexscan/json_extract.hpp - MOD-0008: Выделение JSON из вывода команды
// ==============================================================================
//
// MOD-0008 io::json_extract
//
// Azure CLI может печатать в stdout служебные строки перед JSON.
// Правило: ищется ПЕРВАЯ сверху строка, которая после пропуска пробелов
// начинается с '{' или '['. Результат — текст от начала этой строки до конца
// входа, без изменений (хвост после документа не отрезается).
//
// Ограничение: строка лога, случайно начинающаяся с '{', тоже будет принята
// за начало JSON. Скобки не сопоставляются.
//
// ==============================================================================

#ifndef FLEXSCAN_JSON_EXTRACT_HPP
#define FLEXSCAN_JSON_EXTRACT_HPP

#include <optional>
#include <string>
#include <string_view>

namespace flexscan::io {

/// Выделить JSON из смешанного вывода
/// @return std::nullopt, если подходящей строки нет (NoJsonFound)
std::optional<std::string> extract_json(std::string_view raw);

std::optional<std::string> extract_json(const std::string& raw);

/// nullptr -> std::nullopt
std::optional<std::string> extract_json(const char* raw);

/// Вариант для отсутствующего вывода: std::nullopt на входе -> std::nullopt
std::optional<std::string> extract_json(const std::optional<std::string>& raw);

}  // namespace flexscan::io

#endif  // FLEXSCAN_JSON_EXTRACT_HPP
