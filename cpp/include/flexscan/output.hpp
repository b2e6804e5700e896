// ==============================================================================
// flexscan/output.hpp - MOD-0003: Пользовательский вывод
// ==============================================================================
//
// MOD-0003 output
// ADR-0006: собственный слой вывода и логирования
// GUIDE-0001 G-011: только этот модуль пишет в stdout/stderr
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Уровни сообщений: info/warn/error/debug/trace
// - Цветной вывод (ANSI escape codes) только на TTY
// - Таблицы для итоговой сводки
//
// ==============================================================================

#ifndef FLEXSCAN_OUTPUT_HPP
#define FLEXSCAN_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace flexscan::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить info и warn
    int verbose = 0;     // -v: уровень подробности (0..2+)

    // Подмена потоков (тесты пишут во временные файлы).
    // nullptr = stdout/stderr процесса. Для подменённых потоков цвет отключён.
    FILE* stdout_sink = nullptr;
    FILE* stderr_sink = nullptr;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Сбросить буферы
    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Префикс уровня + сообщение в stderr
    void write_tagged(std::string_view tag, Color color, std::string_view message);

    /// Записать с цветом (без цвета, если поток не TTY)
    void write_colored(Stream s, std::string_view message, Color color);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    /// Разрешён ли цвет для потока
    bool use_color(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

enum class Align { Left, Right };

class Table {
public:
    Table();

    /// Добавить заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Выравнивание столбца (по умолчанию Left)
    void set_alignment(size_t col, Align align);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w) const;

    /// Вывести таблицу в строку
    std::string to_string() const;

private:
    std::string format_line(char kind, const std::vector<size_t>& widths) const;
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;
    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<Align> alignment_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Ширина строки в символах (UTF-8 code points)
size_t display_width(std::string_view text);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

}  // namespace flexscan::output

#endif  // FLEXSCAN_OUTPUT_HPP
