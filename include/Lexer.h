#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "Types.h"

/** @brief Типы лексем входной строки */
enum class TokenType {
    Eof,     // Конец строки
    Symbol,  // Символ алфавита (0, 1, #)
    Unknown  // Символ вне алфавита
};

/** @brief Представление лексемы */
struct Token {
    TokenType type{TokenType::Eof};
    std::string value;  // Исходный символ целиком (UTF-8)
    ::Symbol symbol{::Symbol::Blank};
};

/**
 * @brief Лексический анализатор строки, введённой пользователем
 *
 * Строка читается по кодовым точкам UTF-8: многобайтовый символ
 * образует одну лексему.
 */
class Lexer {
public:
    explicit Lexer(std::string_view source);

    /** @brief Следующая лексема; пробельные символы (включая Unicode) пропускаются */
    Token next();

private:
    /** @brief Длина последовательности UTF-8, начинающейся в текущей позиции */
    std::size_t sequenceLength() const;

    /** @brief Кодовая точка в текущей позиции */
    char32_t codePoint() const;

    void skipWhitespace();

    std::string_view source_;
    std::size_t pos_{0};
};

/** @brief Пробельный символ в смысле Unicode (пробелы, разделители строк и абзацев) */
bool isWhitespace(char32_t cp);
