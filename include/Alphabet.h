#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "Diagnostics.h"
#include "Types.h"

/**
 * @struct SymbolParseResult
 * @brief Результат разбора одного символа
 */
struct SymbolParseResult {
    std::optional<Symbol> symbol;
    SymbolNotAccepted error;

    bool ok() const { return symbol.has_value(); }
};

/**
 * @struct LineParseResult
 * @brief Результат разбора строки ввода
 *
 * При ошибке symbols пуст: строка отбрасывается целиком.
 */
struct LineParseResult {
    bool ok{false};
    bool empty{false};  ///< В строке только пробельные символы
    std::vector<Symbol> symbols;
    SymbolNotAccepted error;
};

/**
 * @brief Получить символ алфавита по литере
 * @param value '0', '1' или '#' (theta)
 * @return Символ либо ошибка SymbolNotAccepted для любой другой литеры
 */
SymbolParseResult parseSymbol(char value);

/**
 * @brief Разобрать строку ввода в последовательность символов
 * @param line Строка без завершающего перевода строки
 * @return Все символы строки либо первая недопустимая литера
 */
LineParseResult parseLine(std::string_view line);
