#pragma once

#include <string>

/** @brief Уровень диагностического сообщения */
enum class DiagnosticLevel { Error, Warning, Info };

/** @brief Диагностическое сообщение о таблице переходов */
struct Diagnostic {
    DiagnosticLevel level{DiagnosticLevel::Error};
    std::string message;
};

/** @brief Символ, не входящий в алфавит машины */
struct SymbolNotAccepted {
    std::string value;  ///< Полная последовательность UTF-8 символа
};

/** @brief Сообщение для пользователя: "TM doesn't accept symbol: x" */
std::string describe(const SymbolNotAccepted& error);
