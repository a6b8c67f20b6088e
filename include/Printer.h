#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "TransitionTable.h"
#include "Types.h"

/** @brief Таблица строк для вывода сеткой */
using Grid = std::vector<std::vector<std::string>>;

/**
 * @brief Построить сетку таблицы переходов
 *
 * Заголовок: "δ" и входные символы в порядке появления. Далее по строке
 * на каждое состояние: метка состояния и "w, n, m" в колонке символа
 * ("-", если перехода нет).
 */
Grid tableGrid(const TransitionTable& table);

/** @brief Вывести сетку с рамкой из '+', '-', '|'; ячейки выровнены вправо */
void printGrid(std::ostream& out, const Grid& grid);

/** @brief Ширина строки UTF-8 в кодовых точках */
std::size_t displayWidth(std::string_view text);

/** @brief "Transition table:" и сетка таблицы */
void printTable(std::ostream& out, const TransitionTable& table);

/**
 * @brief "Current TM state: q0 " либо "Final TM state: q2 (accepting)"
 *
 * Пометка "(accepting)" выводится только в итоговой строке.
 */
void printState(std::ostream& out, State state, bool accepting, bool onClose);

void printReading(std::ostream& out, Symbol symbol);

void printWritten(std::ostream& out, Symbol symbol);

void printMove(std::ostream& out, Move move);

/** @brief "State change path: q0→q1→..." */
void printStatePath(std::ostream& out, const std::vector<State>& states);

void printFinalValue(std::ostream& out, const std::string& value);
