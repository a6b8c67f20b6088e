#pragma once

#include <string>

/** @brief Символ алфавита ленты машины Тьюринга */
enum class Symbol { Zero, One, Theta, Blank };

/** @brief Состояние машины Тьюринга */
enum class State { Q0, Q1, Q2, Idle };

/** @brief Направление движения головки */
enum class Move { Left, Right, Stay };

/** @brief Текстовое представление символа ("0", "1", "Θ", "-") */
std::string toString(Symbol symbol);

/** @brief Текстовое представление состояния (idle печатается как "-") */
std::string toString(State state);

/** @brief Текстовое представление направления ("L", "R", "-") */
std::string toString(Move move);
