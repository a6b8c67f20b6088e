#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "TransitionTable.h"
#include "Types.h"

/** @brief Результат выполнения одного шага машины */
enum class StepResult {
    Ok,           ///< Переход выполнен
    NoTransition  ///< Нет перехода для текущей пары (state, symbol)
};

/**
 * @brief Лента машины Тьюринга
 *
 * Позиция головки не хранится: лента - журнал записанных символов
 * в порядке записи. Головка при записи движется влево, поэтому
 * значение на ленте читается в обратном порядке.
 */
class Tape {
public:
    /** @brief Дописать символ */
    void write(Symbol value);

    /** @brief Очистить ленту */
    void clear();

    /** @brief Записанные символы в хронологическом порядке */
    const std::vector<Symbol>& writes() const { return writes_; }

    /** @brief Количество записей */
    std::size_t size() const { return writes_.size(); }

    /** @brief Значение на ленте: записи в обратном порядке */
    std::string value() const;

private:
    std::vector<Symbol> writes_;
};

/** @brief Машина Тьюринга с историей состояний */
class TuringMachine {
public:
    explicit TuringMachine(const TransitionTable& table);

    /** @brief Сбросить машину в начальное состояние */
    void reset();

    /**
     * @brief Прочитать входной символ и выполнить переход
     *
     * Если перехода нет (например, из idle), история не меняется.
     */
    StepResult step(Symbol input);

    /** @brief Получить текущее состояние */
    State state() const;

    /** @brief Все пройденные состояния, начиная с начального */
    const std::vector<State>& states() const;

    /** @brief Проверить, является ли текущее состояние допускающим */
    bool isAccepting() const;

    /** @brief Последний применённый переход */
    const std::optional<Transition>& lastTransition() const;

    /** @brief Получить ленту (только чтение) */
    const Tape& tape() const;

    /** @brief Получить таблицу переходов */
    const TransitionTable& table() const;

    /** @brief Получить количество выполненных переходов */
    uint64_t steps() const;

private:
    const TransitionTable& table_;
    Tape tape_;
    std::vector<State> states_;
    std::optional<Transition> lastTransition_;
    uint64_t steps_{0};
};
