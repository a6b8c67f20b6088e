#pragma once

#include <iosfwd>

#include "TransitionTable.h"
#include "TuringMachine.h"

/**
 * @class Session
 * @brief Один запуск машины с выводом отчёта
 *
 * Конструктор печатает таблицу переходов и начальное состояние.
 * Итоговый отчёт печатается ровно один раз: явным вызовом finalize()
 * или в деструкторе, в том числе при выходе по исключению.
 */
class Session {
public:
    Session(const TransitionTable& table, std::ostream& out);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /** @brief Подать символ машине и вывести результат шага */
    StepResult consume(Symbol symbol);

    /** @brief Вывести путь состояний, итоговое состояние и значение на ленте */
    void finalize();

    bool finalized() const { return finalized_; }

    const TuringMachine& machine() const { return tm_; }

private:
    TuringMachine tm_;
    std::ostream& out_;
    bool finalized_{false};
};
