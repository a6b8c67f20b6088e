#pragma once

#include <iosfwd>
#include <vector>

#include "TransitionTable.h"
#include "Types.h"

/**
 * @class App
 * @brief Консольный цикл: запрос строки, разбор, подача символов машине
 */
class App {
public:
    App(std::istream& in, std::ostream& out, const TransitionTable& table = TransitionTable::standard());

    /**
     * @brief Выполнить один запуск машины
     *
     * Запрашивает строки, пока не будет введена непустая строка из
     * символов алфавита. Строка с недопустимым символом отбрасывается
     * целиком. Итоговый отчёт печатается при любом выходе.
     *
     * @return Код завершения процесса
     * @throws std::runtime_error если ввод закончился раньше
     */
    int run();

private:
    /** @brief Читать строки до первой корректной */
    std::vector<Symbol> readSymbols();

    std::istream& in_;
    std::ostream& out_;
    const TransitionTable& table_;
};
