#include "Session.h"

#include <exception>
#include <ostream>

#include "Printer.h"

Session::Session(const TransitionTable& table, std::ostream& out) : tm_(table), out_(out) {
    printTable(out_, tm_.table());
    printState(out_, tm_.state(), tm_.isAccepting(), false);
}

Session::~Session() {
    // Поток с установленным exceptions() бросает ios_base::failure;
    // ошибка остаётся в состоянии потока (badbit), деструктор не бросает
    try {
        finalize();
    } catch (const std::exception&) {
        finalized_ = true;
    }
}

StepResult Session::consume(Symbol symbol) {
    printReading(out_, symbol);

    const StepResult result = tm_.step(symbol);
    if (result == StepResult::Ok) {
        const Transition& transition = *tm_.lastTransition();
        printState(out_, tm_.state(), tm_.isAccepting(), false);
        printWritten(out_, transition.writeSymbol);
        printMove(out_, transition.move);
    }
    return result;
}

void Session::finalize() {
    if (finalized_) {
        return;
    }
    finalized_ = true;

    printStatePath(out_, tm_.states());
    printState(out_, tm_.state(), tm_.isAccepting(), true);
    if (tm_.isAccepting()) {
        printFinalValue(out_, tm_.tape().value());
    }
    out_.flush();
}
