#include "TuringMachine.h"

// Лента

void Tape::write(Symbol value) {
    writes_.push_back(value);
}

void Tape::clear() {
    writes_.clear();
}

std::string Tape::value() const {
    std::string out;
    for (auto it = writes_.rbegin(); it != writes_.rend(); ++it) {
        out += toString(*it);
    }
    return out;
}

// Машина Тьюринга

TuringMachine::TuringMachine(const TransitionTable& table) : table_(table) {
    reset();
}

void TuringMachine::reset() {
    tape_.clear();
    states_.assign(1, table_.startState);
    lastTransition_.reset();
    steps_ = 0;
}

StepResult TuringMachine::step(Symbol input) {
    const std::optional<Transition> transition = table_.get(state(), input);

    if (!transition) {
        return StepResult::NoTransition;
    }

    // Применить переход: запись и смена состояния, направление только сообщается
    tape_.write(transition->writeSymbol);
    states_.push_back(transition->nextState);
    lastTransition_ = transition;
    steps_++;
    return StepResult::Ok;
}

State TuringMachine::state() const {
    return states_.back();
}

const std::vector<State>& TuringMachine::states() const {
    return states_;
}

bool TuringMachine::isAccepting() const {
    return table_.isAccepting(state());
}

const std::optional<Transition>& TuringMachine::lastTransition() const {
    return lastTransition_;
}

const Tape& TuringMachine::tape() const {
    return tape_;
}

const TransitionTable& TuringMachine::table() const {
    return table_;
}

uint64_t TuringMachine::steps() const {
    return steps_;
}
