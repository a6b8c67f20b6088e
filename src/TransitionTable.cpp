#include "TransitionTable.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

std::string toString(const Transition& transition) {
    return toString(transition.writeSymbol) + ", " + toString(transition.nextState) + ", " +
           toString(transition.move);
}

bool TransitionTable::add(State state, Symbol symbol, const Transition& transition) {
    Key key{state, symbol};

    // Детерминированность: только один переход на пару (состояние, символ).
    auto [it, inserted] = transitions_.emplace(key, transition);

    if (!inserted) {
        return false;
    }
    entries_.push_back({state, symbol, transition});
    return true;
}

bool TransitionTable::has(State state, Symbol symbol) const {
    Key key{state, symbol};
    return transitions_.find(key) != transitions_.end();
}

std::optional<Transition> TransitionTable::get(State state, Symbol symbol) const {
    Key key{state, symbol};
    auto it = transitions_.find(key);
    if (it == transitions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TransitionTable::isAccepting(State state) const {
    return std::find(acceptingStates.begin(), acceptingStates.end(), state) != acceptingStates.end();
}

std::vector<State> TransitionTable::states() const {
    std::vector<State> out;
    for (const auto& entry : entries_) {
        if (std::find(out.begin(), out.end(), entry.state) == out.end()) {
            out.push_back(entry.state);
        }
    }
    return out;
}

std::vector<Symbol> TransitionTable::alphabet() const {
    std::vector<Symbol> out;
    for (const auto& entry : entries_) {
        if (std::find(out.begin(), out.end(), entry.symbol) == out.end()) {
            out.push_back(entry.symbol);
        }
    }
    return out;
}

bool TransitionTable::validate(std::vector<Diagnostic>& out) const {
    bool ok = true;

    const std::vector<State> sources = states();
    if (std::find(sources.begin(), sources.end(), startState) == sources.end()) {
        ok = false;
        out.push_back({DiagnosticLevel::Error,
                       "start state " + toString(startState) + " has no transitions"});
    }

    // Из терминального состояния idle переходов быть не должно
    for (const auto& entry : entries_) {
        if (entry.state == State::Idle) {
            ok = false;
            out.push_back({DiagnosticLevel::Error,
                           "terminal state has a transition on " + toString(entry.symbol)});
        }
    }

    for (State accepting : acceptingStates) {
        const bool reachable = std::any_of(entries_.begin(), entries_.end(), [accepting](const TransitionEntry& entry) {
            return entry.transition.nextState == accepting;
        });
        if (!reachable && accepting != startState) {
            out.push_back({DiagnosticLevel::Warning,
                           "accepting state " + toString(accepting) + " is unreachable"});
        }
    }

    return ok;
}

const TransitionTable& TransitionTable::standard() {
    static const TransitionTable table = [] {
        TransitionTable t;
        t.startState = State::Q0;
        t.acceptingStates = {State::Q2};

        const TransitionEntry rows[] = {
            // clang-format off
            {State::Q0, Symbol::Zero,  {Symbol::Zero,  State::Q1,   Move::Left}},
            {State::Q0, Symbol::One,   {Symbol::One,   State::Q1,   Move::Left}},
            {State::Q0, Symbol::Theta, {Symbol::Blank, State::Idle, Move::Stay}},
            {State::Q1, Symbol::Zero,  {Symbol::Blank, State::Idle, Move::Stay}},
            {State::Q1, Symbol::One,   {Symbol::Blank, State::Idle, Move::Stay}},
            {State::Q1, Symbol::Theta, {Symbol::One,   State::Q2,   Move::Left}},
            {State::Q2, Symbol::Zero,  {Symbol::Blank, State::Idle, Move::Stay}},
            {State::Q2, Symbol::One,   {Symbol::Blank, State::Idle, Move::Stay}},
            {State::Q2, Symbol::Theta, {Symbol::Blank, State::Idle, Move::Stay}},
            // clang-format on
        };
        for (const auto& row : rows) {
            if (!t.add(row.state, row.symbol, row.transition)) {
                throw std::logic_error("duplicate transition for " + toString(row.state) + ", " +
                                       toString(row.symbol));
            }
        }
        return t;
    }();
    return table;
}
