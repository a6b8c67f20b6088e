#include "Types.h"

std::string toString(Symbol symbol) {
    switch (symbol) {
    case Symbol::Zero:
        return "0";
    case Symbol::One:
        return "1";
    case Symbol::Theta:
        return "Θ";
    case Symbol::Blank:
        return "-";
    }
    return "?";
}

std::string toString(State state) {
    switch (state) {
    case State::Q0:
        return "q0";
    case State::Q1:
        return "q1";
    case State::Q2:
        return "q2";
    case State::Idle:
        return "-";
    }
    return "?";
}

std::string toString(Move move) {
    switch (move) {
    case Move::Left:
        return "L";
    case Move::Right:
        return "R";
    case Move::Stay:
        return "-";
    }
    return "?";
}
