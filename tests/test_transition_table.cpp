#include <gtest/gtest.h>

#include "TransitionTable.h"

namespace {

struct Row {
    State state;
    Symbol symbol;
    Symbol write;
    State next;
    Move move;
};

TEST(TransitionTableTest, StandardTableContents) {
    const TransitionTable& table = TransitionTable::standard();

    const Row rows[] = {
            {State::Q0, Symbol::Zero, Symbol::Zero, State::Q1, Move::Left},
            {State::Q0, Symbol::One, Symbol::One, State::Q1, Move::Left},
            {State::Q0, Symbol::Theta, Symbol::Blank, State::Idle, Move::Stay},
            {State::Q1, Symbol::Zero, Symbol::Blank, State::Idle, Move::Stay},
            {State::Q1, Symbol::One, Symbol::Blank, State::Idle, Move::Stay},
            {State::Q1, Symbol::Theta, Symbol::One, State::Q2, Move::Left},
            {State::Q2, Symbol::Zero, Symbol::Blank, State::Idle, Move::Stay},
            {State::Q2, Symbol::One, Symbol::Blank, State::Idle, Move::Stay},
            {State::Q2, Symbol::Theta, Symbol::Blank, State::Idle, Move::Stay},
    };

    EXPECT_EQ(table.entries().size(), 9u);
    for (const auto& row : rows) {
        const auto transition = table.get(row.state, row.symbol);
        ASSERT_TRUE(transition.has_value()) << toString(row.state) << " " << toString(row.symbol);
        EXPECT_EQ(transition->writeSymbol, row.write);
        EXPECT_EQ(transition->nextState, row.next);
        EXPECT_EQ(transition->move, row.move);
    }
}

TEST(TransitionTableTest, IdleHasNoTransitions) {
    const TransitionTable& table = TransitionTable::standard();
    for (Symbol symbol : {Symbol::Zero, Symbol::One, Symbol::Theta, Symbol::Blank}) {
        EXPECT_FALSE(table.get(State::Idle, symbol).has_value());
        EXPECT_FALSE(table.has(State::Idle, symbol));
    }
}

TEST(TransitionTableTest, AcceptingStates) {
    const TransitionTable& table = TransitionTable::standard();
    EXPECT_EQ(table.startState, State::Q0);
    EXPECT_TRUE(table.isAccepting(State::Q2));
    EXPECT_FALSE(table.isAccepting(State::Q0));
    EXPECT_FALSE(table.isAccepting(State::Q1));
    EXPECT_FALSE(table.isAccepting(State::Idle));
}

TEST(TransitionTableTest, FirstSeenOrder) {
    const TransitionTable& table = TransitionTable::standard();
    const std::vector<State> states{State::Q0, State::Q1, State::Q2};
    const std::vector<Symbol> alphabet{Symbol::Zero, Symbol::One, Symbol::Theta};
    EXPECT_EQ(table.states(), states);
    EXPECT_EQ(table.alphabet(), alphabet);
}

TEST(TransitionTableTest, RejectsDuplicateKey) {
    TransitionTable table;
    EXPECT_TRUE(table.add(State::Q0, Symbol::Zero, {Symbol::One, State::Q1, Move::Right}));
    EXPECT_FALSE(table.add(State::Q0, Symbol::Zero, {Symbol::Zero, State::Q2, Move::Left}));
    EXPECT_EQ(table.entries().size(), 1u);
    EXPECT_EQ(table.get(State::Q0, Symbol::Zero)->nextState, State::Q1);
}

TEST(TransitionTableTest, TransitionAsString) {
    EXPECT_EQ(toString(Transition{Symbol::Zero, State::Q1, Move::Left}), "0, q1, L");
    EXPECT_EQ(toString(Transition{Symbol::Blank, State::Idle, Move::Stay}), "-, -, -");
    EXPECT_EQ(toString(Transition{Symbol::One, State::Q2, Move::Right}), "1, q2, R");
}

TEST(TransitionTableTest, StandardTableValidates) {
    std::vector<Diagnostic> diags;
    EXPECT_TRUE(TransitionTable::standard().validate(diags));
    EXPECT_TRUE(diags.empty());
}

TEST(TransitionTableTest, ValidateReportsBrokenTables) {
    TransitionTable table;
    table.startState = State::Q0;
    table.acceptingStates = {State::Q2};
    ASSERT_TRUE(table.add(State::Q1, Symbol::Zero, {Symbol::Zero, State::Q1, Move::Left}));
    ASSERT_TRUE(table.add(State::Idle, Symbol::One, {Symbol::One, State::Q1, Move::Left}));

    std::vector<Diagnostic> diags;
    EXPECT_FALSE(table.validate(diags));
    ASSERT_EQ(diags.size(), 3u);
    EXPECT_EQ(diags[0].level, DiagnosticLevel::Error);
    EXPECT_EQ(diags[1].level, DiagnosticLevel::Error);
    EXPECT_EQ(diags[2].level, DiagnosticLevel::Warning);
}

}  // namespace
