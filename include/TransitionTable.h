#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Diagnostics.h"
#include "Types.h"

/** @brief Одно правило перехода машины Тьюринга */
struct Transition {
    Symbol writeSymbol{Symbol::Blank};
    State nextState{State::Idle};
    Move move{Move::Stay};
};

/** @brief "w, n, m": записываемый символ, следующее состояние, направление */
std::string toString(const Transition& transition);

/** @brief Строка таблицы: ключ (состояние, символ) и правило */
struct TransitionEntry {
    State state{State::Q0};
    Symbol symbol{Symbol::Zero};
    Transition transition;
};

/** @brief Таблица переходов (программа) машины Тьюринга */
class TransitionTable {
public:
    State startState{State::Q0};
    std::vector<State> acceptingStates;

    /** @brief Добавить правило перехода (false, если пара уже занята) */
    bool add(State state, Symbol symbol, const Transition& transition);

    /** @brief Проверить наличие перехода */
    bool has(State state, Symbol symbol) const;

    /**
     * @brief Получить переход
     * @return std::nullopt, если для пары нет правила; это штатный останов
     */
    std::optional<Transition> get(State state, Symbol symbol) const;

    /** @brief Проверить, является ли состояние допускающим */
    bool isAccepting(State state) const;

    /** @brief Все правила в порядке добавления */
    const std::vector<TransitionEntry>& entries() const { return entries_; }

    /** @brief Состояния, из которых есть переходы, в порядке появления */
    std::vector<State> states() const;

    /** @brief Входные символы таблицы в порядке появления */
    std::vector<Symbol> alphabet() const;

    /** @brief Проверить корректность таблицы */
    bool validate(std::vector<Diagnostic>& out) const;

    /** @brief Фиксированная таблица машины (строится один раз) */
    static const TransitionTable& standard();

private:
    struct Key {
        State state;
        Symbol symbol;
        bool operator==(const Key& other) const {
            return state == other.state && symbol == other.symbol;
        }
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            const std::size_t hs = std::hash<int>{}(static_cast<int>(key.state));
            const std::size_t hsym = std::hash<int>{}(static_cast<int>(key.symbol));
            return hs ^ (hsym << 1);
        }
    };

    std::unordered_map<Key, Transition, KeyHash> transitions_;
    std::vector<TransitionEntry> entries_;
};
