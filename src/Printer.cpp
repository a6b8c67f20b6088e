#include "Printer.h"

#include <algorithm>
#include <ostream>

namespace {

constexpr char kBorderKnot = '+';
constexpr char kBorderHorizontal = '-';
constexpr char kBorderVertical = '|';

std::string horizontalBorder(std::size_t columns, std::size_t width) {
    std::string border(1, kBorderKnot);
    for (std::size_t c = 0; c < columns; c++) {
        border.append(width, kBorderHorizontal);
        border.push_back(kBorderKnot);
    }
    return border;
}

// Выравнивание вправо по ширине в кодовых точках
std::string padCell(const std::string& text, std::size_t width) {
    const std::size_t len = displayWidth(text);
    std::string cell = len < width ? std::string(width - len, ' ') : std::string();
    cell += text;
    cell.push_back(kBorderVertical);
    return cell;
}

} // namespace

std::size_t displayWidth(std::string_view text) {
    // Байты продолжения UTF-8 (10xxxxxx) не считаются
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

Grid tableGrid(const TransitionTable& table) {
    const auto alphabet = table.alphabet();
    const auto states = table.states();

    Grid grid;
    std::vector<std::string> header{"δ"};
    for (Symbol symbol : alphabet) {
        header.push_back(toString(symbol));
    }
    grid.push_back(header);

    for (State state : states) {
        std::vector<std::string> row{toString(state)};
        for (Symbol symbol : alphabet) {
            const auto transition = table.get(state, symbol);
            row.push_back(transition ? toString(*transition) : std::string("-"));
        }
        grid.push_back(row);
    }
    return grid;
}

void printGrid(std::ostream& out, const Grid& grid) {
    if (grid.empty()) {
        return;
    }

    std::size_t columns = 0;
    std::size_t width = 0;
    for (const auto& row : grid) {
        columns = std::max(columns, row.size());
        for (const auto& cell : row) {
            width = std::max(width, displayWidth(cell));
        }
    }

    const std::string border = horizontalBorder(columns, width);
    out << border << '\n';
    for (const auto& row : grid) {
        std::string line(1, kBorderVertical);
        for (const auto& cell : row) {
            line += padCell(cell, width);
        }
        out << line << '\n' << border << '\n';
    }
}

void printTable(std::ostream& out, const TransitionTable& table) {
    out << "Transition table:" << '\n';
    printGrid(out, tableGrid(table));
}

void printState(std::ostream& out, State state, bool accepting, bool onClose) {
    const char* statusLabel = onClose ? "Final" : "Current";
    const char* resultLabel = (onClose && accepting) ? "(accepting)" : "";
    out << statusLabel << " TM state: " << toString(state) << ' ' << resultLabel << '\n';
}

void printReading(std::ostream& out, Symbol symbol) {
    out << "Reading symbol: " << toString(symbol) << '\n';
}

void printWritten(std::ostream& out, Symbol symbol) {
    out << "Value written on tape: " << toString(symbol) << '\n';
}

void printMove(std::ostream& out, Move move) {
    out << "Head direction of movement: " << toString(move) << '\n';
}

void printStatePath(std::ostream& out, const std::vector<State>& states) {
    out << "State change path: ";
    for (std::size_t i = 0; i < states.size(); i++) {
        if (i > 0) {
            out << "→";
        }
        out << toString(states[i]);
    }
    out << '\n';
}

void printFinalValue(std::ostream& out, const std::string& value) {
    out << "Final value: " << value << '\n';
}
