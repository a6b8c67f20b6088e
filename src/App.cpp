#include "App.h"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

#include "Alphabet.h"
#include "Session.h"

namespace {

constexpr const char* kPrompt = "Type value terminated by # character (theta equivalent): ";

} // namespace

App::App(std::istream& in, std::ostream& out, const TransitionTable& table)
    : in_(in), out_(out), table_(table) {}

int App::run() {
    // Итоговый отчёт выводит деструктор сессии, если readSymbols() бросит исключение
    Session session(table_, out_);

    const std::vector<Symbol> symbols = readSymbols();
    for (Symbol symbol : symbols) {
        session.consume(symbol);
    }

    session.finalize();
    return 0;
}

std::vector<Symbol> App::readSymbols() {
    std::string line;
    while (true) {
        out_ << kPrompt << std::flush;
        if (!std::getline(in_, line)) {
            throw std::runtime_error("input closed before a value was entered");
        }

        const LineParseResult parsed = parseLine(line);
        if (!parsed.ok) {
            // Строка отбрасывается целиком, машина не меняется
            out_ << describe(parsed.error) << '\n';
            continue;
        }
        if (parsed.empty) {
            continue;
        }
        return parsed.symbols;
    }
}
