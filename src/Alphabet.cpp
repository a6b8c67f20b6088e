#include "Alphabet.h"

#include "Lexer.h"

SymbolParseResult parseSymbol(char value) {
    SymbolParseResult result;
    switch (value) {
    case '0':
        result.symbol = Symbol::Zero;
        break;
    case '1':
        result.symbol = Symbol::One;
        break;
    case '#':
        result.symbol = Symbol::Theta;
        break;
    default:
        result.error = {std::string(1, value)};
        break;
    }
    return result;
}

LineParseResult parseLine(std::string_view line) {
    LineParseResult result;
    result.ok = true;

    Lexer lexer(line);
    Token token = lexer.next();

    while (token.type != TokenType::Eof) {
        if (token.type == TokenType::Unknown) {
            // Строка отбрасывается целиком, уже разобранные символы не возвращаются
            result.ok = false;
            result.symbols.clear();
            result.error = {token.value};
            return result;
        }
        result.symbols.push_back(token.symbol);
        token = lexer.next();
    }

    result.empty = result.symbols.empty();
    return result;
}
