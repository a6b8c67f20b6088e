#include "Lexer.h"

#include "Alphabet.h"

bool isWhitespace(char32_t cp) {
    // Управляющие пробельные символы ASCII
    if ((cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20)) {
        return true;
    }
    // Разделители Unicode (Zs, Zl, Zp)
    switch (cp) {
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

Lexer::Lexer(std::string_view source)
    : source_(source) {}

Token Lexer::next() {
    skipWhitespace();

    if (pos_ >= source_.size()) {
        return {TokenType::Eof, "", Symbol::Blank};
    }

    const std::size_t len = sequenceLength();
    std::string text(source_.substr(pos_, len));
    pos_ += len;

    if (len > 1) {
        return {TokenType::Unknown, text, Symbol::Blank};
    }

    const SymbolParseResult parsed = parseSymbol(text[0]);
    if (!parsed.ok()) {
        return {TokenType::Unknown, text, Symbol::Blank};
    }
    return {TokenType::Symbol, text, *parsed.symbol};
}

namespace {

// Длина последовательности UTF-8 по ведущему байту
std::size_t leadLength(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

} // namespace

std::size_t Lexer::sequenceLength() const {
    const std::size_t len = leadLength(static_cast<unsigned char>(source_[pos_]));

    // Байты продолжения (10xxxxxx) входят в последовательность; обрыв строки укорачивает её
    std::size_t n = 1;
    while (n < len && pos_ + n < source_.size() &&
           (static_cast<unsigned char>(source_[pos_ + n]) & 0xC0) == 0x80) {
        n++;
    }
    return n;
}

char32_t Lexer::codePoint() const {
    const auto lead = static_cast<unsigned char>(source_[pos_]);
    const std::size_t len = leadLength(lead);
    if (len == 1) {
        return lead;
    }
    if (sequenceLength() != len) {
        return 0xFFFD;  // Оборванная последовательность
    }

    char32_t cp = lead & (0x7F >> len);
    for (std::size_t i = 1; i < len; i++) {
        cp = (cp << 6) | (static_cast<unsigned char>(source_[pos_ + i]) & 0x3F);
    }
    return cp;
}

void Lexer::skipWhitespace() {
    while (pos_ < source_.size() && isWhitespace(codePoint())) {
        pos_ += sequenceLength();
    }
}
