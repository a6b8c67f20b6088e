#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Alphabet.h"
#include "Lexer.h"

namespace {

TEST(AlphabetTest, ParsesAcceptedCharacters) {
    EXPECT_EQ(parseSymbol('0').symbol, Symbol::Zero);
    EXPECT_EQ(parseSymbol('1').symbol, Symbol::One);
    EXPECT_EQ(parseSymbol('#').symbol, Symbol::Theta);
}

TEST(AlphabetTest, RejectsEverythingElse) {
    for (int c = 0; c < 256; ++c) {
        const char ch = static_cast<char>(c);
        if (ch == '0' || ch == '1' || ch == '#') {
            continue;
        }
        const SymbolParseResult result = parseSymbol(ch);
        EXPECT_FALSE(result.ok()) << "character code " << c;
        EXPECT_EQ(result.error.value, std::string(1, ch));
    }
}

TEST(AlphabetTest, BlankIsNeverParsed) {
    EXPECT_FALSE(parseSymbol('-').ok());
    EXPECT_FALSE(parseSymbol(' ').ok());
}

TEST(AlphabetTest, ParseIsDeterministic) {
    for (char ch : {'0', '1', '#', 'x'}) {
        const SymbolParseResult first = parseSymbol(ch);
        const SymbolParseResult second = parseSymbol(ch);
        EXPECT_EQ(first.ok(), second.ok());
        EXPECT_EQ(first.symbol, second.symbol);
    }
}

TEST(AlphabetTest, DescribesRejectedSymbol) {
    EXPECT_EQ(describe(parseSymbol('x').error), "TM doesn't accept symbol: x");
}

TEST(LineParseTest, DropsWhitespace) {
    const LineParseResult result = parseLine(" 0 1\t# ");
    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.empty);
    const std::vector<Symbol> expected{Symbol::Zero, Symbol::One, Symbol::Theta};
    EXPECT_EQ(result.symbols, expected);
}

TEST(LineParseTest, WhitespaceOnlyLineIsEmpty) {
    const LineParseResult result = parseLine("  \t \r");
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.empty);
    EXPECT_TRUE(result.symbols.empty());

    EXPECT_TRUE(parseLine("").empty);
}

TEST(LineParseTest, FirstInvalidCharacterDiscardsLine) {
    const LineParseResult result = parseLine("0x#y");
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.symbols.empty());
    EXPECT_EQ(result.error.value, "x");
}

TEST(LineParseTest, MultibyteCharacterIsRejectedWhole) {
    const LineParseResult result = parseLine("0Θ#");
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.symbols.empty());
    EXPECT_EQ(result.error.value, "Θ");
    EXPECT_EQ(describe(result.error), "TM doesn't accept symbol: Θ");
}

TEST(LineParseTest, UnicodeSpacesAreDropped) {
    // U+00A0, U+2003, U+3000
    const LineParseResult result = parseLine("0\xC2\xA0\xE2\x80\x83#\xE3\x80\x80");
    ASSERT_TRUE(result.ok);
    const std::vector<Symbol> expected{Symbol::Zero, Symbol::Theta};
    EXPECT_EQ(result.symbols, expected);
}

TEST(LineParseTest, TruncatedSequenceIsRejected) {
    const LineParseResult result = parseLine("0\xE2\x80");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.value, "\xE2\x80");
}

TEST(LexerTest, TokenizesByCodePoint) {
    Lexer lexer("  1 z\u00e9");
    Token token = lexer.next();
    EXPECT_EQ(token.type, TokenType::Symbol);
    EXPECT_EQ(token.symbol, Symbol::One);
    EXPECT_EQ(token.value, "1");

    token = lexer.next();
    EXPECT_EQ(token.type, TokenType::Unknown);
    EXPECT_EQ(token.value, "z");

    token = lexer.next();
    EXPECT_EQ(token.type, TokenType::Unknown);
    EXPECT_EQ(token.value, "\xC3\xA9");

    EXPECT_EQ(lexer.next().type, TokenType::Eof);
}

TEST(LexerTest, WhitespaceCodePoints) {
    EXPECT_TRUE(isWhitespace(U' '));
    EXPECT_TRUE(isWhitespace(U'\t'));
    EXPECT_TRUE(isWhitespace(U'\r'));
    EXPECT_TRUE(isWhitespace(0x00A0));
    EXPECT_TRUE(isWhitespace(0x2028));
    EXPECT_FALSE(isWhitespace(U'0'));
    EXPECT_FALSE(isWhitespace(0x0398));
    EXPECT_FALSE(isWhitespace(0x200B));
}

}  // namespace
