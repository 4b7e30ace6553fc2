#include "lexer.h"
#include "token.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "gtest/gtest.h"

namespace rlisp {

TEST(LexerTest, TestingStream) {
    FixedMemoryInputStream s("abc");

    ASSERT_FALSE(s.eof());
    ASSERT_EQ('a', s.ReadOne());

    ASSERT_FALSE(s.eof());
    ASSERT_EQ('b', s.ReadOne());

    ASSERT_FALSE(s.eof());
    ASSERT_EQ('c', s.ReadOne());

    ASSERT_TRUE(s.eof());
    ASSERT_EQ(-1, s.ReadOne());
}

TEST(LexerTest, Brackets) {
    Lexer lex(new FixedMemoryInputStream("( ] {}["), true);
    TokenObject token;

    Token expected[] = {
        TOKEN_LPAREN, TOKEN_RBRACK, TOKEN_LBRACE, TOKEN_RBRACE, TOKEN_LBRACK,
    };
    int pos[] = {0, 2, 4, 5, 6};
    for (size_t i = 0; i < arraysize(expected); ++i) {
        ASSERT_TRUE(lex.Next(&token));
        ASSERT_EQ(expected[i], token.token_code()) << i;
        ASSERT_EQ(pos[i], token.position());
        ASSERT_EQ(1, token.len());
    }
    ASSERT_FALSE(lex.Next(&token));
    ASSERT_EQ(TOKEN_EOF, token.token_code());
}

TEST(LexerTest, QuoteMarks) {
    Lexer lex(new FixedMemoryInputStream("'a `(b ,c)"), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_QUOTE, token.token_code());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_SYMBOL, token.token_code());
    ASSERT_EQ("a", token.text());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_QUASIQUOTE, token.token_code());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_LPAREN, token.token_code());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ("b", token.text());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_UNQUOTE, token.token_code());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ("c", token.text());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_RPAREN, token.token_code());
}

TEST(LexerTest, IntLiteral) {
    Lexer lex(new FixedMemoryInputStream(" 123 -7 +4"), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_INT_LITERAL, token.token_code());
    ASSERT_EQ(123, token.int_data());
    ASSERT_EQ(1, token.position());
    ASSERT_EQ(3, token.len());

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_INT_LITERAL, token.token_code());
    ASSERT_EQ(-7, token.int_data());

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_INT_LITERAL, token.token_code());
    ASSERT_EQ(4, token.int_data());
}

TEST(LexerTest, FloatLiteral) {
    Lexer lex(new FixedMemoryInputStream("1.5 -0.25 1e3 99999999999999999999"),
              true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_FLOAT_LITERAL, token.token_code());
    ASSERT_DOUBLE_EQ(1.5, token.float_data());

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_FLOAT_LITERAL, token.token_code());
    ASSERT_DOUBLE_EQ(-0.25, token.float_data());

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_FLOAT_LITERAL, token.token_code());
    ASSERT_DOUBLE_EQ(1000, token.float_data());

    // Too large for an integer.
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_FLOAT_LITERAL, token.token_code());
    ASSERT_DOUBLE_EQ(1e20, token.float_data());
}

TEST(LexerTest, Symbols) {
    Lexer lex(new FixedMemoryInputStream("+ - set! make-point <= λ ->x"), true);
    TokenObject token;

    const char *expected[] = {"+", "-", "set!", "make-point", "<=", "λ", "->x"};
    for (auto name : expected) {
        ASSERT_TRUE(lex.Next(&token));
        ASSERT_EQ(TOKEN_SYMBOL, token.token_code()) << name;
        ASSERT_EQ(name, token.text());
    }
    ASSERT_FALSE(lex.Next(&token));
}

TEST(LexerTest, Keywords) {
    Lexer lex(new FixedMemoryInputStream("true #t false #f nil empty"), true);
    TokenObject token;

    Token expected[] = {
        TOKEN_TRUE, TOKEN_TRUE, TOKEN_FALSE, TOKEN_FALSE, TOKEN_NIL, TOKEN_NIL,
    };
    for (auto code : expected) {
        ASSERT_TRUE(lex.Next(&token));
        ASSERT_EQ(code, token.token_code()) << token.text();
    }
}

TEST(LexerTest, Comments) {
    Lexer lex(new FixedMemoryInputStream("; line\n a #| block\n |# b ;"), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ("a", token.text());
    ASSERT_EQ(2, token.line());
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ("b", token.text());
    ASSERT_EQ(3, token.line());
    ASSERT_FALSE(lex.Next(&token));
}

TEST(LexerTest, UnclosedBlockComment) {
    Lexer lex(new FixedMemoryInputStream("#| never"), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_ERROR, token.token_code());
    ASSERT_EQ(ERR_PARSE_EXPRESSION, token.error_code());
}

TEST(LexerTest, StringLiteral) {
    Lexer lex(new FixedMemoryInputStream("\"a\\n\\\"b\\\"\" \"\""), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_STRING_LITERAL, token.token_code());
    ASSERT_EQ("a\n\"b\"", token.text());

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_STRING_LITERAL, token.token_code());
    ASSERT_EQ("", token.text());
}

TEST(LexerTest, UnclosedStringLiteral) {
    Lexer lex(new FixedMemoryInputStream("\"abc"), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_ERROR, token.token_code());
    ASSERT_EQ(ERR_UNCLOSED_STRING, token.error_code());
}

TEST(LexerTest, FormatString) {
    Lexer lex(new FixedMemoryInputStream("#\"x = #{x}, #{(f {1 + 2})}!\""),
              true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_FORMAT_STRING, token.token_code());

    const auto &spans = token.spans();
    ASSERT_EQ(5u, spans.size());
    EXPECT_FALSE(spans[0].is_expression);
    EXPECT_EQ("x = ", spans[0].text);
    EXPECT_TRUE(spans[1].is_expression);
    EXPECT_EQ("x", spans[1].text);
    EXPECT_EQ(", ", spans[2].text);
    EXPECT_TRUE(spans[3].is_expression);
    EXPECT_EQ("(f {1 + 2})", spans[3].text);
    EXPECT_EQ("!", spans[4].text);

    ASSERT_FALSE(lex.Next(&token));
}

TEST(LexerTest, FormatStringKeepsBareBrace) {
    Lexer lex(new FixedMemoryInputStream("#\"{a} # #{b}\""), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_FORMAT_STRING, token.token_code());
    ASSERT_EQ(2u, token.spans().size());
    EXPECT_EQ("{a} # ", token.spans()[0].text);
    EXPECT_EQ("b", token.spans()[1].text);
}

TEST(LexerTest, FormatStringEscapedQuoteInExpression) {
    Lexer lex(new FixedMemoryInputStream(
            "#\"v #{(format \\\"a\\\" x)} end\""), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ(TOKEN_FORMAT_STRING, token.token_code());
    ASSERT_EQ(3u, token.spans().size());
    EXPECT_EQ("v ", token.spans()[0].text);
    EXPECT_TRUE(token.spans()[1].is_expression);
    EXPECT_EQ("(format \"a\" x)", token.spans()[1].text);
    EXPECT_EQ(" end", token.spans()[2].text);

    ASSERT_FALSE(lex.Next(&token));
}

TEST(LexerTest, FormatStringFailures) {
    TokenObject token;
    {
        Lexer lex(new FixedMemoryInputStream("#\"no expression\""), true);
        ASSERT_TRUE(lex.Next(&token));
        ASSERT_EQ(TOKEN_ERROR, token.token_code());
        ASSERT_EQ(ERR_FORMAT_WITHOUT_EXPR, token.error_code());
    }
    {
        Lexer lex(new FixedMemoryInputStream("#\"a #{(f {x}\""), true);
        ASSERT_TRUE(lex.Next(&token));
        ASSERT_EQ(TOKEN_ERROR, token.token_code());
        ASSERT_EQ(ERR_UNCLOSED_INTERPOLATION, token.error_code());
    }
    {
        Lexer lex(new FixedMemoryInputStream("#\"a #{x} b"), true);
        ASSERT_TRUE(lex.Next(&token));
        ASSERT_EQ(TOKEN_ERROR, token.token_code());
        ASSERT_EQ(ERR_UNCLOSED_STRING, token.error_code());
    }
}

TEST(LexerTest, NestedScope) {
    Lexer lex(new FixedMemoryInputStream("a b"), true);
    TokenObject token;

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ("a", token.text());

    lex.PushScope(new FixedMemoryInputStream("inner"), true);
    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ("inner", token.text());
    ASSERT_FALSE(lex.Next(&token));
    lex.PopScope();

    ASSERT_TRUE(lex.Next(&token));
    ASSERT_EQ("b", token.text());
}

} // namespace rlisp
