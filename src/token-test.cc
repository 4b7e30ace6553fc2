#include "token.h"
#include "gtest/gtest.h"

namespace rlisp {

TEST(TokenTest, Sanity) {
    TokenObject token;

    token.set_int_data(100L);
    ASSERT_EQ(100L, token.int_data());

    token.set_text("TEXT");
    ASSERT_EQ("TEXT", token.text());

    token.Reset();
    ASSERT_TRUE(token.is_error());
    ASSERT_TRUE(token.text().empty());
}

TEST(TokenTest, NameWithText) {
    ASSERT_EQ("LPAREN `('", TokenNameWithText(TOKEN_LPAREN));
    ASSERT_EQ("EOF", TokenNameWithText(TOKEN_EOF));

    TokenObject token;
    token.set_token_code(TOKEN_SYMBOL);
    token.set_text("foo");
    ASSERT_EQ("SYMBOL `foo'", token.ToNameWithText());
}

} // namespace rlisp
