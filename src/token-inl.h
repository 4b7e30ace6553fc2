#ifndef RLISP_TOKEN_INL_H_
#define RLISP_TOKEN_INL_H_

#if defined(__cplusplus)
namespace rlisp {
#endif

// All tokens
#define DEFINE_TOKENS(M) \
    M(ERROR, "") \
    M(EOF, "") \
    M(LPAREN, "(") \
    M(RPAREN, ")") \
    M(LBRACK, "[") \
    M(RBRACK, "]") \
    M(LBRACE, "{") \
    M(RBRACE, "}") \
    M(QUOTE, "'") \
    M(QUASIQUOTE, "`") \
    M(UNQUOTE, ",") \
    M(TRUE, "true") \
    M(FALSE, "false") \
    M(NIL, "nil") \
    M(SYMBOL, "") \
    M(INT_LITERAL, "") \
    M(FLOAT_LITERAL, "") \
    M(STRING_LITERAL, "\"...\"") \
    M(FORMAT_STRING, "#\"...\"")

#define Token_CODE_ENUM(name, text) TOKEN_##name,

#if defined(__cplusplus)
enum Token: int {
    DEFINE_TOKENS(Token_CODE_ENUM)
};
#else
enum Token {
    DEFINE_TOKENS(Token_CODE_ENUM)
};
#endif

#undef Token_CODE_ENUM

#if defined(__cplusplus)
}
#endif

#endif // RLISP_TOKEN_INL_H_
