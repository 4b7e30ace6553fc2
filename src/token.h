#ifndef RLISP_TOKEN_H_
#define RLISP_TOKEN_H_

#include "token-inl.h"
#include "base.h"
#include <string>
#include <vector>

namespace rlisp {

struct TokenMetadata {
    Token       code;
    const char *name;
    const char *text;
};

std::string TokenNameWithText(Token token);

/**
 * One piece of a format string: `#"a #{e} b"' has three spans.
 */
struct FormatSpan {
    bool        is_expression;
    int         position;
    std::string text;
};

class TokenObject {
public:
    TokenObject();
    ~TokenObject();

    DEF_PROP_RW(Token, token_code)
    DEF_PROP_RW(int, position)
    DEF_PROP_RW(int, len)
    DEF_PROP_RW(int, line)
    DEF_PROP_RW(int, column)
    DEF_PROP_RMW(std::string, text)
    DEF_PROP_RW(rlisp_int_t, int_data)
    DEF_PROP_RW(rlisp_float_t, float_data)
    DEF_PROP_RW(int, error_code)
    DEF_PROP_RMW(std::vector<FormatSpan>, spans)

    bool is_error() const { return token_code_ == TOKEN_ERROR; }
    bool is_eof() const { return token_code_ == TOKEN_EOF; }

    /**
     * `(', `[' or `{'
     */
    bool IsOpener() const {
        return token_code_ == TOKEN_LPAREN || token_code_ == TOKEN_LBRACK ||
               token_code_ == TOKEN_LBRACE;
    }

    bool IsCloser() const {
        return token_code_ == TOKEN_RPAREN || token_code_ == TOKEN_RBRACK ||
               token_code_ == TOKEN_RBRACE;
    }

    std::string ToNameWithText() const;

    void Reset();

private:
    Token         token_code_;
    int           position_;
    int           len_;
    int           line_;
    int           column_;
    std::string   text_;
    rlisp_int_t   int_data_;
    rlisp_float_t float_data_;
    int           error_code_;
    std::vector<FormatSpan> spans_;

    DISALLOW_IMPLICIT_CONSTRUCTORS(TokenObject);
};

} // namespace rlisp

#endif // RLISP_TOKEN_H_
