#ifndef RLISP_PARSER_H_
#define RLISP_PARSER_H_

#include "values.h"
#include "token.h"
#include <stdarg.h>
#include <string>

namespace rlisp {

class Lexer;
class TextInputStream;
class TextStreamFactory;
class ValueFactory;

struct ParsingError {
    int code;
    int column;
    int line;
    int position;
    std::string file_name;
    std::string message;

    ParsingError();

    static ParsingError NoError();

    std::string ToString() const;
}; // struct ParsingError

/**
 * Reads terms, one top-level form at a time.
 *
 * Infix groups `{a op b op c}' are rewritten to `(op a b c)', quote marks
 * to `(quote x)' `(quasiquote x)' `(unquote x)', and format strings to
 * `(format ...)'.
 */
class Parser {
public:
    Parser(ValueFactory *values, TextStreamFactory *text_streams);
    ~Parser();

    DEF_GETTER(bool, has_error)

    ParsingError last_error() const;

    void ClearError();

    /**
     * The returned stream is owned by parser, check its `error()' for
     * failures of opening.
     */
    TextInputStream *SwitchInputStream(const std::string &key);
    void SwitchInputStream(TextInputStream *input, bool ownership);

    bool AtEnd() const { return Peek() == TOKEN_EOF; }

    /**
     * One top-level form.
     */
    Handle<Value> ParseForm(bool *ok) { return ParseExpression(ok); }

    Handle<Value> ParseExpression(bool *ok);
    Handle<Value> ParseList(Token closer, bool *ok);
    Handle<Value> ParseInfix(bool *ok);
    Handle<Value> ParseQuoted(const char *name, bool *ok);
    Handle<Value> ParseFormatString(bool *ok);
    Handle<Value> ParseAtom(bool *ok);

    DISALLOW_IMPLICIT_CONSTRUCTORS(Parser)
private:
    Token Peek() const { return ahead_.token_code(); }

    void Match(Token code, bool *ok);

    void Advance();

    __attribute__ (( __format__ (__printf__, 3, 4)))
    void ThrowError(int code, const char *fmt, ...);
    void VThrowError(int code, const char *fmt, va_list ap);

    Lexer *lexer_;
    TokenObject ahead_;
    ParsingError last_error_;
    bool has_error_ = false;
    ValueFactory *values_;
    TextStreamFactory *text_streams_;
}; // class Parser

} // namespace rlisp

#endif // RLISP_PARSER_H_
