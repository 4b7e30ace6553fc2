#ifndef RLISP_LEXER_H_
#define RLISP_LEXER_H_

#include "base.h"
#include "glog/logging.h"
#include <stdarg.h>

namespace rlisp {

class TextInputStream;
class TokenObject;

class Lexer {
public:
    struct Scope {
        Scope *top = nullptr;
        TextInputStream *input_stream = nullptr;
        bool ownership = false;
        int ahead = 0;
        int line = 0;
        int column = 0;
        int position = 0;
    };

    Lexer(TextInputStream *input_stream, bool ownership);
    Lexer() = default;
    ~Lexer();

    TextInputStream *input_stream() const {
        return DCHECK_NOTNULL(current_)->input_stream;
    }

    Scope *current() { return DCHECK_NOTNULL(current_); }

    bool has_scope() const { return current_ != nullptr; }

    void PushScope(TextInputStream *input_stream, bool ownership);
    void PopScope();

    /**
     * Returns false at end of the current scope. A lexical failure is
     * returned as a `TOKEN_ERROR' token with `error_code()' set.
     */
    bool Next(TokenObject *token);

    int Peek() const { return DCHECK_NOTNULL(current_)->ahead; }

    int Move();

    static bool IsTermination(int ch);
    static inline bool IsNotTermination(int ch) { return !IsTermination(ch); }

private:
    bool SingleCharToken(int token_code, TokenObject *token);
    void BeginToken(TokenObject *token);
    void EndToken(TokenObject *token);

    void SkipLineComment();
    bool SkipBlockComment(TokenObject *token);

    bool ParseStringLiteral(TokenObject *token);
    bool ParseFormatString(TokenObject *token);
    bool ParseEscapedChar(std::string *buf);
    bool ParseAtom(TokenObject *token);

    __attribute__ (( __format__ (__printf__, 3, 4)))
    static bool ThrowError(TokenObject *token, int code, const char *fmt, ...);

    static bool VThrowError(TokenObject *token, int code, const char *fmt,
                            va_list ap);

    Scope *current_ = nullptr;

    DISALLOW_IMPLICIT_CONSTRUCTORS(Lexer);
};

} // namespace rlisp

#endif // RLISP_LEXER_H_
