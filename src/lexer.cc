#include "lexer.h"
#include "token.h"
#include "error-codes.h"
#include "number-parser.h"
#include "text-input-stream.h"
#include "text-output-stream.h"
#include <ctype.h>
#include <string.h>

namespace rlisp {

namespace {

struct Keyword {
    const char *z;
    Token id;
};

const Keyword kKeywords[] = {
    {"true",  TOKEN_TRUE},
    {"#t",    TOKEN_TRUE},
    {"false", TOKEN_FALSE},
    {"#f",    TOKEN_FALSE},
    {"nil",   TOKEN_NIL},
    {"empty", TOKEN_NIL},
};

const Keyword *ParseKeyword(const std::string &text) {
    for (size_t i = 0; i < arraysize(kKeywords); ++i) {
        if (text == kKeywords[i].z) {
            return &kKeywords[i];
        }
    }
    return nullptr;
}

} // namespace

Lexer::Lexer(TextInputStream *input_stream, bool ownership) {
    PushScope(input_stream, ownership);
}

Lexer::~Lexer() {
    while (current_) {
        PopScope();
    }
}

void Lexer::PushScope(TextInputStream *input_stream, bool ownership) {
    auto scope = new Scope;
    scope->input_stream = DCHECK_NOTNULL(input_stream);
    scope->ownership    = ownership;

    scope->ahead = scope->input_stream->ReadOne();
    if (scope->ahead != -1) {
        scope->column = 1;
        scope->line   = 1;
    }

    scope->top = current_;
    current_ = scope;
}

void Lexer::PopScope() {
    if (!current_) {
        return;
    }

    auto top = current_->top;
    if (current_->ownership) {
        delete current_->input_stream;
    }
    delete current_;
    current_ = top;
}

bool Lexer::Next(TokenObject *token) {
    token->Reset();

    for (;;) {
        auto ahead = Peek();

        switch (ahead) {
            case -1: // EOF
                BeginToken(token);
                token->set_token_code(TOKEN_EOF);
                token->set_len(0);
                return false;
            case '(':
                return SingleCharToken(TOKEN_LPAREN, token);
            case ')':
                return SingleCharToken(TOKEN_RPAREN, token);
            case '[':
                return SingleCharToken(TOKEN_LBRACK, token);
            case ']':
                return SingleCharToken(TOKEN_RBRACK, token);
            case '{':
                return SingleCharToken(TOKEN_LBRACE, token);
            case '}':
                return SingleCharToken(TOKEN_RBRACE, token);
            case '\'':
                return SingleCharToken(TOKEN_QUOTE, token);
            case '`':
                return SingleCharToken(TOKEN_QUASIQUOTE, token);
            case ',':
                return SingleCharToken(TOKEN_UNQUOTE, token);

            case ';':
                SkipLineComment();
                break;

            case '"':
                BeginToken(token);
                return ParseStringLiteral(token);

            case '#':
                BeginToken(token);
                ahead = Move();
                if (ahead == '|') {
                    if (!SkipBlockComment(token)) {
                        return true; // error token
                    }
                    token->Reset();
                    break;
                }
                if (ahead == '"') {
                    return ParseFormatString(token);
                }
                token->mutable_text()->assign("#");
                return ParseAtom(token);

            default:
                if (isspace(ahead)) {
                    while (isspace(Move()))
                        ;
                } else {
                    BeginToken(token);
                    return ParseAtom(token);
                }
                break;
        }
    }
}

int Lexer::Move() {
    DCHECK_NE(current_, static_cast<Scope*>(nullptr)) << "forget push scope?";

    if (current_->ahead == '\n') {
        ++current_->line;
        current_->column = 0;
    }
    current_->ahead = current_->input_stream->ReadOne();
    ++current_->column;
    ++current_->position;
    return current_->ahead;
}

bool Lexer::SingleCharToken(int token_code, TokenObject *token) {
    BeginToken(token);
    token->set_token_code(static_cast<Token>(token_code));
    Move();
    EndToken(token);
    return true;
}

void Lexer::BeginToken(TokenObject *token) {
    token->set_position(current()->position);
    token->set_line(current()->line);
    token->set_column(current()->column);
}

void Lexer::EndToken(TokenObject *token) {
    token->set_len(current()->position - token->position());
}

void Lexer::SkipLineComment() {
    int ahead = Move();
    while (ahead != '\n' && ahead != -1) {
        ahead = Move();
    }
}

// #| ... |#
bool Lexer::SkipBlockComment(TokenObject *token) {
    int ahead = Move();
    for (;;) {
        if (ahead == -1) {
            return !ThrowError(token, ERR_PARSE_EXPRESSION,
                               "unclosed block comment");
        }
        if (ahead == '|') {
            ahead = Move();
            if (ahead == '#') {
                Move();
                return true;
            }
        } else {
            ahead = Move();
        }
    }
}

bool Lexer::ParseStringLiteral(TokenObject *token) {
    token->set_token_code(TOKEN_STRING_LITERAL);
    token->mutable_text()->clear();

    int ahead = Move();
    while (ahead != '"') {
        if (ahead == -1) {
            return ThrowError(token, ERR_UNCLOSED_STRING,
                              "string literal not terminated");
        }
        if (ahead == '\\') {
            if (!ParseEscapedChar(token->mutable_text())) {
                return ThrowError(token, ERR_UNCLOSED_STRING,
                                  "string literal not terminated");
            }
        } else {
            token->mutable_text()->append(1, static_cast<char>(ahead));
            Move();
        }
        ahead = Peek();
    }
    Move();

    EndToken(token);
    return true;
}

// #"literal #{expression} literal"
//
// Only `#{' opens an expression span, braces inside the span are balanced.
// A `"' always terminates the format string, a string literal inside the
// span is written with `\"'.
bool Lexer::ParseFormatString(TokenObject *token) {
    token->set_token_code(TOKEN_FORMAT_STRING);

    bool has_expression = false;
    FormatSpan literal{false, current()->position + 1, ""};

    int ahead = Move();
    while (ahead != '"') {
        if (ahead == -1) {
            return ThrowError(token, ERR_UNCLOSED_STRING,
                              "format string not terminated");
        }

        if (ahead == '\\') {
            if (!ParseEscapedChar(&literal.text)) {
                return ThrowError(token, ERR_UNCLOSED_STRING,
                                  "format string not terminated");
            }
            ahead = Peek();
            continue;
        }

        if (ahead != '#') {
            literal.text.append(1, static_cast<char>(ahead));
            ahead = Move();
            continue;
        }

        ahead = Move();
        if (ahead != '{') {
            literal.text.append(1, '#');
            continue;
        }

        if (!literal.text.empty()) {
            token->mutable_spans()->push_back(literal);
        }

        FormatSpan expression{true, current()->position + 1, ""};
        int layers = 0;
        ahead = Move();
        for (;;) {
            if (ahead == -1 || ahead == '"') {
                return ThrowError(token, ERR_UNCLOSED_INTERPOLATION,
                                  "`#{' at position %d not closed",
                                  expression.position - 2);
            }
            if (ahead == '\\') {
                if (!ParseEscapedChar(&expression.text)) {
                    return ThrowError(token, ERR_UNCLOSED_INTERPOLATION,
                                      "`#{' at position %d not closed",
                                      expression.position - 2);
                }
                ahead = Peek();
                continue;
            }
            if (ahead == '{') {
                ++layers;
            } else if (ahead == '}') {
                if (layers == 0) {
                    break;
                }
                --layers;
            }
            expression.text.append(1, static_cast<char>(ahead));
            ahead = Move();
        }
        token->mutable_spans()->push_back(expression);
        has_expression = true;

        literal.position = current()->position + 1;
        literal.text.clear();
        ahead = Move();
    }
    Move();

    if (!literal.text.empty()) {
        token->mutable_spans()->push_back(literal);
    }
    if (!has_expression) {
        return ThrowError(token, ERR_FORMAT_WITHOUT_EXPR,
                          "no `#{...}' in format string");
    }

    EndToken(token);
    return true;
}

bool Lexer::ParseEscapedChar(std::string *buf) {
    int ahead = Move();
    switch (ahead) {
        case -1:
            return false;
        case 'n':
            buf->append(1, '\n');
            break;
        case 'r':
            buf->append(1, '\r');
            break;
        case 't':
            buf->append(1, '\t');
            break;
        case '0':
            buf->append(1, '\0');
            break;
        default:
            buf->append(1, static_cast<char>(ahead));
            break;
    }
    Move();
    return true;
}

bool Lexer::ParseAtom(TokenObject *token) {
    int ahead = Peek();
    while (IsNotTermination(ahead)) {
        token->mutable_text()->append(1, static_cast<char>(ahead));
        ahead = Move();
    }
    EndToken(token);

    const auto &text = token->text();
    auto keyword = ParseKeyword(text);
    if (keyword) {
        token->set_token_code(keyword->id);
        return true;
    }

    bool ok = true;
    if (NumberParser::IsDecimalInt(text.data(), text.size())) {
        auto value = NumberParser::ParseDecimalInt(text.data(), text.size(),
                                                   &ok);
        if (ok) {
            token->set_token_code(TOKEN_INT_LITERAL);
            token->set_int_data(value);
            return true;
        }
        // Too large for an integer, keep it as a float.
    }

    auto value = NumberParser::ParseFloat(text.data(), text.size(), &ok);
    if (ok) {
        token->set_token_code(TOKEN_FLOAT_LITERAL);
        token->set_float_data(value);
        return true;
    }

    token->set_token_code(TOKEN_SYMBOL);
    return true;
}

/*static*/ bool Lexer::IsTermination(int ch) {
    switch (ch) {
        case -1:
            return true;

        case '(': case ')': case '[': case ']': case '{': case '}':
        case '\'': case '`': case ',': case '"': case ';':
            return true;

        default:
            if (isspace(ch)) {
                return true;
            }
            break;
    }
    return false;
}

/*static*/
bool Lexer::ThrowError(TokenObject *token, int code, const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    auto rv = VThrowError(token, code, fmt, ap);
    va_end(ap);
    return rv;
}

/*static*/
bool Lexer::VThrowError(TokenObject *token, int code, const char *fmt,
                        va_list ap) {
    token->set_token_code(TOKEN_ERROR);
    token->set_error_code(code);
    token->mutable_text()->assign(TextOutputStream::vsprintf(fmt, ap));
    return true;
}

} // namespace rlisp
