#include "parser.h"
#include "lexer.h"
#include "value-factory.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "text-input-stream.h"
#include "text-output-stream.h"
#include "glog/logging.h"

namespace rlisp {

#define CHECK_OK ok); if (!*ok) { return 0; } ((void)0

ParsingError::ParsingError()
    : code(0)
    , column(0)
    , line(0)
    , position(0)
    , message("ok") {
}

/*static*/ ParsingError ParsingError::NoError() {
    return ParsingError();
}

std::string ParsingError::ToString() const {
    if (!file_name.empty()) {
        return TextOutputStream::sprintf("%s[%d:%d] %s", file_name.c_str(),
                                         line, column, message.c_str());
    }
    return message;
}

Parser::Parser(ValueFactory *values, TextStreamFactory *text_streams)
    : lexer_(new Lexer())
    , values_(DCHECK_NOTNULL(values))
    , text_streams_(text_streams) {
    ahead_.set_token_code(TOKEN_EOF);
}

Parser::~Parser() {
    delete lexer_;
}

ParsingError Parser::last_error() const {
    if (has_error()) {
        return last_error_;
    } else {
        return ParsingError::NoError();
    }
}

void Parser::ClearError() {
    has_error_  = false;
    last_error_ = ParsingError::NoError();
}

TextInputStream *Parser::SwitchInputStream(const std::string &key) {
    auto input = DCHECK_NOTNULL(text_streams_)->GetInputStream(key);
    SwitchInputStream(input, true);
    return input;
}

void Parser::SwitchInputStream(TextInputStream *input, bool ownership) {
    while (lexer_->has_scope()) {
        lexer_->PopScope();
    }
    lexer_->PushScope(input, ownership);
    ClearError();
    Advance();
}

Handle<Value> Parser::ParseExpression(bool *ok) {
    switch (Peek()) {
        case TOKEN_LPAREN:
            return ParseList(TOKEN_RPAREN, ok);
        case TOKEN_LBRACK:
            return ParseList(TOKEN_RBRACK, ok);
        case TOKEN_LBRACE:
            return ParseInfix(ok);

        case TOKEN_RPAREN:
        case TOKEN_RBRACK:
        case TOKEN_RBRACE:
            ThrowError(ERR_UNCLOSED_LIST, "unexpected list close: %s",
                       ahead_.ToNameWithText().c_str());
            *ok = false;
            return nullptr;

        case TOKEN_QUOTE:
            return ParseQuoted("quote", ok);
        case TOKEN_QUASIQUOTE:
            return ParseQuoted("quasiquote", ok);
        case TOKEN_UNQUOTE:
            return ParseQuoted("unquote", ok);

        case TOKEN_FORMAT_STRING:
            return ParseFormatString(ok);

        case TOKEN_EOF:
            ThrowError(ERR_PARSE_EXPRESSION, "unexpected end of input");
            *ok = false;
            return nullptr;

        case TOKEN_ERROR:
            ThrowError(ahead_.error_code(), "%s", ahead_.text().c_str());
            *ok = false;
            return nullptr;

        default:
            break;
    }
    return ParseAtom(ok);
}

// ( expr* ) or [ expr* ]
Handle<Value> Parser::ParseList(Token closer, bool *ok) {
    Advance(); // ( or [

    ValueList elements;
    while (Peek() != closer) {
        if (Peek() == TOKEN_EOF) {
            ThrowError(ERR_UNCLOSED_LIST, "expected: %s",
                       TokenNameWithText(closer).c_str());
            *ok = false;
            return nullptr;
        }
        auto expr = ParseExpression(CHECK_OK);
        elements.push_back(expr);
    }
    Match(closer, CHECK_OK);

    return values_->NewList(elements);
}

// { a op b op c ... } => (op a b c ...)
Handle<Value> Parser::ParseInfix(bool *ok) {
    Advance(); // {

    ValueList elements;
    elements.push_back(Handle<Value>()); // placeholder of operator
    Handle<Value> op;
    bool is_op = false;
    while (Peek() != TOKEN_RBRACE) {
        if (Peek() == TOKEN_EOF) {
            ThrowError(ERR_UNCLOSED_INFIX_LIST, "expected: %s",
                       TokenNameWithText(TOKEN_RBRACE).c_str());
            *ok = false;
            return nullptr;
        }

        auto expr = ParseExpression(CHECK_OK);
        if (!is_op) {
            elements.push_back(expr);
        } else if (op.empty()) {
            op = expr;
        } else if (!ValueEquals(op.get(), expr.get())) {
            ThrowError(ERR_INFIX_NOT_IDENTICAL, "infix operator `%s' is not "
                       "`%s'", expr->ToString().c_str(),
                       op->ToString().c_str());
            *ok = false;
            return nullptr;
        }
        is_op = !is_op;
    }
    Match(TOKEN_RBRACE, CHECK_OK);

    if (op.empty()) {
        // {} or {a}
        return elements.size() == 1 ? Handle<Value>(values_->nil())
                                    : elements[1];
    }
    elements[0] = op;
    return values_->NewList(elements);
}

// 'x => (quote x)
Handle<Value> Parser::ParseQuoted(const char *name, bool *ok) {
    Advance(); // ' ` ,

    auto expr = ParseExpression(CHECK_OK);
    ValueList elements;
    elements.push_back(values_->NewSymbol(name));
    elements.push_back(expr);
    return values_->NewList(elements);
}

// #"a #{e} b" => (format "a " e " b")
Handle<Value> Parser::ParseFormatString(bool *ok) {
    std::vector<FormatSpan> spans(ahead_.spans());

    ValueList elements;
    elements.push_back(values_->NewSymbol("format"));
    for (const auto &span : spans) {
        if (!span.is_expression) {
            elements.push_back(values_->NewString(span.text));
            continue;
        }

        lexer_->PushScope(new FixedMemoryInputStream(span.text), true);
        Advance();
        if (Peek() == TOKEN_EOF) {
            ThrowError(ERR_FORMAT_WITHOUT_EXPR, "empty expression at %d",
                       span.position);
            lexer_->PopScope();
            *ok = false;
            return nullptr;
        }
        auto expr = ParseExpression(ok);
        if (*ok && Peek() != TOKEN_EOF) {
            ThrowError(ERR_PARSE_EXPRESSION, "more than one expression in "
                       "`#{%s}'", span.text.c_str());
            *ok = false;
        }
        lexer_->PopScope();
        if (!*ok) {
            return nullptr;
        }
        elements.push_back(expr);
    }
    Advance(); // the format string

    return values_->NewList(elements);
}

Handle<Value> Parser::ParseAtom(bool *ok) {
    Handle<Value> atom;
    switch (Peek()) {
        case TOKEN_TRUE:
            atom = values_->true_value();
            break;
        case TOKEN_FALSE:
            atom = values_->false_value();
            break;
        case TOKEN_NIL: {
            // nil => (quote ()), evaluates to the empty list.
            ValueList elements;
            elements.push_back(values_->NewSymbol("quote"));
            elements.push_back(values_->nil());
            atom = values_->NewList(elements);
        } break;
        case TOKEN_INT_LITERAL:
            atom = values_->NewInt(ahead_.int_data());
            break;
        case TOKEN_FLOAT_LITERAL:
            atom = values_->NewFloat(ahead_.float_data());
            break;
        case TOKEN_STRING_LITERAL:
            atom = values_->NewString(ahead_.text());
            break;
        case TOKEN_SYMBOL:
            atom = values_->NewSymbol(ahead_.text());
            break;
        default:
            ThrowError(ERR_PARSE_EXPRESSION, "unexpected: %s",
                       ahead_.ToNameWithText().c_str());
            *ok = false;
            return nullptr;
    }
    Advance();
    return atom;
}

void Parser::Match(Token code, bool *ok) {
    DCHECK_NE(TOKEN_ERROR, code);

    if (ahead_.token_code() != code) {
        *ok = false;
        if (ahead_.is_error()) {
            ThrowError(ahead_.error_code(), "%s", ahead_.text().c_str());
        } else {
            ThrowError(ERR_PARSE_EXPRESSION, "unexpected: %s, expected: %s",
                       ahead_.ToNameWithText().c_str(),
                       TokenNameWithText(code).c_str());
        }
        return;
    }
    Advance();
}

void Parser::Advance() {
    lexer_->Next(&ahead_);
}

void Parser::ThrowError(int code, const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VThrowError(code, fmt, ap);
    va_end(ap);
}

void Parser::VThrowError(int code, const char *fmt, va_list ap) {
    has_error_ = true;
    last_error_.code      = code;
    last_error_.column    = ahead_.column();
    last_error_.line      = ahead_.line();
    last_error_.position  = ahead_.position();
    last_error_.file_name = lexer_->has_scope()
                          ? lexer_->input_stream()->file_name() : "";
    last_error_.message = TextOutputStream::vsprintf(fmt, ap);
}

} // namespace rlisp
