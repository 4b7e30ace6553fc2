#ifndef RLISP_ERROR_CODES_H_
#define RLISP_ERROR_CODES_H_

#include "base.h"
#include <string>

namespace rlisp {

// All error conditions, the description text is part of the tooling
// contract: never change it.
#define DEFINE_ERROR_CODES(M) \
    M(UNDEFINED_IDENTIFIER,     1, "undefined identifier") \
    M(NOT_CALLABLE,             2, "not a callable value") \
    M(NO_FUNCTION,              3, "no function to call") \
    M(ARITY_MISMATCH,           4, "arity mismatch") \
    M(UNCLOSED_LIST,            5, "unclosed list") \
    M(INFIX_NOT_IDENTICAL,      6, "infix functions must be identical") \
    M(UNCLOSED_INFIX_LIST,      7, "unclosed infix list") \
    M(UNCLOSED_STRING,          8, "unclosed string literal") \
    M(SIGNATURE_MISMATCH,       9, "signature mismatch") \
    M(HEAD_OF_EMPTY_LIST,      10, "cannot get the head of an empty list") \
    M(TAIL_OF_EMPTY_LIST,      11, "cannot get the tail of an empty list") \
    M(FLUSH_STDOUT,            12, "could not flush stdout") \
    M(BAD_DEFINITION,          13, "invalid macro or struct definition") \
    M(READ_FILE,               14, "could not read file") \
    M(READ_STDIN,              15, "failed to read stdin") \
    M(PARSE_EXPRESSION,        16, "could not parse expression") \
    M(LAMBDA_SYNTAX,           17, "lambda syntax: (lambda [args...] body)") \
    M(COND_NOT_BOOLEAN,        18, "cond condition must be a boolean") \
    M(COND_CASE_SIZE,          19, "condition case must contain 2 elements") \
    M(COND_CASE_NOT_LIST,      20, "condition case must be a list") \
    M(BINDING_LIST,            21, "binding list must be a list of bindings") \
    M(BINDING_IDENTIFIER,      22, "identifier in binding must be a symbol") \
    M(BINDING_SHAPE,           23, "binding must be a list containing a symbol and a value") \
    M(LET_BODY,                24, "let body not found") \
    M(BIND_TO_SYMBOL,          25, "value must be bound to a symbol") \
    M(DEFINE_SHAPE,            26, "define must bind either a function or a symbol") \
    M(PARAMETER_NOT_SYMBOL,    27, "function parameters must be symbols") \
    M(RESERVED_IDENTIFIER,     28, "reserved identifier") \
    M(NO_SUCH_FIELD,           29, "struct does not contain specified field") \
    M(TOO_MANY_STRUCTS,        30, "failed to define new struct; too many structs") \
    M(FORMAT_WITHOUT_EXPR,     31, "format string must contain expression to interpolate") \
    M(UNCLOSED_INTERPOLATION,  32, "unclosed expression while interpolating string")

#define ErrorCode_ENUM(name, code, text) ERR_##name = code,
enum ErrorCode: int {
    ERR_NONE = 0,
    DEFINE_ERROR_CODES(ErrorCode_ENUM)
};
#undef ErrorCode_ENUM

struct ErrorCodeMetadata {
    ErrorCode   code;
    const char *name;
    const char *description;
};

/**
 * Canonical description of the error code, or `nullptr' when the code is
 * not in the catalog.
 */
const char *ErrorCodeDescription(int code);

const char *ErrorCodeName(int code);

inline bool IsValidErrorCode(int code) {
    return code > 0 && code <= kMaxErrorCode;
}

/**
 * "error(004): arity mismatch"
 */
std::string ErrorCodeToString(int code);

} // namespace rlisp

#endif // RLISP_ERROR_CODES_H_
