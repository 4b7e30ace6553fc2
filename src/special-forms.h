#ifndef RLISP_SPECIAL_FORMS_H_
#define RLISP_SPECIAL_FORMS_H_

#include <string>

namespace rlisp {

#define DEFINE_SPECIAL_FORMS(M)                         \
    M(DEFINE,            define,            "define")            \
    M(LAMBDA,            lambda,            "lambda")            \
    M(IF,                branch,            "if")                \
    M(COND,              cond,              "cond")              \
    M(LET,               let,               "let")               \
    M(BEGIN,             begin,             "begin")             \
    M(QUOTE,             quote,             "quote")             \
    M(QUASIQUOTE,        quasiquote,        "quasiquote")        \
    M(UNQUOTE,           unquote,           "unquote")           \
    M(DEFINE_STRUCT,     define_struct,     "define-struct")     \
    M(DEFINE_MACRO,      define_macro,      "define-macro")      \
    M(DEFINE_MACRO_RULE, define_macro_rule, "define-macro-rule") \
    M(SET,               set,               "set!")              \
    M(TRY,               try_catch,         "try")               \
    M(IMPORT,            import,            "import")

enum SpecialForm: int {
#define SpecialForm_ENUM(code, name, literal) FORM_##code,
    DEFINE_SPECIAL_FORMS(SpecialForm_ENUM)
#undef SpecialForm_ENUM
    FORM_NONE,
};

/**
 * `FORM_NONE' if `name' is not a special form keyword. `λ' is an alias of
 * `lambda'.
 */
SpecialForm FindSpecialForm(const std::string &name);

const char *SpecialFormName(SpecialForm form);

/**
 * Special form keywords, `else' and `_' can not be defined.
 */
bool IsReservedIdentifier(const std::string &name);

} // namespace rlisp

#endif // RLISP_SPECIAL_FORMS_H_
