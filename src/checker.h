#ifndef RLISP_CHECKER_H_
#define RLISP_CHECKER_H_

#include "values.h"
#include "special-forms.h"
#include <stdarg.h>
#include <string>

namespace rlisp {

/**
 * Validates the shape of every special form in a term before evaluation.
 *
 * Quoted data, quasiquote templates and macro bodies are not checked: they
 * are not code until they are expanded.
 */
class Checker {
public:
    Checker() = default;

    DEF_GETTER(bool, has_error)
    DEF_GETTER(int, error_code)
    DEF_GETTER(std::string, error_message)

    /**
     * Returns false and records the first error.
     */
    bool Check(const Value *term);

    DISALLOW_IMPLICIT_CONSTRUCTORS(Checker)
private:
    void CheckTerm(const Value *term, bool *ok);
    void CheckElements(const ValueList &elements, size_t start, bool *ok);

    void CheckDefine(const ValueList &form, bool *ok);
    void CheckLambda(const ValueList &form, bool *ok);
    void CheckParameters(const Value *params, int code, bool *ok);
    void CheckCond(const ValueList &form, bool *ok);
    void CheckLet(const ValueList &form, bool *ok);
    void CheckDefineStruct(const ValueList &form, bool *ok);
    void CheckDefineMacro(const ValueList &form, bool *ok);
    void CheckMacroPattern(const Value *pattern, bool *ok);

    __attribute__ (( __format__ (__printf__, 3, 4)))
    void ThrowError(int code, const char *fmt, ...);
    void VThrowError(int code, const char *fmt, va_list ap);

    bool has_error_ = false;
    int error_code_ = 0;
    std::string error_message_;
}; // class Checker

} // namespace rlisp

#endif // RLISP_CHECKER_H_
