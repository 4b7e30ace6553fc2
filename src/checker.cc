#include "checker.h"
#include "error-codes.h"
#include "text-output-stream.h"
#include "glog/logging.h"

namespace rlisp {

#define CHECK_OK ok); if (!*ok) { return; } ((void)0

namespace {

inline bool IsListTerm(const Value *term) {
    return term->IsNil() || term->IsPair();
}

} // namespace

bool Checker::Check(const Value *term) {
    has_error_ = false;
    error_code_ = 0;
    error_message_.clear();

    bool ok = true;
    CheckTerm(DCHECK_NOTNULL(term), &ok);
    return ok;
}

void Checker::CheckTerm(const Value *term, bool *ok) {
    if (!term->IsPair()) {
        return;
    }

    ValueList form;
    if (!term->AsPair()->ToVector(&form)) {
        ThrowError(ERR_PARSE_EXPRESSION, "improper form: %s",
                   term->ToString().c_str());
        *ok = false;
        return;
    }

    auto head = form[0].get();
    auto special = head->IsSymbol()
                 ? FindSpecialForm(head->AsSymbol()->name()) : FORM_NONE;
    switch (special) {
        case FORM_DEFINE:
            CheckDefine(form, ok);
            break;
        case FORM_LAMBDA:
            CheckLambda(form, ok);
            break;
        case FORM_COND:
            CheckCond(form, ok);
            break;
        case FORM_LET:
            CheckLet(form, ok);
            break;
        case FORM_DEFINE_STRUCT:
            CheckDefineStruct(form, ok);
            break;
        case FORM_DEFINE_MACRO:
        case FORM_DEFINE_MACRO_RULE:
            CheckDefineMacro(form, ok);
            break;

        // Data, not code.
        case FORM_QUOTE:
        case FORM_QUASIQUOTE:
            break;

        case FORM_NONE:
            CheckElements(form, 0, ok);
            break;

        default:
            CheckElements(form, 1, ok);
            break;
    }
}

void Checker::CheckElements(const ValueList &elements, size_t start,
                            bool *ok) {
    for (size_t i = start; i < elements.size(); ++i) {
        CheckTerm(elements[i].get(), CHECK_OK);
    }
}

// (define name value)
// (define (name param ...) body ...)
void Checker::CheckDefine(const ValueList &form, bool *ok) {
    if (form.size() < 2) {
        ThrowError(ERR_DEFINE_SHAPE, "nothing to define");
        *ok = false;
        return;
    }

    auto target = form[1].get();
    if (target->IsSymbol()) {
        if (form.size() != 3) {
            ThrowError(ERR_DEFINE_SHAPE, "`%s' must be bound to one value, "
                       "found %d", target->AsSymbol()->name().c_str(),
                       static_cast<int>(form.size()) - 2);
            *ok = false;
            return;
        }
        CheckTerm(form[2].get(), ok);
        return;
    }

    if (!target->IsPair()) {
        ThrowError(ERR_DEFINE_SHAPE, "can not define: %s",
                   target->ToString().c_str());
        *ok = false;
        return;
    }

    auto name = target->AsPair()->car().get();
    if (!name->IsSymbol()) {
        ThrowError(ERR_BIND_TO_SYMBOL, "function name: %s",
                   name->ToString().c_str());
        *ok = false;
        return;
    }
    CheckParameters(target->AsPair()->cdr().get(), ERR_PARAMETER_NOT_SYMBOL,
                    CHECK_OK);
    if (form.size() < 3) {
        ThrowError(ERR_DEFINE_SHAPE, "function `%s' has no body",
                   name->AsSymbol()->name().c_str());
        *ok = false;
        return;
    }
    CheckElements(form, 2, ok);
}

// (lambda [param ...] body ...)
void Checker::CheckLambda(const ValueList &form, bool *ok) {
    if (form.size() < 3 || !IsListTerm(form[1].get())) {
        ThrowError(ERR_LAMBDA_SYNTAX, "%s", form[0]->ToString().c_str());
        *ok = false;
        return;
    }
    CheckParameters(form[1].get(), ERR_PARAMETER_NOT_SYMBOL, CHECK_OK);
    CheckElements(form, 2, ok);
}

void Checker::CheckParameters(const Value *params, int code, bool *ok) {
    while (params->IsPair()) {
        auto param = params->AsPair()->car().get();
        if (!param->IsSymbol()) {
            ThrowError(code, "parameter: %s", param->ToString().c_str());
            *ok = false;
            return;
        }
        params = params->AsPair()->cdr().get();
    }
    if (!params->IsNil()) {
        ThrowError(code, "parameter: %s", params->ToString().c_str());
        *ok = false;
    }
}

// (cond [condition consequent] ...)
void Checker::CheckCond(const ValueList &form, bool *ok) {
    for (size_t i = 1; i < form.size(); ++i) {
        auto clause = form[i].get();
        if (!clause->IsPair()) {
            ThrowError(ERR_COND_CASE_NOT_LIST, "case: %s",
                       clause->ToString().c_str());
            *ok = false;
            return;
        }
        ValueList parts;
        if (!clause->AsPair()->ToVector(&parts) || parts.size() != 2) {
            ThrowError(ERR_COND_CASE_SIZE, "case: %s",
                       clause->ToString().c_str());
            *ok = false;
            return;
        }
        CheckElements(parts, 0, CHECK_OK);
    }
}

// (let ([name value] ...) body ...)
void Checker::CheckLet(const ValueList &form, bool *ok) {
    if (form.size() < 2 || !IsListTerm(form[1].get())) {
        ThrowError(ERR_BINDING_LIST, "bindings: %s", form.size() < 2
                   ? "<none>" : form[1]->ToString().c_str());
        *ok = false;
        return;
    }

    auto bindings = form[1].get();
    while (bindings->IsPair()) {
        auto binding = bindings->AsPair()->car().get();
        if (!binding->IsPair() || binding->AsPair()->Length() != 2) {
            ThrowError(ERR_BINDING_SHAPE, "found %s",
                       binding->ToString().c_str());
            *ok = false;
            return;
        }
        auto name = binding->AsPair()->car().get();
        if (!name->IsSymbol()) {
            ThrowError(ERR_BINDING_IDENTIFIER, "found %s",
                       name->ToString().c_str());
            *ok = false;
            return;
        }
        auto value = binding->AsPair()->cdr()->AsPair()->car().get();
        CheckTerm(value, CHECK_OK);
        bindings = bindings->AsPair()->cdr().get();
    }
    if (!bindings->IsNil()) {
        ThrowError(ERR_BINDING_LIST, "bindings: %s",
                   form[1]->ToString().c_str());
        *ok = false;
        return;
    }

    if (form.size() < 3) {
        ThrowError(ERR_LET_BODY, "%s", "(let bindings)");
        *ok = false;
        return;
    }
    CheckElements(form, 2, ok);
}

// (define-struct name [field ...])
void Checker::CheckDefineStruct(const ValueList &form, bool *ok) {
    if (form.size() != 3) {
        ThrowError(ERR_BAD_DEFINITION, "(define-struct name [field...])");
        *ok = false;
        return;
    }
    if (!form[1]->IsSymbol()) {
        ThrowError(ERR_BAD_DEFINITION, "struct name: %s",
                   form[1]->ToString().c_str());
        *ok = false;
        return;
    }
    if (!IsListTerm(form[2].get())) {
        ThrowError(ERR_BAD_DEFINITION, "struct fields: %s",
                   form[2]->ToString().c_str());
        *ok = false;
        return;
    }
    CheckParameters(form[2].get(), ERR_BAD_DEFINITION, ok);
}

// (define-macro (name param ...) body)
// (define-macro-rule (name pattern ...) template)
void Checker::CheckDefineMacro(const ValueList &form, bool *ok) {
    auto keyword = form[0]->AsSymbol()->name();
    if (form.size() != 3 || !form[1]->IsPair()) {
        ThrowError(ERR_BAD_DEFINITION, "(%s (name ...) body)",
                   keyword.c_str());
        *ok = false;
        return;
    }

    auto signature = form[1]->AsPair();
    if (!signature->car()->IsSymbol()) {
        ThrowError(ERR_BAD_DEFINITION, "macro name: %s",
                   signature->car()->ToString().c_str());
        *ok = false;
        return;
    }
    if (FindSpecialForm(keyword) == FORM_DEFINE_MACRO) {
        CheckParameters(signature->cdr().get(), ERR_BAD_DEFINITION, ok);
    } else {
        CheckMacroPattern(signature->cdr().get(), ok);
    }
}

void Checker::CheckMacroPattern(const Value *pattern, bool *ok) {
    while (pattern->IsPair()) {
        auto element = pattern->AsPair()->car().get();
        if (element->IsPair()) {
            CheckMacroPattern(element, CHECK_OK);
        }
        pattern = pattern->AsPair()->cdr().get();
    }
    if (!pattern->IsNil()) {
        ThrowError(ERR_BAD_DEFINITION, "improper pattern: %s",
                   pattern->ToString().c_str());
        *ok = false;
    }
}

void Checker::ThrowError(int code, const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VThrowError(code, fmt, ap);
    va_end(ap);
}

void Checker::VThrowError(int code, const char *fmt, va_list ap) {
    DCHECK(IsValidErrorCode(code)) << code;
    has_error_ = true;
    error_code_ = code;
    error_message_ = TextOutputStream::vsprintf(fmt, ap);
}

} // namespace rlisp
