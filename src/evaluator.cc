#include "evaluator.h"
#include "environment.h"
#include "value-factory.h"
#include "macro-expander.h"
#include "struct-registry.h"
#include "checker.h"
#include "parser.h"
#include "error-codes.h"
#include "text-input-stream.h"
#include "text-output-stream.h"
#include "glog/logging.h"

namespace rlisp {

#define CHECK_OK ok); if (!*ok) { return 0; } ((void)0

class EvalDepthScope {
public:
    EvalDepthScope(int *depth, int limit)
        : depth_(DCHECK_NOTNULL(depth)) {
        if (++(*depth_) > limit) {
            LOG(FATAL) << "evaluation depth exceeds " << limit
                       << ", stack exhausted.";
        }
    }

    ~EvalDepthScope() { --(*depth_); }

    DISALLOW_IMPLICIT_CONSTRUCTORS(EvalDepthScope)
private:
    int *depth_;
}; // class EvalDepthScope

////////////////////////////////////////////////////////////////////////////////
/// Arguments
////////////////////////////////////////////////////////////////////////////////

Arguments::Arguments(Evaluator *evaluator, Handle<Environment> env,
                     Builtin *self, const ValueList &values)
    : evaluator_(DCHECK_NOTNULL(evaluator))
    , env_(env)
    , self_(DCHECK_NOTNULL(self))
    , values_(values) {
}

Arguments::~Arguments() {
}

Handle<Number> Arguments::GetNumber(int i, bool *ok) const {
    auto n = GetAnyNumber(i, CHECK_OK);
    if (n->is_quaternion()) {
        evaluator_->ThrowError(ERR_SIGNATURE_MISMATCH, "`%s' argument(%d): "
                               "expected real number, found `%s'",
                               self_->name().c_str(), i,
                               n->ToString().c_str());
        *ok = false;
        return nullptr;
    }
    return n;
}

Handle<Number> Arguments::GetAnyNumber(int i, bool *ok) const {
    auto arg = Get(i);
    if (!arg->IsNumber()) {
        Mismatch(i, "number");
        *ok = false;
        return nullptr;
    }
    return Handle<Number>(arg->AsNumber());
}

Handle<String> Arguments::GetString(int i, bool *ok) const {
    auto arg = Get(i);
    if (!arg->IsString()) {
        Mismatch(i, "string");
        *ok = false;
        return nullptr;
    }
    return Handle<String>(arg->AsString());
}

Handle<Symbol> Arguments::GetSymbol(int i, bool *ok) const {
    auto arg = Get(i);
    if (!arg->IsSymbol()) {
        Mismatch(i, "symbol");
        *ok = false;
        return nullptr;
    }
    return Handle<Symbol>(arg->AsSymbol());
}

Handle<ErrorValue> Arguments::GetError(int i, bool *ok) const {
    auto arg = Get(i);
    if (!arg->IsErrorValue()) {
        Mismatch(i, "error");
        *ok = false;
        return nullptr;
    }
    return Handle<ErrorValue>(arg->AsErrorValue());
}

bool Arguments::GetBoolean(int i, bool *ok) const {
    auto arg = Get(i);
    if (!arg->IsBoolean()) {
        Mismatch(i, "bool");
        *ok = false;
        return false;
    }
    return arg->AsBoolean()->value();
}

Handle<Value> Arguments::GetList(int i, bool *ok) const {
    auto arg = Get(i);
    if (!arg->IsList()) {
        Mismatch(i, "list");
        *ok = false;
        return nullptr;
    }
    return arg;
}

void Arguments::Mismatch(int i, const char *expected) const {
    evaluator_->ThrowError(ERR_SIGNATURE_MISMATCH, "`%s' argument(%d): "
                           "expected `%s', found `%s'",
                           self_->name().c_str(), i, expected,
                           Get(i)->type_name());
}

////////////////////////////////////////////////////////////////////////////////
/// Evaluator
////////////////////////////////////////////////////////////////////////////////

Evaluator::Evaluator(ValueFactory *values, StructRegistry *structs,
                     TextStreamFactory *text_streams)
    : values_(DCHECK_NOTNULL(values))
    , structs_(DCHECK_NOTNULL(structs))
    , expander_(new MacroExpander(this))
    , text_streams_(text_streams) {
}

Evaluator::~Evaluator() {
    delete expander_;
}

void Evaluator::ClearError() {
    has_error_ = false;
    last_error_ = Handle<ErrorValue>();
}

Handle<Value> Evaluator::Eval(Handle<Value> term, Handle<Environment> env,
                              bool *ok) {
    EvalDepthScope depth_scope(&depth_, max_eval_depth_);

    for (;;) {
        if (should_exit_) {
            // Unwind to the session, no error recorded.
            *ok = false;
            return nullptr;
        }

        switch (term->kind()) {
            case Value::kSymbol:
                return LookupSymbol(term->AsSymbol(), env.get(), ok);
            case Value::kNil:
                ThrowError(ERR_NO_FUNCTION, "()");
                *ok = false;
                return nullptr;
            case Value::kPair:
                break;
            default:
                return term;
        }

        ValueList form;
        if (!term->AsPair()->ToVector(&form)) {
            ThrowError(ERR_PARSE_EXPRESSION, "improper form: %s",
                       term->ToString().c_str());
            *ok = false;
            return nullptr;
        }

        auto head = form[0];
        auto special = head->IsSymbol()
                     ? FindSpecialForm(head->AsSymbol()->name()) : FORM_NONE;
        switch (special) {
            case FORM_IF:
                term = EvalIf(form, env, CHECK_OK);
                continue;
            case FORM_COND:
                term = EvalCond(form, env, CHECK_OK);
                if (term.empty()) {
                    return values_->nil();
                }
                continue;
            case FORM_LET:
                term = EvalLet(form, &env, CHECK_OK);
                continue;
            case FORM_BEGIN:
                if (form.size() == 1) {
                    return values_->nil();
                }
                term = EvalBegin(form, 1, env, CHECK_OK);
                continue;
            case FORM_NONE:
                break;
            default:
                return EvalSpecialForm(special, form, env, ok);
        }

        auto callee = Eval(head, env, CHECK_OK);
        if (callee->IsMacro()) {
            term = expander_->Expand(Handle<Macro>(callee->AsMacro()), term,
                                     CHECK_OK);
            CheckTerm(term.get(), CHECK_OK);
            continue;
        }
        if (!callee->IsCallable()) {
            ThrowError(ERR_NOT_CALLABLE, "`%s'", callee->ToString().c_str());
            *ok = false;
            return nullptr;
        }

        ValueList args;
        for (size_t i = 1; i < form.size(); ++i) {
            auto arg = Eval(form[i], env, CHECK_OK);
            args.push_back(arg);
        }

        if (callee->IsBuiltin()) {
            return CallBuiltin(callee->AsBuiltin(), args, env, ok);
        }
        auto closure = callee->AsClosure();
        env  = BindParameters(closure, args, CHECK_OK);
        term = closure->body();
    }
}

Handle<Value> Evaluator::EvalForm(Handle<Value> form, Handle<Environment> env,
                                  bool *ok) {
    CheckTerm(form.get(), CHECK_OK);
    return Eval(form, env, ok);
}

Handle<Value> Evaluator::Apply(Handle<Value> callee, const ValueList &args,
                               Handle<Environment> env, bool *ok) {
    if (callee->IsBuiltin()) {
        return CallBuiltin(callee->AsBuiltin(), args, env, ok);
    }
    if (!callee->IsClosure()) {
        ThrowError(ERR_NOT_CALLABLE, "`%s'", callee->ToString().c_str());
        *ok = false;
        return nullptr;
    }
    auto closure = callee->AsClosure();
    auto frame = BindParameters(closure, args, CHECK_OK);
    return Eval(closure->body(), frame, ok);
}

Handle<Value> Evaluator::Import(const std::string &key,
                                Handle<Environment> env, bool *ok) {
    if (!text_streams_) {
        ThrowError(ERR_READ_FILE, "%s: no source", key.c_str());
        *ok = false;
        return nullptr;
    }

    Parser parser(values_, text_streams_);
    auto input = parser.SwitchInputStream(key);
    if (!input->error().empty()) {
        ThrowError(ERR_READ_FILE, "%s: %s", key.c_str(),
                   input->error().c_str());
        *ok = false;
        return nullptr;
    }
    VLOG(1) << "import: " << key;

    Handle<Value> result = values_->nil();
    while (!parser.AtEnd()) {
        bool parsed = true;
        auto form = parser.ParseForm(&parsed);
        if (!parsed) {
            auto error = parser.last_error();
            ThrowError(error.code, "%s", error.ToString().c_str());
            *ok = false;
            return nullptr;
        }
        result = EvalForm(form, env, CHECK_OK);
    }
    return result;
}

Handle<Value> Evaluator::Quasiquote(Handle<Value> templ,
                                    Handle<Environment> env, bool *ok) {
    if (!templ->IsPair()) {
        return templ;
    }

    auto pair = templ->AsPair();
    if (pair->car()->IsSymbol() &&
        FindSpecialForm(pair->car()->AsSymbol()->name()) == FORM_UNQUOTE) {
        ValueList parts;
        if (pair->ToVector(&parts) && parts.size() == 2) {
            return Eval(parts[1], env, ok);
        }
    }

    auto car = Quasiquote(pair->car(), env, CHECK_OK);
    auto cdr = Quasiquote(pair->cdr(), env, CHECK_OK);
    return values_->NewPair(car, cdr);
}

void Evaluator::ThrowError(int code, const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VThrowError(code, fmt, ap);
    va_end(ap);
}

void Evaluator::VThrowError(int code, const char *fmt, va_list ap) {
    DCHECK(IsValidErrorCode(code)) << code;
    auto message = TextOutputStream::vsprintf(fmt, ap);
    Raise(values_->NewError(code, values_->NewString(message)));
}

void Evaluator::Raise(Handle<ErrorValue> error) {
    has_error_  = true;
    last_error_ = error;
    VLOG(1) << error->ToHeadline();
}

Handle<Value> Evaluator::LookupSymbol(Symbol *symbol, Environment *env,
                                      bool *ok) {
    auto value = env->Lookup(symbol->name());
    if (value.valid()) {
        return value;
    }
    if (structs_->IsAccessorName(symbol->name())) {
        ThrowError(ERR_NO_SUCH_FIELD, "%s", symbol->name().c_str());
    } else {
        ThrowError(ERR_UNDEFINED_IDENTIFIER, "%s", symbol->name().c_str());
    }
    *ok = false;
    return nullptr;
}

Handle<Value> Evaluator::EvalSpecialForm(SpecialForm form,
                                         const ValueList &elements,
                                         Handle<Environment> env, bool *ok) {
    switch (form) {
        case FORM_DEFINE:
            return EvalDefine(elements, env, ok);
        case FORM_LAMBDA:
            return EvalLambda(elements, env, ok);
        case FORM_QUOTE:
            CheckArity(elements, 1, ok);
            return *ok ? elements[1] : nullptr;
        case FORM_QUASIQUOTE:
            CheckArity(elements, 1, ok);
            return *ok ? Quasiquote(elements[1], env, ok) : nullptr;
        case FORM_UNQUOTE:
            ThrowError(ERR_PARSE_EXPRESSION, "unquote expression must be "
                       "contained in a quasiquote");
            *ok = false;
            return nullptr;
        case FORM_DEFINE_STRUCT:
            return EvalDefineStruct(elements, env, ok);
        case FORM_DEFINE_MACRO:
            return EvalDefineMacro(Macro::TEMPLATE, elements, env, ok);
        case FORM_DEFINE_MACRO_RULE:
            return EvalDefineMacro(Macro::RULE, elements, env, ok);
        case FORM_SET:
            return EvalSet(elements, env, ok);
        case FORM_TRY:
            return EvalTry(elements, env, ok);
        case FORM_IMPORT:
            return EvalImport(elements, env, ok);
        default:
            DLOG(FATAL) << "noreached! " << SpecialFormName(form);
            break;
    }
    return nullptr;
}

// (if condition then else)
Handle<Value> Evaluator::EvalIf(const ValueList &form,
                                Handle<Environment> env, bool *ok) {
    CheckArity(form, 3, ok);
    if (!*ok) {
        return nullptr;
    }
    auto cond = Eval(form[1], env, CHECK_OK);
    if (!cond->IsBoolean()) {
        ThrowError(ERR_SIGNATURE_MISMATCH, "`if' condition: expected `bool', "
                   "found `%s'", cond->type_name());
        *ok = false;
        return nullptr;
    }
    return cond->AsBoolean()->value() ? form[2] : form[3];
}

// (cond [condition consequent] ...), empty handle if no clause matches.
Handle<Value> Evaluator::EvalCond(const ValueList &form,
                                  Handle<Environment> env, bool *ok) {
    for (size_t i = 1; i < form.size(); ++i) {
        if (!form[i]->IsPair()) {
            ThrowError(ERR_COND_CASE_NOT_LIST, "case: %s",
                       form[i]->ToString().c_str());
            *ok = false;
            return nullptr;
        }
        ValueList clause;
        if (!form[i]->AsPair()->ToVector(&clause) || clause.size() != 2) {
            ThrowError(ERR_COND_CASE_SIZE, "case: %s",
                       form[i]->ToString().c_str());
            *ok = false;
            return nullptr;
        }

        auto test = clause[0];
        if (test->IsSymbol() && test->AsSymbol()->name() == "else") {
            return clause[1];
        }
        auto cond = Eval(test, env, CHECK_OK);
        if (!cond->IsBoolean()) {
            ThrowError(ERR_COND_NOT_BOOLEAN, "found `%s'", cond->type_name());
            *ok = false;
            return nullptr;
        }
        if (cond->AsBoolean()->value()) {
            return clause[1];
        }
    }
    return Handle<Value>();
}

// (let ([name value] ...) body ...), bindings are sequential.
Handle<Value> Evaluator::EvalLet(const ValueList &form,
                                 Handle<Environment> *env, bool *ok) {
    DCHECK_GE(form.size(), 3u);
    Handle<Environment> frame(new Environment(*env));

    ValueList bindings;
    if (form[1]->IsPair()) {
        form[1]->AsPair()->ToVector(&bindings);
    }
    for (const auto &binding : bindings) {
        auto pair = binding->AsPair();
        auto name = pair->car()->AsSymbol()->name();
        auto value = Eval(pair->cdr()->AsPair()->car(), frame, CHECK_OK);
        if (!frame->Define(name, value)) {
            ThrowError(ERR_RESERVED_IDENTIFIER, "%s", name.c_str());
            *ok = false;
            return nullptr;
        }
    }

    *env = frame;
    return EvalBegin(form, 2, frame, ok);
}

Handle<Value> Evaluator::EvalBegin(const ValueList &form, size_t start,
                                   Handle<Environment> env, bool *ok) {
    DCHECK_LT(start, form.size());
    for (size_t i = start; i + 1 < form.size(); ++i) {
        Eval(form[i], env, CHECK_OK);
    }
    return form.back();
}

// (define name value) or (define (name param ...) body ...)
Handle<Value> Evaluator::EvalDefine(const ValueList &form,
                                    Handle<Environment> env, bool *ok) {
    DCHECK_GE(form.size(), 3u);
    if (form[1]->IsSymbol()) {
        auto name = form[1]->AsSymbol()->name();
        if (IsReservedIdentifier(name)) {
            ThrowError(ERR_RESERVED_IDENTIFIER, "%s", name.c_str());
            *ok = false;
            return nullptr;
        }
        auto value = Eval(form[2], env, CHECK_OK);
        if (value->IsClosure() && value->AsClosure()->name().empty()) {
            value->AsClosure()->set_name(name);
        }
        env->Put(name, value);
        return values_->nil();
    }

    auto signature = form[1]->AsPair();
    auto name = signature->car()->AsSymbol()->name();
    if (IsReservedIdentifier(name)) {
        ThrowError(ERR_RESERVED_IDENTIFIER, "%s", name.c_str());
        *ok = false;
        return nullptr;
    }
    auto closure = NewClosure(signature->cdr(), form, 2, env);
    closure->set_name(name);
    env->Put(name, closure);
    return values_->nil();
}

// (lambda [param ...] body ...)
Handle<Value> Evaluator::EvalLambda(const ValueList &form,
                                    Handle<Environment> env, bool *) {
    DCHECK_GE(form.size(), 3u);
    return NewClosure(form[1], form, 2, env);
}

// (set! name value)
Handle<Value> Evaluator::EvalSet(const ValueList &form,
                                 Handle<Environment> env, bool *ok) {
    CheckArity(form, 2, ok);
    if (!*ok) {
        return nullptr;
    }
    if (!form[1]->IsSymbol()) {
        ThrowError(ERR_SIGNATURE_MISMATCH, "`set!' expected `symbol', "
                   "found `%s'", form[1]->type_name());
        *ok = false;
        return nullptr;
    }

    auto name = form[1]->AsSymbol()->name();
    auto value = Eval(form[2], env, CHECK_OK);
    if (!env->Set(name, value)) {
        ThrowError(ERR_UNDEFINED_IDENTIFIER, "%s", name.c_str());
        *ok = false;
        return nullptr;
    }
    return values_->nil();
}

// (try body handler)
Handle<Value> Evaluator::EvalTry(const ValueList &form,
                                 Handle<Environment> env, bool *ok) {
    CheckArity(form, 2, ok);
    if (!*ok) {
        return nullptr;
    }
    auto handler = Eval(form[2], env, CHECK_OK);
    if (!handler->IsCallable()) {
        ThrowError(ERR_NOT_CALLABLE, "`%s'", handler->ToString().c_str());
        *ok = false;
        return nullptr;
    }

    bool body_ok = true;
    auto result = Eval(form[1], env, &body_ok);
    if (body_ok) {
        return result;
    }
    if (!has_error_) {
        // Exiting, nothing to catch.
        *ok = false;
        return nullptr;
    }

    auto error = last_error_;
    ClearError();
    ValueList args;
    args.push_back(error);
    return Apply(handler, args, env, ok);
}

// (import "key")
Handle<Value> Evaluator::EvalImport(const ValueList &form,
                                    Handle<Environment> env, bool *ok) {
    CheckArity(form, 1, ok);
    if (!*ok) {
        return nullptr;
    }
    auto key = Eval(form[1], env, CHECK_OK);
    if (!key->IsString()) {
        ThrowError(ERR_SIGNATURE_MISMATCH, "`import' expected `string', "
                   "found `%s'", key->type_name());
        *ok = false;
        return nullptr;
    }
    return Import(key->AsString()->data(), env, ok);
}

// (define-struct name [field ...])
Handle<Value> Evaluator::EvalDefineStruct(const ValueList &form,
                                          Handle<Environment> env, bool *ok) {
    DCHECK_EQ(3u, form.size());
    auto name = form[1]->AsSymbol()->name();

    ValueList elements;
    if (form[2]->IsPair()) {
        form[2]->AsPair()->ToVector(&elements);
    }
    std::vector<std::string> fields;
    for (const auto &element : elements) {
        fields.push_back(element->AsSymbol()->name());
    }

    auto type = structs_->NewType(name, fields);
    if (type.empty()) {
        ThrowError(ERR_TOO_MANY_STRUCTS, "`%s', at most %d struct types",
                   name.c_str(), structs_->max_types());
        *ok = false;
        return nullptr;
    }
    structs_->Install(type, env.get());
    return values_->nil();
}

// (define-macro (name param ...) body)
// (define-macro-rule (name pattern ...) template)
Handle<Value> Evaluator::EvalDefineMacro(Macro::Transformer transformer,
                                         const ValueList &form,
                                         Handle<Environment> env, bool *ok) {
    DCHECK_EQ(3u, form.size());
    auto signature = form[1]->AsPair();
    auto name = signature->car()->AsSymbol()->name();

    auto macro = values_->NewMacro(transformer, name, signature->cdr(),
                                   form[2], env);
    if (!env->Define(name, macro)) {
        ThrowError(ERR_RESERVED_IDENTIFIER, "%s", name.c_str());
        *ok = false;
        return nullptr;
    }
    VLOG(1) << "define macro: " << name;
    return values_->nil();
}

Handle<Closure> Evaluator::NewClosure(Handle<Value> params,
                                      const ValueList &body, size_t start,
                                      Handle<Environment> env) {
    std::vector<Handle<Symbol>> symbols;
    auto node = params.get();
    while (node->IsPair()) {
        symbols.push_back(Handle<Symbol>(node->AsPair()->car()->AsSymbol()));
        node = node->AsPair()->cdr().get();
    }
    return values_->NewClosure(symbols, MakeBody(body, start), env);
}

Handle<Value> Evaluator::MakeBody(const ValueList &body, size_t start) {
    DCHECK_LT(start, body.size());
    if (body.size() - start == 1) {
        return body[start];
    }
    return values_->NewPair(values_->NewSymbol("begin"),
                            values_->NewList(body, start));
}

Handle<Environment> Evaluator::BindParameters(Closure *closure,
                                              const ValueList &args,
                                              bool *ok) {
    if (closure->arity() != static_cast<int>(args.size())) {
        ThrowError(ERR_ARITY_MISMATCH, "`%s' expected %d, found %d",
                   closure->name().empty() ? "lambda"
                                           : closure->name().c_str(),
                   closure->arity(), static_cast<int>(args.size()));
        *ok = false;
        return nullptr;
    }

    Handle<Environment> frame(new Environment(closure->env()));
    for (size_t i = 0; i < args.size(); ++i) {
        auto name = closure->params()[i]->name();
        if (!frame->Define(name, args[i])) {
            ThrowError(ERR_RESERVED_IDENTIFIER, "%s", name.c_str());
            *ok = false;
            return nullptr;
        }
    }
    return frame;
}

Handle<Value> Evaluator::CallBuiltin(Builtin *builtin, const ValueList &args,
                                     Handle<Environment> env, bool *ok) {
    if (builtin->arity() != Builtin::kVariadic &&
        builtin->arity() != static_cast<int>(args.size())) {
        ThrowError(ERR_ARITY_MISMATCH, "`%s' expected %d, found %d",
                   builtin->name().c_str(), builtin->arity(),
                   static_cast<int>(args.size()));
        *ok = false;
        return nullptr;
    }

    Arguments arguments(this, env, builtin, args);
    auto result = builtin->function()(this, &arguments, CHECK_OK);
    DCHECK(result.valid()) << "builtin: " << builtin->name();
    return result;
}

bool Evaluator::CheckTerm(const Value *term, bool *ok) {
    Checker checker;
    if (!checker.Check(term)) {
        ThrowError(checker.error_code(), "%s",
                   checker.error_message().c_str());
        *ok = false;
    }
    return *ok;
}

void Evaluator::CheckArity(const ValueList &form, int expected, bool *ok) {
    auto found = static_cast<int>(form.size()) - 1;
    if (found != expected) {
        ThrowError(ERR_ARITY_MISMATCH, "`%s' expected %d, found %d",
                   form[0]->ToString().c_str(), expected, found);
        *ok = false;
    }
}

} // namespace rlisp
