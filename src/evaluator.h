#ifndef RLISP_EVALUATOR_H_
#define RLISP_EVALUATOR_H_

#include "values.h"
#include "special-forms.h"
#include <stdarg.h>
#include <string>

namespace rlisp {

class Environment;
class MacroExpander;
class StructRegistry;
class TextInputStream;
class TextOutputStream;
class TextStreamFactory;
class ValueFactory;

/**
 * How `check-type' compares a value with a type spec.
 */
enum SignaturePolicy: int {
    // Spec is a type name, compared with `type-of'.
    SIGNATURE_NOMINAL,
    // Also accepts `(list T)' specs, and struct instances whose fields
    // equal the named struct's fields.
    SIGNATURE_STRUCTURAL,
};

/**
 * Evaluated arguments of a builtin call.
 */
class Arguments {
public:
    Arguments(Evaluator *evaluator, Handle<Environment> env, Builtin *self,
              const ValueList &values);
    ~Arguments();

    Evaluator *evaluator() const { return evaluator_; }
    Builtin *self() const { return self_; }

    DEF_GETTER(Handle<Environment>, env)
    DEF_GETTER(ValueList, values)

    int size() const { return static_cast<int>(values_.size()); }

    Handle<Value> Get(int i) const {
        DCHECK_GE(i, 0);
        DCHECK_LT(i, size());
        return values_[i];
    }

    // Signature mismatch (009) if the argument is not the asked kind.
    // `GetNumber' rejects quaternions, `GetAnyNumber' accepts them.
    Handle<Number>     GetNumber(int i, bool *ok) const;
    Handle<Number>     GetAnyNumber(int i, bool *ok) const;
    Handle<String>     GetString(int i, bool *ok) const;
    Handle<Symbol>     GetSymbol(int i, bool *ok) const;
    Handle<ErrorValue> GetError(int i, bool *ok) const;
    bool               GetBoolean(int i, bool *ok) const;

    /**
     * A proper list: `nil' or a pair.
     */
    Handle<Value> GetList(int i, bool *ok) const;

    DISALLOW_IMPLICIT_CONSTRUCTORS(Arguments)
private:
    void Mismatch(int i, const char *expected) const;

    Evaluator *evaluator_;
    Handle<Environment> env_;
    Builtin *self_;
    ValueList values_;
}; // class Arguments


/**
 * Reduces terms to values.
 *
 * Tail positions (closure body, last form of `begin', `let' body, `if' and
 * `cond' branches, macro expansions) continue the loop in `Eval' instead
 * of recursing, so tail recursion runs in constant native stack.
 */
class Evaluator {
public:
    Evaluator(ValueFactory *values, StructRegistry *structs,
              TextStreamFactory *text_streams);
    ~Evaluator();

    DEF_PTR_GETTER(ValueFactory, values)
    DEF_PTR_GETTER(StructRegistry, structs)
    DEF_PTR_PROP_RW(TextStreamFactory, text_streams)
    DEF_PTR_PROP_RW(TextOutputStream, output)
    DEF_PTR_PROP_RW(TextInputStream, input)
    DEF_PROP_RW(int, max_eval_depth)
    DEF_PROP_RW(SignaturePolicy, signature_policy)
    DEF_PROP_RW(bool, should_exit)
    DEF_PROP_RW(int, exit_code)
    DEF_GETTER(int, depth)
    DEF_GETTER(bool, has_error)

    Handle<ErrorValue> last_error() const { return last_error_; }

    void ClearError();

    /**
     * `term' must have passed the `Checker'.
     */
    Handle<Value> Eval(Handle<Value> term, Handle<Environment> env, bool *ok);

    /**
     * Check then evaluate, for top-level forms and `eval'.
     */
    Handle<Value> EvalForm(Handle<Value> form, Handle<Environment> env,
                           bool *ok);

    Handle<Value> Apply(Handle<Value> callee, const ValueList &args,
                        Handle<Environment> env, bool *ok);

    /**
     * Evaluate all forms of the `key' source in `env', the value of the
     * last form is returned.
     */
    Handle<Value> Import(const std::string &key, Handle<Environment> env,
                         bool *ok);

    Handle<Value> Quasiquote(Handle<Value> templ, Handle<Environment> env,
                             bool *ok);

    /**
     * Records the error with a string payload, callers must still set
     * `*ok' to false.
     */
    __attribute__ (( __format__ (__printf__, 3, 4)))
    void ThrowError(int code, const char *fmt, ...);
    void VThrowError(int code, const char *fmt, va_list ap);

    void Raise(Handle<ErrorValue> error);

    DISALLOW_IMPLICIT_CONSTRUCTORS(Evaluator)
private:
    Handle<Value> LookupSymbol(Symbol *symbol, Environment *env, bool *ok);

    Handle<Value> EvalSpecialForm(SpecialForm form, const ValueList &elements,
                                  Handle<Environment> env, bool *ok);

    // Tail forms return the term to continue with.
    Handle<Value> EvalIf(const ValueList &form, Handle<Environment> env,
                         bool *ok);
    Handle<Value> EvalCond(const ValueList &form, Handle<Environment> env,
                           bool *ok);
    Handle<Value> EvalLet(const ValueList &form, Handle<Environment> *env,
                          bool *ok);
    Handle<Value> EvalBegin(const ValueList &form, size_t start,
                            Handle<Environment> env, bool *ok);

    Handle<Value> EvalDefine(const ValueList &form, Handle<Environment> env,
                             bool *ok);
    Handle<Value> EvalLambda(const ValueList &form, Handle<Environment> env,
                             bool *ok);
    Handle<Value> EvalSet(const ValueList &form, Handle<Environment> env,
                          bool *ok);
    Handle<Value> EvalTry(const ValueList &form, Handle<Environment> env,
                          bool *ok);
    Handle<Value> EvalImport(const ValueList &form, Handle<Environment> env,
                             bool *ok);
    Handle<Value> EvalDefineStruct(const ValueList &form,
                                   Handle<Environment> env, bool *ok);
    Handle<Value> EvalDefineMacro(Macro::Transformer transformer,
                                  const ValueList &form,
                                  Handle<Environment> env, bool *ok);

    Handle<Closure> NewClosure(Handle<Value> params, const ValueList &body,
                               size_t start, Handle<Environment> env);

    // Body of `body[start...]', wrapped in `begin' for more than one form.
    Handle<Value> MakeBody(const ValueList &body, size_t start);

    Handle<Environment> BindParameters(Closure *closure,
                                       const ValueList &args, bool *ok);

    Handle<Value> CallBuiltin(Builtin *builtin, const ValueList &args,
                              Handle<Environment> env, bool *ok);

    bool CheckTerm(const Value *term, bool *ok);

    void CheckArity(const ValueList &form, int expected, bool *ok);

    ValueFactory *values_;
    StructRegistry *structs_;
    MacroExpander *expander_;
    TextStreamFactory *text_streams_;
    TextOutputStream *output_ = nullptr;
    TextInputStream *input_ = nullptr;
    int max_eval_depth_ = kDefaultMaxEvalDepth;
    int depth_ = 0;
    SignaturePolicy signature_policy_ = SIGNATURE_NOMINAL;
    bool should_exit_ = false;
    int exit_code_ = 0;
    bool has_error_ = false;
    Handle<ErrorValue> last_error_;
}; // class Evaluator

} // namespace rlisp

#endif // RLISP_EVALUATOR_H_
