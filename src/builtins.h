#ifndef RLISP_BUILTINS_H_
#define RLISP_BUILTINS_H_

#include "values.h"

namespace rlisp {

class Environment;
class TextOutputStream;
class ValueFactory;

struct BuiltinEntry {
    const char      *name;
    BuiltinFunction  pointer;
    int              arity;
};

extern const BuiltinEntry kBuiltins[];

#define DECLARE_BUILTIN(name) \
    static Handle<Value> name(Evaluator *evaluator, Arguments *args, bool *ok);

class BaseLibrary {
public:
    /**
     * Bind every entry of `kBuiltins' and `pi' into `env'.
     */
    static void Install(ValueFactory *values, Environment *env);

    /**
     * "error(004): arity mismatch" and the indented payload, if any.
     */
    static void WriteError(TextOutputStream *stream, const ErrorValue *error);

    // arithmetic
    DECLARE_BUILTIN(Add)
    DECLARE_BUILTIN(Sub)
    DECLARE_BUILTIN(Mul)
    DECLARE_BUILTIN(Div)
    DECLARE_BUILTIN(Rem)

    // comparison
    DECLARE_BUILTIN(Equal)
    DECLARE_BUILTIN(Less)
    DECLARE_BUILTIN(LessEqual)
    DECLARE_BUILTIN(Greater)
    DECLARE_BUILTIN(GreaterEqual)

    // logic
    DECLARE_BUILTIN(And)
    DECLARE_BUILTIN(Or)
    DECLARE_BUILTIN(Not)

    // math
    DECLARE_BUILTIN(Sqrt)
    DECLARE_BUILTIN(Floor)
    DECLARE_BUILTIN(Ceil)
    DECLARE_BUILTIN(Pow)
    DECLARE_BUILTIN(Exp)
    DECLARE_BUILTIN(Ln)
    DECLARE_BUILTIN(Sin)
    DECLARE_BUILTIN(Cos)
    DECLARE_BUILTIN(Tan)
    DECLARE_BUILTIN(Asin)
    DECLARE_BUILTIN(Acos)
    DECLARE_BUILTIN(Atan)
    DECLARE_BUILTIN(Quat)

    // lists
    DECLARE_BUILTIN(Cons)
    DECLARE_BUILTIN(Head)
    DECLARE_BUILTIN(Tail)
    DECLARE_BUILTIN(List)
    DECLARE_BUILTIN(IsEmpty)
    DECLARE_BUILTIN(Append)
    DECLARE_BUILTIN(Length)

    // i/o
    DECLARE_BUILTIN(Display)
    DECLARE_BUILTIN(DisplayDebug)
    DECLARE_BUILTIN(Newline)
    DECLARE_BUILTIN(ReadLine)
    DECLARE_BUILTIN(ReadFile)

    // reflection
    DECLARE_BUILTIN(Eval)
    DECLARE_BUILTIN(Parse)
    DECLARE_BUILTIN(TypeOf)
    DECLARE_BUILTIN(CheckType)
    DECLARE_BUILTIN(Format)
    DECLARE_BUILTIN(SymbolToString)

    // errors
    DECLARE_BUILTIN(MakeError)
    DECLARE_BUILTIN(ErrorCode)
    DECLARE_BUILTIN(ErrorDescription)
    DECLARE_BUILTIN(ErrorPayload)
    DECLARE_BUILTIN(IsError)
    DECLARE_BUILTIN(Raise)
    DECLARE_BUILTIN(PrintError)

    DECLARE_BUILTIN(Exit)
}; // class BaseLibrary

#undef DECLARE_BUILTIN

} // namespace rlisp

#endif // RLISP_BUILTINS_H_
