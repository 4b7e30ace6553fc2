#include "builtins.h"
#include "evaluator.h"
#include "environment.h"
#include "value-factory.h"
#include "struct-registry.h"
#include "parser.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "text-input-stream.h"
#include "text-output-stream.h"
#include "glog/logging.h"
#include <math.h>
#include <cmath>
#include <memory>

namespace rlisp {

#define CHECK_OK ok); if (!*ok) { return 0; } ((void)0

const BuiltinEntry kBuiltins[] = {
    // arithmetic
    { "+",              &BaseLibrary::Add,              Builtin::kVariadic, },
    { "-",              &BaseLibrary::Sub,              Builtin::kVariadic, },
    { "*",              &BaseLibrary::Mul,              Builtin::kVariadic, },
    { "/",              &BaseLibrary::Div,              Builtin::kVariadic, },
    { "%",              &BaseLibrary::Rem,              2, },
    { "rem",            &BaseLibrary::Rem,              2, },
    // comparison
    { "=",              &BaseLibrary::Equal,            2, },
    { "eq?",            &BaseLibrary::Equal,            2, },
    { "<",              &BaseLibrary::Less,             2, },
    { "<=",             &BaseLibrary::LessEqual,        2, },
    { ">",              &BaseLibrary::Greater,          2, },
    { ">=",             &BaseLibrary::GreaterEqual,     2, },
    // logic
    { "and",            &BaseLibrary::And,              Builtin::kVariadic, },
    { "&&",             &BaseLibrary::And,              Builtin::kVariadic, },
    { "or",             &BaseLibrary::Or,               Builtin::kVariadic, },
    { "||",             &BaseLibrary::Or,               Builtin::kVariadic, },
    { "not",            &BaseLibrary::Not,              1, },
    // math
    { "sqrt",           &BaseLibrary::Sqrt,             1, },
    { "floor",          &BaseLibrary::Floor,            1, },
    { "ceil",           &BaseLibrary::Ceil,             1, },
    { "pow",            &BaseLibrary::Pow,              2, },
    { "exp",            &BaseLibrary::Exp,              1, },
    { "ln",             &BaseLibrary::Ln,               1, },
    { "sin",            &BaseLibrary::Sin,              1, },
    { "cos",            &BaseLibrary::Cos,              1, },
    { "tan",            &BaseLibrary::Tan,              1, },
    { "asin",           &BaseLibrary::Asin,             1, },
    { "acos",           &BaseLibrary::Acos,             1, },
    { "atan",           &BaseLibrary::Atan,             1, },
    { "quat",           &BaseLibrary::Quat,             4, },
    // lists
    { "cons",           &BaseLibrary::Cons,             2, },
    { ":",              &BaseLibrary::Cons,             2, },
    { "head",           &BaseLibrary::Head,             1, },
    { "tail",           &BaseLibrary::Tail,             1, },
    { "list",           &BaseLibrary::List,             Builtin::kVariadic, },
    { "empty?",         &BaseLibrary::IsEmpty,          1, },
    { "append",         &BaseLibrary::Append,           Builtin::kVariadic, },
    { "++",             &BaseLibrary::Append,           Builtin::kVariadic, },
    { "length",         &BaseLibrary::Length,           1, },
    // i/o
    { "display",        &BaseLibrary::Display,          Builtin::kVariadic, },
    { "display-debug",  &BaseLibrary::DisplayDebug,     Builtin::kVariadic, },
    { "newline",        &BaseLibrary::Newline,          0, },
    { "readline",       &BaseLibrary::ReadLine,         0, },
    { "readfile",       &BaseLibrary::ReadFile,         1, },
    // reflection
    { "eval",           &BaseLibrary::Eval,             1, },
    { "parse",          &BaseLibrary::Parse,            1, },
    { "type-of",        &BaseLibrary::TypeOf,           1, },
    { "check-type",     &BaseLibrary::CheckType,        2, },
    { "format",         &BaseLibrary::Format,           Builtin::kVariadic, },
    { "string-concat",  &BaseLibrary::Format,           Builtin::kVariadic, },
    { "symbol->string", &BaseLibrary::SymbolToString,   1, },
    // errors
    { "make-error",        &BaseLibrary::MakeError,        Builtin::kVariadic, },
    { "error-code",        &BaseLibrary::ErrorCode,        1, },
    { "error-description", &BaseLibrary::ErrorDescription, 1, },
    { "error-payload",     &BaseLibrary::ErrorPayload,     1, },
    { "is-error?",         &BaseLibrary::IsError,          1, },
    { "raise",             &BaseLibrary::Raise,            1, },
    { "print-error",       &BaseLibrary::PrintError,       1, },

    { "exit",           &BaseLibrary::Exit,             Builtin::kVariadic, },

    { nullptr, nullptr, 0, } // end of builtins
};

namespace {

enum ArithmeticOp: int {
    OP_ADD,
    OP_SUB,
    OP_MUL,
    OP_DIV,
};

// Returns false if the result is not an exact integer.
bool IntegralOp(ArithmeticOp op, rlisp_int_t lhs, rlisp_int_t rhs,
                rlisp_int_t *result) {
    switch (op) {
        case OP_ADD:
            return !__builtin_add_overflow(lhs, rhs, result);
        case OP_SUB:
            return !__builtin_sub_overflow(lhs, rhs, result);
        case OP_MUL:
            return !__builtin_mul_overflow(lhs, rhs, result);
        case OP_DIV:
            if (rhs == 0 || (rhs == -1 && lhs == INT64_MIN) ||
                lhs % rhs != 0) {
                return false;
            }
            *result = lhs / rhs;
            return true;
    }
    return false;
}

rlisp_float_t FloatOp(ArithmeticOp op, rlisp_float_t lhs, rlisp_float_t rhs) {
    switch (op) {
        case OP_ADD: return lhs + rhs;
        case OP_SUB: return lhs - rhs;
        case OP_MUL: return lhs * rhs;
        case OP_DIV: return lhs / rhs;
    }
    return 0;
}

Quaternion QuaternionOp(ArithmeticOp op, const Quaternion &lhs,
                        const Quaternion &rhs) {
    switch (op) {
        case OP_ADD: return lhs.Add(rhs);
        case OP_SUB: return lhs.Sub(rhs);
        case OP_MUL: return lhs.Mul(rhs);
        case OP_DIV: return lhs.Div(rhs);
    }
    return Quaternion::FromReal(0);
}

// Integers stay integers until a float operand, an overflow or an inexact
// division. Any quaternion operand makes the rest quaternion arithmetic,
// applied left to right.
Handle<Value> Fold(Evaluator *evaluator, Arguments *args, ArithmeticOp op,
                   int start, Handle<Number> init, bool *ok) {
    auto integral = init->is_integral();
    auto quaternion = init->is_quaternion();
    auto int_acc = init->int_value();
    auto float_acc = init->float_value();
    auto quaternion_acc = init->quaternion_value();
    for (int i = start; i < args->size(); ++i) {
        auto n = args->GetAnyNumber(i, CHECK_OK);
        rlisp_int_t result;
        if (integral && n->is_integral() &&
            IntegralOp(op, int_acc, n->int_value(), &result)) {
            int_acc = result;
            continue;
        }
        if (integral) {
            float_acc = static_cast<rlisp_float_t>(int_acc);
            integral = false;
        }
        if (!quaternion && n->is_quaternion()) {
            quaternion_acc = Quaternion::FromReal(float_acc);
            quaternion = true;
        }
        if (quaternion) {
            quaternion_acc = QuaternionOp(op, quaternion_acc,
                                          n->quaternion_value());
        } else {
            float_acc = FloatOp(op, float_acc, n->float_value());
        }
    }
    if (integral) {
        return evaluator->values()->NewInt(int_acc);
    }
    if (quaternion) {
        return evaluator->values()->NewQuaternion(quaternion_acc);
    }
    return evaluator->values()->NewFloat(float_acc);
}

// Compare two numbers: -1, 0 or 1.
int CompareNumbers(const Number *lhs, const Number *rhs) {
    if (lhs->is_integral() && rhs->is_integral()) {
        return lhs->int_value() < rhs->int_value() ? -1
             : (lhs->int_value() > rhs->int_value() ? 1 : 0);
    }
    return lhs->float_value() < rhs->float_value() ? -1
         : (lhs->float_value() > rhs->float_value() ? 1 : 0);
}

Handle<Value> Compare(Evaluator *evaluator, Arguments *args,
                      bool (*predicate)(int), bool *ok) {
    auto lhs = args->GetNumber(0, CHECK_OK);
    auto rhs = args->GetNumber(1, CHECK_OK);
    if (std::isnan(lhs->float_value()) || std::isnan(rhs->float_value())) {
        return evaluator->values()->false_value();
    }
    return evaluator->values()->NewBoolean(
            predicate(CompareNumbers(lhs.get(), rhs.get())));
}

Handle<Value> UnaryMath(Evaluator *evaluator, Arguments *args,
                        rlisp_float_t (*fn)(rlisp_float_t), bool *ok) {
    auto n = args->GetNumber(0, CHECK_OK);
    return evaluator->values()->NewFloat(fn(n->float_value()));
}

Handle<Value> IntegralIfExact(ValueFactory *values, rlisp_float_t value) {
    if (value >= -9.2e18 && value <= 9.2e18) {
        return values->NewInt(static_cast<rlisp_int_t>(value));
    }
    return values->NewFloat(value);
}

void CheckArgumentsRange(Evaluator *evaluator, Arguments *args, int min,
                         int max, bool *ok) {
    if (args->size() < min || args->size() > max) {
        evaluator->ThrowError(ERR_ARITY_MISMATCH, "`%s' expected %d to %d, "
                              "found %d", args->self()->name().c_str(), min,
                              max, args->size());
        *ok = false;
    }
}

Handle<Value> Flush(Evaluator *evaluator, bool *ok) {
    auto output = DCHECK_NOTNULL(evaluator->output());
    if (!output->Flush()) {
        evaluator->ThrowError(ERR_FLUSH_STDOUT, "%s: %s", output->file_name(),
                              output->error().c_str());
        *ok = false;
        return nullptr;
    }
    return evaluator->values()->nil();
}

std::string TypeName(const Value *value) {
    if (value->IsStructInstance()) {
        return value->AsStructInstance()->type()->name();
    }
    return value->type_name();
}

bool MatchType(Evaluator *evaluator, const Value *value, const Value *spec) {
    auto structural = evaluator->signature_policy() == SIGNATURE_STRUCTURAL;
    if (spec->IsSymbol()) {
        auto name = spec->AsSymbol()->name();
        if (name == "any" || name == TypeName(value)) {
            return true;
        }
        if (!structural || !value->IsStructInstance()) {
            return false;
        }
        auto type = evaluator->structs()->FindType(name);
        return type.valid() &&
               type->fields() == value->AsStructInstance()->type()->fields();
    }

    // (list T)
    ValueList parts;
    if (!structural || !spec->IsPair() || !spec->AsPair()->ToVector(&parts) ||
        parts.size() != 2 || !parts[0]->IsSymbol() ||
        parts[0]->AsSymbol()->name() != "list" || !value->IsList()) {
        return false;
    }
    auto node = value;
    while (node->IsPair()) {
        if (!MatchType(evaluator, node->AsPair()->car().get(),
                       parts[1].get())) {
            return false;
        }
        node = node->AsPair()->cdr().get();
    }
    return true;
}

} // namespace

/*static*/ void BaseLibrary::Install(ValueFactory *values, Environment *env) {
    auto entry = &kBuiltins[0];
    while (entry->name != nullptr) {
        env->Put(entry->name, values->NewBuiltin(entry->name, entry->pointer,
                                                 entry->arity));
        ++entry;
    }
    env->Put("pi", values->NewFloat(M_PI));
}

/*static*/ void BaseLibrary::WriteError(TextOutputStream *stream,
                                        const ErrorValue *error) {
    stream->Printf("%s\n", error->ToHeadline().c_str());
    if (error->has_payload()) {
        stream->Printf("    %s\n",
                       error->payload()->ToDisplayString().c_str());
    }
}

////////////////////////////////////////////////////////////////////////////////
/// Arithmetic
////////////////////////////////////////////////////////////////////////////////

/*static*/ Handle<Value> BaseLibrary::Add(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    return Fold(evaluator, args, OP_ADD, 0, evaluator->values()->NewInt(0),
                ok);
}

/*static*/ Handle<Value> BaseLibrary::Sub(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    CheckArgumentsRange(evaluator, args, 1, INT32_MAX, CHECK_OK);
    if (args->size() == 1) {
        // (- x) => (- 0 x)
        return Fold(evaluator, args, OP_SUB, 0,
                    evaluator->values()->NewInt(0), ok);
    }
    auto first = args->GetAnyNumber(0, CHECK_OK);
    return Fold(evaluator, args, OP_SUB, 1, first, ok);
}

/*static*/ Handle<Value> BaseLibrary::Mul(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    return Fold(evaluator, args, OP_MUL, 0, evaluator->values()->NewInt(1),
                ok);
}

/*static*/ Handle<Value> BaseLibrary::Div(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    CheckArgumentsRange(evaluator, args, 1, INT32_MAX, CHECK_OK);
    if (args->size() == 1) {
        // (/ x) => (/ 1 x)
        return Fold(evaluator, args, OP_DIV, 0,
                    evaluator->values()->NewInt(1), ok);
    }
    auto first = args->GetAnyNumber(0, CHECK_OK);
    return Fold(evaluator, args, OP_DIV, 1, first, ok);
}

/*static*/ Handle<Value> BaseLibrary::Rem(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    auto lhs = args->GetNumber(0, CHECK_OK);
    auto rhs = args->GetNumber(1, CHECK_OK);
    if (lhs->is_integral() && rhs->is_integral() && rhs->int_value() != 0 &&
        rhs->int_value() != -1) {
        return evaluator->values()->NewInt(lhs->int_value() %
                                           rhs->int_value());
    }
    if (lhs->is_integral() && rhs->is_integral() && rhs->int_value() == -1) {
        return evaluator->values()->NewInt(0);
    }
    return evaluator->values()->NewFloat(fmod(lhs->float_value(),
                                              rhs->float_value()));
}

////////////////////////////////////////////////////////////////////////////////
/// Comparison & Logic
////////////////////////////////////////////////////////////////////////////////

/*static*/ Handle<Value> BaseLibrary::Equal(Evaluator *evaluator,
                                            Arguments *args, bool *) {
    return evaluator->values()->NewBoolean(
            ValueEquals(args->Get(0).get(), args->Get(1).get()));
}

/*static*/ Handle<Value> BaseLibrary::Less(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    return Compare(evaluator, args, [](int r) { return r < 0; }, ok);
}

/*static*/ Handle<Value> BaseLibrary::LessEqual(Evaluator *evaluator,
                                                Arguments *args, bool *ok) {
    return Compare(evaluator, args, [](int r) { return r <= 0; }, ok);
}

/*static*/ Handle<Value> BaseLibrary::Greater(Evaluator *evaluator,
                                              Arguments *args, bool *ok) {
    return Compare(evaluator, args, [](int r) { return r > 0; }, ok);
}

/*static*/ Handle<Value> BaseLibrary::GreaterEqual(Evaluator *evaluator,
                                                   Arguments *args,
                                                   bool *ok) {
    return Compare(evaluator, args, [](int r) { return r >= 0; }, ok);
}

/*static*/ Handle<Value> BaseLibrary::And(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    auto result = true;
    for (int i = 0; i < args->size(); ++i) {
        auto value = args->GetBoolean(i, CHECK_OK);
        result = result && value;
    }
    return evaluator->values()->NewBoolean(result);
}

/*static*/ Handle<Value> BaseLibrary::Or(Evaluator *evaluator,
                                         Arguments *args, bool *ok) {
    auto result = false;
    for (int i = 0; i < args->size(); ++i) {
        auto value = args->GetBoolean(i, CHECK_OK);
        result = result || value;
    }
    return evaluator->values()->NewBoolean(result);
}

/*static*/ Handle<Value> BaseLibrary::Not(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    auto value = args->GetBoolean(0, CHECK_OK);
    return evaluator->values()->NewBoolean(!value);
}

////////////////////////////////////////////////////////////////////////////////
/// Math
////////////////////////////////////////////////////////////////////////////////

// Square root of a negative number is on the i axis.
/*static*/ Handle<Value> BaseLibrary::Sqrt(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    auto n = args->GetNumber(0, CHECK_OK);
    auto x = n->float_value();
    if (x < 0) {
        return evaluator->values()->NewQuaternion({0, sqrt(-x), 0, 0});
    }
    return evaluator->values()->NewFloat(sqrt(x));
}

/*static*/ Handle<Value> BaseLibrary::Floor(Evaluator *evaluator,
                                            Arguments *args, bool *ok) {
    auto n = args->GetNumber(0, CHECK_OK);
    if (n->is_integral()) {
        return n;
    }
    return IntegralIfExact(evaluator->values(), floor(n->float_value()));
}

/*static*/ Handle<Value> BaseLibrary::Ceil(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    auto n = args->GetNumber(0, CHECK_OK);
    if (n->is_integral()) {
        return n;
    }
    return IntegralIfExact(evaluator->values(), ceil(n->float_value()));
}

/*static*/ Handle<Value> BaseLibrary::Pow(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    auto base = args->GetAnyNumber(0, CHECK_OK);
    auto exponent = args->GetAnyNumber(1, CHECK_OK);
    if (base->is_quaternion() || exponent->is_quaternion()) {
        return evaluator->values()->NewQuaternion(
                base->quaternion_value().Pow(exponent->quaternion_value()));
    }
    if (base->is_integral() && exponent->is_integral() &&
        exponent->int_value() >= 0) {
        rlisp_int_t result = 1;
        auto overflow = false;
        for (rlisp_int_t i = 0; i < exponent->int_value() && !overflow; ++i) {
            overflow = __builtin_mul_overflow(result, base->int_value(),
                                              &result);
        }
        if (!overflow) {
            return evaluator->values()->NewInt(result);
        }
    }
    return evaluator->values()->NewFloat(pow(base->float_value(),
                                             exponent->float_value()));
}

/*static*/ Handle<Value> BaseLibrary::Exp(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    auto n = args->GetAnyNumber(0, CHECK_OK);
    if (n->is_quaternion()) {
        return evaluator->values()->NewQuaternion(
                n->quaternion_value().Exp());
    }
    return evaluator->values()->NewFloat(exp(n->float_value()));
}

/*static*/ Handle<Value> BaseLibrary::Ln(Evaluator *evaluator,
                                         Arguments *args, bool *ok) {
    auto n = args->GetAnyNumber(0, CHECK_OK);
    if (n->is_quaternion()) {
        return evaluator->values()->NewQuaternion(
                n->quaternion_value().Ln());
    }
    return evaluator->values()->NewFloat(log(n->float_value()));
}

// (quat a b c d) => a + bi + cj + dk
/*static*/ Handle<Value> BaseLibrary::Quat(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    rlisp_float_t parts[4];
    for (int i = 0; i < 4; ++i) {
        auto n = args->GetNumber(i, CHECK_OK);
        parts[i] = n->float_value();
    }
    return evaluator->values()->NewQuaternion({parts[0], parts[1], parts[2],
                                               parts[3]});
}

/*static*/ Handle<Value> BaseLibrary::Sin(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    return UnaryMath(evaluator, args, [](rlisp_float_t x) { return sin(x); },
                     ok);
}

/*static*/ Handle<Value> BaseLibrary::Cos(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    return UnaryMath(evaluator, args, [](rlisp_float_t x) { return cos(x); },
                     ok);
}

/*static*/ Handle<Value> BaseLibrary::Tan(Evaluator *evaluator,
                                          Arguments *args, bool *ok) {
    return UnaryMath(evaluator, args, [](rlisp_float_t x) { return tan(x); },
                     ok);
}

/*static*/ Handle<Value> BaseLibrary::Asin(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    return UnaryMath(evaluator, args, [](rlisp_float_t x) { return asin(x); },
                     ok);
}

/*static*/ Handle<Value> BaseLibrary::Acos(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    return UnaryMath(evaluator, args, [](rlisp_float_t x) { return acos(x); },
                     ok);
}

/*static*/ Handle<Value> BaseLibrary::Atan(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    return UnaryMath(evaluator, args, [](rlisp_float_t x) { return atan(x); },
                     ok);
}

////////////////////////////////////////////////////////////////////////////////
/// Lists
////////////////////////////////////////////////////////////////////////////////

/*static*/ Handle<Value> BaseLibrary::Cons(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    auto list = args->GetList(1, CHECK_OK);
    return evaluator->values()->NewPair(args->Get(0), list);
}

/*static*/ Handle<Value> BaseLibrary::Head(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    auto list = args->GetList(0, CHECK_OK);
    if (list->IsNil()) {
        evaluator->ThrowError(ERR_HEAD_OF_EMPTY_LIST, "(head '())");
        *ok = false;
        return nullptr;
    }
    return list->AsPair()->car();
}

/*static*/ Handle<Value> BaseLibrary::Tail(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    auto list = args->GetList(0, CHECK_OK);
    if (list->IsNil()) {
        evaluator->ThrowError(ERR_TAIL_OF_EMPTY_LIST, "(tail '())");
        *ok = false;
        return nullptr;
    }
    return list->AsPair()->cdr();
}

/*static*/ Handle<Value> BaseLibrary::List(Evaluator *evaluator,
                                           Arguments *args, bool *) {
    return evaluator->values()->NewList(args->values());
}

/*static*/ Handle<Value> BaseLibrary::IsEmpty(Evaluator *evaluator,
                                              Arguments *args, bool *ok) {
    auto list = args->GetList(0, CHECK_OK);
    return evaluator->values()->NewBoolean(list->IsNil());
}

/*static*/ Handle<Value> BaseLibrary::Append(Evaluator *evaluator,
                                             Arguments *args, bool *ok) {
    ValueList elements;
    for (int i = 0; i < args->size(); ++i) {
        auto list = args->GetList(i, CHECK_OK);
        if (list->IsPair()) {
            list->AsPair()->ToVector(&elements);
        }
    }
    return evaluator->values()->NewList(elements);
}

/*static*/ Handle<Value> BaseLibrary::Length(Evaluator *evaluator,
                                             Arguments *args, bool *ok) {
    auto list = args->GetList(0, CHECK_OK);
    return evaluator->values()->NewInt(list->IsNil() ? 0
                                       : list->AsPair()->Length());
}

////////////////////////////////////////////////////////////////////////////////
/// I/O
////////////////////////////////////////////////////////////////////////////////

/*static*/ Handle<Value> BaseLibrary::Display(Evaluator *evaluator,
                                              Arguments *args, bool *ok) {
    auto output = DCHECK_NOTNULL(evaluator->output());
    for (const auto &arg : args->values()) {
        output->Write(arg->ToDisplayString());
    }
    return Flush(evaluator, ok);
}

/*static*/ Handle<Value> BaseLibrary::DisplayDebug(Evaluator *evaluator,
                                                   Arguments *args,
                                                   bool *ok) {
    auto output = DCHECK_NOTNULL(evaluator->output());
    for (const auto &arg : args->values()) {
        output->Write(arg->ToString());
    }
    return Flush(evaluator, ok);
}

/*static*/ Handle<Value> BaseLibrary::Newline(Evaluator *evaluator,
                                              Arguments *, bool *ok) {
    DCHECK_NOTNULL(evaluator->output())->Write("\n", 1);
    return Flush(evaluator, ok);
}

/*static*/ Handle<Value> BaseLibrary::ReadLine(Evaluator *evaluator,
                                               Arguments *, bool *ok) {
    auto input = evaluator->input();
    if (!input) {
        evaluator->ThrowError(ERR_READ_STDIN, "no input");
        *ok = false;
        return nullptr;
    }

    std::string line;
    if (!input->ReadLine(&line) || !input->error().empty()) {
        evaluator->ThrowError(ERR_READ_STDIN, "%s: %s", input->file_name(),
                              input->error().empty() ? "end of input"
                                                     : input->error().c_str());
        *ok = false;
        return nullptr;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return evaluator->values()->NewString(line);
}

/*static*/ Handle<Value> BaseLibrary::ReadFile(Evaluator *evaluator,
                                               Arguments *args, bool *ok) {
    auto name = args->GetString(0, CHECK_OK);
    auto factory = evaluator->text_streams();
    if (!factory) {
        evaluator->ThrowError(ERR_READ_FILE, "%s: no source",
                              name->data().c_str());
        *ok = false;
        return nullptr;
    }

    std::unique_ptr<TextInputStream> input(
            factory->GetInputStream(name->data()));
    std::string buf;
    if (input->error().empty()) {
        for (auto ch = input->ReadOne(); ch >= 0; ch = input->ReadOne()) {
            buf.push_back(static_cast<char>(ch));
        }
    }
    if (!input->error().empty()) {
        evaluator->ThrowError(ERR_READ_FILE, "%s: %s", name->data().c_str(),
                              input->error().c_str());
        *ok = false;
        return nullptr;
    }
    return evaluator->values()->NewString(buf);
}

////////////////////////////////////////////////////////////////////////////////
/// Reflection
////////////////////////////////////////////////////////////////////////////////

/*static*/ Handle<Value> BaseLibrary::Eval(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    return evaluator->EvalForm(args->Get(0), args->env(), ok);
}

/*static*/ Handle<Value> BaseLibrary::Parse(Evaluator *evaluator,
                                            Arguments *args, bool *ok) {
    auto source = args->GetString(0, CHECK_OK);
    auto values = evaluator->values();

    Parser parser(values, evaluator->text_streams());
    parser.SwitchInputStream(new FixedMemoryInputStream(source->data()), true);
    if (parser.AtEnd()) {
        // Nothing to parse: '()
        ValueList elements;
        elements.push_back(values->NewSymbol("quote"));
        elements.push_back(values->nil());
        return values->NewList(elements);
    }

    bool parsed = true;
    auto form = parser.ParseForm(&parsed);
    if (!parsed) {
        auto error = parser.last_error();
        evaluator->ThrowError(error.code, "%s", error.ToString().c_str());
        *ok = false;
        return nullptr;
    }
    return form;
}

/*static*/ Handle<Value> BaseLibrary::TypeOf(Evaluator *evaluator,
                                             Arguments *args, bool *) {
    return evaluator->values()->NewSymbol(TypeName(args->Get(0).get()));
}

/*static*/ Handle<Value> BaseLibrary::CheckType(Evaluator *evaluator,
                                                Arguments *args, bool *ok) {
    auto value = args->Get(0);
    auto spec = args->Get(1);
    if (!MatchType(evaluator, value.get(), spec.get())) {
        evaluator->ThrowError(ERR_SIGNATURE_MISMATCH, "expected `%s', found "
                              "`%s'", spec->ToDisplayString().c_str(),
                              TypeName(value.get()).c_str());
        *ok = false;
        return nullptr;
    }
    return value;
}

/*static*/ Handle<Value> BaseLibrary::Format(Evaluator *evaluator,
                                             Arguments *args, bool *) {
    std::string buf;
    for (const auto &arg : args->values()) {
        arg->PrintTo(&buf, false);
    }
    return evaluator->values()->NewString(buf);
}

/*static*/ Handle<Value> BaseLibrary::SymbolToString(Evaluator *evaluator,
                                                     Arguments *args,
                                                     bool *ok) {
    auto symbol = args->GetSymbol(0, CHECK_OK);
    return evaluator->values()->NewString(symbol->name());
}

////////////////////////////////////////////////////////////////////////////////
/// Errors
////////////////////////////////////////////////////////////////////////////////

// (make-error code [description [payload]])
/*static*/ Handle<Value> BaseLibrary::MakeError(Evaluator *evaluator,
                                                Arguments *args, bool *ok) {
    CheckArgumentsRange(evaluator, args, 1, 3, CHECK_OK);
    auto code = args->GetNumber(0, CHECK_OK);
    if (!code->IsIntegralValue() || !IsValidErrorCode(code->int_value())) {
        evaluator->ThrowError(ERR_SIGNATURE_MISMATCH, "error code must be in "
                              "1-%d, found %s", kMaxErrorCode,
                              code->ToString().c_str());
        *ok = false;
        return nullptr;
    }

    auto values = evaluator->values();
    auto int_code = static_cast<int>(code->int_value());
    if (args->size() < 2) {
        return values->NewError(int_code, values->nil());
    }
    auto description = args->GetString(1, CHECK_OK);
    return values->NewError(int_code, description->data(),
                            args->size() < 3 ? Handle<Value>() : args->Get(2));
}

/*static*/ Handle<Value> BaseLibrary::ErrorCode(Evaluator *evaluator,
                                                Arguments *args, bool *ok) {
    auto error = args->GetError(0, CHECK_OK);
    return evaluator->values()->NewInt(error->code());
}

/*static*/ Handle<Value> BaseLibrary::ErrorDescription(Evaluator *evaluator,
                                                       Arguments *args,
                                                       bool *ok) {
    auto error = args->GetError(0, CHECK_OK);
    return evaluator->values()->NewString(error->description());
}

/*static*/ Handle<Value> BaseLibrary::ErrorPayload(Evaluator *evaluator,
                                                   Arguments *args,
                                                   bool *ok) {
    auto error = args->GetError(0, CHECK_OK);
    if (!error->has_payload()) {
        return evaluator->values()->nil();
    }
    return error->payload();
}

/*static*/ Handle<Value> BaseLibrary::IsError(Evaluator *evaluator,
                                              Arguments *args, bool *) {
    return evaluator->values()->NewBoolean(args->Get(0)->IsErrorValue());
}

/*static*/ Handle<Value> BaseLibrary::Raise(Evaluator *evaluator,
                                            Arguments *args, bool *ok) {
    auto error = args->GetError(0, CHECK_OK);
    evaluator->Raise(error);
    *ok = false;
    return nullptr;
}

/*static*/ Handle<Value> BaseLibrary::PrintError(Evaluator *evaluator,
                                                 Arguments *args, bool *ok) {
    auto error = args->GetError(0, CHECK_OK);
    WriteError(DCHECK_NOTNULL(evaluator->output()), error.get());
    return Flush(evaluator, ok);
}

// (exit [code])
/*static*/ Handle<Value> BaseLibrary::Exit(Evaluator *evaluator,
                                           Arguments *args, bool *ok) {
    CheckArgumentsRange(evaluator, args, 0, 1, CHECK_OK);
    auto code = 0;
    if (args->size() == 1) {
        auto n = args->GetNumber(0, CHECK_OK);
        code = static_cast<int>(n->int_value());
    }
    VLOG(1) << "exit: " << code;
    evaluator->set_exit_code(code);
    evaluator->set_should_exit(true);
    return evaluator->values()->nil();
}

} // namespace rlisp
