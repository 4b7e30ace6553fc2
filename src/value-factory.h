#ifndef RLISP_VALUE_FACTORY_H_
#define RLISP_VALUE_FACTORY_H_

#include "values.h"
#include <unordered_map>

namespace rlisp {

/**
 * Creates all values, `nil', `true' and `false' are shared and symbols are
 * interned.
 */
class ValueFactory {
public:
    ValueFactory();
    ~ValueFactory();

    Handle<Nil> nil() const { return nil_; }
    Handle<Boolean> true_value() const { return true_; }
    Handle<Boolean> false_value() const { return false_; }

    Handle<Boolean> NewBoolean(bool value) const {
        return value ? true_ : false_;
    }

    Handle<Number> NewInt(rlisp_int_t value);

    Handle<Number> NewFloat(rlisp_float_t value);

    /**
     * A float if the vector part is zero.
     */
    Handle<Number> NewQuaternion(const Quaternion &value);

    Handle<String> NewString(const std::string &data);

    Handle<Symbol> NewSymbol(const std::string &name);

    Handle<Pair> NewPair(Handle<Value> car, Handle<Value> cdr);

    /**
     * Proper list of `elements' from `start', `nil' if none.
     */
    Handle<Value> NewList(const ValueList &elements, size_t start = 0);

    Handle<Closure> NewClosure(const std::vector<Handle<Symbol>> &params,
                               Handle<Value> body, Handle<Environment> env);

    Handle<Macro> NewMacro(Macro::Transformer transformer,
                           const std::string &name, Handle<Value> pattern,
                           Handle<Value> body, Handle<Environment> env);

    Handle<StructType> NewStructType(int id, const std::string &name,
                                     const std::vector<std::string> &fields);

    Handle<StructInstance> NewStructInstance(Handle<StructType> type,
                                             const ValueList &values);

    Handle<Builtin> NewBuiltin(const std::string &name,
                               BuiltinFunction function, int arity);

    /**
     * Description comes from the error catalog.
     */
    Handle<ErrorValue> NewError(int code, Handle<Value> payload);

    Handle<ErrorValue> NewError(int code, const std::string &description,
                                Handle<Value> payload);

    int symbols_size() const { return static_cast<int>(symbols_.size()); }

    DISALLOW_IMPLICIT_CONSTRUCTORS(ValueFactory)
private:
    Handle<Nil> nil_;
    Handle<Boolean> true_;
    Handle<Boolean> false_;
    std::unordered_map<std::string, Handle<Symbol>> symbols_;
}; // class ValueFactory

} // namespace rlisp

#endif // RLISP_VALUE_FACTORY_H_
