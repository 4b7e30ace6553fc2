#include "value-factory.h"
#include "environment.h"
#include "error-codes.h"

namespace rlisp {

ValueFactory::ValueFactory()
    : nil_(new Nil())
    , true_(new Boolean(true))
    , false_(new Boolean(false)) {
}

ValueFactory::~ValueFactory() {
}

Handle<Number> ValueFactory::NewInt(rlisp_int_t value) {
    return make_handle(new Number(value));
}

Handle<Number> ValueFactory::NewFloat(rlisp_float_t value) {
    return make_handle(new Number(value));
}

Handle<Number> ValueFactory::NewQuaternion(const Quaternion &value) {
    if (value.IsReal()) {
        return NewFloat(value.a);
    }
    return make_handle(new Number(value));
}

Handle<String> ValueFactory::NewString(const std::string &data) {
    return make_handle(new String(data));
}

Handle<Symbol> ValueFactory::NewSymbol(const std::string &name) {
    auto iter = symbols_.find(name);
    if (iter != symbols_.end()) {
        return iter->second;
    }
    auto symbol = make_handle(new Symbol(name));
    symbols_.emplace(name, symbol);
    return symbol;
}

Handle<Pair> ValueFactory::NewPair(Handle<Value> car, Handle<Value> cdr) {
    DCHECK(car.valid());
    DCHECK(cdr.valid());
    return make_handle(new Pair(car, cdr));
}

Handle<Value> ValueFactory::NewList(const ValueList &elements, size_t start) {
    Handle<Value> list(nil_);
    for (size_t i = elements.size(); i > start; --i) {
        list = NewPair(elements[i - 1], list);
    }
    return list;
}

Handle<Closure>
ValueFactory::NewClosure(const std::vector<Handle<Symbol>> &params,
                         Handle<Value> body, Handle<Environment> env) {
    return make_handle(new Closure(params, body, env));
}

Handle<Macro> ValueFactory::NewMacro(Macro::Transformer transformer,
                                     const std::string &name,
                                     Handle<Value> pattern, Handle<Value> body,
                                     Handle<Environment> env) {
    return make_handle(new Macro(transformer, name, pattern, body, env));
}

Handle<StructType>
ValueFactory::NewStructType(int id, const std::string &name,
                            const std::vector<std::string> &fields) {
    return make_handle(new StructType(id, name, fields));
}

Handle<StructInstance>
ValueFactory::NewStructInstance(Handle<StructType> type,
                                const ValueList &values) {
    return make_handle(new StructInstance(type, values));
}

Handle<Builtin> ValueFactory::NewBuiltin(const std::string &name,
                                         BuiltinFunction function, int arity) {
    return make_handle(new Builtin(name, function, arity));
}

Handle<ErrorValue> ValueFactory::NewError(int code, Handle<Value> payload) {
    auto description = ErrorCodeDescription(code);
    DCHECK(description) << "bad error code: " << code;
    return NewError(code, description ? description : "", payload);
}

Handle<ErrorValue> ValueFactory::NewError(int code,
                                          const std::string &description,
                                          Handle<Value> payload) {
    if (payload.empty()) {
        payload = nil_;
    }
    return make_handle(new ErrorValue(code, description, payload));
}

} // namespace rlisp
