#ifndef RLISP_VALUES_H_
#define RLISP_VALUES_H_

#include "handles.h"
#include "quaternion.h"
#include "base.h"
#include <string>
#include <vector>

namespace rlisp {

#define DEFINE_VALUE_KINDS(M) \
    M(Nil,            "nil")      \
    M(Boolean,        "bool")     \
    M(Number,         "number")   \
    M(String,         "string")   \
    M(Symbol,         "symbol")   \
    M(Pair,           "list")     \
    M(Closure,        "function") \
    M(Macro,          "macro")    \
    M(StructType,     "struct")   \
    M(StructInstance, "object")   \
    M(Builtin,        "function") \
    M(ErrorValue,     "error")

#define DECLARE_VALUE_KIND(name)                          \
    friend class ValueFactory;                            \
    virtual Value::Kind kind() const override             \
        { return Value::k##name; }                        \
    virtual void PrintTo(std::string *buf,                \
                         bool readable) const override;

class Value;
    class Nil;
    class Boolean;
    class Number;
    class String;
    class Symbol;
    class Pair;
    class Closure;
    class Macro;
    class StructType;
    class StructInstance;
    class Builtin;
    class ErrorValue;

class Environment;
class Evaluator;
class Arguments;
class ValueFactory;

typedef std::vector<Handle<Value>> ValueList;

/**
 * Both parsed terms and evaluation results.
 *
 * Lists are right-nested `Pair's terminated by `Nil'.
 */
class Value : public HeapObject {
public:
#define Value_Kind_ENUM(name, type_name) k##name,
    enum Kind {
        DEFINE_VALUE_KINDS(Value_Kind_ENUM)
        kMaxKinds,
    };
#undef Value_Kind_ENUM

    Value() = default;

    virtual Kind kind() const = 0;

    /**
     * `readable' prints strings quoted and escaped, otherwise raw.
     */
    virtual void PrintTo(std::string *buf, bool readable) const = 0;

    std::string ToString() const {
        std::string buf;
        PrintTo(&buf, true);
        return buf;
    }

    std::string ToDisplayString() const {
        std::string buf;
        PrintTo(&buf, false);
        return buf;
    }

    const char *type_name() const { return KindName(kind()); }

    static const char *KindName(Kind kind);

    bool IsList() const;

    bool IsCallable() const { return IsClosure() || IsBuiltin(); }

#define Value_TYPE_ASSERT(name, type_name)                \
    bool Is##name() const { return kind() == k##name; }   \
    inline name *As##name();                              \
    inline const name *As##name() const;
    DEFINE_VALUE_KINDS(Value_TYPE_ASSERT)
#undef Value_TYPE_ASSERT

    DISALLOW_IMPLICIT_CONSTRUCTORS(Value)
}; // class Value


class Nil : public Value {
public:
    DECLARE_VALUE_KIND(Nil)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Nil)
private:
    Nil() = default;
}; // class Nil


class Boolean : public Value {
public:
    DEF_GETTER(bool, value)

    DECLARE_VALUE_KIND(Boolean)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Boolean)
private:
    explicit Boolean(bool value) : value_(value) {}

    bool value_;
}; // class Boolean


/**
 * Integer, float or quaternion. A quaternion always has a non-zero vector
 * part, `ValueFactory::NewQuaternion' folds the others to floats.
 */
class Number : public Value {
public:
    DEF_GETTER(bool, is_integral)
    DEF_GETTER(bool, is_quaternion)

    bool is_real() const { return !is_quaternion_; }

    rlisp_int_t int_value() const {
        return is_integral_ ? int_value_
                            : static_cast<rlisp_int_t>(float_value_);
    }

    // Real part of a quaternion.
    rlisp_float_t float_value() const {
        return is_integral_ ? static_cast<rlisp_float_t>(int_value_)
                            : float_value_;
    }

    Quaternion quaternion_value() const {
        return is_quaternion_ ? quaternion_
                              : Quaternion::FromReal(float_value());
    }

    bool IsIntegralValue() const;

    bool Equals(const Number *other) const;

    DECLARE_VALUE_KIND(Number)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Number)
private:
    explicit Number(rlisp_int_t value)
        : is_integral_(true)
        , is_quaternion_(false)
        , int_value_(value)
        , float_value_(0)
        , quaternion_(Quaternion::FromReal(0)) {}

    explicit Number(rlisp_float_t value)
        : is_integral_(false)
        , is_quaternion_(false)
        , int_value_(0)
        , float_value_(value)
        , quaternion_(Quaternion::FromReal(0)) {}

    explicit Number(const Quaternion &value)
        : is_integral_(false)
        , is_quaternion_(true)
        , int_value_(0)
        , float_value_(value.a)
        , quaternion_(value) {}

    bool is_integral_;
    bool is_quaternion_;
    rlisp_int_t int_value_;
    rlisp_float_t float_value_;
    Quaternion quaternion_;
}; // class Number


class String : public Value {
public:
    DEF_GETTER(std::string, data)

    DECLARE_VALUE_KIND(String)
    DISALLOW_IMPLICIT_CONSTRUCTORS(String)
private:
    explicit String(const std::string &data) : data_(data) {}

    std::string data_;
}; // class String


/**
 * Symbols are interned by `ValueFactory', compare them by address.
 */
class Symbol : public Value {
public:
    DEF_GETTER(std::string, name)

    DECLARE_VALUE_KIND(Symbol)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Symbol)
private:
    explicit Symbol(const std::string &name) : name_(name) {}

    std::string name_;
}; // class Symbol


class Pair : public Value {
public:
    DEF_PROP_RW(Handle<Value>, car)
    DEF_PROP_RW(Handle<Value>, cdr)

    /**
     * Elements of a proper list, returns false for an improper one.
     */
    bool ToVector(ValueList *elements) const;

    int Length() const;

    DECLARE_VALUE_KIND(Pair)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Pair)
private:
    Pair(Handle<Value> car, Handle<Value> cdr)
        : car_(car)
        , cdr_(cdr) {}

    Handle<Value> car_;
    Handle<Value> cdr_;
}; // class Pair


class Closure : public Value {
public:
    DEF_GETTER(std::string, name)
    DEF_GETTER(std::vector<Handle<Symbol>>, params)
    DEF_GETTER(Handle<Value>, body)
    DEF_GETTER(Handle<Environment>, env)

    void set_name(const std::string &name) { name_ = name; }

    int arity() const { return static_cast<int>(params_.size()); }

    virtual ~Closure() override;

    DECLARE_VALUE_KIND(Closure)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Closure)
private:
    Closure(const std::vector<Handle<Symbol>> &params, Handle<Value> body,
            Handle<Environment> env);

    std::string name_;
    std::vector<Handle<Symbol>> params_;
    Handle<Value> body_;
    Handle<Environment> env_;
}; // class Closure


class Macro : public Value {
public:
    enum Transformer {
        // define-macro: body is evaluated with the call-site terms bound.
        TEMPLATE,
        // define-macro-rule: pattern names are substituted into template.
        RULE,
    };

    DEF_GETTER(Transformer, transformer)
    DEF_GETTER(std::string, name)
    DEF_GETTER(Handle<Value>, pattern)
    DEF_GETTER(Handle<Value>, body)
    DEF_GETTER(Handle<Environment>, env)

    virtual ~Macro() override;

    DECLARE_VALUE_KIND(Macro)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Macro)
private:
    Macro(Transformer transformer, const std::string &name,
          Handle<Value> pattern, Handle<Value> body, Handle<Environment> env);

    Transformer transformer_;
    std::string name_;
    Handle<Value> pattern_;
    Handle<Value> body_;
    Handle<Environment> env_;
}; // class Macro


class StructType : public Value {
public:
    DEF_GETTER(int, id)
    DEF_GETTER(std::string, name)
    DEF_GETTER(std::vector<std::string>, fields)

    int field_count() const { return static_cast<int>(fields_.size()); }

    /**
     * -1 if no such field.
     */
    int FindField(const std::string &field) const;

    DECLARE_VALUE_KIND(StructType)
    DISALLOW_IMPLICIT_CONSTRUCTORS(StructType)
private:
    StructType(int id, const std::string &name,
               const std::vector<std::string> &fields)
        : id_(id)
        , name_(name)
        , fields_(fields) {}

    int id_;
    std::string name_;
    std::vector<std::string> fields_;
}; // class StructType


class StructInstance : public Value {
public:
    DEF_GETTER(Handle<StructType>, type)
    DEF_GETTER(ValueList, values)

    Handle<Value> field(int index) const {
        DCHECK_GE(index, 0);
        DCHECK_LT(index, static_cast<int>(values_.size()));
        return values_[index];
    }

    DECLARE_VALUE_KIND(StructInstance)
    DISALLOW_IMPLICIT_CONSTRUCTORS(StructInstance)
private:
    StructInstance(Handle<StructType> type, const ValueList &values)
        : type_(type)
        , values_(values) {
        DCHECK_EQ(type_->field_count(), static_cast<int>(values_.size()));
    }

    Handle<StructType> type_;
    ValueList values_;
}; // class StructInstance


typedef Handle<Value> (*BuiltinFunction)(Evaluator *, Arguments *, bool *);

class Builtin : public Value {
public:
    static const int kVariadic = -1;

    DEF_GETTER(std::string, name)
    DEF_GETTER(int, arity)
    DEF_GETTER(Handle<StructType>, struct_type)
    DEF_GETTER(int, field_index)

    BuiltinFunction function() const { return function_; }

    /**
     * Struct generated builtins: constructor, predicate and accessors.
     */
    void BindStruct(Handle<StructType> struct_type, int field_index) {
        struct_type_ = struct_type;
        field_index_ = field_index;
    }

    DECLARE_VALUE_KIND(Builtin)
    DISALLOW_IMPLICIT_CONSTRUCTORS(Builtin)
private:
    Builtin(const std::string &name, BuiltinFunction function, int arity)
        : name_(name)
        , function_(DCHECK_NOTNULL(function))
        , arity_(arity) {}

    std::string name_;
    BuiltinFunction function_;
    int arity_;
    Handle<StructType> struct_type_;
    int field_index_ = -1;
}; // class Builtin


class ErrorValue : public Value {
public:
    DEF_GETTER(int, code)
    DEF_GETTER(std::string, description)
    DEF_GETTER(Handle<Value>, payload)

    bool has_payload() const { return payload_.valid() && !payload_->IsNil(); }

    /**
     * "error(004): arity mismatch"
     */
    std::string ToHeadline() const;

    DECLARE_VALUE_KIND(ErrorValue)
    DISALLOW_IMPLICIT_CONSTRUCTORS(ErrorValue)
private:
    ErrorValue(int code, const std::string &description, Handle<Value> payload)
        : code_(code)
        , description_(description)
        , payload_(payload) {}

    int code_;
    std::string description_;
    Handle<Value> payload_;
}; // class ErrorValue


#define Value_TYPE_CAST(name, type_name)                                   \
    inline name *Value::As##name() {                                       \
        return Is##name() ? static_cast<name *>(this) : nullptr;           \
    }                                                                      \
    inline const name *Value::As##name() const {                           \
        return Is##name() ? static_cast<const name *>(this) : nullptr;     \
    }
DEFINE_VALUE_KINDS(Value_TYPE_CAST)
#undef Value_TYPE_CAST

/**
 * Structural equality, numbers compare by value, symbols by identity.
 */
bool ValueEquals(const Value *lhs, const Value *rhs);

} // namespace rlisp

#endif // RLISP_VALUES_H_
