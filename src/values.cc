#include "values.h"
#include "environment.h"
#include <inttypes.h>
#include <math.h>
#include <stdio.h>
#include <string.h>

namespace rlisp {

namespace {

const char *kKindNames[] = {
#define Value_KIND_NAME(name, type_name) type_name,
    DEFINE_VALUE_KINDS(Value_KIND_NAME)
#undef Value_KIND_NAME
};

void PrintEscaped(const std::string &s, std::string *buf) {
    buf->append(1, '"');
    for (auto c : s) {
        switch (c) {
            case '"':  buf->append("\\\""); break;
            case '\\': buf->append("\\\\"); break;
            case '\n': buf->append("\\n");  break;
            case '\r': buf->append("\\r");  break;
            case '\t': buf->append("\\t");  break;
            default:   buf->append(1, c);   break;
        }
    }
    buf->append(1, '"');
}

// 'x `x ,x
const char *QuotePrefix(const Pair *pair) {
    if (!pair->car()->IsSymbol() || !pair->cdr()->IsPair()) {
        return nullptr;
    }
    auto rest = pair->cdr()->AsPair();
    if (!rest->cdr()->IsNil()) {
        return nullptr;
    }
    const auto &name = pair->car()->AsSymbol()->name();
    if (name == "quote") {
        return "'";
    } else if (name == "quasiquote") {
        return "`";
    } else if (name == "unquote") {
        return ",";
    }
    return nullptr;
}

} // namespace

/*static*/ const char *Value::KindName(Kind kind) {
    DCHECK_GE(kind, 0);
    DCHECK_LT(kind, kMaxKinds);
    return kKindNames[kind];
}

bool Value::IsList() const {
    auto node = this;
    while (node->IsPair()) {
        node = node->AsPair()->cdr().get();
    }
    return node->IsNil();
}

////////////////////////////////////////////////////////////////////////////////
/// Nil & Boolean
////////////////////////////////////////////////////////////////////////////////

/*virtual*/ void Nil::PrintTo(std::string *buf, bool /*readable*/) const {
    buf->append("()");
}

/*virtual*/ void Boolean::PrintTo(std::string *buf, bool /*readable*/) const {
    buf->append(value_ ? "true" : "false");
}

////////////////////////////////////////////////////////////////////////////////
/// Number
////////////////////////////////////////////////////////////////////////////////

bool Number::IsIntegralValue() const {
    if (is_integral_) {
        return true;
    }
    if (is_quaternion_) {
        return false;
    }
    return isfinite(float_value_) && floor(float_value_) == float_value_;
}

bool Number::Equals(const Number *other) const {
    if (is_integral_ && other->is_integral_) {
        return int_value_ == other->int_value_;
    }
    if (is_quaternion_ || other->is_quaternion_) {
        return quaternion_value().Equals(other->quaternion_value());
    }
    return float_value() == other->float_value();
}

/*virtual*/ void Number::PrintTo(std::string *buf, bool /*readable*/) const {
    if (is_quaternion_) {
        buf->append(quaternion_.ToString());
        return;
    }

    char tmp[64];
    if (is_integral_) {
        snprintf(tmp, arraysize(tmp), "%" PRId64, int_value_);
        buf->append(tmp);
        return;
    }

    snprintf(tmp, arraysize(tmp), "%.15g", float_value_);
    buf->append(tmp);
    if (isfinite(float_value_) && !strpbrk(tmp, ".e")) {
        buf->append(".0");
    }
}

////////////////////////////////////////////////////////////////////////////////
/// String & Symbol
////////////////////////////////////////////////////////////////////////////////

/*virtual*/ void String::PrintTo(std::string *buf, bool readable) const {
    if (readable) {
        PrintEscaped(data_, buf);
    } else {
        buf->append(data_);
    }
}

/*virtual*/ void Symbol::PrintTo(std::string *buf, bool /*readable*/) const {
    buf->append(name_);
}

////////////////////////////////////////////////////////////////////////////////
/// Pair
////////////////////////////////////////////////////////////////////////////////

bool Pair::ToVector(ValueList *elements) const {
    const Value *node = this;
    while (node->IsPair()) {
        auto pair = node->AsPair();
        elements->push_back(pair->car());
        node = pair->cdr().get();
    }
    return node->IsNil();
}

int Pair::Length() const {
    int n = 0;
    const Value *node = this;
    while (node->IsPair()) {
        ++n;
        node = node->AsPair()->cdr().get();
    }
    return n;
}

/*virtual*/ void Pair::PrintTo(std::string *buf, bool readable) const {
    auto prefix = QuotePrefix(this);
    if (prefix) {
        buf->append(prefix);
        cdr()->AsPair()->car()->PrintTo(buf, readable);
        return;
    }

    buf->append(1, '(');
    const Value *node = this;
    bool first = true;
    while (node->IsPair()) {
        if (!first) {
            buf->append(1, ' ');
        }
        first = false;
        node->AsPair()->car()->PrintTo(buf, readable);
        node = node->AsPair()->cdr().get();
    }
    if (!node->IsNil()) {
        buf->append(" . ");
        node->PrintTo(buf, readable);
    }
    buf->append(1, ')');
}

////////////////////////////////////////////////////////////////////////////////
/// Closure & Macro
////////////////////////////////////////////////////////////////////////////////

Closure::Closure(const std::vector<Handle<Symbol>> &params, Handle<Value> body,
                 Handle<Environment> env)
    : params_(params)
    , body_(body)
    , env_(env) {
}

/*virtual*/ Closure::~Closure() {
}

/*virtual*/ void Closure::PrintTo(std::string *buf, bool /*readable*/) const {
    buf->append("<procedure>");
}

Macro::Macro(Transformer transformer, const std::string &name,
             Handle<Value> pattern, Handle<Value> body, Handle<Environment> env)
    : transformer_(transformer)
    , name_(name)
    , pattern_(pattern)
    , body_(body)
    , env_(env) {
}

/*virtual*/ Macro::~Macro() {
}

/*virtual*/ void Macro::PrintTo(std::string *buf, bool /*readable*/) const {
    buf->append("<macro ").append(name_).append(">");
}

////////////////////////////////////////////////////////////////////////////////
/// Structs
////////////////////////////////////////////////////////////////////////////////

int StructType::FindField(const std::string &field) const {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i] == field) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

/*virtual*/ void StructType::PrintTo(std::string *buf, bool /*readable*/) const {
    buf->append("<struct ").append(name_).append(">");
}

/*virtual*/
void StructInstance::PrintTo(std::string *buf, bool readable) const {
    buf->append("(make-").append(type_->name());
    for (const auto &value : values_) {
        buf->append(1, ' ');
        value->PrintTo(buf, readable);
    }
    buf->append(1, ')');
}

////////////////////////////////////////////////////////////////////////////////
/// Builtin & ErrorValue
////////////////////////////////////////////////////////////////////////////////

/*virtual*/ void Builtin::PrintTo(std::string *buf, bool /*readable*/) const {
    buf->append("<procedure>");
}

std::string ErrorValue::ToHeadline() const {
    char tmp[32];
    snprintf(tmp, arraysize(tmp), "error(%03d): ", code_);
    return std::string(tmp) + description_;
}

/*virtual*/ void ErrorValue::PrintTo(std::string *buf, bool readable) const {
    buf->append(ToHeadline());
    if (has_payload()) {
        buf->append(" (");
        payload_->PrintTo(buf, readable);
        buf->append(1, ')');
    }
}

////////////////////////////////////////////////////////////////////////////////
/// Equality
////////////////////////////////////////////////////////////////////////////////

bool ValueEquals(const Value *lhs, const Value *rhs) {
    if (lhs == rhs) {
        return true;
    }
    if (lhs->kind() != rhs->kind()) {
        return false;
    }

    switch (lhs->kind()) {
        case Value::kNil:
            return true;
        case Value::kBoolean:
            return lhs->AsBoolean()->value() == rhs->AsBoolean()->value();
        case Value::kNumber:
            return lhs->AsNumber()->Equals(rhs->AsNumber());
        case Value::kString:
            return lhs->AsString()->data() == rhs->AsString()->data();
        case Value::kSymbol:
            // Symbols made out of the same factory are interned.
            return lhs->AsSymbol()->name() == rhs->AsSymbol()->name();
        case Value::kPair: {
            auto a = lhs, b = rhs;
            while (a->IsPair() && b->IsPair()) {
                if (!ValueEquals(a->AsPair()->car().get(),
                                 b->AsPair()->car().get())) {
                    return false;
                }
                a = a->AsPair()->cdr().get();
                b = b->AsPair()->cdr().get();
            }
            return ValueEquals(a, b);
        }
        case Value::kStructInstance: {
            auto a = lhs->AsStructInstance(), b = rhs->AsStructInstance();
            if (a->type().get() != b->type().get()) {
                return false;
            }
            for (int i = 0; i < a->type()->field_count(); ++i) {
                if (!ValueEquals(a->field(i).get(), b->field(i).get())) {
                    return false;
                }
            }
            return true;
        }
        case Value::kErrorValue:
            return lhs->AsErrorValue()->code() == rhs->AsErrorValue()->code() &&
                   lhs->AsErrorValue()->description() ==
                   rhs->AsErrorValue()->description();
        case Value::kClosure:
        case Value::kMacro:
        case Value::kStructType:
        case Value::kBuiltin:
            // Compare by identity only.
            return false;
        case Value::kMaxKinds:
            break;
    }
    DLOG(FATAL) << "not reached.";
    return false;
}

} // namespace rlisp
