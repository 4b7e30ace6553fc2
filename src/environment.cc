#include "environment.h"
#include "frame-collector.h"
#include "special-forms.h"

namespace rlisp {

Environment::Environment(Handle<Environment> parent)
    : Environment(parent, parent.empty() ? nullptr : parent->collector_) {
}

Environment::Environment(Handle<Environment> parent,
                         FrameCollector *collector)
    : parent_(parent)
    , collector_(collector) {
    if (collector_) {
        collector_->Track(this);
    }
}

/*virtual*/ Environment::~Environment() {
    if (collector_) {
        collector_->Untrack(this);
    }
}

void Environment::Clear() {
    BindingMap bindings;
    bindings.swap(bindings_);
    parent_ = Handle<Environment>();
}

Handle<Value> Environment::Lookup(const std::string &name) const {
    auto env = this;
    while (env) {
        auto iter = env->bindings_.find(name);
        if (iter != env->bindings_.end()) {
            return iter->second;
        }
        env = env->parent_.get();
    }
    return Handle<Value>();
}

Handle<Value> Environment::LookupLocal(const std::string &name) const {
    auto iter = bindings_.find(name);
    return iter == bindings_.end() ? Handle<Value>() : iter->second;
}

bool Environment::Define(const std::string &name, Handle<Value> value) {
    if (IsReservedIdentifier(name)) {
        return false;
    }
    Put(name, value);
    return true;
}

void Environment::Put(const std::string &name, Handle<Value> value) {
    DCHECK(value.valid()) << "bind empty value to: " << name;
    bindings_[name] = value;
}

bool Environment::Set(const std::string &name, Handle<Value> value) {
    auto owner = FindOwner(name);
    if (!owner) {
        return false;
    }
    owner->Put(name, value);
    return true;
}

Environment *Environment::FindOwner(const std::string &name) {
    auto env = this;
    while (env) {
        if (env->bindings_.find(name) != env->bindings_.end()) {
            return env;
        }
        env = env->parent_.get();
    }
    return nullptr;
}

} // namespace rlisp
