#include "struct-registry.h"
#include "evaluator.h"
#include "environment.h"
#include "value-factory.h"
#include "error-codes.h"
#include "glog/logging.h"

namespace rlisp {

StructRegistry::StructRegistry(ValueFactory *values, int max_types)
    : values_(DCHECK_NOTNULL(values))
    , max_types_(max_types) {
    DCHECK_GT(max_types_, 0);
}

StructRegistry::~StructRegistry() {
}

Handle<StructType>
StructRegistry::NewType(const std::string &name,
                        const std::vector<std::string> &fields) {
    if (is_full()) {
        LOG(WARNING) << "struct registry is full, can not define: " << name;
        return Handle<StructType>();
    }

    auto id = size();
    auto type = values_->NewStructType(id, name, fields);
    types_.push_back(type);
    names_[name] = id;
    VLOG(1) << "define struct: " << name << " id: " << id;
    return type;
}

Handle<StructType> StructRegistry::FindType(const std::string &name) const {
    auto iter = names_.find(name);
    return iter == names_.end() ? Handle<StructType>() : types_[iter->second];
}

bool StructRegistry::IsAccessorName(const std::string &name) const {
    auto pos = name.find('-');
    while (pos != std::string::npos) {
        if (pos + 1 < name.size() &&
            names_.find(name.substr(0, pos)) != names_.end()) {
            return true;
        }
        pos = name.find('-', pos + 1);
    }
    return false;
}

void StructRegistry::Install(Handle<StructType> type, Environment *env) {
    auto constructor = values_->NewBuiltin("make-" + type->name(),
                                           &StructRegistry::Construct,
                                           type->field_count());
    constructor->BindStruct(type, -1);
    env->Put(constructor->name(), constructor);

    auto predicate = values_->NewBuiltin("is-" + type->name() + "?",
                                         &StructRegistry::Predicate, 1);
    predicate->BindStruct(type, -1);
    env->Put(predicate->name(), predicate);

    for (int i = 0; i < type->field_count(); ++i) {
        auto accessor = values_->NewBuiltin(type->name() + "-" +
                                            type->fields()[i],
                                            &StructRegistry::Access, 1);
        accessor->BindStruct(type, i);
        env->Put(accessor->name(), accessor);
    }
}

/*static*/ Handle<Value> StructRegistry::Construct(Evaluator *evaluator,
                                                   Arguments *args,
                                                   bool *) {
    auto type = args->self()->struct_type();
    return evaluator->values()->NewStructInstance(type, args->values());
}

/*static*/ Handle<Value> StructRegistry::Predicate(Evaluator *evaluator,
                                                   Arguments *args,
                                                   bool *) {
    auto type = args->self()->struct_type();
    auto arg = args->Get(0);
    auto matched = arg->IsStructInstance() &&
                   arg->AsStructInstance()->type()->id() == type->id();
    return evaluator->values()->NewBoolean(matched);
}

/*static*/ Handle<Value> StructRegistry::Access(Evaluator *evaluator,
                                                Arguments *args,
                                                bool *ok) {
    auto type = args->self()->struct_type();
    auto arg = args->Get(0);
    if (!arg->IsStructInstance()) {
        evaluator->ThrowError(ERR_SIGNATURE_MISMATCH, "`%s' expected `%s', "
                              "found `%s'", args->self()->name().c_str(),
                              type->name().c_str(), arg->type_name());
        *ok = false;
        return nullptr;
    }

    auto instance = arg->AsStructInstance();
    if (instance->type()->id() != type->id()) {
        evaluator->ThrowError(ERR_NO_SUCH_FIELD, "`%s' on `%s'",
                              args->self()->name().c_str(),
                              instance->type()->name().c_str());
        *ok = false;
        return nullptr;
    }
    return instance->field(args->self()->field_index());
}

} // namespace rlisp
