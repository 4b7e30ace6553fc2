#ifndef RLISP_STRUCT_REGISTRY_H_
#define RLISP_STRUCT_REGISTRY_H_

#include "values.h"
#include <unordered_map>
#include <string>
#include <vector>

namespace rlisp {

class Environment;
class ValueFactory;

/**
 * Append-only table of struct types with a fixed capacity.
 *
 * Defining `point [x y]' installs `make-point', `is-point?', `point-x' and
 * `point-y'. Redefining a name registers a new type, old instances keep the
 * old one.
 */
class StructRegistry {
public:
    StructRegistry(ValueFactory *values, int max_types);
    ~StructRegistry();

    DEF_GETTER(int, max_types)

    int size() const { return static_cast<int>(types_.size()); }

    bool is_full() const { return size() >= max_types_; }

    /**
     * Empty handle if the registry is full.
     */
    Handle<StructType> NewType(const std::string &name,
                               const std::vector<std::string> &fields);

    /**
     * The latest type defined with `name', empty handle if none.
     */
    Handle<StructType> FindType(const std::string &name) const;

    /**
     * `<name>-<anything>' for a registered struct `name'.
     */
    bool IsAccessorName(const std::string &name) const;

    void Install(Handle<StructType> type, Environment *env);

    static Handle<Value> Construct(Evaluator *evaluator, Arguments *args,
                                  bool *ok);
    static Handle<Value> Predicate(Evaluator *evaluator, Arguments *args,
                                  bool *ok);
    static Handle<Value> Access(Evaluator *evaluator, Arguments *args,
                               bool *ok);

    DISALLOW_IMPLICIT_CONSTRUCTORS(StructRegistry)
private:
    ValueFactory *values_;
    int max_types_;
    std::vector<Handle<StructType>> types_;
    std::unordered_map<std::string, int> names_;
}; // class StructRegistry

} // namespace rlisp

#endif // RLISP_STRUCT_REGISTRY_H_
