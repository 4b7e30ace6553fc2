#ifndef RLISP_ENVIRONMENT_H_
#define RLISP_ENVIRONMENT_H_

#include "values.h"
#include <unordered_map>

namespace rlisp {

class FrameCollector;

/**
 * One frame of bindings. Frames are shared by closures, so they are
 * reference counted. A closure stored in its own frame is a cycle, the
 * `FrameCollector' of the root frame breaks it.
 */
class Environment : public HeapObject {
public:
    typedef std::unordered_map<std::string, Handle<Value>> BindingMap;

    /**
     * Inner frames are tracked by the collector of their parent.
     */
    explicit Environment(Handle<Environment> parent);
    Environment(Handle<Environment> parent, FrameCollector *collector);
    virtual ~Environment() override;

    FrameCollector *collector() const { return collector_; }

    DEF_GETTER(Handle<Environment>, parent)

    bool is_global() const { return parent_.empty(); }

    int size() const { return static_cast<int>(bindings_.size()); }

    /**
     * Walk outward, empty handle if no frame defines `name'.
     */
    Handle<Value> Lookup(const std::string &name) const;

    Handle<Value> LookupLocal(const std::string &name) const;

    /**
     * Bind in this frame only. Returns false for reserved identifiers.
     */
    bool Define(const std::string &name, Handle<Value> value);

    /**
     * Bind without the reserved check, for the session's own bindings
     * such as `_'.
     */
    void Put(const std::string &name, Handle<Value> value);

    /**
     * Mutate the frame that owns `name', false if no frame owns it.
     */
    bool Set(const std::string &name, Handle<Value> value);

    /**
     * Frame that owns `name' or `nullptr'.
     */
    Environment *FindOwner(const std::string &name);

    const BindingMap &bindings() const { return bindings_; }

    friend class FrameCollector;
    DISALLOW_IMPLICIT_CONSTRUCTORS(Environment)
private:
    void Clear();

    Handle<Environment> parent_;
    BindingMap bindings_;
    FrameCollector *collector_;
}; // class Environment

} // namespace rlisp

#endif // RLISP_ENVIRONMENT_H_
