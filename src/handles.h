#ifndef RLISP_HANDLES_H_
#define RLISP_HANDLES_H_

#include "base.h"
#include "glog/logging.h"
#include <cstddef>

namespace rlisp {

/**
 * Intrusive reference counted object.
 *
 * Not thread safe: the counter is a plain integer, every handle of the same
 * object must live in one evaluation thread.
 */
class HeapObject {
public:
    HeapObject() = default;
    virtual ~HeapObject() = default;

    int handle_count() const { return handle_count_; }

    bool IsGrabbed() const { return handle_count_ > 0; }

    void Grab() { ++handle_count_; }

    void Drop() {
        DCHECK_GT(handle_count_, 0) << "drop a released object!";
        if (--handle_count_ == 0) {
            delete this;
        }
    }

    DISALLOW_IMPLICIT_CONSTRUCTORS(HeapObject)
private:
    int handle_count_ = 0;
}; // class HeapObject


template<class T>
class Handle {
public:
    Handle() : object_(nullptr) {}

    // For `return 0' in CHECK_OK.
    Handle(std::nullptr_t) : object_(nullptr) {}

    template<class U>
    explicit Handle(U *object) : object_(object) {
        if (object_) {
            object_->Grab();
        }
    }

    explicit Handle(T *object) : object_(object) {
        if (object_) {
            object_->Grab();
        }
    }

    template<class U>
    Handle(const Handle<U> &other) : object_(other.get()) {
        if (object_) {
            object_->Grab();
        }
    }

    Handle(const Handle<T> &other) : object_(other.object_) {
        if (object_) {
            object_->Grab();
        }
    }

    Handle(Handle &&other) : object_(other.object_) {
        other.object_ = nullptr;
    }

    ~Handle() {
        if (object_) {
            object_->Drop();
        }
    }

    T *get() const { return object_; }

    bool empty() const { return object_ == nullptr; }

    bool valid() const { return !empty(); }

    T *operator -> () const { return DCHECK_NOTNULL(object_); }

    Handle<T> &operator = (T *object) {
        Reset(object);
        return *this;
    }

    template<class U>
    Handle<T> &operator = (const Handle<U> &other) {
        Reset(other.get());
        return *this;
    }

    Handle<T> &operator = (const Handle<T> &other) {
        Reset(other.object_);
        return *this;
    }

    Handle<T> &operator = (Handle<T> &&other) {
        if (this != &other) {
            auto old = object_;
            object_ = other.object_;
            other.object_ = nullptr;
            if (old) {
                old->Drop();
            }
        }
        return *this;
    }

    bool operator == (const Handle<T> &other) const {
        return object_ == other.object_;
    }

    bool operator != (const Handle<T> &other) const {
        return object_ != other.object_;
    }

private:
    void Reset(T *object) {
        // grab first, the new object may be owned by the old one.
        if (object) {
            object->Grab();
        }
        auto old = object_;
        object_ = object;
        if (old) {
            old->Drop();
        }
    }

    T *object_;
}; // template<class T> class Handle


template<class T>
inline Handle<T> make_handle(T *ob) {
    return Handle<T>(ob);
}

} // namespace rlisp

#endif // RLISP_HANDLES_H_
