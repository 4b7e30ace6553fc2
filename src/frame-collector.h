#ifndef RLISP_FRAME_COLLECTOR_H_
#define RLISP_FRAME_COLLECTOR_H_

#include "base.h"
#include <functional>
#include <unordered_set>

namespace rlisp {

class HeapObject;
class Environment;
class Value;

/**
 * Frames and closures reference each other, so a frame that binds a closure
 * made in it is never released by reference counting alone.
 *
 * The collector tracks every frame created under one root frame. `Collect'
 * subtracts the references held inside the frame and value graph from each
 * object's handle count; objects still referenced from outside are roots,
 * tracked frames unreachable from them are cleared.
 */
class FrameCollector {
public:
    struct Reference {
        HeapObject *object;
        bool is_frame;
    };

    typedef std::function<void (const Reference &)> Callback;

    FrameCollector() = default;
    ~FrameCollector();

    int size() const { return static_cast<int>(frames_.size()); }

    void Track(Environment *frame);

    void Untrack(Environment *frame);

    /**
     * Returns the number of released frames.
     */
    int Collect();

    static void ScanFrame(const Environment *frame, Callback callback);

    static void ScanValue(const Value *value, Callback callback);

    DISALLOW_IMPLICIT_CONSTRUCTORS(FrameCollector)
private:
    std::unordered_set<Environment *> frames_;
    bool collecting_ = false;
}; // class FrameCollector

} // namespace rlisp

#endif // RLISP_FRAME_COLLECTOR_H_
