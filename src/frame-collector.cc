#include "frame-collector.h"
#include "environment.h"
#include "values.h"
#include "glog/logging.h"
#include <unordered_map>
#include <vector>

namespace rlisp {

namespace {

struct Node {
    int refs;
    bool is_frame;
    bool reachable;
};

void ScanChildren(const FrameCollector::Reference &ref,
                  FrameCollector::Callback callback) {
    if (ref.is_frame) {
        FrameCollector::ScanFrame(static_cast<Environment *>(ref.object),
                                  callback);
    } else {
        FrameCollector::ScanValue(static_cast<Value *>(ref.object), callback);
    }
}

} // namespace

FrameCollector::~FrameCollector() {
    for (auto frame : frames_) {
        frame->collector_ = nullptr;
    }
}

void FrameCollector::Track(Environment *frame) {
    frames_.insert(DCHECK_NOTNULL(frame));
}

void FrameCollector::Untrack(Environment *frame) {
    frames_.erase(frame);
}

int FrameCollector::Collect() {
    if (collecting_) {
        return 0;
    }
    collecting_ = true;

    // Every object reachable from a tracked frame.
    std::unordered_map<HeapObject *, Node> nodes;
    std::vector<Reference> pending;
    for (auto frame : frames_) {
        nodes.emplace(frame, Node{frame->handle_count(), true, false});
        pending.push_back({frame, true});
    }
    while (!pending.empty()) {
        auto ref = pending.back();
        pending.pop_back();
        ScanChildren(ref, [&](const Reference &child) {
            if (nodes.find(child.object) == nodes.end()) {
                nodes.emplace(child.object,
                              Node{child.object->handle_count(),
                                   child.is_frame, false});
                pending.push_back(child);
            }
        });
    }

    // Handles held inside the graph.
    for (const auto &pair : nodes) {
        ScanChildren({pair.first, pair.second.is_frame},
                     [&nodes](const Reference &child) {
            nodes[child.object].refs--;
        });
    }

    // Objects still grabbed from outside keep their subgraph alive.
    for (auto &pair : nodes) {
        if (pair.second.refs > 0) {
            pair.second.reachable = true;
            pending.push_back({pair.first, pair.second.is_frame});
        }
    }
    while (!pending.empty()) {
        auto ref = pending.back();
        pending.pop_back();
        ScanChildren(ref, [&](const Reference &child) {
            auto &node = nodes[child.object];
            if (!node.reachable) {
                node.reachable = true;
                pending.push_back(child);
            }
        });
    }

    // Hold the garbage while clearing, so no frame dies half cleared.
    std::vector<Handle<Environment>> garbage;
    for (auto frame : frames_) {
        if (!nodes[frame].reachable) {
            garbage.push_back(make_handle(frame));
        }
    }
    for (const auto &frame : garbage) {
        frame->Clear();
    }
    auto released = static_cast<int>(garbage.size());
    garbage.clear();

    VLOG(1) << "collect frames: " << released << " released, "
            << frames_.size() << " tracked";
    collecting_ = false;
    return released;
}

/*static*/ void FrameCollector::ScanFrame(const Environment *frame,
                                          Callback callback) {
    if (frame->parent().valid()) {
        callback({frame->parent().get(), true});
    }
    for (const auto &pair : frame->bindings()) {
        callback({pair.second.get(), false});
    }
}

/*static*/ void FrameCollector::ScanValue(const Value *value,
                                          Callback callback) {
    switch (value->kind()) {
        case Value::kPair: {
            auto pair = value->AsPair();
            if (pair->car().valid()) {
                callback({pair->car().get(), false});
            }
            if (pair->cdr().valid()) {
                callback({pair->cdr().get(), false});
            }
        } break;

        case Value::kClosure: {
            auto closure = value->AsClosure();
            for (const auto &param : closure->params()) {
                callback({param.get(), false});
            }
            if (closure->body().valid()) {
                callback({closure->body().get(), false});
            }
            if (closure->env().valid()) {
                callback({closure->env().get(), true});
            }
        } break;

        case Value::kMacro: {
            auto macro = value->AsMacro();
            if (macro->pattern().valid()) {
                callback({macro->pattern().get(), false});
            }
            if (macro->body().valid()) {
                callback({macro->body().get(), false});
            }
            if (macro->env().valid()) {
                callback({macro->env().get(), true});
            }
        } break;

        case Value::kStructInstance: {
            auto instance = value->AsStructInstance();
            callback({instance->type().get(), false});
            for (const auto &field : instance->values()) {
                callback({field.get(), false});
            }
        } break;

        case Value::kBuiltin: {
            auto builtin = value->AsBuiltin();
            if (builtin->struct_type().valid()) {
                callback({builtin->struct_type().get(), false});
            }
        } break;

        case Value::kErrorValue: {
            auto error = value->AsErrorValue();
            if (error->payload().valid()) {
                callback({error->payload().get(), false});
            }
        } break;

        default:
            break;
    }
}

} // namespace rlisp
