#include "frame-collector.h"
#include "environment.h"
#include "value-factory.h"
#include "gtest/gtest.h"

namespace rlisp {

class FrameCollectorTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        values_ = new ValueFactory();
        collector_ = new FrameCollector();
        global_ = new Environment(Handle<Environment>(), collector_);
    }

    virtual void TearDown() override {
        global_ = Handle<Environment>();
        collector_->Collect();
        delete collector_;
        delete values_;
    }

    // (lambda [x] x) closed over `env'.
    Handle<Closure> NewIdentity(Handle<Environment> env) {
        std::vector<Handle<Symbol>> params;
        params.push_back(values_->NewSymbol("x"));
        return values_->NewClosure(params, values_->NewSymbol("x"), env);
    }

    ValueFactory *values_ = nullptr;
    FrameCollector *collector_ = nullptr;
    Handle<Environment> global_;
}; // class FrameCollectorTest

TEST_F(FrameCollectorTest, InnerFramesAreTracked) {
    EXPECT_EQ(collector_, global_->collector());
    EXPECT_EQ(1, collector_->size());

    {
        Handle<Environment> inner(new Environment(global_));
        EXPECT_EQ(collector_, inner->collector());
        EXPECT_EQ(2, collector_->size());
    }
    EXPECT_EQ(1, collector_->size());
}

TEST_F(FrameCollectorTest, ReleaseClosureCycle) {
    {
        Handle<Environment> frame(new Environment(global_));
        frame->Define("g", NewIdentity(frame));
        frame->Define("n", values_->NewInt(1));
    }
    // The frame and its closure hold each other.
    EXPECT_EQ(2, collector_->size());

    EXPECT_EQ(1, collector_->Collect());
    EXPECT_EQ(1, collector_->size());
    EXPECT_EQ(0, collector_->Collect());
}

TEST_F(FrameCollectorTest, ReleaseNestedFrames) {
    {
        Handle<Environment> outer(new Environment(global_));
        Handle<Environment> inner(new Environment(outer));
        outer->Define("f", NewIdentity(inner));
        inner->Define("l", values_->NewPair(NewIdentity(outer),
                                            values_->nil()));
    }
    EXPECT_EQ(3, collector_->size());
    EXPECT_EQ(2, collector_->Collect());
    EXPECT_EQ(1, collector_->size());
}

TEST_F(FrameCollectorTest, KeepFramesHeldOutside) {
    Handle<Value> escaped;
    {
        Handle<Environment> frame(new Environment(global_));
        frame->Define("n", values_->NewInt(42));
        auto closure = NewIdentity(frame);
        frame->Define("g", closure);
        escaped = closure;
    }
    EXPECT_EQ(0, collector_->Collect());
    EXPECT_EQ(2, collector_->size());

    auto env = escaped->AsClosure()->env();
    EXPECT_EQ(42, env->Lookup("n")->AsNumber()->int_value());
    EXPECT_EQ(escaped.get(), env->Lookup("g").get());

    env = Handle<Environment>();
    escaped = Handle<Value>();
    EXPECT_EQ(1, collector_->Collect());
}

TEST_F(FrameCollectorTest, KeepFramesReachableFromGlobal) {
    {
        Handle<Environment> frame(new Environment(global_));
        frame->Define("g", NewIdentity(frame));
        global_->Define("keep", frame->Lookup("g"));
    }
    EXPECT_EQ(0, collector_->Collect());
    EXPECT_EQ(2, collector_->size());

    global_->Define("keep", values_->nil());
    EXPECT_EQ(1, collector_->Collect());
}

TEST_F(FrameCollectorTest, ReleaseGlobalCycle) {
    global_->Define("f", NewIdentity(global_));
    Handle<Environment> inner(new Environment(global_));

    inner = Handle<Environment>();
    global_ = Handle<Environment>();
    EXPECT_EQ(1, collector_->size());
    EXPECT_EQ(1, collector_->Collect());
    EXPECT_EQ(0, collector_->size());
}

} // namespace rlisp
