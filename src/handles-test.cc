#include "handles.h"
#include "gtest/gtest.h"

namespace rlisp {

namespace {

class Counted : public HeapObject {
public:
    explicit Counted(int *alive) : alive_(alive) { ++*alive_; }
    virtual ~Counted() override { --*alive_; }

private:
    int *alive_;
};

class DerivedCounted : public Counted {
public:
    explicit DerivedCounted(int *alive) : Counted(alive) {}
};

} // namespace

TEST(HandlesTest, GrabAndDrop) {
    int alive = 0;
    {
        auto handle = make_handle(new Counted(&alive));
        ASSERT_EQ(1, alive);
        ASSERT_EQ(1, handle->handle_count());

        Handle<Counted> other(handle);
        ASSERT_EQ(2, handle->handle_count());
    }
    ASSERT_EQ(0, alive);
}

TEST(HandlesTest, Assignment) {
    int alive = 0;
    Handle<Counted> a(new Counted(&alive));
    Handle<Counted> b(new Counted(&alive));
    ASSERT_EQ(2, alive);

    a = b;
    ASSERT_EQ(1, alive);
    ASSERT_EQ(2, b->handle_count());

    a = a;
    ASSERT_EQ(2, a->handle_count());

    a = nullptr;
    b = nullptr;
    ASSERT_EQ(0, alive);
}

TEST(HandlesTest, MoveAndUpcast) {
    int alive = 0;
    Handle<DerivedCounted> derived(new DerivedCounted(&alive));
    Handle<Counted> base(derived);
    ASSERT_EQ(2, base->handle_count());

    Handle<Counted> moved(std::move(base));
    ASSERT_TRUE(base.empty());
    ASSERT_EQ(2, moved->handle_count());

    derived = Handle<DerivedCounted>();
    ASSERT_EQ(1, alive);
    moved = Handle<Counted>();
    ASSERT_EQ(0, alive);
}

TEST(HandlesTest, NewObjectOwnedByOld) {
    int alive = 0;

    struct Node : public HeapObject {
        explicit Node(int *n) : count(n) { ++*count; }
        virtual ~Node() override { --*count; }
        int *count;
        Handle<Node> next;
    };

    Handle<Node> head(new Node(&alive));
    head->next = new Node(&alive);
    ASSERT_EQ(2, alive);

    // The next node is only owned by head.
    head = head->next;
    ASSERT_EQ(1, alive);
    head = nullptr;
    ASSERT_EQ(0, alive);
}

} // namespace rlisp
