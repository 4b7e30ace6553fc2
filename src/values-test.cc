#include "values.h"
#include "value-factory.h"
#include "environment.h"
#include "error-codes.h"
#include "gtest/gtest.h"

namespace rlisp {

namespace {

Handle<Value> Nothing(Evaluator *, Arguments *, bool *) {
    return nullptr;
}

} // namespace

class ValuesTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        values_ = new ValueFactory();
    }

    virtual void TearDown() override {
        delete values_;
    }

    Handle<Value> List3(Handle<Value> a, Handle<Value> b, Handle<Value> c) {
        ValueList elements;
        elements.push_back(a);
        elements.push_back(b);
        elements.push_back(c);
        return values_->NewList(elements);
    }

    ValueFactory *values_ = nullptr;
}; // class ValuesTest

TEST_F(ValuesTest, Sanity) {
    EXPECT_TRUE(values_->nil()->IsNil());
    EXPECT_TRUE(values_->nil()->IsList());
    EXPECT_EQ(values_->true_value().get(), values_->NewBoolean(true).get());
    EXPECT_STREQ("nil", values_->nil()->type_name());
    EXPECT_STREQ("number", values_->NewInt(1)->type_name());
    EXPECT_STREQ("function", values_->NewBuiltin("f", &Nothing, 0)->type_name());
}

TEST_F(ValuesTest, NumberPrinting) {
    EXPECT_EQ("55", values_->NewInt(55)->ToString());
    EXPECT_EQ("-3", values_->NewInt(-3)->ToString());
    EXPECT_EQ("2.5", values_->NewFloat(2.5)->ToString());
    EXPECT_EQ("3.0", values_->NewFloat(3)->ToString());
    EXPECT_EQ("1e+21", values_->NewFloat(1e21)->ToString());
}

TEST_F(ValuesTest, NumberEquality) {
    EXPECT_TRUE(ValueEquals(values_->NewInt(1).get(),
                            values_->NewFloat(1.0).get()));
    EXPECT_FALSE(ValueEquals(values_->NewInt(1).get(),
                             values_->NewInt(2).get()));
    EXPECT_TRUE(values_->NewFloat(4.0)->IsIntegralValue());
    EXPECT_FALSE(values_->NewFloat(4.5)->IsIntegralValue());
}

TEST_F(ValuesTest, StringPrinting) {
    auto s = values_->NewString("a\"b\n");
    EXPECT_EQ("\"a\\\"b\\n\"", s->ToString());
    EXPECT_EQ("a\"b\n", s->ToDisplayString());
}

TEST_F(ValuesTest, Lists) {
    auto list = List3(values_->NewInt(10), values_->NewInt(20),
                      values_->NewInt(30));
    ASSERT_TRUE(list->IsPair());
    EXPECT_TRUE(list->IsList());
    EXPECT_EQ(3, list->AsPair()->Length());
    EXPECT_EQ("(10 20 30)", list->ToString());

    ValueList elements;
    ASSERT_TRUE(list->AsPair()->ToVector(&elements));
    ASSERT_EQ(3u, elements.size());
    EXPECT_EQ(20, elements[1]->AsNumber()->int_value());

    auto dotted = values_->NewPair(values_->NewInt(1), values_->NewInt(2));
    EXPECT_FALSE(dotted->IsList());
    EXPECT_EQ("(1 . 2)", dotted->ToString());
    elements.clear();
    EXPECT_FALSE(dotted->ToVector(&elements));
}

TEST_F(ValuesTest, ListEquality) {
    auto a = List3(values_->NewSymbol("+"), values_->NewInt(1),
                   values_->NewString("x"));
    auto b = List3(values_->NewSymbol("+"), values_->NewFloat(1),
                   values_->NewString("x"));
    auto c = List3(values_->NewSymbol("-"), values_->NewInt(1),
                   values_->NewString("x"));
    EXPECT_TRUE(ValueEquals(a.get(), b.get()));
    EXPECT_FALSE(ValueEquals(a.get(), c.get()));
    EXPECT_FALSE(ValueEquals(a.get(), values_->nil().get()));
}

TEST_F(ValuesTest, QuotePrinting) {
    ValueList elements;
    elements.push_back(values_->NewSymbol("quote"));
    elements.push_back(values_->NewSymbol("x"));
    EXPECT_EQ("'x", values_->NewList(elements)->ToString());
}

TEST_F(ValuesTest, Structs) {
    std::vector<std::string> fields = {"x", "y"};
    auto type = values_->NewStructType(0, "point", fields);
    EXPECT_EQ(1, type->FindField("y"));
    EXPECT_EQ(-1, type->FindField("z"));

    ValueList args;
    args.push_back(values_->NewInt(1));
    args.push_back(values_->NewInt(2));
    auto instance = values_->NewStructInstance(type, args);
    EXPECT_EQ("(make-point 1 2)", instance->ToString());
    EXPECT_EQ(2, instance->field(1)->AsNumber()->int_value());
}

TEST_F(ValuesTest, Errors) {
    auto err = values_->NewError(ERR_ARITY_MISMATCH,
                                 values_->NewString("expected 2, found 1"));
    EXPECT_EQ(4, err->code());
    EXPECT_EQ("arity mismatch", err->description());
    EXPECT_TRUE(err->has_payload());
    EXPECT_EQ("error(004): arity mismatch", err->ToHeadline());

    auto bare = values_->NewError(ERR_UNCLOSED_LIST, Handle<Value>());
    EXPECT_FALSE(bare->has_payload());
    EXPECT_TRUE(bare->payload()->IsNil());
}

TEST_F(ValuesTest, ClosureKeepsEnvironment) {
    Handle<Environment> env(new Environment(Handle<Environment>()));
    std::vector<Handle<Symbol>> params;
    params.push_back(values_->NewSymbol("n"));

    auto closure = values_->NewClosure(params, values_->NewSymbol("n"), env);
    EXPECT_EQ(1, closure->arity());
    EXPECT_EQ(env.get(), closure->env().get());
    EXPECT_EQ(2, env->handle_count());
    EXPECT_EQ("<procedure>", closure->ToString());
}

} // namespace rlisp
