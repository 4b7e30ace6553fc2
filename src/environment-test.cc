#include "environment.h"
#include "value-factory.h"
#include "special-forms.h"
#include "gtest/gtest.h"

namespace rlisp {

class EnvironmentTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        values_ = new ValueFactory();
        global_ = new Environment(Handle<Environment>());
    }

    virtual void TearDown() override {
        global_ = Handle<Environment>();
        delete values_;
    }

    ValueFactory *values_ = nullptr;
    Handle<Environment> global_;
}; // class EnvironmentTest

TEST_F(EnvironmentTest, Sanity) {
    EXPECT_TRUE(global_->is_global());
    EXPECT_TRUE(global_->Define("foo", values_->NewInt(1)));
    EXPECT_EQ(1, global_->Lookup("foo")->AsNumber()->int_value());
    EXPECT_TRUE(global_->Lookup("bar").empty());
}

TEST_F(EnvironmentTest, Shadowing) {
    global_->Define("x", values_->NewInt(1));

    Handle<Environment> inner(new Environment(global_));
    EXPECT_TRUE(inner->Define("x", values_->NewInt(2)));

    EXPECT_EQ(2, inner->Lookup("x")->AsNumber()->int_value());
    EXPECT_EQ(1, global_->Lookup("x")->AsNumber()->int_value());
    EXPECT_TRUE(inner->LookupLocal("y").empty());
}

TEST_F(EnvironmentTest, SetMutatesOwner) {
    global_->Define("x", values_->NewInt(1));

    Handle<Environment> inner(new Environment(global_));
    EXPECT_TRUE(inner->Set("x", values_->NewInt(3)));
    EXPECT_TRUE(inner->LookupLocal("x").empty());
    EXPECT_EQ(3, global_->Lookup("x")->AsNumber()->int_value());
    EXPECT_EQ(global_.get(), inner->FindOwner("x"));

    EXPECT_FALSE(inner->Set("undefined", values_->NewInt(0)));
}

TEST_F(EnvironmentTest, ReservedIdentifiers) {
    EXPECT_FALSE(global_->Define("define", values_->NewInt(1)));
    EXPECT_FALSE(global_->Define("lambda", values_->NewInt(1)));
    EXPECT_FALSE(global_->Define("\xce\xbb", values_->NewInt(1)));
    EXPECT_FALSE(global_->Define("else", values_->NewInt(1)));
    EXPECT_FALSE(global_->Define("_", values_->NewInt(1)));
    EXPECT_EQ(0, global_->size());

    global_->Put("_", values_->NewInt(7));
    EXPECT_EQ(7, global_->Lookup("_")->AsNumber()->int_value());
}

TEST(SpecialFormsTest, Lookup) {
    EXPECT_EQ(FORM_DEFINE, FindSpecialForm("define"));
    EXPECT_EQ(FORM_SET, FindSpecialForm("set!"));
    EXPECT_EQ(FORM_LAMBDA, FindSpecialForm("\xce\xbb"));
    EXPECT_EQ(FORM_NONE, FindSpecialForm("head"));
    EXPECT_STREQ("define-macro-rule", SpecialFormName(FORM_DEFINE_MACRO_RULE));
    EXPECT_TRUE(IsReservedIdentifier("try"));
    EXPECT_FALSE(IsReservedIdentifier("display"));
}

} // namespace rlisp
