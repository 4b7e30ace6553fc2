#include "struct-registry.h"
#include "evaluator.h"
#include "builtins.h"
#include "environment.h"
#include "value-factory.h"
#include "parser.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "memory-output-stream.h"
#include "gtest/gtest.h"
#include <memory>

namespace rlisp {

const int kMaxTypes = 3;

class StructRegistryTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        values_ = new ValueFactory();
        structs_ = new StructRegistry(values_, kMaxTypes);
        streams_ = new FixedMemoryStreamFactory();
        output_ = new MemoryOutputStream(&buf_);
        evaluator_ = new Evaluator(values_, structs_, streams_);
        evaluator_->set_output(output_);
        global_ = new Environment(Handle<Environment>());
        BaseLibrary::Install(values_, global_.get());
    }

    virtual void TearDown() override {
        global_ = Handle<Environment>();
        delete evaluator_;
        delete output_;
        delete streams_;
        delete structs_;
        delete values_;
    }

    Handle<Value> EvalAll(const char *z, bool *ok) {
        streams_->PutInputStream(":memory:", z);
        std::unique_ptr<Parser> p(new Parser(values_, streams_));
        p->SwitchInputStream(":memory:");

        evaluator_->ClearError();
        Handle<Value> result = values_->nil();
        while (*ok && !p->AtEnd()) {
            auto form = p->ParseForm(ok);
            EXPECT_TRUE(*ok) << p->last_error().ToString();
            if (!*ok) {
                return nullptr;
            }
            result = evaluator_->EvalForm(form, global_, ok);
        }
        return result;
    }

    std::string EvalToString(const char *z) {
        bool ok = true;
        auto result = EvalAll(z, &ok);
        EXPECT_TRUE(ok) << z << "\n" << (evaluator_->has_error()
                ? evaluator_->last_error()->ToHeadline() : "");
        return ok ? result->ToString() : "";
    }

    int EvalErrorCode(const char *z) {
        bool ok = true;
        EvalAll(z, &ok);
        EXPECT_FALSE(ok) << z;
        if (ok || !evaluator_->has_error()) {
            return 0;
        }
        return evaluator_->last_error()->code();
    }

    ValueFactory *values_ = nullptr;
    StructRegistry *structs_ = nullptr;
    FixedMemoryStreamFactory *streams_ = nullptr;
    std::string buf_;
    MemoryOutputStream *output_ = nullptr;
    Evaluator *evaluator_ = nullptr;
    Handle<Environment> global_;
}; // class StructRegistryTest

TEST_F(StructRegistryTest, Sanity) {
    EXPECT_EQ(kMaxTypes, structs_->max_types());
    EXPECT_EQ(0, structs_->size());

    auto type = structs_->NewType("point", {"x", "y"});
    ASSERT_TRUE(type.valid());
    EXPECT_EQ(0, type->id());
    EXPECT_EQ(2, type->field_count());
    EXPECT_EQ(1, type->FindField("y"));
    EXPECT_EQ(-1, type->FindField("z"));
    EXPECT_EQ(type.get(), structs_->FindType("point").get());
    EXPECT_TRUE(structs_->FindType("line").empty());

    EXPECT_TRUE(structs_->IsAccessorName("point-z"));
    EXPECT_FALSE(structs_->IsAccessorName("point-"));
    EXPECT_FALSE(structs_->IsAccessorName("line-x"));
}

TEST_F(StructRegistryTest, Install) {
    auto type = structs_->NewType("point", {"x", "y"});
    ASSERT_TRUE(type.valid());
    structs_->Install(type, global_.get());

    EXPECT_TRUE(global_->LookupLocal("make-point")->IsBuiltin());
    EXPECT_TRUE(global_->LookupLocal("is-point?")->IsBuiltin());
    EXPECT_TRUE(global_->LookupLocal("point-x")->IsBuiltin());
    EXPECT_TRUE(global_->LookupLocal("point-y")->IsBuiltin());
    EXPECT_EQ(2, global_->LookupLocal("make-point")->AsBuiltin()->arity());
}

TEST_F(StructRegistryTest, Accessors) {
    EXPECT_EQ("3", EvalToString(
        "(define-struct point [x y])\n"
        "(define p (make-point 1 2))\n"
        "{(point-x p) + (point-y p)}"));
    EXPECT_EQ("true", EvalToString("(is-point? p)"));
    EXPECT_EQ("false", EvalToString("(is-point? 1)"));
    EXPECT_EQ("(make-point 1 2)", EvalToString("p"));

    EXPECT_EQ(ERR_NO_SUCH_FIELD, EvalErrorCode("(point-z p)"));
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(make-point 1)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(point-x 1)"));
}

TEST_F(StructRegistryTest, AccessorOfOtherType) {
    EvalToString("(define-struct point [x y]) (define-struct size [x y])");
    EXPECT_EQ(ERR_NO_SUCH_FIELD, EvalErrorCode("(size-x (make-point 1 2))"));
    EXPECT_EQ("false", EvalToString("(is-size? (make-point 1 2))"));
}

TEST_F(StructRegistryTest, TooManyStructs) {
    EvalToString("(define-struct a [x]) (define-struct b [x])"
                 "(define-struct c [x])");
    EXPECT_TRUE(structs_->is_full());
    EXPECT_EQ(ERR_TOO_MANY_STRUCTS, EvalErrorCode("(define-struct d [x])"));
    EXPECT_EQ(ERR_UNDEFINED_IDENTIFIER, EvalErrorCode("make-d"));

    // Redefinition is a new type too.
    EXPECT_EQ(ERR_TOO_MANY_STRUCTS, EvalErrorCode("(define-struct a [y])"));
    EXPECT_EQ(kMaxTypes, structs_->size());
}

TEST_F(StructRegistryTest, Redefine) {
    EvalToString("(define-struct point [x y])\n"
                 "(define old (make-point 1 2))\n"
                 "(define-struct point [x y z])");
    EXPECT_EQ(2, structs_->size());
    EXPECT_EQ("false", EvalToString("(is-point? old)"));
    EXPECT_EQ("3", EvalToString("(point-z (make-point 1 2 3))"));
}

TEST_F(StructRegistryTest, BadDefinition) {
    EXPECT_EQ(ERR_BAD_DEFINITION, EvalErrorCode("(define-struct 1 [x])"));
    EXPECT_EQ(ERR_BAD_DEFINITION, EvalErrorCode("(define-struct p [1])"));
    EXPECT_EQ(0, structs_->size());
}

} // namespace rlisp
