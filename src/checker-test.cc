#include "checker.h"
#include "parser.h"
#include "value-factory.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "gtest/gtest.h"
#include <memory>

namespace rlisp {

class CheckerTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        values_ = new ValueFactory();
        streams_ = new FixedMemoryStreamFactory();
    }

    virtual void TearDown() override {
        delete streams_;
        delete values_;
    }

    // 0 if the form passes.
    int CheckErrorCode(const char *z) {
        streams_->PutInputStream(":memory:", z);
        std::unique_ptr<Parser> p(new Parser(values_, streams_));
        p->SwitchInputStream(":memory:");

        bool ok = true;
        auto form = p->ParseForm(&ok);
        EXPECT_TRUE(ok) << p->last_error().ToString();
        if (!ok) {
            return -1;
        }

        Checker checker;
        if (checker.Check(form.get())) {
            EXPECT_FALSE(checker.has_error());
            return 0;
        }
        EXPECT_TRUE(checker.has_error());
        return checker.error_code();
    }

    ValueFactory *values_ = nullptr;
    FixedMemoryStreamFactory *streams_ = nullptr;
}; // class CheckerTest

TEST_F(CheckerTest, Sanity) {
    EXPECT_EQ(0, CheckErrorCode("(define (f n) (cond [{n < 2} n] "
                                "[else {(f {n - 1}) + (f {n - 2})}]))"));
    EXPECT_EQ(0, CheckErrorCode("(let ([x 1] [y 2]) {x + y})"));
    EXPECT_EQ(0, CheckErrorCode("(lambda () 1)"));
    EXPECT_EQ(0, CheckErrorCode("(define-struct point [x y])"));
    EXPECT_EQ(0, CheckErrorCode("(define-macro-rule (swap! a b) "
                                "(let ([tmp a]) (set! a b) (set! b tmp)))"));
}

TEST_F(CheckerTest, Lambda) {
    EXPECT_EQ(ERR_LAMBDA_SYNTAX, CheckErrorCode("(lambda x x)"));
    EXPECT_EQ(ERR_LAMBDA_SYNTAX, CheckErrorCode("(lambda [x])"));
    EXPECT_EQ(ERR_PARAMETER_NOT_SYMBOL, CheckErrorCode("(lambda [x 1] x)"));
    EXPECT_EQ(ERR_LAMBDA_SYNTAX, CheckErrorCode("(λ 1 1)"));
}

TEST_F(CheckerTest, Let) {
    EXPECT_EQ(ERR_BINDING_LIST, CheckErrorCode("(let x x)"));
    EXPECT_EQ(ERR_BINDING_IDENTIFIER, CheckErrorCode("(let ([1 2]) 1)"));
    EXPECT_EQ(ERR_BINDING_SHAPE, CheckErrorCode("(let (x) 1)"));
    EXPECT_EQ(ERR_BINDING_SHAPE, CheckErrorCode("(let ([x 1 2]) 1)"));
    EXPECT_EQ(ERR_LET_BODY, CheckErrorCode("(let ([x 1]))"));
}

TEST_F(CheckerTest, Define) {
    EXPECT_EQ(ERR_DEFINE_SHAPE, CheckErrorCode("(define 1 2)"));
    EXPECT_EQ(ERR_DEFINE_SHAPE, CheckErrorCode("(define x)"));
    EXPECT_EQ(ERR_DEFINE_SHAPE, CheckErrorCode("(define x 1 2)"));
    EXPECT_EQ(ERR_BIND_TO_SYMBOL, CheckErrorCode("(define (1 x) x)"));
    EXPECT_EQ(ERR_PARAMETER_NOT_SYMBOL, CheckErrorCode("(define (f 1) 1)"));
    EXPECT_EQ(ERR_DEFINE_SHAPE, CheckErrorCode("(define (f x))"));
}

TEST_F(CheckerTest, Cond) {
    EXPECT_EQ(ERR_COND_CASE_NOT_LIST, CheckErrorCode("(cond 1)"));
    EXPECT_EQ(ERR_COND_CASE_SIZE, CheckErrorCode("(cond [true 1 2])"));
    EXPECT_EQ(ERR_COND_CASE_SIZE, CheckErrorCode("(cond [true])"));
}

TEST_F(CheckerTest, Definitions) {
    EXPECT_EQ(ERR_BAD_DEFINITION, CheckErrorCode("(define-struct 1 [x])"));
    EXPECT_EQ(ERR_BAD_DEFINITION, CheckErrorCode("(define-struct p [1])"));
    EXPECT_EQ(ERR_BAD_DEFINITION, CheckErrorCode("(define-struct p)"));
    EXPECT_EQ(ERR_BAD_DEFINITION, CheckErrorCode("(define-macro m 1)"));
    EXPECT_EQ(ERR_BAD_DEFINITION, CheckErrorCode("(define-macro (m 1) 1)"));
    EXPECT_EQ(ERR_BAD_DEFINITION, CheckErrorCode("(define-macro-rule (1) 1)"));
}

TEST_F(CheckerTest, NestedForms) {
    EXPECT_EQ(ERR_LET_BODY, CheckErrorCode("(display (let ([x 1])))"));
    EXPECT_EQ(ERR_LAMBDA_SYNTAX,
              CheckErrorCode("(define (f) (begin (lambda x x)))"));
}

TEST_F(CheckerTest, DataIsNotChecked) {
    EXPECT_EQ(0, CheckErrorCode("'(let x x)"));
    EXPECT_EQ(0, CheckErrorCode("`(lambda 1 ,x)"));
    EXPECT_EQ(0, CheckErrorCode("(define-macro (m x) (let x x))"));
}

} // namespace rlisp
