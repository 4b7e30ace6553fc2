#include "evaluator.h"
#include "builtins.h"
#include "environment.h"
#include "value-factory.h"
#include "struct-registry.h"
#include "parser.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "memory-output-stream.h"
#include "gtest/gtest.h"
#include <memory>

namespace rlisp {

class EvaluatorTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        values_ = new ValueFactory();
        structs_ = new StructRegistry(values_, 8);
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

    // Evaluate all forms, value of the last one.
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
        EXPECT_TRUE(ok) << z << "\n" << LastErrorHeadline();
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

    std::string LastErrorHeadline() {
        return evaluator_->has_error() ? evaluator_->last_error()->ToHeadline()
                                       : "";
    }

    ValueFactory *values_ = nullptr;
    StructRegistry *structs_ = nullptr;
    FixedMemoryStreamFactory *streams_ = nullptr;
    std::string buf_;
    MemoryOutputStream *output_ = nullptr;
    Evaluator *evaluator_ = nullptr;
    Handle<Environment> global_;
}; // class EvaluatorTest

TEST_F(EvaluatorTest, Atoms) {
    EXPECT_EQ("1", EvalToString("1"));
    EXPECT_EQ("\"s\"", EvalToString("\"s\""));
    EXPECT_EQ("true", EvalToString("true"));
    EXPECT_EQ("()", EvalToString("nil"));
    EXPECT_EQ("a", EvalToString("'a"));
    EXPECT_EQ("(1 2 3)", EvalToString("'(1 2 3)"));
}

TEST_F(EvaluatorTest, Define) {
    EXPECT_EQ("3", EvalToString("(define x 3) x"));
    EXPECT_EQ("7", EvalToString("(define (add a b) (+ a b)) (add 3 4)"));
    EXPECT_EQ("9", EvalToString("(define sq (lambda [n] (* n n))) (sq 3)"));

    auto sq = global_->Lookup("sq");
    ASSERT_TRUE(sq->IsClosure());
    EXPECT_EQ("sq", sq->AsClosure()->name());
}

TEST_F(EvaluatorTest, Closures) {
    EXPECT_EQ("15", EvalToString(
        "(define (adder n) (lambda [x] (+ x n)))\n"
        "(define add5 (adder 5))\n"
        "(add5 10)"));

    EXPECT_EQ("3", EvalToString(
        "(define (counter)\n"
        "  (let ([n 0])\n"
        "    (lambda [] (begin (set! n (+ n 1)) n))))\n"
        "(define c (counter))\n"
        "(c) (c) (c)"));
}

TEST_F(EvaluatorTest, IfAndCond) {
    EXPECT_EQ("1", EvalToString("(if true 1 2)"));
    EXPECT_EQ("2", EvalToString("(if {1 > 2} 1 2)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(if 1 1 2)"));

    EXPECT_EQ("b", EvalToString("(cond [false 'a] [true 'b] [else 'c])"));
    EXPECT_EQ("c", EvalToString("(cond [false 'a] [else 'c])"));
    EXPECT_EQ("()", EvalToString("(cond [false 'a])"));
    EXPECT_EQ(ERR_COND_NOT_BOOLEAN, EvalErrorCode("(cond [1 'a])"));
}

TEST_F(EvaluatorTest, Let) {
    EXPECT_EQ("3", EvalToString("(let ([a 1] [b 2]) (+ a b))"));
    // Later bindings see the earlier ones.
    EXPECT_EQ("4", EvalToString("(let ([a 2] [b (* a 2)]) b)"));
    EXPECT_EQ(ERR_UNDEFINED_IDENTIFIER,
              EvalErrorCode("(let ([a 1]) a) a"));
}

TEST_F(EvaluatorTest, Set) {
    EXPECT_EQ("2", EvalToString("(define x 1) (set! x 2) x"));
    EXPECT_EQ(ERR_UNDEFINED_IDENTIFIER, EvalErrorCode("(set! nope 1)"));
}

TEST_F(EvaluatorTest, CallErrors) {
    EXPECT_EQ(ERR_UNDEFINED_IDENTIFIER, EvalErrorCode("undefined-name"));
    EXPECT_EQ(ERR_NOT_CALLABLE, EvalErrorCode("(1 2 3)"));
    EXPECT_EQ(ERR_NO_FUNCTION, EvalErrorCode("()"));
    EXPECT_EQ(ERR_ARITY_MISMATCH,
              EvalErrorCode("(define (f a b) a) (f 1)"));
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(head '(1) '(2))"));

    // Message names the callee.
    EvalErrorCode("(define (g a) a) (g)");
    ASSERT_TRUE(evaluator_->last_error()->has_payload());
    EXPECT_EQ("`g' expected 1, found 0",
              evaluator_->last_error()->payload()->ToDisplayString());
}

TEST_F(EvaluatorTest, ReservedIdentifiers) {
    EXPECT_EQ(ERR_RESERVED_IDENTIFIER, EvalErrorCode("(define else 1)"));
    EXPECT_EQ(ERR_RESERVED_IDENTIFIER, EvalErrorCode("(define (if) 1)"));
    EXPECT_EQ(ERR_RESERVED_IDENTIFIER,
              EvalErrorCode("((lambda [lambda] 1) 2)"));
}

TEST_F(EvaluatorTest, TailCalls) {
    // Deeper than the depth limit, must run in constant stack.
    EXPECT_EQ("100000", EvalToString(
        "(define (loop n acc)\n"
        "  (if {n = 0} acc (loop (- n 1) (+ acc 1))))\n"
        "(loop 100000 0)"));

    EXPECT_EQ("true", EvalToString(
        "(define (even? n) (cond [{n = 0} true] [else (odd? (- n 1))]))\n"
        "(define (odd? n) (cond [{n = 0} false] [else (even? (- n 1))]))\n"
        "(even? 50000)"));
}

TEST_F(EvaluatorTest, Quasiquote) {
    EXPECT_EQ("(1 2 3)", EvalToString("(define x 2) `(1 ,x 3)"));
    EXPECT_EQ("(a (b 3))", EvalToString("`(a (b ,(+ 1 2)))"));
    EXPECT_EQ(ERR_PARSE_EXPRESSION, EvalErrorCode("(unquote 1)"));
}

TEST_F(EvaluatorTest, TryCatch) {
    EXPECT_EQ("1", EvalToString("(try 1 (lambda [e] 2))"));
    EXPECT_EQ("10", EvalToString("(try (head '()) error-code)"));
    EXPECT_EQ("4", EvalToString(
        "(try (raise (make-error 4 \"boom\")) (lambda [e] (error-code e)))"));
    EXPECT_EQ("\"boom\"", EvalToString(
        "(try (raise (make-error 4 \"boom\"))\n"
        "     (lambda [e] (error-description e)))"));
    EXPECT_FALSE(evaluator_->has_error());

    // Errors of the handler are not caught.
    EXPECT_EQ(ERR_UNDEFINED_IDENTIFIER,
              EvalErrorCode("(try (head '()) (lambda [e] nope))"));
}

TEST_F(EvaluatorTest, SideEffectsAreKept) {
    EXPECT_EQ(ERR_TAIL_OF_EMPTY_LIST,
              EvalErrorCode("(define x 1) (begin (set! x 2) (tail '()))"));
    EXPECT_EQ("2", EvalToString("x"));
}

TEST_F(EvaluatorTest, Import) {
    streams_->PutInputStream("lib.rl", "(define (twice x) (* 2 x))");
    EXPECT_EQ("8", EvalToString("(import \"lib.rl\") (twice 4)"));
    EXPECT_EQ(ERR_READ_FILE, EvalErrorCode("(import \"none.rl\")"));
}

TEST_F(EvaluatorTest, Exit) {
    bool ok = true;
    EvalAll("(begin (exit 3) (display \"unreachable\"))", &ok);
    EXPECT_FALSE(ok);
    EXPECT_FALSE(evaluator_->has_error());
    EXPECT_TRUE(evaluator_->should_exit());
    EXPECT_EQ(3, evaluator_->exit_code());
    EXPECT_EQ("", buf_);
}

TEST_F(EvaluatorTest, Apply) {
    bool ok = true;
    auto add = global_->Lookup("+");
    ValueList args{values_->NewInt(1), values_->NewInt(2)};
    auto result = evaluator_->Apply(add, args, global_, &ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ(3, result->AsNumber()->int_value());

    result = evaluator_->Apply(values_->NewInt(1), args, global_, &ok);
    EXPECT_FALSE(ok);
    EXPECT_EQ(ERR_NOT_CALLABLE, evaluator_->last_error()->code());
}

TEST_F(EvaluatorTest, DepthExhausted) {
    evaluator_->set_max_eval_depth(64);
    bool ok = true;
    EvalAll("(define (f n) (+ 1 (f n)))", &ok);
    ASSERT_TRUE(ok);
    EXPECT_DEATH(EvalAll("(f 1)", &ok), "evaluation depth");
}

} // namespace rlisp
