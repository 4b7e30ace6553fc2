#include "macro-expander.h"
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

class MacroExpanderTest : public ::testing::Test {
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

    Handle<Value> Parse(const char *z) {
        streams_->PutInputStream(":memory:", z);
        std::unique_ptr<Parser> p(new Parser(values_, streams_));
        p->SwitchInputStream(":memory:");

        bool ok = true;
        auto form = p->ParseForm(&ok);
        EXPECT_TRUE(ok) << p->last_error().ToString();
        return form;
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
}; // class MacroExpanderTest

TEST_F(MacroExpanderTest, MatchAndSubstitute) {
    MacroExpander expander(evaluator_);
    MacroExpander::Bindings bindings;

    auto pattern = Parse("(a (b _))");
    bool ok = true;
    EXPECT_TRUE(expander.Match(pattern.get(), Parse("(1 (\"s\" 3))"),
                               &bindings, &ok));
    ASSERT_TRUE(ok);
    ASSERT_EQ(2u, bindings.size());
    EXPECT_EQ("1", bindings["a"]->ToString());
    EXPECT_EQ("\"s\"", bindings["b"]->ToString());

    auto result = expander.Substitute(Parse("(list a (quote b) c)"), bindings);
    EXPECT_EQ("(list 1 '\"s\" c)", result->ToString());
}

TEST_F(MacroExpanderTest, MatchFailure) {
    MacroExpander expander(evaluator_);
    MacroExpander::Bindings bindings;

    bool ok = true;
    expander.Match(Parse("(a b)").get(), Parse("(1 2 3)"), &bindings, &ok);
    EXPECT_FALSE(ok);
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, evaluator_->last_error()->code());

    ok = true;
    expander.Match(Parse("(0 b)").get(), Parse("(1 2)"), &bindings, &ok);
    EXPECT_FALSE(ok);
}

TEST_F(MacroExpanderTest, Template) {
    EXPECT_EQ("1", EvalToString(
        "(define-macro (my-if c a b) (list 'if c a b))\n"
        "(my-if true 1 (head '()))"));

    EXPECT_EQ("2", EvalToString(
        "(define-macro (inc! x) `(set! ,x (+ ,x 1)))\n"
        "(define n 1)\n"
        "(inc! n)\n"
        "n"));
}

TEST_F(MacroExpanderTest, Rule) {
    EXPECT_EQ("(2 1)", EvalToString(
        "(define-macro-rule (swap! a b)\n"
        "  (let ([tmp a]) (begin (set! a b) (set! b tmp))))\n"
        "(define x 1)\n"
        "(define y 2)\n"
        "(swap! x y)\n"
        "(list x y)"));

    EXPECT_EQ("1", EvalToString(
        "(define-macro-rule (first-of (a _)) a)\n"
        "(first-of (1 2))"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(first-of (1 2 3))"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(first-of 5)"));
}

TEST_F(MacroExpanderTest, ArityMismatch) {
    EvalToString("(define-macro-rule (swap! a b) (list a b))\n"
                 "(define-macro (twice x) (list '* 2 x))");
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(swap! 1)"));
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(twice 1 2)"));
    EXPECT_EQ("6", EvalToString("(twice 3)"));
}

TEST_F(MacroExpanderTest, ExpansionIsChecked) {
    EvalToString("(define-macro (bad) '(lambda 1))");
    EXPECT_EQ(ERR_LAMBDA_SYNTAX, EvalErrorCode("(bad)"));
}

TEST_F(MacroExpanderTest, NotHygienic) {
    // `tmp' of the expansion captures the caller's `tmp'.
    EXPECT_EQ("(1 2)", EvalToString(
        "(define-macro-rule (swap! a b)\n"
        "  (let ([tmp a]) (begin (set! a b) (set! b tmp))))\n"
        "(define tmp 1)\n"
        "(define other 2)\n"
        "(swap! tmp other)\n"
        "(list tmp other)"));
}

} // namespace rlisp
