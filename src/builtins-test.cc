#include "builtins.h"
#include "evaluator.h"
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

class BuiltinsTest : public ::testing::Test {
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
}; // class BuiltinsTest

TEST_F(BuiltinsTest, Arithmetic) {
    EXPECT_EQ("6", EvalToString("(+ 1 2 3)"));
    EXPECT_EQ("0", EvalToString("(+)"));
    EXPECT_EQ("3.5", EvalToString("(+ 1 2.5)"));
    EXPECT_EQ("-5", EvalToString("(- 5)"));
    EXPECT_EQ("4", EvalToString("(- 10 5 1)"));
    EXPECT_EQ("24", EvalToString("(* 2 3 4)"));
    EXPECT_EQ("3", EvalToString("(/ 6 2)"));
    EXPECT_EQ("3.5", EvalToString("(/ 7 2)"));
    EXPECT_EQ("0.5", EvalToString("(/ 2)"));
    EXPECT_EQ("1", EvalToString("(% 7 3)"));
    EXPECT_EQ("1.5", EvalToString("(rem 7.5 2)"));
    EXPECT_EQ("10", EvalToString("{1 + 2 + 3 + 4}"));

    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(-)"));
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(/)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(+ 1 \"2\")"));
}

TEST_F(BuiltinsTest, IntegerOverflowPromotes) {
    bool ok = true;
    auto result = EvalAll("(* 9223372036854775807 2)", &ok);
    ASSERT_TRUE(ok);
    ASSERT_TRUE(result->IsNumber());
    EXPECT_FALSE(result->AsNumber()->is_integral());
    EXPECT_DOUBLE_EQ(18446744073709551614.0,
                     result->AsNumber()->float_value());
}

TEST_F(BuiltinsTest, Comparison) {
    EXPECT_EQ("true", EvalToString("(< 1 2)"));
    EXPECT_EQ("false", EvalToString("(> 1 2)"));
    EXPECT_EQ("true", EvalToString("(<= 2 2.0)"));
    EXPECT_EQ("true", EvalToString("(>= 3 2)"));
    EXPECT_EQ("true", EvalToString("(= 1 1.0)"));
    EXPECT_EQ("true", EvalToString("(eq? '(1 (2 \"a\")) '(1 (2 \"a\")))"));
    EXPECT_EQ("false", EvalToString("(eq? 'a 'b)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(< 1 \"a\")"));
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(< 1 2 3)"));
}

TEST_F(BuiltinsTest, Logic) {
    EXPECT_EQ("false", EvalToString("(and true false)"));
    EXPECT_EQ("true", EvalToString("(&& true true)"));
    EXPECT_EQ("true", EvalToString("(or false true)"));
    EXPECT_EQ("false", EvalToString("(|| false false)"));
    EXPECT_EQ("true", EvalToString("(not false)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(and true 1)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(not '())"));
}

TEST_F(BuiltinsTest, Math) {
    EXPECT_EQ("4.0", EvalToString("(sqrt 16)"));
    EXPECT_EQ("2", EvalToString("(floor 2.7)"));
    EXPECT_EQ("3", EvalToString("(ceil 2.1)"));
    EXPECT_EQ("-3", EvalToString("(floor -2.5)"));
    EXPECT_EQ("1024", EvalToString("(pow 2 10)"));
    EXPECT_EQ("0.5", EvalToString("(pow 2 -1)"));
    EXPECT_EQ("1.0", EvalToString("(exp 0)"));
    EXPECT_EQ("0.0", EvalToString("(ln 1)"));
    EXPECT_EQ("0.0", EvalToString("(sin 0)"));
    EXPECT_EQ("1.0", EvalToString("(cos 0)"));
    EXPECT_EQ("3", EvalToString("(floor pi)"));
}

TEST_F(BuiltinsTest, Quaternions) {
    EXPECT_EQ("2i", EvalToString("(sqrt -4)"));
    EXPECT_EQ("1+2i-3j+0.5k", EvalToString("(quat 1 2 -3 0.5)"));
    EXPECT_EQ("number", EvalToString("(type-of (sqrt -1))"));

    // Results without a vector part are floats again.
    EXPECT_EQ("-4.0", EvalToString("(* (sqrt -4) (sqrt -4))"));
    EXPECT_EQ("-1.0", EvalToString(
        "(* (quat 0 1 0 0) (quat 0 0 1 0) (quat 0 0 0 1))"));
    EXPECT_EQ("1.0", EvalToString("(/ (quat 0 1 0 0) (quat 0 1 0 0))"));
    EXPECT_EQ("0.0", EvalToString("(- (quat 1 2 3 4) (quat 1 2 3 4))"));

    EXPECT_EQ("1+1i", EvalToString("(+ 1 (sqrt -1))"));
    EXPECT_EQ("-1-2i-3j-4k", EvalToString("(- (quat 1 2 3 4))"));
    EXPECT_EQ("-1k", EvalToString("(* (quat 0 0 1 0) (quat 0 1 0 0))"));
    EXPECT_EQ("true", EvalToString("(= (quat 0 1 0 0) (sqrt -1))"));
    EXPECT_EQ("false", EvalToString("(= (quat 0 1 0 0) (quat 0 0 1 0))"));

    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(floor (sqrt -1))"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(< (sqrt -1) 1)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(sqrt (sqrt -1))"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(quat 1 2 3 \"4\")"));
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(quat 1 2 3)"));
}

TEST_F(BuiltinsTest, Lists) {
    EXPECT_EQ("(1 2)", EvalToString("(cons 1 '(2))"));
    EXPECT_EQ("(1)", EvalToString("(: 1 nil)"));
    EXPECT_EQ("1", EvalToString("(head '(1 2))"));
    EXPECT_EQ("(2)", EvalToString("(tail '(1 2))"));
    EXPECT_EQ("()", EvalToString("(list)"));
    EXPECT_EQ("(1 \"a\" b)", EvalToString("(list 1 \"a\" 'b)"));
    EXPECT_EQ("true", EvalToString("(empty? '())"));
    EXPECT_EQ("false", EvalToString("(empty? '(1))"));
    EXPECT_EQ("(1 2 3)", EvalToString("(append '(1) '(2 3) '())"));
    EXPECT_EQ("(1 2)", EvalToString("(++ '(1) '(2))"));
    EXPECT_EQ("3", EvalToString("(length '(a b c))"));
    EXPECT_EQ("0", EvalToString("(length '())"));

    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(cons 1 2)"));
    EXPECT_EQ(ERR_HEAD_OF_EMPTY_LIST, EvalErrorCode("(head '())"));
    EXPECT_EQ(ERR_TAIL_OF_EMPTY_LIST, EvalErrorCode("(tail '())"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(head 1)"));
}

TEST_F(BuiltinsTest, Display) {
    EXPECT_EQ("()", EvalToString("(display \"a\" 1 '(x \"y\"))"));
    EXPECT_EQ("a1(x y)", buf_);

    buf_.clear();
    EvalToString("(display-debug \"a\") (newline)");
    EXPECT_EQ("\"a\"\n", buf_);

    output_->set_flush_fail(true);
    EXPECT_EQ(ERR_FLUSH_STDOUT, EvalErrorCode("(display 1)"));
}

TEST_F(BuiltinsTest, ReadLine) {
    EXPECT_EQ(ERR_READ_STDIN, EvalErrorCode("(readline)"));

    std::unique_ptr<TextInputStream> input(
            new FixedMemoryInputStream("line one\r\nline two"));
    evaluator_->set_input(input.get());
    EXPECT_EQ("\"line one\"", EvalToString("(readline)"));
    EXPECT_EQ("\"line two\"", EvalToString("(readline)"));
    EXPECT_EQ(ERR_READ_STDIN, EvalErrorCode("(readline)"));
    evaluator_->set_input(nullptr);
}

TEST_F(BuiltinsTest, ReadFile) {
    streams_->PutInputStream("a.txt", "hello\nworld");
    EXPECT_EQ("\"hello\\nworld\"", EvalToString("(readfile \"a.txt\")"));
    EXPECT_EQ(ERR_READ_FILE, EvalErrorCode("(readfile \"none.txt\")"));
}

TEST_F(BuiltinsTest, ParseAndEval) {
    EXPECT_EQ("(+ 1 2)", EvalToString("(parse \"(+ 1 2)\")"));
    EXPECT_EQ("(+ 1 2)", EvalToString("(parse \"{1 + 2}\")"));
    EXPECT_EQ("3", EvalToString("(eval (parse \"(+ 1 2)\"))"));
    EXPECT_EQ("'()", EvalToString("(parse \"\")"));
    EXPECT_EQ("()", EvalToString("(eval (parse \"\"))"));
    EXPECT_EQ("3", EvalToString("(eval '(+ 1 2))"));

    EXPECT_EQ(ERR_UNCLOSED_LIST, EvalErrorCode("(parse \"(1 2\")"));
    EXPECT_EQ(ERR_LAMBDA_SYNTAX, EvalErrorCode("(eval '(lambda 1 2))"));
}

TEST_F(BuiltinsTest, TypeOf) {
    EXPECT_EQ("number", EvalToString("(type-of 1)"));
    EXPECT_EQ("string", EvalToString("(type-of \"s\")"));
    EXPECT_EQ("bool", EvalToString("(type-of true)"));
    EXPECT_EQ("symbol", EvalToString("(type-of 'a)"));
    EXPECT_EQ("list", EvalToString("(type-of '(1))"));
    EXPECT_EQ("nil", EvalToString("(type-of '())"));
    EXPECT_EQ("function", EvalToString("(type-of type-of)"));
    EXPECT_EQ("function", EvalToString("(type-of (lambda [] 1))"));
    EXPECT_EQ("error", EvalToString("(type-of (make-error 1))"));
    EXPECT_EQ("point", EvalToString(
        "(define-struct point [x y]) (type-of (make-point 1 2))"));
}

TEST_F(BuiltinsTest, CheckTypeNominal) {
    EXPECT_EQ("1", EvalToString("(check-type 1 'number)"));
    EXPECT_EQ("1", EvalToString("(check-type 1 'any)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(check-type 1 'string)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH,
              EvalErrorCode("(check-type '(1 2) '(list number))"));

    EvalToString("(define-struct p1 [x y]) (define-struct p2 [x y])");
    EXPECT_EQ("(make-p1 1 2)", EvalToString("(check-type (make-p1 1 2) 'p1)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH,
              EvalErrorCode("(check-type (make-p1 1 2) 'p2)"));
}

TEST_F(BuiltinsTest, CheckTypeStructural) {
    evaluator_->set_signature_policy(SIGNATURE_STRUCTURAL);
    EXPECT_EQ("(1 2)", EvalToString("(check-type '(1 2) '(list number))"));
    EXPECT_EQ("()", EvalToString("(check-type '() '(list string))"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH,
              EvalErrorCode("(check-type '(1 \"a\") '(list number))"));

    EvalToString("(define-struct p1 [x y]) (define-struct p2 [x y])"
                 "(define-struct p3 [x z])");
    EXPECT_EQ("(make-p1 1 2)", EvalToString("(check-type (make-p1 1 2) 'p2)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH,
              EvalErrorCode("(check-type (make-p1 1 2) 'p3)"));
}

TEST_F(BuiltinsTest, Format) {
    EXPECT_EQ("\"a1b\"", EvalToString("(format \"a\" 1 \"b\")"));
    EXPECT_EQ("\"(1 x)\"", EvalToString("(string-concat '(1 x))"));
    EXPECT_EQ("\"x=5!\"", EvalToString("(define x 5) #\"x=#{x}!\""));
    EXPECT_EQ("\"sum: 3\"", EvalToString("#\"sum: #{(+ 1 2)}\""));
    EXPECT_EQ("\"abc\"", EvalToString("(symbol->string 'abc)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(symbol->string 1)"));
}

TEST_F(BuiltinsTest, Errors) {
    EXPECT_EQ("12", EvalToString("(error-code (make-error 12))"));
    EXPECT_EQ("\"could not flush stdout\"",
              EvalToString("(error-description (make-error 12))"));
    EXPECT_EQ("()", EvalToString("(error-payload (make-error 12))"));
    EXPECT_EQ("5", EvalToString("(error-payload (make-error 1 \"d\" 5))"));
    EXPECT_EQ("\"d\"", EvalToString("(error-description (make-error 1 \"d\"))"));
    EXPECT_EQ("true", EvalToString("(is-error? (make-error 1))"));
    EXPECT_EQ("false", EvalToString("(is-error? 1)"));

    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(make-error 33)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(make-error 0)"));
    EXPECT_EQ(ERR_ARITY_MISMATCH, EvalErrorCode("(make-error)"));
    EXPECT_EQ(ERR_SIGNATURE_MISMATCH, EvalErrorCode("(raise 1)"));

    EXPECT_EQ(ERR_NO_SUCH_FIELD, EvalErrorCode("(raise (make-error 29))"));
    EXPECT_EQ("struct does not contain specified field",
              evaluator_->last_error()->description());
}

TEST_F(BuiltinsTest, PrintError) {
    EvalToString("(print-error (make-error 4 \"arity mismatch\" "
                 "\"expected 2, found 1\"))");
    EXPECT_EQ("error(004): arity mismatch\n    expected 2, found 1\n", buf_);

    buf_.clear();
    EvalToString("(print-error (make-error 1))");
    EXPECT_EQ("error(001): undefined identifier\n", buf_);
}

TEST_F(BuiltinsTest, Exit) {
    bool ok = true;
    EvalAll("(exit)", &ok);
    EXPECT_TRUE(ok);
    EXPECT_TRUE(evaluator_->should_exit());
    EXPECT_EQ(0, evaluator_->exit_code());
}

} // namespace rlisp
