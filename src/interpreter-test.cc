#include "interpreter.h"
#include "value-factory.h"
#include "struct-registry.h"
#include "frame-collector.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "memory-output-stream.h"
#include "gtest/gtest.h"
#include <memory>

namespace rlisp {

class InterpreterTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        streams_ = new FixedMemoryStreamFactory();
        output_ = new MemoryOutputStream(&buf_);
        options_.interactive = true;
    }

    virtual void TearDown() override {
        delete interpreter_;
        delete output_;
        delete streams_;
    }

    Interpreter *CreateInterpreter() {
        delete interpreter_;
        interpreter_ = new Interpreter(options_, streams_, output_);
        EXPECT_TRUE(interpreter_->Init());
        return interpreter_;
    }

    bool Contains(const std::string &s) const {
        return buf_.find(s) != std::string::npos;
    }

    Interpreter::Options options_;
    FixedMemoryStreamFactory *streams_ = nullptr;
    std::string buf_;
    MemoryOutputStream *output_ = nullptr;
    Interpreter *interpreter_ = nullptr;
}; // class InterpreterTest

TEST_F(InterpreterTest, Fibonacci) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString(
        "(define (f n)\n"
        "  (if {n < 2} n {(f (- n 1)) + (f (- n 2))}))\n"
        "(f 10)"));
    EXPECT_EQ("55\n", buf_);
}

TEST_F(InterpreterTest, FibonacciCond) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString(
        "(define (f n) (cond [{n < 2} n] "
        "[else {(f {n - 1}) + (f {n - 2})}])) (f 10)"));
    EXPECT_EQ("55\n", buf_);
    EXPECT_EQ("55", interp->last_value()->ToString());
}

TEST_F(InterpreterTest, ListAccess) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString("(head (tail '(10 20 30)))"));
    EXPECT_EQ("20\n", buf_);

    buf_.clear();
    EXPECT_FALSE(interp->ExecuteString("(head '())"));
    EXPECT_EQ("error(010): cannot get the head of an empty list\n"
              "    (head '())\n", buf_);

    buf_.clear();
    EXPECT_FALSE(interp->ExecuteString("(tail '())"));
    EXPECT_TRUE(Contains("error(011): cannot get the tail of an empty list\n"));
}

TEST_F(InterpreterTest, LastValue) {
    auto interp = CreateInterpreter();
    EXPECT_EQ("()", interp->last_value()->ToString());
    EXPECT_TRUE(interp->ExecuteString("(+ 1 2)"));
    EXPECT_TRUE(interp->ExecuteString("(* _ 2)"));
    EXPECT_EQ("6", interp->last_value()->ToString());

    // Failed forms keep the last value.
    EXPECT_FALSE(interp->ExecuteString("(head '())"));
    EXPECT_EQ("6", interp->last_value()->ToString());
    EXPECT_FALSE(interp->ExecuteString("(define _ 1)"));
    EXPECT_TRUE(Contains("error(028): reserved identifier"));
}

TEST_F(InterpreterTest, ErrorAbortsOnlyTheForm) {
    auto interp = CreateInterpreter();
    EXPECT_FALSE(interp->ExecuteString("(undefined-name) (+ 1 1)"));
    EXPECT_EQ("error(001): undefined identifier\n"
              "    undefined-name\n"
              "2\n", buf_);
}

TEST_F(InterpreterTest, ParsingErrorStops) {
    auto interp = CreateInterpreter();
    EXPECT_FALSE(interp->ExecuteString("(+ 1 1) (+ 1"));
    EXPECT_TRUE(Contains("2\n"));
    EXPECT_TRUE(Contains("error(005): unclosed list\n"));
}

TEST_F(InterpreterTest, Structs) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString(
        "(define-struct point [x y])\n"
        "(define p (make-point 3 4))\n"
        "(list (point-x p) (point-y p) (is-point? p))"));
    EXPECT_EQ("(3 4 true)\n", buf_);

    buf_.clear();
    EXPECT_FALSE(interp->ExecuteString("(point-z p)"));
    EXPECT_TRUE(Contains("error(029): struct does not contain specified "
                         "field\n"));
}

TEST_F(InterpreterTest, StructCeiling) {
    options_.max_struct_types = 1;
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString("(define-struct a [x])"));
    EXPECT_FALSE(interp->ExecuteString("(define-struct b [x])"));
    EXPECT_TRUE(Contains("error(030): failed to define new struct; too many "
                         "structs\n"));
    EXPECT_EQ(1, interp->structs()->size());
}

TEST_F(InterpreterTest, DefaultStructCeiling) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString(
        "(define count 0)\n"
        "(define (go)\n"
        "  (begin (define-struct s [x]) (set! count {count + 1}) (go)))\n"
        "(try (go) error-code)\n"
        "count"));
    EXPECT_EQ("30\n1024\n", buf_);
    EXPECT_EQ(kDefaultMaxStructTypes, interp->structs()->size());
    EXPECT_TRUE(interp->structs()->is_full());

    buf_.clear();
    EXPECT_FALSE(interp->ExecuteString("(define-struct t [y])"));
    EXPECT_TRUE(Contains("error(030): failed to define new struct; too many "
                         "structs\n"));
}

TEST_F(InterpreterTest, Arity) {
    auto interp = CreateInterpreter();
    EXPECT_FALSE(interp->ExecuteString("(define (f a b) a) (f 1)"));
    EXPECT_EQ("error(004): arity mismatch\n"
              "    `f' expected 2, found 1\n", buf_);
}

TEST_F(InterpreterTest, SwapMacro) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString(
        "(define-macro-rule (swap! a b)\n"
        "  (let ([tmp a]) (begin (set! a b) (set! b tmp))))\n"
        "(define x 1)\n"
        "(define y 2)\n"
        "(swap! x y)\n"
        "(list x y)"));
    EXPECT_EQ("(2 1)\n", buf_);
}

TEST_F(InterpreterTest, Infix) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString("(eq? '{1 + 2 + 3} '(+ 1 2 3))"));
    EXPECT_TRUE(interp->ExecuteString("{1 + 2 + 3}"));
    EXPECT_EQ("true\n6\n", buf_);

    buf_.clear();
    EXPECT_FALSE(interp->ExecuteString("{1 + 2 - 3}"));
    EXPECT_TRUE(Contains("error(006): infix functions must be identical\n"));
}

TEST_F(InterpreterTest, FormatString) {
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString(
        "(define name \"world\") (display #\"hello #{name}!\") (newline)"));
    EXPECT_EQ("hello world!\n", buf_);

    buf_.clear();
    EXPECT_TRUE(interp->ExecuteString(
        "(define x 5)\n"
        "#\"v #{(string-concat \\\"<\\\" (format \\\"a\\\" x))} end\""));
    EXPECT_EQ("\"v <a5 end\"\n", buf_);
}

TEST_F(InterpreterTest, BatchDoesNotEcho) {
    options_.interactive = false;
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString("(+ 1 2) (display \"x\")"));
    EXPECT_EQ("x", buf_);
    EXPECT_EQ("()", interp->last_value()->ToString());
}

TEST_F(InterpreterTest, Execute) {
    options_.interactive = false;
    streams_->PutInputStream("lib.rl", "(define (sq x) (* x x))");
    streams_->PutInputStream("main.rl", "(import \"lib.rl\")\n"
                                        "(display (sq 7))");
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->Execute("main.rl"));
    EXPECT_EQ("49", buf_);

    buf_.clear();
    EXPECT_FALSE(interp->Execute("none.rl"));
    EXPECT_TRUE(Contains("error(014): could not read file\n"));
}

TEST_F(InterpreterTest, Repl) {
    auto interp = CreateInterpreter();
    FixedMemoryInputStream input("(define x 1)\n"
                                 "(+ x\n"
                                 "   2)\n"
                                 "{1 + 2 - 3}\n"
                                 "(exit 7)\n"
                                 "(display \"unreachable\")\n");
    interp->Repl(&input);
    EXPECT_EQ(0u, buf_.find("rlisp> rlisp> ... 3\n"
                            "rlisp> error(006): infix functions must be "
                            "identical\n"));
    EXPECT_TRUE(interp->should_exit());
    EXPECT_EQ(7, interp->exit_code());
    EXPECT_FALSE(Contains("unreachable"));
}

TEST_F(InterpreterTest, ReplReadsFromSameInput) {
    auto interp = CreateInterpreter();
    FixedMemoryInputStream input("(readline)\n"
                                 "typed text\n");
    interp->Repl(&input);
    EXPECT_TRUE(Contains("\"typed text\"\n"));
    EXPECT_FALSE(interp->should_exit());
}

TEST_F(InterpreterTest, ReplStrayCloser) {
    auto interp = CreateInterpreter();
    FixedMemoryInputStream input(")\n"
                                 "(+ 1 2)\n");
    interp->Repl(&input);
    EXPECT_TRUE(Contains("rlisp> error(005): "));
    EXPECT_TRUE(Contains("rlisp> 3\n"));
}

TEST_F(InterpreterTest, CallFramesAreReleased) {
    options_.interactive = false;
    auto interp = CreateInterpreter();
    EXPECT_TRUE(interp->ExecuteString(
        "(define (outer n) (let ([g (lambda [x] x)]) (g n)))\n"
        "(define (inner n) (begin (define (h x) x) (h n)))\n"
        "(define (loop i)\n"
        "  (if {i < 1000} (begin (outer i) (inner i) (loop {i + 1})) i))\n"
        "(display (loop 0))"));
    EXPECT_EQ("1000", buf_);
    EXPECT_EQ(1, interp->collector()->size());

    // A closure kept in the global frame keeps its frames.
    EXPECT_TRUE(interp->ExecuteString(
        "(define (counter)\n"
        "  (let ([n 0]) (lambda [] (begin (set! n {n + 1}) n))))\n"
        "(define c (counter))\n"
        "(c)\n"
        "(display (c))"));
    EXPECT_EQ("10002", buf_);
    EXPECT_EQ(3, interp->collector()->size());

    EXPECT_TRUE(interp->ExecuteString("(define c 0)"));
    EXPECT_EQ(1, interp->collector()->size());
}

TEST_F(InterpreterTest, BadOptions) {
    options_.max_eval_depth = 0;
    Interpreter interp(options_, streams_, output_);
    EXPECT_FALSE(interp.Init());
}

} // namespace rlisp
