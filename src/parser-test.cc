#include "parser.h"
#include "value-factory.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "gtest/gtest.h"
#include <memory>

namespace rlisp {

class ParserTest : public ::testing::Test {
public:
    virtual void SetUp() override {
        values_ = new ValueFactory();
        streams_ = new FixedMemoryStreamFactory();
    }

    virtual void TearDown() override {
        delete streams_;
        delete values_;
    }

    Parser *CreateOnecParser(const char *z) {
        streams_->PutInputStream(":memory:", z);

        auto p = new Parser(values_, streams_);
        p->SwitchInputStream(":memory:");
        return p;
    }

    std::string ParseToString(const char *z) {
        std::unique_ptr<Parser> p(CreateOnecParser(z));

        bool ok = true;
        auto form = p->ParseForm(&ok);
        EXPECT_TRUE(ok) << p->last_error().ToString();
        if (!ok) {
            return "";
        }
        EXPECT_TRUE(p->AtEnd());
        return form->ToString();
    }

    int ParseErrorCode(const char *z) {
        std::unique_ptr<Parser> p(CreateOnecParser(z));

        bool ok = true;
        while (ok && !p->AtEnd()) {
            p->ParseForm(&ok);
        }
        EXPECT_FALSE(ok) << z;
        return p->last_error().code;
    }

    Handle<Value> ParseOne(const char *z) {
        std::unique_ptr<Parser> p(CreateOnecParser(z));

        bool ok = true;
        auto form = p->ParseForm(&ok);
        EXPECT_TRUE(ok) << p->last_error().ToString();
        return form;
    }

    ValueFactory *values_ = nullptr;
    FixedMemoryStreamFactory *streams_ = nullptr;
}; // class ParserTest

TEST_F(ParserTest, Sanity) {
    EXPECT_EQ("(define (f n) n)", ParseToString("(define (f n) n)"));
    EXPECT_EQ("(1 2.5 \"s\" sym true false '())",
              ParseToString("[1 2.5 \"s\" sym #t #f nil]"));
}

TEST_F(ParserTest, Atoms) {
    auto form = ParseOne("42");
    ASSERT_TRUE(form->IsNumber());
    EXPECT_TRUE(form->AsNumber()->is_integral());
    EXPECT_EQ(42, form->AsNumber()->int_value());

    form = ParseOne("empty");
    ASSERT_TRUE(form->IsPair());
    EXPECT_EQ("'()", form->ToString());

    form = ParseOne("\"a\\tb\"");
    ASSERT_TRUE(form->IsString());
    EXPECT_EQ("a\tb", form->AsString()->data());
}

TEST_F(ParserTest, SymbolsAreInterned) {
    std::unique_ptr<Parser> p(CreateOnecParser("foo foo"));

    bool ok = true;
    auto a = p->ParseForm(&ok);
    ASSERT_TRUE(ok);
    auto b = p->ParseForm(&ok);
    ASSERT_TRUE(ok);
    ASSERT_EQ(a.get(), b.get());
}

TEST_F(ParserTest, QuoteMarks) {
    auto form = ParseOne("'(1 2)");
    ASSERT_TRUE(form->IsPair());
    EXPECT_EQ("quote", form->AsPair()->car()->AsSymbol()->name());
    EXPECT_EQ("'(1 2)", form->ToString());

    EXPECT_EQ("`(a ,b)", ParseToString("`(a ,b)"));
}

TEST_F(ParserTest, InfixEqualsPrefix) {
    const char *cases[][2] = {
        {"{1 + 2 + 3}", "(+ 1 2 3)"},
        {"{a < b}", "(< a b)"},
        {"{(f x) ++ '(1) ++ y}", "(++ (f x) '(1) y)"},
        {"{n - {1 * 2}}", "(- n (* 1 2))"},
    };

    for (auto c : cases) {
        auto infix = ParseOne(c[0]);
        auto prefix = ParseOne(c[1]);
        EXPECT_TRUE(ValueEquals(infix.get(), prefix.get())) << c[0];
    }
}

TEST_F(ParserTest, InfixDegenerateGroups) {
    EXPECT_EQ("()", ParseToString("{}"));
    EXPECT_EQ("a", ParseToString("{a}"));
    EXPECT_EQ("(- a)", ParseToString("{a -}"));
}

TEST_F(ParserTest, InfixMixedOperators) {
    EXPECT_EQ(ERR_INFIX_NOT_IDENTICAL, ParseErrorCode("{1 + 2 - 3}"));
    EXPECT_EQ(ERR_INFIX_NOT_IDENTICAL, ParseErrorCode("{a < b > c}"));
}

TEST_F(ParserTest, UnclosedGroups) {
    EXPECT_EQ(ERR_UNCLOSED_INFIX_LIST, ParseErrorCode("{1 + 2"));
    EXPECT_EQ(ERR_UNCLOSED_LIST, ParseErrorCode("(define (f n) n"));
    EXPECT_EQ(ERR_UNCLOSED_LIST, ParseErrorCode("[1 2"));
    EXPECT_EQ(ERR_UNCLOSED_LIST, ParseErrorCode(")"));
    EXPECT_EQ(ERR_UNCLOSED_LIST, ParseErrorCode("(a ]"));
    EXPECT_EQ(ERR_UNCLOSED_STRING, ParseErrorCode("(display \"abc)"));
}

TEST_F(ParserTest, FormatString) {
    EXPECT_EQ("(format \"a \" e \" b\")", ParseToString("#\"a #{e} b\""));
    EXPECT_EQ("(format (+ 1 2))", ParseToString("#\"#{{1 + 2}}\""));
}

TEST_F(ParserTest, FormatStringFailures) {
    EXPECT_EQ(ERR_FORMAT_WITHOUT_EXPR, ParseErrorCode("#\"plain\""));
    EXPECT_EQ(ERR_FORMAT_WITHOUT_EXPR, ParseErrorCode("#\"a #{ } b\""));
    EXPECT_EQ(ERR_UNCLOSED_INTERPOLATION, ParseErrorCode("#\"a #{x b\""));
    EXPECT_EQ(ERR_PARSE_EXPRESSION, ParseErrorCode("#\"#{a b}\""));
}

TEST_F(ParserTest, ContinuesAfterFormatString) {
    std::unique_ptr<Parser> p(CreateOnecParser("(f #\"#{x}\" y) z"));

    bool ok = true;
    auto form = p->ParseForm(&ok);
    ASSERT_TRUE(ok) << p->last_error().ToString();
    EXPECT_EQ("(f (format x) y)", form->ToString());

    form = p->ParseForm(&ok);
    ASSERT_TRUE(ok);
    EXPECT_EQ("z", form->ToString());
    EXPECT_TRUE(p->AtEnd());
}

TEST_F(ParserTest, ErrorPosition) {
    std::unique_ptr<Parser> p(CreateOnecParser("(a\n  b }"));

    bool ok = true;
    p->ParseForm(&ok);
    ASSERT_FALSE(ok);

    auto err = p->last_error();
    EXPECT_EQ(ERR_UNCLOSED_LIST, err.code);
    EXPECT_EQ(2, err.line);
    EXPECT_EQ(5, err.column);
    EXPECT_EQ("[:memory:][2:5] unexpected list close: RBRACE `}'",
              err.ToString());
}

TEST_F(ParserTest, MissingInput) {
    Parser p(values_, streams_);
    auto input = p.SwitchInputStream("no-such-key");
    EXPECT_FALSE(input->error().empty());
    EXPECT_TRUE(p.AtEnd());
}

} // namespace rlisp
