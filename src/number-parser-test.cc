#include "number-parser.h"
#include "gtest/gtest.h"
#include <string.h>

namespace rlisp {

TEST(NumberParserTest, Sanity) {
    bool ok = true;
    ASSERT_EQ(0, NumberParser::ParseDecimalInt("0", 1, &ok));
    ASSERT_TRUE(ok);
}

TEST(NumberParserTest, IntParsing) {
    bool ok = true;
    EXPECT_EQ(127, NumberParser::ParseDecimalInt("127", 3, &ok));
    EXPECT_TRUE(ok);

    EXPECT_EQ(-128, NumberParser::ParseDecimalInt("-128", 4, &ok));
    EXPECT_TRUE(ok);

    EXPECT_EQ(42, NumberParser::ParseDecimalInt("+42", 3, &ok));
    EXPECT_TRUE(ok);
}

TEST(NumberParserTest, IntLimits) {
    bool ok = true;
    const char *max = "9223372036854775807";
    EXPECT_EQ(INT64_MAX, NumberParser::ParseDecimalInt(max, strlen(max), &ok));
    EXPECT_TRUE(ok);

    const char *min = "-9223372036854775808";
    EXPECT_EQ(INT64_MIN, NumberParser::ParseDecimalInt(min, strlen(min), &ok));
    EXPECT_TRUE(ok);

    const char *overflow = "9223372036854775808";
    NumberParser::ParseDecimalInt(overflow, strlen(overflow), &ok);
    EXPECT_FALSE(ok);
}

TEST(NumberParserTest, IntIncorrectChar) {
    bool ok = true;
    EXPECT_EQ(0, NumberParser::ParseDecimalInt("12b", 3, &ok));
    EXPECT_FALSE(ok);

    ok = true;
    EXPECT_EQ(0, NumberParser::ParseDecimalInt("-", 1, &ok));
    EXPECT_FALSE(ok);
}

TEST(NumberParserTest, FloatParsing) {
    bool ok = false;
    EXPECT_DOUBLE_EQ(1.5, NumberParser::ParseFloat("1.5", 3, &ok));
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(-0.25, NumberParser::ParseFloat("-.25", 4, &ok));
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(3.0, NumberParser::ParseFloat("3.", 2, &ok));
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(1e3, NumberParser::ParseFloat("1e3", 3, &ok));
    EXPECT_TRUE(ok);
}

TEST(NumberParserTest, NotFloat) {
    bool ok = true;
    NumberParser::ParseFloat("inf", 3, &ok);
    EXPECT_FALSE(ok);

    ok = true;
    NumberParser::ParseFloat(".", 1, &ok);
    EXPECT_FALSE(ok);

    ok = true;
    NumberParser::ParseFloat("1e", 2, &ok);
    EXPECT_FALSE(ok);

    ok = true;
    NumberParser::ParseFloat("1.2.3", 5, &ok);
    EXPECT_FALSE(ok);
}

} // namespace rlisp
