#ifndef RLISP_NUMBER_PARSER_H_
#define RLISP_NUMBER_PARSER_H_

#include "base.h"

namespace rlisp {

class NumberParser {
public:
    /**
     * [+-]digits, fails if the literal can not fit `rlisp_int_t'.
     */
    static rlisp_int_t ParseDecimalInt(const char *z, size_t n, bool *ok);

    /**
     * [+-]digits[.digits][(e|E)[+-]digits], at least one digit is required
     * before the exponent. `inf' and `nan' are not numbers.
     */
    static rlisp_float_t ParseFloat(const char *z, size_t n, bool *ok);

    static bool IsDecimalInt(const char *z, size_t n);

private:
    NumberParser() = delete;
    ~NumberParser() = delete;
}; // class NumberParser

} // namespace rlisp

#endif // RLISP_NUMBER_PARSER_H_
