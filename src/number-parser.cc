#include "number-parser.h"
#include "glog/logging.h"
#include <stdlib.h>
#include <string>

namespace rlisp {

namespace {

inline bool IsDigit(char c) { return c >= '0' && c <= '9'; }

size_t SkipDigits(const char *z, size_t i, size_t n) {
    while (i < n && IsDigit(z[i])) {
        ++i;
    }
    return i;
}

} // namespace

/*static*/
bool NumberParser::IsDecimalInt(const char *z, size_t n) {
    size_t i = 0;
    if (i < n && (z[i] == '-' || z[i] == '+')) {
        ++i;
    }
    if (i == n) {
        return false;
    }
    return SkipDigits(z, i, n) == n;
}

/*static*/
rlisp_int_t NumberParser::ParseDecimalInt(const char *z, size_t n, bool *ok) {
    DCHECK_NOTNULL(z);
    DCHECK_NOTNULL(ok);

    if (!IsDecimalInt(z, n)) {
        *ok = false;
        return 0;
    }

    bool negative = (z[0] == '-');
    size_t i = (z[0] == '-' || z[0] == '+') ? 1 : 0;

    // Accumulate as negative, INT64_MIN has no positive counterpart.
    int64_t rv = 0;
    for (; i < n; ++i) {
        int64_t digit = z[i] - '0';
        if (rv < (INT64_MIN + digit) / 10) {
            *ok = false;
            return 0;
        }
        rv = rv * 10 - digit;
    }
    if (!negative) {
        if (rv == INT64_MIN) {
            *ok = false;
            return 0;
        }
        rv = -rv;
    }

    *ok = true;
    return rv;
}

/*static*/
rlisp_float_t NumberParser::ParseFloat(const char *z, size_t n, bool *ok) {
    DCHECK_NOTNULL(z);
    DCHECK_NOTNULL(ok);

    size_t i = 0;
    if (i < n && (z[i] == '-' || z[i] == '+')) {
        ++i;
    }
    auto begin = i;
    i = SkipDigits(z, i, n);
    auto digits = i - begin;
    if (i < n && z[i] == '.') {
        auto dot = ++i;
        i = SkipDigits(z, i, n);
        digits += i - dot;
    }
    if (digits == 0) {
        *ok = false;
        return 0;
    }
    if (i < n && (z[i] == 'e' || z[i] == 'E')) {
        ++i;
        if (i < n && (z[i] == '-' || z[i] == '+')) {
            ++i;
        }
        auto exp = i;
        i = SkipDigits(z, i, n);
        if (i == exp) {
            *ok = false;
            return 0;
        }
    }
    if (i != n) {
        *ok = false;
        return 0;
    }

    std::string literal(z, n);
    *ok = true;
    return strtod(literal.c_str(), nullptr);
}

} // namespace rlisp
