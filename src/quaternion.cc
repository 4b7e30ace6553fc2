#include "quaternion.h"
#include <math.h>
#include <stdio.h>
#include <cmath>

namespace rlisp {

bool Quaternion::HasNaN() const {
    return std::isnan(a) || std::isnan(b) || std::isnan(c) || std::isnan(d);
}

rlisp_float_t Quaternion::Norm() const {
    return sqrt(a * a + b * b + c * c + d * d);
}

rlisp_float_t Quaternion::VectorNorm() const {
    return sqrt(b * b + c * c + d * d);
}

Quaternion Quaternion::Inverse() const {
    auto squared = a * a + b * b + c * c + d * d;
    return Conjugate().Scale(1.0 / squared);
}

Quaternion Quaternion::Mul(const Quaternion &rhs) const {
    return {
        a * rhs.a - b * rhs.b - c * rhs.c - d * rhs.d,
        a * rhs.b + b * rhs.a + c * rhs.d - d * rhs.c,
        a * rhs.c - b * rhs.d + c * rhs.a + d * rhs.b,
        a * rhs.d + b * rhs.c - c * rhs.b + d * rhs.a,
    };
}

// e^a * (cos|v| + v/|v| * sin|v|)
Quaternion Quaternion::Exp() const {
    auto scale = exp(a);
    auto v = VectorNorm();
    if (v == 0) {
        return FromReal(scale);
    }
    auto k = scale * sin(v) / v;
    return {scale * cos(v), b * k, c * k, d * k};
}

// ln|q| + v/|v| * acos(a/|q|)
Quaternion Quaternion::Ln() const {
    auto norm = Norm();
    auto v = VectorNorm();
    if (v == 0) {
        if (a >= 0) {
            return FromReal(log(a));
        }
        // Principal value on the i axis.
        return {log(-a), M_PI, 0, 0};
    }
    auto k = acos(a / norm) / v;
    return {log(norm), b * k, c * k, d * k};
}

Quaternion Quaternion::Pow(const Quaternion &exponent) const {
    return exponent.Mul(Ln()).Exp();
}

std::string Quaternion::ToString() const {
    if (HasNaN()) {
        return "nan";
    }

    static const char *const kUnits[] = {"", "i", "j", "k"};
    const rlisp_float_t parts[] = {a, b, c, d};
    std::string buf;
    char tmp[64];
    for (int i = 0; i < 4; ++i) {
        if (parts[i] == 0) {
            continue;
        }
        snprintf(tmp, arraysize(tmp), buf.empty() ? "%.15g%s" : "%+.15g%s",
                 parts[i], kUnits[i]);
        buf.append(tmp);
    }
    return buf.empty() ? "0" : buf;
}

} // namespace rlisp
