#ifndef RLISP_QUATERNION_H_
#define RLISP_QUATERNION_H_

#include "base.h"
#include <string>

namespace rlisp {

/**
 * a + bi + cj + dk
 */
struct Quaternion {
    rlisp_float_t a;
    rlisp_float_t b;
    rlisp_float_t c;
    rlisp_float_t d;

    static Quaternion FromReal(rlisp_float_t x) { return {x, 0, 0, 0}; }

    bool IsReal() const { return b == 0 && c == 0 && d == 0; }

    bool HasNaN() const;

    rlisp_float_t Norm() const;

    // Norm of the vector part.
    rlisp_float_t VectorNorm() const;

    Quaternion Conjugate() const { return {a, -b, -c, -d}; }

    Quaternion Scale(rlisp_float_t k) const {
        return {a * k, b * k, c * k, d * k};
    }

    Quaternion Inverse() const;

    Quaternion Add(const Quaternion &rhs) const {
        return {a + rhs.a, b + rhs.b, c + rhs.c, d + rhs.d};
    }

    Quaternion Sub(const Quaternion &rhs) const {
        return {a - rhs.a, b - rhs.b, c - rhs.c, d - rhs.d};
    }

    // Hamilton product, not commutative.
    Quaternion Mul(const Quaternion &rhs) const;

    // this * rhs^-1
    Quaternion Div(const Quaternion &rhs) const { return Mul(rhs.Inverse()); }

    Quaternion Exp() const;

    Quaternion Ln() const;

    // e^(exponent * ln(this))
    Quaternion Pow(const Quaternion &exponent) const;

    bool Equals(const Quaternion &rhs) const {
        return a == rhs.a && b == rhs.b && c == rhs.c && d == rhs.d;
    }

    /**
     * "1+2i-3j+0.5k", zero parts are omitted.
     */
    std::string ToString() const;
}; // struct Quaternion

} // namespace rlisp

#endif // RLISP_QUATERNION_H_
