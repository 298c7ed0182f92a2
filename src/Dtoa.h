// Copyright (c) 2017 Alexander Bolz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#ifndef TFMT_DTOA_H
#define TFMT_DTOA_H 1

//------------------------------------------------------------------------------
// NOTE:
//
// All the conversion functions defined here require a non-negative finite
// IEEE-754 double precision value!!!
//
// No infinity, no NaN, no negative zero!!!
//------------------------------------------------------------------------------

namespace dtoa {

// Maximum number of digits after the decimal point which may be non-zero.
// (denorm_min = [751 digits] 10^-323)
static constexpr int kMaxPrecision = 1074;

// Values >= kFixedLimit are not printed in fixed notation.
static constexpr double kFixedLimit = 1e21;

// Buffer sizes sufficient for all inputs satisfying the preconditions.
static constexpr int kFixedBufferSize       = 21 + 1 + kMaxPrecision + 1/*null*/;
static constexpr int kExponentialBufferSize = 1 + 1 + kMaxPrecision + 6 + 1/*null*/;
static constexpr int kShortestBufferSize    = 32;

// Separates the digits from the exponent in exponential notation.
// Positive exponents have no sign and no leading zeros.
static constexpr char kExponentChar = 'e';

// Like printf("%#.*f"), but without the sign:
// Converts D into the style ddd.ddd, where the number of digits after the
// decimal-point character is equal to PRECISION. The decimal point is always
// printed, even if PRECISION is zero. At least
// one digit appears before the decimal point. The value is rounded to the
// appropriate number of digits.
//
// Returns the number of characters written.
//
// PRE: 0 <= d < kFixedLimit
// PRE: 0 <= precision <= kMaxPrecision
// PRE: bufsize >= kFixedBufferSize
int ToFixed(char* buf, int bufsize, double d, int precision);

// Like printf("%#.*e"), but without the sign:
// Converts D into the style d.ddde-dd, with one digit before the decimal
// point and PRECISION digits after it. The decimal point is always printed.
//
// Returns the number of characters written.
//
// PRE: 0 <= precision <= kMaxPrecision
// PRE: bufsize >= kExponentialBufferSize
int ToExponential(char* buf, int bufsize, double d, int precision);

// The natural representation of an inexact real:
//
// Converts D into the shortest string which reads back as D. Uses a decimal
// notation if the decimal exponent n of the shortest digit string satisfies
// -6 < n <= 21, and an exponential notation otherwise. Integral values in
// decimal notation get a trailing ".0" so that they read back as inexact.
//
//      1.0     32.0    0.5     1e21    1.5e-7
//
// Returns the number of characters written.
//
// PRE: bufsize >= kShortestBufferSize
int ToShortest(char* buf, int bufsize, double d);

} // namespace dtoa

#endif // TFMT_DTOA_H
