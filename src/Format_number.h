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

#ifndef TFMT_FORMAT_NUMBER_H
#define TFMT_FORMAT_NUMBER_H 1

#include "Format_value.h"

namespace tfmt {

// Parameters of the ~w,dF directive.
struct FixedSpec
{
    int width = 0;  // Minimum field width. 0 means no padding.
    int prec  = -1; // Number of digits after the decimal point. -1 means absent.
};

// Writes VALUE in the given radix (2, 8, 10 or 16).
// No padding, no prefix, lower-case hex digits.
TFMT_API ErrorCode FormatInteger(Writer& w, int64_t value, int base);

// Writes the natural textual representation of a number, e.g.
//      42      -1/3        0.5     32.0    1e21    1.0-2.5i    +inf.0
// PRE: num.is_number()
TFMT_API ErrorCode FormatNumber(Writer& w, Value num);

// Implements ~w,dF.
//
// Strings are left-padded to spec.width, spec.prec is ignored.
// Numbers are printed with exactly spec.prec digits after the decimal point
// (after conversion to an inexact number), or in their natural representation
// if spec.prec < 0, and then left-padded to spec.width. Complex numbers have
// both parts printed with spec.prec digits. The output is never truncated.
//
// Returns ErrorCode::type_mismatch if VAL is neither a string nor a number.
TFMT_API ErrorCode FormatFixed(Writer& w, Heap const& heap, FixedSpec const& spec, Value val);

} // namespace tfmt

#endif // TFMT_FORMAT_NUMBER_H
