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

#ifndef TFMT_FORMAT_PRETTY_H
#define TFMT_FORMAT_PRETTY_H 1

#include "Format_value.h"

namespace tfmt {

// Maximum line length the pretty printer tries to keep to.
static constexpr int kPrettyLineWidth = 79;

//
// Pretty-prints VAL (~y), followed by a newline.
//
// Values which fit into the remaining line are written as by WriteValue in
// WriteMode::write. Longer lists are broken into one element per line, each
// element indented one column past the opening parenthesis:
//
//      (define
//       (f x)
//       (g x))
//
// Vectors are broken in the same way, indented two columns past the '#'.
// Values containing a cycle are written on a single line, using datum labels.
//
TFMT_API ErrorCode PrettyPrint(Writer& w, Heap const& heap, Value val);

} // namespace tfmt

#endif // TFMT_FORMAT_PRETTY_H
