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

#ifndef TFMT_FORMAT_WRITE_H
#define TFMT_FORMAT_WRITE_H 1

#include "Format_value.h"

namespace tfmt {

enum struct WriteMode : unsigned char {
    display,    // Human readable (~a): strings and characters unquoted
    write,      // Machine readable (~s)
    shared,     // Machine readable, all shared structure labeled (~w)
};

//
// Writes VAL.
//
// Pairs and vectors which are reachable from themselves are always printed
// using datum labels, so that the output is finite:
//
//      #1=(a b c . #1#)
//
// In WriteMode::shared, every pair or vector which is reachable more than
// once is labeled, whether it is part of a cycle or not:
//
//      (#1=(x) #1#)
//
// Labels are numbered from 1, in the order in which sharing is discovered by a
// depth-first traversal.
//
TFMT_API ErrorCode WriteValue(Writer& w, Heap const& heap, Value val, WriteMode mode);

// Writes a value which is neither a pair nor a vector.
TFMT_API ErrorCode WriteAtom(Writer& w, Heap const& heap, Value val, bool display);

// Returns whether VAL is reachable from itself, or contains such a value.
TFMT_API bool ContainsCycle(Heap const& heap, Value val);

} // namespace tfmt

#endif // TFMT_FORMAT_WRITE_H
