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

#include "Format_pretty.h"
#include "Format_write.h"

using namespace tfmt;

namespace {

// Counts the characters which would have been written.
class LengthWriter : public Writer
{
    size_t length_ = 0;

public:
    size_t length() const { return length_; }

private:
    ErrorCode Put(char /*c*/) override
    {
        ++length_;
        return {};
    }

    ErrorCode Write(char const* /*str*/, size_t len) override
    {
        length_ += len;
        return {};
    }

    ErrorCode Pad(char /*c*/, size_t count) override
    {
        length_ += count;
        return {};
    }
};

struct PP
{
    Writer&     w;
    Heap const& heap;

    ErrorCode NewLine(size_t indent)
    {
        if (Failed ec = w.put('\n'))
            return ec;
        if (Failed ec = w.pad(' ', indent))
            return ec;

        return {};
    }

    ErrorCode Print(Value val, size_t indent);
    ErrorCode PrintList(Value val, size_t indent);
    ErrorCode PrintVector(Value val, size_t indent);
};

ErrorCode PP::Print(Value val, size_t indent)
{
    if (!val.is_compound())
        return WriteValue(w, heap, val, WriteMode::write);

    LengthWriter flat;
    if (Failed ec = WriteValue(flat, heap, val, WriteMode::write))
        return ec;

    if (indent + flat.length() <= static_cast<size_t>(kPrettyLineWidth))
        return WriteValue(w, heap, val, WriteMode::write);

    return val.is_vector() ? PrintVector(val, indent) : PrintList(val, indent);
}

ErrorCode PP::PrintList(Value val, size_t indent)
{
    size_t const inner = indent + 1;

    if (Failed ec = w.put('('))
        return ec;
    if (Failed ec = Print(heap.car(val), inner)) // Recursive!!!
        return ec;

    Value x = heap.cdr(val);
    while (x.is_pair())
    {
        if (Failed ec = NewLine(inner))
            return ec;
        if (Failed ec = Print(heap.car(x), inner)) // Recursive!!!
            return ec;

        x = heap.cdr(x);
    }

    if (!x.is_null())
    {
        if (Failed ec = NewLine(inner))
            return ec;
        if (Failed ec = w.write(". ", 2))
            return ec;
        if (Failed ec = Print(x, inner + 2)) // Recursive!!!
            return ec;
    }

    if (Failed ec = w.put(')'))
        return ec;

    return {};
}

ErrorCode PP::PrintVector(Value val, size_t indent)
{
    size_t const inner = indent + 2;

    if (Failed ec = w.write("#(", 2))
        return ec;

    size_t const n = heap.vector_size(val);
    for (size_t i = 0; i < n; ++i)
    {
        if (Failed ec = (i == 0) ? ErrorCode{} : NewLine(inner))
            return ec;
        if (Failed ec = Print(heap.vector_ref(val, i), inner)) // Recursive!!!
            return ec;
    }

    if (Failed ec = w.put(')'))
        return ec;

    return {};
}

} // namespace

ErrorCode tfmt::PrettyPrint(Writer& w, Heap const& heap, Value val)
{
    if (ContainsCycle(heap, val))
    {
        if (Failed ec = WriteValue(w, heap, val, WriteMode::write))
            return ec;
    }
    else
    {
        PP pp{w, heap};
        if (Failed ec = pp.Print(val, 0))
            return ec;
    }

    return w.put('\n');
}
