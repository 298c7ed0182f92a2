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

#include "Format_value.h"

using namespace tfmt;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static int64_t Gcd(int64_t a, int64_t b)
{
    // Works on the (non-positive) negated values, so that INT64_MIN does not overflow.
    if (a > 0)
        a = -a;
    if (b > 0)
        b = -b;

    while (b != 0)
    {
        if (b == -1) // INT64_MIN % -1 overflows
            return -1;

        int64_t const r = a % b;
        a = b;
        b = r;
    }

    return a; // <= 0
}

Value tfmt::Value::rational(int64_t num, int64_t den)
{
    assert(den != 0 && "division by zero");

    // g <= 0: dividing by g flips the signs of num and den.
    int64_t const g = Gcd(num, den);
    if (g < -1)
    {
        num /= g;
        den /= g;
    }

    if (den < 0)
    {
        if (num == INT64_MIN || den == INT64_MIN)
            return Value(static_cast<double>(num) / static_cast<double>(den));

        num = -num;
        den = -den;
    }

    if (den == 1)
        return Value(static_cast<long long>(num));

    Value v;
    v.type_ = Type::rational;
    v.rational_ = {num, den};
    return v;
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

Value tfmt::Heap::string(string_view str)
{
    strings_.emplace_back(str.data(), str.size());
    return MakeHandle(Type::string, strings_.size() - 1);
}

Value tfmt::Heap::symbol(string_view name)
{
    strings_.emplace_back(name.data(), name.size());
    return MakeHandle(Type::symbol, strings_.size() - 1);
}

Value tfmt::Heap::cons(Value car, Value cdr)
{
    pairs_.push_back({car, cdr});
    return MakeHandle(Type::pair, pairs_.size() - 1);
}

Value tfmt::Heap::list(Value const* first, size_t count, Value tail)
{
    Value res = tail;
    while (count > 0)
    {
        --count;
        res = cons(first[count], res);
    }

    return res;
}

Value tfmt::Heap::list(std::initializer_list<Value> elems)
{
    return list(elems.begin(), elems.size());
}

Value tfmt::Heap::vector(Value const* first, size_t count)
{
    vectors_.emplace_back(first, first + count);
    return MakeHandle(Type::vector, vectors_.size() - 1);
}

Value tfmt::Heap::vector(std::initializer_list<Value> elems)
{
    return vector(elems.begin(), elems.size());
}

bool tfmt::Heap::list_to_values(Value seq, std::vector<Value>& out) const
{
    out.clear();

    if (seq.is_vector())
    {
        auto const& elems = elements(seq);
        out.assign(elems.begin(), elems.end());
        return true;
    }

    // Walk the spine with a second cursor moving at half speed.
    // If the two ever meet, the list is circular.
    Value slow = seq;
    Value fast = seq;
    for (;;)
    {
        if (fast.is_null())
            return true;
        if (!fast.is_pair())
            return false;

        out.push_back(car(fast));
        fast = cdr(fast);

        if (fast.is_null())
            return true;
        if (!fast.is_pair())
            return false;

        out.push_back(car(fast));
        fast = cdr(fast);

        slow = cdr(slow);
        if (fast.is_pair() && fast.index_ == slow.index_)
            return false;
    }
}
