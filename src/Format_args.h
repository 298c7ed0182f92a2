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

#ifndef TFMT_FORMAT_ARGS_H
#define TFMT_FORMAT_ARGS_H 1

#include "Format_value.h"

#include <type_traits>
#include <vector>

namespace tfmt {

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

// Hands out the arguments of one format call in order.
//
// Every consumed argument advances the cursor, it is never rewound. The
// number of consumed arguments must match the number of arguments exactly.
class ArgCursor
{
    Value const* next_;
    Value const* const end_;

public:
    ArgCursor(Value const* args, size_t nargs) : next_(args), end_(args + nargs) {
        assert(nargs == 0 || args != nullptr);
    }

    size_t remaining() const { return static_cast<size_t>(end_ - next_); }

    // Returns ErrorCode::argument_underflow if there are no arguments left.
    ErrorCode next(Value& val)
    {
        if (next_ == end_)
            return ErrorCode::argument_underflow;

        val = *next_++;
        return {};
    }

    // Returns ErrorCode::argument_overflow if not all arguments have been used.
    ErrorCode finish() const
    {
        return next_ == end_ ? ErrorCode{} : ErrorCode::argument_overflow;
    }
};

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

// Holds the arguments of a variadic format call.
template <typename ...Args>
class ArgPack
{
    static constexpr const size_t kArgs = sizeof...(Args);

    using Array = typename std::conditional< kArgs == 0, Value const*, Value const [kArgs == 0 ? 1 : kArgs] >::type;
    Array args_;

public:
    explicit ArgPack(Args const&... args) : args_{Value(args)...} {}

    Value const* data() const { return args_; }
    size_t       size() const { return kArgs; }
};

// A list of arguments which is built at runtime.
class FormatArgs
{
    std::vector<Value> values_;

public:
    FormatArgs() = default;

    Value const* data() const { return values_.data(); }
    size_t       size() const { return values_.size(); }

    // Add arguments to this list.
    template <typename ...Ts>
    void push_back(Ts const&... vals)
    {
        static_assert(sizeof...(Ts) > 0, "Too few arguments");

        int const unused[] = { (values_.push_back(Value(vals)), 0)... };
        static_cast<void>(unused);
    }
};

} // namespace tfmt

#endif // TFMT_FORMAT_ARGS_H
