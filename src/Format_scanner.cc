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

#include "Format_scanner.h"

#include <algorithm>
#include <limits>

using namespace tfmt;

static bool IsDigit(char ch) { return '0' <= ch && ch <= '9'; }

static char ToLower(char ch) { return ('A' <= ch && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch; }

static bool ParseInt(int& value, char const*& f, char const* end)
{
    assert(f != end && IsDigit(*f)); // internal error
    auto const f0 = f;

    int x = *f - '0';

    while (++f != end && IsDigit(*f))
    {
        if ((f - f0) + 1 > std::numeric_limits<int>::digits10)
        {
            if (x > INT_MAX / 10 || (*f - '0') > INT_MAX - 10 * x)
                return false;
        }

        x = 10 * x + (*f - '0');
    }

    value = x;
    return true;
}

static ErrorCode ParseFixedPrefix(FixedSpec& spec, char const*& f, char const* end)
{
    if (IsDigit(*f))
    {
        if (!ParseInt(spec.width, f, end))
            return ErrorCode::malformed_directive;
    }

    if (f != end && *f == ',')
    {
        ++f;
        if (f != end && IsDigit(*f))
        {
            if (!ParseInt(spec.prec, f, end))
                return ErrorCode::malformed_directive;
        }
    }

    if (f == end || ToLower(*f) != 'f')
        return ErrorCode::malformed_directive;

    return {};
}

ErrorCode tfmt::Scanner::next(Token& tok)
{
    assert(!done());

    char const* const f0 = next_;

    if (*next_ != '~')
    {
        next_ = std::find(next_, end_, '~');

        tok.kind = TokenKind::literal;
        tok.text = string_view(f0, static_cast<size_t>(next_ - f0));
        tok.code = '\0';
        tok.fixed = FixedSpec{};
        return {};
    }

    ++next_; // skip '~'
    if (next_ == end_)
        return ErrorCode::malformed_directive;

    FixedSpec spec;
    if (IsDigit(*next_) || *next_ == ',')
    {
        if (Failed ec = ParseFixedPrefix(spec, next_, end_))
            return ec;
    }

    tok.kind = TokenKind::directive;
    tok.code = ToLower(*next_);
    tok.fixed = spec;

    ++next_; // skip code
    tok.text = string_view(f0, static_cast<size_t>(next_ - f0));

    return {};
}
