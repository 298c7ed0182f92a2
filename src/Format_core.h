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

#ifndef TFMT_FORMAT_CORE_H
#define TFMT_FORMAT_CORE_H 1

#include <cassert>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <string_view>

#ifdef _MSC_VER
#  define TFMT_VISIBILITY_DEFAULT
#else
#  define TFMT_VISIBILITY_DEFAULT __attribute__((visibility("default")))
#endif

#ifdef TFMT_SHARED
#  ifdef _MSC_VER
#    ifdef TFMT_EXPORT
#      define TFMT_API __declspec(dllexport)
#    else
#      define TFMT_API __declspec(dllimport)
#    endif
#  else
#    ifdef TFMT_EXPORT
#      define TFMT_API TFMT_VISIBILITY_DEFAULT
#    else
#      define TFMT_API
#    endif
#  endif
#else
#  define TFMT_API
#endif

namespace tfmt {

using string_view = std::string_view;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

enum struct ErrorCode {
    success = 0,
    malformed_directive,    // '~' at end of template, bad ~w,dF prefix or unknown directive
    argument_underflow,     // A directive needs an argument, but there are none left
    argument_overflow,      // Unused arguments after the template has been processed
    type_mismatch,          // Argument does not have the shape required by the directive
    io_error,               // Writer failed.
};

// Wraps an error code, may be checked for failure.
// Replaces ErrorCode::operator bool() in most cases (and is more explicit).
struct Failed
{
    ErrorCode const ec = ErrorCode::success;

    Failed() = default;
    Failed(ErrorCode ec_) : ec(ec_) {}
    explicit operator bool() const { return ec != ErrorCode::success; }

    operator ErrorCode() const { return ec; }
};

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

// The base class for output sinks.
//
// Keeps track of whether the last character written was a newline. The flag
// belongs to the sink, not to a single call: it is shared by nested ~? calls
// and by consecutive format calls writing into the same Writer.
class TFMT_VISIBILITY_DEFAULT Writer
{
    bool at_line_start_ = true;

public:
    TFMT_API virtual ~Writer() noexcept;

    // Returns true if nothing has been written yet, or if the last character
    // written was a newline.
    bool at_line_start() const { return at_line_start_; }

    // Write a character to the output stream.
    ErrorCode put(char c)
    {
        if (Failed ec = Put(c))
            return ec;

        at_line_start_ = (c == '\n');
        return {};
    }

    // Insert a range of characters into the output stream.
    ErrorCode write(char const* str, size_t len)
    {
        if (len == 0)
            return {};
        if (Failed ec = Write(str, len))
            return ec;

        at_line_start_ = (str[len - 1] == '\n');
        return {};
    }

    ErrorCode write(string_view str) { return write(str.data(), str.size()); }

    // Insert a character multiple times into the output stream.
    ErrorCode pad(char c, size_t count)
    {
        if (count == 0)
            return {};
        if (Failed ec = Pad(c, count))
            return ec;

        at_line_start_ = (c == '\n');
        return {};
    }

    // Start a new line unless already at the start of one.
    ErrorCode fresh_line() { return at_line_start_ ? ErrorCode{} : put('\n'); }

private:
    virtual ErrorCode Put(char c) = 0;
    virtual ErrorCode Write(char const* str, size_t len) = 0;
    virtual ErrorCode Pad(char c, size_t count) = 0;
};

} // namespace tfmt

#endif // TFMT_FORMAT_CORE_H
