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

#ifndef TFMT_FORMAT_STRING_H
#define TFMT_FORMAT_STRING_H 1

#include "Format.h"

#include <string>
#include <utility>

namespace tfmt {

namespace impl {

TFMT_API ErrorCode DoFormat(std::string& str, Heap const& heap, string_view tmpl, Value const* args, size_t nargs);

} // namespace impl

// Appends to a std::string.
class TFMT_VISIBILITY_DEFAULT StringWriter : public Writer
{
public:
    std::string& str;

    explicit StringWriter(std::string& s) : str(s) {}

private:
    TFMT_API ErrorCode Put(char c) override;
    TFMT_API ErrorCode Write(char const* ptr, size_t len) override;
    TFMT_API ErrorCode Pad(char c, size_t count) override;
};

template <typename ...Args>
ErrorCode format(std::string& str, Heap const& heap, string_view tmpl, ArgPack<Args...> const& args)
{
    return ::tfmt::impl::DoFormat(str, heap, tmpl, args.data(), args.size());
}

inline ErrorCode format(std::string& str, Heap const& heap, string_view tmpl, FormatArgs const& args)
{
    return ::tfmt::impl::DoFormat(str, heap, tmpl, args.data(), args.size());
}

template <typename ...Args>
ErrorCode format(std::string& str, Heap const& heap, string_view tmpl, Args const&... args)
{
    return ::tfmt::format(str, heap, tmpl, ArgPack<Args...>(args...));
}

struct StringFormatResult
{
    std::string str;
    ErrorCode ec = ErrorCode{};

    StringFormatResult() = default;
    StringFormatResult(std::string str_, ErrorCode ec_) : str(std::move(str_)), ec(ec_) {}

    // Test for successful conversion
    explicit operator bool() const { return ec == ErrorCode{}; }
};

// Formats into a new string.
// On error, str holds the output produced before the error was detected.
template <typename ...Args>
StringFormatResult string_format(Heap const& heap, string_view tmpl, Args const&... args)
{
    StringFormatResult r;
    r.ec = ::tfmt::format(r.str, heap, tmpl, args...);
    return r;
}

} // namespace tfmt

#endif // TFMT_FORMAT_STRING_H
