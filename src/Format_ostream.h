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

#ifndef TFMT_FORMAT_OSTREAM_H
#define TFMT_FORMAT_OSTREAM_H 1

#include "Format.h"

#include <ostream>

namespace tfmt {

// Writes directly into the stream buffer of a std::ostream.
// Sets the stream's badbit if the buffer fails.
class TFMT_VISIBILITY_DEFAULT StreamWriter : public Writer
{
public:
    std::ostream& os;

    explicit StreamWriter(std::ostream& os_) : os(os_) {}

private:
    TFMT_API ErrorCode Put(char c) override;
    TFMT_API ErrorCode Write(char const* str, size_t len) override;
    TFMT_API ErrorCode Pad(char c, size_t count) override;
};

namespace impl {

TFMT_API ErrorCode DoFormat(std::ostream& os, Heap const& heap, string_view tmpl, Value const* args, size_t nargs);

} // namespace impl

template <typename ...Args>
ErrorCode format(std::ostream& os, Heap const& heap, string_view tmpl, ArgPack<Args...> const& args)
{
    return ::tfmt::impl::DoFormat(os, heap, tmpl, args.data(), args.size());
}

inline ErrorCode format(std::ostream& os, Heap const& heap, string_view tmpl, FormatArgs const& args)
{
    return ::tfmt::impl::DoFormat(os, heap, tmpl, args.data(), args.size());
}

template <typename ...Args>
ErrorCode format(std::ostream& os, Heap const& heap, string_view tmpl, Args const&... args)
{
    return ::tfmt::format(os, heap, tmpl, ArgPack<Args...>(args...));
}

} // namespace tfmt

#endif // TFMT_FORMAT_OSTREAM_H
