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

#ifndef TFMT_FORMAT_STDIO_H
#define TFMT_FORMAT_STDIO_H 1

#include "Format.h"

#include <cstdio>

namespace tfmt {

// Write to std::FILE's, keeping track of the number of characters (successfully) transmitted.
class TFMT_VISIBILITY_DEFAULT FILEWriter : public Writer
{
    std::FILE* const file_;
    size_t           size_ = 0;

public:
    explicit FILEWriter(std::FILE* v) : file_(v) {
        assert(file_ != nullptr);
    }

    // Returns the FILE stream.
    std::FILE* file() const { return file_; }

    // Returns the number of bytes successfully transmitted (since construction).
    size_t size() const { return size_; }

private:
    TFMT_API ErrorCode Put(char c) noexcept override;
    TFMT_API ErrorCode Write(char const* ptr, size_t len) noexcept override;
    TFMT_API ErrorCode Pad(char c, size_t count) noexcept override;
};

namespace impl {

TFMT_API ErrorCode DoFormat(std::FILE* file, Heap const& heap, string_view tmpl, Value const* args, size_t nargs);

} // namespace impl

//
// Each call uses a new FILEWriter, which assumes that the stream is at the
// start of a line. Use format(Writer&, ...) with a long-lived FILEWriter to
// keep track of ~& across calls.
//

template <typename ...Args>
ErrorCode format(std::FILE* file, Heap const& heap, string_view tmpl, ArgPack<Args...> const& args)
{
    return ::tfmt::impl::DoFormat(file, heap, tmpl, args.data(), args.size());
}

inline ErrorCode format(std::FILE* file, Heap const& heap, string_view tmpl, FormatArgs const& args)
{
    return ::tfmt::impl::DoFormat(file, heap, tmpl, args.data(), args.size());
}

template <typename ...Args>
ErrorCode format(std::FILE* file, Heap const& heap, string_view tmpl, Args const&... args)
{
    return ::tfmt::format(file, heap, tmpl, ArgPack<Args...>(args...));
}

} // namespace tfmt

#endif // TFMT_FORMAT_STDIO_H
