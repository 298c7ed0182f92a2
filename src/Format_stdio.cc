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

#include "Format_stdio.h"

#include <algorithm> // min
#include <cstring>

using namespace tfmt;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

ErrorCode tfmt::FILEWriter::Put(char c) noexcept
{
    if (EOF == std::fputc(c, file_))
        return ErrorCode::io_error;

    size_ += 1;
    return {};
}

ErrorCode tfmt::FILEWriter::Write(char const* ptr, size_t len) noexcept
{
    size_t n = std::fwrite(ptr, 1, len, file_);

    // Count the number of characters successfully transmitted.
    size_ += n;
    return n == len ? ErrorCode{} : ErrorCode::io_error;
}

ErrorCode tfmt::FILEWriter::Pad(char c, size_t count) noexcept
{
    size_t const kBlockSize = 32;

    char block[kBlockSize];
    std::memset(block, static_cast<unsigned char>(c), kBlockSize);

    while (count > 0)
    {
        auto const n = std::min(count, kBlockSize);
        if (Failed ec = FILEWriter::Write(block, n))
            return ec;
        count -= n;
    }

    return {};
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

ErrorCode tfmt::impl::DoFormat(std::FILE* file, Heap const& heap, string_view tmpl, Value const* args, size_t nargs)
{
    FILEWriter w{file};
    return ::tfmt::impl::DoFormat(w, heap, tmpl, args, nargs);
}
