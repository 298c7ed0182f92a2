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

#include "Format_string.h"

using namespace tfmt;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

ErrorCode tfmt::StringWriter::Put(char c)
{
    str.push_back(c);
    return ErrorCode::success;
}

ErrorCode tfmt::StringWriter::Write(char const* ptr, size_t len)
{
    str.append(ptr, len);
    return ErrorCode::success;
}

ErrorCode tfmt::StringWriter::Pad(char c, size_t count)
{
    str.append(count, c);
    return ErrorCode::success;
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

ErrorCode tfmt::impl::DoFormat(std::string& str, Heap const& heap, string_view tmpl, Value const* args, size_t nargs)
{
    StringWriter w{str};
    return ::tfmt::impl::DoFormat(w, heap, tmpl, args, nargs);
}
