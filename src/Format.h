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

#ifndef TFMT_FORMAT_H
#define TFMT_FORMAT_H 1

#include "Format_args.h"
#include "Format_core.h"
#include "Format_value.h"

namespace tfmt {

//
// Directives (case-insensitive):
//
//      ~a      display the next argument
//      ~s      write the next argument
//      ~w      write the next argument, labeling all shared structure
//      ~d      exact integer in decimal
//      ~x      exact integer in hexadecimal
//      ~o      exact integer in octal
//      ~b      exact integer in binary
//      ~c      character
//      ~y      pretty print the next argument
//      ~?      format the next argument (a template) using the argument after
//              it (a list or vector) as its arguments. Also ~k.
//      ~w,dF   fixed format number or string
//      ~~      tilde
//      ~t      tab
//      ~%      newline
//      ~&      newline, unless at the start of a line
//      ~_      space
//      ~h      help
//

namespace impl {

TFMT_API ErrorCode DoFormat(Writer& w, Heap const& heap, string_view tmpl, Value const* args, size_t nargs);

} // namespace impl

// Returns the text written by ~h.
TFMT_API string_view help_text();

template <typename ...Args>
ErrorCode format(Writer& w, Heap const& heap, string_view tmpl, ArgPack<Args...> const& args)
{
    return ::tfmt::impl::DoFormat(w, heap, tmpl, args.data(), args.size());
}

inline ErrorCode format(Writer& w, Heap const& heap, string_view tmpl, FormatArgs const& args)
{
    return ::tfmt::impl::DoFormat(w, heap, tmpl, args.data(), args.size());
}

template <typename ...Args>
ErrorCode format(Writer& w, Heap const& heap, string_view tmpl, Args const&... args)
{
    return ::tfmt::format(w, heap, tmpl, ArgPack<Args...>(args...));
}

} // namespace tfmt

#endif // TFMT_FORMAT_H
