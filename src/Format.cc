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

#include "Format.h"
#include "Format_number.h"
#include "Format_pretty.h"
#include "Format_scanner.h"
#include "Format_write.h"

#include <vector>

using namespace tfmt;
using namespace tfmt::impl;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

tfmt::Writer::~Writer() noexcept
{
}

static constexpr char kHelpText[] =
    "Directives (case-insensitive):\n"
    "  ~a      display the next argument\n"
    "  ~s      write the next argument\n"
    "  ~w      write the next argument, with labels for shared structure\n"
    "  ~d      exact integer, decimal\n"
    "  ~x      exact integer, hexadecimal\n"
    "  ~o      exact integer, octal\n"
    "  ~b      exact integer, binary\n"
    "  ~c      character\n"
    "  ~y      pretty print the next argument\n"
    "  ~?      template and argument list, formatted recursively (also ~k)\n"
    "  ~w,dF   number or string in a field of width w with d digits after the point\n"
    "  ~~      tilde\n"
    "  ~t      tab\n"
    "  ~%      newline\n"
    "  ~&      newline, unless already at the start of a line\n"
    "  ~_      space\n"
    "  ~h      this help\n";

string_view tfmt::help_text()
{
    return string_view(kHelpText, sizeof(kHelpText) - 1);
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static ErrorCode FormatRadix(Writer& w, Value val, int base)
{
    if (!val.is_integer())
        return ErrorCode::type_mismatch;

    return FormatInteger(w, val.as_integer(), base);
}

static ErrorCode FormatChar(Writer& w, Value val)
{
    if (!val.is_character())
        return ErrorCode::type_mismatch;

    return w.put(val.as_char());
}

// ~? and ~k.
// The nested call writes into the same Writer, so that ~& sees what the
// nested template has written.
static ErrorCode FormatIndirect(Writer& w, Heap const& heap, ArgCursor& args)
{
    Value tmpl;
    if (Failed ec = args.next(tmpl))
        return ec;

    Value seq;
    if (Failed ec = args.next(seq))
        return ec;

    if (!tmpl.is_string())
        return ErrorCode::type_mismatch;

    std::vector<Value> sub_args;
    if (!heap.list_to_values(seq, sub_args))
        return ErrorCode::type_mismatch;

    return DoFormat(w, heap, heap.text(tmpl), sub_args.data(), sub_args.size()); // Recursive!!!
}

static bool ConsumesValue(char code)
{
    switch (code)
    {
    case 'a':
    case 's':
    case 'w':
    case 'd':
    case 'x':
    case 'o':
    case 'b':
    case 'c':
    case 'y':
    case 'f':
        return true;
    default:
        return false;
    }
}

static ErrorCode FormatDirective(Writer& w, Heap const& heap, Token const& tok, ArgCursor& args)
{
    switch (tok.code)
    {
    case '~':
        return w.put('~');
    case 't':
        return w.put('\t');
    case '%':
        return w.put('\n');
    case '&':
        return w.fresh_line();
    case '_':
        return w.put(' ');
    case 'h':
        return w.write(help_text());
    case '?':
    case 'k':
        return FormatIndirect(w, heap, args);
    }

    if (!ConsumesValue(tok.code))
        return ErrorCode::malformed_directive;

    Value val;
    if (Failed ec = args.next(val))
        return ec;

    switch (tok.code)
    {
    case 'a':
        return WriteValue(w, heap, val, WriteMode::display);
    case 's':
        return WriteValue(w, heap, val, WriteMode::write);
    case 'w':
        return WriteValue(w, heap, val, WriteMode::shared);
    case 'd':
        return FormatRadix(w, val, 10);
    case 'x':
        return FormatRadix(w, val, 16);
    case 'o':
        return FormatRadix(w, val, 8);
    case 'b':
        return FormatRadix(w, val, 2);
    case 'c':
        return FormatChar(w, val);
    case 'y':
        return PrettyPrint(w, heap, val);
    case 'f':
        return FormatFixed(w, heap, tok.fixed, val);
    }

    assert(!"unhandled directive"); // internal error
    return ErrorCode::malformed_directive;
}

ErrorCode tfmt::impl::DoFormat(Writer& w, Heap const& heap, string_view tmpl, Value const* args, size_t nargs)
{
    ArgCursor cursor{args, nargs};
    Scanner   scanner{tmpl};

    while (!scanner.done())
    {
        Token tok;
        if (Failed ec = scanner.next(tok))
            return ec;

        if (tok.kind == TokenKind::literal)
        {
            if (Failed ec = w.write(tok.text))
                return ec;
        }
        else
        {
            if (Failed ec = FormatDirective(w, heap, tok, cursor))
                return ec;
        }
    }

    return cursor.finish();
}
