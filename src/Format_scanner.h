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

#ifndef TFMT_FORMAT_SCANNER_H
#define TFMT_FORMAT_SCANNER_H 1

#include "Format_number.h"

namespace tfmt {

enum struct TokenKind : unsigned char {
    literal,
    directive,
};

struct Token
{
    TokenKind   kind = TokenKind::literal;
    string_view text;       // The literal text, or the complete directive including the '~'
    char        code = '\0'; // Directive code, folded to lower case
    FixedSpec   fixed;      // Parameters of ~w,dF
};

// Splits a template into literal text and directives.
//
// Forward-only: each call to next() returns the next token. Directive codes
// are not validated here, with the exception of the ~w,dF prefix. The prefix
// has the form [digits][,[digits]] and must be followed by 'f' or 'F'.
class TFMT_VISIBILITY_DEFAULT Scanner
{
    char const* const begin_;
    char const*       next_;
    char const* const end_;

public:
    explicit Scanner(string_view tmpl)
        : begin_(tmpl.data())
        , next_(tmpl.data())
        , end_(tmpl.data() + tmpl.size())
    {
    }

    // Returns true if the whole template has been consumed.
    bool done() const { return next_ == end_; }

    // Returns the offset of the next character to be scanned.
    // After an error, this is the position of the offending character.
    size_t offset() const { return static_cast<size_t>(next_ - begin_); }

    // Reads the next token.
    // Returns ErrorCode::malformed_directive if the template ends with a
    // single '~', or if the ~w,dF prefix is invalid.
    // PRE: !done()
    TFMT_API ErrorCode next(Token& tok);
};

} // namespace tfmt

#endif // TFMT_FORMAT_SCANNER_H
