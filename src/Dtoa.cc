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

#include "Dtoa.h"

#include <double-conversion/double-conversion.h>

#include <algorithm>
#include <cassert>

using namespace dtoa;
using double_conversion::DoubleToStringConverter;

static void GenerateDigits(double v, DoubleToStringConverter::DtoaMode mode, int requested_digits, char* buf, int bufsize, int* num_digits, int* decpt)
{
    assert(v >= 0);

    bool sign = false;
    DoubleToStringConverter::DoubleToAscii(v, mode, requested_digits, buf, bufsize, &sign, num_digits, decpt);

    assert(!sign);
}

static void CreateFixedRepresentation(char* buf, int num_digits, int decpt, int precision, int* length)
{
    if (decpt <= 0)
    {
        // 0.[000]digits[000]

        assert(precision == 0 || precision >= -decpt + num_digits);

        if (precision > 0)
        {
            // digits --> digits0.[000][000]

            int const nextra = 2 + (precision - num_digits);
            // nextra includes the decimal point.
            std::fill_n(buf + num_digits, nextra, '0');
            buf[num_digits + 1] = '.';

            // digits0.[000][000] --> 0.[000]digits[000]
            std::rotate(buf, buf + num_digits, buf + (num_digits + 2 + -decpt));

            *length = 2 + precision;
        }
        else
        {
            buf[0] = '0';
            buf[1] = '.';

            *length = 2;
        }

        return;
    }

    if (decpt >= num_digits)
    {
        // digits[000][.000]

        int const nzeros = decpt - num_digits;
        int const nextra = 1 + precision;
        // nextra includes the decimal point.

        std::fill_n(buf + num_digits, nzeros + nextra, '0');
        buf[decpt] = '.';

        *length = decpt + nextra;
    }
    else
    {
        // dig.its[000]

        assert(precision >= num_digits - decpt); // >= 1

        // digits --> dig.its
        std::copy_backward(buf + decpt, buf + num_digits, buf + (num_digits + 1));
        buf[decpt] = '.';
        // dig.its --> dig.its[000]
        std::fill_n(buf + (num_digits + 1), precision - (num_digits - decpt), '0');

        *length = decpt + 1 + precision;
    }
}

int dtoa::ToFixed(char* buf, int bufsize, double d, int precision)
{
    assert(d >= 0);
    assert(d < kFixedLimit);
    assert(precision >= 0);
    assert(precision <= kMaxPrecision);
    assert(bufsize >= kFixedBufferSize);

    int num_digits = 0;
    int decpt = 0;

    GenerateDigits(d, DoubleToStringConverter::FIXED, precision, buf, bufsize, &num_digits, &decpt);

    if (num_digits == 0)
    {
        // The value rounds to zero.
        decpt = -precision;
    }

    int length = 0;
    CreateFixedRepresentation(buf, num_digits, decpt, precision, &length);

    return length;
}

// Append a decimal representation of EXPONENT to BUF.
// Returns pos + number of characters written.
static int AppendExponent(char* buf, int pos, int exponent)
{
    assert(exponent > -10000);
    assert(exponent <  10000);

    buf[pos++] = kExponentChar;

    if (exponent < 0)
    {
        buf[pos++] = '-';
        exponent = -exponent;
    }

    int const k = exponent;

    if (k >= 1000) { buf[pos++] = static_cast<char>('0' + exponent / 1000); exponent %= 1000; }
    if (k >=  100) { buf[pos++] = static_cast<char>('0' + exponent /  100); exponent %=  100; }
    if (k >=   10) { buf[pos++] = static_cast<char>('0' + exponent /   10); exponent %=   10; }
    buf[pos++] = static_cast<char>('0' + exponent % 10);

    return pos;
}

static int CreateExponentialRepresentation(char* buf, int num_digits, int exponent, int precision)
{
    int pos = 0;

    pos += 1; // leading digit
    if (num_digits > 1)
    {
        // d.igits[000]e123

        std::copy_backward(buf + pos, buf + (pos + num_digits - 1), buf + (pos + num_digits));
        buf[pos] = '.';
        pos += 1 + (num_digits - 1);

        if (precision > num_digits - 1)
        {
            int const nzeros = precision - (num_digits - 1);
            std::fill_n(buf + pos, nzeros, '0');
            pos += nzeros;
        }
    }
    else if (precision > 0)
    {
        // d.0[000]e123

        std::fill_n(buf + pos, 1 + precision, '0');
        buf[pos] = '.';
        pos += 1 + precision;
    }
    else
    {
        // d.e123

        buf[pos++] = '.';
    }

    return AppendExponent(buf, pos, exponent);
}

int dtoa::ToExponential(char* buf, int bufsize, double d, int precision)
{
    assert(d >= 0);
    assert(precision >= 0);
    assert(precision <= kMaxPrecision);
    assert(bufsize >= kExponentialBufferSize);

    int num_digits = 0;
    int decpt = 0;

    GenerateDigits(d, DoubleToStringConverter::PRECISION, precision + 1, buf, bufsize, &num_digits, &decpt);

    assert(num_digits > 0);

    int const exponent = (d == 0) ? 0 : decpt - 1;
    return CreateExponentialRepresentation(buf, num_digits, exponent, precision);
}

int dtoa::ToShortest(char* buf, int bufsize, double d)
{
    assert(bufsize >= kShortestBufferSize);

    int num_digits = 0;
    int decpt = 0;

    GenerateDigits(d, DoubleToStringConverter::SHORTEST, 0, buf, bufsize, &num_digits, &decpt);

    assert(num_digits > 0);

    int const k = num_digits;
    int const n = decpt;

    if (k <= n && n <= 21)
    {
        // digits[000].0

        std::fill_n(buf + k, n - k, '0');
        buf[n] = '.';
        buf[n + 1] = '0';
        return n + 2;
    }

    if (0 < n && n <= 21)
    {
        // dig.its

        std::copy_backward(buf + n, buf + k, buf + (k + 1));
        buf[n] = '.';
        return k + 1;
    }

    if (-6 < n && n <= 0)
    {
        // 0.[000]digits

        std::copy_backward(buf, buf + k, buf + (2 + -n + k));
        buf[0] = '0';
        buf[1] = '.';
        std::fill_n(buf + 2, -n, '0');
        return 2 + (-n) + k;
    }

    // Otherwise use an exponential notation.

    if (k == 1)
    {
        // de123

        return AppendExponent(buf, /*pos*/ 1, n - 1);
    }
    else
    {
        // d.igitse123

        std::copy_backward(buf + 1, buf + k, buf + (k + 1));
        buf[1] = '.';
        return AppendExponent(buf, /*pos*/ k + 1, n - 1);
    }
}
