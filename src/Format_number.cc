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

#include "Format_number.h"
#include "Dtoa.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

using namespace tfmt;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static constexpr char const* kLowerDigits = "0123456789abcdef";

static constexpr char const* kDecDigits100 =
    "00010203040506070809"
    "10111213141516171819"
    "20212223242526272829"
    "30313233343536373839"
    "40414243444546474849"
    "50515253545556575859"
    "60616263646566676869"
    "70717273747576777879"
    "80818283848586878889"
    "90919293949596979899";

// Large enough for INT64_MIN in base 2, and for the natural representation of
// any rational or complex number.
static constexpr int kNumberBufferSize = 2 * dtoa::kShortestBufferSize + 8;

static_assert(kNumberBufferSize >= 1 + 64, "buffer too small for binary integers");
static_assert(kNumberBufferSize >= 1 + 20 + 1 + 20, "buffer too small for rationals");

static constexpr int kRealBufferSize =
    dtoa::kFixedBufferSize > dtoa::kExponentialBufferSize ? dtoa::kFixedBufferSize : dtoa::kExponentialBufferSize;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static char* DecIntToAsciiBackwards(char* last/*[-20]*/, uint64_t n)
{
    while (n >= 100)
    {
        auto const q = n / 100;
        auto const r = n % 100;
        *--last = kDecDigits100[2*r + 1];
        *--last = kDecDigits100[2*r + 0];
        n = q;
    }

    if (n >= 10)
    {
        *--last = kDecDigits100[2*n + 1];
        *--last = kDecDigits100[2*n + 0];
    }
    else
    {
        *--last = kDecDigits100[2*n + 1];
    }

    return last;
}

static char* IntToAsciiBackwards(char* last/*[-64]*/, uint64_t n, int base)
{
    switch (base)
    {
    case 10:
        return DecIntToAsciiBackwards(last, n);
    case 16:
        do *--last = kLowerDigits[n & 15]; while (n >>= 4);
        return last;
    case 8:
        do *--last = kLowerDigits[n & 7]; while (n >>= 3);
        return last;
    case 2:
        do *--last = kLowerDigits[n & 1]; while (n >>= 1);
        return last;
    }

    assert(!"invalid base"); // internal error
    return last;
}

// Writes the signed integer N into [first, ...) and returns the end of the
// string.
static char* IntToChars(char* first, int64_t n, int base)
{
    char buf[1 + 64];

    char* const l = buf + sizeof(buf);
    char* f = IntToAsciiBackwards(l, n < 0 ? 0 - static_cast<uint64_t>(n) : static_cast<uint64_t>(n), base);
    if (n < 0)
        *--f = '-';

    std::memcpy(first, f, static_cast<size_t>(l - f));
    return first + (l - f);
}

static int SpecialToChars(char* buf, double x)
{
    char const* str = std::isnan(x) ? "+nan.0" : (x < 0 ? "-inf.0" : "+inf.0");

    std::memcpy(buf, str, 6);
    return 6;
}

// Writes the natural representation of an inexact real.
// PRE: bufsize >= 1 + dtoa::kShortestBufferSize
static int RealToChars(char* buf, int bufsize, double x)
{
    if (!std::isfinite(x))
        return SpecialToChars(buf, x);

    int pos = 0;
    if (std::signbit(x))
        buf[pos++] = '-';

    return pos + dtoa::ToShortest(buf + pos, bufsize - pos, std::abs(x));
}

static int NumberToChars(char* buf, int bufsize, Value num)
{
    assert(bufsize >= kNumberBufferSize);

    switch (num.type())
    {
    case Type::integer:
        return static_cast<int>(IntToChars(buf, num.as_integer(), 10) - buf);

    case Type::rational:
        {
            auto const q = num.as_rational();

            char* p = IntToChars(buf, q.num, 10);
            *p++ = '/';
            p = IntToChars(p, q.den, 10);
            return static_cast<int>(p - buf);
        }

    case Type::real:
        return RealToChars(buf, bufsize, num.as_real());

    case Type::complex:
        {
            auto const z = num.as_complex();

            int pos = RealToChars(buf, bufsize, z.re);

            char im[1 + dtoa::kShortestBufferSize];
            int const len = RealToChars(im, static_cast<int>(sizeof(im)), z.im);

            // The imaginary part always carries a sign.
            if (im[0] != '-' && im[0] != '+')
                buf[pos++] = '+';

            assert(pos + len + 1 <= bufsize);
            std::memcpy(buf + pos, im, static_cast<size_t>(len));
            pos += len;
            buf[pos++] = 'i';
            return pos;
        }

    default:
        assert(!"not a number"); // internal error
        return 0;
    }
}

static ErrorCode PrintAndPadString(Writer& w, int width, char const* str, size_t len)
{
    assert(width >= 0); // internal error

    size_t const pad = static_cast<size_t>(width) > len ? static_cast<size_t>(width) - len : 0;

    if (Failed ec = w.pad(' ', pad))
        return ec;
    if (Failed ec = w.write(str, len))
        return ec;

    return {};
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

ErrorCode tfmt::FormatInteger(Writer& w, int64_t value, int base)
{
    assert(base == 2 || base == 8 || base == 10 || base == 16);

    char buf[1 + 64];
    char* const l = IntToChars(buf, value, base);

    return w.write(buf, static_cast<size_t>(l - buf));
}

ErrorCode tfmt::FormatNumber(Writer& w, Value num)
{
    char buf[kNumberBufferSize];
    int const len = NumberToChars(buf, kNumberBufferSize, num);

    return w.write(buf, static_cast<size_t>(len));
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

namespace {

// An inexact real printed with a fixed number of digits after the decimal point.
//
// Precisions larger than dtoa::kMaxPrecision only add zeros, which are not
// stored but written on the fly.
struct FixedReal
{
    char   sign = '\0';
    char   buf[kRealBufferSize];
    int    head = 0;  // Digits, including the decimal point
    size_t zeros = 0; // Trailing zeros after the digits
    int    tail = 0;  // Exponent, stored at buf + head

    size_t size() const {
        return (sign != '\0' ? 1u : 0u) + static_cast<size_t>(head) + zeros + static_cast<size_t>(tail);
    }

    ErrorCode print(Writer& w) const
    {
        if (Failed ec = (sign == '\0') ? ErrorCode{} : w.put(sign))
            return ec;
        if (Failed ec = w.write(buf, static_cast<size_t>(head)))
            return ec;
        if (Failed ec = w.pad('0', zeros))
            return ec;
        if (Failed ec = w.write(buf + head, static_cast<size_t>(tail)))
            return ec;

        return {};
    }
};

} // namespace

// Fills R with |X|. The sign is left to the caller, unless X is not finite.
static void RenderFixedMagnitude(FixedReal& r, double x, int prec)
{
    assert(prec >= 0);

    if (!std::isfinite(x))
    {
        r.head = SpecialToChars(r.buf, x);
        return;
    }

    double const abs_x = std::abs(x);
    int    const digits = std::min(prec, dtoa::kMaxPrecision);

    r.zeros = static_cast<size_t>(prec - digits);

    if (abs_x < dtoa::kFixedLimit)
    {
        r.head = dtoa::ToFixed(r.buf, kRealBufferSize, abs_x, digits);
    }
    else
    {
        int const len = dtoa::ToExponential(r.buf, kRealBufferSize, abs_x, digits);

        auto const e = std::find(r.buf, r.buf + len, dtoa::kExponentChar);
        assert(e != r.buf + len);

        r.head = static_cast<int>(e - r.buf);
        r.tail = len - r.head;
    }
}

static void RenderFixed(FixedReal& r, double x, int prec)
{
    RenderFixedMagnitude(r, x, prec);

    if (std::isfinite(x) && x < 0)
        r.sign = '-';
}

// Returns n/d correctly rounded if both n and d are exactly representable as a
// double. Otherwise the quotient is computed with the precision of long double
// and rounded once more.
static double RationalToDouble(Rational q)
{
    static constexpr int64_t kMaxExact = int64_t{1} << std::numeric_limits<double>::digits;

    if (-kMaxExact <= q.num && q.num <= kMaxExact && q.den <= kMaxExact)
        return static_cast<double>(q.num) / static_cast<double>(q.den);

    return static_cast<double>(static_cast<long double>(q.num) / static_cast<long double>(q.den));
}

static double ToInexact(Value num)
{
    switch (num.type())
    {
    case Type::integer:
        return static_cast<double>(num.as_integer());
    case Type::rational:
        return RationalToDouble(num.as_rational());
    case Type::real:
        return num.as_real();
    default:
        assert(!"not a real number"); // internal error
        return 0.0;
    }
}

static ErrorCode FormatFixedComplex(Writer& w, int width, Complex z, int prec)
{
    FixedReal re;
    RenderFixed(re, z.re, prec);

    FixedReal im;
    RenderFixedMagnitude(im, z.im, prec);
    if (std::isfinite(z.im))
        im.sign = z.im < 0 ? '-' : '+';

    size_t const len = re.size() + im.size() + 1;
    size_t const pad = static_cast<size_t>(width) > len ? static_cast<size_t>(width) - len : 0;

    if (Failed ec = w.pad(' ', pad))
        return ec;
    if (Failed ec = re.print(w))
        return ec;
    if (Failed ec = im.print(w))
        return ec;
    if (Failed ec = w.put('i'))
        return ec;

    return {};
}

ErrorCode tfmt::FormatFixed(Writer& w, Heap const& heap, FixedSpec const& spec, Value val)
{
    assert(spec.width >= 0);

    if (val.is_string())
    {
        auto const str = heap.text(val);
        return PrintAndPadString(w, spec.width, str.data(), str.size());
    }

    if (!val.is_number())
        return ErrorCode::type_mismatch;

    if (spec.prec < 0)
    {
        char buf[kNumberBufferSize];
        int const len = NumberToChars(buf, kNumberBufferSize, val);

        return PrintAndPadString(w, spec.width, buf, static_cast<size_t>(len));
    }

    if (val.type() == Type::complex)
        return FormatFixedComplex(w, spec.width, val.as_complex(), spec.prec);

    FixedReal r;
    RenderFixed(r, ToInexact(val), spec.prec);

    size_t const len = r.size();
    size_t const pad = static_cast<size_t>(spec.width) > len ? static_cast<size_t>(spec.width) - len : 0;

    if (Failed ec = w.pad(' ', pad))
        return ec;
    if (Failed ec = r.print(w))
        return ec;

    return {};
}
