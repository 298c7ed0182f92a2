#include "../src/Format.h"
#include "../src/Format_ostream.h"
#include "../src/Format_scanner.h"
#include "../src/Format_stdio.h"
#include "../src/Format_string.h"
#include "../src/Format_system_error.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using tfmt::ErrorCode;
using tfmt::Heap;
using tfmt::StringFormatResult;
using tfmt::Value;
using tfmt::string_view;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static constexpr size_t kBufferSize = 8 * 1024;

#ifdef __linux__
struct FILEFormatter
{
    template <typename ...Args>
    static StringFormatResult do_format(Heap const& heap, string_view tmpl, Args const&... args)
    {
        char buf[kBufferSize] = {0};
        FILE* f = fmemopen(buf, kBufferSize, "w");
        REQUIRE(f != nullptr);
        const auto ec = tfmt::format(f, heap, tmpl, args...);
        fclose(f); // flush!
        return { std::string(buf), ec };
    }
};
#endif

struct WriterFormatter
{
    template <typename ...Args>
    static StringFormatResult do_format(Heap const& heap, string_view tmpl, Args const&... args)
    {
        std::string str;
        tfmt::StringWriter w{str};
        const auto ec = tfmt::format(w, heap, tmpl, args...);
        return { str, ec };
    }
};

struct StringFormatter
{
    template <typename ...Args>
    static StringFormatResult do_format(Heap const& heap, string_view tmpl, Args const&... args)
    {
        return tfmt::string_format(heap, tmpl, args...);
    }
};

struct StreamFormatter
{
    template <typename ...Args>
    static StringFormatResult do_format(Heap const& heap, string_view tmpl, Args const&... args)
    {
        std::ostringstream os;
        const auto ec = tfmt::format(os, heap, tmpl, args...);
        return { os.str(), ec };
    }
};

// Formats using all sinks and checks that they agree.
template <typename ...Args>
static StringFormatResult FormatArgsTemplate(Heap const& heap, string_view tmpl, Args const&... args)
{
    auto const res = StringFormatter::do_format(heap, tmpl, args...);

#ifdef __linux__
    {
        auto const x = FILEFormatter::do_format(heap, tmpl, args...);
        REQUIRE(res.ec == x.ec);
        REQUIRE(res.str == x.str);
    }
#endif
    {
        auto const x = StreamFormatter::do_format(heap, tmpl, args...);
        REQUIRE(res.ec == x.ec);
        REQUIRE(res.str == x.str);
    }
    {
        auto const x = WriterFormatter::do_format(heap, tmpl, args...);
        REQUIRE(res.ec == x.ec);
        REQUIRE(res.str == x.str);
    }

    return res;
}

template <typename ...Args>
static std::string FormatArgs(Heap const& heap, string_view tmpl, Args const&... args)
{
    auto const res = FormatArgsTemplate(heap, tmpl, args...);
    CHECK(ErrorCode{} == res.ec);
    return res.str;
}

template <typename ...Args>
static ErrorCode FormatError(Heap const& heap, string_view tmpl, Args const&... args)
{
    return FormatArgsTemplate(heap, tmpl, args...).ec;
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Literals")
{
    Heap heap;

    CHECK(""                        == FormatArgs(heap, ""));
    CHECK("x"                       == FormatArgs(heap, "x"));
    CHECK("Hello, world!"           == FormatArgs(heap, "Hello, world!"));
    CHECK("{} %s %d"                == FormatArgs(heap, "{} %s %d"));
    CHECK("~"                       == FormatArgs(heap, "~~"));
    CHECK("a~b"                     == FormatArgs(heap, "a~~b"));
    CHECK("\n"                      == FormatArgs(heap, "~%"));
    CHECK("a\tb c"                  == FormatArgs(heap, "a~tb~_c"));
    CHECK("a\tb c"                  == FormatArgs(heap, "a~Tb~_c"));
    CHECK("one\ntwo\n"              == FormatArgs(heap, "one~%two~%"));
}

TEST_CASE("FreshLine")
{
    Heap heap;

    CHECK(""                        == FormatArgs(heap, "~&"));
    CHECK(""                        == FormatArgs(heap, "~&~&"));
    CHECK("\n"                      == FormatArgs(heap, "~%~&"));
    CHECK("\n"                      == FormatArgs(heap, "~%~&~&"));
    CHECK("a\nb"                    == FormatArgs(heap, "a~&b"));
    CHECK("a\nb"                    == FormatArgs(heap, "a\n~&b"));
    CHECK("1\n"                     == FormatArgs(heap, "~a~&", 1));
}

TEST_CASE("FreshLine_Recursion")
{
    Heap heap;

    // The nested template ends with a newline, so the outer ~& does nothing.
    CHECK("xa\ny"                   == FormatArgs(heap, "x~?~&y", heap.string("a~%"), Value()));
    CHECK("xa\ny"                   == FormatArgs(heap, "x~?~&y", heap.string("a"), Value()));
    CHECK("x\ny"                    == FormatArgs(heap, "x~?y", heap.string("~&"), Value()));
    CHECK("x\ny"                    == FormatArgs(heap, "x~%~?y", heap.string("~&"), Value()));
}

TEST_CASE("FreshLine_Writer")
{
    Heap heap;

    std::string str;
    tfmt::StringWriter w{str};

    CHECK(w.at_line_start());
    CHECK(ErrorCode{} == tfmt::format(w, heap, "abc"));
    CHECK(!w.at_line_start());
    CHECK(ErrorCode{} == tfmt::format(w, heap, "~&def~%"));
    CHECK(w.at_line_start());
    CHECK(ErrorCode{} == tfmt::format(w, heap, "~&ghi"));
    CHECK("abc\ndef\nghi" == str);
}

TEST_CASE("ArgumentCount")
{
    Heap heap;

    CHECK(ErrorCode::argument_overflow  == FormatError(heap, "~a", 1, 2));
    CHECK(ErrorCode::argument_overflow  == FormatError(heap, "", 1));
    CHECK(ErrorCode::argument_overflow  == FormatError(heap, "~~", 1));
    CHECK(ErrorCode::argument_underflow == FormatError(heap, "~a ~a", 1));
    CHECK(ErrorCode::argument_underflow == FormatError(heap, "~a"));
    CHECK(ErrorCode::argument_underflow == FormatError(heap, "~?", heap.string("")));

    // Output written before the error stays written.
    auto const res = FormatArgsTemplate(heap, "~a ~a", 1);
    CHECK(ErrorCode::argument_underflow == res.ec);
    CHECK("1 " == res.str);
}

TEST_CASE("MalformedDirective")
{
    Heap heap;

    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~"));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "abc~"));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~5"));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~5,", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~5,2", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~5,2x", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~5,,2F", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~5a", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~-5F", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~5,-2F", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~2147483648F", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~,2147483648F", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~q"));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~z", 1));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~ "));

    auto const res = FormatArgsTemplate(heap, "abc~");
    CHECK("abc" == res.str);
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Scanner")
{
    tfmt::Scanner sc("ab~5,2Fc~%~,3f~7F~S");
    tfmt::Token tok;

    REQUIRE(!sc.done());
    REQUIRE(ErrorCode{} == sc.next(tok));
    CHECK(tfmt::TokenKind::literal == tok.kind);
    CHECK("ab" == std::string(tok.text));

    REQUIRE(ErrorCode{} == sc.next(tok));
    CHECK(tfmt::TokenKind::directive == tok.kind);
    CHECK("~5,2F" == std::string(tok.text));
    CHECK('f' == tok.code);
    CHECK(5 == tok.fixed.width);
    CHECK(2 == tok.fixed.prec);

    REQUIRE(ErrorCode{} == sc.next(tok));
    CHECK(tfmt::TokenKind::literal == tok.kind);
    CHECK("c" == std::string(tok.text));

    REQUIRE(ErrorCode{} == sc.next(tok));
    CHECK(tfmt::TokenKind::directive == tok.kind);
    CHECK('%' == tok.code);
    CHECK(0 == tok.fixed.width);
    CHECK(-1 == tok.fixed.prec);

    REQUIRE(ErrorCode{} == sc.next(tok));
    CHECK('f' == tok.code);
    CHECK(0 == tok.fixed.width);
    CHECK(3 == tok.fixed.prec);

    REQUIRE(ErrorCode{} == sc.next(tok));
    CHECK('f' == tok.code);
    CHECK(7 == tok.fixed.width);
    CHECK(-1 == tok.fixed.prec);

    REQUIRE(ErrorCode{} == sc.next(tok));
    CHECK('s' == tok.code);
    CHECK("~S" == std::string(tok.text));

    CHECK(sc.done());
}

TEST_CASE("Scanner_Errors")
{
    tfmt::Token tok;

    {
        tfmt::Scanner sc("abc~");
        REQUIRE(ErrorCode{} == sc.next(tok));
        CHECK(ErrorCode::malformed_directive == sc.next(tok));
        CHECK(4u == sc.offset());
    }
    {
        tfmt::Scanner sc("~5,2x");
        CHECK(ErrorCode::malformed_directive == sc.next(tok));
        CHECK(4u == sc.offset());
    }
    {
        tfmt::Scanner sc("~1,2,3F");
        CHECK(ErrorCode::malformed_directive == sc.next(tok));
        CHECK(4u == sc.offset());
    }
    {
        tfmt::Scanner sc("~2147483647,2147483647F");
        REQUIRE(ErrorCode{} == sc.next(tok));
        CHECK(INT_MAX == tok.fixed.width);
        CHECK(INT_MAX == tok.fixed.prec);
        CHECK(sc.done());
    }
    {
        // Unknown codes are passed through.
        tfmt::Scanner sc("~Q");
        REQUIRE(ErrorCode{} == sc.next(tok));
        CHECK('q' == tok.code);
    }
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Radix")
{
    Heap heap;

    CHECK("255 ff 377 11111111"     == FormatArgs(heap, "~d ~x ~o ~b", 255, 255, 255, 255));
    CHECK("255 ff 377 11111111"     == FormatArgs(heap, "~D ~X ~O ~B", 255, 255, 255, 255));
    CHECK("0 0 0 0"                 == FormatArgs(heap, "~d ~x ~o ~b", 0, 0, 0, 0));
    CHECK("-42 -2a -52 -101010"     == FormatArgs(heap, "~d ~x ~o ~b", -42, -42, -42, -42));
    CHECK("9223372036854775807"     == FormatArgs(heap, "~d", std::numeric_limits<int64_t>::max()));
    CHECK("-9223372036854775808"    == FormatArgs(heap, "~d", std::numeric_limits<int64_t>::min()));
    CHECK("-8000000000000000"       == FormatArgs(heap, "~x", std::numeric_limits<int64_t>::min()));
    CHECK("1234567890"              == FormatArgs(heap, "~d", 1234567890));

    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~d", 1.5));
    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~x", heap.string("ff")));
    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~o", Value::rational(1, 2)));
    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~b", 'x'));
}

TEST_CASE("Chars")
{
    Heap heap;

    CHECK("x"                       == FormatArgs(heap, "~c", 'x'));
    CHECK("xy"                      == FormatArgs(heap, "~c~C", 'x', 'y'));
    CHECK("\n"                      == FormatArgs(heap, "~c", '\n'));

    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~c", 65));
    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~c", heap.string("x")));
}

TEST_CASE("Display_Write_Atoms")
{
    Heap heap;

    CHECK("#t #f"                   == FormatArgs(heap, "~a ~a", true, false));
    CHECK("#t #f"                   == FormatArgs(heap, "~s ~s", true, false));
    CHECK("()"                      == FormatArgs(heap, "~a", Value()));
    CHECK("()"                      == FormatArgs(heap, "~s", Value()));
    CHECK("sym"                     == FormatArgs(heap, "~a", heap.symbol("sym")));
    CHECK("sym"                     == FormatArgs(heap, "~s", heap.symbol("sym")));

    CHECK("a"                       == FormatArgs(heap, "~a", 'a'));
    CHECK("#\\a"                    == FormatArgs(heap, "~s", 'a'));
    CHECK("#\\space"                == FormatArgs(heap, "~s", ' '));
    CHECK("#\\newline"              == FormatArgs(heap, "~s", '\n'));
    CHECK("#\\tab"                  == FormatArgs(heap, "~s", '\t'));
    CHECK("#\\null"                 == FormatArgs(heap, "~s", '\0'));
    CHECK("#\\x1"                   == FormatArgs(heap, "~s", '\x01'));

    auto const str = heap.string("say \"hi\"\n\\");
    CHECK("say \"hi\"\n\\"          == FormatArgs(heap, "~a", str));
    CHECK("\"say \\\"hi\\\"\\n\\\\\"" == FormatArgs(heap, "~s", str));
    CHECK("\"\""                    == FormatArgs(heap, "~s", heap.string("")));
}

TEST_CASE("Numbers")
{
    Heap heap;

    CHECK("42"                      == FormatArgs(heap, "~a", 42));
    CHECK("-42"                     == FormatArgs(heap, "~s", -42));
    CHECK("-1/3"                    == FormatArgs(heap, "~a", Value::rational(-1, 3)));
    CHECK("3/2"                     == FormatArgs(heap, "~a", Value::rational(6, 4)));
    CHECK("2"                       == FormatArgs(heap, "~a", Value::rational(6, 3)));
    CHECK("0.5"                     == FormatArgs(heap, "~a", 0.5));
    CHECK("32.0"                    == FormatArgs(heap, "~a", 32.0));
    CHECK("-0.0"                    == FormatArgs(heap, "~a", -0.0));
    CHECK("0.1"                     == FormatArgs(heap, "~a", 0.1));
    CHECK("123.456"                 == FormatArgs(heap, "~a", 123.456));
    CHECK("0.000001"                == FormatArgs(heap, "~a", 1e-6));
    CHECK("1e-7"                    == FormatArgs(heap, "~a", 1e-7));
    CHECK("1.5e-7"                  == FormatArgs(heap, "~a", 1.5e-7));
    CHECK("100000000000000000000.0" == FormatArgs(heap, "~a", 1e20));
    CHECK("1e21"                    == FormatArgs(heap, "~a", 1e21));
    CHECK("1.25e22"                 == FormatArgs(heap, "~a", 1.25e22));
    CHECK("+inf.0"                  == FormatArgs(heap, "~a", std::numeric_limits<double>::infinity()));
    CHECK("-inf.0"                  == FormatArgs(heap, "~a", -std::numeric_limits<double>::infinity()));
    CHECK("+nan.0"                  == FormatArgs(heap, "~a", std::numeric_limits<double>::quiet_NaN()));
    CHECK("1.0-2.5i"                == FormatArgs(heap, "~a", Value::complex(1.0, -2.5)));
    CHECK("0.5+2.0i"                == FormatArgs(heap, "~s", Value::complex(0.5, 2.0)));
    CHECK("0.0+inf.0i"              == FormatArgs(heap, "~s", Value::complex(0.0, std::numeric_limits<double>::infinity())));
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Fixed")
{
    Heap heap;

    CHECK("    0.33"                == FormatArgs(heap, "~8,2F", Value::rational(1, 3)));
    CHECK("    32"                  == FormatArgs(heap, "~6F", 32));
    CHECK("   32.00"                == FormatArgs(heap, "~8,2F", 32));
    CHECK("4321.00"                 == FormatArgs(heap, "~1,2F", 4321));
    CHECK("     foo"                == FormatArgs(heap, "~8,3F", heap.string("foo")));
    CHECK("foobar"                  == FormatArgs(heap, "~3,3F", heap.string("foobar")));
    CHECK("foo"                     == FormatArgs(heap, "~F", heap.string("foo")));

    CHECK("32"                      == FormatArgs(heap, "~F", 32));
    CHECK("32.5"                    == FormatArgs(heap, "~f", 32.5));
    CHECK("  1/3"                   == FormatArgs(heap, "~5F", Value::rational(1, 3)));
    CHECK("0.50"                    == FormatArgs(heap, "~,2F", 0.5));
    CHECK("0.00"                    == FormatArgs(heap, "~,2F", 0));
    CHECK("0.00"                    == FormatArgs(heap, "~,2F", 0.001));
    CHECK("4321."                   == FormatArgs(heap, "~,0F", 4321));
    CHECK("1.5000"                  == FormatArgs(heap, "~,4F", 1.5));
    CHECK("   -1.50"                == FormatArgs(heap, "~8,2F", -1.5));
    CHECK("-0.33"                   == FormatArgs(heap, "~,2F", Value::rational(-1, 3)));
    CHECK("0.0"                     == FormatArgs(heap, "~,1F", -0.0));
    CHECK("3.14159"                 == FormatArgs(heap, "~,5F", 3.14159265));
    CHECK("1.00e21"                 == FormatArgs(heap, "~,2F", 1e21));
    CHECK("-1.50e22"                == FormatArgs(heap, "~,2F", -1.5e22));
    CHECK("+inf.0"                  == FormatArgs(heap, "~,2F", std::numeric_limits<double>::infinity()));
    CHECK("  -inf.0"                == FormatArgs(heap, "~8,2F", -std::numeric_limits<double>::infinity()));

    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~8,2F", heap.symbol("foo")));
    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~8,2F", 'c'));
    CHECK(ErrorCode::type_mismatch  == FormatError(heap, "~F", heap.list({1, 2})));
}

TEST_CASE("Fixed_Complex")
{
    Heap heap;

    CHECK("1.50-2.25i"              == FormatArgs(heap, "~,2F", Value::complex(1.5, -2.25)));
    CHECK("  1.50-2.25i"            == FormatArgs(heap, "~12,2F", Value::complex(1.5, -2.25)));
    CHECK("1.0+0.5i"                == FormatArgs(heap, "~,1F", Value::complex(1.0, 0.5)));
    CHECK("-1.000+0.000i"           == FormatArgs(heap, "~,3F", Value::complex(-1.0, 0.0)));
    CHECK("1.0-2.5i"                == FormatArgs(heap, "~F", Value::complex(1.0, -2.5)));
}

TEST_CASE("Fixed_Consistency")
{
    Heap heap;

    // Fixed notation below 1e21, exponential notation from 1e21 on.
    CHECK("100000000000000000000.000"   == FormatArgs(heap, "~,3F", 1e20));
    CHECK("999999900000000016384.000"   == FormatArgs(heap, "~,3F", 9.999999e20));
    CHECK("999999999999999868928.000"   == FormatArgs(heap, "~,3F", std::nextafter(1e21, 0.0)));
    CHECK("-999999999999999868928.0"    == FormatArgs(heap, "~,1F", -std::nextafter(1e21, 0.0)));
    CHECK("1.000e21"                    == FormatArgs(heap, "~,3F", 1e21));
    CHECK("1.000e21"                    == FormatArgs(heap, "~,3F", 1.0000001e21));
    CHECK("1.e21"                       == FormatArgs(heap, "~,0F", 1e21));
    CHECK("-1.000e21"                   == FormatArgs(heap, "~,3F", -1e21));

    // The width only pads.
    double const values[] = { 1e20, 9.999999e20, 1e21, 1.0000001e21, 123456789.123, 5e-324 };
    for (double const v : values)
    {
        auto const str = FormatArgs(heap, "~,3F", v);
        REQUIRE(str.size() <= 30);
        CHECK(std::string(30 - str.size(), ' ') + str == FormatArgs(heap, "~30,3F", v));
    }
}

TEST_CASE("Fixed_Rational")
{
    Heap heap;

    // (2^54 + 1) / 3 = 6004799503160661.666...
    auto const q = Value::rational((int64_t{1} << 54) + 1, 3);
    REQUIRE(tfmt::Type::rational == q.type());

    CHECK("18014398509481985/3" == FormatArgs(heap, "~a", q));
    if (std::numeric_limits<long double>::digits >= 64)
    {
        CHECK("6004799503160662." == FormatArgs(heap, "~,0F", q));
    }

    CHECK("0.500" == FormatArgs(heap, "~,3F", Value::rational(1, 2)));
    CHECK("-2.50" == FormatArgs(heap, "~,2F", Value::rational(5, -2)));
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Lists")
{
    Heap heap;

    auto const list = heap.list({1, heap.string("two"), heap.symbol("three"), 'c'});

    CHECK("(1 two three c)"         == FormatArgs(heap, "~a", list));
    CHECK("(1 \"two\" three #\\c)"  == FormatArgs(heap, "~s", list));
    CHECK("(1 \"two\" three #\\c)"  == FormatArgs(heap, "~w", list));
    CHECK("(1 . 2)"                 == FormatArgs(heap, "~s", heap.cons(1, 2)));
    CHECK("(1 2 . 3)"               == FormatArgs(heap, "~s", heap.cons(1, heap.cons(2, 3))));
    CHECK("((1) (2 (3)))"           == FormatArgs(heap, "~s", heap.list({heap.list({1}), heap.list({2, heap.list({3})})})));
    CHECK("(())"                    == FormatArgs(heap, "~s", heap.list({Value()})));
}

TEST_CASE("Vectors")
{
    Heap heap;

    CHECK("#()"                     == FormatArgs(heap, "~s", heap.vector({})));
    CHECK("#(1 2 (3))"              == FormatArgs(heap, "~s", heap.vector({1, 2, heap.list({3})})));
    CHECK("#(\"a\" #(b))"           == FormatArgs(heap, "~s", heap.vector({heap.string("a"), heap.vector({heap.symbol("b")})})));
    CHECK("(1 . #(2))"              == FormatArgs(heap, "~s", heap.cons(1, heap.vector({2}))));
}

TEST_CASE("Shared_Cycles")
{
    Heap heap;

    auto const a = heap.symbol("a");
    auto const b = heap.symbol("b");
    auto const c = heap.symbol("c");

    auto const cyclic = heap.list({a, b, c});
    heap.set_cdr(heap.cdr(heap.cdr(cyclic)), cyclic);

    CHECK("#1=(a b c . #1#)"        == FormatArgs(heap, "~w", cyclic));
    CHECK("#1=(a b c . #1#)"        == FormatArgs(heap, "~s", cyclic));
    CHECK("#1=(a b c . #1#)"        == FormatArgs(heap, "~a", cyclic));
    CHECK("#1=(a b c . #1#)"        == FormatArgs(heap, "~W", cyclic));

    // The cycle does not start at the head of the list.
    auto const lasso = heap.list({a, b, c});
    heap.set_cdr(heap.cdr(heap.cdr(lasso)), heap.cdr(lasso));

    CHECK("(a . #1=(b c . #1#))"    == FormatArgs(heap, "~w", lasso));

    // Cycle through the car.
    auto const self = heap.list({1});
    heap.set_car(self, self);

    CHECK("#1=(#1#)"                == FormatArgs(heap, "~w", self));
    CHECK("#1=(#1#)"                == FormatArgs(heap, "~s", self));

    // Cycle through a vector.
    auto const vec = heap.vector({1, 2});
    heap.vector_set(vec, 1, vec);

    CHECK("#1=#(1 #1#)"             == FormatArgs(heap, "~w", vec));
    CHECK("#1=#(1 #1#)"             == FormatArgs(heap, "~a", vec));
}

TEST_CASE("Shared_NonCyclic")
{
    Heap heap;

    auto const x = heap.list({heap.symbol("x")});
    auto const twice = heap.list({x, x});

    CHECK("(#1=(x) #1#)"            == FormatArgs(heap, "~w", twice));
    CHECK("((x) (x))"               == FormatArgs(heap, "~s", twice));
    CHECK("((x) (x))"               == FormatArgs(heap, "~a", twice));

    auto const v = heap.vector({1});
    CHECK("(#1=#(1) #1#)"           == FormatArgs(heap, "~w", heap.list({v, v})));

    // Labels are numbered in the order in which the sharing is detected,
    // not in the order of their first appearance.
    auto const y = heap.list({heap.symbol("y")});
    CHECK("(#2=(y) #1=(x) #1# #2#)" == FormatArgs(heap, "~w", heap.list({y, x, x, y})));

    // A shared tail is written in dotted form.
    auto const tail = heap.list({2, 3});
    CHECK("((1 . #1=(2 3)) #1#)"    == FormatArgs(heap, "~w", heap.list({heap.cons(1, tail), tail})));
    CHECK("((1 2 3) (2 3))"         == FormatArgs(heap, "~s", heap.list({heap.cons(1, tail), tail})));

    // Labels are local to a single directive.
    CHECK("(#1=(x) #1#) (#1=(x) #1#)" == FormatArgs(heap, "~w ~w", twice, twice));
}

TEST_CASE("Shared_LongList")
{
    Heap heap;

    std::vector<Value> elems(100000, Value(1));
    auto const list = heap.list(elems.data(), elems.size());

    // Too large for the fmemopen buffer, use a string only.
    auto const res = tfmt::string_format(heap, "~w", list);
    REQUIRE(ErrorCode{} == res.ec);
    CHECK(2 * elems.size() + 1 == res.str.size());
    CHECK("(1 1 1" == res.str.substr(0, 6));
    CHECK("1 1)" == res.str.substr(res.str.size() - 4));
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Indirection")
{
    Heap heap;

    CHECK("a new test"              == FormatArgs(heap, "~a ~? ~a", heap.symbol("a"), heap.string("~s"), heap.list({heap.symbol("new")}), heap.symbol("test")));
    CHECK("a new test"              == FormatArgs(heap, "~a ~K ~a", heap.symbol("a"), heap.string("~s"), heap.list({heap.symbol("new")}), heap.symbol("test")));
    CHECK("<1-2>"                   == FormatArgs(heap, "<~?>", heap.string("~a-~a"), heap.list({1, 2})));
    CHECK("<1-2>"                   == FormatArgs(heap, "<~?>", heap.string("~a-~a"), heap.vector({1, 2})));
    CHECK("<>"                      == FormatArgs(heap, "<~?>", heap.string(""), Value()));
    CHECK("[(x)]"                   == FormatArgs(heap, "[~?]", heap.string("~?"), heap.list({heap.string("~s"), heap.list({heap.list({heap.symbol("x")})})})));
}

TEST_CASE("Indirection_Errors")
{
    Heap heap;

    CHECK(ErrorCode::type_mismatch       == FormatError(heap, "~?", 5, Value()));
    CHECK(ErrorCode::type_mismatch       == FormatError(heap, "~?", heap.symbol("~a"), heap.list({1})));
    CHECK(ErrorCode::type_mismatch       == FormatError(heap, "~?", heap.string("~a"), 1));
    CHECK(ErrorCode::type_mismatch       == FormatError(heap, "~?", heap.string("~a"), heap.cons(1, 2)));

    auto const circular = heap.list({1, 2});
    heap.set_cdr(heap.cdr(circular), circular);
    CHECK(ErrorCode::type_mismatch       == FormatError(heap, "~?", heap.string("~a"), circular));

    // Errors in the nested template abort the outer call.
    CHECK(ErrorCode::argument_underflow  == FormatError(heap, "~? ~a", heap.string("~a ~a"), heap.list({1}), 2));
    CHECK(ErrorCode::argument_overflow   == FormatError(heap, "~? ~a", heap.string("~a"), heap.list({1, 2}), 3));
    CHECK(ErrorCode::malformed_directive == FormatError(heap, "~? ~a", heap.string("~"), Value(), 3));

    auto const res = FormatArgsTemplate(heap, "x~?y", heap.string("a~ab~d"), heap.list({1, heap.string("2")}));
    CHECK(ErrorCode::type_mismatch == res.ec);
    CHECK("xa1b" == res.str);
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Pretty")
{
    Heap heap;

    CHECK("42\n"                    == FormatArgs(heap, "~y", 42));
    CHECK("\"s\"\n"                 == FormatArgs(heap, "~y", heap.string("s")));
    CHECK("(1 2 3)\n"               == FormatArgs(heap, "~y", heap.list({1, 2, 3})));
    CHECK("#(1 2 3)\n"              == FormatArgs(heap, "~Y", heap.vector({1, 2, 3})));

    auto const cyclic = heap.list({heap.symbol("a")});
    heap.set_cdr(cyclic, cyclic);
    CHECK("#1=(a . #1#)\n"          == FormatArgs(heap, "~y", cyclic));
}

TEST_CASE("Pretty_Break")
{
    Heap heap;

    auto const elem = heap.symbol("element");

    std::vector<Value> elems(20, elem);
    auto const list = heap.list(elems.data(), elems.size());

    std::string expected = "(element";
    for (int i = 1; i < 20; ++i)
        expected += "\n element";
    expected += ")\n";

    CHECK(expected == FormatArgs(heap, "~y", list));

    auto const vec = heap.vector(elems.data(), elems.size());

    expected = "#(element";
    for (int i = 1; i < 20; ++i)
        expected += "\n  element";
    expected += ")\n";

    CHECK(expected == FormatArgs(heap, "~y", vec));
}

TEST_CASE("Pretty_Nested")
{
    Heap heap;

    auto const elem = heap.symbol("element");

    std::vector<Value> elems(12, elem);
    auto const inner = heap.list(elems.data(), elems.size());
    auto const outer = heap.list({heap.symbol("a"), heap.list({1, 2}), inner});

    std::string expected = "(a\n (1 2)\n (element";
    for (int i = 1; i < 12; ++i)
        expected += "\n  element";
    expected += "))\n";

    CHECK(expected == FormatArgs(heap, "~y", outer));
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Help")
{
    Heap heap;

    auto const help = FormatArgs(heap, "~h");
    CHECK(std::string(tfmt::help_text()) == help);
    CHECK(help.find("~a") != std::string::npos);
    CHECK(help.find("~w,dF") != std::string::npos);
    CHECK('\n' == help.back());

    CHECK(help == FormatArgs(heap, "~H"));
}

TEST_CASE("FormatArgs")
{
    Heap heap;

    tfmt::FormatArgs args;
    args.push_back(1, heap.symbol("x"));
    args.push_back(2.5);

    CHECK("1 x 2.5"                 == FormatArgs(heap, "~a ~a ~a", args));
    CHECK(ErrorCode::argument_overflow == FormatError(heap, "~a", args));

    tfmt::FormatArgs empty;
    CHECK("~"                       == FormatArgs(heap, "~~", empty));
}

TEST_CASE("StringFormatResult")
{
    Heap heap;

    auto const ok = tfmt::string_format(heap, "~a", 1);
    CHECK(static_cast<bool>(ok));
    CHECK("1" == ok.str);

    auto const fail = tfmt::string_format(heap, "~a ~a", 1);
    CHECK(!static_cast<bool>(fail));
    CHECK(ErrorCode::argument_underflow == fail.ec);
}

TEST_CASE("ErrorCategory")
{
    std::error_code ec = ErrorCode::type_mismatch;

    CHECK(std::string("format error") == ec.category().name());
    CHECK("argument type mismatch"    == ec.message());
    CHECK("malformed directive"       == tfmt::make_error_code(ErrorCode::malformed_directive).message());
    CHECK("too few arguments"         == tfmt::make_error_code(ErrorCode::argument_underflow).message());
    CHECK("too many arguments"        == tfmt::make_error_code(ErrorCode::argument_overflow).message());
    CHECK("io error"                  == tfmt::make_error_code(ErrorCode::io_error).message());
    CHECK(!tfmt::make_error_code(ErrorCode::success));
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

TEST_CASE("Value")
{
    auto const q = Value::rational(2, -4);
    REQUIRE(tfmt::Type::rational == q.type());
    CHECK(-1 == q.as_rational().num);
    CHECK( 2 == q.as_rational().den);

    CHECK(Value::rational(4, 2).is_integer());
    CHECK(2 == Value::rational(4, 2).as_integer());
    CHECK(0 == Value::rational(0, 5).as_integer());
    CHECK(0 == Value::rational(0, -5).as_integer());

    int64_t const min = std::numeric_limits<int64_t>::min();
    int64_t const max = std::numeric_limits<int64_t>::max();

    CHECK(min == Value::rational(min, 1).as_integer());
    CHECK(min / 2 == Value::rational(min, 2).as_integer());
    CHECK(-(min / 2) == Value::rational(min, -2).as_integer());
    CHECK(1 == Value::rational(min, min).as_integer());
    CHECK(0 == Value::rational(0, min).as_integer());
    CHECK(-max == Value::rational(max, -1).as_integer());

    auto const r = Value::rational(max - 1, min);
    REQUIRE(tfmt::Type::rational == r.type());
    CHECK(-(max / 2) == r.as_rational().num);
    CHECK(-(min / 2) == r.as_rational().den);

    // -INT64_MIN is not representable.
    CHECK(tfmt::Type::real == Value::rational(max, min).type());
    REQUIRE(tfmt::Type::real == Value::rational(min, -1).type());
    CHECK(9223372036854775808.0 == Value::rational(min, -1).as_real());
    REQUIRE(tfmt::Type::real == Value::rational(1, min).type());
    CHECK(-1.0 / 9223372036854775808.0 == Value::rational(1, min).as_real());

    uint64_t const big = 1234567890123ull;
    size_t const sz = 42;
    CHECK(1234567890123 == Value(big).as_integer());
    CHECK(42 == Value(sz).as_integer());

    Heap heap;

    std::vector<Value> out;
    CHECK(heap.list_to_values(Value(), out));
    CHECK(out.empty());
    CHECK(heap.list_to_values(heap.list({1, 2, 3}), out));
    CHECK(3 == out.size());
    CHECK(heap.list_to_values(heap.vector({1, 2}), out));
    CHECK(2 == out.size());
    CHECK(!heap.list_to_values(heap.cons(1, 2), out));
    CHECK(!heap.list_to_values(Value(1), out));

    auto const tail = heap.list({3});
    Value const head[] = {1, 2};
    auto const list = heap.list(head, 2, tail);
    CHECK(heap.list_to_values(list, out));
    CHECK(3 == out.size());
    CHECK(3 == out[2].as_integer());
}
