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

#ifndef TFMT_FORMAT_VALUE_H
#define TFMT_FORMAT_VALUE_H 1

#include "Format_core.h"

#include <initializer_list>
#include <string>
#include <vector>

namespace tfmt {

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

enum struct Type : unsigned char {
    null,       // The empty list '()
    boolean,
    character,
    integer,    // Exact
    rational,   // Exact, never has a denominator of 1
    real,       // Inexact
    complex,    // Inexact
    string,     // Heap
    symbol,     // Heap
    pair,       // Heap
    vector,     // Heap
};

struct Rational { int64_t num; int64_t den; };
struct Complex  { double re; double im; };

// A formatting argument.
//
// Values are small and trivially copyable. Strings, symbols, pairs and vectors
// are handles into a Heap and are only meaningful together with the Heap
// which created them.
class TFMT_VISIBILITY_DEFAULT Value
{
    friend class Heap;

    Type type_ = Type::null;
    union {
        bool     boolean_;
        char     char_;
        int64_t  integer_;
        Rational rational_;
        double   real_;
        Complex  complex_;
        uint32_t index_;
    };

public:
    // Constructs the empty list.
    Value() : integer_(0) {}

    Value(bool      v) : type_(Type::boolean),   boolean_(v) {}
    Value(char      v) : type_(Type::character), char_(v) {}
    Value(int       v) : type_(Type::integer),   integer_(v) {}
    Value(long      v) : type_(Type::integer),   integer_(v) {}
    Value(long long v) : type_(Type::integer),   integer_(v) {}
    Value(unsigned  v) : type_(Type::integer),   integer_(v) {}
    // PRE: v <= INT64_MAX
    Value(unsigned long      v) : type_(Type::integer), integer_(static_cast<int64_t>(v)) { assert(v <= static_cast<unsigned long>(INT64_MAX)); }
    Value(unsigned long long v) : type_(Type::integer), integer_(static_cast<int64_t>(v)) { assert(v <= static_cast<unsigned long long>(INT64_MAX)); }
    Value(double    v) : type_(Type::real),      real_(v) {}

    // Strings must be allocated in a Heap.
    Value(char const*) = delete;

    // Returns num/den in lowest terms, or an integer if den divides num.
    // If the reduced denominator cannot be made positive without overflow
    // (num or den is INT64_MIN and den < 0), returns the inexact quotient.
    // PRE: den != 0
    static TFMT_API Value rational(int64_t num, int64_t den);

    static Value complex(double re, double im)
    {
        Value v;
        v.type_ = Type::complex;
        v.complex_ = {re, im};
        return v;
    }

    Type type() const { return type_; }

    bool is_null()      const { return type_ == Type::null; }
    bool is_boolean()   const { return type_ == Type::boolean; }
    bool is_character() const { return type_ == Type::character; }
    bool is_integer()   const { return type_ == Type::integer; }
    bool is_string()    const { return type_ == Type::string; }
    bool is_symbol()    const { return type_ == Type::symbol; }
    bool is_pair()      const { return type_ == Type::pair; }
    bool is_vector()    const { return type_ == Type::vector; }

    bool is_number() const {
        return type_ == Type::integer || type_ == Type::rational || type_ == Type::real || type_ == Type::complex;
    }

    // Pairs and vectors may be shared and may be part of a cycle.
    bool is_compound() const { return type_ == Type::pair || type_ == Type::vector; }

    bool     as_bool()     const { assert(is_boolean());              return boolean_; }
    char     as_char()     const { assert(is_character());            return char_; }
    int64_t  as_integer()  const { assert(is_integer());              return integer_; }
    Rational as_rational() const { assert(type_ == Type::rational);   return rational_; }
    double   as_real()     const { assert(type_ == Type::real);       return real_; }
    Complex  as_complex()  const { assert(type_ == Type::complex);    return complex_; }

    // Returns the Heap slot of a string, symbol, pair or vector.
    uint32_t index() const
    {
        assert(type_ == Type::string || type_ == Type::symbol || is_compound());
        return index_;
    }
};

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

// Owns the heap allocated parts of Values.
//
// Pairs and vectors are identified by their slot index, which is what the
// shared-structure writer uses to detect sharing and cycles.
class TFMT_VISIBILITY_DEFAULT Heap
{
    struct Pair { Value car; Value cdr; };

    std::vector<Pair>               pairs_;
    std::vector<std::vector<Value>> vectors_;
    std::vector<std::string>        strings_; // Strings and symbol names

public:
    TFMT_API Value string(string_view str);
    TFMT_API Value symbol(string_view name);

    TFMT_API Value cons(Value car, Value cdr);

    // Returns the list (x1 x2 ... xn . tail).
    TFMT_API Value list(Value const* first, size_t count, Value tail = Value());
    TFMT_API Value list(std::initializer_list<Value> elems);

    TFMT_API Value vector(Value const* first, size_t count);
    TFMT_API Value vector(std::initializer_list<Value> elems);

    // Returns the text of a string or the name of a symbol.
    string_view text(Value v) const
    {
        assert(v.is_string() || v.is_symbol());
        assert(v.index_ < strings_.size());
        return strings_[v.index_];
    }

    Value car(Value p) const { return pair(p).car; }
    Value cdr(Value p) const { return pair(p).cdr; }

    void set_car(Value p, Value x) { pair(p).car = x; }
    void set_cdr(Value p, Value x) { pair(p).cdr = x; }

    size_t vector_size(Value v) const { return elements(v).size(); }

    Value vector_ref(Value v, size_t i) const
    {
        assert(i < elements(v).size());
        return elements(v)[i];
    }

    void vector_set(Value v, size_t i, Value x)
    {
        assert(i < elements(v).size());
        elements(v)[i] = x;
    }

    // Stores the elements of a proper list or a vector in OUT.
    // Returns false if SEQ is neither, e.g. an improper or circular list.
    TFMT_API bool list_to_values(Value seq, std::vector<Value>& out) const;

private:
    Pair const& pair(Value p) const
    {
        assert(p.is_pair());
        assert(p.index_ < pairs_.size());
        return pairs_[p.index_];
    }

    Pair& pair(Value p)
    {
        assert(p.is_pair());
        assert(p.index_ < pairs_.size());
        return pairs_[p.index_];
    }

    std::vector<Value> const& elements(Value v) const
    {
        assert(v.is_vector());
        assert(v.index_ < vectors_.size());
        return vectors_[v.index_];
    }

    std::vector<Value>& elements(Value v)
    {
        assert(v.is_vector());
        assert(v.index_ < vectors_.size());
        return vectors_[v.index_];
    }

    static Value MakeHandle(Type type, size_t index)
    {
        assert(index <= UINT32_MAX);

        Value v;
        v.type_ = type;
        v.index_ = static_cast<uint32_t>(index);
        return v;
    }
};

} // namespace tfmt

#endif // TFMT_FORMAT_VALUE_H
