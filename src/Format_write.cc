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

#include "Format_write.h"
#include "Format_number.h"

#include <unordered_map>
#include <vector>

using namespace tfmt;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

struct CharName { char ch; char const* name; };

static constexpr CharName kCharNames[] = {
    {'\x00', "null"},
    {'\x07', "alarm"},
    {'\x08', "backspace"},
    {'\x09', "tab"},
    {'\x0A', "newline"},
    {'\x0D', "return"},
    {'\x1B', "escape"},
    {'\x20', "space"},
    {'\x7F', "delete"},
};

static ErrorCode WriteCharLiteral(Writer& w, char ch)
{
    if (Failed ec = w.write("#\\", 2))
        return ec;

    for (auto const& n : kCharNames)
    {
        if (n.ch == ch)
            return w.write(n.name);
    }

    auto const u = static_cast<unsigned char>(ch);
    if (u < 0x20)
    {
        if (Failed ec = w.put('x'))
            return ec;
        return FormatInteger(w, u, 16);
    }

    return w.put(ch);
}

template <typename F>
static ErrorCode ForEachEscaped(char const* str, size_t len, F func)
{
    for (size_t i = 0; i < len; ++i)
    {
        char const ch = str[i];
        switch (ch)
        {
        case '"':
        case '\\':
            if (Failed ec = func('\\')) return ec;
            if (Failed ec = func(ch)  ) return ec;
            break;
        case '\n':
            if (Failed ec = func('\\')) return ec;
            if (Failed ec = func('n') ) return ec;
            break;
        case '\r':
            if (Failed ec = func('\\')) return ec;
            if (Failed ec = func('r') ) return ec;
            break;
        case '\t':
            if (Failed ec = func('\\')) return ec;
            if (Failed ec = func('t') ) return ec;
            break;
        default:
            if (Failed ec = func(ch)) return ec;
            break;
        }
    }

    return {};
}

static ErrorCode WriteQuoted(Writer& w, string_view str)
{
    if (Failed ec = w.put('"'))
        return ec;
    if (Failed ec = ForEachEscaped(str.data(), str.size(), [&](char c) { return w.put(c); }))
        return ec;
    if (Failed ec = w.put('"'))
        return ec;

    return {};
}

ErrorCode tfmt::WriteAtom(Writer& w, Heap const& heap, Value val, bool display)
{
    switch (val.type())
    {
    case Type::null:
        return w.write("()", 2);
    case Type::boolean:
        return w.write(val.as_bool() ? "#t" : "#f", 2);
    case Type::character:
        return display ? w.put(val.as_char()) : WriteCharLiteral(w, val.as_char());
    case Type::integer:
    case Type::rational:
    case Type::real:
    case Type::complex:
        return FormatNumber(w, val);
    case Type::string:
        return display ? w.write(heap.text(val)) : WriteQuoted(w, heap.text(val));
    case Type::symbol:
        return w.write(heap.text(val));
    case Type::pair:
    case Type::vector:
        break;
    }

    assert(!"not an atom"); // internal error
    return {};
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

namespace {

struct Label
{
    int  number = 0;
    bool emitted = false;
};

// Pairs and vectors live in different slot arrays.
inline uint64_t NodeKey(Value v)
{
    return (uint64_t{v.index()} << 1) | (v.is_vector() ? 1u : 0u);
}

// The discovery pass.
//
// Finds the nodes which have to be printed with a label. A node which is seen
// again while it is still being visited is part of a cycle. A node which is
// seen again after it has been visited completely is shared, but not cyclic.
// No node is ever descended into twice, which guarantees termination.
class LabelTable
{
    enum struct Visit : unsigned char { active, done };

    Heap const& heap_;
    bool const  all_shared_;
    int         next_label_ = 1;

    std::unordered_map<uint64_t, Visit> visited_;
    std::unordered_map<uint64_t, Label> labels_;

public:
    LabelTable(Heap const& heap, bool all_shared) : heap_(heap), all_shared_(all_shared) {}

    bool empty() const { return labels_.empty(); }

    void Discover(Value val);

    // Returns the label of VAL, or null if VAL is printed without a label.
    Label* Find(Value val)
    {
        auto const I = labels_.find(NodeKey(val));
        return I != labels_.end() ? &I->second : nullptr;
    }

private:
    // Returns true if VAL has not been seen before.
    bool Enter(Value val);
};

bool LabelTable::Enter(Value val)
{
    auto const key = NodeKey(val);

    auto const res = visited_.emplace(key, Visit::active);
    if (res.second)
        return true;

    if (all_shared_ || res.first->second == Visit::active)
    {
        if (labels_.emplace(key, Label{next_label_, false}).second)
            ++next_label_;
    }

    return false;
}

void LabelTable::Discover(Value val)
{
    if (val.is_vector())
    {
        if (!Enter(val))
            return;

        size_t const n = heap_.vector_size(val);
        for (size_t i = 0; i < n; ++i)
            Discover(heap_.vector_ref(val, i)); // Recursive!!!

        visited_[NodeKey(val)] = Visit::done;
        return;
    }

    // Walk the spine of a list iteratively. The pairs of the spine are the
    // ancestors of everything reachable from the list's elements and stay
    // active until the whole list has been visited.
    std::vector<uint64_t> spine;

    Value x = val;
    while (x.is_pair())
    {
        if (!Enter(x))
            break;

        spine.push_back(NodeKey(x));
        Discover(heap_.car(x)); // Recursive!!!
        x = heap_.cdr(x);
    }

    if (x.is_vector())
        Discover(x);

    for (auto const key : spine)
        visited_[key] = Visit::done;
}

// The emission pass.
class DatumWriter
{
    Writer&     w_;
    Heap const& heap_;
    LabelTable& labels_;
    bool const  display_;

public:
    DatumWriter(Writer& w, Heap const& heap, LabelTable& labels, bool display)
        : w_(w), heap_(heap), labels_(labels), display_(display)
    {
    }

    ErrorCode Emit(Value val);

private:
    ErrorCode EmitList(Value val);
    ErrorCode EmitVector(Value val);
};

ErrorCode DatumWriter::Emit(Value val)
{
    if (!val.is_compound())
        return WriteAtom(w_, heap_, val, display_);

    if (Label* label = labels_.Find(val))
    {
        if (Failed ec = w_.put('#'))
            return ec;
        if (Failed ec = FormatInteger(w_, label->number, 10))
            return ec;

        // Never expand a labeled node twice.
        if (label->emitted)
            return w_.put('#');

        label->emitted = true;
        if (Failed ec = w_.put('='))
            return ec;
    }

    return val.is_vector() ? EmitVector(val) : EmitList(val);
}

ErrorCode DatumWriter::EmitList(Value val)
{
    if (Failed ec = w_.put('('))
        return ec;
    if (Failed ec = Emit(heap_.car(val)))
        return ec;

    Value x = heap_.cdr(val);
    for (;;)
    {
        if (x.is_null())
            break;

        if (x.is_pair() && labels_.Find(x) == nullptr)
        {
            if (Failed ec = w_.put(' '))
                return ec;
            if (Failed ec = Emit(heap_.car(x)))
                return ec;

            x = heap_.cdr(x);
            continue;
        }

        // Improper tail, or a labeled pair in cdr position.
        if (Failed ec = w_.write(" . ", 3))
            return ec;
        if (Failed ec = Emit(x))
            return ec;
        break;
    }

    if (Failed ec = w_.put(')'))
        return ec;

    return {};
}

ErrorCode DatumWriter::EmitVector(Value val)
{
    if (Failed ec = w_.write("#(", 2))
        return ec;

    size_t const n = heap_.vector_size(val);
    for (size_t i = 0; i < n; ++i)
    {
        if (Failed ec = (i == 0) ? ErrorCode{} : w_.put(' '))
            return ec;
        if (Failed ec = Emit(heap_.vector_ref(val, i)))
            return ec;
    }

    if (Failed ec = w_.put(')'))
        return ec;

    return {};
}

} // namespace

ErrorCode tfmt::WriteValue(Writer& w, Heap const& heap, Value val, WriteMode mode)
{
    if (!val.is_compound())
        return WriteAtom(w, heap, val, mode == WriteMode::display);

    LabelTable labels{heap, mode == WriteMode::shared};
    labels.Discover(val);

    DatumWriter dw{w, heap, labels, mode == WriteMode::display};
    return dw.Emit(val);
}

bool tfmt::ContainsCycle(Heap const& heap, Value val)
{
    if (!val.is_compound())
        return false;

    LabelTable labels{heap, /*all_shared*/ false};
    labels.Discover(val);

    return !labels.empty();
}
