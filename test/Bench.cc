#include "../src/Format.h"
#include "../src/Format_string.h"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <string>
#include <vector>

template <typename ...Args>
static void Format(benchmark::State& state, tfmt::Heap const& heap, char const* tmpl, Args const&... args)
{
    std::string str;
    tfmt::StringWriter w{str};

    auto const ec = tfmt::format(w, heap, tmpl, args...);
    if (ec != tfmt::ErrorCode{})
        state.SkipWithError("format failed");

    benchmark::DoNotOptimize(str.data());
}

static void warm_up(benchmark::State& state)
{
    tfmt::Heap heap;

    while (state.KeepRunning())
        Format(state, heap, "~a", 123);
}
BENCHMARK(warm_up);
BENCHMARK(warm_up);
BENCHMARK(warm_up);

#define TEST_INT(NAME, FORMAT) \
    static void test_##NAME(benchmark::State& state) \
    { \
        tfmt::Heap heap; \
        std::mt19937 rng; \
        std::uniform_int_distribution<int64_t> dist; \
\
        while (state.KeepRunning()) \
            Format(state, heap, FORMAT, dist(rng)); \
    } \
    BENCHMARK(test_##NAME); \
    /**/

TEST_INT(int_dec,       "~d");
TEST_INT(int_hex,       "~x");
TEST_INT(int_bin,       "~b");
TEST_INT(int_fixed,     "~30,2F");

#define TEST_DOUBLE(NAME, FORMAT) \
    static void test_##NAME(benchmark::State& state) \
    { \
        tfmt::Heap heap; \
        std::mt19937 rng; \
        std::uniform_real_distribution<double> dist(0.0, 1.0e6); \
\
        while (state.KeepRunning()) \
            Format(state, heap, FORMAT, dist(rng)); \
    } \
    BENCHMARK(test_##NAME); \
    /**/

TEST_DOUBLE(double_natural,     "~a");
TEST_DOUBLE(double_fixed_2,     "~,2F");
TEST_DOUBLE(double_fixed_17,    "~,17F");
TEST_DOUBLE(double_fixed_w20,   "~20,6F");

static void test_text(benchmark::State& state)
{
    tfmt::Heap heap;
    auto const str = heap.string("Hello, world!");

    while (state.KeepRunning())
        Format(state, heap, "~a ~s~%~8,3F~&", str, str, str);
}
BENCHMARK(test_text);

static tfmt::Value MakeList(tfmt::Heap& heap, int length)
{
    std::vector<tfmt::Value> elems;
    for (int i = 0; i < length; ++i)
        elems.push_back(heap.list({i, heap.symbol("sym"), 0.5}));

    return heap.list(elems.data(), elems.size());
}

static void test_write_list(benchmark::State& state)
{
    tfmt::Heap heap;
    auto const list = MakeList(heap, static_cast<int>(state.range(0)));

    while (state.KeepRunning())
        Format(state, heap, "~s", list);
}
BENCHMARK(test_write_list)->Arg(10)->Arg(1000);

static void test_write_shared(benchmark::State& state)
{
    tfmt::Heap heap;
    auto const list = MakeList(heap, static_cast<int>(state.range(0)));

    while (state.KeepRunning())
        Format(state, heap, "~w", list);
}
BENCHMARK(test_write_shared)->Arg(10)->Arg(1000);

static void test_pretty(benchmark::State& state)
{
    tfmt::Heap heap;
    auto const list = MakeList(heap, static_cast<int>(state.range(0)));

    while (state.KeepRunning())
        Format(state, heap, "~y", list);
}
BENCHMARK(test_pretty)->Arg(10)->Arg(100);

static void test_indirect(benchmark::State& state)
{
    tfmt::Heap heap;
    auto const sub = heap.string("~a-~a");
    auto const args = heap.list({1, 2});

    while (state.KeepRunning())
        Format(state, heap, "<~?>", sub, args);
}
BENCHMARK(test_indirect);

BENCHMARK_MAIN();
