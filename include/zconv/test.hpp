#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <concepts>
#include <cstdlib>
#include <format>
#include <functional>
#include <print>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

// Minimal self-registering test harness. Each tests/test_*.cpp is its own
// executable ending in ZCONV_TEST_MAIN().

namespace zconv::test {

// ---------------------------------------------------------------------------
// Value printing for failure reports
// ---------------------------------------------------------------------------

template <typename T>
concept Printable = std::formattable<T, char>;

template <typename T>
concept SelfDescribing = requires(const T& v) {
    { v.to_string() } -> std::convertible_to<std::string>;
};

template <typename T>
std::string to_string_val(const T& v) {
    if constexpr (Printable<T>) {
        return std::format("{}", v);
    } else if constexpr (SelfDescribing<T>) {
        return v.to_string();
    } else if constexpr (std::is_enum_v<T>) {
        return std::format("{}", static_cast<std::underlying_type_t<T>>(v));
    } else {
        return "<non-printable>";
    }
}

namespace color {
    inline constexpr const char* green  = "\033[32m";
    inline constexpr const char* red    = "\033[31m";
    inline constexpr const char* yellow = "\033[33m";
    inline constexpr const char* reset  = "\033[0m";
    inline constexpr const char* bold   = "\033[1m";
} // namespace color

// ---------------------------------------------------------------------------
// Registry and run state
// ---------------------------------------------------------------------------

struct TestCase {
    std::string_view name;
    std::string_view file;
    int line;
    std::function<void()> func;
};

/// Thrown by fatal assertions to abandon the current test case.
struct TestFailure {};

struct Context {
    std::atomic<int> passed{0};
    std::atomic<int> failed{0};
    std::atomic<int> checks{0};
    bool current_failed = false;
    bool use_color      = true;
    bool verbose        = false;
    std::string filter;
};

inline std::vector<TestCase>& registry() {
    static std::vector<TestCase> r;
    return r;
}

inline Context& ctx() {
    static Context c;
    return c;
}

inline const char* col(const char* code) {
    return ctx().use_color ? code : "";
}

// ---------------------------------------------------------------------------
// Assertion reporting
// ---------------------------------------------------------------------------

inline void fail_assert(std::string_view expr, std::string_view lhs, std::string_view rhs,
                        std::source_location loc) {
    ctx().current_failed = true;
    std::println(stderr, "    {}{}:{}{}: {}failed: {}{}",
                 col(color::bold), loc.file_name(), col(color::reset), loc.line(),
                 col(color::red), expr, col(color::reset));
    if (!lhs.empty() || !rhs.empty()) {
        std::println(stderr, "      lhs = {}", lhs);
        std::println(stderr, "      rhs = {}", rhs);
    }
}

template <typename A, typename B>
void fail_cmp(std::string_view expr, const A& a, const B& b, std::source_location loc) {
    fail_assert(expr, to_string_val(a), to_string_val(b), loc);
}

inline void pass_assert(std::string_view expr, std::source_location loc) {
    ctx().checks++;
    if (ctx().verbose)
        std::println("    {}PASS{}: {} ({}:{})", col(color::green), col(color::reset),
                     expr, loc.file_name(), loc.line());
}

struct AutoRegister {
    AutoRegister(std::string_view name, std::function<void()> func,
                 std::source_location loc = std::source_location::current()) {
        registry().push_back({name, loc.file_name(), static_cast<int>(loc.line()), std::move(func)});
    }
};

// ---------------------------------------------------------------------------
// Runner
// ---------------------------------------------------------------------------

inline int run_all(int argc = 0, const char** argv = nullptr) {
    auto& c = ctx();
    c.passed = 0;
    c.failed = 0;
    c.checks = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg.starts_with("--filter=")) {
            c.filter = std::string(arg.substr(9));
        } else if (arg == "--no-color") {
            c.use_color = false;
        } else if (arg == "--verbose") {
            c.verbose = true;
        } else if (arg == "--list") {
            for (auto& tc : registry()) std::println("{}", tc.name);
            return 0;
        } else {
            std::println(stderr, "unknown argument: {}", arg);
            return 2;
        }
    }

    std::vector<TestCase*> to_run;
    for (auto& tc : registry())
        if (c.filter.empty() || tc.name.find(c.filter) != std::string_view::npos)
            to_run.push_back(&tc);

    std::println("{}[==========]{} Running {} test{}", col(color::bold), col(color::reset),
                 to_run.size(), to_run.size() == 1 ? "" : "s");

    auto wall_start = std::chrono::steady_clock::now();
    std::vector<std::string_view> failures;

    for (auto* tc : to_run) {
        std::println("{}[ RUN      ]{} {}", col(color::green), col(color::reset), tc->name);
        c.current_failed = false;
        auto t0 = std::chrono::steady_clock::now();

        try {
            tc->func();
        } catch (const TestFailure&) {
            // already reported
        } catch (const std::exception& e) {
            c.current_failed = true;
            std::println(stderr, "    {}unhandled exception{}: {}", col(color::red), col(color::reset), e.what());
        } catch (...) {
            c.current_failed = true;
            std::println(stderr, "    {}unhandled non-standard exception{}", col(color::red), col(color::reset));
        }

        double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        if (c.current_failed) {
            c.failed++;
            failures.push_back(tc->name);
            std::println("{}[  FAILED  ]{} {} ({:.1f}ms)", col(color::red), col(color::reset), tc->name, ms);
        } else {
            c.passed++;
            std::println("{}[       OK ]{} {} ({:.1f}ms)", col(color::green), col(color::reset), tc->name, ms);
        }
    }

    double total_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - wall_start).count();
    const int p = c.passed.load();
    const int f = c.failed.load();
    std::println("{}[==========]{} {}{} passed{}, {}{} failed{}, {} checks ({:.1f}ms total)",
                 col(color::bold), col(color::reset),
                 col(color::green), p, col(color::reset),
                 f ? col(color::red) : col(color::green), f, col(color::reset),
                 c.checks.load(), total_ms);
    for (auto name : failures)
        std::println("{}[  FAILED  ]{} {}", col(color::red), col(color::reset), name);

    return f > 0 ? 1 : 0;
}

} // namespace zconv::test

// ===========================================================================
// Macros
// ===========================================================================

#define ZCONV_TEST_CAT2(a, b) a##b
#define ZCONV_TEST_CAT(a, b) ZCONV_TEST_CAT2(a, b)

// One TEST_CASE per line; the line number names the generated symbols.
#define TEST_CASE(tname)                                                       \
    static void ZCONV_TEST_CAT(zconv_test_func_, __LINE__)();                  \
    static ::zconv::test::AutoRegister                                         \
        ZCONV_TEST_CAT(zconv_test_reg_, __LINE__)(                             \
            tname, ZCONV_TEST_CAT(zconv_test_func_, __LINE__));                \
    static void ZCONV_TEST_CAT(zconv_test_func_, __LINE__)()

#define SECTION(sname)                                                         \
    if (::zconv::test::ctx().verbose)                                          \
        std::println("  {}-- {}{}",                                            \
                     ::zconv::test::col(::zconv::test::color::yellow), sname,  \
                     ::zconv::test::col(::zconv::test::color::reset));         \
    if (true)

#define STATIC_REQUIRE(expr) static_assert(expr, "STATIC_REQUIRE(" #expr ") failed")

#define REQUIRE(expr)                                                          \
    do {                                                                       \
        if (!(expr)) {                                                         \
            ::zconv::test::fail_assert("REQUIRE(" #expr ")", "", "",           \
                                       std::source_location::current());       \
            throw ::zconv::test::TestFailure{};                                \
        }                                                                      \
        ::zconv::test::pass_assert(#expr, std::source_location::current());    \
    } while (0)

#define CHECK(expr)                                                            \
    do {                                                                       \
        if (!(expr))                                                           \
            ::zconv::test::fail_assert("CHECK(" #expr ")", "", "",             \
                                       std::source_location::current());       \
        else                                                                   \
            ::zconv::test::pass_assert(#expr, std::source_location::current());\
    } while (0)

#define ZCONV_CMP_ASSERT(a, b, op, fatal)                                      \
    do {                                                                       \
        const auto& _zconv_a = (a);                                            \
        const auto& _zconv_b = (b);                                            \
        if (!(_zconv_a op _zconv_b)) {                                         \
            ::zconv::test::fail_cmp(#a " " #op " " #b, _zconv_a, _zconv_b,     \
                                    std::source_location::current());          \
            if constexpr (fatal) throw ::zconv::test::TestFailure{};           \
        } else {                                                               \
            ::zconv::test::pass_assert(#a " " #op " " #b,                      \
                                       std::source_location::current());       \
        }                                                                      \
    } while (0)

#define REQUIRE_EQ(a, b) ZCONV_CMP_ASSERT(a, b, ==, true)
#define CHECK_EQ(a, b)   ZCONV_CMP_ASSERT(a, b, ==, false)
#define REQUIRE_NE(a, b) ZCONV_CMP_ASSERT(a, b, !=, true)
#define CHECK_NE(a, b)   ZCONV_CMP_ASSERT(a, b, !=, false)
#define REQUIRE_LT(a, b) ZCONV_CMP_ASSERT(a, b, <,  true)
#define CHECK_LT(a, b)   ZCONV_CMP_ASSERT(a, b, <,  false)
#define REQUIRE_GE(a, b) ZCONV_CMP_ASSERT(a, b, >=, true)
#define CHECK_GE(a, b)   ZCONV_CMP_ASSERT(a, b, >=, false)

#define REQUIRE_NEAR(a, b, eps)                                                \
    do {                                                                       \
        const double _zconv_a = static_cast<double>(a);                        \
        const double _zconv_b = static_cast<double>(b);                        \
        if (std::fabs(_zconv_a - _zconv_b) > static_cast<double>(eps)) {       \
            ::zconv::test::fail_cmp(#a " ~= " #b, _zconv_a, _zconv_b,          \
                                    std::source_location::current());          \
            throw ::zconv::test::TestFailure{};                                \
        }                                                                      \
        ::zconv::test::pass_assert(#a " ~= " #b,                               \
                                   std::source_location::current());           \
    } while (0)

#define ZCONV_THROWS_ASSERT(expr, fatal)                                       \
    do {                                                                       \
        bool _zconv_threw = false;                                             \
        try { (void)(expr); } catch (...) { _zconv_threw = true; }             \
        if (!_zconv_threw) {                                                   \
            ::zconv::test::fail_assert(#expr " throws", "", "",                \
                                       std::source_location::current());       \
            if constexpr (fatal) throw ::zconv::test::TestFailure{};           \
        } else {                                                               \
            ::zconv::test::pass_assert(#expr " throws",                        \
                                       std::source_location::current());       \
        }                                                                      \
    } while (0)

#define REQUIRE_THROWS(expr) ZCONV_THROWS_ASSERT(expr, true)
#define CHECK_THROWS(expr)   ZCONV_THROWS_ASSERT(expr, false)

// Passes only if expr throws exactly `type` (or a subclass). A different
// exception fails the assertion instead of escaping the test case.
#define REQUIRE_THROWS_AS(expr, type)                                          \
    do {                                                                       \
        int _zconv_state = 0;                                                  \
        try { (void)(expr); }                                                  \
        catch (const type&) { _zconv_state = 1; }                              \
        catch (...) { _zconv_state = 2; }                                      \
        if (_zconv_state != 1) {                                               \
            ::zconv::test::fail_assert(                                        \
                #expr " throws " #type,                                        \
                _zconv_state == 0 ? "nothing thrown" : "other exception", "",  \
                std::source_location::current());                              \
            throw ::zconv::test::TestFailure{};                                \
        }                                                                      \
        ::zconv::test::pass_assert(#expr " throws " #type,                     \
                                   std::source_location::current());           \
    } while (0)

#define REQUIRE_NOTHROW(expr)                                                  \
    do {                                                                       \
        try { (void)(expr); }                                                  \
        catch (const std::exception& _zconv_e) {                               \
            ::zconv::test::fail_assert(#expr " does not throw",                \
                                       _zconv_e.what(), "",                    \
                                       std::source_location::current());       \
            throw ::zconv::test::TestFailure{};                                \
        }                                                                      \
        ::zconv::test::pass_assert(#expr " does not throw",                    \
                                   std::source_location::current());           \
    } while (0)

#define ZCONV_TEST_MAIN()                                                      \
    int main(int argc, const char** argv) {                                    \
        return ::zconv::test::run_all(argc, argv);                             \
    }
