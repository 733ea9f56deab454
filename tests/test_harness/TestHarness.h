#ifndef CIRCUITSKETCH_TEST_HARNESS_H
#define CIRCUITSKETCH_TEST_HARNESS_H

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace circuitsketch::test {

struct TestCase {
    std::string name;
    std::function<void()> func;
};

/**
 * @brief Counters shared by every check in one test executable
 */
struct RunState {
    std::vector<TestCase> cases;
    std::string currentCase;
    int checks = 0;
    int failures = 0;
};

inline RunState& state() {
    static RunState s;
    return s;
}

namespace detail {

template <typename T>
std::string toString(const T& value) {
    if constexpr (requires(std::ostream& os, const T& v) { os << v; }) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return "<unprintable>";
    }
}

template <typename A, typename B>
std::string describePair(const A& lhs, const B& rhs) {
    return "lhs=" + toString(lhs) + " rhs=" + toString(rhs);
}

} // namespace detail

/**
 * @brief Count one check and print it on failure, tagged with the running case
 */
inline void check(bool passed, std::string_view expr, std::string_view file, int line,
                  const std::string& message = {}) {
    RunState& s = state();
    ++s.checks;
    if (passed) {
        return;
    }
    ++s.failures;
    std::cerr << "[FAIL] " << s.currentCase << " (" << file << ":" << line << ") " << expr;
    if (!message.empty()) {
        std::cerr << " | " << message;
    }
    std::cerr << std::endl;
}

struct Registrar {
    Registrar(std::string name, std::function<void()> func) {
        state().cases.push_back({std::move(name), std::move(func)});
    }
};

#define TEST_CASE(name) \
    static void name(); \
    static ::circuitsketch::test::Registrar registrar_##name(#name, name); \
    static void name()

#define EXPECT_TRUE(expr) \
    ::circuitsketch::test::check(static_cast<bool>(expr), #expr, __FILE__, __LINE__, "expected true")

#define EXPECT_FALSE(expr) \
    ::circuitsketch::test::check(!(expr), #expr, __FILE__, __LINE__, "expected false")

#define EXPECT_EQ(a, b) do { \
    auto _va = (a); \
    auto _vb = (b); \
    const bool _ok = (_va == _vb); \
    ::circuitsketch::test::check(_ok, #a " == " #b, __FILE__, __LINE__, \
                                 _ok ? std::string() : ::circuitsketch::test::detail::describePair(_va, _vb)); \
} while (0)

#define EXPECT_NE(a, b) do { \
    auto _va = (a); \
    auto _vb = (b); \
    const bool _ok = !(_va == _vb); \
    ::circuitsketch::test::check(_ok, #a " != " #b, __FILE__, __LINE__, \
                                 _ok ? std::string() : ::circuitsketch::test::detail::describePair(_va, _vb)); \
} while (0)

// Absolute or relative tolerance, whichever is looser
#define EXPECT_NEAR(a, b, tol) do { \
    const double _va = static_cast<double>(a); \
    const double _vb = static_cast<double>(b); \
    const double _tol = static_cast<double>(tol); \
    const double _diff = std::fabs(_va - _vb); \
    const double _scale = std::max(std::fabs(_va), std::fabs(_vb)); \
    const bool _ok = _diff <= _tol || _diff <= _tol * _scale; \
    std::ostringstream _oss; \
    if (!_ok) { \
        _oss << "lhs=" << _va << " rhs=" << _vb << " diff=" << _diff << " tol=" << _tol; \
    } \
    ::circuitsketch::test::check(_ok, #a " ~= " #b, __FILE__, __LINE__, _oss.str()); \
} while (0)

// gp_Pnt2d (or anything with Distance/X/Y) within a Euclidean tolerance
#define EXPECT_PNT2D_NEAR(a, b, tol) do { \
    const auto _pa = (a); \
    const auto _pb = (b); \
    const double _dist = _pa.Distance(_pb); \
    const double _tol = static_cast<double>(tol); \
    std::ostringstream _oss; \
    if (_dist > _tol) { \
        _oss << "dist=" << _dist << " tol=" << _tol << " a=(" << _pa.X() << ", " << _pa.Y() \
             << ") b=(" << _pb.X() << ", " << _pb.Y() << ")"; \
    } \
    ::circuitsketch::test::check(_dist <= _tol, #a " ~= " #b, __FILE__, __LINE__, _oss.str()); \
} while (0)

#define EXPECT_THROWS_AS(expr, ExceptionType) do { \
    bool _thrown = false; \
    try { \
        (void)(expr); \
    } catch (const ExceptionType&) { \
        _thrown = true; \
    } \
    ::circuitsketch::test::check(_thrown, #expr, __FILE__, __LINE__, "expected " #ExceptionType); \
} while (0)

/**
 * @brief Run every registered case, or only those whose name contains
 *        CIRCUITSKETCH_TEST_FILTER when it is set
 * @return Number of failed checks plus cases that threw
 */
inline int runAllTests() {
    RunState& s = state();
    const char* rawFilter = std::getenv("CIRCUITSKETCH_TEST_FILTER");
    const std::string filter = rawFilter ? rawFilter : "";

    int executed = 0;
    for (const auto& tc : s.cases) {
        if (!filter.empty() && tc.name.find(filter) == std::string::npos) {
            continue;
        }
        s.currentCase = tc.name;
        ++executed;
        try {
            tc.func();
        } catch (const std::exception& ex) {
            std::cerr << "[EXCEPT] " << tc.name << " - " << ex.what() << std::endl;
            ++s.failures;
        }
    }

    std::cout << "[RESULT] " << executed << "/" << s.cases.size() << " cases, " << s.checks
              << " checks" << std::endl;
    if (s.failures == 0) {
        std::cout << "[PASS] All tests passed" << std::endl;
    } else {
        std::cout << "[FAIL] " << s.failures << " failures" << std::endl;
    }
    return s.failures;
}

} // namespace circuitsketch::test

#endif // CIRCUITSKETCH_TEST_HARNESS_H
