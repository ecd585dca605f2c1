#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                        \
    do {                                                                                         \
        if (!(cond)) {                                                                           \
            ++g_failures;                                                                        \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n"; \
        }                                                                                        \
    } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                       \
    do {                                                                                                      \
        const auto _a = (a);                                                                                  \
        const auto _b = (b);                                                                                  \
        if (!(_a == _b)) {                                                                                    \
            ++g_failures;                                                                                     \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n"; \
        }                                                                                                     \
    } while (0)

#define EXPECT_NEAR(a, b, tol)                                                                                  \
    do {                                                                                                        \
        const double _a = (a);                                                                                  \
        const double _b = (b);                                                                                  \
        if (!((_a - _b) <= (tol) && (_b - _a) <= (tol))) {                                                      \
            ++g_failures;                                                                                       \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~ " << #b << " (" \
                      << _a << " vs " << _b << ")\n";                                                           \
        }                                                                                                       \
    } while (0)

#define ASSERT_TRUE(cond)                                                                         \
    do {                                                                                          \
        if (!(cond)) {                                                                            \
            ++g_failures;                                                                         \
            std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n"; \
            return;                                                                               \
        }                                                                                         \
    } while (0)

static fs::path make_temp_path(const std::string& prefix) {
    static std::uint64_t counter = 0;
    ++counter;

    std::error_code ec;
    fs::path root = fs::temp_directory_path(ec);
    if (ec || root.empty()) {
        root = fs::current_path(ec);
        if (ec || root.empty()) {
            root = fs::path(".");
        }
    }

    const auto stamp = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static int finish_tests(const char* name) {
    if (g_failures == 0) {
        std::cout << name << ": OK\n";
        return 0;
    }
    std::cerr << name << ": FAILED (" << g_failures << ")\n";
    return 1;
}
