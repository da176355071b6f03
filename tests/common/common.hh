#pragma once

#include <fmt/core.h>
#include <cstdio>
#include <cstdlib>

#define ASSERT(condition)                                                                         \
    do {                                                                                          \
        if (!(condition)) {                                                                       \
            fmt::print(stderr, "{}:{}: Assertion '{}' failed.\n", __FILE__, __LINE__, #condition); \
            exit(EXIT_FAILURE);                                                                   \
        }                                                                                         \
    } while (0)

// Asserts that `statement` throws `exception_type`, the exception is available as `e` in `check`.
#define ASSERT_THROWS(statement, exception_type, check)                                                          \
    do {                                                                                                         \
        bool thrown = false;                                                                                     \
        try {                                                                                                    \
            statement;                                                                                           \
        } catch (const exception_type &e) {                                                                      \
            thrown = true;                                                                                       \
            check;                                                                                               \
        }                                                                                                        \
        if (!thrown) {                                                                                           \
            fmt::print(stderr, "{}:{}: '{}' did not throw {}.\n", __FILE__, __LINE__, #statement, #exception_type); \
            exit(EXIT_FAILURE);                                                                                  \
        }                                                                                                        \
    } while (0)
