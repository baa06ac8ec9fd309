#pragma once

#include "macros.hh"

#define EXPECT_EQ(T, a, b)                                                     \
    EXPECT((T)(a) == (T)(b), "Expected ", #a, " == ", #b, ", but ", a, " != ", b)

#define EXPECT_STR_EQ(a, b)                                                    \
    do {                                                                       \
        std::string a_ = (a) ? (a) : "";                                       \
        std::string b_ = (b) ? (b) : "";                                       \
        EXPECT(a_ == b_,                                                       \
               "Expected ",                                                    \
               #a,                                                             \
               " == ",                                                         \
               #b,                                                             \
               ", but ",                                                       \
               a_,                                                             \
               " != ",                                                         \
               b_);                                                            \
    } while (0)

#define CHECK_OK(e) CHECK((e) == StowStatusCode_Success)

#define CHECK_NO_ERROR(e)                                                      \
    do {                                                                       \
        const stow::Error err_ = (e);                                          \
        EXPECT(!err_, #e, " failed: ", err_.to_string());                      \
    } while (0)
