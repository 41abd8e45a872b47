// Copyright (c) 2023, The jsonvfy Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONVFY_UTILS_H
#define JSONVFY_UTILS_H

#include <cassert>
#include <cstddef>
#include <cstdint>

#define JSONVFY_EXPECT_TRUE(expr) assert(expr)
#define JSONVFY_EXPECT_FALSE(expr) JSONVFY_EXPECT_TRUE(!(expr))
#define JSONVFY_EXPECT_EQ(lhs, rhs) JSONVFY_EXPECT_TRUE((lhs) == (rhs))
#define JSONVFY_EXPECT_NE(lhs, rhs) JSONVFY_EXPECT_TRUE((lhs) != (rhs))
#define JSONVFY_EXPECT_LT(lhs, rhs) JSONVFY_EXPECT_TRUE((lhs) < (rhs))
#define JSONVFY_EXPECT_LE(lhs, rhs) JSONVFY_EXPECT_TRUE((lhs) <= (rhs))
#define JSONVFY_EXPECT_GT(lhs, rhs) JSONVFY_EXPECT_TRUE((lhs) > (rhs))
#define JSONVFY_EXPECT_GE(lhs, rhs) JSONVFY_EXPECT_TRUE((lhs) >= (rhs))

#define ARRAY_SIZE(x) (sizeof(x) / sizeof((x)[0]))

#endif // JSONVFY_UTILS_H
