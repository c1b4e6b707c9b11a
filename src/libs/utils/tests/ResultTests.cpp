// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/Result.hpp"

using Utils::Result;

TEST(ResultTests, SuccessHasNoErrors)
{
    const Result r = Result::success();
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_TRUE(r.errors.isEmpty());
    EXPECT_TRUE(r.errorString().isEmpty());
}

TEST(ResultTests, AddErrorFlipsOk)
{
    Result r;
    r.addError(QStringLiteral("first"));
    r.addError(QStringLiteral("second"));

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 2);
    EXPECT_EQ(r.errorString(), QStringLiteral("first; second"));
    EXPECT_EQ(r.errorString(QStringLiteral("\n")), QStringLiteral("first\nsecond"));
}
