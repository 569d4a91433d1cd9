// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>
#include <cstring>
#include <string_view>

#include "bras.h"
#include "common/gtest_utils.hpp"

using namespace std::literals;

namespace {

BRAS_RET_CODE from_string(
    std::string_view str, uint64_t *result, const bras_config *config = nullptr)
{
    return bras_cpf_from_string(str.data(), str.size(), config, result);
}

TEST(TestCpfInterface, FromInteger)
{
    uint64_t result = 0;
    EXPECT_EQ(bras_cpf_from_integer(1678346063, nullptr, &result), BRAS_OK);
    EXPECT_EQ(result, 1678346063);

    result = 0;
    EXPECT_EQ(bras_cpf_from_integer(1678346064, nullptr, &result), BRAS_ERR_INVALID_CHECKSUM);
    EXPECT_EQ(result, 0);

    EXPECT_EQ(bras_cpf_from_integer(100'000'000'000, nullptr, &result), BRAS_ERR_INVALID_LENGTH);
    EXPECT_EQ(bras_cpf_from_integer(33333333333, nullptr, &result), BRAS_ERR_REPEATED_DIGITS);
    EXPECT_EQ(bras_cpf_from_integer(1678346063, nullptr, nullptr), BRAS_ERR_INVALID_ARGUMENT);
}

TEST(TestCpfInterface, FromString)
{
    uint64_t result = 0;
    EXPECT_EQ(from_string("01678346063", &result), BRAS_OK);
    EXPECT_EQ(result, 1678346063);

    result = 0;
    EXPECT_EQ(from_string("016.783.460-63", &result), BRAS_OK);
    EXPECT_EQ(result, 1678346063);

    EXPECT_EQ(from_string("01678346064", &result), BRAS_ERR_INVALID_CHECKSUM);
    EXPECT_EQ(from_string("0167834606", &result), BRAS_ERR_INVALID_LENGTH);
    EXPECT_EQ(from_string("0167834606a", &result), BRAS_ERR_INVALID_FORMAT);
    EXPECT_EQ(from_string("984-844-854.39", &result), BRAS_ERR_INVALID_FORMAT);
    EXPECT_EQ(from_string("", &result), BRAS_ERR_INVALID_LENGTH);

    EXPECT_EQ(bras_cpf_from_string(nullptr, 0, nullptr, &result), BRAS_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(bras_cpf_from_string("01678346063", 11, nullptr, nullptr),
        BRAS_ERR_INVALID_ARGUMENT);
}

TEST(TestCpfInterface, NotNullTerminated)
{
    constexpr std::string_view buffer = "0167834606312345";

    uint64_t result = 0;
    EXPECT_EQ(bras_cpf_from_string(buffer.data(), 11, nullptr, &result), BRAS_OK);
    EXPECT_EQ(result, 1678346063);
}

TEST(TestCpfInterface, Config)
{
    uint64_t result = 1;

    bras_config config{};
    EXPECT_EQ(from_string("00000000000", &result, &config), BRAS_ERR_REPEATED_DIGITS);
    EXPECT_EQ(result, 1);

    config.allow_repeated_digits = true;
    EXPECT_EQ(from_string("00000000000", &result, &config), BRAS_OK);
    EXPECT_EQ(result, 0);

    EXPECT_EQ(bras_cpf_from_integer(77777777777, &config, &result), BRAS_OK);
    EXPECT_EQ(result, 77777777777);

    // A value accepted under a policy can be printed under the same policy
    std::array<char, 12> buffer{};
    EXPECT_EQ(bras_cpf_to_string(0, &config, buffer.data(), buffer.size()), BRAS_OK);
    EXPECT_STREQ(buffer.data(), "00000000000");
    EXPECT_EQ(bras_cpf_to_string(77777777777, &config, buffer.data(), buffer.size()), BRAS_OK);
    EXPECT_STREQ(buffer.data(), "77777777777");
    EXPECT_EQ(bras_cpf_to_string(0, nullptr, buffer.data(), buffer.size()),
        BRAS_ERR_REPEATED_DIGITS);

    // Each policy keeps its own scanner across calls
    constexpr std::string_view text = "00000000000 01678346063 11111111111";
    std::array<uint64_t, 4> results{};
    size_t count = 0;
    for (int i = 0; i < 2; ++i) {
        EXPECT_EQ(bras_cpf_scan(text.data(), text.size(), &config, results.data(),
                      results.size(), &count),
            BRAS_OK);
        ASSERT_EQ(count, 3);
        EXPECT_EQ(results[0], 0);
        EXPECT_EQ(results[1], 1678346063);
        EXPECT_EQ(results[2], 11111111111);

        EXPECT_EQ(bras_cpf_scan(text.data(), text.size(), nullptr, results.data(),
                      results.size(), &count),
            BRAS_OK);
        ASSERT_EQ(count, 1);
        EXPECT_EQ(results[0], 1678346063);
    }
}

TEST(TestCpfInterface, ToString)
{
    std::array<char, 12> buffer{};
    EXPECT_EQ(bras_cpf_to_string(604, nullptr, buffer.data(), buffer.size()), BRAS_OK);
    EXPECT_STREQ(buffer.data(), "00000000604");

    EXPECT_EQ(bras_cpf_to_string(98484485439, nullptr, buffer.data(), buffer.size()), BRAS_OK);
    EXPECT_STREQ(buffer.data(), "98484485439");

    EXPECT_EQ(bras_cpf_to_string(98484485440, nullptr, buffer.data(), buffer.size()),
        BRAS_ERR_INVALID_CHECKSUM);
    EXPECT_EQ(bras_cpf_to_string(604, nullptr, buffer.data(), 11), BRAS_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(bras_cpf_to_string(604, nullptr, nullptr, 12), BRAS_ERR_INVALID_ARGUMENT);
}

TEST(TestCpfInterface, Scan)
{
    constexpr std::string_view text = "a 984.844.854-39 b 01678346063 c 01678346064 d 00000000604";

    std::array<uint64_t, 4> results{};
    size_t count = 0;
    EXPECT_EQ(bras_cpf_scan(
                  text.data(), text.size(), nullptr, results.data(), results.size(), &count),
        BRAS_OK);
    ASSERT_EQ(count, 3);
    EXPECT_EQ(results[0], 98484485439);
    EXPECT_EQ(results[1], 1678346063);
    EXPECT_EQ(results[2], 604);

    // Only counting
    count = 0;
    EXPECT_EQ(bras_cpf_scan(text.data(), text.size(), nullptr, nullptr, 0, &count), BRAS_OK);
    EXPECT_EQ(count, 3);

    // Truncated output
    results = {};
    EXPECT_EQ(
        bras_cpf_scan(text.data(), text.size(), nullptr, results.data(), 1, &count), BRAS_OK);
    EXPECT_EQ(count, 3);
    EXPECT_EQ(results[0], 98484485439);
    EXPECT_EQ(results[1], 0);

    EXPECT_EQ(bras_cpf_scan(nullptr, 0, nullptr, nullptr, 0, &count), BRAS_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(bras_cpf_scan(text.data(), text.size(), nullptr, nullptr, 1, &count),
        BRAS_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(bras_cpf_scan(text.data(), text.size(), nullptr, nullptr, 0, nullptr),
        BRAS_ERR_INVALID_ARGUMENT);
}

TEST(TestCpfInterface, RetCodeToString)
{
    EXPECT_STREQ(bras_ret_code_to_string(BRAS_OK), "ok");
    EXPECT_STREQ(bras_ret_code_to_string(BRAS_ERR_INVALID_ARGUMENT), "invalid argument");
    EXPECT_STREQ(bras_ret_code_to_string(BRAS_ERR_INVALID_LENGTH), "invalid length");
    EXPECT_STREQ(bras_ret_code_to_string(BRAS_ERR_INVALID_FORMAT), "invalid format");
    EXPECT_STREQ(bras_ret_code_to_string(BRAS_ERR_INVALID_CHECKSUM), "invalid checksum");
    EXPECT_STREQ(bras_ret_code_to_string(BRAS_ERR_REPEATED_DIGITS), "repeated digits");
    EXPECT_STREQ(bras_ret_code_to_string(BRAS_ERR_INTERNAL), "internal error");
}

TEST(TestCpfInterface, Version) { EXPECT_GT(std::strlen(bras_get_version()), 0); }

} // namespace
