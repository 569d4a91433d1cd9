// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "checksum/cpf_checksum.hpp"

namespace bras {

namespace {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
uint8_t remainder_to_digit(uint32_t sum)
{
    const auto r = sum % 11U;
    return r < 2 ? 0 : static_cast<uint8_t>(11U - r);
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace

std::array<uint8_t, 2> cpf_checksum::compute(std::span<const uint8_t, base_length> base) noexcept
{
    uint32_t first_sum = 0;
    uint32_t second_sum = 0;
    for (std::size_t i = 0; i < base_length; ++i) {
        const uint32_t d = base[i];
        first_sum += d * static_cast<uint32_t>(base_length + 1 - i);
        second_sum += d * static_cast<uint32_t>(base_length + 2 - i);
    }

    const auto first = remainder_to_digit(first_sum);
    second_sum += first * 2U;

    return {first, remainder_to_digit(second_sum)};
}

bool cpf_checksum::validate(std::span<const uint8_t, length> digits) noexcept
{
    auto expected = compute(digits.first<base_length>());
    return digits[base_length] == expected[0] && digits[base_length + 1] == expected[1];
}

} // namespace bras
