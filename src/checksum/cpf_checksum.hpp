// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace bras {

// Weighted mod-11 check digits of the Brazilian CPF. The first check digit is
// derived from the 9 base digits with weights 10..2, the second one from the
// base digits plus the first check digit with weights 11..2.
class cpf_checksum {
public:
    static constexpr std::size_t base_length = 9;
    static constexpr std::size_t length = base_length + 2;

    [[nodiscard]] static std::array<uint8_t, 2> compute(
        std::span<const uint8_t, base_length> base) noexcept;

    [[nodiscard]] static bool validate(std::span<const uint8_t, length> digits) noexcept;
};

} // namespace bras
