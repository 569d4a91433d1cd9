// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

#include "checksum/cpf_checksum.hpp"
#include "cpf_error.hpp"

namespace bras {

struct parse_options {
    // Numbers made of 11 identical digits satisfy the checksum but are not
    // issued, they are rejected unless explicitly allowed.
    bool allow_repeated_digits{false};
};

// Brazilian individual taxpayer registry number. An instance always holds 11
// digits whose last two are the check digits of the first nine.
class cpf {
public:
    static constexpr std::size_t length = cpf_checksum::length;
    static constexpr uint64_t max_value = 99'999'999'999;

    using digit_array = std::array<uint8_t, length>;

    explicit cpf(uint64_t value, const parse_options &options = {});
    explicit cpf(std::string_view str, const parse_options &options = {});

    cpf(const cpf &) = default;
    cpf &operator=(const cpf &) = default;
    cpf(cpf &&) noexcept = default;
    cpf &operator=(cpf &&) noexcept = default;
    ~cpf() = default;

    [[nodiscard]] static std::variant<cpf, cpf_error> from_integer(
        uint64_t value, const parse_options &options = {}) noexcept;
    [[nodiscard]] static std::variant<cpf, cpf_error> from_string(
        std::string_view str, const parse_options &options = {}) noexcept;

    [[nodiscard]] uint64_t value() const noexcept { return value_; }
    [[nodiscard]] digit_array digits() const noexcept;
    // Zero-padded, no punctuation
    [[nodiscard]] std::string to_string() const;

    bool operator==(const cpf &other) const noexcept { return value_ == other.value_; }
    auto operator<=>(const cpf &other) const noexcept { return value_ <=> other.value_; }

protected:
    struct validated_tag {};
    cpf(validated_tag /*unused*/, uint64_t value) noexcept : value_(value) {}

    static std::variant<cpf, cpf_error> validate(
        const digit_array &digits, const parse_options &options) noexcept;

    uint64_t value_;
};

} // namespace bras

template <> struct std::hash<bras::cpf> {
    std::size_t operator()(const bras::cpf &v) const noexcept
    {
        return std::hash<uint64_t>{}(v.value());
    }
};

template <> struct fmt::formatter<bras::cpf> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(const bras::cpf &v, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(v.to_string(), ctx);
    }
};
