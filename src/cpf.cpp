// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "checksum/cpf_checksum.hpp"
#include "cpf.hpp"
#include "cpf_error.hpp"
#include "utils.hpp"

namespace bras {

namespace {

// XXX.XXX.XXX-XX
constexpr std::size_t punctuated_length = 14;
constexpr std::size_t first_dot = 3;
constexpr std::size_t second_dot = 7;
constexpr std::size_t dash = 11;

bool is_separator(char c) { return c == '.' || c == '-'; }

bool has_canonical_punctuation(std::string_view str)
{
    return str.size() == punctuated_length && str[first_dot] == '.' && str[second_dot] == '.' &&
           str[dash] == '-';
}

cpf unwrap(std::variant<cpf, cpf_error> &&res)
{
    if (auto *error = std::get_if<cpf_error>(&res); error != nullptr) {
        throw parse_error(*error);
    }
    return std::get<cpf>(std::move(res));
}

} // namespace

cpf::cpf(uint64_t value, const parse_options &options) : cpf(unwrap(from_integer(value, options)))
{}

cpf::cpf(std::string_view str, const parse_options &options)
    : cpf(unwrap(from_string(str, options)))
{}

std::variant<cpf, cpf_error> cpf::from_integer(
    uint64_t value, const parse_options &options) noexcept
{
    if (value > max_value) {
        return cpf_error::invalid_length;
    }

    digit_array digits{};
    for (std::size_t i = length; i > 0; --i) {
        digits[i - 1] = static_cast<uint8_t>(value % 10);
        value /= 10;
    }

    return validate(digits, options);
}

std::variant<cpf, cpf_error> cpf::from_string(
    std::string_view str, const parse_options &options) noexcept
{
    digit_array digits{};
    std::size_t count = 0;
    bool punctuated = false;

    for (auto c : str) {
        if (bras::isdigit(c)) {
            if (count < length) {
                digits[count] = static_cast<uint8_t>(c - '0');
            }
            ++count;
        } else if (is_separator(c)) {
            punctuated = true;
        } else {
            return cpf_error::invalid_format;
        }
    }

    if (count != length) {
        return cpf_error::invalid_length;
    }

    if (punctuated && !has_canonical_punctuation(str)) {
        return cpf_error::invalid_format;
    }

    return validate(digits, options);
}

std::variant<cpf, cpf_error> cpf::validate(
    const digit_array &digits, const parse_options &options) noexcept
{
    if (!options.allow_repeated_digits &&
        std::all_of(digits.begin(), digits.end(), [&](uint8_t d) { return d == digits[0]; })) {
        return cpf_error::repeated_digits;
    }

    if (!cpf_checksum::validate(digits)) {
        return cpf_error::invalid_checksum;
    }

    uint64_t value = 0;
    for (auto d : digits) {
        value = value * 10 + d;
    }

    return cpf{validated_tag{}, value};
}

cpf::digit_array cpf::digits() const noexcept
{
    digit_array digits{};
    auto value = value_;
    for (std::size_t i = length; i > 0; --i) {
        digits[i - 1] = static_cast<uint8_t>(value % 10);
        value /= 10;
    }
    return digits;
}

std::string cpf::to_string() const
{
    std::string str(length, '0');
    auto value = value_;
    for (std::size_t i = length; i > 0; --i) {
        str[i - 1] = static_cast<char>('0' + value % 10);
        value /= 10;
    }
    return str;
}

} // namespace bras
