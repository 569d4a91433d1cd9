// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bras {

enum class cpf_error : uint8_t {
    invalid_length,
    invalid_format,
    invalid_checksum,
    repeated_digits,
};

inline std::string_view cpf_error_to_string(cpf_error error)
{
    switch (error) {
    case cpf_error::invalid_length:
        return "invalid length";
    case cpf_error::invalid_format:
        return "invalid format";
    case cpf_error::invalid_checksum:
        return "invalid checksum";
    case cpf_error::repeated_digits:
        return "repeated digits";
    }

    return "unknown error";
}

class parse_error : public std::invalid_argument {
public:
    explicit parse_error(cpf_error code)
        : std::invalid_argument("invalid cpf: " + std::string{cpf_error_to_string(code)}),
          code_(code)
    {}

    [[nodiscard]] cpf_error code() const noexcept { return code_; }

protected:
    cpf_error code_;
};

} // namespace bras
