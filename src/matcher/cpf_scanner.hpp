// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <string_view>
#include <utility>
#include <vector>

#include "cpf.hpp"

namespace bras::matcher {

// Finds CPFs embedded in text: candidates are extracted with a regular
// expression and only those passing full validation are reported.
class cpf_scanner {
public:
    static constexpr std::string_view candidate_regex =
        R"(\b(?:\d{3}\.\d{3}\.\d{3}-\d{2}|\d{11})\b)";

    explicit cpf_scanner(const parse_options &options = {});
    ~cpf_scanner() = default;
    cpf_scanner(const cpf_scanner &) = delete;
    cpf_scanner(cpf_scanner &&) noexcept = default;
    cpf_scanner &operator=(const cpf_scanner &) = delete;
    cpf_scanner &operator=(cpf_scanner &&) noexcept = default;

    [[nodiscard]] std::pair<bool, std::string_view> match(std::string_view text) const;
    [[nodiscard]] std::vector<cpf> scan(std::string_view text) const;

protected:
    // First valid cpf within text, along with the slice it was parsed from
    [[nodiscard]] std::optional<std::pair<cpf, std::string_view>> next(std::string_view text) const;

    std::unique_ptr<re2::RE2> regex{nullptr};
    parse_options options_;
};

} // namespace bras::matcher
