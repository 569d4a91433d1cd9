// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "cpf.hpp"
#include "cpf_error.hpp"
#include "log.hpp"
#include "matcher/cpf_scanner.hpp"

namespace bras::matcher {

cpf_scanner::cpf_scanner(const parse_options &options) : options_(options)
{
    constexpr unsigned regex_max_mem = 512 * 1024;

    re2::RE2::Options re_options;
    re_options.set_max_mem(regex_max_mem);
    re_options.set_log_errors(false);

    regex = std::make_unique<re2::RE2>(
        re2::StringPiece{candidate_regex.data(), candidate_regex.size()}, re_options);
    if (!regex->ok()) {
        throw std::runtime_error("invalid regular expression: " + regex->error_arg());
    }
}

std::optional<std::pair<cpf, std::string_view>> cpf_scanner::next(std::string_view text) const
{
    while (text.size() >= cpf::length) {
        re2::StringPiece match;
        if (!regex->Match(
                {text.data(), text.size()}, 0, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
            break;
        }

        const std::string_view candidate{match.data(), match.size()};
        auto res = cpf::from_string(candidate, options_);
        if (auto *value = std::get_if<cpf>(&res); value != nullptr) {
            return std::make_pair(*value, candidate);
        }

        BRAS_TRACE("Discarding cpf candidate '{}': {}", candidate,
            cpf_error_to_string(std::get<cpf_error>(res)));
        text.remove_prefix(
            static_cast<std::size_t>(candidate.data() - text.data()) + candidate.size());
    }

    return std::nullopt;
}

std::pair<bool, std::string_view> cpf_scanner::match(std::string_view text) const
{
    auto res = next(text);
    if (!res.has_value()) {
        return {false, {}};
    }
    return {true, res->second};
}

std::vector<cpf> cpf_scanner::scan(std::string_view text) const
{
    std::vector<cpf> found;
    for (auto remaining = text; remaining.size() >= cpf::length;) {
        auto res = next(remaining);
        if (!res.has_value()) {
            break;
        }

        auto [value, candidate] = *res;
        found.emplace_back(value);
        remaining.remove_prefix(
            static_cast<std::size_t>(candidate.data() - remaining.data()) + candidate.size());
    }

    BRAS_DEBUG("Found {} cpf(s) in text of length {}", found.size(), text.size());
    return found;
}

} // namespace bras::matcher
