// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>
#include <variant>

#include "bras.h"
#include "cpf.hpp"
#include "cpf_error.hpp"
#include "log.hpp"
#include "matcher/cpf_scanner.hpp"
#include "version.hpp"

namespace {

bras::parse_options options_from_config(const bras_config *config)
{
    bras::parse_options options;
    if (config != nullptr) {
        options.allow_repeated_digits = config->allow_repeated_digits;
    }
    return options;
}

BRAS_RET_CODE to_ret_code(bras::cpf_error error)
{
    switch (error) {
    case bras::cpf_error::invalid_length:
        return BRAS_ERR_INVALID_LENGTH;
    case bras::cpf_error::invalid_format:
        return BRAS_ERR_INVALID_FORMAT;
    case bras::cpf_error::invalid_checksum:
        return BRAS_ERR_INVALID_CHECKSUM;
    case bras::cpf_error::repeated_digits:
        return BRAS_ERR_REPEATED_DIGITS;
    }
    return BRAS_ERR_INTERNAL;
}

BRAS_RET_CODE store_result(std::variant<bras::cpf, bras::cpf_error> &&res, uint64_t *result)
{
    if (auto *error = std::get_if<bras::cpf_error>(&res); error != nullptr) {
        BRAS_DEBUG("Rejected cpf: {}", bras::cpf_error_to_string(*error));
        return to_ret_code(*error);
    }

    *result = std::get<bras::cpf>(res).value();
    return BRAS_OK;
}

} // namespace

extern "C" {

BRAS_RET_CODE bras_cpf_from_integer(uint64_t value, const bras_config *config, uint64_t *result)
{
    if (result == nullptr) {
        BRAS_WARN("Illegal call: result was null");
        return BRAS_ERR_INVALID_ARGUMENT;
    }

    return store_result(bras::cpf::from_integer(value, options_from_config(config)), result);
}

BRAS_RET_CODE bras_cpf_from_string(
    const char *str, size_t length, const bras_config *config, uint64_t *result)
{
    if (str == nullptr || result == nullptr) {
        BRAS_WARN("Illegal call: string or result was null");
        return BRAS_ERR_INVALID_ARGUMENT;
    }

    return store_result(
        bras::cpf::from_string({str, length}, options_from_config(config)), result);
}

BRAS_RET_CODE bras_cpf_to_string(
    uint64_t value, const bras_config *config, char *buffer, size_t size)
{
    if (buffer == nullptr || size <= bras::cpf::length) {
        BRAS_WARN("Illegal call: buffer was null or smaller than {} bytes", bras::cpf::length + 1);
        return BRAS_ERR_INVALID_ARGUMENT;
    }

    try {
        auto res = bras::cpf::from_integer(value, options_from_config(config));
        if (auto *error = std::get_if<bras::cpf_error>(&res); error != nullptr) {
            return to_ret_code(*error);
        }

        auto str = std::get<bras::cpf>(res).to_string();
        str.copy(buffer, str.size());
        buffer[str.size()] = '\0';
        return BRAS_OK;
    } catch (const std::exception &e) {
        BRAS_ERROR("{}", e.what());
    } catch (...) {
        BRAS_ERROR("unknown exception");
    }

    return BRAS_ERR_INTERNAL;
}

BRAS_RET_CODE bras_cpf_scan(const char *text, size_t length, const bras_config *config,
    uint64_t *results, size_t capacity, size_t *count)
{
    if (text == nullptr || count == nullptr || (results == nullptr && capacity > 0)) {
        BRAS_WARN("Illegal call: text, results or count was null");
        return BRAS_ERR_INVALID_ARGUMENT;
    }

    try {
        static const bras::matcher::cpf_scanner strict_scanner{};
        static const bras::matcher::cpf_scanner permissive_scanner{
            bras::parse_options{.allow_repeated_digits = true}};

        const auto &scanner = options_from_config(config).allow_repeated_digits
                                  ? permissive_scanner
                                  : strict_scanner;
        auto found = scanner.scan({text, length});
        for (std::size_t i = 0; i < found.size() && i < capacity; ++i) {
            results[i] = found[i].value();
        }
        *count = found.size();
        return BRAS_OK;
    } catch (const std::exception &e) {
        BRAS_ERROR("{}", e.what());
    } catch (...) {
        BRAS_ERROR("unknown exception");
    }

    return BRAS_ERR_INTERNAL;
}

const char *bras_ret_code_to_string(BRAS_RET_CODE code)
{
    switch (code) {
    case BRAS_OK:
        return "ok";
    case BRAS_ERR_INVALID_ARGUMENT:
        return "invalid argument";
    case BRAS_ERR_INVALID_LENGTH:
        return "invalid length";
    case BRAS_ERR_INVALID_FORMAT:
        return "invalid format";
    case BRAS_ERR_INVALID_CHECKSUM:
        return "invalid checksum";
    case BRAS_ERR_REPEATED_DIGITS:
        return "repeated digits";
    case BRAS_ERR_INTERNAL:
        break;
    }

    return "internal error";
}

const char *bras_get_version() { return bras::current_version; }

bool bras_set_log_cb(bras_log_cb cb, BRAS_LOG_LEVEL min_level)
{
    bras::logger::init(cb, static_cast<bras::log_level>(min_level));
    BRAS_INFO("Sending log messages to binding, min level {}",
        bras::log_level_to_str(static_cast<bras::log_level>(min_level)));
    return true;
}
}
