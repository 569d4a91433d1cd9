// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <variant>

#include "../../common/utils.hpp"
#include "cpf.hpp"

using namespace bras_fuzz;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    auto res = bras::cpf::from_string(bytes_to_string_view(data, size));
    if (auto *value = std::get_if<bras::cpf>(&res); value != nullptr) {
        // Any accepted text must be accepted as an integer and print back as digits
        auto from_integer = bras::cpf::from_integer(value->value());
        if (!std::holds_alternative<bras::cpf>(from_integer) ||
            std::get<bras::cpf>(from_integer) != *value) {
            __builtin_trap();
        }

        auto str = value->to_string();
        if (!std::holds_alternative<bras::cpf>(bras::cpf::from_string(str))) {
            __builtin_trap();
        }
    }

    prevent_optimization(res);

    return 0;
}
