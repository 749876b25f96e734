// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "../../common/afl_wrapper.hpp"
#include "../../common/utils.hpp"
#include "docval.h"
#include "tax_id.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

using namespace docval_afl;

namespace {

bool is_enumerated(DOCVAL_RET_CODE code)
{
    switch (code) {
    case DOCVAL_OK:
    case DOCVAL_INVALID_INPUT:
    case DOCVAL_INVALID_LENGTH:
    case DOCVAL_ALL_DIGITS_EQUAL:
    case DOCVAL_INVALID_CHECKSUM:
        return true;
    case DOCVAL_ERR_INTERNAL:
    case DOCVAL_ERR_INVALID_ARGUMENT:
        break;
    }
    return false;
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    auto input = bytes_to_string_view(data, size);

    DOCVAL_DOC_KIND kind = DOCVAL_DOC_UNKNOWN;
    auto code = docval_validate(input.data(), input.size(), &kind);
    if (!is_enumerated(code)) {
        __builtin_trap();
    }

    // The kind is only known once the length has been classified
    bool kind_expected = code == DOCVAL_OK || code == DOCVAL_ALL_DIGITS_EQUAL ||
                         code == DOCVAL_INVALID_CHECKSUM;
    if (kind_expected != (kind != DOCVAL_DOC_UNKNOWN)) {
        __builtin_trap();
    }

    // Sanitisation is idempotent and doesn't change the outcome
    auto digits = docval::sanitize_tax_id(input);
    if (docval::sanitize_tax_id(digits) != digits) {
        __builtin_trap();
    }

    DOCVAL_DOC_KIND sanitized_kind = DOCVAL_DOC_UNKNOWN;
    if (docval_validate(digits.data(), digits.size(), &sanitized_kind) != code ||
        sanitized_kind != kind) {
        __builtin_trap();
    }

    prevent_optimization(code);

    return 0;
}

AFL_FUZZ_TARGET("tax_id_fuzz", LLVMFuzzerTestOneInput)
