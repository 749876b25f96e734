// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include "docval.h"
#include "log.hpp"
#include "tax_id.hpp"
#include "version.hpp"

using namespace docval;

// Kind compatibility
static_assert(static_cast<uint8_t>(tax_id_kind::cpf) + 1 == DOCVAL_DOC_CPF);
static_assert(static_cast<uint8_t>(tax_id_kind::cnpj) + 1 == DOCVAL_DOC_CNPJ);

namespace {

DOCVAL_RET_CODE error_to_ret_code(tax_id_error error)
{
    switch (error) {
    case tax_id_error::invalid_input:
        return DOCVAL_INVALID_INPUT;
    case tax_id_error::invalid_length:
        return DOCVAL_INVALID_LENGTH;
    case tax_id_error::all_digits_equal:
        return DOCVAL_ALL_DIGITS_EQUAL;
    case tax_id_error::invalid_checksum:
        return DOCVAL_INVALID_CHECKSUM;
    }
    return DOCVAL_ERR_INTERNAL;
}

DOCVAL_DOC_KIND kind_to_doc_kind(tax_id_kind kind)
{
    return kind == tax_id_kind::cpf ? DOCVAL_DOC_CPF : DOCVAL_DOC_CNPJ;
}

} // namespace

extern "C" {

DOCVAL_RET_CODE docval_validate(const char *value, size_t length, DOCVAL_DOC_KIND *kind)
{
    if (kind != nullptr) {
        *kind = DOCVAL_DOC_UNKNOWN;
    }

    if (value == nullptr && length > 0) {
        DOCVAL_WARN("Tried to validate a null pointer with length {}", length);
        return DOCVAL_ERR_INVALID_ARGUMENT;
    }

    try {
        const std::string_view input = value == nullptr ? std::string_view{}
                                                        : std::string_view{value, length};
        auto result = validate_tax_id(input);
        if (kind != nullptr && result.kind.has_value()) {
            *kind = kind_to_doc_kind(*result.kind);
        }

        if (!result.valid()) {
            DOCVAL_DEBUG("Document rejected: {}", describe(*result.error));
            return error_to_ret_code(*result.error);
        }

        return DOCVAL_OK;
    } catch (const std::exception &e) {
        DOCVAL_ERROR("{}", e.what());
    } catch (...) {
        DOCVAL_ERROR("unknown exception");
    }

    return DOCVAL_ERR_INTERNAL;
}

const char *docval_ret_code_to_string(DOCVAL_RET_CODE code)
{
    switch (code) {
    case DOCVAL_ERR_INTERNAL:
        return "Internal error";
    case DOCVAL_ERR_INVALID_ARGUMENT:
        return "Invalid argument";
    case DOCVAL_OK:
        return "Ok";
    case DOCVAL_INVALID_INPUT:
        return "Invalid input";
    case DOCVAL_INVALID_LENGTH:
        return "Invalid length";
    case DOCVAL_ALL_DIGITS_EQUAL:
        return "All digits are equal";
    case DOCVAL_INVALID_CHECKSUM:
        return "Invalid checksum";
    }
    return "Unknown";
}

const char *docval_get_version() { return docval::current_version; }

bool docval_set_log_cb(docval_log_cb cb, DOCVAL_LOG_LEVEL min_level)
{
    docval::logger::init(cb, min_level);
    DOCVAL_INFO("Sending log messages to binding, min level {}", log_level_to_str(min_level));
    return true;
}

} // extern "C"
