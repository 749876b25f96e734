// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef DOCVAL_H
#define DOCVAL_H

#ifdef __cplusplus
#include <cstddef>

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum DOCVAL_RET_CODE
 *
 * Codes returned by docval_validate.
 **/
typedef enum
{
    DOCVAL_ERR_INTERNAL         = -2,
    DOCVAL_ERR_INVALID_ARGUMENT = -1,
    DOCVAL_OK                   = 0,
    // The input contains no decimal digit
    DOCVAL_INVALID_INPUT        = 1,
    // The number of digits matches neither a CPF (11) nor a CNPJ (14)
    DOCVAL_INVALID_LENGTH       = 2,
    // Every digit is the same, e.g. 000.000.000-00
    DOCVAL_ALL_DIGITS_EQUAL     = 3,
    // The check digits don't match the ones computed from the rest of the number
    DOCVAL_INVALID_CHECKSUM     = 4,
} DOCVAL_RET_CODE;

/**
 * @enum DOCVAL_DOC_KIND
 *
 * Kind of document, as determined by the number of digits.
 **/
typedef enum
{
    DOCVAL_DOC_UNKNOWN = 0,
    // Cadastro de Pessoas Físicas, 11 digits
    DOCVAL_DOC_CPF     = 1,
    // Cadastro Nacional da Pessoa Jurídica, 14 digits
    DOCVAL_DOC_CNPJ    = 2,
} DOCVAL_DOC_KIND;

/**
 * @enum DOCVAL_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    DOCVAL_LOG_TRACE,
    DOCVAL_LOG_DEBUG,
    DOCVAL_LOG_INFO,
    DOCVAL_LOG_WARN,
    DOCVAL_LOG_ERROR,
    DOCVAL_LOG_OFF,
} DOCVAL_LOG_LEVEL;

/**
 * @typedef docval_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*docval_log_cb)(
    DOCVAL_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * docval_validate
 *
 * Validate a CPF or CNPJ. Any character other than an ASCII decimal digit is
 * ignored, so both plain and formatted numbers (123.456.789-09,
 * 12.345.678/0001-95) are accepted.
 *
 * @param value The document number, not necessarily NUL-terminated. (nullable if length is 0)
 * @param length The length of value in bytes.
 * @param kind Receives the kind of document whenever it could be determined. (nullable)
 *
 * @return DOCVAL_OK if the document is valid, the reason it was rejected
 *         otherwise, or a negative error code on misuse or internal failure.
 *
 * @note This function is pure and thread-safe.
 **/
DOCVAL_RET_CODE docval_validate(const char *value, size_t length, DOCVAL_DOC_KIND *kind);

/**
 * docval_ret_code_to_string
 *
 * Return a human readable description of a return code.
 *
 * @param code The code to describe.
 *
 * @return Static string, note that this should not be freed
 **/
const char *docval_ret_code_to_string(DOCVAL_RET_CODE code);

/**
 * docval_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *docval_get_version();

/**
 * docval_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool docval_set_log_cb(docval_log_cb cb, DOCVAL_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*DOCVAL_H */
