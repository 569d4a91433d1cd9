// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef BRAS_H
#define BRAS_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum BRAS_RET_CODE
 *
 * Codes returned by the CPF parsing functions.
 **/
typedef enum
{
    BRAS_ERR_INTERNAL          = -6,
    BRAS_ERR_REPEATED_DIGITS   = -5,
    BRAS_ERR_INVALID_CHECKSUM  = -4,
    BRAS_ERR_INVALID_FORMAT    = -3,
    BRAS_ERR_INVALID_LENGTH    = -2,
    BRAS_ERR_INVALID_ARGUMENT  = -1,
    BRAS_OK                    = 0,
} BRAS_RET_CODE;

/**
 * @enum BRAS_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    BRAS_LOG_TRACE,
    BRAS_LOG_DEBUG,
    BRAS_LOG_INFO,
    BRAS_LOG_WARN,
    BRAS_LOG_ERROR,
    BRAS_LOG_OFF,
} BRAS_LOG_LEVEL;

typedef struct _bras_config bras_config;

/**
 * @struct bras_config
 *
 * Parsing configuration, a zero-initialised structure provides the defaults.
 **/
struct _bras_config
{
    /** Accept numbers made of 11 identical digits, e.g. 00000000000 */
    bool allow_repeated_digits;
};

/**
 * @typedef bras_log_cb
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
typedef void (*bras_log_cb)(
    BRAS_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * bras_cpf_from_integer
 *
 * Validate a CPF provided as an integer, leading zeros are implicit.
 *
 * @param value Numeric CPF, up to 99999999999.
 * @param config Optional parsing configuration. (nullable)
 * @param result Validated CPF, only written on success. (nonnull)
 *
 * @return BRAS_OK or the error code describing the failure.
 **/
BRAS_RET_CODE bras_cpf_from_integer(uint64_t value, const bras_config *config, uint64_t *result);

/**
 * bras_cpf_from_string
 *
 * Validate a CPF provided as text, either as 11 digits or as XXX.XXX.XXX-XX.
 *
 * @param str The string to parse, not necessarily NUL-terminated. (nonnull)
 * @param length Length of str.
 * @param config Optional parsing configuration. (nullable)
 * @param result Validated CPF, only written on success. (nonnull)
 *
 * @return BRAS_OK or the error code describing the failure.
 **/
BRAS_RET_CODE bras_cpf_from_string(
    const char *str, size_t length, const bras_config *config, uint64_t *result);

/**
 * bras_cpf_to_string
 *
 * Write the zero-padded 11-digit representation of a CPF.
 *
 * @param value Numeric CPF.
 * @param config Optional parsing configuration used to revalidate value. (nullable)
 * @param buffer Output buffer, NUL-terminated on success. (nonnull)
 * @param size Size of buffer, at least 12.
 *
 * @return BRAS_OK or the error code describing the failure.
 **/
BRAS_RET_CODE bras_cpf_to_string(
    uint64_t value, const bras_config *config, char *buffer, size_t size);

/**
 * bras_cpf_scan
 *
 * Find the valid CPFs contained within an arbitrary text.
 *
 * @param text The text to scan, not necessarily NUL-terminated. (nonnull)
 * @param length Length of text.
 * @param config Optional parsing configuration. (nullable)
 * @param results Output array for the CPFs found, in order of appearance. (nullable if capacity is 0)
 * @param capacity Number of elements available in results.
 * @param count Total number of CPFs found, which may exceed capacity. (nonnull)
 *
 * @return BRAS_OK or the error code describing the failure.
 **/
BRAS_RET_CODE bras_cpf_scan(const char *text, size_t length, const bras_config *config,
    uint64_t *results, size_t capacity, size_t *count);

/**
 * bras_ret_code_to_string
 *
 * @return Static description of the return code, note that this should not be freed
 **/
const char *bras_ret_code_to_string(BRAS_RET_CODE code);

/**
 * bras_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *bras_get_version();

/**
 * bras_set_log_cb
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
bool bras_set_log_cb(bras_log_cb cb, BRAS_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* BRAS_H */
