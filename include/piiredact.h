// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef PIIREDACT_H
#define PIIREDACT_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum PIIREDACT_RET_CODE
 *
 * Codes returned by piiredact_mask_json.
 **/
typedef enum
{
    PIIREDACT_ERR_INTERNAL         = -3,
    PIIREDACT_ERR_INVALID_OBJECT   = -2,
    PIIREDACT_ERR_INVALID_ARGUMENT = -1,
    PIIREDACT_OK                   = 0,
} PIIREDACT_RET_CODE;

/**
 * @enum PIIREDACT_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    PIIREDACT_LOG_TRACE,
    PIIREDACT_LOG_DEBUG,
    PIIREDACT_LOG_INFO,
    PIIREDACT_LOG_WARN,
    PIIREDACT_LOG_ERROR,
    PIIREDACT_LOG_OFF,
} PIIREDACT_LOG_LEVEL;

typedef struct _piiredact_config piiredact_config;
typedef struct _piiredact_pattern piiredact_pattern;

/**
 * @struct piiredact_config
 *
 * Masking configuration. Nothing is masked unless enabled is true, in which
 * case each pattern is applied unless its flag is false.
 **/
struct _piiredact_config
{
    /** Top-level gate, masking is a no-op when false. */
    bool enabled;

    /** Per-pattern flags. */
    struct _piiredact_config_rules {
        bool cpr;
        bool email;
        bool phone;
        bool credit_card;
        bool ssn;
    } rules;
};

/**
 * @struct piiredact_pattern
 *
 * Documentation entry for a single pattern. The strings are owned by the
 * library and remain valid for the lifetime of the process.
 **/
struct _piiredact_pattern
{
    const char *id;
    const char *description;
    const char *example;
};

/**
 * @typedef piiredact_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The size of the logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*piiredact_log_cb)(
    PIIREDACT_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * piiredact_default_config
 *
 * Obtain the default configuration: masking disabled, every pattern enabled.
 *
 * @return The default configuration.
 **/
piiredact_config piiredact_default_config(void);

/**
 * piiredact_mask_json
 *
 * Decode a JSON document, mask every string it contains according to the
 * configuration and encode the result back into JSON. The shape of the
 * document is preserved, only string contents change.
 *
 * @param json The JSON document. (nonnull)
 * @param length Length of the JSON document.
 * @param config Masking configuration, the default is used if null. (nullable)
 * @param output Pointer to the resulting NUL-terminated JSON, must be freed
 *               with piiredact_buffer_free. (nonnull)
 * @param output_length Length of the resulting JSON. (nullable)
 *
 * @return PIIREDACT_OK on success, PIIREDACT_ERR_INVALID_ARGUMENT if a nonnull
 *         argument is null, PIIREDACT_ERR_INVALID_OBJECT if the document isn't
 *         valid JSON, PIIREDACT_ERR_INTERNAL on any other failure.
 **/
PIIREDACT_RET_CODE piiredact_mask_json(const char *json, size_t length,
    const piiredact_config *config, char **output, size_t *output_length);

/**
 * piiredact_buffer_free
 *
 * Free a buffer returned by piiredact_mask_json.
 *
 * @param buffer Buffer to free. (nullable)
 **/
void piiredact_buffer_free(char *buffer);

/**
 * piiredact_pattern_count
 *
 * @return The number of patterns known to the library.
 **/
size_t piiredact_pattern_count(void);

/**
 * piiredact_pattern_info
 *
 * Retrieve the documentation entry of a pattern, patterns are listed in the
 * order in which they are applied.
 *
 * @param index Index of the pattern, smaller than piiredact_pattern_count.
 * @param info Structure to populate. (nonnull)
 *
 * @return Whether the index was valid and info has been populated.
 **/
bool piiredact_pattern_info(size_t index, piiredact_pattern *info);

/**
 * piiredact_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *piiredact_get_version(void);

/**
 * piiredact_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 **/
bool piiredact_set_log_cb(piiredact_log_cb cb, PIIREDACT_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* PIIREDACT_H */
