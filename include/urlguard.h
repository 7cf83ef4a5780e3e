// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef URLGUARD_H
#define URLGUARD_H

#ifdef __cplusplus
#include <cstddef>

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum URLGUARD_VERDICT
 *
 * Outcome of an allowlist or safety check. Every value other than
 * URLGUARD_ALLOWED must be treated as a denial by the caller.
 **/
typedef enum
{
    URLGUARD_ALLOWED          = 0,
    // The URL provided was empty or NULL
    URLGUARD_EMPTY_URL        = 1,
    // The service is not present in the allowlist
    URLGUARD_UNKNOWN_SERVICE  = 2,
    // The URL doesn't match any allowlisted endpoint for the mode and transport
    URLGUARD_NOT_ALLOWLISTED  = 3,
    // The URL couldn't be decomposed
    URLGUARD_MALFORMED_URL    = 4,
    // The scheme is not one of http, https, ws or wss
    URLGUARD_FORBIDDEN_SCHEME = 5,
    // The URL has no host
    URLGUARD_MISSING_HOST     = 6,
    // The host matched one of the forbidden host rules
    URLGUARD_FORBIDDEN_HOST   = 7,
    // The explicit port is one of the forbidden ports
    URLGUARD_FORBIDDEN_PORT   = 8,
    // Unexpected failure while evaluating the URL
    URLGUARD_INTERNAL_ERROR   = 9,
} URLGUARD_VERDICT;

/**
 * @enum URLGUARD_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    URLGUARD_LOG_TRACE,
    URLGUARD_LOG_DEBUG,
    URLGUARD_LOG_INFO,
    URLGUARD_LOG_WARN,
    URLGUARD_LOG_ERROR,
    URLGUARD_LOG_OFF,
} URLGUARD_LOG_LEVEL;

/**
 * @typedef urlguard_log_cb
 *
 * Callback that urlguard will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*urlguard_log_cb)(
    URLGUARD_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * urlguard_check_allowed_url
 *
 * Verify that the URL is one of the allowlisted endpoints of the service, or a
 * path below one of them, for the given network mode and transport.
 *
 * @param service Name of the service, compared case-insensitively. (nullable)
 * @param url URL to verify. (nullable)
 * @param length Length of the URL.
 * @param is_testnet Whether to use the testnet endpoints.
 * @param is_websocket Whether to use the websocket endpoints.
 *
 * @return URLGUARD_ALLOWED or the reason of the denial.
 **/
URLGUARD_VERDICT urlguard_check_allowed_url(const char *service, const char *url, size_t length,
    bool is_testnet, bool is_websocket);

/**
 * urlguard_is_allowed_url
 *
 * Same as urlguard_check_allowed_url, returning true only when allowed.
 **/
bool urlguard_is_allowed_url(const char *service, const char *url, size_t length,
    bool is_testnet, bool is_websocket);

/**
 * urlguard_check_url_safety
 *
 * Verify that the URL uses a web scheme and doesn't point to a forbidden host
 * or port, regardless of any allowlist.
 *
 * @param url URL to verify. (nullable)
 * @param length Length of the URL.
 *
 * @return URLGUARD_ALLOWED or the reason of the denial.
 **/
URLGUARD_VERDICT urlguard_check_url_safety(const char *url, size_t length);

/**
 * urlguard_validate_url_safety
 *
 * Same as urlguard_check_url_safety, returning true only when allowed.
 **/
bool urlguard_validate_url_safety(const char *url, size_t length);

/**
 * urlguard_sanitize_url
 *
 * Remove the query and fragment of the URL, as well as any trailing slash.
 * Characters within the path, query and fragment aren't validated. URLs with
 * an unbalanced IPv6 bracket in their authority are returned unchanged.
 *
 * @param url URL to sanitize. (nullable)
 * @param length Length of the URL.
 * @param buffer Destination of the NUL-terminated result. (nullable)
 * @param buffer_size Size of the buffer, including space for the NUL terminator.
 *
 * @return The length of the sanitized URL, excluding the NUL terminator. The
 *         buffer is only written if buffer_size is larger than this value.
 **/
size_t urlguard_sanitize_url(const char *url, size_t length, char *buffer, size_t buffer_size);

/**
 * urlguard_verdict_to_str
 *
 * @return A static string describing the verdict, note that this should not be freed
 **/
const char *urlguard_verdict_to_str(URLGUARD_VERDICT verdict);

/**
 * urlguard_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *urlguard_get_version();

/**
 * urlguard_set_log_cb
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
bool urlguard_set_log_cb(urlguard_log_cb cb, URLGUARD_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*URLGUARD_H */
