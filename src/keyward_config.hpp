/**
 * @file keyward_config.hpp
 * @brief Compile-time configuration, feature flags and wire constants
 *
 * Values in the "compatibility contract" section are baked into every
 * wrapped key and recovery record ever produced. Changing any of them makes
 * existing records undecryptable.
 */

#pragma once

#define KEYWARD_VERSION_MAJOR 1
#define KEYWARD_VERSION_MINOR 2
#define KEYWARD_VERSION_PATCH 0
#define KEYWARD_VERSION_STRING "1.2.0"

// ============================================================================
// FEATURE FLAGS
// ============================================================================

/**
 * @brief Allow the memory-hard KDF (Argon2id, 64 MiB) on this build
 *
 * Builds for memory-constrained targets set this to 0. Argon2id requests
 * then fail with UnsupportedOperationError and legacy recovery records must
 * be opened on another device.
 */
#ifndef KEYWARD_ALLOW_MEMORY_HARD_KDF
#define KEYWARD_ALLOW_MEMORY_HARD_KDF 1
#endif

/**
 * @brief Auto-register the first device of an account during initialize()
 */
#ifndef KEYWARD_AUTO_SETUP_FIRST_DEVICE
#define KEYWARD_AUTO_SETUP_FIRST_DEVICE 1
#endif

// ============================================================================
// COMPATIBILITY CONTRACT
// ============================================================================

#define KEYWARD_UMK_BYTES 32
#define KEYWARD_SALT_BYTES 16

#define KEYWARD_PBKDF2_ITERATIONS 310000
#define KEYWARD_PBKDF2_KEY_BYTES 32

#define KEYWARD_ARGON2_T_COST 3
#define KEYWARD_ARGON2_M_COST_KIB 65536
#define KEYWARD_ARGON2_PARALLELISM 4
#define KEYWARD_ARGON2_KEY_BYTES 32

#define KEYWARD_PAYLOAD_VERSION 1
#define KEYWARD_RECOVERY_EXPORT_VERSION 1
#define KEYWARD_PREVIEW_MAX_CHARS 500

// ============================================================================
// RUNTIME DEFAULTS
// ============================================================================

#define KEYWARD_APPROVAL_POLL_INTERVAL_MS 3000
#define KEYWARD_PENDING_EXPIRY_HOURS 24

#if defined(_WIN32)
#define KEYWARD_PLATFORM_NAME "windows"
#elif defined(__ANDROID__)
#define KEYWARD_PLATFORM_NAME "android"
#elif defined(__APPLE__)
#include <TargetConditionals.h>
#if TARGET_OS_IPHONE
#define KEYWARD_PLATFORM_NAME "ios"
#else
#define KEYWARD_PLATFORM_NAME "macos"
#endif
#elif defined(__EMSCRIPTEN__)
#define KEYWARD_PLATFORM_NAME "web"
#elif defined(__linux__)
#define KEYWARD_PLATFORM_NAME "linux"
#else
#define KEYWARD_PLATFORM_NAME "unknown"
#endif
