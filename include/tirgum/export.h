#pragma once

/**
 * @file export.h
 * @brief Symbol visibility macros for the Tirgum library
 *
 * NOTE: With WINDOWS_EXPORT_ALL_SYMBOLS, CMake auto-generates exports.
 *       TIRGUM_API is kept as empty macro for compatibility but has no effect.
 */

// TIRGUM_API is a no-op - WINDOWS_EXPORT_ALL_SYMBOLS handles exports
#define TIRGUM_API
