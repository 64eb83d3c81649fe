/**
 * @file macro.hpp
 * @author Ruan Formigoni
 * @brief Control flow shorthands that log before leaving
 *
 * Every macro takes an optional logger format after its action, the level comes from the prefix of
 * the format (D::, I::, W::, E::, C::).
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include "lib/log.hpp"

/**
 * @brief Returns value when condition holds
 *
 * @code
 * return_if(not fs::exists(path_source), Error("E::Source '{}' does not exist", path_source));
 * return_if(names.empty(),, "D::No package to install");
 * @endcode
 *
 * Commas inside value must be parenthesized.
 */
#define return_if(condition, value, ...) \
  if (condition) { \
    __VA_OPT__(logger(__VA_ARGS__);) \
    return value; \
  }

/**
 * @brief Leaves the enclosing loop when condition holds
 */
#define break_if(condition, ...) \
  if (condition) { \
    __VA_OPT__(logger(__VA_ARGS__);) \
    break; \
  }

/**
 * @brief Skips to the next iteration when condition holds
 *
 * @code
 * continue_if(skip.contains(role), "D::Skipping role {}", role);
 * @endcode
 */
#define continue_if(condition, ...) \
  if (condition) { \
    __VA_OPT__(logger(__VA_ARGS__);) \
    continue; \
  }

// Logs when condition holds, control flow is unchanged
#define log_if(condition, ...) \
  if (condition) { \
    logger(__VA_ARGS__); \
  }

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
