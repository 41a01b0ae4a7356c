/**
 * @file logger.cpp
 * @brief Logger linkage unit for mmbind_utils.
 *
 * @copyright Copyright (c) 2024 mmbind Contributors
 * @license MIT License
 */

#include "mmbind/utils/logger.hpp"

namespace mmbind {
namespace utils {

// Logger is header-only; the singleton lives in a function-local static.
// This unit gives the library an object file to anchor the export macros.

}  // namespace utils
}  // namespace mmbind
