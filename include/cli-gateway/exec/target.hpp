/*
 * Target normalization - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace cligate {

// Canonical key for a target: absolute, lexically normal, '/' separated,
// without trailing separator. Empty input stays empty (global target).
// Never throws.
std::string normalize_target(const std::string& target);

} // namespace cligate
