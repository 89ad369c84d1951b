#pragma once

#include <string>
#include "job.hpp"

// Lowercase and keep only [a-z0-9].
std::string sanitize_base(const std::string& base);

// Random lowercase suffix shared by every generated name of one job.
std::string random_suffix(std::size_t length);

// Build all resource names from a sanitized base and a suffix. Each name is
// <truncated base><role code><suffix>, cut to the provider's length limit.
ResourceNames build_names(const std::string& sanitized_base, const std::string& suffix);
