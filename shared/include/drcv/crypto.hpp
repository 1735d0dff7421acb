/**
 * drcv - Randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace drcv::crypto
{

    // Uniformly random string of `length` characters drawn from `alphabet`.
    std::string random_string(std::size_t length, std::string_view alphabet);

    // Short lowercase alphanumeric identifier, e.g. "k3x9qa".
    std::string random_identifier(std::size_t length);

} // namespace drcv::crypto
