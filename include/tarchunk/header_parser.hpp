/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <tarchunk/error.hpp>
#include <tarchunk/header.hpp>
#include <cstddef>
#include <expected>
#include <limits>
#include <span>
#include <string_view>

namespace tarchunk::detail {

constexpr size_t BLOCK_SIZE = 512;

// Bytes needed after `size` payload bytes to reach the next block boundary
[[nodiscard]] constexpr size_type padding_for(const size_type size) noexcept {
    constexpr auto block = static_cast<size_type>(BLOCK_SIZE);
    return (block - size % block) % block;
}

// Parse the leading run of octal digits in a numeric field. Anything that is
// not '0'..'7' ends the value, so space or NUL padding terminates it and a
// field with no leading digit is 0. Only overflow of T is an error.
template<typename T = std::int64_t, size_t N>
constexpr std::expected<T, error> parse_octal(std::span<const char, N> field) {
    T result = 0;

    for (const char c : field) {
        if (c < '0' || c > '7') {
            break;
        }
        const auto digit = static_cast<T>(c - '0');
        if (result > (std::numeric_limits<T>::max() - digit) / 8) {
            return std::unexpected(error{error_code::invalid_header, "Octal value overflow"});
        }
        result = static_cast<T>(result * 8 + digit);
    }

    return result;
}

// Unsigned byte sum of the block with the checksum field counted as spaces.
// The decoder never compares it with the stored value.
[[nodiscard]] std::uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block);

// Decode one non-zero header block found at `offset`
[[nodiscard]] std::expected<header, error> parse_header(std::span<const std::byte, BLOCK_SIZE> block,
                                                        offset_type offset);

// Check if block is all zeros (end-of-archive marker)
[[nodiscard]] bool is_zero_block(std::span<const std::byte> block);

// Helper to safely extract null-terminated string from a fixed-size field
[[nodiscard]] std::string_view extract_string(std::span<const char> field);

} // namespace tarchunk::detail
