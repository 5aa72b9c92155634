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
#include <chrono>
#include <cstdint>
#include <string>

namespace tarchunk {

enum class entry_kind : std::uint8_t {
    normal,
    hard_link,
    symbolic_link,
    character_special,
    block_special,
    directory,
    fifo,
    other
};

// Semantic file type of an entry. The raw indicator byte is kept so that
// unknown types (entry_kind::other) remain distinguishable.
struct entry_type {
    entry_kind kind = entry_kind::normal;
    std::uint8_t indicator = 0;

    friend bool operator==(const entry_type&, const entry_type&) = default;
};

// Map a raw ustar typeflag byte to its entry type. Total: every byte maps.
[[nodiscard]] constexpr entry_type classify_link_indicator(const std::uint8_t indicator) noexcept {
    switch (indicator) {
        case 0:
        case '0': return {entry_kind::normal, indicator};
        case '1': return {entry_kind::hard_link, indicator};
        case '2': return {entry_kind::symbolic_link, indicator};
        case '3': return {entry_kind::character_special, indicator};
        case '4': return {entry_kind::block_special, indicator};
        case '5': return {entry_kind::directory, indicator};
        case '6': return {entry_kind::fifo, indicator};
        default:  return {entry_kind::other, indicator};
    }
}

[[nodiscard]] std::string_view to_string(entry_kind kind) noexcept;

struct header {
    // Offset of the header block itself; always block aligned
    offset_type offset = 0;
    // First payload byte, offset + 512
    offset_type payload_offset = 0;

    std::string file_name_suffix;
    std::string file_name_prefix;
    std::uint32_t file_mode = 0;
    std::int64_t owner_id = 0;
    std::int64_t group_id = 0;
    size_type payload_size = 0;
    std::int64_t mod_time = 0;
    std::uint8_t link_indicator = 0;
    std::string link_name;
    std::string owner_name;
    std::string group_name;

    // Only meaningful for character and block special entries
    std::int64_t device_major = 0;
    std::int64_t device_minor = 0;

    // Stored checksum as found in the block. Never verified.
    std::uint32_t checksum = 0;

    // Prefix and suffix concatenated as stored, no separator is inserted
    [[nodiscard]] std::string path() const;

    [[nodiscard]] entry_type type() const noexcept { return classify_link_indicator(link_indicator); }

    [[nodiscard]] std::chrono::system_clock::time_point modification_time() const noexcept {
        return std::chrono::system_clock::time_point{std::chrono::seconds{mod_time}};
    }

    [[nodiscard]] bool is_regular_file() const noexcept { return type().kind == entry_kind::normal; }
    [[nodiscard]] bool is_directory() const noexcept { return type().kind == entry_kind::directory; }
    [[nodiscard]] bool is_symbolic_link() const noexcept { return type().kind == entry_kind::symbolic_link; }
    [[nodiscard]] bool is_hard_link() const noexcept { return type().kind == entry_kind::hard_link; }

    [[nodiscard]] bool is_device() const noexcept {
        const auto kind = type().kind;
        return kind == entry_kind::character_special || kind == entry_kind::block_special;
    }

    friend bool operator==(const header&, const header&) = default;
};

// POSIX ustar header layout (512 bytes)
struct ustar_header {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];      // "ustar\0"
    char version[2];    // "00"
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};

static_assert(sizeof(ustar_header) == 512, "POSIX ustar header must be exactly 512 bytes");

} // namespace tarchunk
