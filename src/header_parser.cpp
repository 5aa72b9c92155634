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

#include <tarchunk/header_parser.hpp>
#include <algorithm>
#include <array>
#include <bit>
#include <limits>
#include <ranges>

namespace tarchunk::detail {

namespace {

// Every digit of the widest field fits its destination, so parsing a ustar
// block cannot overflow
constexpr int octal_bits(const size_t width) { return static_cast<int>(width) * 3; }

static_assert(octal_bits(sizeof(ustar_header::size)) < std::numeric_limits<std::int64_t>::digits);
static_assert(octal_bits(sizeof(ustar_header::mtime)) < std::numeric_limits<std::int64_t>::digits);
static_assert(octal_bits(sizeof(ustar_header::uid)) < std::numeric_limits<std::int64_t>::digits);
static_assert(octal_bits(sizeof(ustar_header::devmajor)) < std::numeric_limits<std::int64_t>::digits);
static_assert(octal_bits(sizeof(ustar_header::mode)) <= std::numeric_limits<std::uint32_t>::digits);
static_assert(octal_bits(sizeof(ustar_header::checksum)) <= std::numeric_limits<std::uint32_t>::digits);

} // anonymous namespace

std::uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block) {
    std::uint32_t sum = 0;

    // Work on a copy with the checksum field filled with spaces
    std::array<std::byte, BLOCK_SIZE> temp_block{};
    std::ranges::copy(block, temp_block.begin());

    auto* raw = std::bit_cast<ustar_header*>(temp_block.data());
    std::ranges::fill(std::span{raw->checksum}, ' ');

    for (const auto byte : temp_block) {
        sum += static_cast<std::uint8_t>(byte);
    }

    return sum;
}

std::string_view extract_string(std::span<const char> field) {
    const auto null_pos = std::ranges::find(field, '\0');
    const size_t length = null_pos != field.end() ?
        static_cast<size_t>(std::distance(field.begin(), null_pos)) :
        field.size();
    return std::string_view{field.data(), length};
}

bool is_zero_block(std::span<const std::byte> block) {
    return std::ranges::all_of(block, [](auto b) { return b == std::byte{0}; });
}

auto parse_header(std::span<const std::byte, BLOCK_SIZE> block, const offset_type offset)
    -> std::expected<header, error> {
    const auto* raw = std::bit_cast<const ustar_header*>(block.data());

    // A field without a leading octal digit, a GNU base-256 size included,
    // decodes to 0
    auto mode = parse_octal<std::uint32_t>(std::span{raw->mode});
    auto uid = parse_octal(std::span{raw->uid});
    auto gid = parse_octal(std::span{raw->gid});
    auto size = parse_octal(std::span{raw->size});
    auto mtime = parse_octal(std::span{raw->mtime});
    auto checksum = parse_octal<std::uint32_t>(std::span{raw->checksum});
    auto major = parse_octal(std::span{raw->devmajor});
    auto minor = parse_octal(std::span{raw->devminor});

    if (!mode || !uid || !gid || !size || !mtime || !checksum || !major || !minor) {
        return std::unexpected(make_error(error_code::invalid_header, offset));
    }

    header h;
    h.offset = offset;
    h.payload_offset = offset + static_cast<offset_type>(BLOCK_SIZE);
    h.file_name_suffix = std::string{extract_string(std::span{raw->name})};
    h.file_name_prefix = std::string{extract_string(std::span{raw->prefix})};
    h.file_mode = *mode;
    h.owner_id = *uid;
    h.group_id = *gid;
    h.payload_size = *size;
    h.mod_time = *mtime;
    h.link_indicator = static_cast<std::uint8_t>(raw->typeflag);
    h.link_name = std::string{extract_string(std::span{raw->linkname})};
    h.owner_name = std::string{extract_string(std::span{raw->uname})};
    h.group_name = std::string{extract_string(std::span{raw->gname})};
    h.device_major = *major;
    h.device_minor = *minor;
    h.checksum = *checksum;

    return h;
}

} // namespace tarchunk::detail
