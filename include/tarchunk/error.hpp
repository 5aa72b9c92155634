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

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace tarchunk {

// Absolute byte position within an archive stream
using offset_type = std::int64_t;

// Byte count; signed so archives beyond 4 GiB and differences stay representable
using size_type = std::int64_t;

enum class error_code {
    // Clean end of archive while another entry was expected
    no_more_headers,
    // A payload chunk arrived with no header pending
    unexpected_payload,
    incomplete_header,
    incomplete_payload,
    // First zero block of the trailer is not followed by a full block
    short_trailer,
    // First zero block of the trailer is followed by a non-zero block
    bad_trailer,
    invalid_header,
    io_error,
    invalid_operation
};

[[nodiscard]] std::string_view to_string(error_code code) noexcept;

class error {
public:
    error(const error_code code, std::string message, const offset_type offset = 0, const size_type remaining = 0)
        : code_(code), message_(std::move(message)), offset_(offset), remaining_(remaining) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    // Byte offset at which the condition was detected
    [[nodiscard]] offset_type offset() const noexcept { return offset_; }

    // Payload bytes still owed by the stream (incomplete_payload only)
    [[nodiscard]] size_type remaining() const noexcept { return remaining_; }

    friend bool operator==(const error& lhs, const error& rhs) noexcept {
        return lhs.code_ == rhs.code_ && lhs.offset_ == rhs.offset_ && lhs.remaining_ == rhs.remaining_;
    }

private:
    error_code code_;
    std::string message_;
    offset_type offset_;
    size_type remaining_;
};

// Build an archive error with a message derived from its code and position
[[nodiscard]] error make_error(error_code code, offset_type offset, size_type remaining = 0);

// Same, with a cause appended to the message (e.g. the strerror text)
[[nodiscard]] error make_error(error_code code, offset_type offset, std::string_view detail);

} // namespace tarchunk
