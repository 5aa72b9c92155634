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
#include <optional>
#include <variant>
#include <vector>

namespace tarchunk {

// A fragment of the payload of the entry announced by the last header chunk
struct payload {
    offset_type offset = 0;
    std::vector<std::byte> bytes;

    [[nodiscard]] size_type size() const noexcept { return static_cast<size_type>(bytes.size()); }

    friend bool operator==(const payload&, const payload&) = default;
};

// One event of a decoded archive: a header, a payload fragment or a
// terminal error
struct chunk {
    std::variant<header, payload, error> value;

    [[nodiscard]] bool is_header() const noexcept { return std::holds_alternative<header>(value); }
    [[nodiscard]] bool is_payload() const noexcept { return std::holds_alternative<payload>(value); }
    [[nodiscard]] bool is_error() const noexcept { return std::holds_alternative<error>(value); }

    [[nodiscard]] const header* as_header() const noexcept { return std::get_if<header>(&value); }
    [[nodiscard]] const payload* as_payload() const noexcept { return std::get_if<payload>(&value); }
    [[nodiscard]] const error* as_error() const noexcept { return std::get_if<error>(&value); }
};

// Anything that produces a chunk sequence on demand
class chunk_source {
public:
    virtual ~chunk_source() = default;

    // Next chunk, or nullopt once the sequence has ended
    [[nodiscard]] virtual std::optional<chunk> next() = 0;
};

} // namespace tarchunk
