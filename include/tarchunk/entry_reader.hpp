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

#include <tarchunk/chunk.hpp>
#include <tarchunk/error.hpp>
#include <tarchunk/header.hpp>
#include <tarchunk/header_parser.hpp>
#include <tarchunk/stream.hpp>
#include <concepts>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace tarchunk {

class entry_reader;

// The payload bytes of one entry, valid only while the entry handler runs.
// Reading stops at the next header; an error chunk met on the way is
// returned from every later call.
class payload_stream : public input_stream {
private:
    entry_reader* reader_;
    std::vector<std::byte> fragment_;
    size_t consumed_ = 0;
    size_type bytes_read_ = 0;
    bool finished_ = false;
    std::optional<error> error_;

    // Load the next non-empty payload fragment. False at the end of the entry.
    [[nodiscard]] std::expected<bool, error> fetch();

public:
    explicit payload_stream(entry_reader& reader) : reader_(&reader) {}

    payload_stream(const payload_stream&) = delete;
    payload_stream& operator=(const payload_stream&) = delete;

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] bool at_end() const override;

    // Unread remainder of the current fragment without copying. Empty at the
    // end of the entry. The span is invalidated by the next call on this stream.
    [[nodiscard]] std::expected<std::span<const std::byte>, error> next_fragment();

    // Everything not yet read, collected in memory
    [[nodiscard]] std::expected<std::vector<std::byte>, error> read_all();

    // Discard everything not yet read
    [[nodiscard]] std::expected<void, error> drain();

    // Bytes handed to the caller so far
    [[nodiscard]] size_type bytes_read() const noexcept { return bytes_read_; }
};

template<typename F>
concept entry_handler = std::invocable<F&, const header&, payload_stream&>;

template<typename F>
using entry_result_t = std::remove_cvref_t<std::invoke_result_t<F&, const header&, payload_stream&>>;

// Groups a chunk sequence into entries and hands each one to a handler
// together with its payload. Whatever the handler leaves unread is drained
// before the call returns, so the next call starts at the next header.
class entry_reader {
private:
    friend class payload_stream;

    chunk_source* source_;
    std::optional<chunk> pending_;   // One-slot chunk push-back
    offset_type next_offset_ = 0;    // Where the next header is expected

    [[nodiscard]] std::optional<chunk> pull();
    void push_back(chunk c);

public:
    explicit entry_reader(chunk_source& source) : source_(&source) {}

    // Process exactly one entry. Fails with no_more_headers when the sequence
    // has ended, unexpected_payload when it is positioned inside an entry,
    // or with the error chunk the sequence produced.
    template<entry_handler Handler>
    auto with_entry(Handler&& handler) -> std::expected<entry_result_t<Handler>, error>;

    // Process entries until the archive is exhausted. Stops at the first
    // error other than no_more_headers.
    template<entry_handler Handler>
    std::expected<void, error> with_entries(Handler&& handler);
};

template<entry_handler Handler>
auto entry_reader::with_entry(Handler&& handler) -> std::expected<entry_result_t<Handler>, error> {
    using result_type = entry_result_t<Handler>;

    auto next = pull();
    if (!next) {
        return std::unexpected(make_error(error_code::no_more_headers, next_offset_));
    }

    if (const auto* fragment = next->as_payload()) {
        const offset_type offset = fragment->offset;
        push_back(std::move(*next));
        return std::unexpected(make_error(error_code::unexpected_payload, offset));
    }

    if (const auto* e = next->as_error()) {
        return std::unexpected(*e);
    }

    const header h = std::get<header>(std::move(next->value));
    next_offset_ = h.payload_offset + h.payload_size + detail::padding_for(h.payload_size);

    payload_stream payload{*this};

    if constexpr (std::is_void_v<result_type>) {
        std::invoke(handler, h, payload);
        if (auto drained = payload.drain(); !drained) {
            return std::unexpected(drained.error());
        }
        return {};
    } else {
        result_type result = std::invoke(handler, h, payload);
        if (auto drained = payload.drain(); !drained) {
            return std::unexpected(drained.error());
        }
        return result;
    }
}

template<entry_handler Handler>
std::expected<void, error> entry_reader::with_entries(Handler&& handler) {
    static_assert(std::is_void_v<entry_result_t<Handler>>, "with_entries handlers must return void");

    while (true) {
        auto result = with_entry(handler);
        if (!result) {
            if (result.error().code() == error_code::no_more_headers) {
                return {};
            }
            return std::unexpected(result.error());
        }
    }
}

// Process every entry of `source` with `handler`
template<entry_handler Handler>
std::expected<void, error> with_entries(chunk_source& source, Handler&& handler) {
    entry_reader reader{source};
    return reader.with_entries(std::forward<Handler>(handler));
}

} // namespace tarchunk
