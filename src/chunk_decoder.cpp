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

#include <tarchunk/chunk_decoder.hpp>
#include <algorithm>
#include <cassert>
#include <utility>

namespace tarchunk {

namespace {

constexpr auto block_size = static_cast<offset_type>(detail::BLOCK_SIZE);

} // anonymous namespace

auto chunk_decoder::from_file(const std::filesystem::path &path, const decoder_options options)
    -> std::expected<chunk_decoder, error> {
    auto stream = file_stream::open(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }

    return from_stream(std::make_unique<file_stream>(std::move(*stream)), options);
}

auto chunk_decoder::from_stream(std::unique_ptr<input_stream> stream, const decoder_options options)
    -> std::expected<chunk_decoder, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }

    if (options.read_size == 0) {
        return std::unexpected(error{error_code::invalid_operation, "Read size must be non-zero"});
    }

    return chunk_decoder{std::move(stream), options};
}

auto chunk_decoder::pull() -> std::expected<std::vector<std::byte>, error> {
    if (!leftover_.empty()) {
        return std::exchange(leftover_, {});
    }

    std::vector<std::byte> buffer(std::max<size_t>(options_.read_size, 1));
    auto result = stream_->read(buffer);
    if (!result) {
        return std::unexpected(error{error_code::io_error, result.error().message(), offset_});
    }

    buffer.resize(*result);
    return buffer;
}

void chunk_decoder::push_back(std::vector<std::byte> bytes) {
    if (bytes.empty()) {
        return;
    }

    // Keep a single slot: anything already waiting comes after the new bytes
    if (!leftover_.empty()) {
        bytes.insert(bytes.end(), leftover_.begin(), leftover_.end());
    }
    leftover_ = std::move(bytes);
}

auto chunk_decoder::take(const size_t count) -> std::expected<std::vector<std::byte>, error> {
    std::vector<std::byte> out;
    out.reserve(count);

    while (out.size() < count) {
        auto bytes = pull();
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        if (bytes->empty()) {
            break;
        }

        const size_t needed = count - out.size();
        if (bytes->size() > needed) {
            const auto split = bytes->begin() + static_cast<std::ptrdiff_t>(needed);
            out.insert(out.end(), bytes->begin(), split);
            push_back(std::vector<std::byte>(split, bytes->end()));
        } else {
            out.insert(out.end(), bytes->begin(), bytes->end());
        }
    }

    return out;
}

auto chunk_decoder::fail(error e) -> chunk {
    state_ = state::done;
    return chunk{std::move(e)};
}

auto chunk_decoder::next() -> std::optional<chunk> {
    switch (state_) {
        case state::done:
            return std::nullopt;

        case state::payload:
            return next_payload();

        case state::padding:
            if (auto padded = skip_padding(); !padded) {
                return fail(padded.error());
            }
            state_ = state::header;
            return next_header();

        case state::header:
            return next_header();
    }

    return std::nullopt;
}

auto chunk_decoder::next_header() -> std::optional<chunk> {
    assert(offset_ % block_size == 0);

    auto block = take(detail::BLOCK_SIZE);
    if (!block) {
        return fail(block.error());
    }

    // Source exhausted on a block boundary
    if (block->empty()) {
        state_ = state::done;
        return std::nullopt;
    }

    if (block->size() < detail::BLOCK_SIZE) {
        push_back(std::move(*block));
        return fail(make_error(error_code::incomplete_header, offset_));
    }

    // First block of the end-of-archive trailer; the second must follow
    if (detail::is_zero_block(*block)) {
        const offset_type trailer = offset_ + block_size;
        offset_ = trailer;

        auto second = take(detail::BLOCK_SIZE);
        if (!second) {
            return fail(second.error());
        }

        if (second->size() < detail::BLOCK_SIZE) {
            push_back(std::move(*second));
            return fail(make_error(error_code::short_trailer, trailer));
        }

        if (!detail::is_zero_block(*second)) {
            push_back(std::move(*second));
            return fail(make_error(error_code::bad_trailer, trailer));
        }

        offset_ = trailer + block_size;
        state_ = state::done;
        return std::nullopt;
    }

    auto parsed = detail::parse_header(
        std::span<const std::byte, detail::BLOCK_SIZE>{block->data(), detail::BLOCK_SIZE}, offset_);
    if (!parsed) {
        push_back(std::move(*block));
        return fail(parsed.error());
    }

    offset_ = parsed->payload_offset;
    payload_remaining_ = parsed->payload_size;
    entry_end_ = offset_ + parsed->payload_size + detail::padding_for(parsed->payload_size);
    state_ = payload_remaining_ > 0 ? state::payload : state::padding;

    return chunk{std::move(*parsed)};
}

auto chunk_decoder::next_payload() -> chunk {
    auto bytes = pull();
    if (!bytes) {
        return fail(bytes.error());
    }

    if (bytes->empty()) {
        return fail(make_error(error_code::incomplete_payload, offset_, payload_remaining_));
    }

    // Bytes past the payload end belong to the padding or the next header
    const auto wanted = static_cast<size_t>(
        std::min(payload_remaining_, static_cast<size_type>(bytes->size())));
    if (bytes->size() > wanted) {
        push_back(std::vector<std::byte>(bytes->begin() + static_cast<std::ptrdiff_t>(wanted), bytes->end()));
        bytes->resize(wanted);
    }

    payload fragment{offset_, std::move(*bytes)};
    offset_ += static_cast<offset_type>(wanted);
    payload_remaining_ -= static_cast<size_type>(wanted);

    if (payload_remaining_ == 0) {
        state_ = state::padding;
    }

    return chunk{std::move(fragment)};
}

auto chunk_decoder::skip_padding() -> std::expected<void, error> {
    const size_type padding = detail::padding_for(offset_);

    if (padding > 0) {
        auto bytes = take(static_cast<size_t>(padding));
        if (!bytes) {
            return std::unexpected(bytes.error());
        }

        offset_ += static_cast<offset_type>(bytes->size());
        if (static_cast<size_type>(bytes->size()) < padding) {
            // Every payload byte arrived; only the padding is cut short
            return std::unexpected(make_error(error_code::incomplete_payload, offset_, 0));
        }
    }

    assert(offset_ == entry_end_);
    assert(offset_ % block_size == 0);
    return {};
}

} // namespace tarchunk
