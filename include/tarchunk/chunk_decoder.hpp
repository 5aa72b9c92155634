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
#include <tarchunk/header_parser.hpp>
#include <tarchunk/stream.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace tarchunk {

struct decoder_options {
    // Bytes requested from the source per read. Payload fragments are at
    // most this large.
    size_t read_size = 64 * 1024;
};

// Turns a tar byte stream into a lazy sequence of header, payload and error
// chunks. Reads from the source only when a chunk is requested and never
// holds more than one pushed-back fragment beyond the block being decoded.
// An error chunk ends the sequence.
class chunk_decoder : public chunk_source {
private:
    enum class state {
        header,
        payload,
        padding,
        done
    };

    std::unique_ptr<input_stream> stream_;
    decoder_options options_;
    std::vector<std::byte> leftover_;       // One-slot push-back buffer
    offset_type offset_ = 0;                // Offset of the next unread byte
    offset_type entry_end_ = 0;             // Block-aligned end of the current entry
    size_type payload_remaining_ = 0;
    state state_ = state::header;

    // Next bytes from the source, leftover first. Empty once exhausted.
    [[nodiscard]] std::expected<std::vector<std::byte>, error> pull();

    // Return unconsumed bytes so the next pull sees them first
    void push_back(std::vector<std::byte> bytes);

    // Collect exactly `count` bytes unless the source runs dry first
    [[nodiscard]] std::expected<std::vector<std::byte>, error> take(size_t count);

    [[nodiscard]] std::optional<chunk> next_header();
    [[nodiscard]] chunk next_payload();

    // Consume the bytes between the payload end and the block boundary
    [[nodiscard]] std::expected<void, error> skip_padding();

    [[nodiscard]] chunk fail(error e);

public:
    explicit chunk_decoder(std::unique_ptr<input_stream> stream, decoder_options options = {})
        : stream_(std::move(stream)), options_(options) {}

    // Factory methods
    [[nodiscard]] static std::expected<chunk_decoder, error> from_file(const std::filesystem::path& path,
                                                                      decoder_options options = {});
    [[nodiscard]] static std::expected<chunk_decoder, error> from_stream(std::unique_ptr<input_stream> stream,
                                                                        decoder_options options = {});

    [[nodiscard]] std::optional<chunk> next() override;

    // Absolute offset of the next byte the decoder will consume
    [[nodiscard]] offset_type offset() const noexcept { return offset_; }

    // True once the sequence has ended, cleanly or with an error
    [[nodiscard]] bool finished() const noexcept { return state_ == state::done; }

    // Iterator support
    class iterator {
    private:
        chunk_decoder* decoder_ = nullptr;
        std::optional<chunk> current_;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const chunk*;
        using reference = const chunk&;

        iterator() = default;
        explicit iterator(chunk_decoder* decoder) : decoder_(decoder) {
            ++(*this);  // Load the first chunk
        }

        [[nodiscard]] const chunk& operator*() const { return *current_; }
        [[nodiscard]] const chunk* operator->() const { return &*current_; }

        iterator& operator++() {
            if (decoder_) {
                current_ = decoder_->next();
                if (!current_) {
                    decoder_ = nullptr;
                }
            }
            return *this;
        }

        void operator++(int) { ++(*this); }

        [[nodiscard]] bool operator==(const iterator& other) const {
            return decoder_ == other.decoder_;
        }
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() const { return {}; }
};

} // namespace tarchunk
