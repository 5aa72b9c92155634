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
#include <algorithm>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <istream>
#include <memory>
#include <ranges>
#include <span>

namespace tarchunk {

// Base interface for forward-only byte sources
class input_stream {
public:
    virtual ~input_stream() = default;

    // Read up to buffer.size() bytes into buffer, returns actual bytes read.
    // A return of 0 for a non-empty buffer means the source is exhausted.
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    // Check if at end of stream
    [[nodiscard]] virtual bool at_end() const = 0;
};

// Non-owning view over bytes already in memory
class memory_stream : public input_stream {
private:
    std::span<const std::byte> data_;
    size_t position_ = 0;

public:
    explicit memory_stream(std::span<const std::byte> data)
        : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        size_t available = data_.size() - position_;
        size_t to_read = std::min(buffer.size(), available);

        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                           static_cast<std::ptrdiff_t>(to_read), buffer.begin());
        position_ += to_read;

        return to_read;
    }

    [[nodiscard]] bool at_end() const override {
        return position_ >= data_.size();
    }

    [[nodiscard]] size_t position() const noexcept { return position_; }
};

// File-based stream
class file_stream : public input_stream {
private:
    struct file_deleter {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, file_deleter> file_;
    offset_type position_ = 0;

public:
    [[nodiscard]] static std::expected<file_stream, error> open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] bool at_end() const override;

    // Bytes read from the file so far; read errors are reported at this offset
    [[nodiscard]] offset_type position() const noexcept { return position_; }

private:
    explicit file_stream(std::FILE* file);
};

// Adapter for a std::istream such as std::cin. The istream is not owned.
class istream_stream : public input_stream {
private:
    std::istream* is_;
    offset_type position_ = 0;

public:
    explicit istream_stream(std::istream& is)
        : is_(&is) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] bool at_end() const override;

    [[nodiscard]] offset_type position() const noexcept { return position_; }
};

} // namespace tarchunk
