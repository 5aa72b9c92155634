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

#include <tarchunk/stream.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace tarchunk {

file_stream::file_stream(std::FILE* file)
    : file_(file) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(make_error(error_code::io_error, 0,
            "cannot open " + path.string() + ": " + std::strerror(errno)));
    }

    return file_stream{file};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t count = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (count < buffer.size() && std::ferror(file_.get())) {
        const int cause = errno;
        // Bytes before the failure are dropped with it
        return std::unexpected(make_error(error_code::io_error, position_ + static_cast<offset_type>(count),
            std::strerror(cause)));
    }

    position_ += static_cast<offset_type>(count);
    return count;
}

bool file_stream::at_end() const {
    return std::feof(file_.get()) != 0;
}

auto istream_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    if (buffer.empty() || is_->eof()) {
        return 0;
    }

    is_->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto count = static_cast<size_t>(is_->gcount());

    if (is_->bad()) {
        return std::unexpected(make_error(error_code::io_error, position_ + static_cast<offset_type>(count),
            "input stream failed"));
    }

    position_ += static_cast<offset_type>(count);
    return count;
}

bool istream_stream::at_end() const {
    return is_->eof();
}

} // namespace tarchunk
