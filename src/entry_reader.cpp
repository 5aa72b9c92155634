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

#include <tarchunk/entry_reader.hpp>
#include <algorithm>
#include <cassert>
#include <ranges>

namespace tarchunk {

auto entry_reader::pull() -> std::optional<chunk> {
    if (pending_) {
        return std::exchange(pending_, std::nullopt);
    }
    return source_->next();
}

void entry_reader::push_back(chunk c) {
    assert(!pending_);
    pending_ = std::move(c);
}

auto payload_stream::fetch() -> std::expected<bool, error> {
    if (error_) {
        return std::unexpected(*error_);
    }

    while (!finished_) {
        auto next = reader_->pull();
        if (!next) {
            finished_ = true;
            break;
        }

        if (auto* fragment = std::get_if<payload>(&next->value)) {
            if (fragment->bytes.empty()) {
                continue;
            }
            fragment_ = std::move(fragment->bytes);
            consumed_ = 0;
            return true;
        }

        if (const auto* e = next->as_error()) {
            error_ = *e;
            finished_ = true;
            return std::unexpected(*e);
        }

        // The next entry's header; leave it for the next with_entry call
        reader_->push_back(std::move(*next));
        finished_ = true;
    }

    return false;
}

auto payload_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t written = 0;

    while (written < buffer.size()) {
        if (consumed_ == fragment_.size()) {
            auto more = fetch();
            if (!more) {
                // Hand out what was copied; the error is reported by the next call
                if (written > 0) {
                    break;
                }
                return std::unexpected(more.error());
            }
            if (!*more) {
                break;
            }
        }

        const size_t count = std::min(buffer.size() - written, fragment_.size() - consumed_);
        std::ranges::copy_n(fragment_.begin() + static_cast<std::ptrdiff_t>(consumed_),
                           static_cast<std::ptrdiff_t>(count),
                           buffer.begin() + static_cast<std::ptrdiff_t>(written));
        consumed_ += count;
        written += count;
    }

    bytes_read_ += static_cast<size_type>(written);
    return written;
}

bool payload_stream::at_end() const {
    return error_.has_value() || (finished_ && consumed_ == fragment_.size());
}

auto payload_stream::next_fragment() -> std::expected<std::span<const std::byte>, error> {
    if (consumed_ == fragment_.size()) {
        auto more = fetch();
        if (!more) {
            return std::unexpected(more.error());
        }
        if (!*more) {
            return std::span<const std::byte>{};
        }
    }

    const auto view = std::span<const std::byte>{fragment_}.subspan(consumed_);
    consumed_ = fragment_.size();
    bytes_read_ += static_cast<size_type>(view.size());
    return view;
}

auto payload_stream::read_all() -> std::expected<std::vector<std::byte>, error> {
    std::vector<std::byte> data;

    while (true) {
        auto fragment = next_fragment();
        if (!fragment) {
            return std::unexpected(fragment.error());
        }
        if (fragment->empty()) {
            return data;
        }
        data.insert(data.end(), fragment->begin(), fragment->end());
    }
}

auto payload_stream::drain() -> std::expected<void, error> {
    consumed_ = fragment_.size();

    while (true) {
        auto more = fetch();
        if (!more) {
            return std::unexpected(more.error());
        }
        if (!*more) {
            return {};
        }
        consumed_ = fragment_.size();
    }
}

} // namespace tarchunk
