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

#include <tarchunk/header.hpp>

namespace tarchunk {

std::string header::path() const {
    std::string result;
    result.reserve(file_name_prefix.size() + file_name_suffix.size());
    result += file_name_prefix;
    result += file_name_suffix;
    return result;
}

std::string_view to_string(const entry_kind kind) noexcept {
    switch (kind) {
        case entry_kind::normal:            return "normal";
        case entry_kind::hard_link:         return "hard_link";
        case entry_kind::symbolic_link:     return "symbolic_link";
        case entry_kind::character_special: return "character_special";
        case entry_kind::block_special:     return "block_special";
        case entry_kind::directory:         return "directory";
        case entry_kind::fifo:              return "fifo";
        case entry_kind::other:             return "other";
    }
    return "unknown";
}

} // namespace tarchunk
