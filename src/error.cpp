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

#include <tarchunk/error.hpp>

namespace tarchunk {

std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::no_more_headers:    return "no_more_headers";
        case error_code::unexpected_payload: return "unexpected_payload";
        case error_code::incomplete_header:  return "incomplete_header";
        case error_code::incomplete_payload: return "incomplete_payload";
        case error_code::short_trailer:      return "short_trailer";
        case error_code::bad_trailer:        return "bad_trailer";
        case error_code::invalid_header:     return "invalid_header";
        case error_code::io_error:           return "io_error";
        case error_code::invalid_operation:  return "invalid_operation";
    }
    return "unknown";
}

error make_error(const error_code code, const offset_type offset, const size_type remaining) {
    const std::string at = " at offset " + std::to_string(offset);

    switch (code) {
        case error_code::no_more_headers:
            return error{code, "No more headers in archive" + at, offset};
        case error_code::unexpected_payload:
            return error{code, "Payload without a preceding header" + at, offset};
        case error_code::incomplete_header:
            return error{code, "Stream ended inside a header block" + at, offset};
        case error_code::incomplete_payload:
            return error{code, "Stream ended inside an entry" + at + " with " +
                std::to_string(remaining) + " payload bytes missing", offset, remaining};
        case error_code::short_trailer:
            return error{code, "Truncated end-of-archive trailer" + at, offset};
        case error_code::bad_trailer:
            return error{code, "Non-zero block inside end-of-archive trailer" + at, offset};
        case error_code::invalid_header:
            return error{code, "Invalid header block" + at, offset};
        case error_code::io_error:
            return error{code, "Read error" + at, offset};
        case error_code::invalid_operation:
            return error{code, "Invalid operation" + at, offset};
    }
    return error{code, "Unknown error" + at, offset, remaining};
}

error make_error(const error_code code, const offset_type offset, const std::string_view detail) {
    const error base = make_error(code, offset);
    return error{code, base.message() + ": " + std::string{detail}, offset};
}

} // namespace tarchunk
