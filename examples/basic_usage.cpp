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

/**
 * basic_usage - Lists the entries of a tar archive with their metadata and content previews.
 *
 * Usage: ./basic_usage <tar_file | ->
 *
 * Features demonstrated:
 * - Opening tar archives from a file or standard input
 * - Visiting entries with with_entries
 * - Displaying entry metadata (type, size, modification time, path)
 * - Reading the start of a payload and leaving the rest to be drained
 */

#include <tarchunk/tarchunk.hpp>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

std::expected<tarchunk::chunk_decoder, tarchunk::error> open_input(const std::string& arg) {
    if (arg == "-") {
        return tarchunk::decode(std::make_unique<tarchunk::istream_stream>(std::cin));
    }
    return tarchunk::open_archive(arg);
}

char type_char(const tarchunk::header& h) {
    switch (h.type().kind) {
        case tarchunk::entry_kind::directory:         return 'd';
        case tarchunk::entry_kind::symbolic_link:     return 'l';
        case tarchunk::entry_kind::hard_link:         return 'h';
        case tarchunk::entry_kind::character_special: return 'c';
        case tarchunk::entry_kind::block_special:     return 'b';
        case tarchunk::entry_kind::fifo:              return 'p';
        case tarchunk::entry_kind::other:             return '?';
        case tarchunk::entry_kind::normal:            break;
    }
    return 'f';
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <tar_file | ->\n";
        return 1;
    }

    // Open the tar archive
    auto decoder = open_input(argv[1]);
    if (!decoder) {
        std::cerr << "Failed to open archive: " << decoder.error().message() << '\n';
        return 1;
    }

    std::cout << "Archive contents:\n";
    std::cout << "================\n";

    auto result = tarchunk::with_entries(*decoder, [](const tarchunk::header& h, tarchunk::payload_stream& payload) {
        const std::time_t mtime = static_cast<std::time_t>(h.mod_time);

        std::cout << type_char(h) << ' '
                  << std::setw(10) << h.payload_size << ' '
                  << std::put_time(std::gmtime(&mtime), "%Y-%m-%d %H:%M") << ' '
                  << h.path();
        if (!h.link_name.empty() && (h.is_symbolic_link() || h.is_hard_link())) {
            std::cout << " -> " << h.link_name;
        }
        std::cout << '\n';

        // For text files, show first few bytes
        const std::string path = h.path();
        if (!h.is_regular_file() || h.payload_size == 0 ||
            path.size() < 4 || path.compare(path.size() - 4, 4, ".txt") != 0) {
            return;
        }

        std::array<std::byte, 50> preview{};
        auto count = payload.read(preview);
        if (!count || *count == 0) {
            return;
        }

        std::cout << "  Preview: ";
        for (size_t i = 0; i < *count; ++i) {
            const auto c = static_cast<char>(preview[i]);
            if (c == '\n') {
                break;  // Stop at first newline
            }
            std::cout << (std::isprint(static_cast<unsigned char>(c)) && c != '\r' ? c : '.');
        }
        std::cout << '\n';
    });

    if (!result) {
        std::cerr << "Archive error (" << tarchunk::to_string(result.error().code()) << "): "
                  << result.error().message() << '\n';
        return 1;
    }

    return 0;
}
