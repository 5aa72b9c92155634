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
 * debug_chunks - Dumps the raw chunk sequence of a tar archive.
 *
 * Usage: ./debug_chunks <tar_file | -> [read_size]
 *
 * Features:
 * - Header offsets, sizes and type flags
 * - Payload fragment offsets and lengths
 * - The terminal error chunk, if any, with its offset
 * - Final decoder offset, for checking block alignment
 */

#include <tarchunk/tarchunk.hpp>
#include <charconv>
#include <cstring>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 2 && argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <tar_file | -> [read_size]\n";
        return 1;
    }

    tarchunk::decoder_options options;
    if (argc == 3) {
        const char* arg = argv[2];
        auto [ptr, ec] = std::from_chars(arg, arg + std::strlen(arg), options.read_size);
        if (ec != std::errc{} || *ptr != '\0') {
            std::cerr << "Invalid read size: " << arg << '\n';
            return 1;
        }
    }

    const std::string input = argv[1];
    auto decoder = input == "-"
        ? tarchunk::decode(std::make_unique<tarchunk::istream_stream>(std::cin), options)
        : tarchunk::open_archive(input, options);
    if (!decoder) {
        std::cerr << "Failed to open archive: " << decoder.error().message() << '\n';
        return 1;
    }

    size_t headers = 0;
    size_t fragments = 0;
    int status = 0;

    for (const auto& c : *decoder) {
        if (const auto* h = c.as_header()) {
            ++headers;
            std::cout << "header  @" << h->offset
                      << " type=" << tarchunk::to_string(h->type().kind)
                      << " flag=" << static_cast<unsigned>(h->link_indicator)
                      << " size=" << h->payload_size
                      << " path=" << h->path() << '\n';
        } else if (const auto* p = c.as_payload()) {
            ++fragments;
            std::cout << "payload @" << p->offset << " len=" << p->size() << '\n';
        } else if (const auto* e = c.as_error()) {
            std::cout << "error   @" << e->offset() << ' ' << tarchunk::to_string(e->code());
            if (e->code() == tarchunk::error_code::incomplete_payload) {
                std::cout << " remaining=" << e->remaining();
            }
            std::cout << '\n';
            std::cerr << e->message() << '\n';
            status = 2;
        }
    }

    std::cout << "\nDebug Summary:\n";
    std::cout << "==============\n";
    std::cout << "Headers: " << headers << '\n';
    std::cout << "Payload fragments: " << fragments << '\n';
    std::cout << "Final offset: " << decoder->offset()
              << (decoder->offset() % 512 == 0 ? " (block aligned)" : " (unaligned)") << '\n';

    return status;
}
