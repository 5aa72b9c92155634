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
 * simple_count - Counts the total number of entries in a tar archive with progress reporting.
 *
 * Usage: ./simple_count <tar_file | ->
 *
 * Features demonstrated:
 * - Efficient iteration for large archives
 * - Progress reporting (every 1000 entries)
 * - Ignoring payloads; the entry reader drains them
 */

#include <tarchunk/tarchunk.hpp>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <tar_file | ->\n";
        return 1;
    }

    const std::string input = argv[1];
    auto decoder = input == "-"
        ? tarchunk::decode(std::make_unique<tarchunk::istream_stream>(std::cin))
        : tarchunk::open_archive(input);
    if (!decoder) {
        std::cerr << "Failed to open archive: " << decoder.error().message() << '\n';
        return 1;
    }

    size_t count = 0;
    auto result = tarchunk::with_entries(*decoder, [&count](const tarchunk::header& h, tarchunk::payload_stream&) {
        ++count;
        if (count % 1000 == 0) {
            std::cerr << "Processed " << count << " entries...\n";
        }
        std::cout << h.path() << '\n';
    });

    std::cerr << "Total entries: " << count << '\n';

    if (!result) {
        std::cerr << "Archive error: " << result.error().message() << '\n';
        return 1;
    }
    return 0;
}
