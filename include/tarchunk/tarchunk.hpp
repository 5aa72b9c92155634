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
#include <tarchunk/header.hpp>
#include <tarchunk/stream.hpp>
#include <tarchunk/chunk.hpp>
#include <tarchunk/chunk_decoder.hpp>
#include <tarchunk/entry_reader.hpp>

namespace tarchunk {

// Main convenience API
[[nodiscard]] std::expected<chunk_decoder, error> open_archive(const std::filesystem::path& path,
                                                              decoder_options options = {});
[[nodiscard]] std::expected<chunk_decoder, error> open_archive(std::unique_ptr<input_stream> stream,
                                                              decoder_options options = {});

// Decode a byte stream into its chunk sequence
[[nodiscard]] std::expected<chunk_decoder, error> decode(std::unique_ptr<input_stream> stream,
                                                        decoder_options options = {});

} // namespace tarchunk
