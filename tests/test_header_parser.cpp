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

#include <catch2/catch_test_macros.hpp>
#include <tarchunk/header_parser.hpp>
#include "archive_builder.hpp"
#include <array>
#include <bit>
#include <cstring>

using namespace tarchunk;
using test_support::entry_desc;
using test_support::make_header_block;

TEST_CASE("Parse valid octal field", "[header_parser]") {
    std::array<const char, 8> octal_field{'0', '0', '0', '6', '4', '4', ' ', '\0'};
    auto result = detail::parse_octal(std::span{octal_field});

    REQUIRE(result.has_value());
    CHECK(*result == 0644);
}

TEST_CASE("Octal parsing stops at the first non-octal character", "[header_parser]") {
    SECTION("Digit 8 ends the value") {
        std::array<const char, 8> octal_field{'0', '0', '0', '8', '4', '4', ' ', '\0'};
        auto result = detail::parse_octal(std::span{octal_field});

        REQUIRE(result.has_value());
        CHECK(*result == 0);
    }

    SECTION("Trailing garbage after digits") {
        std::array<const char, 8> octal_field{'1', '7', 'x', '7', '7', '7', '7', '7'};
        auto result = detail::parse_octal(std::span{octal_field});

        REQUIRE(result.has_value());
        CHECK(*result == 017);
    }

    SECTION("Leading space yields zero") {
        std::array<const char, 8> octal_field{' ', ' ', '6', '4', '4', ' ', ' ', '\0'};
        auto result = detail::parse_octal(std::span{octal_field});

        REQUIRE(result.has_value());
        CHECK(*result == 0);
    }
}

TEST_CASE("Parse empty octal field", "[header_parser]") {
    std::array<const char, 8> octal_field{' ', ' ', ' ', ' ', ' ', ' ', ' ', '\0'};
    auto result = detail::parse_octal(std::span{octal_field});

    REQUIRE(result.has_value());
    CHECK(*result == 0);
}

TEST_CASE("Octal field without terminator uses its full width", "[header_parser]") {
    std::array<const char, 12> size_field{'7', '7', '7', '7', '7', '7', '7', '7', '7', '7', '7', '7'};
    auto result = detail::parse_octal(std::span{size_field});

    REQUIRE(result.has_value());
    CHECK(*result == 0777777777777);
    CHECK(*result > 0xFFFFFFFF);
}

TEST_CASE("Octal overflow of the destination type is an error", "[header_parser]") {
    std::array<const char, 3> field{'7', '7', '7'};
    auto result = detail::parse_octal<std::uint8_t>(std::span{field});

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::invalid_header);
}

TEST_CASE("Parse valid header", "[header_parser]") {
    entry_desc desc;
    desc.name = "test.txt";
    desc.data = "12345678";
    desc.mode = 0755;
    desc.uid = 501;
    desc.gid = 20;
    desc.mtime = 1234567890;
    auto block = make_header_block(desc);

    auto result = detail::parse_header(block, 1024);

    REQUIRE(result.has_value());

    const auto& h = *result;
    CHECK(h.offset == 1024);
    CHECK(h.payload_offset == 1536);
    CHECK(h.file_name_suffix == "test.txt");
    CHECK(h.file_name_prefix.empty());
    CHECK(h.path() == "test.txt");
    CHECK(h.file_mode == 0755);
    CHECK(h.owner_id == 501);
    CHECK(h.group_id == 20);
    CHECK(h.payload_size == 8);
    CHECK(h.mod_time == 1234567890);
    CHECK(h.link_indicator == '0');
    CHECK(h.owner_name == "testuser");
    CHECK(h.group_name == "testgroup");
    CHECK(h.device_major == 0);
    CHECK(h.device_minor == 0);
    CHECK(h.checksum == detail::calculate_checksum(block));
}

TEST_CASE("Parse header string fields", "[header_parser]") {
    SECTION("Prefix and suffix") {
        entry_desc desc;
        desc.name = "file.c";
        desc.prefix = "src/lib/";
        auto result = detail::parse_header(make_header_block(desc), 0);

        REQUIRE(result.has_value());
        CHECK(result->file_name_prefix == "src/lib/");
        CHECK(result->file_name_suffix == "file.c");
        CHECK(result->path() == "src/lib/file.c");
    }

    SECTION("Full width name has no terminator") {
        entry_desc desc;
        desc.name = std::string(100, 'n');
        desc.prefix = std::string(155, 'p');
        auto result = detail::parse_header(make_header_block(desc), 0);

        REQUIRE(result.has_value());
        CHECK(result->file_name_suffix.size() == 100);
        CHECK(result->file_name_prefix.size() == 155);
        CHECK(result->path().size() == 255);
    }

    SECTION("Symbolic link target") {
        entry_desc desc;
        desc.name = "current";
        desc.typeflag = '2';
        desc.linkname = "releases/1.2.3";
        auto result = detail::parse_header(make_header_block(desc), 0);

        REQUIRE(result.has_value());
        CHECK(result->link_name == "releases/1.2.3");
        CHECK(result->is_symbolic_link());
    }

    SECTION("Device numbers") {
        entry_desc desc;
        desc.name = "dev/sda";
        desc.typeflag = '4';
        desc.devmajor = 8;
        desc.devminor = 1;
        auto result = detail::parse_header(make_header_block(desc), 0);

        REQUIRE(result.has_value());
        CHECK(result->is_device());
        CHECK(result->device_major == 8);
        CHECK(result->device_minor == 1);
    }
}

TEST_CASE("Checksum is not verified", "[header_parser]") {
    entry_desc desc;
    desc.name = "test.txt";
    auto block = make_header_block(desc);
    auto* raw = std::bit_cast<ustar_header*>(block.data());
    std::memcpy(raw->checksum, "000001 ", 8);

    auto result = detail::parse_header(block, 0);

    REQUIRE(result.has_value());
    CHECK(result->checksum == 1);
    CHECK(result->file_name_suffix == "test.txt");
}

TEST_CASE("Magic and version are not verified", "[header_parser]") {
    entry_desc desc;
    desc.name = "old.txt";
    auto block = make_header_block(desc);
    auto* raw = std::bit_cast<ustar_header*>(block.data());
    std::memset(raw->magic, 0, sizeof(raw->magic));
    std::memset(raw->version, 0, sizeof(raw->version));

    auto result = detail::parse_header(block, 0);

    REQUIRE(result.has_value());
    CHECK(result->path() == "old.txt");
}

TEST_CASE("Base-256 size field decodes as zero", "[header_parser]") {
    entry_desc desc;
    desc.name = "huge.bin";
    desc.uid = 4321;
    auto block = make_header_block(desc);
    auto* raw = std::bit_cast<ustar_header*>(block.data());
    std::memset(raw->size, 0, sizeof(raw->size));
    raw->size[0] = static_cast<char>(0x80);
    raw->size[11] = 0x01;

    auto result = detail::parse_header(block, 2048);

    REQUIRE(result.has_value());
    CHECK(result->payload_size == 0);
    CHECK(result->offset == 2048);
    CHECK(result->path() == "huge.bin");
    CHECK(result->owner_id == 4321);
}

TEST_CASE("Numeric fields filled to full width decode", "[header_parser]") {
    entry_desc desc;
    desc.name = "wide";
    auto block = make_header_block(desc);
    auto* raw = std::bit_cast<ustar_header*>(block.data());

    // No NUL or space terminator anywhere: every digit counts
    std::memset(raw->mode, '7', sizeof(raw->mode));
    std::memset(raw->uid, '7', sizeof(raw->uid));
    std::memset(raw->gid, '7', sizeof(raw->gid));
    std::memset(raw->size, '7', sizeof(raw->size));
    std::memset(raw->mtime, '7', sizeof(raw->mtime));
    std::memset(raw->checksum, '7', sizeof(raw->checksum));
    std::memset(raw->devmajor, '7', sizeof(raw->devmajor));
    std::memset(raw->devminor, '7', sizeof(raw->devminor));

    auto result = detail::parse_header(block, 0);

    REQUIRE(result.has_value());
    CHECK(result->file_mode == 077777777u);
    CHECK(result->owner_id == 077777777);
    CHECK(result->group_id == 077777777);
    CHECK(result->payload_size == 0777777777777);
    CHECK(result->mod_time == 0777777777777);
    CHECK(result->checksum == 077777777u);
    CHECK(result->device_major == 077777777);
    CHECK(result->device_minor == 077777777);
}

TEST_CASE("Detect zero block", "[header_parser]") {
    std::array<std::byte, 512> zero_block{};
    CHECK(detail::is_zero_block(zero_block));

    entry_desc desc;
    desc.name = "test.txt";
    auto test_block = make_header_block(desc);
    CHECK_FALSE(detail::is_zero_block(test_block));

    zero_block[511] = std::byte{1};
    CHECK_FALSE(detail::is_zero_block(zero_block));
}

TEST_CASE("Padding to the next block boundary", "[header_parser]") {
    CHECK(detail::padding_for(0) == 0);
    CHECK(detail::padding_for(1) == 511);
    CHECK(detail::padding_for(5) == 507);
    CHECK(detail::padding_for(511) == 1);
    CHECK(detail::padding_for(512) == 0);
    CHECK(detail::padding_for(513) == 511);
    CHECK(detail::padding_for(5LL * 1024 * 1024 * 1024 + 3) == 509);

    for (size_type size = 0; size < 2048; ++size) {
        CHECK((size + detail::padding_for(size)) % 512 == 0);
    }
}

TEST_CASE("Calculate checksum", "[header_parser]") {
    std::array<std::byte, 512> zero_block{};
    // Eight spaces stand in for the checksum field
    CHECK(detail::calculate_checksum(zero_block) == 8 * ' ');

    entry_desc desc;
    desc.name = "test.txt";
    auto block = make_header_block(desc);
    CHECK(detail::calculate_checksum(block) > 8 * ' ');
}

TEST_CASE("Extract string from field", "[header_parser]") {
    SECTION("With null terminator") {
        std::array<char, 10> field{'h', 'e', 'l', 'l', 'o', '\0', 'x', 'x', 'x', 'x'};
        auto result = detail::extract_string(std::span{field});
        CHECK(result == "hello");
    }

    SECTION("Without null terminator") {
        std::array<char, 5> field{'h', 'e', 'l', 'l', 'o'};
        auto result = detail::extract_string(std::span{field});
        CHECK(result == "hello");
    }

    SECTION("Empty field") {
        std::array<char, 4> field{};
        auto result = detail::extract_string(std::span{field});
        CHECK(result.empty());
    }
}
