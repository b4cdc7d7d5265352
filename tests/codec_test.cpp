/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file codec_test.cpp
 * @brief Unit tests for draft compression.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "lyra/codec/codec.hpp"

#include <cstdint>
#include <string>

using lyra::codec::Codec;
using lyra::codec::CodecError;
using lyra::codec::EncodedContent;

namespace {

std::string song_sheet()
{
    std::string s = "{title: Amazing Grace}\n{key: G}\n";
    for (int i = 0; i < 40; ++i) {
        s += "[G]Amazing [G7]grace, how [C]sweet the [G]sound\n";
        s += "That [G]saved a [Em]wretch like [D]me\n";
    }
    return s;
}

} // namespace

/**
 * @brief decompress(compress(x)) == x for ASCII, multi-byte and empty input.
 */
void test_codec_round_trip()
{
    Codec codec;
    const std::string samples[] = {
        song_sheet(),
        "",
        "[Am]Über den [F]Wolken, 🎸 [C]grenzenlos",
        "x",
    };
    for (const auto& s : samples) {
        ASSERT_EQ(codec.decompress(codec.compress(s)), s);
    }
}

void test_codec_shrinks_song_sheets()
{
    Codec codec;
    std::string text = song_sheet();
    EncodedContent enc = codec.encode(text);

    ASSERT_TRUE(enc.compressed);
    ASSERT_TRUE(enc.bytes.size() < text.size());
    ASSERT_EQ(codec.decode(enc), text);
}

/**
 * @brief Malformed UTF-8 cannot be compressed; `encode` falls back to raw bytes.
 */
void test_codec_invalid_utf8_falls_back_to_raw()
{
    Codec codec;
    std::string bad = "chorus \xC3\x28 bridge";

    ASSERT_THROWS(codec.compress(bad), CodecError);

    EncodedContent enc = codec.encode(bad);
    ASSERT_FALSE(enc.compressed);
    ASSERT_EQ(enc.bytes, bad);
    ASSERT_EQ(codec.decode(enc), bad);
}

void test_codec_disabled_stores_raw()
{
    Codec codec(false);
    std::string text = song_sheet();
    EncodedContent enc = codec.encode(text);

    ASSERT_FALSE(enc.compressed);
    ASSERT_EQ(enc.bytes, text);
}

void test_codec_rejects_corrupted_frame()
{
    Codec codec;
    std::string frame = codec.compress(song_sheet());
    frame.resize(frame.size() / 2);

    ASSERT_THROWS(codec.decompress(frame), CodecError);
    ASSERT_THROWS(codec.decompress("not a zstd frame"), CodecError);
}

/**
 * @brief A header announcing more than the caller allows is refused up front.
 */
void test_codec_rejects_oversized_frame()
{
    Codec codec;
    const std::string huge = lyra::test::frame_declaring(std::uint64_t{1} << 62);

    ASSERT_THROWS(codec.decompress(huge), CodecError);

    // Within the global ceiling, but larger than the stored length says.
    EncodedContent stored{lyra::test::frame_declaring(5000), true};
    ASSERT_THROWS(codec.decode(stored, 2000), CodecError);
}

void test_codec_utf8_validation()
{
    ASSERT_TRUE(Codec::is_valid_utf8("plain ascii"));
    ASSERT_TRUE(Codec::is_valid_utf8("caf\xC3\xA9"));
    ASSERT_FALSE(Codec::is_valid_utf8("\xC0\xAF"));         // overlong '/'
    ASSERT_FALSE(Codec::is_valid_utf8("\xED\xA0\x80"));     // UTF-16 surrogate
    ASSERT_FALSE(Codec::is_valid_utf8("\xF4\x90\x80\x80")); // above U+10FFFF
    ASSERT_FALSE(Codec::is_valid_utf8("\xE2\x82"));         // truncated
}

void test_codec_metrics()
{
    auto m = Codec::metrics(1000, 250);
    ASSERT_EQ(m.savings, 750LL);
    ASSERT_TRUE(m.ratio > 74.99 && m.ratio < 75.01);

    auto none = Codec::metrics(0, 0);
    ASSERT_TRUE(none.ratio == 0.0);
}
