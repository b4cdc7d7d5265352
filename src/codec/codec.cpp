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
 * @file codec.cpp
 * @brief zstd compression for draft payloads.
 */

#include "lyra/codec/codec.hpp"

#include "lyra/infra/logger.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <zstd.h>

namespace lyra::codec {

Codec::Codec(bool enabled, int level) : enabled_(enabled), level_(level) {}

std::string Codec::compress(const std::string& content) const
{
    if (!is_valid_utf8(content)) {
        throw CodecError("input is not valid UTF-8");
    }

    std::string out;
    out.resize(ZSTD_compressBound(content.size()));

    size_t written = ZSTD_compress(&out[0], out.size(), content.data(), content.size(), level_);
    if (ZSTD_isError(written)) {
        throw CodecError(std::string("zstd: ") + ZSTD_getErrorName(written));
    }
    out.resize(written);
    return out;
}

std::string Codec::decompress(const std::string& bytes, size_t max_size) const
{
    unsigned long long frame_size = ZSTD_getFrameContentSize(bytes.data(), bytes.size());
    if (frame_size == ZSTD_CONTENTSIZE_ERROR) {
        throw CodecError("zstd: not a valid frame");
    }
    if (frame_size == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw CodecError("zstd: frame does not record its content size");
    }
    if (frame_size > max_size) {
        throw CodecError("zstd: frame announces " + std::to_string(frame_size) +
                         " bytes, expected at most " + std::to_string(max_size));
    }
    if (frame_size == 0) {
        return "";
    }

    std::string out;
    out.resize(static_cast<size_t>(frame_size));

    size_t read = ZSTD_decompress(&out[0], out.size(), bytes.data(), bytes.size());
    if (ZSTD_isError(read)) {
        throw CodecError(std::string("zstd: ") + ZSTD_getErrorName(read));
    }
    if (read != out.size()) {
        throw CodecError("zstd: frame shorter than announced");
    }
    return out;
}

/**
 * @brief Compresses `content`, degrading to raw storage on any failure.
 *
 * Raw storage is also chosen when the frame is not smaller than the input
 * (tiny or already dense content), so a stored draft is never larger than
 * the text it holds.
 */
EncodedContent Codec::encode(const std::string& content) const
{
    if (!enabled_) {
        return EncodedContent{content, false};
    }

    std::string frame;
    try {
        frame = compress(content);
    } catch (const CodecError& e) {
        infra::Logger::log(infra::LogLevel::WARN,
                           std::string("Codec: Compression failed, storing raw content (") +
                               e.what() + ")");
        return EncodedContent{content, false};
    }

    if (frame.size() >= content.size()) {
        return EncodedContent{content, false};
    }

    if (infra::Logger::threshold() <= infra::LogLevel::DEBUG) {
        CompressionMetrics m = metrics(content.size(), frame.size());
        std::ostringstream ss;
        ss << "Codec: Compressed " << m.original_size << " -> " << m.compressed_size << " bytes ("
           << std::fixed << std::setprecision(2) << m.ratio << "% saved)";
        infra::Logger::log(infra::LogLevel::DEBUG, ss.str());
    }
    return EncodedContent{std::move(frame), true};
}

std::string Codec::decode(const EncodedContent& encoded, size_t max_size) const
{
    if (!encoded.compressed) {
        return encoded.bytes;
    }
    return decompress(encoded.bytes, max_size);
}

CompressionMetrics Codec::metrics(size_t original_size, size_t compressed_size)
{
    CompressionMetrics m;
    m.original_size = original_size;
    m.compressed_size = compressed_size;
    m.savings = static_cast<long long>(original_size) - static_cast<long long>(compressed_size);
    if (original_size > 0) {
        double ratio = (1.0 - static_cast<double>(compressed_size) /
                                  static_cast<double>(original_size)) *
                       100.0;
        // Two decimals, matching how ratios are reported in logs.
        m.ratio = static_cast<double>(static_cast<long long>(ratio * 100.0)) / 100.0;
    }
    return m;
}

bool Codec::is_valid_utf8(const std::string& text)
{
    const auto* s = reinterpret_cast<const unsigned char*>(text.data());
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        unsigned int cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong encodings, UTF-16 surrogates, out of range.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            return false;
        }
        if (cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace lyra::codec
