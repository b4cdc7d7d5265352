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
 * @file codec.hpp
 * @brief Compression layer for draft content.
 *
 * @details
 * This header declares the `Codec` class, a stateless wrapper around zstd used
 * to shrink chord sheets before they reach a quota-constrained storage tier.
 * Chord sheets are highly repetitive text (`[G]`, `[C]`, `{chorus}` markers),
 * so even the fast zstd levels typically save 60-80% of the space.
 *
 * **Round-trip law:** `decompress(compress(x)) == x` for every valid UTF-8 `x`.
 *
 * **Fallback:** `encode()` never fails. When compression is disabled, when the
 * input is not valid UTF-8, when zstd reports an error, or when the compressed
 * frame would not be smaller, the raw bytes are kept and the `compressed` flag
 * is cleared; `decode()` branches on that flag.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lyra::codec {

/**
 * @class CodecError
 * @brief Thrown by `compress()` and `decompress()` on malformed input.
 */
class CodecError : public std::runtime_error {
  public:
    explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @struct EncodedContent
 * @brief Bytes ready for storage together with the flag that tells how to read them.
 */
struct EncodedContent {
    std::string bytes;
    bool compressed = false;
};

/**
 * @struct CompressionMetrics
 * @brief Size accounting for one compression, reported at DEBUG level.
 */
struct CompressionMetrics {
    size_t original_size = 0;
    size_t compressed_size = 0;
    double ratio = 0.0; ///< Percentage saved, e.g. 72.5.
    long long savings = 0;
};

/**
 * @class Codec
 * @brief zstd-backed compressor with a raw-storage fallback.
 */
class Codec {
  public:
    /// Ceiling applied when the caller has no tighter expectation (256 MiB).
    static constexpr size_t kMaxDecodedSize = size_t{256} * 1024 * 1024;

    /**
     * @param enabled When false, `encode()` always stores raw content.
     * @param level zstd compression level (1 = fastest).
     */
    explicit Codec(bool enabled = true, int level = 3);

    /**
     * @brief Compresses UTF-8 text into a zstd frame.
     *
     * @throws CodecError If the input is not valid UTF-8 or zstd fails.
     */
    std::string compress(const std::string& content) const;

    /**
     * @brief Restores text from a zstd frame produced by `compress()`.
     *
     * @param max_size Upper bound on the decompressed size. A frame announcing
     *                 more is rejected before any buffer is allocated.
     * @throws CodecError If the frame is truncated, corrupted, of unknown size
     *                    or larger than `max_size`.
     */
    std::string decompress(const std::string& bytes,
                           size_t max_size = kMaxDecodedSize) const;

    /**
     * @brief Compresses when possible, otherwise returns the raw bytes unflagged.
     */
    EncodedContent encode(const std::string& content) const;

    /**
     * @brief Inverse of `encode()`.
     *
     * @throws CodecError If a flagged payload cannot be decompressed.
     */
    std::string decode(const EncodedContent& encoded, size_t max_size = kMaxDecodedSize) const;

    bool enabled() const { return enabled_; }

    static CompressionMetrics metrics(size_t original_size, size_t compressed_size);

    /**
     * @brief Strict UTF-8 validation (rejects overlongs, surrogates and code points above U+10FFFF).
     */
    static bool is_valid_utf8(const std::string& text);

  private:
    bool enabled_;
    int level_;
};

} // namespace lyra::codec
