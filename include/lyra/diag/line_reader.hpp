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
 * @file line_reader.hpp
 * @brief Non-blocking line splitter over a file descriptor.
 *
 * @details
 * `lyra edit` reads JSON requests from standard input. The reader never
 * blocks: the event loop calls `drain()` on a short timer, so input handling
 * runs on the loop thread and ends with it.
 */

#pragma once

#include <string>
#include <vector>

namespace lyra::diag {

/**
 * @class LineReader
 * @brief Collects newline-terminated lines from a descriptor the caller owns.
 */
class LineReader {
  public:
    explicit LineReader(int fd) : fd_(fd) {}

    /**
     * @brief Appends every complete line readable right now to `lines`.
     *
     * @return false once the descriptor reached end of file or failed. A
     *         trailing unterminated line is delivered before that.
     */
    bool drain(std::vector<std::string>& lines);

  private:
    int fd_;
    std::string pending_;
};

} // namespace lyra::diag
