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
 * @file line_reader.cpp
 * @brief poll(2) + read(2) line splitting.
 */

#include "lyra/diag/line_reader.hpp"

#include "lyra/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace lyra::diag {

bool LineReader::drain(std::vector<std::string>& lines)
{
    pollfd pfd{fd_, POLLIN, 0};
    while (::poll(&pfd, 1, 0) > 0) {
        char buffer[4096];
        ssize_t read_len = ::read(fd_, buffer, sizeof(buffer));
        if (read_len < 0 && errno == EINTR) {
            continue;
        }

        if (read_len <= 0) {
            if (read_len < 0) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   std::string("Input: Read error (") + std::strerror(errno) +
                                       "), closing");
            }
            if (!pending_.empty()) {
                lines.push_back(pending_);
                pending_.clear();
            }
            return false;
        }
        pending_.append(buffer, static_cast<size_t>(read_len));

        size_t start = 0;
        size_t nl;
        while ((nl = pending_.find('\n', start)) != std::string::npos) {
            lines.push_back(pending_.substr(start, nl - start));
            start = nl + 1;
        }
        pending_.erase(0, start);
    }
    return true;
}

} // namespace lyra::diag
