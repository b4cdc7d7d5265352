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
 * @file file_tier.cpp
 * @brief Implementation of the durable, file-backed tier.
 *
 * @details
 * All file I/O is binary. Values are written through a `.tmp` sibling that is
 * flushed, closed and renamed over the destination with `fs::rename`.
 */

#include "lyra/storage/file_tier.hpp"

#include "lyra/infra/logger.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace lyra::storage {

namespace {

constexpr const char* kExtension = ".lyd";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

FileTier::FileTier(std::string base_path, size_t capacity)
    : base_path_(std::move(base_path)), capacity_(capacity)
{
}

void FileTier::init()
{
    if (!fs::exists(base_path_)) {
        fs::create_directories(base_path_);
    }
}

std::string FileTier::escape_key(const std::string& key)
{
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('.');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

bool FileTier::unescape_key(const std::string& name, std::string& key)
{
    key.clear();
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] != '.') {
            key.push_back(name[i]);
            continue;
        }
        if (i + 2 >= name.size()) {
            return false;
        }
        int hi = hex_value(name[i + 1]);
        int lo = hex_value(name[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        key.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return true;
}

std::string FileTier::get_path(const std::string& key) const
{
    return base_path_ + "/" + escape_key(key) + kExtension;
}

std::optional<std::string> FileTier::get(const std::string& key)
{
    std::ifstream file(get_path(key), std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string buffer((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        infra::Logger::log(infra::LogLevel::WARN, "Storage: Read failed for key " + key);
        return std::nullopt;
    }
    return buffer;
}

/**
 * @brief Replaces the value of `key` through a temporary file and an atomic rename.
 *
 * Capacity is checked against the current directory usage minus the size of
 * the file being replaced.
 */
infra::Status FileTier::set(const std::string& key, const std::string& bytes)
{
    std::string path = get_path(key);
    std::string temp_path = path + ".tmp";

    std::error_code ec;
    size_t previous = 0;
    if (fs::exists(path, ec)) {
        previous = static_cast<size_t>(fs::file_size(path, ec));
        if (ec) {
            previous = 0;
        }
    }

    size_t used = usage().used;
    size_t projected = (used > previous ? used - previous : 0) + bytes.size();
    if (projected > capacity_) {
        return infra::Status::error(infra::ErrorCode::QUOTA_EXCEEDED,
                                    "durable tier full (" + std::to_string(projected) + " > " +
                                        std::to_string(capacity_) + " bytes)");
    }

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return infra::Status::error(infra::ErrorCode::IO_ERROR, "cannot open " + temp_path);
    }

    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    file.close();

    if (file.fail()) {
        fs::remove(temp_path, ec);
        return infra::Status::error(infra::ErrorCode::IO_ERROR, "short write to " + temp_path);
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return infra::Status::error(infra::ErrorCode::IO_ERROR,
                                    "rename failed for " + path + ": " + ec.message());
    }
    return infra::Status::success();
}

infra::Status FileTier::remove(const std::string& key)
{
    std::error_code ec;
    bool removed = fs::remove(get_path(key), ec);
    if (ec) {
        return infra::Status::error(infra::ErrorCode::IO_ERROR, ec.message());
    }
    if (!removed) {
        return infra::Status::error(infra::ErrorCode::NOT_FOUND, "no such key: " + key);
    }
    return infra::Status::success();
}

/**
 * @brief Scans the data directory for `.lyd` files and decodes their names.
 *
 * Leftover `.tmp` files from an interrupted write are ignored.
 */
std::vector<std::string> FileTier::keys()
{
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return out;
    }

    for (const auto& entry : fs::directory_iterator(base_path_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kExtension) {
            continue;
        }
        std::string key;
        if (unescape_key(entry.path().stem().string(), key)) {
            out.push_back(key);
        } else {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Storage: Ignoring foreign file " + entry.path().string());
        }
    }
    return out;
}

TierUsage FileTier::usage()
{
    TierUsage u;
    u.capacity = capacity_;

    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return u;
    }
    for (const auto& entry : fs::directory_iterator(base_path_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kExtension) {
            auto size = entry.file_size(ec);
            if (!ec) {
                u.used += static_cast<size_t>(size);
            }
        }
    }
    return u;
}

} // namespace lyra::storage
