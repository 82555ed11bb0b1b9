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
 * @file engine.cpp
 * @brief Implementation of the table log persistence layer.
 *
 * @details
 * Logs use a **Binary Length-Prefixed Frame** format:
 * `[4-byte Little Endian Length Header] + [N-byte UTF-8 JSON snapshot]`
 */

#include "keystone/storage/engine.hpp"

#include "keystone/infra/logger.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace keystone::storage {

namespace {

constexpr const char* kLogExtension = ".kst";

std::array<char, 4> encode_length(std::uint32_t length)
{
    return {static_cast<char>(length & 0xFF), static_cast<char>((length >> 8) & 0xFF),
            static_cast<char>((length >> 16) & 0xFF), static_cast<char>((length >> 24) & 0xFF)};
}

std::uint32_t decode_length(const std::array<char, 4>& bytes)
{
    return static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[0])) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[1])) << 8) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[2])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[3])) << 24);
}

bool write_frame(std::ofstream& file, const std::string& payload)
{
    auto header = encode_length(static_cast<std::uint32_t>(payload.size()));
    file.write(header.data(), header.size());
    file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    return file.good();
}

} // namespace

Engine::Engine(std::string base_path) : base_path_(std::move(base_path)) {}

void Engine::init()
{
    if (!fs::exists(base_path_)) {
        fs::create_directories(base_path_);
    }
}

std::string Engine::get_path(const std::string& table)
{
    return base_path_ + "/" + table + kLogExtension;
}

bool Engine::create(const std::string& table)
{
    std::string path = get_path(table);
    if (fs::exists(path)) {
        return true;
    }

    std::ofstream file(path, std::ios::binary | std::ios::app);
    return file.is_open();
}

std::vector<std::string> Engine::list_tables()
{
    std::vector<std::string> tables;

    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return tables;
    }

    for (const auto& entry : fs::directory_iterator(base_path_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kLogExtension) {
            tables.push_back(entry.path().stem().string());
        }
    }
    return tables;
}

/**
 * @brief Replays the binary log file to reconstruct a table.
 *
 * Reading stops at the first incomplete header or payload. That is the signature of a
 * crash mid-append, and every complete frame before it is still returned.
 */
std::vector<std::string> Engine::load_log(const std::string& table, bool& torn)
{
    std::vector<std::string> logs;
    torn = false;
    std::ifstream file(get_path(table), std::ios::binary);

    if (!file.is_open()) {
        return logs;
    }

    while (file.peek() != EOF) {
        std::array<char, 4> header{};
        file.read(header.data(), header.size());
        if (file.gcount() < static_cast<std::streamsize>(header.size())) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Engine: Truncated frame header in " + table + ". Stopping replay.");
            torn = true;
            break;
        }

        std::uint32_t payload_length = decode_length(header);
        std::string buffer;
        buffer.resize(payload_length);
        file.read(&buffer[0], payload_length);

        if (file.gcount() != static_cast<std::streamsize>(payload_length)) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Engine: Truncated frame payload in " + table + ". Stopping replay.");
            torn = true;
            break;
        }
        logs.push_back(std::move(buffer));
    }
    return logs;
}

/**
 * @brief Appends one frame, or leaves the log exactly as it was.
 *
 * A short write (disk full, file size limit) would leave a partial frame that later
 * frames are appended after, misaligning the rest of the log on replay. On any failure the
 * log is truncated back to its size before the call.
 */
bool Engine::append(const std::string& table, const std::string& raw_json)
{
    std::string path = get_path(table);

    std::error_code ec;
    std::uintmax_t original_size = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
    if (ec) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Engine: Cannot stat log of " + table + ": " + ec.message());
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        return false;
    }

    bool ok = write_frame(file, raw_json);
    if (ok) {
        file.flush();
        ok = file.good();
    }
    file.close();
    if (ok && !file.fail()) {
        return true;
    }

    fs::resize_file(path, original_size, ec);
    if (ec) {
        infra::Logger::log(infra::LogLevel::ERROR, "Engine: Rollback of failed append to " +
                                                       table + " failed: " + ec.message());
    } else {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Engine: Append to " + table + " failed; log rolled back.");
    }
    return false;
}

bool Engine::compact(const std::string& table, const std::vector<std::string>& active_docs)
{
    std::string path = get_path(table);
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }

        bool ok = true;
        for (const auto& doc : active_docs) {
            if (!write_frame(file, doc)) {
                ok = false;
                break;
            }
        }
        file.flush();
        file.close();

        if (!ok || file.fail()) {
            std::error_code ec;
            fs::remove(temp_path, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Engine: Compaction swap failed for " + table + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace keystone::storage
