/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "FileAccessStrategy.h"
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string describe(const char* strategy, size_t bytes, const AccessMetrics& metrics) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << strategy << ": "
        << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB in " << metrics.load_time.count()
        << " ms";
    if (metrics.fallback_used) {
        oss << " (mapping failed)";
    }
    return oss.str();
}

}  // namespace

// ============================================================================
// Strategy selection
// ============================================================================

std::unique_ptr<FileAccessStrategy> FileAccessStrategy::create(const std::string& filename,
                                                               const FileAccessConfig& config) {
    size_t file_size = regularFileSize(filename);
    if (file_size == 0) {
        throw FileAccessException("Cannot inspect empty file: " + filename);
    }

    if (file_size < config.mmap_threshold) {
        return std::make_unique<InMemoryFile>(filename);
    }

    try {
        return std::make_unique<MemoryMappedFile>(filename);
    } catch (const FileAccessException& e) {
        if (!config.enable_fallback || file_size > FileAccessConfig::MAX_IN_MEMORY_SIZE) {
            throw;
        }
        std::cerr << "Warning: " << e.what() << ", reading the file instead\n";
        return std::make_unique<InMemoryFile>(filename, true);
    }
}

size_t FileAccessStrategy::regularFileSize(const std::string& filename) {
    if (filename.empty()) {
        throw FileAccessException("No input file given");
    }
    std::error_code ec;
    auto status = std::filesystem::status(filename, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw FileAccessException("File does not exist: " + filename);
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw FileAccessException("Not a regular file: " + filename);
    }
    auto size = std::filesystem::file_size(filename, ec);
    if (ec) {
        throw FileAccessException("Cannot determine size of '" + filename + "': " + ec.message());
    }
    if (size > std::numeric_limits<size_t>::max()) {
        throw FileAccessException("File too large for this platform: " + filename);
    }
    return static_cast<size_t>(size);
}

// ============================================================================
// InMemoryFile
// ============================================================================

InMemoryFile::InMemoryFile(const std::string& filename, bool fallback) {
    auto start = Clock::now();
    size_t expected = regularFileSize(filename);

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw FileAccessException("Cannot open '" + filename + "': " + std::strerror(errno));
    }
    bytes_.resize(expected);
    in.read(reinterpret_cast<char*>(bytes_.data()), static_cast<std::streamsize>(expected));
    if (static_cast<size_t>(in.gcount()) != expected) {
        throw FileAccessException("Short read of '" + filename + "': expected " +
                                  std::to_string(expected) + " bytes, got " +
                                  std::to_string(in.gcount()));
    }

    metrics_.load_time = since(start);
    metrics_.fallback_used = fallback;
}

std::string InMemoryFile::getPerformanceMetrics() const {
    return describe("in-memory", bytes_.size(), metrics_);
}

// ============================================================================
// MemoryMappedFile
// ============================================================================

MemoryMappedFile::MemoryMappedFile(const std::string& filename) {
    auto start = Clock::now();

    fd_ = open(filename.c_str(), O_RDONLY);
    if (fd_ == -1) {
        throw FileAccessException("Cannot open '" + filename + "': " + std::strerror(errno));
    }

    struct stat st;
    if (fstat(fd_, &st) == -1 || st.st_size <= 0 ||
        static_cast<uint64_t>(st.st_size) > std::numeric_limits<size_t>::max()) {
        int saved = errno;
        release();
        throw FileAccessException("Cannot size '" + filename + "' for mapping: " +
                                  std::strerror(saved));
    }
    size_ = static_cast<size_t>(st.st_size);

    void* mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (mapped == MAP_FAILED) {
        int saved = errno;
        release();
        throw FileAccessException("Cannot map '" + filename + "': " + std::strerror(saved));
    }
    mapping_ = static_cast<const uint8_t*>(mapped);
    metrics_.load_time = since(start);
}

MemoryMappedFile::~MemoryMappedFile() {
    release();
}

void MemoryMappedFile::release() noexcept {
    if (mapping_ != nullptr) {
        munmap(const_cast<uint8_t*>(mapping_), size_);
        mapping_ = nullptr;
    }
    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
    size_ = 0;
}

std::string MemoryMappedFile::getPerformanceMetrics() const {
    return describe("memory-mapped", size_, metrics_);
}
