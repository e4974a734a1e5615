/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file FileAccessStrategy.h
 * @brief Loads the inspected binary as one read-only byte buffer
 *
 * Decoders, the Range adapters and the pattern search all borrow the same
 * buffer for the lifetime of one BinaryInspector::analyze() call. Files
 * below the threshold are read onto the heap; larger ones are mapped with
 * mmap(2), falling back to reading when mapping fails.
 */

struct FileAccessConfig {
    static constexpr size_t DEFAULT_MMAP_THRESHOLD = 64 * 1024 * 1024;
    static constexpr size_t MAX_IN_MEMORY_SIZE = 2ULL * 1024 * 1024 * 1024;

    size_t mmap_threshold = DEFAULT_MMAP_THRESHOLD;  ///< Map files of at least this many bytes
    bool enable_fallback = true;                     ///< Read the file if mapping fails
};

/**
 * @brief Load statistics printed with -vv
 */
struct AccessMetrics {
    std::chrono::milliseconds load_time{0};
    bool fallback_used = false;
};

class FileAccessException : public std::runtime_error {
public:
    explicit FileAccessException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class FileAccessStrategy
 * @brief A loaded input file
 *
 * ```cpp
 * auto file = FileAccessStrategy::create("a.out");
 * BinaryFormat format = FormatDetector::detect(file->data(), file->size());
 * ```
 */
class FileAccessStrategy {
public:
    virtual ~FileAccessStrategy() = default;

    virtual const uint8_t* data() const = 0;
    virtual size_t size() const = 0;
    virtual std::string getStrategyName() const = 0;
    virtual AccessMetrics getMetrics() const = 0;

    /**
     * @brief One-line summary of the load
     */
    virtual std::string getPerformanceMetrics() const = 0;

    /**
     * @brief Open a regular, non-empty file with the strategy suited to its size
     * @throws FileAccessException if the file cannot be opened, sized, read or mapped
     */
    static std::unique_ptr<FileAccessStrategy> create(const std::string& filename,
                                                      const FileAccessConfig& config = {});

protected:
    static size_t regularFileSize(const std::string& filename);
};

class InMemoryFile : public FileAccessStrategy {
public:
    explicit InMemoryFile(const std::string& filename, bool fallback = false);

    const uint8_t* data() const override { return bytes_.data(); }
    size_t size() const override { return bytes_.size(); }
    std::string getStrategyName() const override { return "in-memory"; }
    AccessMetrics getMetrics() const override { return metrics_; }
    std::string getPerformanceMetrics() const override;

private:
    std::vector<uint8_t> bytes_;
    AccessMetrics metrics_;
};

/**
 * @class MemoryMappedFile
 * @brief Read-only private mapping, unmapped on destruction
 */
class MemoryMappedFile : public FileAccessStrategy {
public:
    explicit MemoryMappedFile(const std::string& filename);
    ~MemoryMappedFile() override;

    MemoryMappedFile(const MemoryMappedFile&) = delete;
    MemoryMappedFile& operator=(const MemoryMappedFile&) = delete;

    const uint8_t* data() const override { return mapping_; }
    size_t size() const override { return size_; }
    std::string getStrategyName() const override { return "memory-mapped"; }
    AccessMetrics getMetrics() const override { return metrics_; }
    std::string getPerformanceMetrics() const override;

private:
    void release() noexcept;

    const uint8_t* mapping_ = nullptr;
    size_t size_ = 0;
    int fd_ = -1;
    AccessMetrics metrics_;
};
