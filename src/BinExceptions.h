/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

/**
 * @file BinExceptions.h
 * @brief Custom exception hierarchy for binary decoding and search errors
 *
 * Exception Hierarchy:
 * - BinaryParsingError (base)
 *   - BinaryFileError (file access and format validation)
 *   - SearchPatternError (caller-fixable search input)
 *   - MemoryAccessError (bounds checking and truncation)
 *   - UnsupportedFormatError (recognized but undecodable container)
 *
 * Structural anomalies such as out-of-range section indices or unreadable
 * names are not exceptions; they are rendered inline as sentinel text.
 *
 * Usage Examples:
 * @code
 * try {
 *     BinaryInspector inspector(config);
 *     inspector.run();
 * } catch (const SearchPatternError& e) {
 *     std::cerr << "Search error: " << e.getDetailedMessage() << std::endl;
 * } catch (const BinaryParsingError& e) {
 *     std::cerr << "Binary error: " << e.getDetailedMessage() << std::endl;
 * }
 * @endcode
 */

#ifndef BIN_EXCEPTIONS_H
#define BIN_EXCEPTIONS_H

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace BinReaderExceptions {

/**
 * @brief Base exception class for all binary decoding related errors
 */
class BinaryParsingError : public std::runtime_error {
public:
    explicit BinaryParsingError(const std::string& message)
        : std::runtime_error(message), context_("") {}

    /**
     * @brief Construct exception with error message and context
     * @param message Descriptive error message
     * @param context Additional context information (filename, table, etc.)
     */
    BinaryParsingError(const std::string& message, const std::string& context)
        : std::runtime_error(message), context_(context) {}

    BinaryParsingError(const BinaryParsingError&) = default;
    BinaryParsingError& operator=(const BinaryParsingError&) = default;
    BinaryParsingError(BinaryParsingError&&) noexcept = default;
    BinaryParsingError& operator=(BinaryParsingError&&) noexcept = default;

    const std::string& getContext() const noexcept { return context_; }

    /**
     * @brief Get formatted error message with context
     * @return Complete error description including context
     */
    virtual std::string getDetailedMessage() const {
        if (context_.empty()) {
            return what();
        }
        return std::string(what()) + " (Context: " + context_ + ")";
    }

protected:
    std::string context_;  ///< Additional context information
};

/**
 * @brief File access and format validation errors
 */
class BinaryFileError : public BinaryParsingError {
public:
    enum class ErrorType {
        FileNotFound,     ///< File does not exist
        PermissionDenied, ///< Cannot read file due to permissions
        FileTooSmall,     ///< File smaller than the declared structures
        InvalidFormat,    ///< Magic or header fields are not valid
        ReadError         ///< I/O or decoder library failure
    };

    BinaryFileError(ErrorType type, const std::string& message, const std::string& filename = "")
        : BinaryParsingError(message, filename), errorType_(type) {}

    ErrorType getErrorType() const noexcept { return errorType_; }

    /**
     * @brief Get user-friendly suggestion for resolving the error
     */
    std::string getSuggestion() const {
        switch (errorType_) {
            case ErrorType::FileNotFound:
                return "Check that the file path is correct and the file exists";
            case ErrorType::PermissionDenied:
                return "Verify that you have read permissions for the file";
            case ErrorType::FileTooSmall:
                return "Ensure the file is complete and not truncated";
            case ErrorType::InvalidFormat:
                return "Verify the file type (try 'file' command)";
            case ErrorType::ReadError:
                return "Check for disk errors or a damaged file";
        }
        return "Contact support with the error details";
    }

    std::string getDetailedMessage() const override {
        return BinaryParsingError::getDetailedMessage() + "\nSuggestion: " + getSuggestion();
    }

    static BinaryFileError fileNotFound(const std::string& filename) {
        return BinaryFileError(ErrorType::FileNotFound, "File not found: " + filename, filename);
    }

    static BinaryFileError invalidFormat(const std::string& what, const std::string& filename = "") {
        return BinaryFileError(ErrorType::InvalidFormat, "Invalid " + what, filename);
    }

    static BinaryFileError truncated(const std::string& what, const std::string& filename = "") {
        return BinaryFileError(ErrorType::FileTooSmall,
                               "File too short to contain " + what,
                               filename);
    }

    static BinaryFileError libraryFailure(const std::string& message, const std::string& filename = "") {
        return BinaryFileError(ErrorType::ReadError, message, filename);
    }

private:
    ErrorType errorType_;
};

/**
 * @brief Invalid search pattern supplied by the caller
 *
 * Raised for an empty needle or a malformed hex pattern. No partial report
 * is produced when this is thrown.
 */
class SearchPatternError : public BinaryParsingError {
public:
    explicit SearchPatternError(const std::string& message, const std::string& pattern = "")
        : BinaryParsingError(message, pattern) {}

    std::string getDetailedMessage() const override {
        std::string msg = BinaryParsingError::getDetailedMessage();
        return msg + "\nSuggestion: Supply a non-empty string with -s or hex bytes with -x";
    }
};

/**
 * @brief Memory access and bounds checking errors
 */
class MemoryAccessError : public BinaryParsingError {
public:
    explicit MemoryAccessError(const std::string& message, size_t offset = 0)
        : BinaryParsingError(message), offset_(offset) {}

    size_t getOffset() const noexcept { return offset_; }

    std::string getDetailedMessage() const override {
        std::string msg = what();
        if (offset_ > 0) {
            std::ostringstream oss;
            oss << " at offset 0x" << std::hex << offset_;
            msg += oss.str();
        }
        return msg + "\nSuggestion: File may be corrupted or truncated";
    }

private:
    size_t offset_;  ///< Memory offset where error occurred
};

/**
 * @brief Container recognized but not decodable by this build
 */
class UnsupportedFormatError : public BinaryParsingError {
public:
    explicit UnsupportedFormatError(const std::string& message, const std::string& context = "")
        : BinaryParsingError(message, context) {}
};

}  // namespace BinReaderExceptions

#endif  // BIN_EXCEPTIONS_H
