/**
 * @file FileTransfer.h
 * @brief Moving one file between local storage and a frame stream
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#pragma once

#include "ErrorCodes.h"
#include "FrameProtocol.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace QuickSend {

/**
 * @brief Progress callback function type
 *
 * Called during file transfer to report progress.
 *
 * @param bytesTransferred Total bytes transferred so far
 * @param totalBytes Total file size
 * @param percentage Transfer percentage (0-100)
 */
using ProgressCallback = std::function<void(uint64_t bytesTransferred,
                                             uint64_t totalBytes,
                                             double percentage)>;

//=============================================================================
// FileSender Class
//=============================================================================

/**
 * @class FileSender
 * @brief Streams one local file as a frame entry
 *
 * initialize() is the pre-flight check: it opens the file and records its
 * exact size without sending anything. sendFile() reopens the file, writes
 * the entry header with the path exactly as given and streams the content
 * in chunks of the caller's buffer size.
 *
 * Usage:
 * @code
 * FileSender sender("docs/report.pdf");
 * TransferError error;
 * if (sender.initialize(error) && sender.sendFile(writer, buffer, error)) {
 *     ...
 * }
 * @endcode
 */
class FileSender {
public:
    /**
     * @brief Constructor
     * @param filePath Path of the local file, also sent on the wire verbatim
     *
     * Does not open the file yet. Call initialize() first.
     */
    explicit FileSender(const std::string& filePath);

    ~FileSender() = default;

    // Prevent copying
    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    // Allow moving
    FileSender(FileSender&&) noexcept = default;
    FileSender& operator=(FileSender&&) noexcept = default;

    /**
     * @brief Validate the file can be opened and record its size
     * @param error Output error (LOCAL_IO)
     * @return true if the file is readable
     */
    bool initialize(TransferError& error);

    /**
     * @brief Write the entry header and the file content
     * @param writer Frame writer positioned at an entry boundary
     * @param buffer Scratch buffer; its size is the chunk size
     * @param error Output error (LOCAL_IO for read failures, CONNECTION for send failures)
     * @param progress Optional progress callback (can be nullptr)
     * @return true if the whole file was sent
     *
     * A file that shrank since initialize() is a LOCAL_IO error; the entry
     * is never padded.
     */
    bool sendFile(FrameWriter& writer, std::vector<uint8_t>& buffer,
                  TransferError& error, ProgressCallback progress = nullptr);

    const std::string& getFilePath() const { return m_filePath; }
    uint64_t getFileSize() const { return m_fileSize; }

private:
    std::string m_filePath;   ///< Path as given by the caller
    uint64_t m_fileSize;      ///< Size recorded by initialize()
    bool m_initialized;
};

//=============================================================================
// FileReceiver Class
//=============================================================================

/**
 * @class FileReceiver
 * @brief Writes frame entries to local storage
 *
 * Destination = output directory / entry path. An absolute entry path
 * replaces the output directory, matching std::filesystem::path::operator/.
 * Parent directories are created on demand; the ones already created in
 * this session are remembered and not touched again.
 *
 * Files are created (or truncated) just before their content is read and
 * closed right after. A failure leaves whatever was written on disk.
 */
class FileReceiver {
public:
    /**
     * @brief Constructor
     * @param outputDir Base directory for relative entry paths
     */
    explicit FileReceiver(const std::filesystem::path& outputDir);

    ~FileReceiver() = default;

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    /**
     * @brief Create the destination and copy the current entry's content into it
     * @param reader Frame reader positioned right after the entry header
     * @param entryPath Path to write (already prefix-stripped if enabled)
     * @param size Declared content length
     * @param buffer Scratch buffer; its size is the chunk size
     * @param error Output error (LOCAL_IO, or FRAMING/CONNECTION from the reader)
     * @param progress Optional progress callback (can be nullptr)
     * @return true if exactly size bytes were written
     */
    bool receiveFile(FrameReader& reader, const std::string& entryPath, uint64_t size,
                     std::vector<uint8_t>& buffer, TransferError& error,
                     ProgressCallback progress = nullptr);

    /**
     * @brief Destination path for an entry path
     */
    std::filesystem::path resolveDestination(const std::string& entryPath) const;

    const std::filesystem::path& getOutputDir() const { return m_outputDir; }

    /**
     * @brief Number of distinct parent directories ensured so far
     */
    size_t getCreatedDirectoryCount() const { return m_createdDirs.size(); }

private:
    bool ensureParentDirectories(const std::filesystem::path& destination,
                                 TransferError& error);

    std::filesystem::path m_outputDir;
    std::unordered_set<std::string> m_createdDirs;  ///< Directories ensured this session
};

}  // namespace QuickSend
