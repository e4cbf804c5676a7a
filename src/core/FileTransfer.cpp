/**
 * @file FileTransfer.cpp
 * @brief FileSender and FileReceiver implementation
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/FileTransfer.h"
#include "quicksend/Debug.h"
#include <cerrno>
#include <cstring>
#include <fstream>

namespace QuickSend {

namespace {
    std::string errnoText() {
        return std::strerror(errno);
    }

    void reportProgress(const ProgressCallback& progress, uint64_t done, uint64_t total) {
        if (!progress) {
            return;
        }
        double percentage = (total == 0)
            ? 100.0
            : (static_cast<double>(done) / static_cast<double>(total)) * 100.0;
        progress(done, total, percentage);
    }
} // anonymous namespace

//=============================================================================
// FileSender Implementation
//=============================================================================

FileSender::FileSender(const std::string& filePath)
    : m_filePath(filePath)
    , m_fileSize(0)
    , m_initialized(false)
{
}

bool FileSender::initialize(TransferError& error)
{
    std::error_code ec;
    if (std::filesystem::is_directory(m_filePath, ec)) {
        error.set(ErrorKind::LOCAL_IO, "Not a regular file: " + m_filePath);
        return false;
    }

    // Check if file exists and can be opened
    std::ifstream file(m_filePath, std::ios::binary | std::ios::ate);
    if (!file) {
        error.set(ErrorKind::LOCAL_IO, "Failed to open file: " + m_filePath +
                  " (" + errnoText() + ")");
        return false;
    }

    std::streamoff end = file.tellg();
    if (end < 0) {
        error.set(ErrorKind::LOCAL_IO, "Failed to determine size of " + m_filePath);
        return false;
    }

    m_fileSize = static_cast<uint64_t>(end);
    m_initialized = true;
    return true;
}

bool FileSender::sendFile(FrameWriter& writer, std::vector<uint8_t>& buffer,
                          TransferError& error, ProgressCallback progress)
{
    if (!m_initialized && !initialize(error)) {
        return false;
    }
    if (buffer.empty()) {
        buffer.resize(BUFFER_SIZE);
    }

    // Reopen before the header so a vanished file never produces a dangling entry
    std::ifstream file(m_filePath, std::ios::binary);
    if (!file) {
        error.set(ErrorKind::LOCAL_IO, "Failed to open file for reading: " + m_filePath +
                  " (" + errnoText() + ")");
        return false;
    }

    FileEntry entry;
    entry.path = m_filePath;
    entry.size = m_fileSize;
    if (!writer.writeEntryHeader(entry, error)) {
        return false;
    }

    uint64_t totalSent = 0;
    while (totalSent < m_fileSize) {
        uint64_t remaining = m_fileSize - totalSent;
        size_t chunk = (remaining < buffer.size()) ? static_cast<size_t>(remaining)
                                                   : buffer.size();

        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk));
        std::streamsize bytesRead = file.gcount();

        if (bytesRead <= 0) {
            if (file.bad()) {
                error.set(ErrorKind::LOCAL_IO, "Error reading file: " + m_filePath);
            } else {
                error.set(ErrorKind::LOCAL_IO, "File shrank while sending: " + m_filePath +
                          " (" + std::to_string(totalSent) + " of " +
                          std::to_string(m_fileSize) + " bytes available)");
            }
            return false;
        }

        if (!writer.writeContent(buffer.data(), static_cast<size_t>(bytesRead), error)) {
            return false;
        }

        totalSent += static_cast<uint64_t>(bytesRead);
        reportProgress(progress, totalSent, m_fileSize);
    }

    if (m_fileSize == 0) {
        reportProgress(progress, 0, 0);
    }

    return true;
}

//=============================================================================
// FileReceiver Implementation
//=============================================================================

FileReceiver::FileReceiver(const std::filesystem::path& outputDir)
    : m_outputDir(outputDir)
{
}

std::filesystem::path FileReceiver::resolveDestination(const std::string& entryPath) const {
    return m_outputDir / std::filesystem::path(entryPath);
}

bool FileReceiver::ensureParentDirectories(const std::filesystem::path& destination,
                                           TransferError& error)
{
    std::filesystem::path parent = destination.parent_path();
    if (parent.empty()) {
        return true;
    }

    const std::string key = parent.string();
    if (m_createdDirs.count(key) != 0) {
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        error.set(ErrorKind::LOCAL_IO, "Failed to create directory " + key + ": " + ec.message());
        return false;
    }

    LOG_DEBUG("Ensured directory " << key);
    m_createdDirs.insert(key);
    return true;
}

bool FileReceiver::receiveFile(FrameReader& reader, const std::string& entryPath,
                               uint64_t size, std::vector<uint8_t>& buffer,
                               TransferError& error, ProgressCallback progress)
{
    if (buffer.empty()) {
        buffer.resize(BUFFER_SIZE);
    }

    const std::filesystem::path destination = resolveDestination(entryPath);
    if (!ensureParentDirectories(destination, error)) {
        return false;
    }

    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file) {
        error.set(ErrorKind::LOCAL_IO, "Failed to create file " + destination.string() +
                  " (" + errnoText() + ")");
        return false;
    }

    uint64_t totalWritten = 0;
    while (totalWritten < size) {
        size_t bytesRead = 0;
        if (!reader.readContent(buffer.data(), buffer.size(), bytesRead, error)) {
            // Stream position is unrecoverable; keep what was written
            file.close();
            return false;
        }
        if (bytesRead == 0) {
            error.set(ErrorKind::FRAMING, "Entry content ended after " +
                      std::to_string(totalWritten) + " of " + std::to_string(size) + " bytes");
            return false;
        }

        file.write(reinterpret_cast<const char*>(buffer.data()),
                   static_cast<std::streamsize>(bytesRead));
        if (!file) {
            error.set(ErrorKind::LOCAL_IO, "Failed to write file " + destination.string() +
                      " (" + errnoText() + ")");
            return false;
        }

        totalWritten += bytesRead;
        reportProgress(progress, totalWritten, size);
    }

    file.close();
    if (file.fail()) {
        error.set(ErrorKind::LOCAL_IO, "Failed to close file " + destination.string());
        return false;
    }

    return true;
}

}  // namespace QuickSend
