/**
 * Quarantine.h
 *
 * Quarantine vault for removed files.
 *
 * A quarantined file becomes two files in the quarantine directory:
 *   <id>.qvault  "QVLT" magic, 32-bit seed, 64-bit original size (both
 *                little-endian), then the payload XOR-masked with an
 *                mt19937 keystream from the seed
 *   <id>.meta    key=value lines (original path, threat, SHA-256, time)
 *
 * The mask only keeps the payload from being executed or picked up by
 * other scanners in place; it is not encryption.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <mutex>
#include <cstdint>

namespace UnifiedScan {

    class PlatformProbe;

    enum class QuarantineResult {
        SUCCESS,
        ALREADY_QUARANTINED,
        ACCESS_DENIED,
        FILE_NOT_FOUND,
        FILE_IN_USE,
        TARGET_EXISTS,
        WRITE_FAILED,
        INTEGRITY_MISMATCH,
        NOT_INITIALIZED,
        UNKNOWN_ERROR
    };

    const wchar_t* ToString(QuarantineResult result);

    struct QuarantineEntry {
        std::wstring quarantineId;
        std::wstring originalPath;
        std::wstring fileName;
        std::wstring vaultPath;
        std::wstring threatName;
        std::string sha256;
        uint64_t originalSize = 0;
        std::chrono::system_clock::time_point quarantineTime;
    };

    struct QuarantineConfig {
        std::wstring quarantineRoot;
    };

    class QuarantineManager {
    public:
        explicit QuarantineManager(PlatformProbe& probe);

        QuarantineManager(const QuarantineManager&) = delete;
        QuarantineManager& operator=(const QuarantineManager&) = delete;

        // Creates the directory and reloads the entries recorded there
        bool Initialize(const QuarantineConfig& config);
        bool IsInitialized() const;

        QuarantineResult QuarantineFile(const std::wstring& filePath, const std::wstring& threatName,
            QuarantineEntry* entryOut = nullptr);

        // Writes the file back to its original path and checks its SHA-256
        QuarantineResult RestoreFile(const std::wstring& quarantineId);
        QuarantineResult DeletePermanently(const std::wstring& quarantineId);

        std::vector<QuarantineEntry> GetQuarantinedFiles() const;
        size_t GetQuarantineCount() const;

    private:
        void LoadEntries();
        bool WriteMetadata(const QuarantineEntry& entry) const;
        std::wstring MetadataPath(const std::wstring& quarantineId) const;
        static std::wstring GenerateId();

        PlatformProbe& m_probe;
        QuarantineConfig m_config;
        bool m_isInitialized = false;
        std::vector<QuarantineEntry> m_entries;
        mutable std::mutex m_entriesMutex;
    };

} // namespace UnifiedScan
