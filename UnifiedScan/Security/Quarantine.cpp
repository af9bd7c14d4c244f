/**
 * Quarantine.cpp - Quarantine vault with masked payloads
 */

#include "Quarantine.h"
#include "../Platform/PlatformProbe.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <cstring>
#include <cstdlib>
#include <random>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace fs = std::filesystem;

namespace UnifiedScan {

    static const char VAULT_MAGIC[4] = { 'Q', 'V', 'L', 'T' };
    static const wchar_t* VAULT_EXTENSION = L".qvault";
    static const wchar_t* METADATA_EXTENSION = L".meta";

    // Header: magic, 32-bit seed, 64-bit original size, both little-endian
    static const size_t HEADER_SIZE = sizeof(VAULT_MAGIC) + sizeof(uint32_t) + sizeof(uint64_t);
    static const size_t SEED_OFFSET = sizeof(VAULT_MAGIC);
    static const size_t SIZE_OFFSET = SEED_OFFSET + sizeof(uint32_t);

    // Multiple of 4 so the keystream stays word-aligned from one chunk to the next
    static const size_t CHUNK_SIZE = 64 * 1024;

    // XOR with a keystream derived from the seed; applying it twice restores the data
    namespace {

    class PayloadMask {
    public:
        explicit PayloadMask(uint32_t seed) : m_keystream(seed) {}

        void Apply(char* data, size_t length) {
            for (size_t i = 0; i < length; i += 4) {
                uint32_t word = m_keystream();
                for (size_t k = 0; k < 4 && i + k < length; k++) {
                    data[i + k] = static_cast<char>(static_cast<uint8_t>(data[i + k]) ^ ((word >> (k * 8)) & 0xFF));
                }
            }
        }

    private:
        std::mt19937 m_keystream;
    };

    } // namespace

    static void PutLittleEndian(char* out, uint64_t value, size_t bytes) {
        for (size_t i = 0; i < bytes; i++) {
            out[i] = static_cast<char>((value >> (i * 8)) & 0xFF);
        }
    }

    static uint64_t GetLittleEndian(const char* in, size_t bytes) {
        uint64_t value = 0;
        for (size_t i = 0; i < bytes; i++) {
            value |= static_cast<uint64_t>(static_cast<uint8_t>(in[i])) << (i * 8);
        }
        return value;
    }

    static uint32_t GenerateSeed() {
        std::random_device rd;
        return rd();
    }

    /**
     * Copies in to out through the mask, one chunk at a time.
     * @return ACCESS_DENIED on a read error, WRITE_FAILED on a write error
     */
    static QuarantineResult CopyMasked(std::istream& in, std::ostream& out, PayloadMask& mask, uint64_t& copied) {
        std::vector<char> buffer(CHUNK_SIZE);
        copied = 0;
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = in.gcount();
            if (got <= 0) break;

            mask.Apply(buffer.data(), static_cast<size_t>(got));
            out.write(buffer.data(), got);
            if (!out) return QuarantineResult::WRITE_FAILED;
            copied += static_cast<uint64_t>(got);
        }
        return in.bad() ? QuarantineResult::ACCESS_DENIED : QuarantineResult::SUCCESS;
    }

    static QuarantineResult FromProbeStatus(ProbeStatus status) {
        switch (status) {
        case ProbeStatus::OK:            return QuarantineResult::SUCCESS;
        case ProbeStatus::NOT_FOUND:     return QuarantineResult::FILE_NOT_FOUND;
        case ProbeStatus::ACCESS_DENIED: return QuarantineResult::ACCESS_DENIED;
        case ProbeStatus::IN_USE:        return QuarantineResult::FILE_IN_USE;
        default:                         return QuarantineResult::UNKNOWN_ERROR;
        }
    }

    const wchar_t* ToString(QuarantineResult result) {
        switch (result) {
        case QuarantineResult::SUCCESS:             return L"success";
        case QuarantineResult::ALREADY_QUARANTINED: return L"already quarantined";
        case QuarantineResult::ACCESS_DENIED:       return L"access denied";
        case QuarantineResult::FILE_NOT_FOUND:      return L"file not found";
        case QuarantineResult::FILE_IN_USE:         return L"file is in use";
        case QuarantineResult::TARGET_EXISTS:       return L"original path is occupied";
        case QuarantineResult::WRITE_FAILED:        return L"cannot write to quarantine";
        case QuarantineResult::INTEGRITY_MISMATCH:  return L"restored file does not match its hash";
        case QuarantineResult::NOT_INITIALIZED:     return L"quarantine not initialized";
        case QuarantineResult::UNKNOWN_ERROR:       return L"unknown error";
        }
        return L"unknown error";
    }

    QuarantineManager::QuarantineManager(PlatformProbe& probe)
        : m_probe(probe) {
    }

    bool QuarantineManager::Initialize(const QuarantineConfig& config) {
        std::error_code ec;
        fs::create_directories(config.quarantineRoot, ec);
        if (ec) {
            LogError("Quarantine", L"Cannot create quarantine directory " + config.quarantineRoot + L": " +
                Utils::FromUtf8(ec.message()));
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_entriesMutex);
            m_config = config;
            m_isInitialized = true;
        }
        LoadEntries();
        return true;
    }

    bool QuarantineManager::IsInitialized() const {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        return m_isInitialized;
    }

    std::wstring QuarantineManager::GenerateId() {
        std::time_t now = std::time(nullptr);
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        std::wostringstream id;
        id << std::put_time(&local, L"%Y%m%d-%H%M%S") << L"-"
            << std::hex << std::setw(8) << std::setfill(L'0') << GenerateSeed();
        return id.str();
    }

    std::wstring QuarantineManager::MetadataPath(const std::wstring& quarantineId) const {
        return (fs::path(m_config.quarantineRoot) / (quarantineId + METADATA_EXTENSION)).wstring();
    }

    bool QuarantineManager::WriteMetadata(const QuarantineEntry& entry) const {
        std::ofstream meta(fs::path(MetadataPath(entry.quarantineId)), std::ios::binary | std::ios::trunc);
        if (!meta) return false;

        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            entry.quarantineTime.time_since_epoch()).count();

        meta << "id=" << Utils::ToUtf8(entry.quarantineId) << "\n"
            << "original_path=" << Utils::ToUtf8(entry.originalPath) << "\n"
            << "file_name=" << Utils::ToUtf8(entry.fileName) << "\n"
            << "threat=" << Utils::ToUtf8(entry.threatName) << "\n"
            << "sha256=" << entry.sha256 << "\n"
            << "size=" << entry.originalSize << "\n"
            << "time=" << seconds << "\n";
        meta.close();
        return !meta.fail();
    }

    void QuarantineManager::LoadEntries() {
        std::vector<QuarantineEntry> loaded;

        std::error_code ec;
        for (fs::directory_iterator it(m_config.quarantineRoot, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().extension() != METADATA_EXTENSION) continue;

            std::ifstream meta(it->path(), std::ios::binary);
            if (!meta) continue;

            QuarantineEntry entry;
            std::string line;
            while (std::getline(meta, line)) {
                size_t eq = line.find('=');
                if (eq == std::string::npos) continue;
                std::string key = line.substr(0, eq);
                std::string value = line.substr(eq + 1);

                if (key == "id") entry.quarantineId = Utils::FromUtf8(value);
                else if (key == "original_path") entry.originalPath = Utils::FromUtf8(value);
                else if (key == "file_name") entry.fileName = Utils::FromUtf8(value);
                else if (key == "threat") entry.threatName = Utils::FromUtf8(value);
                else if (key == "sha256") entry.sha256 = value;
                else if (key == "size") entry.originalSize = std::strtoull(value.c_str(), nullptr, 10);
                else if (key == "time") entry.quarantineTime = std::chrono::system_clock::time_point(
                    std::chrono::seconds(std::strtoll(value.c_str(), nullptr, 10)));
            }

            if (entry.quarantineId.empty() || entry.originalPath.empty()) {
                LogWarning("Quarantine", L"Ignoring malformed record " + it->path().wstring());
                continue;
            }

            entry.vaultPath = (fs::path(m_config.quarantineRoot) / (entry.quarantineId + VAULT_EXTENSION)).wstring();
            std::error_code existsEc;
            if (!fs::exists(entry.vaultPath, existsEc)) {
                LogWarning("Quarantine", L"Vault file missing for " + entry.quarantineId);
                continue;
            }
            loaded.push_back(std::move(entry));
        }

        std::lock_guard<std::mutex> lock(m_entriesMutex);
        m_entries = std::move(loaded);
        LogInfo("Quarantine", L"Loaded " + std::to_wstring(m_entries.size()) + L" quarantined files");
    }

    QuarantineResult QuarantineManager::QuarantineFile(const std::wstring& filePath, const std::wstring& threatName,
        QuarantineEntry* entryOut) {
        if (!IsInitialized()) return QuarantineResult::NOT_INITIALIZED;

        fs::path source = fs::path(filePath).lexically_normal();
        fs::path root = fs::path(m_config.quarantineRoot).lexically_normal();
        if (source.parent_path() == root) return QuarantineResult::ALREADY_QUARANTINED;

        FileMetadata metadata;
        ProbeStatus status = m_probe.GetFileMetadata(filePath, metadata);
        if (status != ProbeStatus::OK) return FromProbeStatus(status);

        QuarantineEntry entry;
        status = m_probe.ComputeFileHash(filePath, entry.sha256);
        if (status != ProbeStatus::OK) return FromProbeStatus(status);

        std::ifstream input(source, std::ios::binary);
        if (!input) return QuarantineResult::ACCESS_DENIED;

        uint32_t seed = GenerateSeed();

        entry.quarantineId = GenerateId();
        entry.originalPath = filePath;
        entry.fileName = source.filename().wstring();
        entry.vaultPath = (root / (entry.quarantineId + VAULT_EXTENSION)).wstring();
        entry.threatName = threatName;
        entry.originalSize = metadata.size;
        entry.quarantineTime = std::chrono::system_clock::now();

        {
            std::ofstream vault(fs::path(entry.vaultPath), std::ios::binary | std::ios::trunc);
            if (!vault) return QuarantineResult::WRITE_FAILED;

            char header[HEADER_SIZE];
            std::memcpy(header, VAULT_MAGIC, sizeof(VAULT_MAGIC));
            PutLittleEndian(header + SEED_OFFSET, seed, sizeof(uint32_t));
            PutLittleEndian(header + SIZE_OFFSET, entry.originalSize, sizeof(uint64_t));
            vault.write(header, sizeof(header));

            PayloadMask mask(seed);
            uint64_t copied = 0;
            QuarantineResult copyResult = vault ? CopyMasked(input, vault, mask, copied) : QuarantineResult::WRITE_FAILED;

            // The file may have changed size since the metadata was read
            if (copyResult == QuarantineResult::SUCCESS && copied != entry.originalSize) {
                entry.originalSize = copied;
                PutLittleEndian(header + SIZE_OFFSET, copied, sizeof(uint64_t));
                vault.seekp(static_cast<std::streamoff>(SIZE_OFFSET));
                vault.write(header + SIZE_OFFSET, sizeof(uint64_t));
            }
            vault.close();
            if (copyResult == QuarantineResult::SUCCESS && vault.fail()) copyResult = QuarantineResult::WRITE_FAILED;

            if (copyResult != QuarantineResult::SUCCESS) {
                std::error_code ec;
                fs::remove(entry.vaultPath, ec);
                LogWarning("Quarantine", L"Cannot copy " + filePath + L" into the vault: " + ToString(copyResult));
                return copyResult;
            }
        }
        input.close();

        if (!WriteMetadata(entry)) {
            std::error_code ec;
            fs::remove(entry.vaultPath, ec);
            fs::remove(MetadataPath(entry.quarantineId), ec);
            return QuarantineResult::WRITE_FAILED;
        }

        ProbeStatus attributeStatus = m_probe.SetAttributes(filePath, FileAttribute::NORMAL);
        if (attributeStatus != ProbeStatus::OK) {
            LogTrace("Quarantine", L"Cannot clear attributes of " + filePath + L": " + ToString(attributeStatus));
        }
        status = m_probe.RemoveFile(filePath);
        if (status != ProbeStatus::OK) {
            // Keep the original in place rather than leave two copies
            std::error_code ec;
            fs::remove(entry.vaultPath, ec);
            fs::remove(MetadataPath(entry.quarantineId), ec);
            LogWarning("Quarantine", L"Cannot remove original " + filePath + L": " + ToString(status));
            return FromProbeStatus(status);
        }

        LogInfo("Quarantine", L"Quarantined " + filePath + L" as " + entry.quarantineId);
        if (entryOut) *entryOut = entry;

        std::lock_guard<std::mutex> lock(m_entriesMutex);
        m_entries.push_back(std::move(entry));
        return QuarantineResult::SUCCESS;
    }

    QuarantineResult QuarantineManager::RestoreFile(const std::wstring& quarantineId) {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        if (!m_isInitialized) return QuarantineResult::NOT_INITIALIZED;

        auto it = std::find_if(m_entries.begin(), m_entries.end(),
            [&quarantineId](const QuarantineEntry& entry) { return entry.quarantineId == quarantineId; });
        if (it == m_entries.end()) return QuarantineResult::FILE_NOT_FOUND;

        std::error_code ec;
        if (fs::exists(it->originalPath, ec)) return QuarantineResult::TARGET_EXISTS;

        std::ifstream vault(fs::path(it->vaultPath), std::ios::binary);
        if (!vault) return QuarantineResult::ACCESS_DENIED;

        char header[HEADER_SIZE];
        vault.read(header, sizeof(header));
        if (vault.gcount() != static_cast<std::streamsize>(sizeof(header)) ||
            !std::equal(VAULT_MAGIC, VAULT_MAGIC + sizeof(VAULT_MAGIC), header)) {
            return QuarantineResult::INTEGRITY_MISMATCH;
        }

        uint32_t seed = static_cast<uint32_t>(GetLittleEndian(header + SEED_OFFSET, sizeof(uint32_t)));
        uint64_t originalSize = GetLittleEndian(header + SIZE_OFFSET, sizeof(uint64_t));
        uintmax_t vaultSize = fs::file_size(it->vaultPath, ec);
        if (ec || vaultSize - HEADER_SIZE != originalSize) return QuarantineResult::INTEGRITY_MISMATCH;

        fs::create_directories(fs::path(it->originalPath).parent_path(), ec);
        {
            std::ofstream out(fs::path(it->originalPath), std::ios::binary | std::ios::trunc);
            if (!out) return QuarantineResult::WRITE_FAILED;

            PayloadMask mask(seed);
            uint64_t copied = 0;
            QuarantineResult copyResult = CopyMasked(vault, out, mask, copied);
            out.close();
            if (copyResult == QuarantineResult::SUCCESS && out.fail()) copyResult = QuarantineResult::WRITE_FAILED;
            if (copyResult == QuarantineResult::SUCCESS && copied != originalSize) {
                copyResult = QuarantineResult::INTEGRITY_MISMATCH;
            }
            if (copyResult != QuarantineResult::SUCCESS) {
                fs::remove(it->originalPath, ec);
                return copyResult;
            }
        }
        vault.close();

        std::string digest;
        if (m_probe.ComputeFileHash(it->originalPath, digest) != ProbeStatus::OK || digest != it->sha256) {
            fs::remove(it->originalPath, ec);
            LogError("Quarantine", L"Hash mismatch restoring " + it->quarantineId);
            return QuarantineResult::INTEGRITY_MISMATCH;
        }

        fs::remove(it->vaultPath, ec);
        fs::remove(MetadataPath(it->quarantineId), ec);
        LogInfo("Quarantine", L"Restored " + it->originalPath);
        m_entries.erase(it);
        return QuarantineResult::SUCCESS;
    }

    QuarantineResult QuarantineManager::DeletePermanently(const std::wstring& quarantineId) {
        std::lock_guard<std::mutex> lock(m_entriesMutex);

        auto it = std::find_if(m_entries.begin(), m_entries.end(),
            [&quarantineId](const QuarantineEntry& entry) { return entry.quarantineId == quarantineId; });
        if (it == m_entries.end()) return QuarantineResult::FILE_NOT_FOUND;

        std::error_code ec;
        fs::remove(it->vaultPath, ec);
        if (ec) return QuarantineResult::ACCESS_DENIED;
        fs::remove(MetadataPath(it->quarantineId), ec);

        LogInfo("Quarantine", L"Deleted " + it->quarantineId + L" permanently");
        m_entries.erase(it);
        return QuarantineResult::SUCCESS;
    }

    std::vector<QuarantineEntry> QuarantineManager::GetQuarantinedFiles() const {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        return m_entries;
    }

    size_t QuarantineManager::GetQuarantineCount() const {
        std::lock_guard<std::mutex> lock(m_entriesMutex);
        return m_entries.size();
    }

} // namespace UnifiedScan
