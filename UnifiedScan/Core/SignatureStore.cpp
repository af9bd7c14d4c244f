/**
 * SignatureStore.cpp - Signature database
 */

#include "SignatureStore.h"
#include "../Utils/StringUtils.h"
#include "../Utils/Logger.h"
#include <filesystem>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace UnifiedScan {

    namespace {

        struct DefaultEntry {
            SignatureCategory category;
            const wchar_t* pattern;
            ThreatSeverity severity;
            const wchar_t* description;
        };

        // Declaration order matters: the first matching entry wins
        const DefaultEntry DEFAULT_NAME_SIGNATURES[] = {
            // Running processes
            { SignatureCategory::PROCESS, L"xmrig",         ThreatSeverity::CRITICAL, L"XMRig cryptocurrency miner" },
            { SignatureCategory::PROCESS, L"coinminer",     ThreatSeverity::CRITICAL, L"Coin miner" },
            { SignatureCategory::PROCESS, L"cryptominer",   ThreatSeverity::CRITICAL, L"Cryptocurrency miner" },
            { SignatureCategory::PROCESS, L"minerd",        ThreatSeverity::CRITICAL, L"CPU miner daemon" },
            { SignatureCategory::PROCESS, L"mimikatz",      ThreatSeverity::CRITICAL, L"Credential dumping tool" },
            { SignatureCategory::PROCESS, L"njrat",         ThreatSeverity::CRITICAL, L"njRAT remote access trojan" },
            { SignatureCategory::PROCESS, L"darkcomet",     ThreatSeverity::CRITICAL, L"DarkComet remote access trojan" },
            { SignatureCategory::PROCESS, L"keylogger",     ThreatSeverity::CRITICAL, L"Keylogger" },
            { SignatureCategory::PROCESS, L"cwshredder",    ThreatSeverity::CRITICAL, L"CoolWebSearch hijacker" },
            { SignatureCategory::PROCESS, L"bonzibuddy",    ThreatSeverity::CRITICAL, L"Bonzi Buddy spyware" },

            // File names
            { SignatureCategory::FILE_NAME, L"keylogger",     ThreatSeverity::MEDIUM, L"Keylogger" },
            { SignatureCategory::FILE_NAME, L"keylog",        ThreatSeverity::MEDIUM, L"Keystroke logger" },
            { SignatureCategory::FILE_NAME, L"xmrig",         ThreatSeverity::MEDIUM, L"Cryptocurrency miner" },
            { SignatureCategory::FILE_NAME, L"coinminer",     ThreatSeverity::MEDIUM, L"Coin miner" },
            { SignatureCategory::FILE_NAME, L"cryptominer",   ThreatSeverity::MEDIUM, L"Cryptocurrency miner" },
            { SignatureCategory::FILE_NAME, L"mimikatz",      ThreatSeverity::MEDIUM, L"Credential dumping tool" },
            { SignatureCategory::FILE_NAME, L"njrat",         ThreatSeverity::MEDIUM, L"Remote access trojan" },
            { SignatureCategory::FILE_NAME, L"darkcomet",     ThreatSeverity::MEDIUM, L"Remote access trojan" },
            { SignatureCategory::FILE_NAME, L"ransomware",    ThreatSeverity::MEDIUM, L"Ransomware" },
            { SignatureCategory::FILE_NAME, L"trojan",        ThreatSeverity::MEDIUM, L"Trojan" },
            { SignatureCategory::FILE_NAME, L"backdoor",      ThreatSeverity::MEDIUM, L"Backdoor" },
            { SignatureCategory::FILE_NAME, L"stealer",       ThreatSeverity::MEDIUM, L"Information stealer" },
            { SignatureCategory::FILE_NAME, L"cwshredder",    ThreatSeverity::MEDIUM, L"CoolWebSearch hijacker" },
            { SignatureCategory::FILE_NAME, L"coolwwwsearch", ThreatSeverity::MEDIUM, L"CoolWebSearch hijacker" },
            { SignatureCategory::FILE_NAME, L"bonzibuddy",    ThreatSeverity::MEDIUM, L"Bonzi Buddy spyware" },
            { SignatureCategory::FILE_NAME, L"cmesys",        ThreatSeverity::MEDIUM, L"Gator adware component" },

            // Browser extension manifests
            { SignatureCategory::ADWARE, L"adware",        ThreatSeverity::MEDIUM, L"Adware" },
            { SignatureCategory::ADWARE, L"popunder",      ThreatSeverity::MEDIUM, L"Pop-under advertising" },
            { SignatureCategory::ADWARE, L"searchprotect", ThreatSeverity::MEDIUM, L"Search hijacker" },
            { SignatureCategory::ADWARE, L"mywebsearch",   ThreatSeverity::MEDIUM, L"Search hijacker" },
            { SignatureCategory::ADWARE, L"conduit",       ThreatSeverity::MEDIUM, L"Conduit toolbar" },
            { SignatureCategory::ADWARE, L"babylon",       ThreatSeverity::MEDIUM, L"Babylon toolbar" },
            { SignatureCategory::ADWARE, L"superfish",     ThreatSeverity::MEDIUM, L"Superfish ad injector" },
            { SignatureCategory::ADWARE, L"crossrider",    ThreatSeverity::MEDIUM, L"Crossrider ad injector" },
            { SignatureCategory::ADWARE, L"coupon",        ThreatSeverity::MEDIUM, L"Coupon adware" },

            // Registry value data
            { SignatureCategory::REGISTRY, L"\\appdata\\local\\temp\\", ThreatSeverity::HIGH, L"Autostart entry in temp directory" },
            { SignatureCategory::REGISTRY, L"\\windows\\temp\\",        ThreatSeverity::HIGH, L"Autostart entry in temp directory" },
            { SignatureCategory::REGISTRY, L"powershell -enc",          ThreatSeverity::HIGH, L"Encoded PowerShell command" },
            { SignatureCategory::REGISTRY, L"mshta http",               ThreatSeverity::HIGH, L"Remote HTA execution" },
        };

        struct DefaultHash {
            const char* digest;
            const wchar_t* description;
        };

        const DefaultHash DEFAULT_HASHES[] = {
            { "275a021bbfb6489e54d471899f7db9d1663fc695ec2fe2a2c4538aabf651fd0f", L"EICAR-Test-File" },
        };

        bool ParseKind(const std::string& text, SignatureKind& kind) {
            std::string value = Utils::ToLower(Utils::Trim(text));
            if (value == "name") kind = SignatureKind::NAME_SUBSTRING;
            else if (value == "hash") kind = SignatureKind::HASH_EXACT;
            else return false;
            return true;
        }

        bool ParseCategory(const std::string& text, SignatureCategory& category) {
            std::string value = Utils::ToLower(Utils::Trim(text));
            if (value == "process") category = SignatureCategory::PROCESS;
            else if (value == "file") category = SignatureCategory::FILE_NAME;
            else if (value == "adware") category = SignatureCategory::ADWARE;
            else if (value == "registry") category = SignatureCategory::REGISTRY;
            else return false;
            return true;
        }

        bool IsHexDigest(const std::string& text) {
            if (text.size() != 64) return false;
            for (char c : text) {
                bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
                if (!hex) return false;
            }
            return true;
        }

    } // namespace

    void SignatureStore::LoadDefaults() {
        for (const auto& entry : DEFAULT_NAME_SIGNATURES) {
            Signature signature;
            signature.kind = SignatureKind::NAME_SUBSTRING;
            signature.category = entry.category;
            signature.pattern = entry.pattern;
            signature.severity = entry.severity;
            signature.description = entry.description;
            AddSignature(signature);
        }

        for (const auto& entry : DEFAULT_HASHES) {
            Signature signature;
            signature.kind = SignatureKind::HASH_EXACT;
            signature.category = SignatureCategory::FILE_HASH;
            signature.pattern = Utils::FromUtf8(entry.digest);
            signature.severity = ThreatSeverity::CRITICAL;
            signature.description = entry.description;
            AddSignature(signature);
        }
    }

    bool SignatureStore::ParseSeverity(const std::string& text, ThreatSeverity& severity) {
        std::string value = Utils::ToLower(Utils::Trim(text));
        if (value == "low" || value == "0") severity = ThreatSeverity::LOW;
        else if (value == "medium" || value == "1") severity = ThreatSeverity::MEDIUM;
        else if (value == "high" || value == "2") severity = ThreatSeverity::HIGH;
        else if (value == "critical" || value == "3") severity = ThreatSeverity::CRITICAL;
        else return false;
        return true;
    }

    bool SignatureStore::ParseLine(const std::string& line, Signature& signature) {
        // kind|category|pattern|severity|description
        auto fields = Utils::Split(line, '|');
        if (fields.size() < 4) return false;

        if (!ParseKind(fields[0], signature.kind)) return false;

        std::string pattern = Utils::ToLower(Utils::Trim(fields[2]));
        if (pattern.empty()) return false;

        if (signature.kind == SignatureKind::HASH_EXACT) {
            if (!IsHexDigest(pattern)) return false;
            signature.category = SignatureCategory::FILE_HASH;
        } else if (!ParseCategory(fields[1], signature.category)) {
            return false;
        }

        if (!ParseSeverity(fields[3], signature.severity)) return false;

        signature.pattern = Utils::FromUtf8(pattern);

        // The description may itself contain '|'
        std::string description;
        for (size_t i = 4; i < fields.size(); i++) {
            if (i > 4) description += "|";
            description += fields[i];
        }
        signature.description = Utils::FromUtf8(Utils::Trim(description));
        return true;
    }

    bool SignatureStore::LoadFromFile(const std::wstring& path, SignatureLoadStats* stats) {
        std::ifstream file{ fs::path(path) };
        if (!file.is_open()) {
            LogWarning("SignatureStore", L"Cannot open definitions file: " + path);
            return false;
        }

        SignatureLoadStats local;
        std::string line;
        size_t lineNumber = 0;
        while (std::getline(file, line)) {
            lineNumber++;
            if (!line.empty() && line.back() == '\r') line.pop_back();

            std::string trimmed = Utils::Trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            Signature signature;
            if (ParseLine(trimmed, signature) && AddSignature(signature)) {
                local.loaded++;
            } else {
                local.rejected++;
                LogWarning("SignatureStore", L"Rejected definition at line " +
                    std::to_wstring(lineNumber) + L" of " + path);
            }
        }

        LogInfo("SignatureStore", L"Loaded " + std::to_wstring(local.loaded) +
            L" definitions from " + path);

        if (stats) *stats = local;
        return true;
    }

    bool SignatureStore::AddSignature(const Signature& signature) {
        if (signature.pattern.empty()) return false;

        Signature stored = signature;
        stored.pattern = Utils::ToLower(signature.pattern);

        std::string digest;
        if (stored.kind == SignatureKind::HASH_EXACT) {
            digest = Utils::ToUtf8(stored.pattern);
            if (!IsHexDigest(digest)) return false;
            stored.category = SignatureCategory::FILE_HASH;
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (!digest.empty()) m_hashes.insert(digest);
        m_signatures.push_back(std::move(stored));
        return true;
    }

    void SignatureStore::Clear() {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_signatures.clear();
        m_hashes.clear();
    }

    std::optional<Signature> SignatureStore::FirstMatch(SignatureCategory category,
        const std::wstring& lowered) const {
        for (const auto& signature : m_signatures) {
            if (signature.kind != SignatureKind::NAME_SUBSTRING) continue;
            if (signature.category != category) continue;
            if (Utils::Contains(lowered, signature.pattern)) {
                return signature;
            }
        }
        return std::nullopt;
    }

    std::optional<Signature> SignatureStore::MatchProcess(const std::wstring& processName) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return FirstMatch(SignatureCategory::PROCESS, Utils::ToLower(processName));
    }

    std::optional<Signature> SignatureStore::MatchFileName(const std::wstring& text) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return FirstMatch(SignatureCategory::FILE_NAME, Utils::ToLower(text));
    }

    std::optional<Signature> SignatureStore::MatchAdwareMarker(const std::wstring& text) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return FirstMatch(SignatureCategory::ADWARE, Utils::ToLower(text));
    }

    std::optional<Signature> SignatureStore::MatchRegistryValue(const std::wstring& valueText) const {
        std::wstring lowered = Utils::ToLower(valueText);

        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto match = FirstMatch(SignatureCategory::REGISTRY, lowered);
        if (match) return match;
        return FirstMatch(SignatureCategory::FILE_NAME, lowered);
    }

    bool SignatureStore::MatchHash(const std::string& digest) const {
        if (digest.empty()) return false;
        std::string lowered = Utils::ToLower(digest);

        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_hashes.find(lowered) != m_hashes.end();
    }

    size_t SignatureStore::GetSignatureCount() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_signatures.size();
    }

    size_t SignatureStore::GetHashCount() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_hashes.size();
    }

} // namespace UnifiedScan
