/**
 * SignatureStore.h
 *
 * Known-bad process names, file-name patterns, adware markers, registry
 * patterns and SHA-256 digests.
 *
 * Name lookups are case-insensitive substring containment and walk the
 * signatures in declaration order: the first match wins, not the best.
 * Hash lookups are exact (case-insensitive hex).
 *
 * The store is filled before a scan starts and only read during it;
 * Match* calls take a shared lock and may run from several threads.
 */

#pragma once

#include "ThreatTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_set>
#include <shared_mutex>

namespace UnifiedScan {

    enum class SignatureKind { NAME_SUBSTRING, HASH_EXACT };

    // Which lookup a signature serves
    enum class SignatureCategory { PROCESS, FILE_NAME, ADWARE, REGISTRY, FILE_HASH };

    struct Signature {
        SignatureKind kind = SignatureKind::NAME_SUBSTRING;
        SignatureCategory category = SignatureCategory::FILE_NAME;
        std::wstring pattern;           // lower-case pattern or hex digest
        ThreatSeverity severity = ThreatSeverity::MEDIUM;
        std::wstring description;
    };

    struct SignatureLoadStats {
        size_t loaded = 0;
        size_t rejected = 0;
    };

    class SignatureStore {
    public:
        SignatureStore() = default;

        SignatureStore(const SignatureStore&) = delete;
        SignatureStore& operator=(const SignatureStore&) = delete;

        // Built-in definitions
        void LoadDefaults();

        /**
         * Loads "kind|category|pattern|severity|description" lines.
         * Malformed lines are counted in stats.rejected and skipped.
         * @return false only if the file cannot be opened
         */
        bool LoadFromFile(const std::wstring& path, SignatureLoadStats* stats = nullptr);

        bool AddSignature(const Signature& signature);
        void Clear();

        std::optional<Signature> MatchProcess(const std::wstring& processName) const;
        std::optional<Signature> MatchFileName(const std::wstring& text) const;
        std::optional<Signature> MatchAdwareMarker(const std::wstring& text) const;
        std::optional<Signature> MatchRegistryValue(const std::wstring& valueText) const;
        bool MatchHash(const std::string& digest) const;

        size_t GetSignatureCount() const;
        size_t GetHashCount() const;

        static bool ParseLine(const std::string& line, Signature& signature);
        static bool ParseSeverity(const std::string& text, ThreatSeverity& severity);

    private:
        std::optional<Signature> FirstMatch(SignatureCategory category, const std::wstring& lowered) const;

        std::vector<Signature> m_signatures;
        std::unordered_set<std::string> m_hashes;
        mutable std::shared_mutex m_mutex;
    };

} // namespace UnifiedScan
