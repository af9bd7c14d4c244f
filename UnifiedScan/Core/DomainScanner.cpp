/**
 * DomainScanner.cpp - Helpers shared by the domain scanners
 */

#include "DomainScanner.h"
#include "../Utils/StringUtils.h"
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace UnifiedScan {

    bool DomainScanner::ReadTextFile(const std::wstring& path, size_t maxBytes, std::wstring& text) {
        std::ifstream file(fs::path(path), std::ios::binary);
        if (!file.is_open()) return false;

        std::vector<char> buffer(maxBytes);
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.bad()) return false;

        text = Utils::DecodeText(std::string(buffer.data(), static_cast<size_t>(file.gcount())));
        return true;
    }

    std::wstring FormatRegistryLocation(RegistryHive hive, const std::wstring& key, const std::wstring& valueName) {
        return std::wstring(ToString(hive)) + L"\\" + key + L"\\" + valueName;
    }

} // namespace UnifiedScan
