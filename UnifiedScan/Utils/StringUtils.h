/**
 * StringUtils.h - Text helpers shared by the scanners
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace UnifiedScan {
namespace Utils {

    std::wstring ToLower(std::wstring text);
    std::string ToLower(std::string text);

    bool Contains(const std::wstring& haystack, const std::wstring& needle);
    bool StartsWith(const std::wstring& text, const std::wstring& prefix);
    bool EndsWith(const std::wstring& text, const std::wstring& suffix);

    std::wstring Trim(const std::wstring& text);
    std::string Trim(const std::string& text);

    std::vector<std::wstring> Split(const std::wstring& text, wchar_t separator);
    std::vector<std::string> Split(const std::string& text, char separator);

    // UTF-8 <-> wide conversion. Invalid sequences become U+FFFD.
    std::wstring FromUtf8(const std::string& text);
    std::string ToUtf8(const std::wstring& text);

    /**
     * Decodes raw file bytes into text. Handles UTF-16LE/BE and UTF-8
     * byte order marks; anything else is treated as UTF-8.
     */
    std::wstring DecodeText(const std::string& bytes);

    std::wstring FormatCount(uint64_t value);

} // namespace Utils
} // namespace UnifiedScan
