/**
 * StringUtils.cpp - Text helpers shared by the scanners
 */

#include "StringUtils.h"
#include <algorithm>
#include <cctype>
#include <cwctype>

namespace UnifiedScan {
namespace Utils {

    std::wstring ToLower(std::wstring text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](wchar_t c) { return static_cast<wchar_t>(std::towlower(static_cast<wint_t>(c))); });
        return text;
    }

    std::string ToLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    bool Contains(const std::wstring& haystack, const std::wstring& needle) {
        return haystack.find(needle) != std::wstring::npos;
    }

    bool StartsWith(const std::wstring& text, const std::wstring& prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    bool EndsWith(const std::wstring& text, const std::wstring& suffix) {
        return text.size() >= suffix.size() &&
            text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::wstring Trim(const std::wstring& text) {
        size_t first = 0;
        while (first < text.size() && std::iswspace(static_cast<wint_t>(text[first]))) first++;
        size_t last = text.size();
        while (last > first && std::iswspace(static_cast<wint_t>(text[last - 1]))) last--;
        return text.substr(first, last - first);
    }

    std::string Trim(const std::string& text) {
        size_t first = 0;
        while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) first++;
        size_t last = text.size();
        while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) last--;
        return text.substr(first, last - first);
    }

    std::vector<std::wstring> Split(const std::wstring& text, wchar_t separator) {
        std::vector<std::wstring> parts;
        size_t start = 0;
        while (true) {
            size_t pos = text.find(separator, start);
            if (pos == std::wstring::npos) {
                parts.push_back(text.substr(start));
                break;
            }
            parts.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    std::vector<std::string> Split(const std::string& text, char separator) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t pos = text.find(separator, start);
            if (pos == std::string::npos) {
                parts.push_back(text.substr(start));
                break;
            }
            parts.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    namespace {

        void AppendCodePoint(std::wstring& out, uint32_t cp) {
            if (sizeof(wchar_t) == 2 && cp > 0xFFFF) {
                cp -= 0x10000;
                out.push_back(static_cast<wchar_t>(0xD800 + (cp >> 10)));
                out.push_back(static_cast<wchar_t>(0xDC00 + (cp & 0x3FF)));
            } else {
                out.push_back(static_cast<wchar_t>(cp));
            }
        }

        std::wstring DecodeUtf16(const std::string& bytes, size_t offset, bool bigEndian) {
            std::wstring out;
            for (size_t i = offset; i + 1 < bytes.size(); i += 2) {
                uint8_t b0 = static_cast<uint8_t>(bytes[i]);
                uint8_t b1 = static_cast<uint8_t>(bytes[i + 1]);
                uint32_t unit = bigEndian ? ((b0 << 8) | b1) : ((b1 << 8) | b0);

                if (unit >= 0xD800 && unit <= 0xDBFF && i + 3 < bytes.size()) {
                    uint8_t c0 = static_cast<uint8_t>(bytes[i + 2]);
                    uint8_t c1 = static_cast<uint8_t>(bytes[i + 3]);
                    uint32_t low = bigEndian ? ((c0 << 8) | c1) : ((c1 << 8) | c0);
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        AppendCodePoint(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                        i += 2;
                        continue;
                    }
                }
                AppendCodePoint(out, unit);
            }
            return out;
        }

    } // namespace

    std::wstring FromUtf8(const std::string& text) {
        std::wstring out;
        out.reserve(text.size());

        size_t i = 0;
        while (i < text.size()) {
            uint8_t lead = static_cast<uint8_t>(text[i]);
            uint32_t cp = 0;
            size_t extra = 0;

            if (lead < 0x80) { cp = lead; }
            else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; extra = 1; }
            else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; extra = 2; }
            else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; extra = 3; }
            else {
                AppendCodePoint(out, 0xFFFD);
                i++;
                continue;
            }

            if (extra > 0 && i + extra >= text.size()) {
                AppendCodePoint(out, 0xFFFD);
                break;
            }

            bool valid = true;
            for (size_t k = 1; k <= extra; k++) {
                uint8_t next = static_cast<uint8_t>(text[i + k]);
                if ((next & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (next & 0x3F);
            }

            if (!valid) {
                AppendCodePoint(out, 0xFFFD);
                i++;
                continue;
            }

            AppendCodePoint(out, cp);
            i += extra + 1;
        }
        return out;
    }

    std::string ToUtf8(const std::wstring& text) {
        std::string out;
        out.reserve(text.size());

        for (size_t i = 0; i < text.size(); i++) {
            uint32_t cp = static_cast<uint32_t>(text[i]);

            if (sizeof(wchar_t) == 2 && cp >= 0xD800 && cp <= 0xDBFF && i + 1 < text.size()) {
                uint32_t low = static_cast<uint32_t>(text[i + 1]);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    i++;
                }
            }

            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }
        return out;
    }

    std::wstring DecodeText(const std::string& bytes) {
        if (bytes.size() >= 2) {
            uint8_t b0 = static_cast<uint8_t>(bytes[0]);
            uint8_t b1 = static_cast<uint8_t>(bytes[1]);
            if (b0 == 0xFF && b1 == 0xFE) return DecodeUtf16(bytes, 2, false);
            if (b0 == 0xFE && b1 == 0xFF) return DecodeUtf16(bytes, 2, true);
        }
        if (bytes.size() >= 3 &&
            static_cast<uint8_t>(bytes[0]) == 0xEF &&
            static_cast<uint8_t>(bytes[1]) == 0xBB &&
            static_cast<uint8_t>(bytes[2]) == 0xBF) {
            return FromUtf8(bytes.substr(3));
        }
        return FromUtf8(bytes);
    }

    std::wstring FormatCount(uint64_t value) {
        std::wstring digits = std::to_wstring(value);
        std::wstring out;
        int group = 0;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            if (group == 3) {
                out.push_back(L',');
                group = 0;
            }
            out.push_back(*it);
            group++;
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

} // namespace Utils
} // namespace UnifiedScan
