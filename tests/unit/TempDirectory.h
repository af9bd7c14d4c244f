/**
 * TempDirectory.h - Scratch directory for file system tests, removed on destruction
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

namespace UnifiedScan {
namespace Testing {

    class TempDirectory {
    public:
        TempDirectory() {
            std::random_device rd;
            std::ostringstream name;
            name << "unifiedscan_test_" << std::hex << rd() << rd();
            m_path = std::filesystem::temp_directory_path() / name.str();
            std::filesystem::create_directories(m_path);
        }

        ~TempDirectory() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        TempDirectory(const TempDirectory&) = delete;
        TempDirectory& operator=(const TempDirectory&) = delete;

        const std::filesystem::path& Path() const { return m_path; }
        std::wstring WPath() const { return m_path.wstring(); }

        // Creates parent directories as needed; returns the full path
        std::filesystem::path WriteFile(const std::filesystem::path& relative, const std::string& content) const {
            std::filesystem::path full = m_path / relative;
            std::filesystem::create_directories(full.parent_path());
            std::ofstream out(full, std::ios::binary | std::ios::trunc);
            out << content;
            return full;
        }

        std::filesystem::path MakeDirectory(const std::filesystem::path& relative) const {
            std::filesystem::path full = m_path / relative;
            std::filesystem::create_directories(full);
            return full;
        }

        static std::string ReadFile(const std::filesystem::path& path) {
            std::ifstream in(path, std::ios::binary);
            std::ostringstream content;
            content << in.rdbuf();
            return content.str();
        }

    private:
        std::filesystem::path m_path;
    };

} // namespace Testing
} // namespace UnifiedScan
