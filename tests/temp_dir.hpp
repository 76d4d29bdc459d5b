#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>


class TempDir final
{
public:
    TempDir()
        : m_dir(std::filesystem::temp_directory_path() / ("unmanifest-test-" + std::to_string(std::random_device{}())))
    {
        std::filesystem::create_directories(m_dir);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir& operator=(const TempDir &) = delete;

    const std::filesystem::path& path() const
    {
        return m_dir;
    }

    std::filesystem::path createFile(std::string_view name, std::string_view content = "data") const
    {
        const auto filePath = m_dir / name;
        std::filesystem::create_directories(filePath.parent_path());

        std::ofstream out(filePath, std::ios::binary);
        out << content;

        return filePath;
    }

private:
    std::filesystem::path m_dir;
};
