#pragma once

#include <filesystem>
#include <span>
#include <string_view>
#include <vector>


class Manifest
{
public:
    Manifest() = default;
    explicit Manifest(std::vector<std::filesystem::path> entries);

    static Manifest read(const std::filesystem::path& manifestFile);
    static Manifest parse(std::string_view content);

    std::span<const std::filesystem::path> entries() const
    {
        return m_entries;
    }

    size_t size() const
    {
        return m_entries.size();
    }

    bool empty() const
    {
        return m_entries.empty();
    }

private:
    std::vector<std::filesystem::path> m_entries;
};
