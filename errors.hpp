#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>


class ManifestNotFound: public std::runtime_error
{
public:
    explicit ManifestNotFound(const std::filesystem::path& manifest);

    const std::filesystem::path& manifest() const
    {
        return m_manifest;
    }

private:
    std::filesystem::path m_manifest;
};


class RemovalFailed: public std::runtime_error
{
public:
    RemovalFailed(const std::filesystem::path& target, size_t position, size_t total, int code, const std::string& reason);

    const std::filesystem::path& target() const
    {
        return m_target;
    }

    // 1-based index of the failing entry in the manifest
    size_t position() const
    {
        return m_position;
    }

    size_t total() const
    {
        return m_total;
    }

    int code() const
    {
        return m_code;
    }

private:
    std::filesystem::path m_target;
    size_t m_position;
    size_t m_total;
    int m_code;
};
