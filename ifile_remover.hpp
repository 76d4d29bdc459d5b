#pragma once

#include <filesystem>
#include <string>


struct RemovalResult
{
    enum class Status
    {
        Removed,
        AlreadyAbsent,
        Failed,
    };

    Status status;
    int code = 0;
    std::string message;
};


struct IFileRemover
{
    virtual ~IFileRemover() = default;

    virtual RemovalResult remove(const std::filesystem::path& path) const = 0;
};
