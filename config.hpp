#pragma once

#include <filesystem>
#include <string>

#include "uninstaller.hpp"


namespace Config
{
    struct Config
    {
        const std::filesystem::path manifest;
        const std::string destDir;
        const MissingFilePolicy missingFilePolicy;
        const bool dryRun;
    };

    Config readParams(int argc, char** argv);
}
