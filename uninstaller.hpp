#pragma once

#include <cstddef>
#include <string>

#include "ifile_remover.hpp"
#include "manifest.hpp"


enum class MissingFilePolicy
{
    Ignore,
    Fail,
};


struct UninstallReport
{
    size_t total = 0;
    size_t removed = 0;
    size_t alreadyAbsent = 0;
};


class Uninstaller
{
public:
    Uninstaller(const IFileRemover& fileRemover, std::string destDir, MissingFilePolicy missingFilePolicy = MissingFilePolicy::Ignore);

    // Removes entries in manifest order. Throws RemovalFailed on the first
    // entry which could not be removed, later entries are left untouched.
    UninstallReport uninstall(const Manifest& manifest) const;

    std::filesystem::path target(const std::filesystem::path& entry) const;

private:
    const IFileRemover& m_fileRemover;
    const std::string m_destDir;
    const MissingFilePolicy m_missingFilePolicy;
};


UninstallReport uninstall(const std::filesystem::path& manifestFile, const Uninstaller& uninstaller);

// One line summary of a finished run, worded for a dry run when nothing was deleted
std::string summary(const UninstallReport& report, bool dryRun);
