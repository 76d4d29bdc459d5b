#include <cerrno>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "uninstaller.hpp"


Uninstaller::Uninstaller(const IFileRemover& fileRemover, std::string destDir, MissingFilePolicy missingFilePolicy)
    : m_fileRemover(fileRemover)
    , m_destDir(std::move(destDir))
    , m_missingFilePolicy(missingFilePolicy)
{

}


UninstallReport Uninstaller::uninstall(const Manifest& manifest) const
{
    const auto entries = manifest.entries();
    const auto total = entries.size();

    UninstallReport report;
    report.total = total;

    for (size_t i = 0; i < total; i++)
    {
        const auto path = target(entries[i]);
        spdlog::info("Uninstalling \"{}\"", path.string());

        const auto result = m_fileRemover.remove(path);

        switch (result.status)
        {
            case RemovalResult::Status::Removed:
                report.removed++;
                break;

            case RemovalResult::Status::AlreadyAbsent:
                if (m_missingFilePolicy == MissingFilePolicy::Fail)
                    throw RemovalFailed(path, i + 1, total, ENOENT, "file does not exist");

                spdlog::warn("File \"{}\" does not exist", path.string());
                report.alreadyAbsent++;
                break;

            case RemovalResult::Status::Failed:
                throw RemovalFailed(path, i + 1, total, result.code, result.message);
        }
    }

    return report;
}


std::filesystem::path Uninstaller::target(const std::filesystem::path& entry) const
{
    // DESTDIR is glued in front of the path as is, like $ENV{DESTDIR}${file} in cmake
    return std::filesystem::path(m_destDir + entry.string());
}


UninstallReport uninstall(const std::filesystem::path& manifestFile, const Uninstaller& uninstaller)
{
    const auto manifest = Manifest::read(manifestFile);
    return uninstaller.uninstall(manifest);
}


std::string summary(const UninstallReport& report, bool dryRun)
{
    return fmt::format("{} {} of {} files ({} already absent)",
                       dryRun? "Would uninstall": "Uninstalled",
                       report.removed,
                       report.total,
                       report.alreadyAbsent);
}
