
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include "config.hpp"
#include "errors.hpp"
#include "file_remover.hpp"
#include "uninstaller.hpp"
#include "utils.hpp"


int main(int argc, char** argv)
{
    spdlog::cfg::load_env_levels();

    try
    {
        const auto config = Config::readParams(argc, argv);

        if (config.dryRun)
            spdlog::info("Dry run, no files will be removed");

        if (config.destDir.empty() == false)
            spdlog::debug("Using destination directory prefix \"{}\"", config.destDir);

        const FileRemover fileRemover(config.dryRun == false);
        const Uninstaller uninstaller(fileRemover, config.destDir, config.missingFilePolicy);

        const auto report = Utils::measureTimeWithMessage("Uninstalling files listed in " + config.manifest.string(), uninstall, config.manifest, uninstaller);
        spdlog::info(summary(report, config.dryRun));
    }
    catch (const ManifestNotFound& error)
    {
        spdlog::error(error.what());
        return 1;
    }
    catch (const RemovalFailed& error)
    {
        spdlog::error(error.what());
        return 1;
    }
    catch (const std::runtime_error& error)
    {
        std::cout << error.what() << "\n";
        return 1;
    }
    catch (const std::invalid_argument& error)
    {
        spdlog::error(error.what());
        return 1;
    }
    catch (const std::logic_error& error)
    {
        spdlog::error("Error: {}", error.what());
        return 1;
    }
    catch(...)
    {
        spdlog::error("Fail: Unhandled exception");
        return 1;
    }

    return 0;
}
