#include <sstream>
#include <stdexcept>
#include <boost/program_options.hpp>

#include "config.hpp"
#include "utils.hpp"


namespace
{
    std::string readDestDir(const boost::program_options::variable_value& destDirValue)
    {
        if (destDirValue.empty() == false)
            return destDirValue.as<std::string>();

        return Utils::environmentValue("DESTDIR").value_or(std::string{});
    }
}


namespace Config
{
    Config readParams(int argc, char** argv)
    {
        namespace po = boost::program_options;

        po::options_description desc("Allowed options");
        desc.add_options()
            ("help", "produce help message")
            ("manifest", po::value<std::string>(), "path to install manifest (one installed file per line)")
            ("destdir", po::value<std::string>(), "prefix prepended to every manifest entry. Overrides DESTDIR environment variable")
            ("dry-run", "Only report files which would be removed")
            ("strict", "Treat files listed in manifest but missing on disk as an error");

        po::variables_map vm;
        po::positional_options_description p;
        p.add("manifest", 1);
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::stringstream help;
            help << desc;
            throw std::runtime_error(help.str());
        }

        if (vm.count("manifest") == 0)
            throw std::invalid_argument("Provide install manifest");

        const std::filesystem::path manifest = vm["manifest"].as<std::string>();
        const auto destDir = readDestDir(vm["destdir"]);
        const bool dryRun = vm.count("dry-run") > 0;
        const bool strict = vm.count("strict") > 0;

        return Config {
            .manifest = manifest,
            .destDir = destDir,
            .missingFilePolicy = strict? MissingFilePolicy::Fail: MissingFilePolicy::Ignore,
            .dryRun = dryRun,
        };
    }
}
