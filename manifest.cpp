#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "manifest.hpp"


Manifest::Manifest(std::vector<std::filesystem::path> entries)
    : m_entries(std::move(entries))
{

}


Manifest Manifest::read(const std::filesystem::path& manifestFile)
{
    std::error_code ec;
    // directories and other special entries can't be read as a manifest
    if (std::filesystem::is_regular_file(manifestFile, ec) == false)
        throw ManifestNotFound(manifestFile);

    std::ifstream input(manifestFile, std::ios::binary);
    if (input.is_open() == false)
        throw ManifestNotFound(manifestFile);

    std::ostringstream content;
    content << input.rdbuf();

    if (input.bad())
        throw ManifestNotFound(manifestFile);

    auto manifest = parse(content.str());

    spdlog::debug("Read {} entries from {}", manifest.size(), manifestFile.string());

    return manifest;
}


Manifest Manifest::parse(std::string_view content)
{
    std::vector<std::string> lines;
    const std::string input(content);
    boost::split(lines, input, boost::is_any_of("\n"));

    // blank lines carry no path, trailing newline produces one of them
    std::erase_if(lines, [](const std::string& line) { return line.empty(); });

    return Manifest(std::vector<std::filesystem::path>(lines.begin(), lines.end()));
}
