#include <fmt/format.h>

#include "errors.hpp"


ManifestNotFound::ManifestNotFound(const std::filesystem::path& manifest)
    : std::runtime_error(fmt::format("Cannot find install manifest: \"{}\"", manifest.string()))
    , m_manifest(manifest)
{

}


RemovalFailed::RemovalFailed(const std::filesystem::path& target, size_t position, size_t total, int code, const std::string& reason)
    : std::runtime_error(fmt::format("Problem when removing \"{}\" (file {} of {}): {}", target.string(), position, total, reason))
    , m_target(target)
    , m_position(position)
    , m_total(total)
    , m_code(code)
{

}
