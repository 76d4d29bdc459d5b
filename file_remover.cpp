#include <system_error>

#include "file_remover.hpp"


namespace
{
    RemovalResult failure(const std::error_code& ec)
    {
        return RemovalResult{.status = RemovalResult::Status::Failed, .code = ec.value(), .message = ec.message()};
    }
}


RemovalResult FileRemover::remove(const std::filesystem::path& path) const
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);

    if (status.type() == std::filesystem::file_type::not_found)
        return RemovalResult{.status = RemovalResult::Status::AlreadyAbsent};

    if (ec)
        return failure(ec);

    if (status.type() == std::filesystem::file_type::directory)
        return failure(std::make_error_code(std::errc::is_a_directory));

    if (m_remove == false)
        return RemovalResult{.status = RemovalResult::Status::Removed};

    const bool removed = std::filesystem::remove(path, ec);

    if (ec)
        return failure(ec);

    // entry vanished between the status check and the removal
    if (removed == false)
        return RemovalResult{.status = RemovalResult::Status::AlreadyAbsent};

    return RemovalResult{.status = RemovalResult::Status::Removed};
}
