#pragma once

#include "ifile_remover.hpp"


class FileRemover: public IFileRemover
{
public:
    // With doRemoval == false entries are only inspected (dry run)
    explicit FileRemover(bool doRemoval) : m_remove(doRemoval) {}

    RemovalResult remove(const std::filesystem::path& path) const override;

private:
    const bool m_remove;
};
