#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(FileType, File, Directory, Symlink, Other)

    struct DirectoryEntry
    {
        std::string name{};
        std::string path{};
        FileType type{FileType::File};
        std::uint64_t size{0};
        std::optional<std::int64_t> modified{std::nullopt};
        std::optional<std::string> permissions{std::nullopt};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
    };
    BOOST_DESCRIBE_STRUCT(DirectoryEntry, (), (name, path, type, size, modified, permissions))
}
