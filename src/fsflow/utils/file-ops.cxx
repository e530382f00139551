/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include <expected>
#include <filesystem>
#include <ranges>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <ztd/ztd.hxx>

#include "fsflow/utils/file-ops.hxx"

std::string_view
fsflow::utils::resolve(const std::string_view argument, const std::string_view stored) noexcept
{
    if (!argument.empty())
    {
        return argument;
    }
    return stored;
}

std::filesystem::path
fsflow::utils::resolve_target(const std::filesystem::path& source,
                              const std::filesystem::path& target) noexcept
{
    std::error_code ec;
    if (!std::filesystem::is_directory(target, ec))
    {
        return target;
    }

    auto name = source.filename();
    if (name.empty())
    { // source has a trailing separator
        name = source.parent_path().filename();
    }
    return target / name;
}

bool
fsflow::utils::is_root(const std::filesystem::path& path) noexcept
{
    return path.lexically_normal() == "/";
}

static std::expected<void, std::error_code>
copy_attributes(const std::filesystem::path& source,
                const std::filesystem::path& destination) noexcept
{
    std::error_code ec;

    const auto status = std::filesystem::status(source, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }
    std::filesystem::permissions(destination, status.permissions(), ec);
    if (ec)
    {
        return std::unexpected(ec);
    }

    const auto mtime = std::filesystem::last_write_time(source, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }
    std::filesystem::last_write_time(destination, mtime, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }

    return {};
}

std::expected<void, std::error_code>
fsflow::utils::copy_file(const std::filesystem::path& source,
                         const std::filesystem::path& destination) noexcept
{
    std::error_code ec;
    std::filesystem::copy_file(source,
                               destination,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec)
    {
        return std::unexpected(ec);
    }

    return copy_attributes(source, destination);
}

static bool
is_subpath(const std::filesystem::path& path, const std::filesystem::path& base) noexcept
{
    std::error_code ec;
    const auto abs_path = std::filesystem::absolute(path, ec).lexically_normal();
    const auto abs_base = std::filesystem::absolute(base, ec).lexically_normal();
    if (ec)
    {
        return false;
    }

    const auto relative = abs_path.lexically_relative(abs_base);
    return !relative.empty() && *relative.begin() != "..";
}

std::expected<void, std::error_code>
fsflow::utils::copy_tree(const std::filesystem::path& source,
                         const std::filesystem::path& destination) noexcept
{
    std::error_code ec;

    const auto source_status = std::filesystem::status(source, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }
    if (!std::filesystem::exists(source_status))
    {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (!std::filesystem::is_directory(source_status))
    {
        return std::unexpected(std::make_error_code(std::errc::not_a_directory));
    }

    if (std::filesystem::exists(std::filesystem::symlink_status(destination, ec)))
    {
        return std::unexpected(std::make_error_code(std::errc::file_exists));
    }

    if (is_subpath(destination, source))
    {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    std::filesystem::create_directory(destination, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }

    // directory attributes are applied after their contents are written,
    // a read-only source directory would otherwise block the copy
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> directories;
    directories.emplace_back(source, destination);

    auto it = std::filesystem::recursive_directory_iterator(source, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            return std::unexpected(ec);
        }

        const auto& entry = *it;
        const auto target = destination / entry.path().lexically_relative(source);

        const auto status = entry.symlink_status(ec);
        if (ec)
        {
            return std::unexpected(ec);
        }

        if (std::filesystem::is_symlink(status))
        {
            std::filesystem::copy_symlink(entry.path(), target, ec);
        }
        else if (std::filesystem::is_directory(status))
        {
            std::filesystem::create_directory(target, ec);
            directories.emplace_back(entry.path(), target);
        }
        else
        {
            const auto result = fsflow::utils::copy_file(entry.path(), target);
            if (!result)
            {
                return result;
            }
        }

        if (ec)
        {
            return std::unexpected(ec);
        }
    }
    if (ec)
    {
        return std::unexpected(ec);
    }

    for (const auto& [src, dst] : directories | std::views::reverse)
    {
        const auto result = copy_attributes(src, dst);
        if (!result)
        {
            return result;
        }
    }

    return {};
}

std::expected<void, std::error_code>
fsflow::utils::move_entry(const std::filesystem::path& source,
                          const std::filesystem::path& destination) noexcept
{
    auto parent = destination.parent_path();
    if (parent.empty())
    {
        parent = ".";
    }

    const auto src_stat = ztd::lstat::create(source);
    const auto dest_stat = ztd::stat::create(parent);
    const bool cross_device = src_stat && dest_stat && (src_stat->dev() != dest_stat->dev());

    std::error_code ec;

    if (!cross_device)
    {
        std::filesystem::rename(source, destination, ec);
        if (ec)
        {
            return std::unexpected(ec);
        }
        return {};
    }

    return fsflow::utils::move_by_copy(source, destination);
}

std::expected<void, std::error_code>
fsflow::utils::move_by_copy(const std::filesystem::path& source,
                            const std::filesystem::path& destination) noexcept
{
    std::error_code ec;

    const auto status = std::filesystem::symlink_status(source, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }

    if (std::filesystem::is_directory(status))
    {
        const auto result = fsflow::utils::copy_tree(source, destination);
        if (!result)
        {
            return result;
        }
    }
    else if (std::filesystem::is_symlink(status))
    {
        std::error_code destination_ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(destination, destination_ec)))
        {
            std::filesystem::remove(destination, ec);
            if (ec)
            {
                return std::unexpected(ec);
            }
        }
        std::filesystem::copy_symlink(source, destination, ec);
        if (ec)
        {
            return std::unexpected(ec);
        }
    }
    else
    {
        const auto result = fsflow::utils::copy_file(source, destination);
        if (!result)
        {
            return result;
        }
    }

    std::filesystem::remove_all(source, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }

    return {};
}

std::expected<void, std::error_code>
fsflow::utils::remove_entry(const std::filesystem::path& path) noexcept
{
    std::error_code ec;

    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec)
    {
        return std::unexpected(ec);
    }
    if (!std::filesystem::exists(status))
    {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    if (std::filesystem::is_directory(status))
    {
        std::filesystem::remove_all(path, ec);
    }
    else
    {
        std::filesystem::remove(path, ec);
    }

    if (ec)
    {
        return std::unexpected(ec);
    }

    return {};
}
