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
#include <string>
#include <string_view>
#include <system_error>

#include "fsflow/error.hxx"
#include "fsflow/task/task.hxx"
#include "fsflow/utils/file-ops.hxx"

#include "logger.hxx"

fsflow::copy::copy(const std::string_view source_path, const std::string_view target_path) noexcept
    : task("copy"), source_path_(source_path), target_path_(target_path)
{
}

const std::string&
fsflow::copy::source_path() const noexcept
{
    return this->source_path_;
}

const std::string&
fsflow::copy::target_path() const noexcept
{
    return this->target_path_;
}

std::expected<std::filesystem::path, std::error_code>
fsflow::copy::run(const std::string_view source_path, const std::string_view target_path) noexcept
{
    const auto source =
        require(source_path, this->source_path_, fsflow::error_code::missing_source_path);
    if (!source)
    {
        return this->failure(source.error());
    }

    const auto target =
        require(target_path, this->target_path_, fsflow::error_code::missing_target_path);
    if (!target)
    {
        return this->failure(target.error());
    }

    if (fsflow::utils::is_root(*source))
    {
        return this->failure(fsflow::error_code::root_preserve_source);
    }

    const auto destination = fsflow::utils::resolve_target(*source, *target);

    logger::debug<logger::domain::task>("{}: {} -> {}",
                                        this->name(),
                                        source->string(),
                                        destination.string());

    std::error_code ec;
    const bool is_directory = std::filesystem::is_directory(*source, ec);
    if (ec)
    {
        return this->failure(ec);
    }

    const auto result = is_directory ? fsflow::utils::copy_tree(*source, destination)
                                     : fsflow::utils::copy_file(*source, destination);
    if (!result)
    {
        return this->failure(result.error());
    }

    this->success(destination);
    return destination;
}
