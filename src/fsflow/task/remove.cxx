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

fsflow::remove::remove(const std::string_view remove_path) noexcept
    : task("remove"), remove_path_(remove_path)
{
}

const std::string&
fsflow::remove::remove_path() const noexcept
{
    return this->remove_path_;
}

std::expected<void, std::error_code>
fsflow::remove::run(const std::string_view remove_path) noexcept
{
    const auto path =
        require(remove_path, this->remove_path_, fsflow::error_code::missing_remove_path);
    if (!path)
    {
        return this->failure(path.error());
    }

    if (fsflow::utils::is_root(*path))
    {
        return this->failure(fsflow::error_code::root_preserve);
    }

    logger::debug<logger::domain::task>("{}: {}", this->name(), path->string());

    const auto result = fsflow::utils::remove_entry(*path);
    if (!result)
    {
        return this->failure(result.error());
    }

    this->success(*path);
    return {};
}
