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

fsflow::task::task(const std::string_view name) noexcept : name_(name) {}

const std::string&
fsflow::task::name() const noexcept
{
    return this->name_;
}

fsflow::task&
fsflow::task::name(const std::string_view name) noexcept
{
    this->name_ = name;
    return *this;
}

std::expected<std::filesystem::path, std::error_code>
fsflow::task::require(const std::string_view argument, const std::string_view stored,
                      const fsflow::error_code missing) noexcept
{
    const auto value = fsflow::utils::resolve(argument, stored);
    if (value.empty())
    {
        return std::unexpected(fsflow::make_error_code(missing));
    }
    return std::filesystem::path(value);
}

void
fsflow::task::success(const std::filesystem::path& path) noexcept
{
    logger::debug<logger::domain::task>("{}: finished {}", this->name_, path.string());

    this->signal_success().emit(path);
}

std::unexpected<std::error_code>
fsflow::task::failure(const std::error_code& ec) noexcept
{
    logger::error<logger::domain::task>("{}: {}", this->name_, ec.message());

    this->signal_failure().emit(ec);

    return std::unexpected(ec);
}
