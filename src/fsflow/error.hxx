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

#pragma once

#include <system_error>
#include <type_traits>

namespace fsflow
{
enum class error_code
{
    none = 0,
    missing_source_path,
    missing_target_path,
    missing_remove_path,
    root_preserve_source,
    root_preserve,
};

/**
 * Broad classes of failure, matched with operator== against any std::error_code
 * returned by a task. Codes from fsflow::error_category() are invalid_input,
 * every other non-zero code came from the file system and is io_failure.
 */
enum class errc
{
    invalid_input = 1,
    io_failure,
};

[[nodiscard]] const std::error_category& error_category() noexcept;
[[nodiscard]] const std::error_category& error_condition_category() noexcept;

[[nodiscard]] inline std::error_code
make_error_code(fsflow::error_code e) noexcept
{
    return {static_cast<int>(e), fsflow::error_category()};
}

[[nodiscard]] inline std::error_condition
make_error_condition(fsflow::errc e) noexcept
{
    return {static_cast<int>(e), fsflow::error_condition_category()};
}
} // namespace fsflow

template<> struct std::is_error_code_enum<fsflow::error_code> : std::true_type
{
};

template<> struct std::is_error_condition_enum<fsflow::errc> : std::true_type
{
};
