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

#include <expected>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace fsflow::utils
{
/**
 * @brief Pick the value a task actually uses for a parameter
 *
 * @param[in] argument value passed to run()
 * @param[in] stored value set at construction
 *
 * @return argument if it is not empty, otherwise stored
 */
[[nodiscard]] std::string_view resolve(const std::string_view argument,
                                       const std::string_view stored) noexcept;

/**
 * @brief Final location of an entry moved or copied to target
 *
 * @return target / basename(source) if target is an existing directory,
 * otherwise target
 */
[[nodiscard]] std::filesystem::path resolve_target(const std::filesystem::path& source,
                                                   const std::filesystem::path& target) noexcept;

[[nodiscard]] bool is_root(const std::filesystem::path& path) noexcept;

// Copy a single file, overwriting destination, keeping permissions and mtime
[[nodiscard]] std::expected<void, std::error_code>
copy_file(const std::filesystem::path& source, const std::filesystem::path& destination) noexcept;

// Recursive directory copy, destination must not exist
[[nodiscard]] std::expected<void, std::error_code>
copy_tree(const std::filesystem::path& source, const std::filesystem::path& destination) noexcept;

// rename(2) on the same device, copy then remove across devices
[[nodiscard]] std::expected<void, std::error_code>
move_entry(const std::filesystem::path& source, const std::filesystem::path& destination) noexcept;

// Copy source to destination, then remove source. Used when rename(2) cannot
// cross devices, symbolic links are recreated rather than followed.
[[nodiscard]] std::expected<void, std::error_code>
move_by_copy(const std::filesystem::path& source,
             const std::filesystem::path& destination) noexcept;

// Directories are removed recursively, anything else is unlinked
[[nodiscard]] std::expected<void, std::error_code>
remove_entry(const std::filesystem::path& path) noexcept;
} // namespace fsflow::utils
