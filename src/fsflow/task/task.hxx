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
#include <string>
#include <string_view>
#include <system_error>

#include <sigc++/sigc++.h>

#include "fsflow/error.hxx"

namespace fsflow
{
/**
 * A single workflow step wrapping one file system operation.
 *
 * Path parameters given at construction are defaults, a non-empty value
 * passed to run() overrides it for that call only. Every run() ends by
 * emitting either signal_success() or signal_failure().
 */
class task
{
  public:
    explicit task(const std::string_view name) noexcept;
    virtual ~task() noexcept = default;
    task(const task& other) noexcept = default;
    task(task&& other) noexcept = default;
    task& operator=(const task& other) noexcept = default;
    task& operator=(task&& other) noexcept = default;

    [[nodiscard]] const std::string& name() const noexcept;
    task& name(const std::string_view name) noexcept;

    [[nodiscard]] auto
    signal_success() noexcept
    {
        return this->signal_success_;
    }

    [[nodiscard]] auto
    signal_failure() noexcept
    {
        return this->signal_failure_;
    }

  protected:
    [[nodiscard]] static std::expected<std::filesystem::path, std::error_code>
    require(const std::string_view argument, const std::string_view stored,
            const fsflow::error_code missing) noexcept;

    void success(const std::filesystem::path& path) noexcept;
    [[nodiscard]] std::unexpected<std::error_code> failure(const std::error_code& ec) noexcept;

  private:
    std::string name_;

    sigc::signal<void(const std::filesystem::path&)> signal_success_;
    sigc::signal<void(const std::error_code&)> signal_failure_;
};

class move final : public task
{
  public:
    explicit move(const std::string_view source_path = "",
                  const std::string_view target_path = "") noexcept;

    [[nodiscard]] const std::string& source_path() const noexcept;
    [[nodiscard]] const std::string& target_path() const noexcept;

    /**
     * @brief Move a file or directory
     *
     * If target_path is an existing directory the entry is moved inside it,
     * keeping its name.
     *
     * @return the path the entry now lives at
     */
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    run(const std::string_view source_path = "", const std::string_view target_path = "") noexcept;

  private:
    std::string source_path_;
    std::string target_path_;
};

class copy final : public task
{
  public:
    explicit copy(const std::string_view source_path = "",
                  const std::string_view target_path = "") noexcept;

    [[nodiscard]] const std::string& source_path() const noexcept;
    [[nodiscard]] const std::string& target_path() const noexcept;

    /**
     * @brief Copy a file, or a directory recursively
     *
     * Same target rules as move. Copying a directory onto a path that already
     * exists fails with std::errc::file_exists, a file is overwritten.
     *
     * @return the path of the new copy
     */
    [[nodiscard]] std::expected<std::filesystem::path, std::error_code>
    run(const std::string_view source_path = "", const std::string_view target_path = "") noexcept;

  private:
    std::string source_path_;
    std::string target_path_;
};

class remove final : public task
{
  public:
    explicit remove(const std::string_view remove_path = "") noexcept;

    [[nodiscard]] const std::string& remove_path() const noexcept;

    [[nodiscard]] std::expected<void, std::error_code>
    run(const std::string_view remove_path = "") noexcept;

  private:
    std::string remove_path_;
};
} // namespace fsflow
