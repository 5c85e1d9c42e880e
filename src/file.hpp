/**
 * @file file.hpp
 * @brief Virtual filesystem setup and binary file handles for save data.
 */

#pragma once

#include "preproc.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

struct PHYSFS_File;

namespace hxg
{
	/// @brief Start PhysicsFS; does nothing if it is already running.
	/// @throws `std::runtime_error` if PhysicsFS cannot start.
	void vfs_init(const std::string& argv0);
	void vfs_deinit();

	/// @brief Make the real directory `dir` readable under `mount_point`.
	void vfs_mount(
		const std::filesystem::path& dir, const std::filesystem::path& mount_point);

	/// @brief Set the real directory which `vfs_writer` creates files in.
	void vfs_set_write_dir(const std::filesystem::path&);

	[[nodiscard]] bool vfs_exists(const std::filesystem::path&) noexcept;

	/**
	 * @brief Write-only handle to a file under the VFS write directory.
	 *
	 * Integers are written little-endian regardless of the host, so save data
	 * is portable. Any short write throws `std::runtime_error`.
	 */
	class vfs_writer final
	{
		PHYSFS_File* handle = nullptr;
		std::filesystem::path path;

	public:
		/// @brief Creates or truncates the file at `path`.
		explicit vfs_writer(const std::filesystem::path& path);
		~vfs_writer() noexcept;
		HXG_DELETE_COPIERS_AND_MOVERS(vfs_writer)

		void write_i32(int32_t);
	};

	/**
	 * @brief Read-only handle to a file anywhere in the VFS search path.
	 *
	 * The counterpart to `vfs_writer`. Reading past the end of the file throws
	 * `std::runtime_error`; nothing is returned for a partial value.
	 */
	class vfs_reader final
	{
		PHYSFS_File* handle = nullptr;
		std::filesystem::path path;

	public:
		explicit vfs_reader(const std::filesystem::path& path);
		~vfs_reader() noexcept;
		HXG_DELETE_COPIERS_AND_MOVERS(vfs_reader)

		[[nodiscard]] int32_t read_i32();
		[[nodiscard]] bool eof() const noexcept;
	};
} // namespace hxg
