/**
 * @file utils.cpp
 * @brief Virtual filesystem helpers, logging setup, and static definitions.
 */

#include "file.hpp"
#include "log.hpp"

#include <fmt/format.h>
#include <physfs.h>
#include <stdexcept>

namespace stdfs = std::filesystem;

[[nodiscard]] static const char* physfs_last_error() noexcept
{
	return PHYSFS_getErrorByCode(PHYSFS_getLastErrorCode());
}

void hxg::vfs_init(const std::string& argv0)
{
	if (PHYSFS_isInit() != 0) return;

	if (PHYSFS_init(argv0.c_str()) == 0)
	{
		throw std::runtime_error(
			fmt::format("Save file system unavailable: {}", physfs_last_error()));
	}
}

void hxg::vfs_deinit()
{
	if (PHYSFS_isInit() == 0) return;

	if (PHYSFS_deinit() == 0)
		HXG_WARNF("Save file system did not shut down cleanly: {}", physfs_last_error());
}

void hxg::vfs_mount(const stdfs::path& dir, const stdfs::path& mount_point)
{
	// Appended, so directories mounted earlier take precedence
	if (PHYSFS_mount(dir.c_str(), mount_point.c_str(), 1) != 0)
	{
		HXG_LOGF("Reading saves from {} at \"{}\"", dir.string(), mount_point.string());
		return;
	}

	HXG_ERRF(
		"Cannot read saves from {} at \"{}\": {}", dir.string(), mount_point.string(),
		physfs_last_error());
}

void hxg::vfs_set_write_dir(const stdfs::path& dir)
{
	if (PHYSFS_setWriteDir(dir.c_str()) != 0)
	{
		HXG_DEBUGF("Writing saves to {}", dir.string());
		return;
	}

	HXG_ERRF("Cannot write saves to {}: {}", dir.string(), physfs_last_error());
}

bool hxg::vfs_exists(const stdfs::path& path) noexcept
{
	return PHYSFS_exists(path.c_str()) != 0;
}

// vfs_writer //////////////////////////////////////////////////////////////////

hxg::vfs_writer::vfs_writer(const stdfs::path& p) : path(p)
{
	handle = PHYSFS_openWrite(path.c_str());

	if (handle == nullptr)
	{
		throw std::runtime_error(fmt::format(
			"Failed to open file for write: {}\n\t{}", path.string(),
			physfs_last_error()));
	}
}

hxg::vfs_writer::~vfs_writer() noexcept
{
	if (PHYSFS_close(handle) == 0)
	{
		HXG_ERRF(
			"Failed to close virtual file handle: {}\n\t{}", path.string(),
			physfs_last_error());
	}
}

void hxg::vfs_writer::write_i32(int32_t val)
{
	if (PHYSFS_writeSLE32(handle, static_cast<PHYSFS_sint32>(val)) == 0)
	{
		throw std::runtime_error(fmt::format(
			"Error while writing file: {}\n\t{}", path.string(), physfs_last_error()));
	}
}

// vfs_reader //////////////////////////////////////////////////////////////////

hxg::vfs_reader::vfs_reader(const stdfs::path& p) : path(p)
{
	PHYSFS_Stat stat = {};

	if (PHYSFS_stat(path.c_str(), &stat) == 0)
		throw std::runtime_error(fmt::format("No such save file: {}", path.string()));

	if (stat.filetype != PHYSFS_FILETYPE_REGULAR)
		throw std::runtime_error(fmt::format("Not a save file: {}", path.string()));

	handle = PHYSFS_openRead(path.c_str());

	if (handle == nullptr)
	{
		throw std::runtime_error(fmt::format(
			"Failed to open file for read: {}\n\t{}", path.string(),
			physfs_last_error()));
	}
}

hxg::vfs_reader::~vfs_reader() noexcept
{
	if (PHYSFS_close(handle) == 0)
	{
		HXG_ERRF(
			"Failed to close virtual file handle: {}\n\t{}", path.string(),
			physfs_last_error());
	}
}

int32_t hxg::vfs_reader::read_i32()
{
	PHYSFS_sint32 ret = 0;

	if (PHYSFS_readSLE32(handle, &ret) == 0)
	{
		throw std::runtime_error(fmt::format(
			"Incomplete read of file: {}\n\t{}", path.string(), physfs_last_error()));
	}

	return static_cast<int32_t>(ret);
}

bool hxg::vfs_reader::eof() const noexcept { return PHYSFS_eof(handle) != 0; }

// Logging /////////////////////////////////////////////////////////////////////

quill::Logger* hxg::qlog = nullptr;

void hxg::log_init(std::initializer_list<quill::Handler*> handlers)
{
#ifdef _WIN32
	quill::init_signal_handler();
#endif

	quill::enable_console_colours();
	quill::start(true);
	quill::preallocate();

	qlog = quill::create_logger("hxg_logger", handlers);
	qlog->set_log_level(quill::LogLevel::Debug);
}
