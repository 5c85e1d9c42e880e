/**
 * @file log.hpp
 * @brief Quill logger for the library's setup and file paths.
 */

#pragma once

#include <initializer_list>
#include <quill/Quill.h>

namespace hxg
{
	/// Null until `log_init()` has been called; the `HXG_*` macros are no-ops
	/// until then, so the library can be used without any logging set up.
	extern quill::Logger* qlog;

	/**
	 * @brief Start Quill's backend and create `qlog` over the given handlers.
	 * @note Call at most once per process.
	 */
	void log_init(std::initializer_list<quill::Handler*>);
} // namespace hxg

#define HXG_LOG_IF_READY(level_macro, msg, ...)         \
	do                                                  \
	{                                                   \
		if (hxg::qlog != nullptr)                       \
			level_macro(hxg::qlog, msg, ##__VA_ARGS__); \
	} while (false)

/** @brief {fmt}-style info record, e.g. mounts and version banners. */
#define HXG_LOGF(msg, ...) HXG_LOG_IF_READY(LOG_INFO, msg, ##__VA_ARGS__)
/** @brief {fmt}-style warning; the operation went ahead regardless. */
#define HXG_WARNF(msg, ...) HXG_LOG_IF_READY(LOG_WARNING, msg, ##__VA_ARGS__)
/** @brief {fmt}-style error; the operation failed but the caller can carry on. */
#define HXG_ERRF(msg, ...) HXG_LOG_IF_READY(LOG_ERROR, msg, ##__VA_ARGS__)

#ifndef NDEBUG

/**
 * @brief {fmt}-style debug record.
 * @note Preprocessed away when `NDEBUG` is set (i.e., in the Release build).
 */
#define HXG_DEBUGF(msg, ...) HXG_LOG_IF_READY(LOG_DEBUG, msg, ##__VA_ARGS__)

#else

#define HXG_DEBUGF(msg, ...)

#endif
