/**
 * @file preproc.hpp
 * @brief General-purpose preprocessor macros.
 */

#pragma once

/// For types owning a handle which must be released exactly once.
#define HXG_DELETE_COPIERS_AND_MOVERS(type)    \
	type(const type&) = delete;                \
	type(type&&) = delete;                     \
	type& operator=(const type&) = delete;     \
	type& operator=(type&&) = delete;
