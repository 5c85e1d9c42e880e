/** @file test/main.cpp */

#include "file.hpp"
#include "log.hpp"
#include "src/defines.hpp"

#include <gtest/gtest.h>

int main(int arg_c, char* argv[])
{
	testing::InitGoogleTest(&arg_c, argv);

	auto qh_stdout = quill::stdout_handler();
	qh_stdout->set_pattern(
		QUILL_STRING("%(ascii_time) [%(thread)] %(filename):%(lineno) "
					 "%(level_name): %(message)"),
		"%H:%M:%S");
	hxg::log_init({ qh_stdout });

	HXG_LOGF(
		"Hexgrid version {}.{}.{}", Hexgrid_VERSION_MAJOR, Hexgrid_VERSION_MINOR,
		Hexgrid_VERSION_PATCH);

	hxg::vfs_init(argv[0]);
	const int ret = RUN_ALL_TESTS();
	hxg::vfs_deinit();
	quill::flush();
	return ret;
}
