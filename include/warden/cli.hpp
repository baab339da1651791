#pragma once

namespace warden::cli
{
	/** Entry point for the warden command line. Returns the process exit code. */
	int run(int argc, char *argv[]);
}
