#pragma once

namespace tiergate::cli
{
	/** Exit status for a refused startup (paid tier requested but not licensed). */
	inline constexpr int kExitStartupRefused = 3;

	int run(int argc, char *argv[]);
}
