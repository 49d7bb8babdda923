// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "io/Logger.hxx"

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <getopt.h>

static void
PrintUsage()
{
	puts("usage: jailspawn [options] [--] PROGRAM [ARGS...]\n\n"
	     "valid options:\n"
	     " -h, --help              help (this text)\n"
	     " -V, --version           show jailspawn version\n"
	     " -v, --verbose           be more verbose\n"
	     " -q, --quiet             be quiet\n"
	     " -f, --profile-file FILE load this profile configuration file\n"
	     " -l, --launcher PATH     use this launcher instead of firejail\n"
	     " -C, --chdir DIR         change the working directory\n"
	     " -n, --dry-run           print the launcher command line and exit\n"
	     " --jail-verbose          do not silence the launcher\n"
	     "\n"
	     );
}

[[noreturn]] [[gnu::format(printf, 2, 3)]]
static void
arg_error(const char *argv0, const char *fmt, ...)
{
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(1);
}

void
ParseCommandLine(JailSpawnCmdLine &cmdline, int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"profile-file", 1, nullptr, 'f'},
		{"launcher", 1, nullptr, 'l'},
		{"chdir", 1, nullptr, 'C'},
		{"dry-run", 0, nullptr, 'n'},
		{"jail-verbose", 0, nullptr, 'J'},
		{nullptr, 0, nullptr, 0}
	};

	unsigned verbose = 1;

	while (true) {
		int option_index = 0;

		/* '+': stop at the first non-option, which belongs to
		   the target program */
		const int ret = getopt_long(argc, argv, "+hVvqf:l:C:n",
					    long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'V':
			printf("jailspawn v%s\n", JAILSPAWN_VERSION);
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'f':
			cmdline.profile_files.push_back(optarg);
			break;

		case 'l':
			cmdline.launcher = optarg;
			break;

		case 'C':
			cmdline.chdir = optarg;
			break;

		case 'n':
			cmdline.dry_run = true;
			break;

		case 'J':
			cmdline.jail_verbose = true;
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(1);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind >= argc)
		arg_error(argv[0], "no program specified");

	cmdline.program = argv[optind];
	cmdline.args = {argv + optind + 1, argv + argc};
}
