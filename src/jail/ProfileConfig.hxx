// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "CapsDropBuilder.hxx"
#include "PrivateListBuilder.hxx"
#include "io/ConfigParser.hxx"

#include <filesystem>

namespace JailSpawn {

class Command;

/**
 * A #ConfigParser which applies profile options to a #Command.  Each
 * line names one option, spelled like the firejail flag without the
 * leading dashes, followed by its values.
 */
class ProfileConfigParser final : public ConfigParser {
	Command &command;

	CapsDropBuilder caps_drop;
	PrivateListBuilder private_list;

public:
	explicit ProfileConfigParser(Command &_command) noexcept
		:command(_command) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;

private:
	bool ParseTableOption(const char *word, LineParser &line);
	void ParseNetOption(const char *word, LineParser &line);
	bool ParseModeOption(const char *word, LineParser &line);
};

/**
 * Load a profile configuration file into the #Command.  Supports
 * comments, "@set" variables and "@include".
 *
 * Throws on error.
 */
void
LoadProfileFile(Command &command, const std::filesystem::path &path);

} // namespace JailSpawn
