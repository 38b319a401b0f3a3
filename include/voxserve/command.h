/**
 * @file command.h
 * @brief Running external tools (ffmpeg, transcription CLIs)
 */

#pragma once

#include <map>
#include <string>

namespace voxserve {

/**
 * @brief Quote one argument for the platform shell
 */
std::string shell_quote(const std::string& arg);

/**
 * @brief Replace {name} placeholders with shell-quoted values
 *
 * Unknown placeholders are left as they are.
 */
std::string expand_command(const std::string& templ, const std::map<std::string, std::string>& values);

/**
 * @brief Run a shell command and capture its standard output
 * @return Exit status (0 on success, -1 if the process could not start)
 */
int run_command(const std::string& command, std::string& output);

} // namespace voxserve
