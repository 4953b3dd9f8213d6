#pragma once

#include "core/processing_result.hpp"
#include <string>

/**
 * @brief Processing callback that runs an external command for each file
 *
 * The command line goes through /bin/sh. A "{path}" placeholder is replaced
 * by the file path, otherwise the path is appended as the last argument. The
 * path is handed to the shell as a positional parameter, never spliced into
 * the command text, so file names need no quoting. Exit status 0 is success.
 */
class CommandProcessor
{
public:
    explicit CommandProcessor(std::string command_template);

    ProcessingResult operator()(const std::string &file_path) const;

    // Shell script run for a file, with the path referenced as "$1"
    std::string shellScript() const;

    const std::string &commandTemplate() const { return command_template_; }

    // Callback used when no command is configured: the file is only recorded as processed
    static ProcessingResult recordOnly(const std::string &file_path);

    static ProcessingCallback fromCommand(const std::string &command_template);

private:
    std::string command_template_;
};
