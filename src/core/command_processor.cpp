#include "core/command_processor.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <vector>

extern char **environ;

namespace
{
    const std::string kPlaceholder = "{path}";
}

CommandProcessor::CommandProcessor(std::string command_template)
    : command_template_(std::move(command_template))
{
}

std::string CommandProcessor::shellScript() const
{
    std::string script = command_template_;
    if (script.find(kPlaceholder) == std::string::npos)
    {
        return script + " \"$1\"";
    }

    size_t pos = 0;
    while ((pos = script.find(kPlaceholder, pos)) != std::string::npos)
    {
        script.replace(pos, kPlaceholder.size(), "\"$1\"");
        pos += 4;
    }
    return script;
}

ProcessingResult CommandProcessor::operator()(const std::string &file_path) const
{
    const std::string script = shellScript();

    // sh -c <script> <$0> <$1>
    std::vector<std::string> args = {"sh", "-c", script, "auto_ingest", file_path};
    std::vector<char *> argv;
    for (auto &arg : args)
    {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, "sh", nullptr, nullptr, argv.data(), environ);
    if (rc != 0)
    {
        return ProcessingResult::failure("could not start command '" + command_template_ + "': " + std::strerror(rc));
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return ProcessingResult::failure(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFSIGNALED(status))
    {
        return ProcessingResult::failure("command terminated by signal " + std::to_string(WTERMSIG(status)));
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    Logger::debug("Command for " + file_path + " exited with " + std::to_string(exit_code));
    if (exit_code != 0)
    {
        return ProcessingResult::failure("command exited with code " + std::to_string(exit_code));
    }

    return ProcessingResult::ok({{"command", command_template_}, {"exit_code", exit_code}});
}

ProcessingResult CommandProcessor::recordOnly(const std::string &file_path)
{
    Logger::info("No processCommand configured; recording " + file_path + " as processed");
    return ProcessingResult::ok({{"status", "success"}});
}

ProcessingCallback CommandProcessor::fromCommand(const std::string &command_template)
{
    if (command_template.empty())
    {
        return &CommandProcessor::recordOnly;
    }
    CommandProcessor processor(command_template);
    return [processor](const std::string &file_path)
    {
        return processor(file_path);
    };
}
