//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements shared command-line parsing for the horder driver and the tool
// context every subcommand runs in.  The helpers decode the workspace options
// that apply to all subcommands so individual entry points can focus on their
// positional arguments.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Parses global command-line options shared by horder subcommands.

#include "cli.hpp"

#include "support/path_utils.hpp"

#include <charconv>
#include <filesystem>
#include <ostream>
#include <string_view>
#include <system_error>
#include <utility>

namespace horder::tools::cli
{

namespace
{

/// @brief Fetch the value following option @p flag, advancing @p index.
/// @return Null when the value is missing.
const char *takeValue(int &index, int argc, char **argv, std::string_view flag, std::ostream &err)
{
    if (index + 1 >= argc)
    {
        err << "error: missing value for " << flag << "\n";
        return nullptr;
    }
    return argv[++index];
}

} // namespace

/// @brief Parse a horder global option and update the shared options structure.
///
/// @details Recognised options are the workspace selectors (`--root`,
///          `--config`), the candidate overrides (`--include`, `--exclude`,
///          `--limit`) and the output switches (`--verbose`, `--quiet`).
///          Options that do not match are reported as
///          @ref SharedOptionParseResult::NotMatched so subcommands can parse
///          their own flags.
SharedOptionParseResult parseSharedOption(
    int &index, int argc, char **argv, SharedCliOptions &opts, std::ostream &err)
{
    const std::string_view arg = argv[index];

    if (arg == "--verbose" || arg == "-v")
    {
        opts.verbose = true;
        return SharedOptionParseResult::Parsed;
    }
    if (arg == "--quiet" || arg == "-q")
    {
        opts.quiet = true;
        return SharedOptionParseResult::Parsed;
    }

    if (arg == "--root" || arg == "--config" || arg == "--include" || arg == "--exclude")
    {
        const char *value = takeValue(index, argc, argv, arg, err);
        if (!value)
            return SharedOptionParseResult::Error;
        if (arg == "--root")
            opts.rootDir = value;
        else if (arg == "--config")
            opts.configPath = value;
        else if (arg == "--include")
            opts.include = value;
        else
            opts.exclude = value;
        return SharedOptionParseResult::Parsed;
    }

    if (arg == "--limit")
    {
        const char *value = takeValue(index, argc, argv, arg, err);
        if (!value)
            return SharedOptionParseResult::Error;
        const std::string_view text(value);
        std::size_t limit = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), limit);
        if (ec != std::errc() || ptr != text.data() + text.size() || limit == 0)
        {
            err << "error: --limit expects a positive integer, got '" << text << "'\n";
            return SharedOptionParseResult::Error;
        }
        opts.limit = limit;
        return SharedOptionParseResult::Parsed;
    }

    return SharedOptionParseResult::NotMatched;
}

bool parseCommandArgs(int argc, char **argv, CommandArgs &args, bool allowDryRun, std::ostream &err)
{
    for (int i = 0; i < argc; ++i)
    {
        switch (parseSharedOption(i, argc, argv, args.shared, err))
        {
            case SharedOptionParseResult::Parsed:
                continue;
            case SharedOptionParseResult::Error:
                return false;
            case SharedOptionParseResult::NotMatched:
                break;
        }

        const std::string_view arg = argv[i];
        if (allowDryRun && arg == "--dry-run")
        {
            args.dryRun = true;
            continue;
        }
        if (arg.size() > 1 && arg.front() == '-')
        {
            err << "error: unknown option '" << arg << "'\n";
            return false;
        }
        args.positionals.emplace_back(arg);
    }
    return true;
}

support::Expected<common::ProjectConfig> resolveConfig(const SharedCliOptions &opts)
{
    auto config = common::resolveProject(opts.rootDir, opts.configPath);
    if (!config)
        return config.error();

    common::ProjectConfig resolved = std::move(config.value());
    if (opts.include)
        resolved.candidates.include = *opts.include;
    if (opts.exclude)
        resolved.candidates.exclude = *opts.exclude;
    if (opts.limit)
        resolved.candidates.limit = *opts.limit;
    return resolved;
}

ToolContext::ToolContext(common::ProjectConfig config, const SharedCliOptions &opts)
    : config_(std::move(config)),
      workspace_(config_.rootDir),
      session_(workspace_, cache_, diags_, sm_, config_),
      verbose_(opts.verbose),
      quiet_(opts.quiet)
{
    session_.setVerbose(verbose_);
}

std::string ToolContext::displayPath(const std::string &path) const
{
    return support::relativeTo(path, config_.rootDir);
}

void ToolContext::flushDiagnostics(std::ostream &err)
{
    diags_.printAll(err, &sm_);
    diags_.clear();
}

std::unique_ptr<ToolContext> makeToolContext(const SharedCliOptions &opts, std::ostream &err)
{
    auto config = resolveConfig(opts);
    if (!config)
    {
        support::printDiag(config.error(), err);
        return nullptr;
    }
    return std::make_unique<ToolContext>(std::move(config.value()), opts);
}

std::string absoluteArg(const std::string &path)
{
    std::error_code ec;
    const std::filesystem::path abs = std::filesystem::absolute(std::filesystem::path(path), ec);
    if (ec)
        return path;
    return support::normalizePath(abs.generic_string());
}

void reportError(std::ostream &err, const std::string &message)
{
    err << "error: " << message << "\n";
}

} // namespace horder::tools::cli
