//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `horder session [<script>]`: run scan/find/sync/invalidate
// commands line by line against one long-lived Session, so the header cache
// carries over from one command to the next.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "support/string_utils.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>

namespace horder::tools::cli
{

namespace
{

std::vector<std::string> tokenize(const std::string &line)
{
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token)
        tokens.push_back(token);
    return tokens;
}

/// @brief Execute one script line.
/// @return Exit status of the command; `quit` is reported through @p stop.
int runSessionLine(ToolContext &ctx,
                   const std::vector<std::string> &tokens,
                   bool &stop,
                   std::ostream &out,
                   std::ostream &err)
{
    const std::string &verb = tokens.front();

    if (verb == "quit" || verb == "exit")
    {
        stop = true;
        return 0;
    }

    if (verb == "scan" || verb == "find" || verb == "invalidate")
    {
        if (tokens.size() != 2)
        {
            reportError(err, verb + " expects exactly one header path");
            return 1;
        }
        const std::string header = absoluteArg(tokens[1]);
        if (verb == "scan")
            return runScan(ctx, header, out, err);
        if (verb == "find")
            return runFind(ctx, header, /*scanFirst=*/false, out, err);

        const bool dropped = ctx.session().invalidate(header);
        if (!ctx.quiet())
            out << (dropped ? "Invalidated " : "Nothing cached for ") << tokens[1] << "\n";
        return 0;
    }

    if (verb == "sync")
    {
        bool dryRun = false;
        std::vector<std::string> positionals;
        for (std::size_t i = 1; i < tokens.size(); ++i)
        {
            if (tokens[i] == "--dry-run")
                dryRun = true;
            else
                positionals.push_back(tokens[i]);
        }
        if (positionals.empty() || positionals.size() > 2)
        {
            reportError(err, "sync expects a header path and an optional target file");
            return 1;
        }
        std::optional<std::string> target;
        if (positionals.size() == 2)
            target = absoluteArg(positionals[1]);
        return runSync(ctx, absoluteArg(positionals[0]), target, dryRun, /*scanFirst=*/false, out, err);
    }

    reportError(err, "unknown session command '" + verb + "'");
    return 1;
}

int runSessionScript(ToolContext &ctx, std::istream &script, std::ostream &out, std::ostream &err)
{
    int status = 0;
    bool stop = false;
    std::string line;
    while (!stop && std::getline(script, line))
    {
        const std::string trimmed(support::string_utils::trim(line));
        if (trimmed.empty() || trimmed.front() == '#')
            continue;
        if (runSessionLine(ctx, tokenize(trimmed), stop, out, err) != 0)
            status = 1;
    }
    return status;
}

} // namespace

int cmdSession(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err)
{
    CommandArgs args;
    if (!parseCommandArgs(argc, argv, args, /*allowDryRun=*/false, err))
        return 1;
    if (args.positionals.size() > 1)
    {
        reportError(err, "session accepts at most one script path");
        return 1;
    }

    auto ctx = makeToolContext(args.shared, err);
    if (!ctx)
        return 1;

    if (args.positionals.empty())
        return runSessionScript(*ctx, in, out, err);

    std::ifstream script(args.positionals.front());
    if (!script)
    {
        reportError(err, "cannot open session script: " + args.positionals.front());
        return 1;
    }
    return runSessionScript(*ctx, script, out, err);
}

} // namespace horder::tools::cli
