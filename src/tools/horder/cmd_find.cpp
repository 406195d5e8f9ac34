//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `horder find <header>`: locate bodies for the header's prototypes
// across the workspace and print the pick list.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <ostream>

namespace horder::tools::cli
{

int runFind(ToolContext &ctx,
            const std::string &header,
            bool scanFirst,
            std::ostream &out,
            std::ostream &err)
{
    if (scanFirst)
    {
        auto scanned = ctx.session().scanHeader(header);
        if (!scanned)
        {
            ctx.flushDiagnostics(err);
            reportError(err, scanned.error().message);
            return 1;
        }
    }

    auto impls = ctx.session().findImplementations(header);
    ctx.flushDiagnostics(err);
    if (!impls)
    {
        reportError(err, impls.error().message);
        return 1;
    }

    if (ctx.quiet())
        return 0;

    out << "Found " << impls.value().size() << " implementation(s) across workspace for header "
        << header << "\n";
    for (const auto &impl : impls.value())
    {
        out << "  " << impl.name << " — " << ctx.displayPath(impl.sourceFile) << ":"
            << (impl.definitionLine + 1) << "\n";
    }
    return 0;
}

int cmdFind(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    CommandArgs args;
    if (!parseCommandArgs(argc, argv, args, /*allowDryRun=*/false, err))
        return 1;
    if (args.positionals.size() != 1)
    {
        reportError(err, "find expects exactly one header path");
        return 1;
    }

    auto ctx = makeToolContext(args.shared, err);
    if (!ctx)
        return 1;
    return runFind(*ctx, absoluteArg(args.positionals.front()), /*scanFirst=*/true, out, err);
}

} // namespace horder::tools::cli
