//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `horder sync <header> [<file>] [--dry-run]`: rewrite the chosen
// implementation file so its function bodies follow header order.  Without a
// target the candidate files are listed so the caller can pick one.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <algorithm>
#include <ostream>

namespace horder::tools::cli
{

namespace
{

void info(ToolContext &ctx, std::ostream &out, const char *message)
{
    if (!ctx.quiet())
        out << message << "\n";
}

} // namespace

int runSync(ToolContext &ctx,
            const std::string &header,
            const std::optional<std::string> &target,
            bool dryRun,
            bool scanFirst,
            std::ostream &out,
            std::ostream &err)
{
    common::Session &session = ctx.session();

    if (scanFirst)
    {
        auto scanned = session.scanHeader(header);
        if (!scanned)
        {
            ctx.flushDiagnostics(err);
            reportError(err, scanned.error().message);
            return 1;
        }
    }

    if (!target)
    {
        auto impls = session.findImplementations(header);
        ctx.flushDiagnostics(err);
        if (!impls)
        {
            reportError(err, impls.error().message);
            return 1;
        }
        if (impls.value().empty())
        {
            info(ctx, out, "No implementations found in workspace.");
            return 0;
        }
        out << "Candidate files:\n";
        for (const auto &file : common::Session::candidateTargets(impls.value()))
            out << "  " << ctx.displayPath(file) << "\n";
        reportError(err, "choose a target file");
        return 1;
    }

    auto result = session.synchronizeOrder(header, *target);
    ctx.flushDiagnostics(err);
    if (!result)
    {
        reportError(err, result.error().message);
        return 1;
    }

    const common::SyncResult &sync = result.value();
    if (sync.implementations.empty())
    {
        info(ctx, out, "No implementations found in workspace.");
        return 0;
    }

    if (!sync.plan)
    {
        const std::string canonical = session.workspace().canonicalPath(*target);
        const bool anyInFile = std::any_of(sync.implementations.begin(),
                                           sync.implementations.end(),
                                           [&](const core::Implementation &impl)
                                           { return impl.sourceFile == canonical; });
        info(ctx,
             out,
             anyInFile ? "No matching functions to reorder in chosen file."
                       : "No implementations from selected header found in this file.");
        return 0;
    }

    const core::ReplacementPlan &plan = *sync.plan;
    if (dryRun)
    {
        out << "Would replace lines " << (plan.range.start + 1) << "-" << (plan.range.end + 1)
            << " of " << ctx.displayPath(plan.file) << " with:\n"
            << plan.newText << "\n";
        return 0;
    }

    auto applied = session.applyPlan(plan);
    if (!applied)
    {
        reportError(err, "Failed to apply edits: " + applied.error().message);
        return 1;
    }
    info(ctx, out, "Reordered functions to match header prototype order.");
    return 0;
}

int cmdSync(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    CommandArgs args;
    if (!parseCommandArgs(argc, argv, args, /*allowDryRun=*/true, err))
        return 1;
    if (args.positionals.empty() || args.positionals.size() > 2)
    {
        reportError(err, "sync expects a header path and an optional target file");
        return 1;
    }

    auto ctx = makeToolContext(args.shared, err);
    if (!ctx)
        return 1;

    std::optional<std::string> target;
    if (args.positionals.size() == 2)
        target = absoluteArg(args.positionals[1]);
    return runSync(
        *ctx, absoluteArg(args.positionals.front()), target, args.dryRun, /*scanFirst=*/true, out, err);
}

} // namespace horder::tools::cli
