//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `horder scan <header>`: parse the header's prototypes and list
// them with their 1-based starting lines.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <ostream>

namespace horder::tools::cli
{

namespace
{

/// @brief Signature folded onto one line for listing.
std::string flatten(const std::string &signature)
{
    std::string flat;
    flat.reserve(signature.size());
    bool pendingSpace = false;
    for (char ch : signature)
    {
        if (ch == '\n' || ch == '\r' || ch == '\t' || ch == ' ')
        {
            pendingSpace = !flat.empty();
            continue;
        }
        if (pendingSpace)
            flat.push_back(' ');
        pendingSpace = false;
        flat.push_back(ch);
    }
    return flat;
}

} // namespace

int runScan(ToolContext &ctx, const std::string &header, std::ostream &out, std::ostream &err)
{
    auto prototypes = ctx.session().scanHeader(header);
    ctx.flushDiagnostics(err);
    if (!prototypes)
    {
        reportError(err, prototypes.error().message);
        return 1;
    }

    if (ctx.quiet())
        return 0;

    out << "Found " << prototypes.value().size() << " prototype(s) in " << header << "\n";
    for (const auto &proto : prototypes.value())
    {
        out << "  " << (proto.span.start + 1) << ": " << proto.name;
        if (ctx.verbose())
            out << "  " << flatten(proto.signature);
        out << "\n";
    }
    return 0;
}

int cmdScan(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    CommandArgs args;
    if (!parseCommandArgs(argc, argv, args, /*allowDryRun=*/false, err))
        return 1;
    if (args.positionals.size() != 1)
    {
        reportError(err, "scan expects exactly one header path");
        return 1;
    }

    auto ctx = makeToolContext(args.shared, err);
    if (!ctx)
        return 1;
    return runScan(*ctx, absoluteArg(args.positionals.front()), out, err);
}

} // namespace horder::tools::cli
