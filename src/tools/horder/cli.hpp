// File: src/tools/horder/cli.hpp
// Purpose: Declarations for horder subcommand handlers, shared option parsing
//          and the per-invocation tool context.
// Key invariants: Handlers write informational output to `out` and
//                 diagnostics to `err`; they never touch std::cout directly.
// Ownership/Lifetime: ToolContext owns the workspace, cache, diagnostics and
//                     session for one invocation.
// Links: tools/common/session.hpp

#pragma once

#include "core/HeaderCache.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tools/common/fs_workspace.hpp"
#include "tools/common/project_config.hpp"
#include "tools/common/session.hpp"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace horder::tools::cli
{

/// @brief Options accepted by every horder subcommand.
struct SharedCliOptions
{
    /// @brief Workspace root given with --root; "." when absent.
    std::string rootDir{};

    /// @brief Manifest given with --config.
    std::string configPath{};

    /// @brief Overrides of the manifest's candidate query.
    std::optional<std::string> include{};
    std::optional<std::string> exclude{};
    std::optional<std::size_t> limit{};

    /// @brief Report notes and prototype signatures.
    bool verbose = false;

    /// @brief Suppress informational lines on stdout.
    bool quiet = false;
};

/// @brief Result of attempting to parse a shared CLI option.
enum class SharedOptionParseResult
{
    NotMatched, ///< Argument does not correspond to a shared option.
    Parsed,     ///< Argument consumed and reflected in the configuration.
    Error       ///< Argument looked like a shared option but was malformed.
};

/// @brief Parse a horder option common to all subcommands.
///
/// @param index Index of the current argument; advanced when a value is consumed.
/// @param argc Total number of arguments available.
/// @param argv Argument vector.
/// @param opts Accumulator receiving parsed option values.
/// @param err Stream receiving a message when the option is malformed.
/// @return Parsing outcome describing whether the argument was handled.
SharedOptionParseResult parseSharedOption(
    int &index, int argc, char **argv, SharedCliOptions &opts, std::ostream &err);

/// @brief Arguments of one subcommand after option parsing.
struct CommandArgs
{
    SharedCliOptions shared{};
    std::vector<std::string> positionals{};
    bool dryRun = false;
};

/// @brief Split subcommand arguments into shared options and positionals.
/// @param allowDryRun Accept `--dry-run`.
/// @return False after printing a message for a malformed or unknown option.
bool parseCommandArgs(int argc, char **argv, CommandArgs &args, bool allowDryRun, std::ostream &err);

/// @brief Resolve defaults, the manifest and the CLI overrides, in that order.
support::Expected<common::ProjectConfig> resolveConfig(const SharedCliOptions &opts);

/// @brief Collaborators for one invocation, wired around a filesystem workspace.
class ToolContext
{
  public:
    ToolContext(common::ProjectConfig config, const SharedCliOptions &opts);

    ToolContext(const ToolContext &) = delete;
    ToolContext &operator=(const ToolContext &) = delete;

    common::Session &session()
    {
        return session_;
    }

    const common::ProjectConfig &config() const
    {
        return config_;
    }

    bool verbose() const
    {
        return verbose_;
    }

    bool quiet() const
    {
        return quiet_;
    }

    /// @brief Path of @p path relative to the workspace root, for display.
    std::string displayPath(const std::string &path) const;

    /// @brief Print and drop every pending diagnostic.
    void flushDiagnostics(std::ostream &err);

  private:
    common::ProjectConfig config_;
    common::FileSystemWorkspace workspace_;
    core::HeaderCache cache_;
    support::DiagnosticEngine diags_;
    support::SourceManager sm_;
    common::Session session_;
    bool verbose_;
    bool quiet_;
};

/// @brief Build the context for @p opts.
/// @return Null after printing the error when the configuration is invalid.
std::unique_ptr<ToolContext> makeToolContext(const SharedCliOptions &opts, std::ostream &err);

/// @brief Absolute form of a path typed by the user, resolved against the
///        current directory.
std::string absoluteArg(const std::string &path);

/// @brief Print `error: <message>` to @p err.
void reportError(std::ostream &err, const std::string &message);

/// @brief Print the prototypes of @p header, scanning it first.
int runScan(ToolContext &ctx, const std::string &header, std::ostream &out, std::ostream &err);

/// @brief Print the implementations of @p header's cached prototypes.
/// @param scanFirst Rescan the header before locating.
int runFind(ToolContext &ctx,
            const std::string &header,
            bool scanFirst,
            std::ostream &out,
            std::ostream &err);

/// @brief Reorder @p target to match @p header, or print candidates when no
///        target is given.
int runSync(ToolContext &ctx,
            const std::string &header,
            const std::optional<std::string> &target,
            bool dryRun,
            bool scanFirst,
            std::ostream &out,
            std::ostream &err);

/// @brief Handle `horder scan`.
int cmdScan(int argc, char **argv, std::ostream &out, std::ostream &err);

/// @brief Handle `horder find`.
int cmdFind(int argc, char **argv, std::ostream &out, std::ostream &err);

/// @brief Handle `horder sync`.
int cmdSync(int argc, char **argv, std::ostream &out, std::ostream &err);

/// @brief Handle `horder session`.
/// @param in Script read when no script path is given.
int cmdSession(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err);

/// @brief Run the horder CLI with injectable streams.
/// @return Process exit status.
int runCLI(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err);

/// @brief Run the horder CLI reading session scripts from std::cin.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace horder::tools::cli
