#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace p4_mcp {

constexpr const char* kDefaultP4Binary = "p4";
constexpr const char* kDefaultSyncPath = "...";
constexpr uint32_t kDefaultChangesMax = 10;

// ---------------------------------------------------------------------------
// P4 commands: one struct per supported operation.
// ---------------------------------------------------------------------------

// `p4 opened [path]`
struct StatusCommand {
    std::optional<std::string> path;
};

// `p4 sync [-f] path`
struct SyncCommand {
    std::string path = kDefaultSyncPath;
    bool force = false;
};

// `p4 edit files...`
struct EditCommand {
    std::vector<std::string> files;
};

// `p4 add files...`
struct AddCommand {
    std::vector<std::string> files;
};

// `p4 submit -d description [files...]`
struct SubmitCommand {
    std::string description;
    std::optional<std::vector<std::string>> files;
};

// `p4 revert files...`
struct RevertCommand {
    std::vector<std::string> files;
};

// `p4 opened [-c changelist]`
struct OpenedCommand {
    std::optional<std::string> changelist;
};

// `p4 changes -m max [path]`
struct ChangesCommand {
    uint32_t max = kDefaultChangesMax;
    std::optional<std::string> path;
};

// `p4 info`
struct InfoCommand {};

using P4Command = std::variant<StatusCommand,
                               SyncCommand,
                               EditCommand,
                               AddCommand,
                               SubmitCommand,
                               RevertCommand,
                               OpenedCommand,
                               ChangesCommand,
                               InfoCommand>;

// ---------------------------------------------------------------------------
// Invocation: program name plus argv (without argv[0]). Arguments are kept
// discrete and are never joined into a shell command line.
// ---------------------------------------------------------------------------
struct Invocation {
    std::string program;
    std::vector<std::string> args;

    bool operator==(const Invocation& other) const {
        return program == other.program && args == other.args;
    }
    bool operator!=(const Invocation& other) const { return !(*this == other); }
};

// Deterministic mapping from a command to its p4 invocation.
[[nodiscard]] Invocation ToInvocation(const P4Command& command,
                                      std::string_view program = kDefaultP4Binary);

// p4 verb for the command ("opened", "sync", ...). Status maps to "opened".
[[nodiscard]] std::string_view CommandName(const P4Command& command);

// Space-joined rendering of an invocation, for log lines only.
[[nodiscard]] std::string FormatInvocation(const Invocation& invocation);

} // namespace p4_mcp
