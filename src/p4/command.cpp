#include <p4_mcp/p4/command.hpp>

namespace p4_mcp {

namespace {

void AppendAll(std::vector<std::string>& args,
               const std::vector<std::string>& files) {
    args.insert(args.end(), files.begin(), files.end());
}

struct ArgsBuilder {
    std::vector<std::string> operator()(const StatusCommand& c) const {
        std::vector<std::string> args{"opened"};
        if (c.path) args.push_back(*c.path);
        return args;
    }

    std::vector<std::string> operator()(const SyncCommand& c) const {
        std::vector<std::string> args{"sync"};
        if (c.force) args.emplace_back("-f");
        args.push_back(c.path);
        return args;
    }

    std::vector<std::string> operator()(const EditCommand& c) const {
        std::vector<std::string> args{"edit"};
        AppendAll(args, c.files);
        return args;
    }

    std::vector<std::string> operator()(const AddCommand& c) const {
        std::vector<std::string> args{"add"};
        AppendAll(args, c.files);
        return args;
    }

    std::vector<std::string> operator()(const SubmitCommand& c) const {
        std::vector<std::string> args{"submit", "-d", c.description};
        if (c.files) AppendAll(args, *c.files);
        return args;
    }

    std::vector<std::string> operator()(const RevertCommand& c) const {
        std::vector<std::string> args{"revert"};
        AppendAll(args, c.files);
        return args;
    }

    std::vector<std::string> operator()(const OpenedCommand& c) const {
        std::vector<std::string> args{"opened"};
        if (c.changelist) {
            args.emplace_back("-c");
            args.push_back(*c.changelist);
        }
        return args;
    }

    std::vector<std::string> operator()(const ChangesCommand& c) const {
        std::vector<std::string> args{"changes", "-m", std::to_string(c.max)};
        if (c.path) args.push_back(*c.path);
        return args;
    }

    std::vector<std::string> operator()(const InfoCommand&) const {
        return {"info"};
    }
};

} // anonymous namespace

Invocation ToInvocation(const P4Command& command, std::string_view program) {
    return Invocation{std::string(program), std::visit(ArgsBuilder{}, command)};
}

std::string_view CommandName(const P4Command& command) {
    static constexpr std::string_view kNames[] = {
        "opened", "sync", "edit", "add", "submit",
        "revert", "opened", "changes", "info",
    };
    static_assert(sizeof(kNames) / sizeof(kNames[0]) == std::variant_size_v<P4Command>,
                  "every P4Command alternative needs a name");
    return kNames[command.index()];
}

std::string FormatInvocation(const Invocation& invocation) {
    std::string out = invocation.program;
    for (const auto& arg : invocation.args) {
        out += ' ';
        out += arg;
    }
    return out;
}

} // namespace p4_mcp
