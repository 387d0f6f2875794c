#include <p4_mcp/p4/mock_executor.hpp>

#include <p4_mcp/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace p4_mcp {

namespace {

constexpr uint32_t kMaxMockChanges = 5;
constexpr uint32_t kFirstMockChange = 12350;

std::string JoinFiles(const std::vector<std::string>& files) {
    std::string out;
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0) out += ", ";
        out += files[i];
    }
    return out;
}

std::string FileListReport(const char* title, const char* heading,
                           const char* verb,
                           const std::vector<std::string>& files) {
    std::ostringstream oss;
    oss << title << ":\n"
        << heading << ":\n"
        << JoinFiles(files) << "\n"
        << "... " << files.size() << " file(s) " << verb;
    return oss.str();
}

struct MockFormatter {
    std::string operator()(const StatusCommand& c) const {
        std::ostringstream oss;
        oss << "Mock P4 Status for " << c.path.value_or("current directory") << ":\n"
            << "//depot/main/file1.txt#1 - edit default change (text)\n"
            << "//depot/main/file2.cpp#2 - add default change (text)\n"
            << "... (mock data)";
        return oss.str();
    }

    std::string operator()(const SyncCommand& c) const {
        std::ostringstream oss;
        oss << "Mock P4 Sync" << (c.force ? " (forced)" : "") << ":\n"
            << "Syncing " << c.path << "\n"
            << "//depot/main/file1.txt#1 - updating /local/workspace/file1.txt\n"
            << "//depot/main/file2.cpp#2 - updating /local/workspace/file2.cpp\n"
            << "... synced 15 files";
        return oss.str();
    }

    std::string operator()(const EditCommand& c) const {
        return FileListReport("Mock P4 Edit", "Files opened for edit",
                              "opened for edit", c.files);
    }

    std::string operator()(const AddCommand& c) const {
        return FileListReport("Mock P4 Add", "Files opened for add",
                              "opened for add", c.files);
    }

    std::string operator()(const SubmitCommand& c) const {
        std::ostringstream oss;
        oss << "Mock P4 Submit:\n"
            << "Change description: " << c.description << "\n"
            << "Files: ";
        if (c.files) {
            oss << "Specific files: " << JoinFiles(*c.files);
        } else {
            oss << "All opened files";
        }
        oss << "\nChange 12345 submitted successfully";
        return oss.str();
    }

    std::string operator()(const RevertCommand& c) const {
        return FileListReport("Mock P4 Revert", "Files reverted",
                              "reverted", c.files);
    }

    std::string operator()(const OpenedCommand& c) const {
        std::ostringstream oss;
        oss << "Mock P4 Opened";
        if (c.changelist) {
            oss << " in changelist " << *c.changelist;
        }
        oss << ":\n"
            << "//depot/main/file1.txt#1 - edit default change (text)\n"
            << "//depot/main/file2.cpp#2 - add default change (text)\n"
            << "//depot/main/file3.h#1 - edit change 12346 (text)";
        return oss.str();
    }

    std::string operator()(const ChangesCommand& c) const {
        std::ostringstream oss;
        oss << "Mock P4 Changes (max: " << c.max << ")";
        if (c.path) {
            oss << " for path " << *c.path;
        }
        oss << ":\n";
        const auto count = std::min(c.max, kMaxMockChanges);
        for (uint32_t i = 0; i < count; ++i) {
            oss << "Change " << (kFirstMockChange - i)
                << " on 2024/01/" << (15 + i)
                << " by user@workspace 'Sample change description " << (i + 1)
                << "'\n";
        }
        return oss.str();
    }

    std::string operator()(const InfoCommand&) const {
        return "Mock P4 Info:\n"
               "User name: testuser\n"
               "Client name: test-client\n"
               "Client host: test-host\n"
               "Client root: /home/testuser/p4/test-client\n"
               "Current directory: /home/testuser/p4/test-client/main\n"
               "Peer address: ssl:perforce.example.com:1666\n"
               "Client address: 192.168.1.100\n"
               "Server address: perforce.example.com:1666\n"
               "Server root: /opt/perforce/depot\n"
               "Server date: 2024/01/15 12:30:45 -0800 PST\n"
               "Server uptime: 15:32:18\n"
               "Server version: P4D/LINUX26X86_64/2023.1/2553040 (2023/06/15)\n"
               "ServerID: perforce-server\n"
               "Case Handling: sensitive";
    }
};

} // anonymous namespace

Result<std::string, ExecutionError> MockExecutor::Execute(const P4Command& command) {
    LogDebug("p4", "mock " + std::string(CommandName(command)));
    return Result<std::string, ExecutionError>::Ok(std::visit(MockFormatter{}, command));
}

} // namespace p4_mcp
