#include <p4_mcp/mcp/mcp_server.hpp>

#include <p4_mcp/core/blocking_queue.hpp>
#include <p4_mcp/core/log.hpp>

#include <string>
#include <thread>

namespace p4_mcp {

namespace {

constexpr const char* kComponent = "server";

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

std::string Preview(const std::string& line) {
    constexpr size_t kMax = 120;
    if (line.size() <= kMax) return line;
    return line.substr(0, kMax) + "...";
}

} // anonymous namespace

McpServer::McpServer(Dispatcher& dispatcher, std::istream& in, std::ostream& out)
    : dispatcher_(dispatcher), in_(in), out_(out) {}

ServerStats McpServer::Run() {
    ServerStats stats;
    BlockingQueue<Request> queue;

    // Reader counters are written only by the reader thread and read after
    // join(), so they need no lock.
    size_t lines_read = 0;
    size_t requests = 0;
    size_t dropped = 0;
    size_t notifications = 0;

    std::thread reader([&] {
        std::string line;
        while (std::getline(in_, line)) {
            if (IsBlank(line)) continue;
            ++lines_read;

            auto decoded = DecodeLine(line);
            if (decoded.IsErr()) {
                const auto& err = decoded.Error();
                if (err.kind == DecodeError::Kind::Notification) {
                    ++notifications;
                    LogDebug(kComponent, "notification " + err.message);
                } else {
                    ++dropped;
                    LogWarn(kComponent, "dropping frame (" + err.message +
                                            "): " + Preview(line));
                }
                continue;
            }

            ++requests;
            if (!queue.Push(std::move(decoded).Value())) {
                break;
            }
        }
        if (in_.bad()) {
            LogError(kComponent, "input stream error, stopping reader");
        } else {
            LogDebug(kComponent, "end of input");
        }
        queue.Close();
    });

    while (auto request = queue.Pop()) {
        Response response = dispatcher_.Dispatch(*request);
        out_ << SerializeResponse(response) << "\n";
        out_.flush();
        ++stats.responses;
        if (!out_) {
            LogError(kComponent, "output stream error after response " +
                                     response.id.dump());
        }
    }

    reader.join();

    stats.lines_read = lines_read;
    stats.requests = requests;
    stats.dropped = dropped;
    stats.notifications = notifications;
    return stats;
}

} // namespace p4_mcp
