#pragma once

#include <p4_mcp/p4/i_executor.hpp>

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

namespace p4_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// ScriptedExecutor: hand-written backend for dispatcher and server tests.
//
// Usage:
//   ScriptedExecutor exec;
//   exec.Enqueue(Result<std::string, ExecutionError>::Ok("Change 1 created"));
//   dispatcher.Dispatch(request);
//   CHECK(exec.CallCount() == 1);
//   CHECK(std::holds_alternative<SubmitCommand>(exec.Calls()[0]));
//
// Results are consumed FIFO. With an empty queue the executor answers with
// the command's p4 verb, so ordering can be checked without scripting.
// ---------------------------------------------------------------------------
class ScriptedExecutor : public IP4Executor {
public:
    ScriptedExecutor() = default;

    void Enqueue(Result<std::string, ExecutionError> result) {
        results_.push_back(std::move(result));
    }

    // The next Execute() throws instead of returning.
    void ThrowOnNext(std::string message) {
        throw_message_ = std::move(message);
    }

    [[nodiscard]] Result<std::string, ExecutionError> Execute(
        const P4Command& command) override {
        calls_.push_back(command);
        if (!throw_message_.empty()) {
            auto message = std::move(throw_message_);
            throw_message_.clear();
            throw std::runtime_error(message);
        }
        if (results_.empty()) {
            return Result<std::string, ExecutionError>::Ok(
                std::string(CommandName(command)));
        }
        auto result = std::move(results_.front());
        results_.pop_front();
        return result;
    }

    [[nodiscard]] std::string Name() const override { return "scripted"; }

    [[nodiscard]] size_t CallCount() const { return calls_.size(); }
    [[nodiscard]] const std::vector<P4Command>& Calls() const { return calls_; }

private:
    std::deque<Result<std::string, ExecutionError>> results_;
    std::vector<P4Command> calls_;
    std::string throw_message_;
};

} // namespace testing
} // namespace p4_mcp
