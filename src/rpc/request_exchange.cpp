#include <mcp_cli/rpc/request_exchange.hpp>

#include <mcp_cli/core/log.hpp>
#include <mcp_cli/rpc/protocol_codec.hpp>

namespace mcp_cli {

namespace {

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

} // anonymous namespace

RequestExchange::RequestExchange(IProcessSupervisor& supervisor,
                                 std::chrono::milliseconds default_timeout)
    : supervisor_(supervisor), default_timeout_(default_timeout) {}

RequestId RequestExchange::LastRequestId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.Last();
}

CallResult<nlohmann::json> RequestExchange::Call(const MethodName& method,
                                                 const nlohmann::json& params,
                                                 const CallOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto started = std::chrono::steady_clock::now();

    // Reject bad params before spawning anything or consuming an id.
    if (!params.is_null() && !params.is_object()) {
        return CallResult<nlohmann::json>::Err(ProtocolError{
            "", "request params must be a JSON object, got " +
                    std::string(params.type_name()),
            ""});
    }

    auto running = supervisor_.EnsureRunning();
    if (running.IsErr()) {
        LogWarn("exchange", method.Value() + ": " + running.Error().message);
        return CallResult<nlohmann::json>::Err(std::move(running).Error());
    }

    // The id is only taken once the request encodes, so ids on the wire
    // have no gaps.
    const RequestId id = ids_.Last() + 1;
    auto encoded = EncodeRequest(method, params, id);
    if (encoded.IsErr()) {
        LogWarn("exchange", method.Value() + ": cannot encode request: " +
                                encoded.Error().parse_message);
        return CallResult<nlohmann::json>::Err(std::move(encoded).Error());
    }
    (void)ids_.Next();

    LogDebug("exchange", "-> " + method.Value() + " #" + std::to_string(id));
    auto written = supervisor_.WriteLine(encoded.Value());
    if (written.IsErr()) {
        return FailTransport(TransportFailure::WriteFailed,
                             "cannot send request #" + std::to_string(id) + ": " +
                                 written.Error());
    }

    const auto timeout = options.timeout.value_or(default_timeout_);
    auto read = supervisor_.ReadLine(timeout, options.cancel);
    switch (read.status) {
        case ReadStatus::Line:
            break;
        case ReadStatus::Eof:
            return FailTransport(TransportFailure::Closed,
                                 "server closed its output before answering request #" +
                                     std::to_string(id));
        case ReadStatus::Timeout:
            return FailTransport(TransportFailure::Timeout,
                                 "no response to request #" + std::to_string(id) +
                                     " within " + std::to_string(timeout.count()) + " ms");
        case ReadStatus::Cancelled:
            return FailTransport(TransportFailure::Cancelled,
                                 "request #" + std::to_string(id) + " cancelled");
        case ReadStatus::IoError:
            return FailTransport(TransportFailure::IoError, read.error);
    }

    auto decoded = DecodeResponse(read.line);
    if (decoded.IsErr()) {
        auto error = std::move(decoded).Error();
        if (auto* protocol = std::get_if<ProtocolError>(&error)) {
            protocol->diagnostics = supervisor_.TakeDiagnostics();
        }
        LogWarn("exchange", "<- " + method.Value() + " #" + std::to_string(id) +
                                " failed after " + std::to_string(ElapsedMs(started)) +
                                " ms: " + Describe(error));
        return CallResult<nlohmann::json>::Err(std::move(error));
    }

    LogDebug("exchange", "<- " + method.Value() + " #" + std::to_string(id) + " ok (" +
                             std::to_string(ElapsedMs(started)) + " ms)");
    return decoded;
}

// A transport failure leaves the stream in an unknown state (a late response
// could still arrive), so the process is stopped and respawned on demand.
CallResult<nlohmann::json> RequestExchange::FailTransport(TransportFailure reason,
                                                          std::string message) {
    auto diagnostics = supervisor_.TakeDiagnostics();
    LogWarn("exchange", std::string(TransportFailureName(reason)) + ": " + message);
    supervisor_.Stop();
    return CallResult<nlohmann::json>::Err(
        TransportError{reason, std::move(message), std::move(diagnostics)});
}

} // namespace mcp_cli
