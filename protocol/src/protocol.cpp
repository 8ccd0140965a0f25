#include "protocol.hpp"

#include <fmt/core.h>

namespace protocol {

namespace {

using nlohmann::json;

// Overload set for std::visit.
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto read_int(const json& envelope, const char* key) -> std::optional<std::int64_t> {
    auto it = envelope.find(key);
    if (it == envelope.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        throw DecodeError{fmt::format("envelope field '{}' is not an integer", key)};
    }
    return it->get<std::int64_t>();
}

}  // namespace


auto encode(const Request& request) -> std::string {
    json envelope = {
        {"ver", request.ver},
        {"cmd", request.cmd},
        {"seq", request.seq},
        {"opcode", request.opcode},
        {"payload", request.payload.is_null() ? json::object() : request.payload},
    };
    return envelope.dump();
}


auto decode(std::string_view text) -> Frame {
    json envelope = json::parse(text.begin(), text.end(), nullptr, false);
    if (envelope.is_discarded()) {
        throw DecodeError{"frame is not valid JSON"};
    }
    if (!envelope.is_object()) {
        throw DecodeError{"frame envelope is not an object"};
    }

    auto opcode = read_int(envelope, "opcode");
    if (!opcode) {
        throw DecodeError{"frame has no opcode"};
    }
    auto seq = read_int(envelope, "seq");
    auto cmd = read_int(envelope, "cmd");
    if (seq && *seq < 0) {
        throw DecodeError{"frame has a negative seq"};
    }

    json payload = json::object();
    if (auto it = envelope.find("payload"); it != envelope.end() && !it->is_null()) {
        payload = std::move(*it);
    }

    if (!seq) {
        return Push{static_cast<int>(*opcode), std::move(payload), std::nullopt};
    }

    auto seq_value = static_cast<std::uint64_t>(*seq);
    if (!cmd || *cmd == kCmdRequest) {
        Request request;
        request.seq = seq_value;
        request.opcode = static_cast<int>(*opcode);
        request.payload = std::move(payload);
        if (auto ver = read_int(envelope, "ver")) {
            request.ver = static_cast<int>(*ver);
        }
        return request;
    }

    return Response{seq_value, static_cast<int>(*cmd), static_cast<int>(*opcode), std::move(payload)};
}


auto describe(const Frame& frame) -> std::string {
    return std::visit(overloaded{
        [](const Request& r) {
            return fmt::format("request seq={} opcode={}", r.seq, r.opcode);
        },
        [](const Response& r) {
            return fmt::format("response seq={} opcode={} status={}", r.seq, r.opcode, r.status);
        },
        [](const Push& p) {
            return fmt::format("push opcode={}", p.opcode);
        },
    }, frame);
}

}  // namespace protocol
