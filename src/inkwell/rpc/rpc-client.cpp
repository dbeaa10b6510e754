#include <inkwell/rpc/rpc-client.h>
#include <inkwell/rpc/value-codec.h>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <deque>

namespace inkwell {
namespace rpc {

static std::string getSocketError() {
    return std::string(std::strerror(errno));
}

// Pack a notification: [2, channel, method, params]
static void packNotification(msgpack::sbuffer& out, Channel channel,
                             const std::string& method, const Value& params) {
    msgpack::packer<msgpack::sbuffer> pk(out);
    pk.pack_array(4);
    pk.pack(static_cast<uint32_t>(MessageType::Notification));
    pk.pack(static_cast<uint32_t>(channel));
    pk.pack(method);
    packValue(pk, params);
}

// Pack a request: [0, msgid, channel, method, params]
static void packRequest(msgpack::sbuffer& out, uint32_t msgid, Channel channel,
                        const std::string& method, const Value& params) {
    msgpack::packer<msgpack::sbuffer> pk(out);
    pk.pack_array(5);
    pk.pack(static_cast<uint32_t>(MessageType::Request));
    pk.pack(msgid);
    pk.pack(static_cast<uint32_t>(channel));
    pk.pack(method);
    packValue(pk, params);
}

class RpcClientSync : public RpcClient {
public:
    explicit RpcClientSync(std::string socketPath)
        : _socketPath(std::move(socketPath)) {
        _unpacker.reserve_buffer(65536);
    }

    ~RpcClientSync() override {
        disconnect();
    }

    Result<void> connect() override {
        if (_socketPath.size() >= sizeof(sockaddr_un::sun_path)) {
            return Err<void>("RpcClient: socket path too long: " + _socketPath);
        }

        _fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        if (_fd < 0) {
            return Err<void>("RpcClient: socket() failed: " + getSocketError());
        }

        struct sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, _socketPath.c_str(), sizeof(addr.sun_path) - 1);

        if (::connect(_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            std::string reason = getSocketError();
            ::close(_fd);
            _fd = -1;
            return Err<void>("RpcClient: connect(" + _socketPath + ") failed: " + reason);
        }
        return Ok();
    }

    void disconnect() override {
        if (_fd >= 0) {
            ::close(_fd);
            _fd = -1;
        }
    }

    // ── Channel::Overlay ──

    Result<void> enqueue(int64_t callId, const std::string& command, const List& args) override {
        List params;
        params.reserve(args.size() + 2);
        params.emplace_back(callId);
        params.emplace_back(command);
        params.insert(params.end(), args.begin(), args.end());
        auto res = request(Channel::Overlay, "enqueue", Value(std::move(params)));
        if (!res) {
            return Err<void>("enqueue failed", res);
        }
        return Ok();
    }

    Result<void> batch(const List& commands) override {
        auto res = request(Channel::Overlay, "batch", Value(commands));
        if (!res) {
            return Err<void>("batch failed", res);
        }
        return Ok();
    }

    Result<void> execute(const std::string& command, const List& args) override {
        auto res = request(Channel::Overlay, command, Value(args));
        if (!res) {
            return Err<void>(command + " failed", res);
        }
        return Ok();
    }

    // ── Channel::Window ──

    Result<void> mouseMove(float x, float y) override {
        Dict params;
        params["x"] = Value(static_cast<double>(x));
        params["y"] = Value(static_cast<double>(y));
        return notify(Channel::Window, "mouse_move", Value(std::move(params)));
    }

    Result<void> windowGeometry(float x, float y, float width, float height) override {
        Dict params;
        params["x"] = Value(static_cast<double>(x));
        params["y"] = Value(static_cast<double>(y));
        params["width"] = Value(static_cast<double>(width));
        params["height"] = Value(static_cast<double>(height));
        return notify(Channel::Window, "window_geometry", Value(std::move(params)));
    }

    // ── Channel::Scene ──

    Result<Value> groups() override {
        auto res = request(Channel::Scene, "groups", Value(Dict{}));
        if (!res) {
            return Err<Value>("groups failed", res);
        }
        return res;
    }

    Result<std::string> sceneTree() override {
        auto res = request(Channel::Scene, "scene_tree", Value(Dict{}));
        if (!res) {
            return Err<std::string>("scene_tree failed", res);
        }
        if (!res->isString()) {
            return Err<std::string>(std::string("scene_tree: unexpected ") + res->typeName());
        }
        return Ok(res->asString());
    }

    // ── Notifications ──

    Result<RpcMessage> waitNotification() override {
        while (_notifications.empty()) {
            if (auto res = readMore(); !res) {
                return Err<RpcMessage>("waitNotification", res);
            }
        }
        RpcMessage msg = std::move(_notifications.front());
        _notifications.pop_front();
        return Ok(std::move(msg));
    }

    // ── Generic send methods ──

    Result<void> notify(Channel channel, const std::string& method, const Value& params) override {
        if (_fd < 0) {
            return Err<void>("RpcClient: not connected");
        }

        msgpack::sbuffer out;
        packNotification(out, channel, method, params);
        return sendAll(out);
    }

    Result<Value> request(Channel channel, const std::string& method, const Value& params) override {
        if (_fd < 0) {
            return Err<Value>("RpcClient: not connected");
        }

        uint32_t msgid = _nextMsgId++;
        msgpack::sbuffer out;
        packRequest(out, msgid, channel, method, params);

        auto res = sendAll(out);
        if (!res) {
            return Err<Value>("RpcClient: send failed", res);
        }

        return recvResponse(msgid);
    }

private:
    Result<void> sendAll(const msgpack::sbuffer& buf) {
        const char* data = buf.data();
        size_t remaining = buf.size();
        while (remaining > 0) {
            ssize_t n = ::send(_fd, data, remaining, 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                return Err<void>("RpcClient: send() failed: " + getSocketError());
            }
            data += n;
            remaining -= static_cast<size_t>(n);
        }
        return Ok();
    }

    // Read one chunk and sort complete messages into responses/notifications.
    Result<void> readMore() {
        _unpacker.reserve_buffer(65536);
        ssize_t n = ::recv(_fd, _unpacker.buffer(), _unpacker.buffer_capacity(), 0);
        if (n < 0 && errno == EINTR) {
            return Ok();
        }
        if (n <= 0) {
            return Err<void>(n == 0 ? std::string("RpcClient: server closed the connection")
                                    : "RpcClient: recv() failed: " + getSocketError());
        }
        _unpacker.buffer_consumed(static_cast<size_t>(n));

        try {
            msgpack::object_handle oh;
            while (_unpacker.next(oh)) {
                const auto& obj = oh.get();
                if (obj.type != msgpack::type::ARRAY || obj.via.array.size < 4) {
                    continue;
                }
                const auto& arr = obj.via.array;
                uint32_t type = arr.ptr[0].as<uint32_t>();

                if (type == static_cast<uint32_t>(MessageType::Response)) {
                    // [1, msgid, error, result]
                    Response response;
                    response.msgid = arr.ptr[1].as<uint32_t>();
                    if (arr.ptr[2].type != msgpack::type::NIL) {
                        auto err = fromMsgpack(arr.ptr[2]);
                        response.error = err ? err->str() : std::string("undecodable error");
                    } else {
                        auto result = fromMsgpack(arr.ptr[3]);
                        if (!result) {
                            response.error = error_msg(result);
                        } else {
                            response.result = std::move(*result);
                        }
                    }
                    _responses.push_back(std::move(response));
                } else if (type == static_cast<uint32_t>(MessageType::Notification)) {
                    // [2, channel, method, params]
                    RpcMessage msg;
                    msg.type = MessageType::Notification;
                    msg.channel = arr.ptr[1].as<uint32_t>();
                    msg.method = arr.ptr[2].as<std::string>();
                    auto params = fromMsgpack(arr.ptr[3]);
                    if (params) {
                        msg.params = std::move(*params);
                    }
                    _notifications.push_back(std::move(msg));
                }
            }
        } catch (const msgpack::type_error& e) {
            return Err<void>(std::string("RpcClient: malformed message: ") + e.what());
        } catch (const msgpack::unpack_error& e) {
            return Err<void>(std::string("RpcClient: malformed stream: ") + e.what());
        }
        return Ok();
    }

    Result<Value> recvResponse(uint32_t expectedMsgId) {
        while (true) {
            for (auto it = _responses.begin(); it != _responses.end(); ++it) {
                if (it->msgid != expectedMsgId) {
                    continue;
                }
                Response response = std::move(*it);
                _responses.erase(it);
                if (!response.error.empty()) {
                    return Err<Value>("RpcClient: server error: " + response.error);
                }
                return Ok(std::move(response.result));
            }
            if (auto res = readMore(); !res) {
                return Err<Value>("RpcClient: no response", res);
            }
        }
    }

    struct Response {
        uint32_t msgid = 0;
        std::string error;
        Value result;
    };

    std::string _socketPath;
    int _fd = -1;
    uint32_t _nextMsgId = 1;
    msgpack::unpacker _unpacker;
    std::deque<Response> _responses;
    std::deque<RpcMessage> _notifications;
};

Result<RpcClient::Ptr> RpcClient::createImpl(const std::string& socketPath) noexcept {
    if (socketPath.empty()) {
        return Err<Ptr>("RpcClient: empty socket path");
    }
    return Ok(Ptr(new RpcClientSync(socketPath)));
}

} // namespace rpc
} // namespace inkwell
