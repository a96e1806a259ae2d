#include "engine_http.h"
#include "constants.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace execbox {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Closes the descriptor on every exit path
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

// Framing of a reply, known once its headers arrived
struct ReplyFraming {
    bool headers_done = false;
    bool chunked = false;
    bool has_length = false;
    size_t content_length = 0;
    size_t expected_size = 0;   // headers + body, when has_length
};

ReplyFraming inspect_framing(const std::string& raw) {
    ReplyFraming framing;
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return framing;
    }
    framing.headers_done = true;

    std::istringstream head(to_lower(raw.substr(0, header_end + 2)));
    std::string line;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.compare(0, 18, "transfer-encoding:") == 0 &&
            line.find("chunked") != std::string::npos) {
            framing.chunked = true;
        } else if (line.compare(0, 15, "content-length:") == 0) {
            try {
                framing.content_length = std::stoul(line.substr(15));
                framing.expected_size = header_end + 4 + framing.content_length;
                framing.has_length = true;
            } catch (const std::exception&) {
                framing.has_length = false;
            }
        }
    }
    return framing;
}

bool reply_complete(const std::string& raw, const ReplyFraming& framing) {
    if (!framing.headers_done) {
        return false;
    }
    if (framing.chunked) {
        static const std::string terminator = "0\r\n\r\n";
        if (raw.size() < terminator.size() ||
            raw.compare(raw.size() - terminator.size(), terminator.size(), terminator) != 0) {
            return false;
        }
        try {
            UnixHttpClient::decode_chunked(raw.substr(raw.find("\r\n\r\n") + 4));
            return true;
        } catch (const std::runtime_error&) {
            return false;  // terminator was payload
        }
    }
    return framing.has_length && raw.size() >= framing.expected_size;
}

} // namespace

std::string EngineResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

UnixHttpClient::UnixHttpClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}

int UnixHttpClient::connect_socket() const {
    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        throw EngineConnectionError("socket path too long: " + socket_path_);
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw EngineConnectionError(std::string("socket: ") + std::strerror(errno));
    }

    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, socket_path_.c_str(), socket_path_.size() + 1);

    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int saved = errno;
        close(fd);
        throw EngineConnectionError("connect " + socket_path_ + ": " + std::strerror(saved));
    }
    return fd;
}

std::string UnixHttpClient::build_request(const EngineRequest& request) {
    std::ostringstream out;

    out << request.method << " " << request.path << " HTTP/1.1\r\n";
    out << "Host: docker\r\n";
    out << "Connection: close\r\n";
    for (const auto& [key, value] : request.headers) {
        out << key << ": " << value << "\r\n";
    }
    out << "Content-Length: " << request.body.size() << "\r\n";
    out << "\r\n";
    out << request.body;

    return out.str();
}

EngineResponse UnixHttpClient::parse_head(const std::string& raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw std::runtime_error("incomplete response headers");
    }

    EngineResponse resp;
    std::istringstream stream(raw.substr(0, header_end + 2));

    // Status line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    size_t space1 = line.find(' ');
    if (line.compare(0, 5, "HTTP/") != 0 || space1 == std::string::npos) {
        throw std::runtime_error("malformed status line: " + line);
    }
    try {
        resp.status_code = std::stoi(line.substr(space1 + 1, 3));
    } catch (const std::exception&) {
        throw std::runtime_error("malformed status code: " + line);
    }

    // Headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = to_lower(line.substr(0, colon));
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            resp.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    return resp;
}

EngineResponse UnixHttpClient::parse_response(const std::string& raw) {
    EngineResponse resp = parse_head(raw);

    // Body
    std::string rest = raw.substr(raw.find("\r\n\r\n") + 4);
    if (to_lower(resp.header("Transfer-Encoding")) == "chunked") {
        resp.body = decode_chunked(rest);
    } else if (!resp.header("Content-Length").empty()) {
        size_t content_length = 0;
        try {
            content_length = std::stoul(resp.header("Content-Length"));
        } catch (const std::exception&) {
            throw std::runtime_error("malformed Content-Length");
        }
        if (rest.size() < content_length) {
            throw std::runtime_error("incomplete response body");
        }
        resp.body = rest.substr(0, content_length);
    } else {
        resp.body = rest;
    }

    return resp;
}

std::string UnixHttpClient::decode_chunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;

    while (true) {
        size_t line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) {
            throw std::runtime_error("incomplete chunk header");
        }

        std::string size_field = body.substr(pos, line_end - pos);
        size_t extension = size_field.find(';');
        if (extension != std::string::npos) size_field.resize(extension);

        size_t chunk_size = 0;
        try {
            chunk_size = std::stoul(size_field, nullptr, 16);
        } catch (const std::exception&) {
            throw std::runtime_error("malformed chunk size: " + size_field);
        }

        pos = line_end + 2;
        if (chunk_size == 0) {
            // Trailers are not used by the engine
            if (body.find("\r\n", pos) == std::string::npos) {
                throw std::runtime_error("incomplete final chunk");
            }
            return decoded;
        }

        if (body.size() < pos + chunk_size + 2) {
            throw std::runtime_error("incomplete chunk");
        }
        decoded.append(body, pos, chunk_size);
        pos += chunk_size + 2;
    }
}

EngineResponse UnixHttpClient::send(const EngineRequest& request, std::chrono::seconds timeout,
                                    const SendOptions& options) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    SocketGuard sock(connect_socket());

    std::string wire = build_request(request);
    size_t sent = 0;
    while (sent < wire.size()) {
        ssize_t n = ::send(sock.get(), wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw EngineConnectionError(std::string("send: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }

    std::string raw;
    raw.reserve(INITIAL_HTTP_BUFFER);
    char buffer[PIPE_BUFFER_SIZE];
    ReplyFraming framing;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw EngineTimeoutError(request.method + " " + request.path);
        }

        struct pollfd pfd;
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw EngineConnectionError(std::string("poll: ") + std::strerror(errno));
        }
        if (ready == 0) {
            continue;
        }

        ssize_t bytes_read = read(sock.get(), buffer, sizeof(buffer));
        if (bytes_read < 0) {
            if (errno == EINTR) continue;
            throw EngineConnectionError(std::string("read: ") + std::strerror(errno));
        }
        if (bytes_read == 0) {
            break;  // engine closed the connection
        }

        raw.append(buffer, static_cast<size_t>(bytes_read));
        if (!framing.headers_done) {
            framing = inspect_framing(raw);
            if (framing.headers_done && options.on_headers) {
                EngineResponse head;
                try {
                    head = parse_head(raw);
                } catch (const std::runtime_error& e) {
                    throw EngineConnectionError(e.what());
                }
                options.on_headers(head);
            }
        }
        if (options.max_response_bytes > 0 && raw.size() > options.max_response_bytes) {
            size_t size = framing.has_length ? framing.content_length : raw.size();
            throw EngineResponseTooLargeError(request.method + " " + request.path + " exceeds " +
                                                  std::to_string(options.max_response_bytes) +
                                                  " bytes",
                                              size, options.max_response_bytes);
        }
        if (reply_complete(raw, framing)) {
            break;
        }
    }

    if (raw.empty()) {
        throw EngineConnectionError("empty response to " + request.method + " " + request.path);
    }
    try {
        return parse_response(raw);
    } catch (const std::runtime_error& e) {
        throw EngineConnectionError(e.what());
    }
}

} // namespace execbox
