#include "tcp_speech_recognizer.h"

#include "../utils/cpp_logger.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace voicetap {
namespace audio {

namespace {

bool read_exact_fd(int fd, void* buf, size_t nbytes) {
    uint8_t* p = static_cast<uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = recv(fd, p + off, nbytes - off, 0);
        if (m < 0 && errno == EINTR) continue;
        if (m <= 0) return false;
        off += static_cast<size_t>(m);
    }
    return true;
}

// On failure `out_errno` holds the cause; a send that makes no progress reports EPIPE.
bool write_all_fd(int fd, const void* buf, size_t nbytes, int& out_errno) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t off = 0;
    while (off < nbytes) {
        ssize_t m = send(fd, p + off, nbytes - off, MSG_NOSIGNAL);
        if (m < 0 && errno == EINTR) continue;
        if (m < 0) {
            out_errno = errno;
            return false;
        }
        if (m == 0) {
            out_errno = EPIPE;
            return false;
        }
        off += static_cast<size_t>(m);
    }
    return true;
}

bool write_u32(int fd, uint32_t value, int& out_errno) {
    const uint32_t be = htonl(value);
    return write_all_fd(fd, &be, sizeof(be), out_errno);
}

bool read_u32(int fd, uint32_t& value) {
    uint32_t be = 0;
    if (!read_exact_fd(fd, &be, sizeof(be))) {
        return false;
    }
    value = ntohl(be);
    return true;
}

void set_io_timeout(int fd, long timeout_ms) {
    if (timeout_ms <= 0) {
        return;
    }
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Connects with a bounded wait; the socket is returned to blocking mode.
bool connect_with_timeout(int fd, const struct sockaddr* addr, socklen_t addr_len, long timeout_ms, std::string& out_error) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        out_error = std::string("fcntl failed: ") + std::strerror(errno);
        return false;
    }

    int rc = connect(fd, addr, addr_len);
    if (rc < 0 && errno != EINPROGRESS) {
        out_error = std::string("connect failed: ") + std::strerror(errno);
        return false;
    }
    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        rc = poll(&pfd, 1, timeout_ms > 0 ? static_cast<int>(timeout_ms) : -1);
        if (rc == 0) {
            out_error = "connect timed out";
            return false;
        }
        if (rc < 0) {
            out_error = std::string("poll failed: ") + std::strerror(errno);
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            out_error = std::string("connect failed: ") + std::strerror(so_error != 0 ? so_error : errno);
            return false;
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        out_error = std::string("fcntl failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace

TcpSpeechRecognizer::TcpSpeechRecognizer(RecognizerEndpoint endpoint) : endpoint_(std::move(endpoint)) {
    LOG_CPP_INFO("[TcpSpeechRecognizer] Using transcription service at %s:%u",
                 endpoint_.host.c_str(), endpoint_.port);
}

std::string TcpSpeechRecognizer::build_metadata(uint32_t source_tag, const RecognitionFormat& format) {
    std::string metadata;
    metadata += "source_tag=" + std::to_string(source_tag) + "\n";
    metadata += "sample_rate=" + std::to_string(format.sample_rate) + "\n";
    metadata += "channels=" + std::to_string(format.channels) + "\n";
    metadata += "encoding=" + format.encoding + "\n";
    metadata += "language=" + format.language_code + "\n";
    return metadata;
}

int TcpSpeechRecognizer::connect_to_service(std::string& out_error) const {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* results = nullptr;
    const std::string port = std::to_string(endpoint_.port);
    const int gai = getaddrinfo(endpoint_.host.c_str(), port.c_str(), &hints, &results);
    if (gai != 0) {
        out_error = std::string("cannot resolve ") + endpoint_.host + ": " + gai_strerror(gai);
        return -1;
    }

    int fd = -1;
    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            out_error = std::string("socket failed: ") + std::strerror(errno);
            continue;
        }
        if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, endpoint_.connect_timeout_ms, out_error)) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd >= 0) {
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        set_io_timeout(fd, endpoint_.io_timeout_ms);
    }
    return fd;
}

RecognitionResult TcpSpeechRecognizer::recognize(uint32_t source_tag,
                                                 const std::vector<uint8_t>& encoded_audio,
                                                 const RecognitionFormat& format) {
    RecognitionResult result;
    if (encoded_audio.empty()) {
        result.error = "no audio to recognize";
        return result;
    }

    std::string error;
    const int fd = connect_to_service(error);
    if (fd < 0) {
        result.error = error;
        return result;
    }

    const std::string metadata = build_metadata(source_tag, format);
    int send_errno = 0;
    const bool sent = write_u32(fd, static_cast<uint32_t>(metadata.size()), send_errno) &&
                      write_all_fd(fd, metadata.data(), metadata.size(), send_errno) &&
                      write_u32(fd, static_cast<uint32_t>(encoded_audio.size()), send_errno) &&
                      write_all_fd(fd, encoded_audio.data(), encoded_audio.size(), send_errno);
    if (!sent) {
        result.error = std::string("failed to send request: ") + std::strerror(send_errno);
        ::close(fd);
        return result;
    }

    uint32_t status = 0;
    uint32_t confidence_bits = 0;
    uint32_t text_length = 0;
    if (!read_u32(fd, status) || !read_u32(fd, confidence_bits) || !read_u32(fd, text_length)) {
        result.error = "connection closed before reply header";
        ::close(fd);
        return result;
    }
    if (text_length > kMaxRecognizerReplyBytes) {
        result.error = "reply text too large (" + std::to_string(text_length) + " bytes)";
        ::close(fd);
        return result;
    }
    std::string text(text_length, '\0');
    if (text_length > 0 && !read_exact_fd(fd, &text[0], text_length)) {
        result.error = "connection closed before reply text";
        ::close(fd);
        return result;
    }
    ::close(fd);

    if (status != 0) {
        result.error = text.empty() ? "service returned status " + std::to_string(status) : text;
        return result;
    }

    float confidence = 0.0f;
    static_assert(sizeof(confidence) == sizeof(confidence_bits), "float must be 32 bits");
    std::memcpy(&confidence, &confidence_bits, sizeof(confidence));

    result.success = true;
    result.transcript = std::move(text);
    result.confidence = confidence;
    LOG_CPP_DEBUG("[TcpSpeechRecognizer] SSRC 0x%08X: %zu bytes -> %zu chars", source_tag,
                  encoded_audio.size(), result.transcript.size());
    return result;
}

} // namespace audio
} // namespace voicetap
