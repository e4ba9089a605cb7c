#include "rtp_packet_source.h"
#include "../../utils/cpp_logger.h"

#include <rtc/rtp.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace voicetap {
namespace audio {

namespace {
constexpr std::size_t kMaxDatagramSize = 1500;
constexpr std::size_t kRtpFixedHeaderSize = 12;
constexpr std::size_t kRtpExtensionPreambleSize = 4;
} // namespace

RtpPacketSource::RtpPacketSource(RtpSourceSettings settings)
    : settings_(std::move(settings)), receive_buffer_(kMaxDatagramSize) {}

RtpPacketSource::~RtpPacketSource() {
    closed_ = true;
    close_socket();
}

bool RtpPacketSource::open() {
    if (socket_fd_ != -1) {
        LOG_CPP_WARNING("[RtpPacketSource] open() called on an open socket");
        return true;
    }

    socket_fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (socket_fd_ == -1) {
        LOG_CPP_ERROR("[RtpPacketSource] Failed to create UDP socket: %s", std::strerror(errno));
        return false;
    }

    int optval = 1;
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
        LOG_CPP_WARNING("[RtpPacketSource] Failed to set SO_REUSEADDR: %s", std::strerror(errno));
    }
    const int recv_buf_size = settings_.receive_buffer_bytes;
    if (recv_buf_size > 0 &&
        setsockopt(socket_fd_, SOL_SOCKET, SO_RCVBUF, &recv_buf_size, sizeof(recv_buf_size)) < 0) {
        LOG_CPP_WARNING("[RtpPacketSource] Failed to set SO_RCVBUF: %s", std::strerror(errno));
    }

    struct sockaddr_in servaddr{};
    servaddr.sin_family = AF_INET;
    servaddr.sin_port = htons(settings_.listen_port);
    if (inet_pton(AF_INET, settings_.bind_address.c_str(), &servaddr.sin_addr) <= 0) {
        LOG_CPP_ERROR("[RtpPacketSource] Invalid bind address: %s", settings_.bind_address.c_str());
        close_socket();
        return false;
    }
    if (bind(socket_fd_, reinterpret_cast<const struct sockaddr*>(&servaddr), sizeof(servaddr)) < 0) {
        LOG_CPP_ERROR("[RtpPacketSource] Could not bind to %s:%u: %s",
                      settings_.bind_address.c_str(), settings_.listen_port, std::strerror(errno));
        close_socket();
        return false;
    }

    struct sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(socket_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = settings_.listen_port;
    }

    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ == -1) {
        LOG_CPP_ERROR("[RtpPacketSource] Failed to create epoll file descriptor: %s", std::strerror(errno));
        close_socket();
        return false;
    }
    struct epoll_event event{};
    event.events = EPOLLIN;
    event.data.fd = socket_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, socket_fd_, &event) == -1) {
        LOG_CPP_ERROR("[RtpPacketSource] Failed to add socket to epoll: %s", std::strerror(errno));
        close_socket();
        return false;
    }

    closed_ = false;
    LOG_CPP_INFO("[RtpPacketSource] Listening on %s:%u (reorder window %ldms)",
                 settings_.bind_address.c_str(), bound_port_, settings_.reorder_window_ms);
    return true;
}

void RtpPacketSource::close() {
    if (!closed_.exchange(true)) {
        LOG_CPP_INFO("[RtpPacketSource] Close requested");
    }
}

void RtpPacketSource::close_socket() {
    if (epoll_fd_ != -1) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (socket_fd_ != -1) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

bool RtpPacketSource::receive(AudioPacket& out_packet) {
    while (!closed_) {
        if (!ready_packets_.empty()) {
            out_packet = std::move(ready_packets_.front());
            ready_packets_.pop_front();
            packets_delivered_++;
            return true;
        }
        if (socket_fd_ == -1) {
            LOG_CPP_ERROR("[RtpPacketSource] receive() called without an open socket");
            return false;
        }
        if (wait_for_datagram()) {
            read_datagram();
        }
        if (settings_.reorder_window_ms > 0) {
            collect_ready_packets(std::chrono::steady_clock::now());
        }
    }
    return false;
}

bool RtpPacketSource::wait_for_datagram() {
    struct epoll_event events[1];
    const int n_events = epoll_wait(epoll_fd_, events, 1, settings_.poll_timeout_ms);
    if (n_events < 0) {
        if (errno != EINTR) {
            LOG_CPP_ERROR("[RtpPacketSource] epoll_wait() error: %s", std::strerror(errno));
        }
        return false;
    }
    return n_events > 0;
}

void RtpPacketSource::read_datagram() {
    struct sockaddr_in cliaddr{};
    socklen_t len = sizeof(cliaddr);
    const ssize_t n_received = recvfrom(socket_fd_, receive_buffer_.data(), receive_buffer_.size(), 0,
                                        reinterpret_cast<struct sockaddr*>(&cliaddr), &len);
    if (n_received < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_CPP_ERROR("[RtpPacketSource] recvfrom() error: %s", std::strerror(errno));
        }
        return;
    }
    datagrams_received_++;

    AudioPacket packet;
    std::string error;
    if (!parse_rtp_datagram(receive_buffer_.data(), static_cast<std::size_t>(n_received), packet, error)) {
        const uint64_t malformed = ++malformed_datagrams_;
        // Log the first and then every hundredth rejection.
        if (malformed == 1 || malformed - last_malformed_log_count_ >= 100) {
            char client_ip_str[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &cliaddr.sin_addr, client_ip_str, sizeof(client_ip_str));
            LOG_CPP_WARNING("[RtpPacketSource] Dropping malformed datagram from %s:%u (%s), total=%llu",
                            client_ip_str, ntohs(cliaddr.sin_port), error.c_str(),
                            static_cast<unsigned long long>(malformed));
            last_malformed_log_count_ = malformed;
        }
        return;
    }
    packet.received_time = std::chrono::steady_clock::now();

    if (known_ssrc_set_.insert(packet.source_tag).second) {
        known_ssrcs_ = known_ssrc_set_.size();
        LOG_CPP_INFO("[RtpPacketSource] New RTP source with SSRC 0x%08X", packet.source_tag);
    }

    if (settings_.reorder_window_ms <= 0) {
        ready_packets_.push_back(std::move(packet));
        return;
    }

    auto it = reordering_buffers_.find(packet.source_tag);
    if (it == reordering_buffers_.end()) {
        it = reordering_buffers_.emplace(packet.source_tag,
                                         RtpReorderingBuffer(std::chrono::milliseconds(settings_.reorder_window_ms),
                                                             settings_.reorder_max_packets)).first;
    }
    it->second.add_packet(std::move(packet));
}

void RtpPacketSource::collect_ready_packets(std::chrono::steady_clock::time_point now) {
    for (auto& entry : reordering_buffers_) {
        for (auto& packet : entry.second.get_ready_packets(now)) {
            ready_packets_.push_back(std::move(packet));
        }
    }
}

RtpPacketSourceStats RtpPacketSource::get_stats() const {
    RtpPacketSourceStats stats;
    stats.datagrams_received = datagrams_received_.load();
    stats.malformed_datagrams = malformed_datagrams_.load();
    stats.packets_delivered = packets_delivered_.load();
    stats.known_ssrcs = known_ssrcs_.load();
    return stats;
}

bool RtpPacketSource::parse_rtp_datagram(const uint8_t* data,
                                         std::size_t size,
                                         AudioPacket& out_packet,
                                         std::string& out_error) {
    if (data == nullptr || size < kRtpFixedHeaderSize) {
        out_error = "datagram too small for an RTP header (" + std::to_string(size) + " bytes)";
        return false;
    }

    const auto* rtp_header = reinterpret_cast<const rtc::RtpHeader*>(data);
    if (rtp_header->version() != 2) {
        out_error = "unsupported RTP version " + std::to_string(rtp_header->version());
        return false;
    }

    std::size_t header_len = rtp_header->getSize();
    if (size < header_len) {
        out_error = "datagram shorter than its CSRC list";
        return false;
    }
    if (rtp_header->extension()) {
        if (size < header_len + kRtpExtensionPreambleSize) {
            out_error = "truncated header extension";
            return false;
        }
        header_len += rtp_header->getExtensionHeaderSize();
        if (size < header_len) {
            out_error = "header extension exceeds datagram";
            return false;
        }
    }

    std::size_t payload_len = size - header_len;
    if (rtp_header->padding()) {
        const uint8_t padding_len = data[size - 1];
        if (padding_len == 0 || padding_len > payload_len) {
            out_error = "invalid padding length " + std::to_string(padding_len);
            return false;
        }
        payload_len -= padding_len;
    }

    out_packet.source_tag = rtp_header->ssrc();
    out_packet.sequence_number = rtp_header->seqNumber();
    out_packet.rtp_timestamp = rtp_header->timestamp();
    out_packet.payload_type = rtp_header->payloadType();
    out_packet.payload.assign(data + header_len, data + header_len + payload_len);
    return true;
}

} // namespace audio
} // namespace voicetap
