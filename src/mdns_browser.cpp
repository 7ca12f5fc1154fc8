#include "heos/mdns.h"

#include "log.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace heos {
namespace {

using Clock = std::chrono::steady_clock;
using mdns::NormalizeName;
using mdns::RecordType;

constexpr size_t kMaxPacketSize = 9000;
constexpr auto kResolveRequery = std::chrono::milliseconds(250);

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    ::inet_pton(AF_INET, address.c_str(), &addr.sin_addr);
  }
  return addr;
}

bool IsAnyAddress(const std::string& address) {
  return address.empty() || address == "0.0.0.0";
}

// UDP socket used for one-shot mDNS queries and their unicast replies.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(const std::string& bind_address) {
    if (fd_ >= 0) {
      return true;
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      last_error_ = "socket() failed: " + std::string(std::strerror(errno));
      return false;
    }
    sockaddr_in addr = MakeSockaddr(bind_address, 0);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "bind(" << bind_address << ":0) failed: " << std::strerror(errno);
      last_error_ = oss.str();
      Close();
      return false;
    }
    return true;
  }

  // Multicast options; failures are reported but leave the socket usable.
  bool ConfigureMulticast(const std::string& interface_address) {
    bool ok = true;
    unsigned char ttl = 255;
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
      last_error_ = "setsockopt(IP_MULTICAST_TTL) failed: " + std::string(std::strerror(errno));
      ok = false;
    }
    unsigned char loop = 1;
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
      last_error_ = "setsockopt(IP_MULTICAST_LOOP) failed: " + std::string(std::strerror(errno));
      ok = false;
    }
    if (!IsAnyAddress(interface_address)) {
      in_addr iface = MakeSockaddr(interface_address, 0).sin_addr;
      if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) < 0) {
        last_error_ = "setsockopt(IP_MULTICAST_IF) failed: " + std::string(std::strerror(errno));
        ok = false;
      }
    }
    return ok;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
    return ::sendto(fd_, data.data(), data.size(), 0,
                    reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  }

  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len) {
    return ::recvfrom(fd_, buffer, length, 0,
                      reinterpret_cast<sockaddr*>(addr), addr_len);
  }

 private:
  int fd_ = -1;
  std::string last_error_;
};

Clock::time_point ExpiresAt(Clock::time_point now, uint32_t ttl) {
  return now + std::chrono::seconds(ttl);
}

}  // namespace

struct MdnsBrowser::Impl {
  struct InstanceEntry {
    std::string instance;
    Clock::time_point expires;
  };
  struct SrvEntry {
    std::string host;
    uint16_t port = 0;
    Clock::time_point expires;
  };
  struct TxtEntry {
    std::vector<std::string> strings;
    Clock::time_point expires;
  };
  struct AddressEntry {
    std::string address;
    Clock::time_point expires;
  };

  explicit Impl(const Config& cfg) : config(cfg) {}

  ~Impl() { Stop(); }

  bool Start(const std::vector<std::string>& service_types,
             ServiceCallback callback, Error* error) {
    if (running) {
      return internal::Fail(error, ErrorKind::kInvalidArgument, "browser already started");
    }
    if (service_types.empty()) {
      return internal::Fail(error, ErrorKind::kInvalidArgument, "no service types to browse");
    }
    if (!socket.Open(config.bind_address)) {
      internal::LogError(config, "mDNS " + socket.last_error());
      return internal::Fail(error, ErrorKind::kDiscoveryFailed, socket.last_error());
    }
    if (!socket.ConfigureMulticast(config.bind_address)) {
      internal::LogWarning(config, "mDNS " + socket.last_error());
    }
    destination = MakeSockaddr(config.mdns_group, config.mdns_port);
    {
      std::lock_guard<std::mutex> lock(mutex);
      browse_types.clear();
      for (const auto& type : service_types) {
        browse_types.push_back(NormalizeName(type));
      }
    }
    {
      std::lock_guard<std::mutex> lock(callback_mutex);
      service_cb = std::move(callback);
    }
    running = true;
    SendBrowseQueries();
    next_browse_query = Clock::now() + config.mdns_query_interval;
    try {
      recv_thread = std::thread([this]() { RecvLoop(); });
    } catch (const std::exception& ex) {
      const std::string message = std::string("thread start failed: ") + ex.what();
      internal::LogError(config, message);
      running = false;
      socket.Close();
      return internal::Fail(error, ErrorKind::kDiscoveryFailed, message);
    }
    return true;
  }

  void Stop() {
    if (!running.exchange(false)) {
      return;
    }
    {
      // Pairs with the running check in Resolve.
      std::lock_guard<std::mutex> lock(mutex);
    }
    cv.notify_all();
    if (recv_thread.joinable()) {
      recv_thread.join();
    }
    socket.Close();
    std::lock_guard<std::mutex> lock(callback_mutex);
    service_cb = nullptr;
  }

  void SendQuery(const std::vector<mdns::Question>& questions) {
    if (questions.empty() || socket.fd() < 0) {
      return;
    }
    mdns::Message query;
    query.questions = questions;
    const std::vector<uint8_t> packet = mdns::BuildMessage(query);
    const ssize_t sent = socket.SendTo(packet, destination);
    if (sent < 0 || static_cast<size_t>(sent) != packet.size()) {
      send_errors.fetch_add(1);
      internal::LogDebug(config, "mDNS query send failed: " + std::string(std::strerror(errno)));
    }
  }

  void SendBrowseQueries() {
    std::vector<mdns::Question> questions;
    {
      std::lock_guard<std::mutex> lock(mutex);
      for (const auto& type : browse_types) {
        mdns::Question question;
        question.name = type;
        question.type = static_cast<uint16_t>(RecordType::kPtr);
        question.unicast_response = true;
        questions.push_back(question);
      }
    }
    SendQuery(questions);
  }

  void RecvLoop() {
    std::array<uint8_t, kMaxPacketSize> buffer{};
    while (running) {
      const int fd = socket.fd();
      if (fd < 0) {
        internal::LogError(config, "mDNS receive loop: socket closed, stopping");
        return;
      }
      fd_set readfds;
      FD_ZERO(&readfds);
      FD_SET(fd, &readfds);
      timeval tv{};
      tv.tv_sec = 0;
      tv.tv_usec = 200000;
      const int ready = ::select(fd + 1, &readfds, nullptr, nullptr, &tv);
      if (ready > 0 && FD_ISSET(fd, &readfds)) {
        sockaddr_in addr{};
        socklen_t addr_len = sizeof(addr);
        const ssize_t bytes = socket.RecvFrom(buffer.data(), buffer.size(), &addr, &addr_len);
        if (bytes > 0) {
          packets_received.fetch_add(1);
          ProcessPacket(std::vector<uint8_t>(buffer.begin(), buffer.begin() + bytes));
        }
      }
      if (running && Clock::now() >= next_browse_query) {
        SendBrowseQueries();
        next_browse_query = Clock::now() + config.mdns_query_interval;
      }
    }
  }

  void ProcessPacket(const std::vector<uint8_t>& packet) {
    mdns::Message message;
    std::string parse_error;
    if (!mdns::ParseMessage(packet, &message, &parse_error)) {
      parse_errors.fetch_add(1);
      internal::LogDebug(config, "dropping malformed mDNS packet: " + parse_error);
      return;
    }
    if (!message.IsResponse()) {
      return;
    }
    std::vector<std::pair<std::string, std::string>> seen;
    {
      std::lock_guard<std::mutex> lock(mutex);
      const auto now = Clock::now();
      for (const auto* section : {&message.answers, &message.additionals}) {
        for (const auto& record : *section) {
          ApplyRecordLocked(record, now, &seen);
        }
      }
    }
    cv.notify_all();
    if (seen.empty()) {
      return;
    }
    ServiceCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex);
      callback = service_cb;
    }
    if (!callback) {
      return;
    }
    for (const auto& item : seen) {
      try {
        callback(item.first, item.second);
      } catch (const std::exception& ex) {
        RecordCallbackException(ex.what());
      } catch (...) {
        RecordCallbackException("unknown exception");
      }
    }
  }

  void RecordCallbackException(const std::string& what) {
    callback_exceptions.fetch_add(1);
    internal::LogError(config, "ServiceCallback threw exception: " + what);
  }

  void ApplyRecordLocked(const mdns::Record& record, Clock::time_point now,
                         std::vector<std::pair<std::string, std::string>>* seen) {
    const std::string key = NormalizeName(record.name);
    switch (static_cast<RecordType>(record.type)) {
      case RecordType::kPtr: {
        auto type_it = std::find(browse_types.begin(), browse_types.end(), key);
        if (type_it == browse_types.end()) {
          return;
        }
        auto& instances = instances_by_type[key];
        const std::string instance_key = NormalizeName(record.target);
        if (record.ttl == 0) {
          instances.erase(instance_key);
          srv.erase(instance_key);
          txt.erase(instance_key);
          internal::LogDebug(config, "mDNS goodbye for " + record.target);
          return;
        }
        auto it = instances.find(instance_key);
        if (it == instances.end() || it->second.expires <= now) {
          seen->emplace_back(*type_it, record.target);
        }
        instances[instance_key] = InstanceEntry{record.target, ExpiresAt(now, record.ttl)};
        return;
      }
      case RecordType::kSrv:
        if (record.ttl == 0) {
          srv.erase(key);
        } else {
          srv[key] = SrvEntry{record.target, record.port, ExpiresAt(now, record.ttl)};
        }
        return;
      case RecordType::kTxt:
        if (record.ttl == 0) {
          txt.erase(key);
        } else {
          txt[key] = TxtEntry{record.txt, ExpiresAt(now, record.ttl)};
        }
        return;
      case RecordType::kA: {
        auto& entries = addresses[key];
        auto it = std::find_if(entries.begin(), entries.end(), [&](const AddressEntry& e) {
          return e.address == record.address;
        });
        if (record.ttl == 0) {
          if (it != entries.end()) {
            entries.erase(it);
          }
        } else if (it != entries.end()) {
          it->expires = ExpiresAt(now, record.ttl);
        } else {
          entries.push_back(AddressEntry{record.address, ExpiresAt(now, record.ttl)});
        }
        return;
      }
      default:
        return;
    }
  }

  // Fills out when SRV and at least one A record are cached and fresh.
  bool CompleteLocked(const std::string& service_type, const std::string& instance,
                      Clock::time_point now, ResolvedService* out,
                      std::vector<mdns::Question>* missing) const {
    const std::string key = NormalizeName(instance);
    auto srv_it = srv.find(key);
    auto txt_it = txt.find(key);
    const bool have_srv = srv_it != srv.end() && srv_it->second.expires > now;
    const bool have_txt = txt_it != txt.end() && txt_it->second.expires > now;
    std::vector<std::string> found;
    if (have_srv) {
      auto addr_it = addresses.find(NormalizeName(srv_it->second.host));
      if (addr_it != addresses.end()) {
        for (const auto& entry : addr_it->second) {
          if (entry.expires > now) {
            found.push_back(entry.address);
          }
        }
      }
    }
    if (have_srv && !found.empty()) {
      out->instance = instance;
      out->name = mdns::InstanceLabel(instance, service_type);
      out->service_type = service_type;
      out->host = srv_it->second.host;
      out->port = srv_it->second.port;
      out->addresses = found;
      if (have_txt) {
        out->txt = mdns::ParseTxt(txt_it->second.strings);
      }
      return true;
    }
    if (missing) {
      missing->clear();
      if (!have_srv) {
        missing->push_back(mdns::Question{instance, static_cast<uint16_t>(RecordType::kSrv), true});
      }
      if (!have_txt) {
        missing->push_back(mdns::Question{instance, static_cast<uint16_t>(RecordType::kTxt), true});
      }
      if (have_srv) {
        missing->push_back(mdns::Question{srv_it->second.host,
                                          static_cast<uint16_t>(RecordType::kA), true});
      }
    }
    return false;
  }

  std::optional<ResolvedService> Resolve(const std::string& service_type,
                                         const std::string& instance,
                                         std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    auto next_query = Clock::now();
    std::unique_lock<std::mutex> lock(mutex);
    for (;;) {
      const auto now = Clock::now();
      ResolvedService resolved;
      std::vector<mdns::Question> missing;
      if (CompleteLocked(service_type, instance, now, &resolved, &missing)) {
        return resolved;
      }
      if (!running || now >= deadline) {
        internal::LogDebug(config, "mDNS resolve timed out for " + instance);
        return std::nullopt;
      }
      if (now >= next_query) {
        lock.unlock();
        SendQuery(missing);
        lock.lock();
        next_query = now + kResolveRequery;
      }
      cv.wait_until(lock, std::min(deadline, next_query));
    }
  }

  std::vector<std::string> KnownInstances(const std::string& service_type) const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = instances_by_type.find(NormalizeName(service_type));
    if (it == instances_by_type.end()) {
      return out;
    }
    const auto now = Clock::now();
    for (const auto& entry : it->second) {
      if (entry.second.expires > now) {
        out.push_back(entry.second.instance);
      }
    }
    return out;
  }

  Config config;
  UdpSocket socket;
  sockaddr_in destination{};
  std::atomic<bool> running{false};
  std::thread recv_thread;
  Clock::time_point next_browse_query;

  mutable std::mutex mutex;
  std::condition_variable cv;
  std::vector<std::string> browse_types;
  std::unordered_map<std::string, std::unordered_map<std::string, InstanceEntry>>
      instances_by_type;
  std::unordered_map<std::string, SrvEntry> srv;
  std::unordered_map<std::string, TxtEntry> txt;
  std::unordered_map<std::string, std::vector<AddressEntry>> addresses;

  std::mutex callback_mutex;
  ServiceCallback service_cb;

  std::atomic<uint64_t> packets_received{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> send_errors{0};
  std::atomic<uint64_t> callback_exceptions{0};
};

MdnsBrowser::MdnsBrowser(const Config& config) : impl_(new Impl(config)) {}

MdnsBrowser::~MdnsBrowser() = default;

bool MdnsBrowser::Start(const std::vector<std::string>& service_types,
                        ServiceCallback callback,
                        Error* error) {
  return impl_->Start(service_types, std::move(callback), error);
}

std::optional<ResolvedService> MdnsBrowser::Resolve(const std::string& service_type,
                                                    const std::string& instance,
                                                    std::chrono::milliseconds timeout) {
  return impl_->Resolve(service_type, instance, timeout);
}

void MdnsBrowser::Stop() { impl_->Stop(); }

std::vector<std::string> MdnsBrowser::KnownInstances(const std::string& service_type) const {
  return impl_->KnownInstances(service_type);
}

uint64_t MdnsBrowser::packets_received() const { return impl_->packets_received.load(); }

uint64_t MdnsBrowser::parse_errors() const { return impl_->parse_errors.load(); }

uint64_t MdnsBrowser::callback_exceptions() const {
  return impl_->callback_exceptions.load();
}

}  // namespace heos
