#include "fakes.h"

#include "fake_device.h"
#include "heos/codec.h"

#include <algorithm>
#include <cstring>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace heos {
namespace fakes {

ScriptedConnection::ScriptedConnection(Responder responder, std::shared_ptr<State> state)
    : responder_(std::move(responder)), state_(std::move(state)) {}

ScriptedConnection::~ScriptedConnection() { Close(); }

bool ScriptedConnection::SendLine(const std::string& line, std::chrono::milliseconds,
                                  Error* error) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->closed) {
      if (error) {
        *error = Error{ErrorKind::kConnectionLost, "scripted connection closed"};
      }
      return false;
    }
    state_->sent.push_back(line);
  }
  std::string trimmed = line;
  if (trimmed.size() >= 2 && trimmed.compare(trimmed.size() - 2, 2, "\r\n") == 0) {
    trimmed.resize(trimmed.size() - 2);
  }
  if (responder_) {
    for (const auto& reply : responder_(trimmed)) {
      pending_.push_back(reply);
    }
  }
  return true;
}

bool ScriptedConnection::ReceiveLine(std::chrono::milliseconds, bool, std::string* line,
                                     Error* error) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->closed) {
      if (error) {
        *error = Error{ErrorKind::kConnectionLost, "scripted connection closed"};
      }
      return false;
    }
  }
  if (pending_.empty()) {
    if (error) {
      *error = Error{ErrorKind::kReadTimeout, "no scripted reply"};
    }
    return false;
  }
  if (line) {
    *line = pending_.front();
  }
  pending_.pop_front();
  return true;
}

void ScriptedConnection::Close() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (!state_->closed) {
    ++state_->close_calls;
  }
  state_->closed = true;
}

bool ScriptedConnection::IsOpen() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return !state_->closed;
}

ScriptedConnector::ScriptedConnector(ScriptedConnection::Responder responder)
    : shared_(std::make_shared<Shared>()) {
  shared_->responder = std::move(responder);
}

Connector ScriptedConnector::connector() {
  std::shared_ptr<Shared> shared = shared_;
  return [shared](const std::string& address, uint16_t port, std::chrono::milliseconds,
                  Error* error) -> std::unique_ptr<Connection> {
    std::lock_guard<std::mutex> lock(shared->mutex);
    ++shared->connects;
    if (shared->fail_remaining > 0) {
      --shared->fail_remaining;
      if (error) {
        *error = Error{shared->fail_kind,
                       "scripted connect failure to " + address + ":" + std::to_string(port)};
      }
      return nullptr;
    }
    auto state = std::make_shared<ScriptedConnection::State>();
    shared->states.push_back(state);
    return std::unique_ptr<Connection>(new ScriptedConnection(shared->responder, state));
  };
}

void ScriptedConnector::FailNext(int count, ErrorKind kind) {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->fail_remaining = count;
  shared_->fail_kind = kind;
}

int ScriptedConnector::connects() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->connects;
}

std::vector<std::shared_ptr<ScriptedConnection::State>> ScriptedConnector::states() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->states;
}

std::vector<std::string> HeartbeatEcho(const std::string& line) {
  CommandRequest request;
  if (!ParseCommandLine(line, &request)) {
    return {};
  }
  if (request.command == kHeartbeatCommand) {
    return {ReplyLine(request.command, true, "")};
  }
  return {ReplyLine(request.command, true, "echo")};
}

FakeBrowser::FakeBrowser(std::shared_ptr<BrowserScript> script) : script_(std::move(script)) {
  script_->created.fetch_add(1);
}

FakeBrowser::~FakeBrowser() { Stop(); }

bool FakeBrowser::Start(const std::vector<std::string>&, ServiceCallback callback,
                        Error* error) {
  script_->started.fetch_add(1);
  if (script_->fail_start) {
    if (error) {
      *error = Error{ErrorKind::kDiscoveryFailed, "scripted start failure"};
    }
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
    stopping_ = false;
  }
  thread_ = std::thread([this, callback]() {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_for(lock, script_->announce_delay, [this]() { return stopping_; })) {
        return;
      }
    }
    for (const auto& announcement : script_->announcements) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
          return;
        }
      }
      if (callback) {
        callback(announcement.service_type, announcement.instance);
      }
    }
  });
  return true;
}

std::optional<ResolvedService> FakeBrowser::Resolve(const std::string&,
                                                    const std::string& instance,
                                                    std::chrono::milliseconds timeout) {
  script_->resolves.fetch_add(1);
  if (script_->resolve_delay.count() > 0) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, std::min(script_->resolve_delay, timeout),
                     [this]() { return stopping_; }) ||
        script_->resolve_delay > timeout) {
      return std::nullopt;
    }
  }
  auto it = script_->resolutions.find(instance);
  if (it == script_->resolutions.end()) {
    return std::nullopt;
  }
  return it->second;
}

void FakeBrowser::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  script_->stopped.fetch_add(1);
}

BrowserFactory MakeBrowserFactory(std::shared_ptr<BrowserScript> script) {
  return [script](const Config&) -> std::unique_ptr<ServiceBrowser> {
    return std::unique_ptr<ServiceBrowser>(new FakeBrowser(script));
  };
}

ResolvedService MakeService(const std::string& name,
                            const std::vector<std::string>& addresses,
                            uint16_t port) {
  ResolvedService service;
  service.service_type = kServiceType;
  service.instance = name + "." + kServiceType;
  service.name = name;
  service.host = name + ".local.";
  service.port = port;
  service.addresses = addresses;
  service.txt["model"] = "HEOS 1";
  service.txt["vers"] = "1.583.147";
  service.txt["networkid"] = "a1b2c3";
  service.txt["did"] = "ADAG9170202780";
  return service;
}

FakeMdnsResponder::FakeMdnsResponder() = default;

FakeMdnsResponder::~FakeMdnsResponder() { Stop(); }

bool FakeMdnsResponder::Start() {
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  socklen_t len = sizeof(addr);
  ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
  port_ = ntohs(addr.sin_port);
  running_ = true;
  thread_ = std::thread([this]() { Loop(); });
  return true;
}

void FakeMdnsResponder::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  ::close(fd_);
  fd_ = -1;
}

void FakeMdnsResponder::AddService(const Service& service) {
  std::lock_guard<std::mutex> lock(mutex_);
  services_.push_back(service);
}

void FakeMdnsResponder::SendRaw(const std::vector<uint8_t>& packet) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!have_peer_) {
    return;
  }
  ::sendto(fd_, packet.data(), packet.size(), 0,
           reinterpret_cast<const sockaddr*>(&last_peer_), sizeof(last_peer_));
}

void FakeMdnsResponder::SendGoodbye(const std::string& service_type,
                                    const std::string& instance_label) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    services_.erase(std::remove_if(services_.begin(), services_.end(),
                                   [&](const Service& service) {
                                     return service.service_type == service_type &&
                                            service.instance_label == instance_label;
                                   }),
                    services_.end());
  }
  mdns::Message message;
  message.flags = 0x8400;
  mdns::Record ptr;
  ptr.name = service_type;
  ptr.type = static_cast<uint16_t>(mdns::RecordType::kPtr);
  ptr.ttl = 0;
  ptr.target = instance_label + "." + service_type;
  message.answers.push_back(ptr);
  SendRaw(mdns::BuildMessage(message));
}

void FakeMdnsResponder::Loop() {
  std::vector<uint8_t> buffer(9000);
  while (running_) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    if (::poll(&pfd, 1, 50) <= 0) {
      continue;
    }
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                 reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n <= 0) {
      continue;
    }
    mdns::Message query;
    if (!mdns::ParseMessage(std::vector<uint8_t>(buffer.begin(), buffer.begin() + n), &query) ||
        query.IsResponse()) {
      continue;
    }
    queries_.fetch_add(1);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_peer_ = from;
      have_peer_ = true;
    }
    Answer(query, from);
  }
}

void FakeMdnsResponder::Answer(const mdns::Message& query, const sockaddr_in& to) {
  using mdns::NormalizeName;
  using mdns::RecordType;
  auto make = [](const std::string& name, RecordType type) {
    mdns::Record record;
    record.name = name;
    record.type = static_cast<uint16_t>(type);
    record.ttl = 120;
    record.cache_flush = type != RecordType::kPtr;
    return record;
  };

  mdns::Message reply;
  reply.id = query.id;
  reply.flags = 0x8400;
  std::vector<Service> services;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    services = services_;
  }
  for (const auto& question : query.questions) {
    for (const auto& service : services) {
      const std::string instance = service.instance_label + "." + service.service_type;
      auto add_details = [&](std::vector<mdns::Record>* section) {
        mdns::Record srv = make(instance, RecordType::kSrv);
        srv.port = service.port;
        srv.target = service.host;
        section->push_back(srv);
        mdns::Record txt = make(instance, RecordType::kTxt);
        txt.txt = service.txt;
        section->push_back(txt);
        for (const auto& address : service.addresses) {
          mdns::Record a = make(service.host, RecordType::kA);
          a.address = address;
          section->push_back(a);
        }
      };
      const std::string qname = NormalizeName(question.name);
      if (question.type == static_cast<uint16_t>(RecordType::kPtr) &&
          qname == NormalizeName(service.service_type)) {
        mdns::Record ptr = make(service.service_type, RecordType::kPtr);
        ptr.target = instance;
        reply.answers.push_back(ptr);
        add_details(&reply.additionals);
      } else if ((question.type == static_cast<uint16_t>(RecordType::kSrv) ||
                  question.type == static_cast<uint16_t>(RecordType::kTxt)) &&
                 qname == NormalizeName(instance)) {
        add_details(&reply.answers);
      } else if (question.type == static_cast<uint16_t>(RecordType::kA) &&
                 qname == NormalizeName(service.host)) {
        for (const auto& address : service.addresses) {
          mdns::Record a = make(service.host, RecordType::kA);
          a.address = address;
          reply.answers.push_back(a);
        }
      }
    }
  }
  if (reply.answers.empty()) {
    return;
  }
  const std::vector<uint8_t> packet = mdns::BuildMessage(reply);
  ::sendto(fd_, packet.data(), packet.size(), 0, reinterpret_cast<const sockaddr*>(&to),
           sizeof(to));
}

}  // namespace fakes
}  // namespace heos
