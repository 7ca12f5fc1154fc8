#pragma once

#include "heos/config.h"
#include "heos/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace heos {
namespace mdns {

/**
 * DNS record types the browser understands. Anything else is kept as raw
 * rdata.
 */
enum class RecordType : uint16_t {
  kA = 1,
  kPtr = 12,
  kTxt = 16,
  kSrv = 33,
  kAny = 255,
};

constexpr uint16_t kClassIn = 1;
/// Top bit of the class field: cache-flush in answers, QU in questions.
constexpr uint16_t kClassTopBit = 0x8000;
/// Header flag marking a response.
constexpr uint16_t kFlagResponse = 0x8000;

struct Question {
  std::string name;
  uint16_t type = static_cast<uint16_t>(RecordType::kPtr);
  /// Ask for a unicast reply (QU bit).
  bool unicast_response = false;
};

/**
 * One resource record. Typed fields are filled by ParseMessage and used by
 * BuildMessage; rdata holds the raw bytes for every type.
 */
struct Record {
  std::string name;
  uint16_t type = 0;
  uint16_t record_class = kClassIn;
  bool cache_flush = false;
  uint32_t ttl = 0;

  /// PTR target or SRV target host.
  std::string target;
  uint16_t priority = 0;
  uint16_t weight = 0;
  uint16_t port = 0;
  /// A record address, dotted quad.
  std::string address;
  /// TXT character-strings.
  std::vector<std::string> txt;

  std::vector<uint8_t> rdata;
};

struct Message {
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<Question> questions;
  std::vector<Record> answers;
  std::vector<Record> authorities;
  std::vector<Record> additionals;

  bool IsResponse() const { return (flags & kFlagResponse) != 0; }
};

/**
 * Serialize a message. rdata is generated from the typed fields for A, PTR,
 * TXT and SRV records; other types are written from rdata as-is.
 */
std::vector<uint8_t> BuildMessage(const Message& message);

/**
 * Parse a DNS message, following compression pointers.
 *
 * @return false on truncated input, bad label lengths or pointer loops.
 */
bool ParseMessage(const std::vector<uint8_t>& data, Message* message,
                  std::string* error = nullptr);

/**
 * Turn TXT strings into a key/value map. Keys are lower-cased; a key without
 * '=' maps to an empty value; the first occurrence of a key wins.
 */
std::map<std::string, std::string> ParseTxt(const std::vector<std::string>& strings);

/**
 * Lower-case a name and make sure it ends with a dot, for comparisons.
 */
std::string NormalizeName(const std::string& name);

/**
 * "Kitchen._heos-audio._tcp.local." -> "Kitchen" for the given service type.
 */
std::string InstanceLabel(const std::string& instance, const std::string& service_type);

}  // namespace mdns

/**
 * A fully resolved service instance.
 */
struct ResolvedService {
  /// Full instance name, e.g. "Kitchen._heos-audio._tcp.local.".
  std::string instance;
  /// Instance label, e.g. "Kitchen".
  std::string name;
  std::string service_type;
  /// SRV target host.
  std::string host;
  uint16_t port = 0;
  /// IPv4 addresses of the host, in the order they were received.
  std::vector<std::string> addresses;
  /// TXT attributes (lower-case keys).
  std::map<std::string, std::string> txt;
};

/**
 * Browses for service instances and resolves them.
 */
class ServiceBrowser {
 public:
  /// Invoked once per newly seen instance, from the browser's thread.
  using ServiceCallback = std::function<void(const std::string& service_type,
                                             const std::string& instance)>;

  virtual ~ServiceBrowser() = default;

  virtual bool Start(const std::vector<std::string>& service_types,
                     ServiceCallback callback,
                     Error* error) = 0;

  /**
   * Resolve an instance to host, port, addresses and TXT attributes.
   *
   * @return nullopt when resolution does not complete within timeout.
   */
  virtual std::optional<ResolvedService> Resolve(const std::string& service_type,
                                                 const std::string& instance,
                                                 std::chrono::milliseconds timeout) = 0;

  /// Stop browsing and release the socket. Idempotent.
  virtual void Stop() = 0;
};

/**
 * mDNS browser using one-shot queries from an ephemeral UDP port.
 *
 * Replies arrive by unicast; records are cached with their TTLs and goodbye
 * packets (TTL 0) remove instances.
 */
class MdnsBrowser : public ServiceBrowser {
 public:
  explicit MdnsBrowser(const Config& config);
  ~MdnsBrowser() override;

  MdnsBrowser(const MdnsBrowser&) = delete;
  MdnsBrowser& operator=(const MdnsBrowser&) = delete;

  bool Start(const std::vector<std::string>& service_types,
             ServiceCallback callback,
             Error* error) override;
  std::optional<ResolvedService> Resolve(const std::string& service_type,
                                         const std::string& instance,
                                         std::chrono::milliseconds timeout) override;
  void Stop() override;

  /// Instances currently known for a service type (goodbyes removed).
  std::vector<std::string> KnownInstances(const std::string& service_type) const;

  uint64_t packets_received() const;
  uint64_t parse_errors() const;
  uint64_t callback_exceptions() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace heos
