#include "heos/mdns.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace heos {
namespace mdns {
namespace {

constexpr size_t kHeaderSize = 12;
constexpr size_t kMaxLabelLength = 63;
constexpr size_t kMaxNameLength = 255;
constexpr int kMaxPointerJumps = 16;

void WriteU16(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back(static_cast<uint8_t>(value >> 8));
  out.push_back(static_cast<uint8_t>(value & 0xff));
}

void WriteU32(std::vector<uint8_t>& out, uint32_t value) {
  out.push_back(static_cast<uint8_t>(value >> 24));
  out.push_back(static_cast<uint8_t>((value >> 16) & 0xff));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  out.push_back(static_cast<uint8_t>(value & 0xff));
}

std::vector<std::string> SplitLabels(const std::string& name) {
  std::vector<std::string> labels;
  std::string current;
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (c == '\\' && i + 1 < name.size()) {
      current += name[++i];
      continue;
    }
    if (c == '.') {
      if (!current.empty()) {
        labels.push_back(current);
      }
      current.clear();
      continue;
    }
    current += c;
  }
  if (!current.empty()) {
    labels.push_back(current);
  }
  return labels;
}

void WriteName(std::vector<uint8_t>& out, const std::string& name) {
  for (auto label : SplitLabels(name)) {
    if (label.size() > kMaxLabelLength) {
      label.resize(kMaxLabelLength);
    }
    out.push_back(static_cast<uint8_t>(label.size()));
    out.insert(out.end(), label.begin(), label.end());
  }
  out.push_back(0);
}

std::vector<uint8_t> EncodeRdata(const Record& record) {
  std::vector<uint8_t> rdata;
  switch (static_cast<RecordType>(record.type)) {
    case RecordType::kA: {
      in_addr addr{};
      if (::inet_pton(AF_INET, record.address.c_str(), &addr) == 1) {
        const auto* bytes = reinterpret_cast<const uint8_t*>(&addr.s_addr);
        rdata.assign(bytes, bytes + 4);
      } else {
        rdata = record.rdata;
      }
      break;
    }
    case RecordType::kPtr:
      WriteName(rdata, record.target);
      break;
    case RecordType::kSrv:
      WriteU16(rdata, record.priority);
      WriteU16(rdata, record.weight);
      WriteU16(rdata, record.port);
      WriteName(rdata, record.target);
      break;
    case RecordType::kTxt:
      for (auto entry : record.txt) {
        if (entry.size() > 255) {
          entry.resize(255);
        }
        rdata.push_back(static_cast<uint8_t>(entry.size()));
        rdata.insert(rdata.end(), entry.begin(), entry.end());
      }
      if (rdata.empty()) {
        rdata.push_back(0);
      }
      break;
    default:
      rdata = record.rdata;
      break;
  }
  return rdata;
}

void WriteRecord(std::vector<uint8_t>& out, const Record& record) {
  WriteName(out, record.name);
  WriteU16(out, record.type);
  WriteU16(out, static_cast<uint16_t>((record.record_class & ~kClassTopBit) |
                                      (record.cache_flush ? kClassTopBit : 0)));
  WriteU32(out, record.ttl);
  const std::vector<uint8_t> rdata = EncodeRdata(record);
  WriteU16(out, static_cast<uint16_t>(rdata.size()));
  out.insert(out.end(), rdata.begin(), rdata.end());
}

// Bounds-checked cursor over a whole packet.
class Reader {
 public:
  explicit Reader(const std::vector<uint8_t>& data) : data_(data) {}

  size_t offset() const { return offset_; }
  void set_offset(size_t offset) { offset_ = offset; }
  size_t remaining() const { return data_.size() - offset_; }

  bool ReadU16(uint16_t* value) {
    if (remaining() < 2) {
      return false;
    }
    *value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return true;
  }

  bool ReadU32(uint32_t* value) {
    if (remaining() < 4) {
      return false;
    }
    *value = (static_cast<uint32_t>(data_[offset_]) << 24) |
             (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
             (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
             static_cast<uint32_t>(data_[offset_ + 3]);
    offset_ += 4;
    return true;
  }

  // Reads a possibly compressed name starting at the cursor.
  bool ReadName(std::string* name) {
    std::string out;
    size_t pos = offset_;
    size_t resume = 0;
    bool jumped = false;
    int jumps = 0;
    for (;;) {
      if (pos >= data_.size()) {
        return false;
      }
      const uint8_t length = data_[pos];
      if ((length & 0xc0) == 0xc0) {
        if (pos + 1 >= data_.size()) {
          return false;
        }
        const size_t pointer = (static_cast<size_t>(length & 0x3f) << 8) | data_[pos + 1];
        // Pointers must go backwards; together with the jump cap this rules
        // out loops.
        if (pointer >= pos || ++jumps > kMaxPointerJumps) {
          return false;
        }
        if (!jumped) {
          resume = pos + 2;
          jumped = true;
        }
        pos = pointer;
        continue;
      }
      if ((length & 0xc0) != 0) {
        return false;
      }
      if (length == 0) {
        ++pos;
        break;
      }
      if (pos + 1 + length > data_.size()) {
        return false;
      }
      if (!out.empty()) {
        out += '.';
      }
      out.append(reinterpret_cast<const char*>(&data_[pos + 1]), length);
      if (out.size() > kMaxNameLength) {
        return false;
      }
      pos += 1 + length;
    }
    offset_ = jumped ? resume : pos;
    *name = out + ".";
    return true;
  }

 private:
  const std::vector<uint8_t>& data_;
  size_t offset_ = 0;
};

bool DecodeRdata(const std::vector<uint8_t>& data, size_t start, size_t length,
                 Record* record) {
  Reader reader(data);
  reader.set_offset(start);
  switch (static_cast<RecordType>(record->type)) {
    case RecordType::kA: {
      if (length != 4) {
        return false;
      }
      char text[INET_ADDRSTRLEN] = {};
      in_addr addr{};
      std::memcpy(&addr.s_addr, &data[start], 4);
      if (!::inet_ntop(AF_INET, &addr, text, sizeof(text))) {
        return false;
      }
      record->address = text;
      return true;
    }
    case RecordType::kPtr:
      return reader.ReadName(&record->target) && reader.offset() <= start + length;
    case RecordType::kSrv:
      return reader.ReadU16(&record->priority) && reader.ReadU16(&record->weight) &&
             reader.ReadU16(&record->port) && reader.ReadName(&record->target) &&
             reader.offset() <= start + length;
    case RecordType::kTxt: {
      size_t pos = start;
      const size_t end = start + length;
      while (pos < end) {
        const size_t entry_length = data[pos];
        if (pos + 1 + entry_length > end) {
          return false;
        }
        if (entry_length > 0) {
          record->txt.emplace_back(reinterpret_cast<const char*>(&data[pos + 1]),
                                   entry_length);
        }
        pos += 1 + entry_length;
      }
      return true;
    }
    default:
      return true;
  }
}

bool ReadRecords(const std::vector<uint8_t>& data, Reader& reader, uint16_t count,
                 std::vector<Record>* records, std::string* error) {
  for (uint16_t i = 0; i < count; ++i) {
    Record record;
    uint16_t klass = 0;
    uint16_t rdlength = 0;
    if (!reader.ReadName(&record.name) || !reader.ReadU16(&record.type) ||
        !reader.ReadU16(&klass) || !reader.ReadU32(&record.ttl) ||
        !reader.ReadU16(&rdlength)) {
      if (error) {
        *error = "truncated resource record";
      }
      return false;
    }
    record.cache_flush = (klass & kClassTopBit) != 0;
    record.record_class = static_cast<uint16_t>(klass & ~kClassTopBit);
    if (reader.remaining() < rdlength) {
      if (error) {
        *error = "rdata extends beyond packet";
      }
      return false;
    }
    const size_t start = reader.offset();
    record.rdata.assign(data.begin() + start, data.begin() + start + rdlength);
    if (!DecodeRdata(data, start, rdlength, &record)) {
      if (error) {
        *error = "malformed rdata for " + record.name;
      }
      return false;
    }
    reader.set_offset(start + rdlength);
    records->push_back(std::move(record));
  }
  return true;
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

}  // namespace

std::vector<uint8_t> BuildMessage(const Message& message) {
  std::vector<uint8_t> out;
  out.reserve(512);
  WriteU16(out, message.id);
  WriteU16(out, message.flags);
  WriteU16(out, static_cast<uint16_t>(message.questions.size()));
  WriteU16(out, static_cast<uint16_t>(message.answers.size()));
  WriteU16(out, static_cast<uint16_t>(message.authorities.size()));
  WriteU16(out, static_cast<uint16_t>(message.additionals.size()));
  for (const auto& question : message.questions) {
    WriteName(out, question.name);
    WriteU16(out, question.type);
    WriteU16(out, static_cast<uint16_t>(kClassIn |
                                        (question.unicast_response ? kClassTopBit : 0)));
  }
  for (const auto& record : message.answers) {
    WriteRecord(out, record);
  }
  for (const auto& record : message.authorities) {
    WriteRecord(out, record);
  }
  for (const auto& record : message.additionals) {
    WriteRecord(out, record);
  }
  return out;
}

bool ParseMessage(const std::vector<uint8_t>& data, Message* message, std::string* error) {
  if (data.size() < kHeaderSize) {
    if (error) {
      *error = "packet shorter than DNS header";
    }
    return false;
  }
  Reader reader(data);
  Message parsed;
  uint16_t qdcount = 0;
  uint16_t ancount = 0;
  uint16_t nscount = 0;
  uint16_t arcount = 0;
  reader.ReadU16(&parsed.id);
  reader.ReadU16(&parsed.flags);
  reader.ReadU16(&qdcount);
  reader.ReadU16(&ancount);
  reader.ReadU16(&nscount);
  reader.ReadU16(&arcount);

  for (uint16_t i = 0; i < qdcount; ++i) {
    Question question;
    uint16_t klass = 0;
    if (!reader.ReadName(&question.name) || !reader.ReadU16(&question.type) ||
        !reader.ReadU16(&klass)) {
      if (error) {
        *error = "truncated question";
      }
      return false;
    }
    question.unicast_response = (klass & kClassTopBit) != 0;
    parsed.questions.push_back(std::move(question));
  }
  if (!ReadRecords(data, reader, ancount, &parsed.answers, error) ||
      !ReadRecords(data, reader, nscount, &parsed.authorities, error) ||
      !ReadRecords(data, reader, arcount, &parsed.additionals, error)) {
    return false;
  }
  if (message) {
    *message = std::move(parsed);
  }
  return true;
}

std::map<std::string, std::string> ParseTxt(const std::vector<std::string>& strings) {
  std::map<std::string, std::string> out;
  for (const auto& entry : strings) {
    const size_t eq = entry.find('=');
    std::string key = Lower(entry.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    std::string value = eq == std::string::npos ? std::string() : entry.substr(eq + 1);
    out.emplace(std::move(key), std::move(value));
  }
  return out;
}

std::string NormalizeName(const std::string& name) {
  std::string out = Lower(name);
  if (out.empty() || out.back() != '.') {
    out += '.';
  }
  return out;
}

std::string InstanceLabel(const std::string& instance, const std::string& service_type) {
  std::string full = instance;
  if (!full.empty() && full.back() == '.') {
    full.pop_back();
  }
  std::string suffix = service_type;
  if (!suffix.empty() && suffix.back() == '.') {
    suffix.pop_back();
  }
  suffix = "." + suffix;
  if (full.size() > suffix.size() &&
      Lower(full.substr(full.size() - suffix.size())) == Lower(suffix)) {
    return full.substr(0, full.size() - suffix.size());
  }
  const auto labels = SplitLabels(full);
  return labels.empty() ? full : labels.front();
}

}  // namespace mdns
}  // namespace heos
