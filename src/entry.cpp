#include <charconv>
#include <cstdint>
#include <system_error>
#include <utility>

#include "journalkv/entry.hpp"

namespace journalkv {

Error validate_field_name(std::string_view name) {
  if (name.empty()) {
    return Error::EMPTY_FIELD;
  }
  if (name[0] >= '0' && name[0] <= '9') {
    return Error::INVALID_FIELD_NAME;
  }
  if (name.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_") != name.npos) {
    return Error::INVALID_FIELD_NAME;
  }
  return Error::SUCCESS;
}

Error Entry::add(std::string_view name, std::string_view value) {
  Error err = validate_field_name(name);
  if (err != Error::SUCCESS) {
    return err;
  }
  fields_.push_back(Field{std::string(name), std::string(value)});
  return Error::SUCCESS;
}

Error Entry::set_priority(Priority priority) {
  return add("PRIORITY", std::to_string(static_cast<int>(priority)));
}

Error Entry::get_field(std::string_view name, std::string *value) const {
  for (const Field &field : fields_) {
    if (field.name == name) {
      *value = field.value;
      return Error::SUCCESS;
    }
  }
  return Error::FIELD_ABSENT;
}

Error Entry::get_usec(std::string_view name, uint64_t *usec) const {
  std::string value;
  if (Error err = get_field(name, &value); err != Error::SUCCESS) {
    return err;
  }
  uint64_t parsed = 0;
  auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
    return Error::FIELD_ABSENT;
  }
  *usec = parsed;
  return Error::SUCCESS;
}

Error Entry::get_wallclock_time(uint64_t *usec) const {
  if (get_source_wallclock_time(usec) == Error::SUCCESS) {
    return Error::SUCCESS;
  }
  return get_reception_wallclock_time(usec);
}

Error Entry::get_source_wallclock_time(uint64_t *usec) const {
  return get_usec("_SOURCE_REALTIME_TIMESTAMP", usec);
}

Error Entry::get_reception_wallclock_time(uint64_t *usec) const {
  return get_usec("__REALTIME_TIMESTAMP", usec);
}

Error Entry::get_monotonic_time(uint64_t *usec) const {
  return get_usec("__MONOTONIC_TIMESTAMP", usec);
}

std::string encode_field(const Field &field) {
  std::string out;
  if (field.value.find('\n') == std::string::npos) {
    out.reserve(field.name.size() + field.value.size() + 2);
    out.append(field.name);
    out.push_back('=');
    out.append(field.value);
    out.push_back('\n');
    return out;
  }
  // binary-safe form: the length is always little-endian regardless of host order.
  uint64_t length = field.value.size();
  out.reserve(field.name.size() + sizeof(length) + field.value.size() + 2);
  out.append(field.name);
  out.push_back('\n');
  for (size_t i = 0; i < sizeof(length); ++i) {
    out.push_back(static_cast<char>((length >> (8 * i)) & 0xff));
  }
  out.append(field.value);
  out.push_back('\n');
  return out;
}

Error encode_entry(const Entry &entry, std::string *out) {
  std::string payload;
  for (const Field &field : entry.fields()) {
    Error err = validate_field_name(field.name);
    if (err != Error::SUCCESS) {
      return err;
    }
    payload.append(encode_field(field));
  }
  *out = std::move(payload);
  return Error::SUCCESS;
}

Entry make_message_entry(Priority priority, std::string_view message) {
  Entry entry;
  // both names are constant and valid, so neither add() can fail.
  (void)entry.set_priority(priority);
  (void)entry.set_message(message);
  return entry;
}

const char *name_for_priority(Priority priority) {
  switch (priority) {
  case PRIORITY_EMERG:
    return "emerg";
  case PRIORITY_ALERT:
    return "alert";
  case PRIORITY_CRIT:
    return "crit";
  case PRIORITY_ERR:
    return "err";
  case PRIORITY_WARNING:
    return "warning";
  case PRIORITY_NOTICE:
    return "notice";
  case PRIORITY_INFO:
    return "info";
  case PRIORITY_DEBUG:
    return "debug";
  default:
    return "unknown";
  }
}

} // namespace journalkv
