#ifndef JOURNALKV_ENTRY_HPP
#define JOURNALKV_ENTRY_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "journalkv/error.hpp"

namespace journalkv {

/**
 * @brief syslog priority levels, as carried in the PRIORITY field. See
 * https://wiki.archlinux.org/title/Systemd/Journal#Priority_level
 */
enum Priority {
  PRIORITY_EMERG = 0,
  PRIORITY_ALERT = 1,
  PRIORITY_CRIT = 2,
  PRIORITY_ERR = 3,
  PRIORITY_WARNING = 4,
  PRIORITY_NOTICE = 5,
  PRIORITY_INFO = 6,
  PRIORITY_DEBUG = 7,
};

/**
 * @brief a named journal field. The value is an arbitrary byte string; it may hold newlines,
 * NUL bytes and invalid UTF-8.
 */
struct Field {
  std::string name;
  std::string value;
};

/**
 * @brief checks that `name` is a valid journal field name: one or more bytes of [A-Z0-9_],
 * not starting with a digit.
 *
 * @returns Error::EMPTY_FIELD for a zero-length name.
 * @returns Error::INVALID_FIELD_NAME for any other violation.
 */
Error validate_field_name(std::string_view name);

/**
 * @brief an ordered list of fields making up one structured log record. Repeated names are
 * kept; the journal stores them as a multi-valued field.
 */
class Entry {
public:
  /**
   * @brief appends a field. Invalid names are rejected and leave the entry unchanged.
   */
  Error add(std::string_view name, std::string_view value);

  Error set_message(std::string_view message) { return add("MESSAGE", message); }
  Error set_priority(Priority priority);

  /**
   * @brief finds the first value stored under `name`.
   *
   * @returns Error::FIELD_ABSENT if the entry has no such field.
   */
  Error get_field(std::string_view name, std::string *value) const;

  Error get_message(std::string *message) const { return get_field("MESSAGE", message); }

  /**
   * @brief the time the entry was logged, in microseconds since the epoch: the sender's
   * _SOURCE_REALTIME_TIMESTAMP if present, otherwise the journal's __REALTIME_TIMESTAMP.
   *
   * The timestamp getters return Error::FIELD_ABSENT when the field is missing or is not a
   * decimal number.
   */
  Error get_wallclock_time(uint64_t *usec) const;
  Error get_source_wallclock_time(uint64_t *usec) const;
  Error get_reception_wallclock_time(uint64_t *usec) const;
  Error get_monotonic_time(uint64_t *usec) const;

  const std::vector<Field> &fields() const { return fields_; }
  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

private:
  Error get_usec(std::string_view name, uint64_t *usec) const;

  std::vector<Field> fields_;
};

/**
 * @brief serializes one field in the native journal protocol. Values without a newline are
 * written as `NAME=VALUE\n`; values with one are written as `NAME\n`, a 64-bit little-endian
 * length, the raw bytes and a trailing `\n`.
 */
std::string encode_field(const Field &field);

/**
 * @brief serializes every field of `entry` in order. On failure `out` is not touched.
 */
Error encode_entry(const Entry &entry, std::string *out);

/**
 * @brief builds an entry holding PRIORITY and MESSAGE.
 */
Entry make_message_entry(Priority priority, std::string_view message);

/**
 * @brief provides the syslog name for a Priority as a static C string.
 */
const char *name_for_priority(Priority priority);

} // namespace journalkv

#endif
