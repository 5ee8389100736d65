#ifndef JOURNALKV_JOURNAL_HPP
#define JOURNALKV_JOURNAL_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

#include <systemd/sd-journal.h>

#include "journalkv/entry.hpp"
#include "journalkv/error.hpp"
#include "journalkv/match.hpp"

namespace journalkv {

/**
 * @brief the set of journal files to read.
 */
enum JournalFiles {
  JOURNAL_ALL,          // both the system journal and the current user's.
  JOURNAL_SYSTEM,       // the system-wide journal only.
  JOURNAL_CURRENT_USER, // the current user's journal only.
};

struct JournalOptions {
  JournalFiles files = JOURNAL_ALL;
  // only volatile journal files, excluding those on persistent storage.
  bool runtime_only = false;
  // only journal files generated on the local machine.
  bool local_only = false;
};

/**
 * @brief where the cursor of a Journal is.
 */
enum JournalState {
  STATE_UNOPENED,
  STATE_BEFORE_START, // before the first entry, after seek_head() or previous() returned false.
  STATE_AT_ENTRY,     // on an entry; the only state in which fields can be read.
  STATE_AFTER_END,    // after the last entry, after seek_tail() or next() returned false.
  STATE_DETACHED,     // seeked to a cursor or timestamp, not yet stepped onto an entry.
  STATE_CLOSED,
};

/**
 * @brief wakeup reasons reported by Journal::wait().
 */
enum WakeupType {
  WAKEUP_NOP = SD_JOURNAL_NOP,
  WAKEUP_APPEND = SD_JOURNAL_APPEND,
  WAKEUP_INVALIDATE = SD_JOURNAL_INVALIDATE,
};

class EntryRange;

/**
 * @brief an open handle on the journal with a single cursor.
 *
 * Not safe for concurrent use; open one Journal per reading thread. The handle is closed by
 * close() or on destruction, after which every call returns Error::USE_AFTER_CLOSE.
 */
class Journal {
public:
  Journal() = default;
  ~Journal();

  Journal(Journal &&other);
  Journal &operator=(Journal &&other);
  Journal(const Journal &) = delete;
  Journal &operator=(const Journal &) = delete;

  /**
   * @brief opens the journal files selected by `options`, positioned before the first entry.
   * Field values are read back whole, however large.
   *
   * @returns Error::JOURNAL_UNAVAILABLE if the journal cannot be opened.
   */
  static Error open(const JournalOptions &options, Journal *out);

  Error seek_head();
  Error seek_tail();
  Error seek_cursor(const std::string &cursor);
  Error seek_realtime_usec(uint64_t usec);

  /** Moves the cursor to the next entry that passes the installed matches.
   *
   * `positioned` is set to false when there are no more entries; this is not an error and
   * calling next() again keeps returning false.
   */
  Error next(bool *positioned);

  /** Moves the cursor to the previous entry that passes the installed matches.
   */
  Error previous(bool *positioned);

  /**
   * @brief reads the first value of `name` in the current entry.
   *
   * @returns Error::FIELD_ABSENT if the entry has no such field.
   * @returns Error::NO_ENTRY if the cursor is not on an entry.
   * @returns Error::INVALID_FIELD_NAME or Error::EMPTY_FIELD if `name` is not a field name.
   */
  Error get_field(const std::string &name, std::string *value);

  /**
   * @brief rewinds the field enumeration of the current entry.
   */
  Error restart_fields();

  /**
   * @brief reads the next field of the current entry. `has_field` is false once every field has
   * been returned. Moving the cursor starts the enumeration over.
   */
  Error next_field(Field *out, bool *has_field);

  /**
   * @brief collects every field of the current entry, plus __REALTIME_TIMESTAMP,
   * __MONOTONIC_TIMESTAMP and __CURSOR.
   */
  Error current_entry(Entry *out);

  /**
   * @brief next() followed by current_entry(). `out` is untouched when `positioned` is false.
   */
  Error next_entry(Entry *out, bool *positioned);
  Error previous_entry(Entry *out, bool *positioned);

  /**
   * @brief like next_entry(), but when there is no next entry waits up to `timeout_usec` for one
   * to be appended. `positioned` is false if the timeout expired first; UINT64_MAX waits forever.
   */
  Error wait_next_entry(uint64_t timeout_usec, Entry *out, bool *positioned);

  /**
   * @brief the entries after the cursor, for use in a range-based for loop. Iteration stops at
   * the end of the journal or on the first error, which the range then reports.
   */
  EntryRange entries();

  /**
   * @brief like entries(), but waits up to `timeout_usec` for each new entry at the end.
   */
  EntryRange wait_entries(uint64_t timeout_usec);

  Error get_realtime_usec(uint64_t *out);
  Error get_monotonic_usec(uint64_t *out);
  Error get_cursor(std::string *out);

  /**
   * @brief restricts next() and previous() to entries matching `expr`. Expressions installed by
   * successive calls must all match.
   *
   * If libsystemd rejects part of `expr`, every installed match is removed.
   */
  Error add_match(const MatchExpression &expr);

  /**
   * @brief removes every installed match.
   */
  Error clear_matches();

  /**
   * @brief blocks until the journal changes or `timeout_usec` elapses. UINT64_MAX waits forever.
   */
  Error wait(uint64_t timeout_usec, WakeupType *out);

  /**
   * @brief releases the handle. Closing twice is reported as Error::USE_AFTER_CLOSE.
   */
  Error close();

  JournalState state() const { return state_; }

  /**
   * @brief the errno behind the most recent IO_ERROR or JOURNAL_UNAVAILABLE, or 0.
   */
  int last_errno() const { return last_errno_; }

private:
  Error check_open(const char *operation);
  Error check_entry(const char *operation);
  Error fail(int rval);
  Error step(int rval, JournalState boundary, bool *positioned);

  sd_journal *j_ = nullptr;
  JournalState state_ = STATE_UNOPENED;
  bool has_matches_ = false;
  int last_errno_ = 0;
};

/**
 * @brief a single pass over the entries of a Journal, advancing its cursor.
 *
 *   EntryRange range = journal.entries();
 *   for (const Entry &entry : range) { ... }
 *   if (range.error() != Error::SUCCESS) { ... }
 */
class EntryRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = const Entry *;
    using reference = const Entry &;

    iterator() = default;

    const Entry &operator*() const { return range_->entry_; }
    const Entry *operator->() const { return &range_->entry_; }
    iterator &operator++();
    bool operator==(const iterator &other) const { return range_ == other.range_; }
    bool operator!=(const iterator &other) const { return range_ != other.range_; }

  private:
    friend class EntryRange;
    explicit iterator(EntryRange *range) : range_(range) {}

    EntryRange *range_ = nullptr;
  };

  iterator begin();
  iterator end() { return iterator(); }

  /**
   * @brief the error that ended the iteration, or Error::SUCCESS.
   */
  Error error() const { return error_; }

private:
  friend class Journal;
  EntryRange(Journal *journal, bool blocking, uint64_t timeout_usec)
      : journal_(journal), blocking_(blocking), timeout_usec_(timeout_usec) {}

  void advance();

  Journal *journal_;
  bool blocking_;
  uint64_t timeout_usec_;
  Entry entry_;
  Error error_ = Error::SUCCESS;
  bool done_ = false;
};

/**
 * @brief serializes an entry as a JSON object. Values that are valid UTF-8 become strings,
 * others become arrays of byte values; repeated names become arrays of values.
 */
std::string serialize_json(const Entry &entry);

} // namespace journalkv

#endif
