#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "journalkv/journal.hpp"

namespace journalkv {

namespace {

bool split_data(const void *data, size_t length, Field *out) {
  std::string_view data_view((const char *)data, length);
  size_t eq_pos = data_view.find('=');
  if (eq_pos == data_view.npos) {
    return false;
  }
  out->name = std::string(data_view.substr(0, eq_pos));
  out->value = std::string(data_view.substr(eq_pos + 1));
  return true;
}

int open_flags(const JournalOptions &options) {
  int flags = 0;
  if (options.runtime_only) {
    flags |= SD_JOURNAL_RUNTIME_ONLY;
  }
  if (options.local_only) {
    flags |= SD_JOURNAL_LOCAL_ONLY;
  }
  switch (options.files) {
  case JOURNAL_SYSTEM:
    flags |= SD_JOURNAL_SYSTEM;
    break;
  case JOURNAL_CURRENT_USER:
    flags |= SD_JOURNAL_CURRENT_USER;
    break;
  case JOURNAL_ALL:
  default:
    break;
  }
  return flags;
}

} // namespace

Journal::~Journal() {
  if (j_ != nullptr) {
    sd_journal_close(j_);
  }
}

Journal::Journal(Journal &&other)
    : j_(std::exchange(other.j_, nullptr)),
      state_(std::exchange(other.state_, STATE_UNOPENED)),
      has_matches_(std::exchange(other.has_matches_, false)),
      last_errno_(std::exchange(other.last_errno_, 0)) {}

Journal &Journal::operator=(Journal &&other) {
  if (this != &other) {
    if (j_ != nullptr) {
      sd_journal_close(j_);
    }
    j_ = std::exchange(other.j_, nullptr);
    state_ = std::exchange(other.state_, STATE_UNOPENED);
    has_matches_ = std::exchange(other.has_matches_, false);
    last_errno_ = std::exchange(other.last_errno_, 0);
  }
  return *this;
}

Error Journal::open(const JournalOptions &options, Journal *out) {
  sd_journal *j = nullptr;
  int err = sd_journal_open(&j, open_flags(options));
  if (err < 0) {
    out->last_errno_ = -err;
    return Error::JOURNAL_UNAVAILABLE;
  }
  // the default threshold silently truncates large compressed fields.
  err = sd_journal_set_data_threshold(j, 0);
  if (err < 0) {
    sd_journal_close(j);
    out->last_errno_ = -err;
    return Error::JOURNAL_UNAVAILABLE;
  }
  Journal journal;
  journal.j_ = j;
  journal.state_ = STATE_BEFORE_START;
  *out = std::move(journal);
  return Error::SUCCESS;
}

Error Journal::check_open(const char *operation) {
  if (state_ == STATE_CLOSED) {
    fprintf(stderr, "attempted to %s on a closed journal\n", operation);
    return Error::USE_AFTER_CLOSE;
  }
  if (j_ == nullptr) {
    return Error::JOURNAL_UNAVAILABLE;
  }
  return Error::SUCCESS;
}

Error Journal::check_entry(const char *operation) {
  Error err = check_open(operation);
  if (err != Error::SUCCESS) {
    return err;
  }
  if (state_ != STATE_AT_ENTRY) {
    return Error::NO_ENTRY;
  }
  return Error::SUCCESS;
}

Error Journal::fail(int rval) {
  last_errno_ = -rval;
  return Error::IO_ERROR;
}

Error Journal::seek_head() {
  if (Error err = check_open("seek to head"); err != Error::SUCCESS) {
    return err;
  }
  int err = sd_journal_seek_head(j_);
  if (err < 0) {
    return fail(err);
  }
  state_ = STATE_BEFORE_START;
  return Error::SUCCESS;
}

Error Journal::seek_tail() {
  if (Error err = check_open("seek to tail"); err != Error::SUCCESS) {
    return err;
  }
  int err = sd_journal_seek_tail(j_);
  if (err < 0) {
    return fail(err);
  }
  state_ = STATE_AFTER_END;
  return Error::SUCCESS;
}

Error Journal::seek_cursor(const std::string &cursor) {
  if (Error err = check_open("seek to cursor"); err != Error::SUCCESS) {
    return err;
  }
  int err = sd_journal_seek_cursor(j_, cursor.c_str());
  if (err < 0) {
    return fail(err);
  }
  state_ = STATE_DETACHED;
  return Error::SUCCESS;
}

Error Journal::seek_realtime_usec(uint64_t usec) {
  if (Error err = check_open("seek to time"); err != Error::SUCCESS) {
    return err;
  }
  int err = sd_journal_seek_realtime_usec(j_, usec);
  if (err < 0) {
    return fail(err);
  }
  state_ = STATE_DETACHED;
  return Error::SUCCESS;
}

Error Journal::step(int rval, JournalState boundary, bool *positioned) {
  if (rval < 0) {
    return fail(rval);
  }
  if (rval == 0) {
    state_ = boundary;
    *positioned = false;
    return Error::SUCCESS;
  }
  state_ = STATE_AT_ENTRY;
  sd_journal_restart_data(j_);
  *positioned = true;
  return Error::SUCCESS;
}

Error Journal::next(bool *positioned) {
  *positioned = false;
  if (Error err = check_open("read the next entry"); err != Error::SUCCESS) {
    return err;
  }
  return step(sd_journal_next(j_), STATE_AFTER_END, positioned);
}

Error Journal::previous(bool *positioned) {
  *positioned = false;
  if (Error err = check_open("read the previous entry"); err != Error::SUCCESS) {
    return err;
  }
  return step(sd_journal_previous(j_), STATE_BEFORE_START, positioned);
}

Error Journal::get_field(const std::string &name, std::string *value) {
  if (Error err = check_entry("read a field"); err != Error::SUCCESS) {
    return err;
  }
  if (Error err = validate_field_name(name); err != Error::SUCCESS) {
    return err;
  }
  const void *data = nullptr;
  size_t length = 0;
  int err = sd_journal_get_data(j_, name.c_str(), &data, &length);
  if (err == -ENOENT) {
    return Error::FIELD_ABSENT;
  }
  if (err < 0) {
    return fail(err);
  }
  Field field;
  if (!split_data(data, length, &field) || field.name != name) {
    return fail(-EBADMSG);
  }
  *value = std::move(field.value);
  return Error::SUCCESS;
}

Error Journal::restart_fields() {
  if (Error err = check_entry("restart field enumeration"); err != Error::SUCCESS) {
    return err;
  }
  sd_journal_restart_data(j_);
  return Error::SUCCESS;
}

Error Journal::next_field(Field *out, bool *has_field) {
  *has_field = false;
  if (Error err = check_entry("enumerate fields"); err != Error::SUCCESS) {
    return err;
  }
  while (true) {
    const void *data = nullptr;
    size_t length = 0;
    int err = sd_journal_enumerate_available_data(j_, &data, &length);
    if (err < 0) {
      return fail(err);
    }
    if (err == 0) {
      return Error::SUCCESS;
    }
    // data without a '=' separator is not a field; skip it.
    if (split_data(data, length, out)) {
      *has_field = true;
      return Error::SUCCESS;
    }
  }
}

Error Journal::current_entry(Entry *out) {
  if (Error err = restart_fields(); err != Error::SUCCESS) {
    return err;
  }
  Entry entry;
  Field field;
  bool has_field = false;
  while (true) {
    if (Error err = next_field(&field, &has_field); err != Error::SUCCESS) {
      return err;
    }
    if (!has_field) {
      break;
    }
    if (Error err = entry.add(field.name, field.value); err != Error::SUCCESS) {
      fprintf(stderr, "skipping journal field with invalid name '%s'\n", field.name.c_str());
    }
  }
  sd_journal_restart_data(j_);

  uint64_t realtime = 0;
  if (Error err = get_realtime_usec(&realtime); err != Error::SUCCESS) {
    return err;
  }
  (void)entry.add("__REALTIME_TIMESTAMP", std::to_string(realtime));
  uint64_t monotonic = 0;
  if (Error err = get_monotonic_usec(&monotonic); err != Error::SUCCESS) {
    return err;
  }
  (void)entry.add("__MONOTONIC_TIMESTAMP", std::to_string(monotonic));
  std::string cursor;
  if (Error err = get_cursor(&cursor); err != Error::SUCCESS) {
    return err;
  }
  (void)entry.add("__CURSOR", cursor);
  *out = std::move(entry);
  return Error::SUCCESS;
}

Error Journal::next_entry(Entry *out, bool *positioned) {
  if (Error err = next(positioned); err != Error::SUCCESS || !*positioned) {
    return err;
  }
  return current_entry(out);
}

Error Journal::previous_entry(Entry *out, bool *positioned) {
  if (Error err = previous(positioned); err != Error::SUCCESS || !*positioned) {
    return err;
  }
  return current_entry(out);
}

Error Journal::wait_next_entry(uint64_t timeout_usec, Entry *out, bool *positioned) {
  Error err = next_entry(out, positioned);
  while (err == Error::SUCCESS && !*positioned) {
    WakeupType wakeup = WAKEUP_NOP;
    err = wait(timeout_usec, &wakeup);
    if (err != Error::SUCCESS) {
      return err;
    }
    // NOP means the timeout expired; with no timeout, keep waiting.
    if (wakeup == WAKEUP_NOP && timeout_usec != UINT64_MAX) {
      return Error::SUCCESS;
    }
    err = next_entry(out, positioned);
  }
  return err;
}

EntryRange Journal::entries() { return EntryRange(this, false, 0); }

EntryRange Journal::wait_entries(uint64_t timeout_usec) {
  return EntryRange(this, true, timeout_usec);
}

void EntryRange::advance() {
  bool positioned = false;
  Error err = blocking_ ? journal_->wait_next_entry(timeout_usec_, &entry_, &positioned)
                        : journal_->next_entry(&entry_, &positioned);
  if (err != Error::SUCCESS) {
    error_ = err;
  }
  if (err != Error::SUCCESS || !positioned) {
    done_ = true;
  }
}

EntryRange::iterator EntryRange::begin() {
  if (!done_) {
    advance();
  }
  return done_ ? iterator() : iterator(this);
}

EntryRange::iterator &EntryRange::iterator::operator++() {
  range_->advance();
  if (range_->done_) {
    range_ = nullptr;
  }
  return *this;
}

Error Journal::get_realtime_usec(uint64_t *out) {
  if (Error err = check_entry("read the realtime timestamp"); err != Error::SUCCESS) {
    return err;
  }
  int err = sd_journal_get_realtime_usec(j_, out);
  if (err < 0) {
    return fail(err);
  }
  return Error::SUCCESS;
}

Error Journal::get_monotonic_usec(uint64_t *out) {
  if (Error err = check_entry("read the monotonic timestamp"); err != Error::SUCCESS) {
    return err;
  }
  int err = sd_journal_get_monotonic_usec(j_, out, nullptr);
  if (err < 0) {
    return fail(err);
  }
  return Error::SUCCESS;
}

Error Journal::get_cursor(std::string *out) {
  if (Error err = check_entry("read the cursor"); err != Error::SUCCESS) {
    return err;
  }
  char *cursor = nullptr;
  int err = sd_journal_get_cursor(j_, &cursor);
  if (err < 0) {
    return fail(err);
  }
  *out = cursor;
  free(cursor);
  return Error::SUCCESS;
}

Error Journal::add_match(const MatchExpression &expr) {
  if (Error err = check_open("add a match"); err != Error::SUCCESS) {
    return err;
  }
  if (expr.empty()) {
    return Error::SUCCESS;
  }
  // a partly installed expression would merge into the next one, so drop everything.
  auto abandon = [this](int err) {
    sd_journal_flush_matches(j_);
    has_matches_ = false;
    return fail(err);
  };
  int err = 0;
  // each installed expression is its own top-level group, ANDed with the ones before it.
  if (has_matches_) {
    err = sd_journal_add_conjunction(j_);
    if (err < 0) {
      return abandon(err);
    }
  }
  bool first_term = true;
  for (const MatchExpression::Term &term : expr.terms()) {
    if (term.empty()) {
      continue;
    }
    if (!first_term) {
      err = sd_journal_add_disjunction(j_);
      if (err < 0) {
        return abandon(err);
      }
    }
    first_term = false;
    for (const Field &constraint : term) {
      std::string match = constraint.name + "=" + constraint.value;
      err = sd_journal_add_match(j_, match.data(), match.size());
      if (err < 0) {
        return abandon(err);
      }
    }
  }
  has_matches_ = true;
  return Error::SUCCESS;
}

Error Journal::clear_matches() {
  if (Error err = check_open("clear matches"); err != Error::SUCCESS) {
    return err;
  }
  sd_journal_flush_matches(j_);
  has_matches_ = false;
  return Error::SUCCESS;
}

Error Journal::wait(uint64_t timeout_usec, WakeupType *out) {
  if (Error err = check_open("wait"); err != Error::SUCCESS) {
    return err;
  }
  int err = sd_journal_wait(j_, timeout_usec);
  if (err < 0) {
    return fail(err);
  }
  *out = static_cast<WakeupType>(err);
  return Error::SUCCESS;
}

Error Journal::close() {
  if (Error err = check_open("close"); err != Error::SUCCESS) {
    return err;
  }
  sd_journal_close(j_);
  j_ = nullptr;
  state_ = STATE_CLOSED;
  has_matches_ = false;
  return Error::SUCCESS;
}

namespace {

nlohmann::json json_for_value(const std::string &value) {
  nlohmann::json text = value;
  try {
    // dump() is where nlohmann-json validates UTF-8.
    (void)text.dump();
    return text;
  } catch (const nlohmann::json::type_error &) {
    nlohmann::json bytes = nlohmann::json::array();
    for (char c : value) {
      bytes.push_back(static_cast<unsigned char>(c));
    }
    return bytes;
  }
}

} // namespace

std::string serialize_json(const Entry &entry) {
  nlohmann::json out = nlohmann::json::object();
  // names seen more than once are collected into an array of values.
  std::map<std::string, size_t> counts;
  for (const Field &field : entry.fields()) {
    counts[field.name]++;
  }
  for (const Field &field : entry.fields()) {
    if (counts[field.name] == 1) {
      out[field.name] = json_for_value(field.value);
    } else {
      out[field.name].push_back(json_for_value(field.value));
    }
  }
  return out.dump();
}

} // namespace journalkv
