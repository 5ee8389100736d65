#ifndef JOURNALKV_ERROR_HPP
#define JOURNALKV_ERROR_HPP

#include <string>

namespace journalkv {

/**
 * @brief the outcome of every fallible journalkv operation. Results are written through
 * out-parameters; the return value only says whether they are valid.
 */
enum class Error {
  SUCCESS = 0,
  INVALID_FIELD_NAME,    // name has a byte outside [A-Z0-9_] or starts with a digit.
  EMPTY_FIELD,           // name is zero-length.
  TRANSPORT_UNAVAILABLE, // the journal socket refused the entry.
  JOURNAL_UNAVAILABLE,   // sd_journal_open() failed.
  FIELD_ABSENT,          // the current entry has no such field. Not a failure.
  NO_ENTRY,              // the cursor is not positioned on an entry.
  USE_AFTER_CLOSE,       // the journal handle was already closed.
  INVALID_MATCH,         // a match term constrains the same field twice.
  IO_ERROR,              // any other errno reported by libsystemd or the kernel.
};

/**
 * @brief provides the name for an Error as a static C string.
 */
const char *name_for_error(Error err);

/**
 * @brief writes `<failure>: <error name>` to stderr.
 */
void print_error(Error err, const std::string &failure);

} // namespace journalkv

#endif
