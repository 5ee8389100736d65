#include <cstdio>

#include "journalkv/error.hpp"

namespace journalkv {

const char *name_for_error(Error err) {
  switch (err) {
  case Error::SUCCESS:
    return "success";
  case Error::INVALID_FIELD_NAME:
    return "invalid field name";
  case Error::EMPTY_FIELD:
    return "empty field name";
  case Error::TRANSPORT_UNAVAILABLE:
    return "transport unavailable";
  case Error::JOURNAL_UNAVAILABLE:
    return "journal unavailable";
  case Error::FIELD_ABSENT:
    return "field absent";
  case Error::NO_ENTRY:
    return "no entry";
  case Error::USE_AFTER_CLOSE:
    return "use after close";
  case Error::INVALID_MATCH:
    return "invalid match";
  case Error::IO_ERROR:
  default:
    return "i/o error";
  }
}

void print_error(Error err, const std::string &failure) {
  fprintf(stderr, "%s: %s\n", failure.c_str(), name_for_error(err));
}

} // namespace journalkv
