#include <algorithm>

#include "journalkv/match.hpp"

namespace journalkv {

Error MatchExpression::add(std::string_view name, std::string_view value) {
  Error err = validate_field_name(name);
  if (err != Error::SUCCESS) {
    return err;
  }
  if (terms_.empty()) {
    terms_.emplace_back();
  }
  Term &term = terms_.back();
  auto same_name = [&](const Field &field) { return field.name == name; };
  if (std::any_of(term.begin(), term.end(), same_name)) {
    return Error::INVALID_MATCH;
  }
  term.push_back(Field{std::string(name), std::string(value)});
  return Error::SUCCESS;
}

void MatchExpression::alternative() {
  if (!terms_.empty() && !terms_.back().empty()) {
    terms_.emplace_back();
  }
}

bool MatchExpression::empty() const {
  return std::all_of(terms_.begin(), terms_.end(), [](const Term &term) { return term.empty(); });
}

bool MatchExpression::matches(const Entry &entry) const {
  // an empty filter selects everything, as it does on the journal.
  if (empty()) {
    return true;
  }
  for (const Term &term : terms_) {
    if (term.empty()) {
      continue;
    }
    bool all = std::all_of(term.begin(), term.end(), [&](const Field &constraint) {
      return std::any_of(entry.fields().begin(), entry.fields().end(), [&](const Field &field) {
        return field.name == constraint.name && field.value == constraint.value;
      });
    });
    if (all) {
      return true;
    }
  }
  return false;
}

} // namespace journalkv
