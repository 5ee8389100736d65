#ifndef JOURNALKV_MATCH_HPP
#define JOURNALKV_MATCH_HPP

#include <string_view>
#include <vector>

#include "journalkv/entry.hpp"
#include "journalkv/error.hpp"

namespace journalkv {

/**
 * @brief a journal filter in the two levels the journal can evaluate: an OR of terms, where each
 * term is an AND of field=value constraints.
 *
 *   MatchExpression expr;
 *   expr.add("A", "1");
 *   expr.alternative();
 *   expr.add("B", "2");   // matches A=1 or B=2
 *
 * There is no negation and no deeper nesting.
 */
class MatchExpression {
public:
  using Term = std::vector<Field>;

  /**
   * @brief narrows the current term with `name=value`.
   *
   * @returns Error::INVALID_MATCH if the current term already constrains `name`; the journal
   * would OR the two values instead of ANDing them.
   */
  Error add(std::string_view name, std::string_view value);

  /**
   * @brief starts a new term. Calling it on an empty current term is a no-op.
   */
  void alternative();

  /**
   * @brief true if any term has all of its constraints present in `entry`, or if the expression
   * has no constraints at all.
   */
  bool matches(const Entry &entry) const;

  const std::vector<Term> &terms() const { return terms_; }
  bool empty() const;

private:
  std::vector<Term> terms_;
};

} // namespace journalkv

#endif
