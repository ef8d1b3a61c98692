#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

#include "autocrate/Types.hpp"
#include "Selector.hpp"

namespace autocrate::combiner {

enum class SetOperator : char {
    Intersection = '&',
    Union = '|',
    Difference = '~'
};

std::optional<SetOperator> operatorFromChar(char c);

/**
 * Apply a set operator; Difference keeps the left-hand tracks that are not
 * in the right-hand set.
 */
TrackIdSet apply(SetOperator op, const TrackIdSet& left, const TrackIdSet& right);

/**
 * Evaluation context for one parenthesis level. Nodes live in an arena owned
 * by the expression being evaluated; parent is an index into it.
 */
struct BooleanNode {
    std::optional<std::size_t> parent;
    std::deque<SetOperator> operators;
    std::deque<Selector> tags;
    std::deque<TrackIdSet> tracks;

    /**
     * Apply the pending operators strictly in the order they were read, with
     * no precedence. Each operand comes from the reduced sets first, then
     * from the pending tags; each result goes back to the front of the
     * reduced sets.
     *
     * @throws MalformedExpressionError unless operators + 1 == operands
     */
    TrackIdSet reduce(const TagTrackIds& lookup);

private:
    TrackIdSet takeOperand(const TagTrackIds& lookup);
};

/**
 * A Combiner expression such as "(Techno | House) ~ {My Favorites}".
 *
 * The text is scanned in one left-to-right pass: '(' opens a node, ')'
 * reduces the current node into its parent, '&', '|' and '~' are operators
 * and everything else accumulates into an operand token.
 */
class BooleanExpression {
public:
    static constexpr char OPEN = '(';
    static constexpr char CLOSE = ')';

    explicit BooleanExpression(std::string expression);

    const std::string& getText() const { return expression_; }

    /**
     * @param tracks tag and selector literal -> track ids
     * @throws MalformedExpressionError for unbalanced parentheses or an
     *         operator/operand count mismatch at any level
     */
    TrackIdSet evaluate(const TagTrackIds& tracks) const;

private:
    std::string expression_;
};

} // namespace autocrate::combiner
