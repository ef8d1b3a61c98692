#include "autocrate/combiner/BooleanNode.hpp"

#include "autocrate/Errors.hpp"
#include "autocrate/Util.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace autocrate::combiner {

std::optional<SetOperator> operatorFromChar(char c) {
    switch (c) {
        case '&': return SetOperator::Intersection;
        case '|': return SetOperator::Union;
        case '~': return SetOperator::Difference;
        default:  return std::nullopt;
    }
}

TrackIdSet apply(SetOperator op, const TrackIdSet& left, const TrackIdSet& right) {
    TrackIdSet result;
    switch (op) {
        case SetOperator::Intersection:
            std::set_intersection(left.begin(), left.end(), right.begin(), right.end(),
                                  std::inserter(result, result.end()));
            break;
        case SetOperator::Union:
            std::set_union(left.begin(), left.end(), right.begin(), right.end(),
                           std::inserter(result, result.end()));
            break;
        case SetOperator::Difference:
            std::set_difference(left.begin(), left.end(), right.begin(), right.end(),
                                std::inserter(result, result.end()));
            break;
    }
    return result;
}

TrackIdSet BooleanNode::takeOperand(const TagTrackIds& lookup) {
    if (!tracks.empty()) {
        TrackIdSet operand = std::move(tracks.front());
        tracks.pop_front();
        return operand;
    }
    Selector selector = std::move(tags.front());
    tags.pop_front();
    return selector.resolve(lookup);
}

TrackIdSet BooleanNode::reduce(const TagTrackIds& lookup) {
    if (operators.size() + 1 != tags.size() + tracks.size()) {
        std::vector<std::string> tagTexts;
        for (const auto& tag : tags) {
            tagTexts.push_back(tag.getText());
        }
        std::vector<char> operatorChars;
        for (const auto op : operators) {
            operatorChars.push_back(static_cast<char>(op));
        }
        throw MalformedExpressionError(
            fmt::format("Invalid boolean expression: track sets: {}, tags: [{}], operators: [{}]",
                        tracks.size(), fmt::join(tagTexts, ", "), fmt::join(operatorChars, ", ")));
    }

    while (!operators.empty()) {
        const SetOperator op = operators.front();
        operators.pop_front();
        TrackIdSet left = takeOperand(lookup);
        TrackIdSet right = takeOperand(lookup);
        tracks.push_front(apply(op, left, right));
    }

    if (!tracks.empty()) {
        return tracks.front();
    }
    return takeOperand(lookup);
}

BooleanExpression::BooleanExpression(std::string expression)
    : expression_(std::move(expression))
{
}

TrackIdSet BooleanExpression::evaluate(const TagTrackIds& tracks) const {
    std::vector<BooleanNode> nodes(1);
    std::size_t current = 0;
    std::string token;

    auto flush = [&nodes, &current, &token]() {
        const std::string trimmed = Util::trim(token);
        if (!trimmed.empty()) {
            nodes[current].tags.push_back(Selector::parse(trimmed));
        }
        token.clear();
    };

    for (const char c : expression_) {
        if (c == OPEN) {
            BooleanNode child;
            child.parent = current;
            nodes.push_back(std::move(child));
            current = nodes.size() - 1;
        } else if (auto op = operatorFromChar(c)) {
            flush();
            nodes[current].operators.push_back(*op);
        } else if (c == CLOSE) {
            flush();
            if (!nodes[current].parent) {
                throw MalformedExpressionError(
                    fmt::format("Unbalanced ')' in boolean expression: {}", expression_));
            }
            TrackIdSet reduced = nodes[current].reduce(tracks);
            current = *nodes[current].parent;
            nodes[current].tracks.push_back(std::move(reduced));
        } else {
            token += c;
        }
    }
    flush();

    if (current != 0) {
        throw MalformedExpressionError(fmt::format("Unbalanced '(' in boolean expression: {}", expression_));
    }
    return nodes[0].reduce(tracks);
}

} // namespace autocrate::combiner
