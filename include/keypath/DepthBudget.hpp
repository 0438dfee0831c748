/**
 * @file DepthBudget.hpp
 * @brief Recursion allowance for schema traversals
 *
 * A budget is attached to a traversal, never to a schema. It shrinks by
 * one for each step through a named object field or a dictionary value,
 * and stays unchanged through array and tuple indices. The enumerator
 * stops extending a branch once the budget is exhausted.
 */

#ifndef KEYPATH_DEPTH_BUDGET_HPP
#define KEYPATH_DEPTH_BUDGET_HPP

#include <stdexcept>
#include <string>

namespace keypath {

/// Default maximum depth for path enumeration
inline constexpr int kDefaultMaxDepth = 5;

class DepthBudget {
public:
    /**
     * @brief Start a budget
     * @param max_depth Allowance, must not be negative
     * @throws std::invalid_argument if max_depth < 0
     */
    explicit DepthBudget(int max_depth = kDefaultMaxDepth)
        : remaining_(max_depth)
    {
        if (max_depth < 0) {
            throw std::invalid_argument("Depth budget must not be negative: " +
                                        std::to_string(max_depth));
        }
    }

    int remaining() const noexcept { return remaining_; }
    bool exhausted() const noexcept { return remaining_ == 0; }

    /// Budget after entering a named object field
    DepthBudget descend_field() const { return shrink(); }

    /// Budget after entering a dictionary value
    DepthBudget descend_key() const { return shrink(); }

    /// Budget after entering an array element or tuple slot
    DepthBudget descend_index() const { return *this; }

    friend bool operator==(DepthBudget a, DepthBudget b) { return a.remaining_ == b.remaining_; }
    friend bool operator!=(DepthBudget a, DepthBudget b) { return !(a == b); }

private:
    DepthBudget shrink() const {
        return DepthBudget(remaining_ > 0 ? remaining_ - 1 : 0);
    }

    int remaining_;
};

} // namespace keypath

#endif // KEYPATH_DEPTH_BUDGET_HPP
