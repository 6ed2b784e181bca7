// core/growth_policy.h - Storage growth policy types for deque
// Part of the arkham board-structures library (C++20)
//
// DESIGN RATIONALE:
// deque takes a SINGLE growth struct instead of numeric template
// parameters.  The struct travels as one token through template
// arguments and aliases:
//
//   deque<card>                        d;   // defaults to growth::standard
//   deque<card, growth::compact>       d2;  // named tier
//   deque<card, growth_from<32, 2>>    d3;  // inline
//
// Geometric growth (factor >= 2) is what makes enqueue O(1) amortized.

#ifndef ARKHAM_CORE_GROWTH_POLICY_H
#define ARKHAM_CORE_GROWTH_POLICY_H

#include <concepts>
#include <cstddef>

namespace arkham {

// =============================================================================
// growth_policy concept
// =============================================================================

/// A type satisfies growth_policy if it provides a positive
/// initial_capacity and a growth_factor of at least 2.
template<typename P>
concept growth_policy = requires {
    { P::initial_capacity } -> std::convertible_to<std::size_t>;
    { P::growth_factor } -> std::convertible_to<std::size_t>;
} && (P::initial_capacity > 0) && (P::growth_factor >= 2);

// =============================================================================
// Named growth tiers
// =============================================================================

namespace growth {

/// 4 slots, doubling - small hands, token pools.
struct compact {
    static constexpr std::size_t initial_capacity = 4;
    static constexpr std::size_t growth_factor = 2;
};

/// 16 slots, doubling - typical decks.
struct standard {
    static constexpr std::size_t initial_capacity = 16;
    static constexpr std::size_t growth_factor = 2;
};

/// 64 slots, quadrupling - large decks built in one go.
struct eager {
    static constexpr std::size_t initial_capacity = 64;
    static constexpr std::size_t growth_factor = 4;
};

} // namespace growth

// =============================================================================
// growth_from<I, F> - inline policy from raw numbers
// =============================================================================

template<std::size_t Initial, std::size_t Factor = 2>
struct growth_from {
    static constexpr std::size_t initial_capacity = Initial;
    static constexpr std::size_t growth_factor = Factor;
};

static_assert(growth_policy<growth::compact>);
static_assert(growth_policy<growth::standard>);
static_assert(growth_policy<growth::eager>);

} // namespace arkham

#endif // ARKHAM_CORE_GROWTH_POLICY_H
