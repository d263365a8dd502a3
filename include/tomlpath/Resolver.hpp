/**
 * @file Resolver.hpp
 * @brief Walk a document along a token chain
 *
 * Resolution rules, applied one token at a time from the root:
 * - Identifier on a Table: descend into the entry; an absent key yields
 *   nullptr (absence is a normal outcome, not an error)
 * - Index on an Array: descend into the element; an index outside
 *   [0, size) yields nullptr (negative indices are always outside)
 * - Identifier on an Array: throws NoIdentifierInArray
 * - Index on a Table: throws NoIndexInTable
 * - Any token on a scalar: throws QueryingValueAsTable (identifier) or
 *   QueryingValueAsArray (index)
 *
 * The read-only and mutable variants share this traversal exactly; the
 * mutable one hands out a non-const pointer so the caller can replace or
 * mutate the node. A mutable resolution needs exclusive access to the
 * document for as long as the returned pointer is used.
 */

#ifndef TOMLPATH_RESOLVER_HPP
#define TOMLPATH_RESOLVER_HPP

#include "tomlpath/Errors.hpp"
#include "tomlpath/Tokenizer.hpp"
#include "tomlpath/Value.hpp"

namespace tomlpath {

/**
 * @brief Resolve a token chain against a document (read-only)
 *
 * @param doc Document root
 * @param tokens Non-empty token chain
 * @param separator Separator used when reporting the failing path prefix
 * @return Pointer to the addressed node, or nullptr if absent
 * @throws StructureError subclass if the path does not fit the document
 */
const Value* resolve(const Value& doc, const TokenChain& tokens,
                     char separator = kDefaultSeparator);

/**
 * @brief Resolve a token chain against a document (mutable)
 *
 * Same contract as resolve(), returning an exclusive pointer.
 */
Value* resolve_mut(Value& doc, const TokenChain& tokens,
                   char separator = kDefaultSeparator);

/**
 * @brief Resolve the tokens [first, last) only
 *
 * Used to reach the parent of the final segment. Error paths are
 * rendered relative to @p first, which must be the start of the chain.
 * An empty range resolves to @p doc itself.
 */
const Value* resolve(const Value& doc, TokenChain::const_iterator first,
                     TokenChain::const_iterator last, char separator);

Value* resolve_mut(Value& doc, TokenChain::const_iterator first,
                   TokenChain::const_iterator last, char separator);

namespace detail {

/**
 * @brief Throw the structural error for applying @p at to @p node
 *
 * @param node Node the token could not be applied to
 * @param first Start of the token chain (for the error path)
 * @param at Offending token
 * @param separator Separator for the error path
 * @pre The token does not fit the node (e.g. index on a Table)
 */
[[noreturn]] void throw_mismatch(const Value& node,
                                 TokenChain::const_iterator first,
                                 TokenChain::const_iterator at,
                                 char separator);

/**
 * @brief Check whether an Index token addresses an existing element
 */
inline bool index_in_range(std::int64_t idx, const Array& array) noexcept {
    return idx >= 0 && static_cast<std::uint64_t>(idx) < array.size();
}

} // namespace detail

} // namespace tomlpath

#endif // TOMLPATH_RESOLVER_HPP
