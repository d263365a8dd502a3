/**
 * @file Query.hpp
 * @brief Composable, typed query pipelines over a document
 *
 * A query step is a stateless function object with declared input and
 * output types:
 *
 * ```cpp
 * struct CountKeys : Query<CountKeys, NoInput, std::size_t> {
 *     std::size_t execute(Value& doc, std::optional<NoInput>) const {
 *         return doc.as_table()->size();
 *     }
 * };
 * ```
 *
 * Steps compose with chain(): `a.chain(b)` runs `a`, then hands its output
 * to `b` as input. The composition is itself a step, so chains nest
 * arbitrarily and associate left to right. Mismatched input and output
 * types are rejected at compile time. If a step throws, the steps after
 * it never run and the exception reaches the caller unchanged.
 *
 * Executors:
 * - query(doc, step) runs a step directly against the live document
 * - ResetExecutor snapshots the document before each query and restores
 *   the snapshot if any step throws (all-or-nothing at the cost of one
 *   full document copy per query)
 */

#ifndef TOMLPATH_QUERY_HPP
#define TOMLPATH_QUERY_HPP

#include "tomlpath/Delete.hpp"
#include "tomlpath/Insert.hpp"
#include "tomlpath/Read.hpp"
#include "tomlpath/Set.hpp"
#include "tomlpath/Value.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tomlpath {

/// Input type of a step that starts a pipeline
using NoInput = std::monostate;

template <typename A, typename B>
class Chain;

/**
 * @brief CRTP base of every query step
 *
 * @tparam Derived The step type; must provide
 *         `Out execute(Value& doc, std::optional<Prev> prev) const`
 * @tparam Prev Input type (output type of the preceding step)
 * @tparam Out Output type
 */
template <typename Derived, typename Prev, typename Out>
class Query {
public:
    using Input = Prev;
    using Output = Out;

    /**
     * @brief Compose this step with a following one
     */
    template <typename Next>
    Chain<Derived, Next> chain(Next next) const {
        return Chain<Derived, Next>(static_cast<const Derived&>(*this), std::move(next));
    }
};

/**
 * @brief Two steps run in sequence
 */
template <typename A, typename B>
class Chain : public Query<Chain<A, B>, typename A::Input, typename B::Output> {
    static_assert(std::is_same<typename B::Input, typename A::Output>::value,
                  "chained query must take the previous query's output as input");

public:
    Chain(A first, B second)
        : first_(std::move(first)), second_(std::move(second)) {}

    typename B::Output execute(Value& doc, std::optional<typename A::Input> prev) const {
        auto intermediate = first_.execute(doc, std::move(prev));
        return second_.execute(doc, std::optional<typename B::Input>(std::move(intermediate)));
    }

private:
    A first_;
    B second_;
};

/**
 * @brief Free-function form of Query::chain()
 */
template <typename A, typename B>
Chain<A, B> chain(A first, B second) {
    return Chain<A, B>(std::move(first), std::move(second));
}

/**
 * @brief Step backed by a callable `Out(Value&, std::optional<Prev>)`
 */
template <typename Prev, typename Out, typename F>
class FnQuery : public Query<FnQuery<Prev, Out, F>, Prev, Out> {
public:
    explicit FnQuery(F fn) : fn_(std::move(fn)) {}

    Out execute(Value& doc, std::optional<Prev> prev) const {
        return fn_(doc, std::move(prev));
    }

private:
    F fn_;
};

/**
 * @brief Wrap a lambda as a query step
 *
 * ```cpp
 * auto bump = make_query<NoInput, std::int64_t>(
 *     [](Value& doc, std::optional<NoInput>) {
 *         Value* n = read_mut(doc, "counter");
 *         return ++*n->as_integer();
 *     });
 * ```
 */
template <typename Prev, typename Out, typename F>
FnQuery<Prev, Out, std::decay_t<F>> make_query(F&& fn) {
    return FnQuery<Prev, Out, std::decay_t<F>>(std::forward<F>(fn));
}

// ============================================================================
// Stock steps
// ============================================================================

/**
 * @brief Copy of the node at a path (std::nullopt if absent)
 */
template <typename Prev = NoInput>
class ReadQuery : public Query<ReadQuery<Prev>, Prev, std::optional<Value>> {
public:
    explicit ReadQuery(std::string path, char separator = kDefaultSeparator)
        : path_(std::move(path)), separator_(separator) {}

    std::optional<Value> execute(Value& doc, std::optional<Prev>) const {
        const Value* found = read_with_separator(doc, path_, separator_);
        if (found == nullptr) {
            return std::nullopt;
        }
        return *found;
    }

private:
    std::string path_;
    char separator_;
};

/**
 * @brief insert() as a step; outputs the replaced value
 */
template <typename Prev = NoInput>
class InsertQuery : public Query<InsertQuery<Prev>, Prev, std::optional<Value>> {
public:
    InsertQuery(std::string path, Value value, char separator = kDefaultSeparator)
        : path_(std::move(path)), value_(std::move(value)), separator_(separator) {}

    std::optional<Value> execute(Value& doc, std::optional<Prev>) const {
        return insert_with_separator(doc, path_, separator_, value_);
    }

private:
    std::string path_;
    Value value_;
    char separator_;
};

/**
 * @brief set() as a step; outputs the replaced value
 */
template <typename Prev = NoInput>
class SetQuery : public Query<SetQuery<Prev>, Prev, std::optional<Value>> {
public:
    SetQuery(std::string path, Value value, char separator = kDefaultSeparator)
        : path_(std::move(path)), value_(std::move(value)), separator_(separator) {}

    std::optional<Value> execute(Value& doc, std::optional<Prev>) const {
        return set_with_separator(doc, path_, separator_, value_);
    }

private:
    std::string path_;
    Value value_;
    char separator_;
};

/**
 * @brief remove() as a step; outputs the removed value
 */
template <typename Prev = NoInput>
class RemoveQuery : public Query<RemoveQuery<Prev>, Prev, std::optional<Value>> {
public:
    explicit RemoveQuery(std::string path, char separator = kDefaultSeparator)
        : path_(std::move(path)), separator_(separator) {}

    std::optional<Value> execute(Value& doc, std::optional<Prev>) const {
        return remove_with_separator(doc, path_, separator_);
    }

private:
    std::string path_;
    char separator_;
};

// ============================================================================
// Executors
// ============================================================================

/**
 * @brief Run a step against the live document
 *
 * The first step of the pipeline receives std::nullopt as input.
 */
template <typename Q>
typename Q::Output query(Value& doc, const Q& step) {
    return step.execute(doc, std::optional<typename Q::Input>());
}

/**
 * @brief Executor with all-or-nothing semantics
 *
 * Every query() copies the document first. If the step throws, the copy is
 * assigned back before the exception propagates, so a failed pipeline
 * leaves no trace of its earlier steps.
 *
 * ```cpp
 * ResetExecutor exec(doc);
 * exec.query(InsertQuery<>("a.b", 1).chain(SetQuery<std::optional<Value>>("x.[9]", 2)));
 * // set() fails → "a.b" is not in doc either
 * ```
 */
class ResetExecutor {
public:
    explicit ResetExecutor(Value& doc) : doc_(doc) {}

    template <typename Q>
    typename Q::Output query(const Q& step) {
        Value snapshot = doc_;
        try {
            return step.execute(doc_, std::optional<typename Q::Input>());
        } catch (...) {
            doc_ = std::move(snapshot);
            throw;
        }
    }

private:
    Value& doc_;
};

} // namespace tomlpath

#endif // TOMLPATH_QUERY_HPP
