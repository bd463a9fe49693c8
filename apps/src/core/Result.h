#pragma once

#include <utility>
#include <variant>

namespace SimPool {

/**
 * @brief Value-or-error return type used by fallible operations.
 *
 * Construct with Result::okay() or Result::error(). Use std::monostate as T for
 * operations that have no value on success.
 */
template <typename T, typename E>
class Result {
public:
    Result() = default;

    static Result okay(T value)
    {
        Result result;
        result.storage_.template emplace<0>(std::move(value));
        return result;
    }

    static Result error(E error)
    {
        Result result;
        result.storage_.template emplace<1>(std::move(error));
        return result;
    }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value() { return std::get<0>(storage_); }
    const T& value() const { return std::get<0>(storage_); }

    E& errorValue() { return std::get<1>(storage_); }
    const E& errorValue() const { return std::get<1>(storage_); }

private:
    std::variant<T, E> storage_;
};

} // namespace SimPool
