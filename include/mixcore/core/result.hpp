#pragma once
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <variant>
namespace mixcore {

/// Value for results that carry no payload on success.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/// Thrown when a Result is unwrapped on the side it does not hold.
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Success value or failure, never both
 *
 * Every fallible operation in the library returns one of these; nothing
 * throws across the API. Unwrapping the wrong side is a programming error
 * and raises BadResultAccess.
 */
template<typename T, typename E>
class [[nodiscard]] Result {
public:
    static Result Ok(T value) {
        return Result(std::in_place_index<OK_INDEX>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<ERR_INDEX>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == OK_INDEX; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == ERR_INDEX; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<OK_INDEX>(storage_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<OK_INDEX>(storage_);
    }

    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<OK_INDEX>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<ERR_INDEX>(storage_);
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<ERR_INDEX>(storage_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<ERR_INDEX>(std::move(storage_));
    }

private:
    static constexpr std::size_t OK_INDEX = 0;
    static constexpr std::size_t ERR_INDEX = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (!IsOk()) {
            throw BadResultAccess("Unwrap() called on an Err result");
        }
    }

    void RequireErr() const {
        if (!IsErr()) {
            throw BadResultAccess("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> storage_;
};

}
