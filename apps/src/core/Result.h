#pragma once

#include <utility>
#include <variant>

namespace WaterClock {

/**
 * @brief Value-or-error return type.
 *
 * Usage:
 *   Result<int, std::string> parse(...);
 *   auto result = parse(...);
 *   if (result.isError()) {
 *       spdlog::error("{}", result.errorValue());
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value() { return std::get<0>(storage_); }
    const T& value() const { return std::get<0>(storage_); }

    E& errorValue() { return std::get<1>(storage_); }
    const E& errorValue() const { return std::get<1>(storage_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : storage_(tag, std::forward<V>(v))
    {}

    std::variant<T, E> storage_;
};

} // namespace WaterClock
