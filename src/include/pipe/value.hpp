#pragma once

/*******************************************************************************
 * @file value.hpp
 * @brief Value: the dynamically typed argument of a pipe message.
 ******************************************************************************/

#include "pipe/representation.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace testpipe::pipe
{

/// An engine object of a type with no registered representation.
struct Opaque
{
    std::string type_name;

    bool operator==(const Opaque &) const = default;
};

class Value
{
  public:
    using Sequence = std::vector<Value>;
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, Sequence,
                                 Representation, Opaque>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : m_data(b) {}
    template <std::integral I>
        requires(!std::same_as<I, bool>)
    Value(I n) : m_data(static_cast<int64_t>(n))
    {
    }
    Value(double d) : m_data(d) {}
    Value(const char *s) : m_data(std::string(s)) {}
    Value(std::string s) : m_data(std::move(s)) {}
    Value(Sequence seq) : m_data(std::move(seq)) {}
    Value(Representation r) : m_data(std::move(r)) {}
    template <typename R>
        requires is_representation_v<R>
    Value(R r) : m_data(Representation(std::move(r)))
    {
    }
    Value(Opaque o) : m_data(std::move(o)) {}

    bool is_none() const noexcept { return std::holds_alternative<std::monostate>(m_data); }

    template <typename T> bool holds() const noexcept
    {
        return std::holds_alternative<T>(m_data);
    }
    template <typename T> const T *get_if() const noexcept { return std::get_if<T>(&m_data); }

    /// The representation of kind R, or nullptr.
    template <typename R> const R *as() const noexcept
    {
        if (const auto *r = std::get_if<Representation>(&m_data))
            return std::get_if<R>(r);
        return nullptr;
    }

    const Storage &storage() const noexcept { return m_data; }

    bool operator==(const Value &) const = default;

  private:
    Storage m_data;
};

} // namespace testpipe::pipe
