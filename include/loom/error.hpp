#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace loom
{
enum class error_code : uint8_t
{
    not_found,
    invalid_range,
    io_error,
    busy,
    validation,
};

[[nodiscard]] constexpr const char* error_code_name(error_code code) noexcept
{
    switch (code)
    {
    case error_code::not_found:
        return "not_found";
    case error_code::invalid_range:
        return "invalid_range";
    case error_code::io_error:
        return "io_error";
    case error_code::busy:
        return "busy";
    case error_code::validation:
        return "validation";
    }
    return "unknown";
}

class error final
{
  public:
    error(error_code code, std::string message) : code_(code), message_(std::move(message))
    {
    }

    [[nodiscard]] static error not_found(const std::string& what)
    {
        return error(error_code::not_found, "not found: " + what);
    }

    [[nodiscard]] static error invalid_range(const std::string& what)
    {
        return error(error_code::invalid_range, "invalid range: " + what);
    }

    [[nodiscard]] static error io(const std::string& what)
    {
        return error(error_code::io_error, "i/o error: " + what);
    }

    [[nodiscard]] static error busy(const std::string& what)
    {
        return error(error_code::busy, "busy: " + what);
    }

    [[nodiscard]] static error validation(const std::string& what)
    {
        return error(error_code::validation, "validation failed: " + what);
    }

    [[nodiscard]] error_code code() const noexcept
    {
        return code_;
    }

    [[nodiscard]] const std::string& message() const noexcept
    {
        return message_;
    }

    // Attaches a key/value pair, e.g. the offending id or file path
    error& with_context(const std::string& key, const std::string& value)
    {
        context_[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* context(const std::string& key) const
    {
        const auto it = context_.find(key);
        return it != context_.end() ? &it->second : nullptr;
    }

    friend std::ostream& operator<<(std::ostream& lhs, const error& rhs)
    {
        lhs << error_code_name(rhs.code_) << ": " << rhs.message_;
        for (const auto& [key, value] : rhs.context_)
            lhs << " [" << key << "=" << value << "]";
        return lhs;
    }

  private:
    error_code code_;
    std::string message_;
    std::map<std::string, std::string> context_;
};

// Value-or-error return type used by every fallible operation
template <typename T>
class result final
{
  public:
    using value_type = T;

    result(T value) : storage_(std::in_place_index<0>, std::move(value))
    {
    }

    result(loom::error err) : storage_(std::in_place_index<1>, std::move(err))
    {
    }

    [[nodiscard]] bool is_ok() const noexcept
    {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept
    {
        return storage_.index() == 1;
    }

    explicit operator bool() const noexcept
    {
        return is_ok();
    }

    // Undefined if the result holds an error
    [[nodiscard]] T& value() &
    {
        return *std::get_if<0>(&storage_);
    }

    [[nodiscard]] const T& value() const&
    {
        return *std::get_if<0>(&storage_);
    }

    [[nodiscard]] T&& value() &&
    {
        return std::move(*std::get_if<0>(&storage_));
    }

    T* operator->()
    {
        return std::get_if<0>(&storage_);
    }

    const T* operator->() const
    {
        return std::get_if<0>(&storage_);
    }

    // Undefined if the result holds a value
    [[nodiscard]] const loom::error& error() const&
    {
        return *std::get_if<1>(&storage_);
    }

    [[nodiscard]] loom::error&& error() &&
    {
        return std::move(*std::get_if<1>(&storage_));
    }

    [[nodiscard]] error_code code() const
    {
        return error().code();
    }

  private:
    std::variant<T, loom::error> storage_;
};

template <>
class result<void> final
{
  public:
    result() = default;

    result(loom::error err) : error_(std::move(err))
    {
    }

    [[nodiscard]] bool is_ok() const noexcept
    {
        return !error_.has_value();
    }

    [[nodiscard]] bool is_err() const noexcept
    {
        return error_.has_value();
    }

    explicit operator bool() const noexcept
    {
        return is_ok();
    }

    [[nodiscard]] const loom::error& error() const&
    {
        return *error_;
    }

    [[nodiscard]] loom::error&& error() &&
    {
        return std::move(*error_);
    }

    [[nodiscard]] error_code code() const
    {
        return error_->code();
    }

  private:
    std::optional<loom::error> error_;
};

using status = result<void>;
} // namespace loom
