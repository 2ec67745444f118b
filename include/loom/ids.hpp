#pragma once

#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace loom
{
namespace detail
{
// Sequence-numbered identifier with a one letter textual prefix, e.g. "N12"
// Sequence numbers start at 1, zero is never a valid identifier
template <char Prefix>
class basic_id final
{
  public:
    static constexpr char prefix = Prefix;

    basic_id() = default;

    explicit constexpr basic_id(uint64_t seq) noexcept : seq_(seq)
    {
    }

    [[nodiscard]] constexpr uint64_t seq() const noexcept
    {
        return seq_;
    }

    [[nodiscard]] constexpr bool valid() const noexcept
    {
        return seq_ != 0;
    }

    [[nodiscard]] std::string str() const
    {
        return Prefix + std::to_string(seq_);
    }

    // Accepts only the canonical form produced by str()
    [[nodiscard]] static std::optional<basic_id> parse(std::string_view text)
    {
        if (text.size() < 2 || text.front() != Prefix)
            return std::nullopt;

        text.remove_prefix(1);

        // No leading zeros, so that parse(str()) is the only spelling of an id
        if (text.front() == '0')
            return std::nullopt;

        uint64_t seq = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), seq);
        if (ec != std::errc() || end != text.data() + text.size())
            return std::nullopt;

        return basic_id(seq);
    }

    friend constexpr bool operator==(basic_id lhs, basic_id rhs) noexcept
    {
        return lhs.seq_ == rhs.seq_;
    }

    friend constexpr bool operator!=(basic_id lhs, basic_id rhs) noexcept
    {
        return lhs.seq_ != rhs.seq_;
    }

    friend constexpr bool operator<(basic_id lhs, basic_id rhs) noexcept
    {
        return lhs.seq_ < rhs.seq_;
    }

    friend std::ostream& operator<<(std::ostream& lhs, basic_id rhs)
    {
        return lhs << Prefix << rhs.seq_;
    }

  private:
    uint64_t seq_ = 0;
};
} // namespace detail

using node_id = detail::basic_id<'N'>;
using root_id = detail::basic_id<'R'>;
} // namespace loom

namespace std
{
template <char Prefix>
struct hash<loom::detail::basic_id<Prefix>>
{
    size_t operator()(loom::detail::basic_id<Prefix> id) const noexcept
    {
        return hash<uint64_t>{}(id.seq());
    }
};
} // namespace std
