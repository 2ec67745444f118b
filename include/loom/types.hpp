#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "loom/error.hpp"
#include "loom/ids.hpp"

namespace loom
{
enum class value_kind : uint8_t
{
    u32,
    u64,
    f32,
    f64,
    str,
    bin,
    _count
};

using binary_blob_t = std::vector<uint8_t>;

using value_type = std::variant<uint32_t, uint64_t, float, double, std::string, binary_blob_t>;

constexpr size_t max_value_name_size_bytes = 255;
constexpr size_t max_str_value_size_bytes = 255;
constexpr size_t max_bin_value_size_bytes = 255;

// Bounds of the extension map in generation_parameters
constexpr size_t max_num_extra_parameters = 10;

constexpr size_t max_num_tags = 32;
constexpr size_t max_tag_size_bytes = 255;
constexpr size_t max_content_size_bytes = 16 * 1024 * 1024;

template <class T>
constexpr auto to_underlying(T value) noexcept
{
    return static_cast<std::underlying_type_t<T>>(value);
}

static_assert(std::is_same_v<uint32_t, std::variant_alternative_t<to_underlying(value_kind::u32), value_type>>);
static_assert(std::is_same_v<uint64_t, std::variant_alternative_t<to_underlying(value_kind::u64), value_type>>);
static_assert(std::is_same_v<float, std::variant_alternative_t<to_underlying(value_kind::f32), value_type>>);
static_assert(std::is_same_v<double, std::variant_alternative_t<to_underlying(value_kind::f64), value_type>>);
static_assert(std::is_same_v<std::string, std::variant_alternative_t<to_underlying(value_kind::str), value_type>>);
static_assert(std::is_same_v<binary_blob_t, std::variant_alternative_t<to_underlying(value_kind::bin), value_type>>);
static_assert(std::variant_size_v<value_type> == to_underlying(value_kind::_count));

std::ostream& operator<<(std::ostream& lhs, const value_type& rhs);

namespace literals
{
constexpr uint32_t operator""_u32(unsigned long long value)
{
    return static_cast<uint32_t>(value);
}

constexpr uint64_t operator""_u64(unsigned long long value)
{
    return static_cast<uint64_t>(value);
}
} // namespace literals

// Millisecond resolution is what gets persisted
using timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

[[nodiscard]] inline timestamp now()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

namespace tags
{
// Marks a node whose branch has not been viewed yet
constexpr const char* unread = "unread";
} // namespace tags

enum class role : uint8_t
{
    user,
    assistant,
    _count
};

[[nodiscard]] const char* to_string(role r) noexcept;
[[nodiscard]] std::optional<role> role_from_string(std::string_view str) noexcept;

struct message
{
    loom::role role = loom::role::user;
    std::string content;
    timestamp created = now();
};

bool operator==(const message& lhs, const message& rhs);
bool operator!=(const message& lhs, const message& rhs);

// Describes which model produced an assistant message
struct generation_info
{
    std::string model;
    std::optional<std::string> finish_reason;
    std::optional<uint64_t> input_tokens;
    std::optional<uint64_t> output_tokens;
};

bool operator==(const generation_info& lhs, const generation_info& rhs);
bool operator!=(const generation_info& lhs, const generation_info& rhs);

struct node_metadata
{
    std::set<std::string> tags;
    std::optional<generation_info> source;

    [[nodiscard]] bool has_tag(std::string_view tag) const;

    // Copies with the tag added or removed, for callers computing an update
    [[nodiscard]] node_metadata with_tag(std::string tag) const;
    [[nodiscard]] node_metadata without_tag(std::string_view tag) const;
};

bool operator==(const node_metadata& lhs, const node_metadata& rhs);
bool operator!=(const node_metadata& lhs, const node_metadata& rhs);

struct node_data
{
    node_id id;
    loom::root_id root;
    std::optional<node_id> parent_id; // nullopt for root-level nodes
    loom::message message;
    std::vector<node_id> child_ids;   // Creation order
    node_metadata metadata;

    [[nodiscard]] bool root_level() const noexcept
    {
        return !parent_id.has_value();
    }
};

bool operator==(const node_data& lhs, const node_data& rhs);
bool operator!=(const node_data& lhs, const node_data& rhs);

struct generation_parameters
{
    uint32_t max_tokens = 1024;
    double temperature = 1.0;

    // Provider specific options not covered above, e.g. "top_p"
    std::map<std::string, value_type> extra;
};

bool operator==(const generation_parameters& lhs, const generation_parameters& rhs);

struct root_config
{
    std::string model;
    std::optional<std::string> system_prompt;
    generation_parameters parameters;
};

bool operator==(const root_config& lhs, const root_config& rhs);

struct root_data
{
    root_id id;
    root_config config;
    timestamp created_at;
};

bool operator==(const root_data& lhs, const root_data& rhs);
bool operator!=(const root_data& lhs, const root_data& rhs);

// Structural checks performed by mutators before anything is written
[[nodiscard]] status validate(const message& msg);
[[nodiscard]] status validate(const node_metadata& metadata);
[[nodiscard]] status validate(const root_config& config);

std::ostream& operator<<(std::ostream& lhs, const message& rhs);
std::ostream& operator<<(std::ostream& lhs, const node_data& rhs);
std::ostream& operator<<(std::ostream& lhs, const root_data& rhs);
} // namespace loom
