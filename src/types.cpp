#include "loom/types.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace loom
{
std::ostream& operator<<(std::ostream& lhs, const value_type& rhs)
{
    const auto kind = static_cast<value_kind>(rhs.index());
    if (kind == value_kind::u32)
        lhs << std::get<uint32_t>(rhs);
    else if (kind == value_kind::u64)
        lhs << std::get<uint64_t>(rhs);
    else if (kind == value_kind::f32)
        lhs << std::get<float>(rhs);
    else if (kind == value_kind::f64)
        lhs << std::get<double>(rhs);
    else if (kind == value_kind::str)
        lhs << std::get<std::string>(rhs);
    else if (kind == value_kind::bin)
        lhs << "<" << std::get<binary_blob_t>(rhs).size() << " bytes>";
    else
        lhs << "<unknown_type>";

    return lhs;
}

const char* to_string(role r) noexcept
{
    switch (r)
    {
    case role::user:
        return "user";
    case role::assistant:
        return "assistant";
    case role::_count:
        break;
    }
    return "unknown";
}

std::optional<role> role_from_string(std::string_view str) noexcept
{
    if (str == "user")
        return role::user;
    if (str == "assistant")
        return role::assistant;
    return std::nullopt;
}

bool operator==(const message& lhs, const message& rhs)
{
    return std::tie(lhs.role, lhs.content, lhs.created) == std::tie(rhs.role, rhs.content, rhs.created);
}

bool operator!=(const message& lhs, const message& rhs)
{
    return !(lhs == rhs);
}

bool operator==(const generation_info& lhs, const generation_info& rhs)
{
    return std::tie(lhs.model, lhs.finish_reason, lhs.input_tokens, lhs.output_tokens) ==
           std::tie(rhs.model, rhs.finish_reason, rhs.input_tokens, rhs.output_tokens);
}

bool operator!=(const generation_info& lhs, const generation_info& rhs)
{
    return !(lhs == rhs);
}

bool node_metadata::has_tag(std::string_view tag) const
{
    return tags.find(std::string(tag)) != tags.end();
}

node_metadata node_metadata::with_tag(std::string tag) const
{
    node_metadata copy = *this;
    copy.tags.insert(std::move(tag));
    return copy;
}

node_metadata node_metadata::without_tag(std::string_view tag) const
{
    node_metadata copy = *this;
    copy.tags.erase(std::string(tag));
    return copy;
}

bool operator==(const node_metadata& lhs, const node_metadata& rhs)
{
    return lhs.tags == rhs.tags && lhs.source == rhs.source;
}

bool operator!=(const node_metadata& lhs, const node_metadata& rhs)
{
    return !(lhs == rhs);
}

bool operator==(const node_data& lhs, const node_data& rhs)
{
    return lhs.id == rhs.id && lhs.root == rhs.root && lhs.parent_id == rhs.parent_id && lhs.message == rhs.message &&
           lhs.child_ids == rhs.child_ids && lhs.metadata == rhs.metadata;
}

bool operator!=(const node_data& lhs, const node_data& rhs)
{
    return !(lhs == rhs);
}

bool operator==(const generation_parameters& lhs, const generation_parameters& rhs)
{
    return lhs.max_tokens == rhs.max_tokens && lhs.temperature == rhs.temperature && lhs.extra == rhs.extra;
}

bool operator==(const root_config& lhs, const root_config& rhs)
{
    return lhs.model == rhs.model && lhs.system_prompt == rhs.system_prompt && lhs.parameters == rhs.parameters;
}

bool operator==(const root_data& lhs, const root_data& rhs)
{
    return lhs.id == rhs.id && lhs.config == rhs.config && lhs.created_at == rhs.created_at;
}

bool operator!=(const root_data& lhs, const root_data& rhs)
{
    return !(lhs == rhs);
}

status validate(const message& msg)
{
    if (msg.role != role::user && msg.role != role::assistant)
        return error::validation("unknown message role");

    if (msg.content.empty())
        return error::validation("message content is empty");

    if (msg.content.size() > max_content_size_bytes)
        return error::validation("message content exceeds " + std::to_string(max_content_size_bytes) + " bytes");

    return {};
}

status validate(const node_metadata& metadata)
{
    if (metadata.tags.size() > max_num_tags)
        return error::validation("more than " + std::to_string(max_num_tags) + " tags");

    for (const std::string& tag : metadata.tags)
    {
        if (tag.empty())
            return error::validation("empty tag");
        if (tag.size() > max_tag_size_bytes)
            return error::validation("tag exceeds " + std::to_string(max_tag_size_bytes) + " bytes");
    }

    if (metadata.source && metadata.source->model.empty())
        return error::validation("generation info without a model name");

    return {};
}

status validate(const root_config& config)
{
    if (config.model.empty())
        return error::validation("model name is empty");

    const generation_parameters& params = config.parameters;
    if (params.max_tokens == 0)
        return error::validation("max_tokens must be positive");

    if (!std::isfinite(params.temperature) || params.temperature < 0.0)
        return error::validation("temperature must be a finite non-negative number");

    if (params.extra.size() > max_num_extra_parameters)
        return error::validation("more than " + std::to_string(max_num_extra_parameters) + " extra parameters");

    for (const auto& [name, value] : params.extra)
    {
        if (name.empty() || name.size() > max_value_name_size_bytes)
            return error::validation("invalid extra parameter name '" + name + "'");

        const auto kind = static_cast<value_kind>(value.index());
        if (kind == value_kind::str && std::get<std::string>(value).size() > max_str_value_size_bytes)
            return error::validation("extra parameter '" + name + "' is too long");
        if (kind == value_kind::bin && std::get<binary_blob_t>(value).size() > max_bin_value_size_bytes)
            return error::validation("extra parameter '" + name + "' is too long");
    }

    return {};
}

std::ostream& operator<<(std::ostream& lhs, const message& rhs)
{
    return lhs << "(" << to_string(rhs.role) << ") " << rhs.content;
}

std::ostream& operator<<(std::ostream& lhs, const node_data& rhs)
{
    lhs << "[" << rhs.id << "] ";
    if (rhs.parent_id)
        lhs << "parent=" << *rhs.parent_id;
    else
        lhs << "root=" << rhs.root;

    lhs << " " << rhs.message;

    if (!rhs.child_ids.empty())
        lhs << " children=" << rhs.child_ids.size();

    for (const std::string& tag : rhs.metadata.tags)
        lhs << " #" << tag;

    return lhs;
}

std::ostream& operator<<(std::ostream& lhs, const root_data& rhs)
{
    lhs << "[" << rhs.id << ":" << rhs.config.model << "]";
    for (const auto& [name, value] : rhs.config.parameters.extra)
        lhs << " " << name << " = " << value;
    return lhs;
}
} // namespace loom
