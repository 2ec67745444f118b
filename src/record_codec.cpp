#include <algorithm>
#include <array>
#include <cstring>
#include <iterator>
#include <tuple>

#include "loom/record_codec.hpp"

namespace loom
{
namespace
{
enum class endian
{
#ifdef _WIN32
    little = 0,
    big = 1,
    native = little
#else
    little = __ORDER_LITTLE_ENDIAN__,
    big = __ORDER_BIG_ENDIAN__,
    native = __BYTE_ORDER__
#endif
};

constexpr size_t checksum_size = sizeof(uint64_t);

std::optional<value_type> deserialize_u32(const std::vector<uint8_t>& buffer, size_t& pos)
{
    if (pos > buffer.size() || buffer.size() - pos < sizeof(uint32_t))
        return std::nullopt;

    uint32_t value;
    memcpy(&value, buffer.data() + pos, sizeof(uint32_t));
    pos += sizeof(uint32_t);

    return value;
}

bool serialize_u32(const value_type& value, std::vector<uint8_t>& buffer)
{
    if (!std::holds_alternative<uint32_t>(value))
        return false;

    const uint32_t u32 = std::get<uint32_t>(value);
    std::copy_n(reinterpret_cast<const uint8_t*>(&u32), sizeof(uint32_t), std::back_inserter(buffer));
    return true;
}

std::optional<value_type> deserialize_u64(const std::vector<uint8_t>& buffer, size_t& pos)
{
    if (pos > buffer.size() || buffer.size() - pos < sizeof(uint64_t))
        return std::nullopt;

    uint64_t value;
    memcpy(&value, buffer.data() + pos, sizeof(uint64_t));
    pos += sizeof(uint64_t);

    return value;
}

bool serialize_u64(const value_type& value, std::vector<uint8_t>& buffer)
{
    if (!std::holds_alternative<uint64_t>(value))
        return false;

    const uint64_t u64 = std::get<uint64_t>(value);
    std::copy_n(reinterpret_cast<const uint8_t*>(&u64), sizeof(uint64_t), std::back_inserter(buffer));
    return true;
}

std::optional<value_type> deserialize_f32(const std::vector<uint8_t>& buffer, size_t& pos)
{
    if (pos > buffer.size() || buffer.size() - pos < sizeof(float))
        return std::nullopt;

    float value;
    memcpy(&value, buffer.data() + pos, sizeof(float));
    pos += sizeof(float);

    return value;
}

bool serialize_f32(const value_type& value, std::vector<uint8_t>& buffer)
{
    if (!std::holds_alternative<float>(value))
        return false;

    const float f32 = std::get<float>(value);
    std::copy_n(reinterpret_cast<const uint8_t*>(&f32), sizeof(float), std::back_inserter(buffer));
    return true;
}

std::optional<value_type> deserialize_f64(const std::vector<uint8_t>& buffer, size_t& pos)
{
    if (pos > buffer.size() || buffer.size() - pos < sizeof(double))
        return std::nullopt;

    double value;
    memcpy(&value, buffer.data() + pos, sizeof(double));
    pos += sizeof(double);

    return value;
}

bool serialize_f64(const value_type& value, std::vector<uint8_t>& buffer)
{
    if (!std::holds_alternative<double>(value))
        return false;

    const double f64 = std::get<double>(value);
    std::copy_n(reinterpret_cast<const uint8_t*>(&f64), sizeof(double), std::back_inserter(buffer));
    return true;
}

std::optional<value_type> deserialize_str(const std::vector<uint8_t>& buffer, size_t& pos)
{
    const std::optional<value_type> opt = deserialize_u64(buffer, pos);
    if (!opt)
        return std::nullopt;
    const uint64_t len = std::get<uint64_t>(opt.value());

    if (buffer.size() - pos < len)
        return std::nullopt;

    auto str = std::string(reinterpret_cast<const char*>(buffer.data() + pos), static_cast<size_t>(len));
    pos += static_cast<size_t>(len);

    return str;
}

bool serialize_str(const value_type& value, std::vector<uint8_t>& buffer)
{
    if (!std::holds_alternative<std::string>(value))
        return false;

    const std::string& s = std::get<std::string>(value);

    bool success = serialize_u64(static_cast<uint64_t>(s.size()), buffer);
    buffer.insert(buffer.end(), s.begin(), s.end());

    return success;
}

std::optional<value_type> deserialize_bin(const std::vector<uint8_t>& buffer, size_t& pos)
{
    const std::optional<value_type> opt = deserialize_u64(buffer, pos);
    if (!opt)
        return std::nullopt;
    const uint64_t len = std::get<uint64_t>(opt.value());

    if (buffer.size() - pos < len)
        return std::nullopt;

    auto blob = binary_blob_t(buffer.data() + pos, buffer.data() + pos + len);
    pos += static_cast<size_t>(len);

    return blob;
}

bool serialize_bin(const value_type& value, std::vector<uint8_t>& buffer)
{
    if (!std::holds_alternative<binary_blob_t>(value))
        return false;

    const binary_blob_t& blob = std::get<binary_blob_t>(value);

    bool success = serialize_u64(static_cast<uint64_t>(blob.size()), buffer);
    buffer.insert(buffer.end(), blob.begin(), blob.end());

    return success;
}

constexpr std::array serializers = {
    std::make_tuple(value_kind::u32, deserialize_u32, serialize_u32),
    std::make_tuple(value_kind::u64, deserialize_u64, serialize_u64),
    std::make_tuple(value_kind::f32, deserialize_f32, serialize_f32),
    std::make_tuple(value_kind::f64, deserialize_f64, serialize_f64),
    std::make_tuple(value_kind::str, deserialize_str, serialize_str),
    std::make_tuple(value_kind::bin, deserialize_bin, serialize_bin),
};

static_assert(std::get<value_kind>(serializers[0]) == value_kind::u32);
static_assert(std::get<value_kind>(serializers[1]) == value_kind::u64);
static_assert(std::get<value_kind>(serializers[2]) == value_kind::f32);
static_assert(std::get<value_kind>(serializers[3]) == value_kind::f64);
static_assert(std::get<value_kind>(serializers[4]) == value_kind::str);
static_assert(std::get<value_kind>(serializers[5]) == value_kind::bin);
static_assert(serializers.size() == to_underlying(value_kind::_count));

bool serialize_header(const std::vector<uint8_t>& signature, std::vector<uint8_t>& buffer)
{
    bool success = true;

    success = success && serialize_bin(signature, buffer);
    success = success && serialize_u32(static_cast<uint32_t>(endian::native), buffer);
    success = success && serialize_u32(detail::serializer::format_version, buffer);

    return success;
}

bool deserialize_header(const std::vector<uint8_t>& signature, const std::vector<uint8_t>& buffer, size_t& pos)
{
    std::optional<value_type> opt = deserialize_bin(buffer, pos);
    if (!opt || std::get<binary_blob_t>(opt.value()) != signature)
        return false;

    opt = deserialize_u32(buffer, pos);
    if (!opt || static_cast<endian>(std::get<uint32_t>(opt.value())) != endian::native)
        return false;

    opt = deserialize_u32(buffer, pos);
    return opt && std::get<uint32_t>(opt.value()) == detail::serializer::format_version;
}

void append_checksum(std::vector<uint8_t>& buffer)
{
    const uint64_t checksum = detail::fnv1a_64(buffer.data(), buffer.size());
    serialize_u64(checksum, buffer);
}

// Returns the size of the checksummed part or nullopt if the record is damaged
std::optional<size_t> verify_checksum(const std::vector<uint8_t>& buffer)
{
    if (buffer.size() < checksum_size)
        return std::nullopt;

    const size_t body_size = buffer.size() - checksum_size;

    size_t pos = body_size;
    const std::optional<value_type> stored = deserialize_u64(buffer, pos);
    if (!stored || std::get<uint64_t>(stored.value()) != detail::fnv1a_64(buffer.data(), body_size))
        return std::nullopt;

    return body_size;
}

bool serialize_flag(bool flag, std::vector<uint8_t>& buffer)
{
    return serialize_u32(static_cast<uint32_t>(flag ? 1 : 0), buffer);
}

int64_t to_millis(timestamp ts)
{
    return static_cast<int64_t>(ts.time_since_epoch().count());
}

timestamp from_millis(uint64_t raw)
{
    return timestamp(std::chrono::milliseconds(static_cast<int64_t>(raw)));
}
} // namespace

namespace detail
{
uint64_t fnv1a_64(const uint8_t* data, size_t size) noexcept
{
    uint64_t hash = 14695981039346656037ull;
    for (size_t i = 0; i < size; ++i)
    {
        hash ^= data[i];
        hash *= 1099511628211ull;
    }
    return hash;
}

#define LOOM_DESERIALIZE_OPT(type, var, func)                                                                          \
    opt = func(buffer, pos);                                                                                           \
    if (!opt)                                                                                                          \
        return std::nullopt;                                                                                           \
    auto var = std::get<type>(opt.value());

bool serializer::serialize_node_payload(const node_data& n, std::vector<uint8_t>& buffer)
{
    bool success = true;

    success = success && serialize_u64(n.id.seq(), buffer);
    success = success && serialize_u64(n.root.seq(), buffer);

    // Sequence numbers start at 1, so zero encodes a root-level node
    success = success && serialize_u64(n.parent_id ? n.parent_id->seq() : uint64_t{0}, buffer);

    success = success && serialize_u32(static_cast<uint32_t>(to_underlying(n.message.role)), buffer);
    success = success && serialize_str(n.message.content, buffer);
    success = success && serialize_u64(static_cast<uint64_t>(to_millis(n.message.created)), buffer);

    success = success && serialize_u64(static_cast<uint64_t>(n.child_ids.size()), buffer);
    for (const node_id& child : n.child_ids)
        success = success && serialize_u64(child.seq(), buffer);

    success = success && serialize_u64(static_cast<uint64_t>(n.metadata.tags.size()), buffer);
    for (const std::string& tag : n.metadata.tags)
        success = success && serialize_str(tag, buffer);

    const std::optional<generation_info>& source = n.metadata.source;
    success = success && serialize_flag(source.has_value(), buffer);
    if (source)
    {
        success = success && serialize_str(source->model, buffer);

        success = success && serialize_flag(source->finish_reason.has_value(), buffer);
        if (source->finish_reason)
            success = success && serialize_str(*source->finish_reason, buffer);

        success = success && serialize_flag(source->input_tokens.has_value(), buffer);
        if (source->input_tokens)
            success = success && serialize_u64(*source->input_tokens, buffer);

        success = success && serialize_flag(source->output_tokens.has_value(), buffer);
        if (source->output_tokens)
            success = success && serialize_u64(*source->output_tokens, buffer);
    }

    return success;
}

std::optional<node_data> serializer::deserialize_node_payload(const std::vector<uint8_t>& buffer, size_t& pos)
{
    std::optional<value_type> opt;
    node_data n;

    LOOM_DESERIALIZE_OPT(uint64_t, id, deserialize_u64)
    LOOM_DESERIALIZE_OPT(uint64_t, root, deserialize_u64)
    LOOM_DESERIALIZE_OPT(uint64_t, parent, deserialize_u64)
    if (id == 0 || root == 0)
        return std::nullopt;

    n.id = node_id(id);
    n.root = root_id(root);
    if (parent != 0)
        n.parent_id = node_id(parent);

    LOOM_DESERIALIZE_OPT(uint32_t, role_value, deserialize_u32)
    if (role_value >= to_underlying(role::_count))
        return std::nullopt;
    n.message.role = static_cast<role>(role_value);

    LOOM_DESERIALIZE_OPT(std::string, content, deserialize_str)
    n.message.content = std::move(content);

    LOOM_DESERIALIZE_OPT(uint64_t, created, deserialize_u64)
    n.message.created = from_millis(created);

    LOOM_DESERIALIZE_OPT(uint64_t, children_count, deserialize_u64)
    for (uint64_t i = 0; i < children_count; ++i)
    {
        LOOM_DESERIALIZE_OPT(uint64_t, child, deserialize_u64)
        if (child == 0)
            return std::nullopt;
        n.child_ids.emplace_back(child);
    }

    LOOM_DESERIALIZE_OPT(uint64_t, tags_count, deserialize_u64)
    for (uint64_t i = 0; i < tags_count; ++i)
    {
        LOOM_DESERIALIZE_OPT(std::string, tag, deserialize_str)
        n.metadata.tags.insert(std::move(tag));
    }

    LOOM_DESERIALIZE_OPT(uint32_t, has_source, deserialize_u32)
    if (has_source)
    {
        generation_info source;

        LOOM_DESERIALIZE_OPT(std::string, model, deserialize_str)
        source.model = std::move(model);

        LOOM_DESERIALIZE_OPT(uint32_t, has_finish_reason, deserialize_u32)
        if (has_finish_reason)
        {
            LOOM_DESERIALIZE_OPT(std::string, finish_reason, deserialize_str)
            source.finish_reason = std::move(finish_reason);
        }

        LOOM_DESERIALIZE_OPT(uint32_t, has_input_tokens, deserialize_u32)
        if (has_input_tokens)
        {
            LOOM_DESERIALIZE_OPT(uint64_t, input_tokens, deserialize_u64)
            source.input_tokens = input_tokens;
        }

        LOOM_DESERIALIZE_OPT(uint32_t, has_output_tokens, deserialize_u32)
        if (has_output_tokens)
        {
            LOOM_DESERIALIZE_OPT(uint64_t, output_tokens, deserialize_u64)
            source.output_tokens = output_tokens;
        }

        n.metadata.source = std::move(source);
    }

    return n;
}

bool serializer::serialize_root_payload(const root_data& r, std::vector<uint8_t>& buffer)
{
    bool success = true;

    success = success && serialize_u64(r.id.seq(), buffer);
    success = success && serialize_u64(static_cast<uint64_t>(to_millis(r.created_at)), buffer);
    success = success && serialize_str(r.config.model, buffer);

    success = success && serialize_flag(r.config.system_prompt.has_value(), buffer);
    if (r.config.system_prompt)
        success = success && serialize_str(*r.config.system_prompt, buffer);

    const generation_parameters& params = r.config.parameters;
    success = success && serialize_u32(params.max_tokens, buffer);
    success = success && serialize_f64(params.temperature, buffer);

    success = success && serialize_u64(static_cast<uint64_t>(params.extra.size()), buffer);
    for (const auto& [name, value] : params.extra)
    {
        const auto kind = static_cast<uint64_t>(value.index());
        success = success && serialize_str(name, buffer);
        success = success && serialize_u64(kind, buffer);
        success = success && std::get<2>(serializers[kind])(value, buffer);
    }

    return success;
}

std::optional<root_data> serializer::deserialize_root_payload(const std::vector<uint8_t>& buffer, size_t& pos)
{
    std::optional<value_type> opt;
    root_data r;

    LOOM_DESERIALIZE_OPT(uint64_t, id, deserialize_u64)
    if (id == 0)
        return std::nullopt;
    r.id = root_id(id);

    LOOM_DESERIALIZE_OPT(uint64_t, created, deserialize_u64)
    r.created_at = from_millis(created);

    LOOM_DESERIALIZE_OPT(std::string, model, deserialize_str)
    r.config.model = std::move(model);

    LOOM_DESERIALIZE_OPT(uint32_t, has_system_prompt, deserialize_u32)
    if (has_system_prompt)
    {
        LOOM_DESERIALIZE_OPT(std::string, system_prompt, deserialize_str)
        r.config.system_prompt = std::move(system_prompt);
    }

    LOOM_DESERIALIZE_OPT(uint32_t, max_tokens, deserialize_u32)
    r.config.parameters.max_tokens = max_tokens;

    LOOM_DESERIALIZE_OPT(double, temperature, deserialize_f64)
    r.config.parameters.temperature = temperature;

    LOOM_DESERIALIZE_OPT(uint64_t, extra_count, deserialize_u64)
    for (uint64_t i = 0; i < extra_count; ++i)
    {
        LOOM_DESERIALIZE_OPT(std::string, name, deserialize_str)
        LOOM_DESERIALIZE_OPT(uint64_t, kind, deserialize_u64)
        if (kind >= serializers.size())
            return std::nullopt;

        opt = std::get<1>(serializers[static_cast<size_t>(kind)])(buffer, pos);
        if (!opt)
            return std::nullopt;
        r.config.parameters.extra.emplace(std::move(name), std::move(opt.value()));
    }

    return r;
}

bool serializer::serialize_node(const node_data& n, std::vector<uint8_t>& buffer)
{
    std::vector<uint8_t> record;
    record.reserve(256);

    bool success = true;
    success = success && serialize_header(node_signature, record);
    success = success && serialize_node_payload(n, record);
    if (!success)
        return false;

    append_checksum(record);
    buffer.insert(buffer.end(), record.begin(), record.end());
    return true;
}

std::optional<node_data> serializer::deserialize_node(const std::vector<uint8_t>& buffer)
{
    const std::optional<size_t> body_size = verify_checksum(buffer);
    if (!body_size)
        return std::nullopt;

    size_t pos = 0;
    if (!deserialize_header(node_signature, buffer, pos))
        return std::nullopt;

    std::optional<node_data> n = deserialize_node_payload(buffer, pos);
    if (!n || pos != *body_size)
        return std::nullopt;

    return n;
}

bool serializer::serialize_root(const root_data& r, std::vector<uint8_t>& buffer)
{
    std::vector<uint8_t> record;
    record.reserve(256);

    bool success = true;
    success = success && serialize_header(root_signature, record);
    success = success && serialize_root_payload(r, record);
    if (!success)
        return false;

    append_checksum(record);
    buffer.insert(buffer.end(), record.begin(), record.end());
    return true;
}

std::optional<root_data> serializer::deserialize_root(const std::vector<uint8_t>& buffer)
{
    const std::optional<size_t> body_size = verify_checksum(buffer);
    if (!body_size)
        return std::nullopt;

    size_t pos = 0;
    if (!deserialize_header(root_signature, buffer, pos))
        return std::nullopt;

    std::optional<root_data> r = deserialize_root_payload(buffer, pos);
    if (!r || pos != *body_size)
        return std::nullopt;

    return r;
}

bool serializer::serialize_journal(const journal& j, std::vector<uint8_t>& buffer)
{
    std::vector<uint8_t> record;
    record.reserve(512);

    bool success = serialize_header(journal_signature, record);

    // Entries are embedded as complete records, each with its own checksum
    success = success && serialize_u64(static_cast<uint64_t>(j.roots.size()), record);
    for (const root_data& r : j.roots)
    {
        binary_blob_t entry;
        success = success && serialize_root(r, entry);
        success = success && serialize_bin(std::move(entry), record);
    }

    success = success && serialize_u64(static_cast<uint64_t>(j.nodes.size()), record);
    for (const node_data& n : j.nodes)
    {
        binary_blob_t entry;
        success = success && serialize_node(n, entry);
        success = success && serialize_bin(std::move(entry), record);
    }

    if (!success)
        return false;

    append_checksum(record);
    buffer.insert(buffer.end(), record.begin(), record.end());
    return true;
}

std::optional<journal> serializer::deserialize_journal(const std::vector<uint8_t>& buffer)
{
    const std::optional<size_t> body_size = verify_checksum(buffer);
    if (!body_size)
        return std::nullopt;

    size_t pos = 0;
    if (!deserialize_header(journal_signature, buffer, pos))
        return std::nullopt;

    std::optional<value_type> opt;
    journal j;

    LOOM_DESERIALIZE_OPT(uint64_t, roots_count, deserialize_u64)
    for (uint64_t i = 0; i < roots_count; ++i)
    {
        LOOM_DESERIALIZE_OPT(binary_blob_t, entry, deserialize_bin)
        std::optional<root_data> r = deserialize_root(entry);
        if (!r)
            return std::nullopt;
        j.roots.push_back(std::move(r.value()));
    }

    LOOM_DESERIALIZE_OPT(uint64_t, nodes_count, deserialize_u64)
    for (uint64_t i = 0; i < nodes_count; ++i)
    {
        LOOM_DESERIALIZE_OPT(binary_blob_t, entry, deserialize_bin)
        std::optional<node_data> n = deserialize_node(entry);
        if (!n)
            return std::nullopt;
        j.nodes.push_back(std::move(n.value()));
    }

    if (pos != *body_size)
        return std::nullopt;

    return j;
}

#undef LOOM_DESERIALIZE_OPT
} // namespace detail
} // namespace loom
