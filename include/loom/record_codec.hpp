#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "loom/types.hpp"

namespace loom
{
namespace detail
{
// A set of records that must become durable together
struct journal
{
    std::vector<root_data> roots;
    std::vector<node_data> nodes;

    [[nodiscard]] bool empty() const
    {
        return roots.empty() && nodes.empty();
    }
};

uint64_t fnv1a_64(const uint8_t* data, size_t size) noexcept;

// Every record is laid out as
//   signature | endianness | format version | payload | checksum
// where the checksum is FNV-1a over everything that precedes it
class serializer final
{
  public:
    static const inline std::vector<uint8_t> node_signature = {'=', 'N', 'O', 'D'};
    static const inline std::vector<uint8_t> root_signature = {'=', 'R', 'O', 'T'};
    static const inline std::vector<uint8_t> journal_signature = {'=', 'J', 'N', 'L'};

    static constexpr uint32_t format_version = 1;

    bool serialize_node(const node_data& n, std::vector<uint8_t>& buffer);
    std::optional<node_data> deserialize_node(const std::vector<uint8_t>& buffer);

    bool serialize_root(const root_data& r, std::vector<uint8_t>& buffer);
    std::optional<root_data> deserialize_root(const std::vector<uint8_t>& buffer);

    bool serialize_journal(const journal& j, std::vector<uint8_t>& buffer);
    std::optional<journal> deserialize_journal(const std::vector<uint8_t>& buffer);

  private:
    bool serialize_node_payload(const node_data& n, std::vector<uint8_t>& buffer);
    std::optional<node_data> deserialize_node_payload(const std::vector<uint8_t>& buffer, size_t& pos);

    bool serialize_root_payload(const root_data& r, std::vector<uint8_t>& buffer);
    std::optional<root_data> deserialize_root_payload(const std::vector<uint8_t>& buffer, size_t& pos);
};
} // namespace detail
} // namespace loom
