#include "loom/forest.hpp"
#include "loom/log.hpp"
#include "loom/session.hpp"
#include "loom/tag_partitioner.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace loom;

namespace
{
message make_message(role r, std::string content)
{
    message msg;
    msg.role = r;
    msg.content = std::move(content);
    return msg;
}

node_metadata unread_reply(const std::string& model)
{
    node_metadata metadata;
    metadata.tags.insert(tags::unread);
    metadata.source = generation_info{model, "stop", std::nullopt, std::nullopt};
    return metadata;
}

template <typename T>
T unwrap(result<T> r)
{
    if (!r)
    {
        std::cerr << r.error() << std::endl;
        std::exit(EXIT_FAILURE);
    }
    return std::move(r).value();
}
} // namespace

int main(int argc, char** argv)
{
    if (const char* level = std::getenv("LOOM_LOG_LEVEL"))
    {
        if (auto parsed = parse_log_level(level))
            set_log_level(*parsed);
    }

    forest_options options;
    options.data_dir = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::temp_directory_path() / "loom_example";

    forest f = unwrap(forest::open(options));

    root_config config;
    config.model = "gpt-4";
    config.system_prompt = "You are a helpful assistant.";
    const root_data root = unwrap(f.create_root(config));

    const node_data question = unwrap(f.create_message_node(root.id, make_message(role::user, "Name a prime number")));
    const node_data two = unwrap(f.create_message_node(question.id, make_message(role::assistant, "2"), unread_reply(config.model)));
    unwrap(f.create_message_node(question.id, make_message(role::assistant, "7"), unread_reply(config.model)));
    const node_data follow_up = unwrap(f.create_message_node(two.id, make_message(role::user, "Why is it prime?")));

    // The user has seen "2", mark it read
    unwrap(f.update_node_metadata(two.id, two.metadata.without_tag(tags::unread)));

    const path_result path = unwrap(f.get_path({std::nullopt, follow_up.id}));

    std::cout << "root: " << path.root << std::endl;
    for (const node_data& n : path.path)
        std::cout << "  " << n << std::endl;

    std::cout << "answers to " << question.id << ":" << std::endl;
    for (const node_data& n : partition_by_tag(f.get_children(question.id), tags::unread))
        std::cout << "  " << n << std::endl;

    const session_pointer pointer(options.data_dir);
    if (auto st = pointer.save(follow_up.id); !st)
    {
        std::cerr << st.error() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "current node: " << pointer.load().value() << std::endl;
}
