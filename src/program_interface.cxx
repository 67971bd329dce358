#include "glmeta/program_interface.hxx"

#include "glmeta/attribute.hxx"
#include "glmeta/binding_accessor.hxx"
#include "glmeta/glmeta_error.hxx"
#include "glmeta/logger.hxx"
#include "glmeta/type_table.hxx"
#include "glmeta/uniform_block.hxx"

#include <string>
#include <utility>

namespace
{
    using log_level = glmeta::I_logger::log_level;

    auto is_builtin(std::string_view name) -> bool
    {
        return name.starts_with("gl_");
    }

    template <typename Map>
    auto find_in(Map const& map, std::string_view name) -> typename Map::mapped_type
    {
        auto it = map.find(name);
        return it != map.end() ? it->second : nullptr;
    }
}

auto glmeta::strip_array_suffix(std::string_view name) -> std::string_view
{
    if (!name.ends_with(']')) {
        return name;
    }
    auto open = name.rfind('[');
    if (std::string_view::npos == open) {
        return name;
    }
    return name.substr(0, open);
}

glmeta::program_interface::program_interface(
    I_program_query const& query,
    I_binding_accessor& bindings,
    I_logger* logger,
    introspection_options const& options
)
    : m_program{ query.program() }
    , m_attributes{ }
    , m_uniform_blocks{ }
    , m_attributes_by_name{ }
    , m_uniform_blocks_by_name{ }
{
    for (auto const& raw : query.active_attributes()) {
        if (options.skip_builtins && is_builtin(raw.name)) {
            continue;
        }

        auto name = std::string{
            options.strip_array_suffix ? strip_array_suffix(raw.name) : raw.name
        };
        if (m_attributes_by_name.contains(name)) {
            throw glmeta_error{ "Duplicate attribute name: " + name };
        }

        auto attr = make_attribute(name, raw.gl_type, m_program, raw.location, raw.array_length);
        if (shape::unknown == attr->shape()) {
            log_message(
                logger,
                "Attribute " + name + " has unsupported GL type " + std::to_string(raw.gl_type),
                log_level::warning
            );
        }
        log_message(
            logger,
            "Attribute " + name + ": location " + std::to_string(attr->location())
                + ", dimension " + std::to_string(attr->dimension())
                + ", shape " + attr->shape(),
            log_level::debug
        );

        m_attributes_by_name.emplace(std::move(name), attr.get());
        m_attributes.push_back(std::move(attr));
    }

    for (auto const& raw : query.active_uniform_blocks()) {
        auto name = std::string{
            options.strip_array_suffix ? strip_array_suffix(raw.name) : raw.name
        };
        if (m_uniform_blocks_by_name.contains(name)) {
            throw glmeta_error{ "Duplicate uniform block name: " + name };
        }

        auto block = make_uniform_block(name, m_program, raw.index, raw.size, bindings);
        log_message(
            logger,
            "Uniform block " + name + ": index " + std::to_string(block->index())
                + ", size " + std::to_string(block->size()),
            log_level::debug
        );

        m_uniform_blocks_by_name.emplace(std::move(name), block.get());
        m_uniform_blocks.push_back(std::move(block));
    }
}

glmeta::program_interface::program_interface(program_interface&&) noexcept = default;

auto glmeta::program_interface::operator=(program_interface&&) noexcept -> program_interface& = default;

glmeta::program_interface::~program_interface() = default;

auto glmeta::program_interface::program() const -> unsigned int
{
    return m_program;
}

auto glmeta::program_interface::attributes() const -> std::vector<std::unique_ptr<attribute>> const&
{
    return m_attributes;
}

auto glmeta::program_interface::uniform_blocks() const -> std::vector<std::unique_ptr<uniform_block>> const&
{
    return m_uniform_blocks;
}

auto glmeta::program_interface::find_attribute(std::string_view name) -> attribute*
{
    return find_in(m_attributes_by_name, name);
}

auto glmeta::program_interface::find_attribute(std::string_view name) const -> attribute const*
{
    return find_in(m_attributes_by_name, name);
}

auto glmeta::program_interface::find_uniform_block(std::string_view name) -> uniform_block*
{
    return find_in(m_uniform_blocks_by_name, name);
}

auto glmeta::program_interface::find_uniform_block(std::string_view name) const -> uniform_block const*
{
    return find_in(m_uniform_blocks_by_name, name);
}

auto glmeta::program_interface::get_attribute(std::string_view name) -> attribute&
{
    if (auto attr = find_attribute(name)) {
        return *attr;
    }
    throw glmeta_error{ "No active attribute named " + std::string{ name } };
}

auto glmeta::program_interface::get_attribute(std::string_view name) const -> attribute const&
{
    if (auto attr = find_attribute(name)) {
        return *attr;
    }
    throw glmeta_error{ "No active attribute named " + std::string{ name } };
}

auto glmeta::program_interface::get_uniform_block(std::string_view name) -> uniform_block&
{
    if (auto block = find_uniform_block(name)) {
        return *block;
    }
    throw glmeta_error{ "No active uniform block named " + std::string{ name } };
}

auto glmeta::program_interface::get_uniform_block(std::string_view name) const -> uniform_block const&
{
    if (auto block = find_uniform_block(name)) {
        return *block;
    }
    throw glmeta_error{ "No active uniform block named " + std::string{ name } };
}
