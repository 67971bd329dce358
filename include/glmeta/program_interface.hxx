#pragma once

#include "glmeta/glmeta_export.hxx"
#include "glmeta/attribute.hxx"
#include "glmeta/uniform_block.hxx"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace glmeta
{
    class I_binding_accessor;
    class I_logger;

    /// Attribute data as reported by the driver; name may carry "[0]".
    struct active_attribute
    {
        std::string name;
        unsigned int gl_type;
        int location;
        int array_length;
    };

    struct active_uniform_block
    {
        std::string name;
        int index;
        int size;
    };

    ////////////////////////////////////////////////////////////////////////////
    /// @class I_program_query
    /// @brief Source of the raw introspection data of one linked program.
    ////////////////////////////////////////////////////////////////////////////
    class I_program_query
    {
    public:
        virtual ~I_program_query() = default;

        virtual auto program() const -> unsigned int = 0;
        virtual auto active_attributes() const -> std::vector<active_attribute> = 0;
        virtual auto active_uniform_blocks() const -> std::vector<active_uniform_block> = 0;
    };

    struct introspection_options
    {
        /// Drop attributes whose name starts with "gl_", e.g. gl_VertexID.
        bool skip_builtins = true;

        /// Remove a trailing "[N]" from names before building descriptors.
        bool strip_array_suffix = true;
    };

    /// "foo[0]" -> "foo". Names without a trailing subscript are returned as-is.
    GLMETA_EXPORT auto strip_array_suffix(std::string_view name) -> std::string_view;

    ////////////////////////////////////////////////////////////////////////////
    /// @class program_interface
    /// @brief The attributes and uniform blocks a linked program declares.
    /// @details Descriptors are created once, at construction, in the order
    /// the driver reports them. Attributes whose type is unknown to glmeta
    /// are kept with shape '?'; callers computing buffer layouts must check
    /// for it. uniform_block bindings are live and require `bindings` to
    /// outlive this object.
    ////////////////////////////////////////////////////////////////////////////
    class GLMETA_EXPORT program_interface final
    {
    public:
        program_interface(
            I_program_query const& query,
            I_binding_accessor& bindings,
            I_logger* logger = nullptr,
            introspection_options const& options = {}
        );
        program_interface(program_interface const&) = delete;
        program_interface& operator=(program_interface const&) = delete;
        program_interface(program_interface&&) noexcept;
        program_interface& operator=(program_interface&&) noexcept;
        ~program_interface();

        auto program() const -> unsigned int;

        auto attributes() const -> std::vector<std::unique_ptr<attribute>> const&;
        auto uniform_blocks() const -> std::vector<std::unique_ptr<uniform_block>> const&;

        auto find_attribute(std::string_view name) -> attribute*;
        auto find_attribute(std::string_view name) const -> attribute const*;
        auto find_uniform_block(std::string_view name) -> uniform_block*;
        auto find_uniform_block(std::string_view name) const -> uniform_block const*;

        /// Like find_attribute, but throws glmeta_error if there is no match.
        auto get_attribute(std::string_view name) -> attribute&;
        auto get_attribute(std::string_view name) const -> attribute const&;

        /// Like find_uniform_block, but throws glmeta_error if there is no match.
        auto get_uniform_block(std::string_view name) -> uniform_block&;
        auto get_uniform_block(std::string_view name) const -> uniform_block const&;

    private:
        unsigned int m_program;
        std::vector<std::unique_ptr<attribute>> m_attributes;
        std::vector<std::unique_ptr<uniform_block>> m_uniform_blocks;
        std::map<std::string, attribute*, std::less<>> m_attributes_by_name;
        std::map<std::string, uniform_block*, std::less<>> m_uniform_blocks_by_name;
    };
} // namespace glmeta
