#pragma once

#include "glmeta/glmeta_export.hxx"

#include <any>
#include <iosfwd>
#include <memory>
#include <string>

namespace glmeta
{
    class I_binding_accessor;
    class uniform_block;

    GLMETA_EXPORT auto make_uniform_block(
        std::string name,
        unsigned int program,
        int index,
        int size,
        I_binding_accessor& accessor
    ) -> std::unique_ptr<uniform_block>;

    GLMETA_EXPORT auto operator<<(std::ostream& os, uniform_block const& block) -> std::ostream&;

    ////////////////////////////////////////////////////////////////////////////
    /// @class uniform_block
    /// @brief An active uniform block of a linked program.
    /// @details The binding point is not stored. Every read or write of it
    /// goes through the I_binding_accessor given at construction.
    ////////////////////////////////////////////////////////////////////////////
    class GLMETA_EXPORT uniform_block final
    {
    public:
        uniform_block(uniform_block const&) = delete;
        uniform_block& operator=(uniform_block const&) = delete;

        auto name() const -> std::string const&;
        auto index() const -> int;

        /// Size of the block's data store in bytes.
        auto size() const -> int;

        auto program() const -> unsigned int;

        auto binding() const -> int;
        void set_binding(int binding);

        // Same as binding() and set_binding().
        auto value() const -> int;
        void set_value(int value);

        friend auto make_uniform_block(
            std::string name,
            unsigned int program,
            int index,
            int size,
            I_binding_accessor& accessor
        ) -> std::unique_ptr<uniform_block>;

        std::any extra;

    private:
        uniform_block(
            std::string name,
            unsigned int program,
            int index,
            int size,
            I_binding_accessor& accessor
        );

        std::string m_name;
        unsigned int m_program;
        int m_index;
        int m_size;
        I_binding_accessor* m_accessor;
    };
} // namespace glmeta
