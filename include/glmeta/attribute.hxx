#pragma once

#include "glmeta/glmeta_export.hxx"
#include "glmeta/type_table.hxx"

#include <any>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace glmeta
{
    class attribute;

    /// Builds the descriptor for one active attribute. gl_type codes the
    /// lookup table does not know produce a descriptor with dimension 1 and
    /// shape '?'.
    GLMETA_EXPORT auto make_attribute(
        std::string name,
        unsigned int gl_type,
        unsigned int program,
        int location,
        int array_length
    ) -> std::unique_ptr<attribute>;

    GLMETA_EXPORT auto operator<<(std::ostream& os, attribute const& attr) -> std::ostream&;

    ////////////////////////////////////////////////////////////////////////////
    /// @class attribute
    /// @brief An active vertex attribute of a linked program.
    /// @details Created once per attribute by make_attribute. Equality and
    /// hashing are by object identity, so two attributes with identical
    /// fields are still distinct keys. For that reason attributes can be
    /// neither copied nor moved.
    ////////////////////////////////////////////////////////////////////////////
    class GLMETA_EXPORT attribute final
    {
    public:
        attribute(attribute const&) = delete;
        attribute& operator=(attribute const&) = delete;

        /// Result of glGetAttribLocation.
        auto location() const -> int;

        /// Length of the array, or 1 if the attribute is not an array.
        auto array_length() const -> int;

        /// Total scalar component count of the attribute's type.
        auto dimension() const -> int;

        /// One of the glmeta::shape tags.
        auto shape() const -> char;

        /// Name without any trailing array subscript.
        auto name() const -> std::string const&;

        auto gl_type() const -> unsigned int;
        auto program() const -> unsigned int;
        auto scalar_type() const -> unsigned int;
        auto rows_length() const -> int;

        /// Per-row component count multiplied by array_length().
        auto row_length() const -> int;

        auto normalizable() const -> bool;

        friend auto operator==(attribute const& a, attribute const& b) -> bool
        {
            return &a == &b;
        }

        friend auto make_attribute(
            std::string name,
            unsigned int gl_type,
            unsigned int program,
            int location,
            int array_length
        ) -> std::unique_ptr<attribute>;

        /// User data; never read by glmeta.
        std::any extra;

    private:
        attribute(
            std::string name,
            attribute_type_info const& info,
            unsigned int gl_type,
            unsigned int program,
            int location,
            int array_length
        );

        std::string m_name;
        unsigned int m_gl_type;
        unsigned int m_program;
        unsigned int m_scalar_type;
        int m_location;
        int m_array_length;
        int m_dimension;
        int m_rows_length;
        int m_row_length;
        bool m_normalizable;
        char m_shape;
    };
} // namespace glmeta

template <>
struct std::hash<glmeta::attribute>
{
    auto operator()(glmeta::attribute const& attr) const noexcept -> std::size_t
    {
        return std::hash<glmeta::attribute const*>{}(&attr);
    }
};
