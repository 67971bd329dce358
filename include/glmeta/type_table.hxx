#pragma once

#include "glmeta/glmeta_export.hxx"

namespace glmeta
{
    namespace shape
    {
        inline constexpr char signed_int = 'i';
        // Unsigned attributes share the signed integer tag.
        inline constexpr char unsigned_int = 'i';
        inline constexpr char single_float = 'f';
        inline constexpr char double_float = 'd';
        inline constexpr char unknown = '?';
    } // namespace shape

    ////////////////////////////////////////////////////////////////////////////
    /// @class attribute_type_info
    /// @brief Structure of a GLSL attribute type, keyed by its GL enum.
    /// @details A matCxR type has rows_length C and row_length R; scalars and
    /// vectors have rows_length 1. dimension is always
    /// rows_length * row_length.
    ////////////////////////////////////////////////////////////////////////////
    struct attribute_type_info
    {
        int dimension;
        unsigned int scalar_type;
        int rows_length;
        int row_length;
        bool normalizable;
        char shape;
    };

    /// Entry returned for any GL type the table does not describe.
    inline constexpr attribute_type_info unknown_attribute_type{
        1, 0, 1, 1, false, shape::unknown
    };

    /// Never throws; unmapped codes yield unknown_attribute_type.
    GLMETA_EXPORT auto lookup_attribute_type(unsigned int gl_type) -> attribute_type_info const&;

    GLMETA_EXPORT auto is_known_attribute_type(unsigned int gl_type) -> bool;
} // namespace glmeta
