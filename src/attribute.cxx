#include "glmeta/attribute.hxx"

#include "glmeta/type_table.hxx"

#include <ostream>
#include <utility>

glmeta::attribute::attribute(
    std::string name,
    attribute_type_info const& info,
    unsigned int gl_type,
    unsigned int program,
    int location,
    int array_length
)
    : extra{ }
    , m_name{ std::move(name) }
    , m_gl_type{ gl_type }
    , m_program{ program }
    , m_scalar_type{ info.scalar_type }
    , m_location{ location }
    , m_array_length{ array_length }
    , m_dimension{ info.dimension }
    , m_rows_length{ info.rows_length }
    , m_row_length{ info.row_length * array_length }
    , m_normalizable{ info.normalizable }
    , m_shape{ info.shape }
{
}

auto glmeta::make_attribute(
    std::string name,
    unsigned int gl_type,
    unsigned int program,
    int location,
    int array_length
) -> std::unique_ptr<attribute>
{
    auto const& info = lookup_attribute_type(gl_type);
    return std::unique_ptr<attribute>{
        new attribute{ std::move(name), info, gl_type, program, location, array_length }
    };
}

auto glmeta::attribute::location() const -> int
{
    return m_location;
}

auto glmeta::attribute::array_length() const -> int
{
    return m_array_length;
}

auto glmeta::attribute::dimension() const -> int
{
    return m_dimension;
}

auto glmeta::attribute::shape() const -> char
{
    return m_shape;
}

auto glmeta::attribute::name() const -> std::string const&
{
    return m_name;
}

auto glmeta::attribute::gl_type() const -> unsigned int
{
    return m_gl_type;
}

auto glmeta::attribute::program() const -> unsigned int
{
    return m_program;
}

auto glmeta::attribute::scalar_type() const -> unsigned int
{
    return m_scalar_type;
}

auto glmeta::attribute::rows_length() const -> int
{
    return m_rows_length;
}

auto glmeta::attribute::row_length() const -> int
{
    return m_row_length;
}

auto glmeta::attribute::normalizable() const -> bool
{
    return m_normalizable;
}

auto glmeta::operator<<(std::ostream& os, attribute const& attr) -> std::ostream&
{
    return os << "<attribute: " << attr.location() << '>';
}
