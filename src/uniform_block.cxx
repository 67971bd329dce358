#include "glmeta/uniform_block.hxx"

#include "glmeta/binding_accessor.hxx"

#include <ostream>
#include <utility>

glmeta::uniform_block::uniform_block(
    std::string name,
    unsigned int program,
    int index,
    int size,
    I_binding_accessor& accessor
)
    : extra{ }
    , m_name{ std::move(name) }
    , m_program{ program }
    , m_index{ index }
    , m_size{ size }
    , m_accessor{ &accessor }
{
}

auto glmeta::make_uniform_block(
    std::string name,
    unsigned int program,
    int index,
    int size,
    I_binding_accessor& accessor
) -> std::unique_ptr<uniform_block>
{
    return std::unique_ptr<uniform_block>{
        new uniform_block{ std::move(name), program, index, size, accessor }
    };
}

auto glmeta::uniform_block::name() const -> std::string const&
{
    return m_name;
}

auto glmeta::uniform_block::index() const -> int
{
    return m_index;
}

auto glmeta::uniform_block::size() const -> int
{
    return m_size;
}

auto glmeta::uniform_block::program() const -> unsigned int
{
    return m_program;
}

auto glmeta::uniform_block::binding() const -> int
{
    return m_accessor->get_uniform_block_binding(m_program, m_index);
}

void glmeta::uniform_block::set_binding(int binding)
{
    m_accessor->set_uniform_block_binding(m_program, m_index, binding);
}

auto glmeta::uniform_block::value() const -> int
{
    return binding();
}

void glmeta::uniform_block::set_value(int value)
{
    set_binding(value);
}

auto glmeta::operator<<(std::ostream& os, uniform_block const& block) -> std::ostream&
{
    return os << "<uniform_block: " << block.index() << '>';
}
