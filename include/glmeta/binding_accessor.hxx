#pragma once

namespace glmeta
{
    ////////////////////////////////////////////////////////////////////////////
    /// @class I_binding_accessor
    /// @brief Reads and writes uniform block binding points of live programs.
    /// @details uniform_block holds a non-owning reference to one of these,
    /// so an accessor must outlive every block created against it.
    ////////////////////////////////////////////////////////////////////////////
    class I_binding_accessor
    {
    public:
        virtual ~I_binding_accessor() = default;

        virtual auto get_uniform_block_binding(unsigned int program, int index) const -> int = 0;
        virtual void set_uniform_block_binding(unsigned int program, int index, int binding) = 0;
    };
} // namespace glmeta
