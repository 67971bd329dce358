#include "glmeta/gl_backend.hxx"

#include "glmeta/binding_accessor.hxx"
#include "glad/glad.h"

#include <memory>

namespace
{
    class gl_binding_accessor final : public glmeta::I_binding_accessor
    {
    public:
        auto get_uniform_block_binding(unsigned int program, int index) const -> int override
        {
            GLint binding = 0;
            ::glGetActiveUniformBlockiv(program, static_cast<GLuint>(index), GL_UNIFORM_BLOCK_BINDING, &binding);
            return binding;
        }

        void set_uniform_block_binding(unsigned int program, int index, int binding) override
        {
            ::glUniformBlockBinding(program, static_cast<GLuint>(index), static_cast<GLuint>(binding));
        }
    };
}

auto glmeta::gl::make_binding_accessor() -> std::unique_ptr<I_binding_accessor>
{
    return std::make_unique<gl_binding_accessor>();
}
