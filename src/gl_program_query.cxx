#include "glmeta/gl_backend.hxx"

#include "glmeta/glmeta_error.hxx"
#include "glmeta/program_interface.hxx"
#include "glad/glad.h"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{
    auto get_program_int(GLuint program, GLenum pname) -> GLint
    {
        GLint value = 0;
        ::glGetProgramiv(program, pname, &value);
        return value;
    }

    class gl_program_query final : public glmeta::I_program_query
    {
    public:
        explicit gl_program_query(GLuint program)
            : m_program{ program }
        {
            if (0 == program || GL_FALSE == ::glIsProgram(program)) {
                throw glmeta::glmeta_error{ "Not a program object: " + std::to_string(program) };
            }
            if (GL_FALSE == get_program_int(program, GL_LINK_STATUS)) {
                throw glmeta::glmeta_error{ "Program is not linked: " + std::to_string(program) };
            }
        }

        auto program() const -> unsigned int override
        {
            return m_program;
        }

        auto active_attributes() const -> std::vector<glmeta::active_attribute> override
        {
            auto count = get_program_int(m_program, GL_ACTIVE_ATTRIBUTES);
            auto max_length = std::max(get_program_int(m_program, GL_ACTIVE_ATTRIBUTE_MAX_LENGTH), 1);

            auto result = std::vector<glmeta::active_attribute>{ };
            result.reserve(static_cast<std::size_t>(count));

            auto buffer = std::vector<GLchar>(static_cast<std::size_t>(max_length));
            for (GLint i = 0; i < count; ++i) {
                GLsizei length = 0;
                GLint array_length = 0;
                GLenum type = 0;
                ::glGetActiveAttrib(
                    m_program,
                    static_cast<GLuint>(i),
                    max_length,
                    &length,
                    &array_length,
                    &type,
                    buffer.data()
                );

                auto name = std::string(buffer.data(), static_cast<std::size_t>(length));
                auto location = ::glGetAttribLocation(m_program, name.c_str());
                result.push_back({ std::move(name), type, location, array_length });
            }
            return result;
        }

        auto active_uniform_blocks() const -> std::vector<glmeta::active_uniform_block> override
        {
            auto count = get_program_int(m_program, GL_ACTIVE_UNIFORM_BLOCKS);
            auto max_length = std::max(get_program_int(m_program, GL_ACTIVE_UNIFORM_BLOCK_MAX_NAME_LENGTH), 1);

            auto result = std::vector<glmeta::active_uniform_block>{ };
            result.reserve(static_cast<std::size_t>(count));

            auto buffer = std::vector<GLchar>(static_cast<std::size_t>(max_length));
            for (GLint i = 0; i < count; ++i) {
                GLsizei length = 0;
                ::glGetActiveUniformBlockName(
                    m_program,
                    static_cast<GLuint>(i),
                    max_length,
                    &length,
                    buffer.data()
                );

                GLint size = 0;
                ::glGetActiveUniformBlockiv(m_program, static_cast<GLuint>(i), GL_UNIFORM_BLOCK_DATA_SIZE, &size);

                result.push_back({ std::string(buffer.data(), static_cast<std::size_t>(length)), i, size });
            }
            return result;
        }

    private:
        GLuint m_program;
    };
}

auto glmeta::gl::make_program_query(unsigned int program) -> std::unique_ptr<I_program_query>
{
    return std::make_unique<gl_program_query>(program);
}
