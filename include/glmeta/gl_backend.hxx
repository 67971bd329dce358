#pragma once

#include "glmeta/glmeta_export.hxx"

#include <memory>

namespace glmeta
{
    class I_binding_accessor;
    class I_program_query;
} // namespace glmeta

namespace glmeta::gl
{
    // Both objects call into OpenGL and require a current context whose
    // entry points have already been loaded through glad.

    /// Binding accessor backed by glGetActiveUniformBlockiv and
    /// glUniformBlockBinding.
    GLMETA_EXPORT auto make_binding_accessor() -> std::unique_ptr<I_binding_accessor>;

    /// Throws glmeta_error if `program` is not a successfully linked program.
    GLMETA_EXPORT auto make_program_query(unsigned int program) -> std::unique_ptr<I_program_query>;
} // namespace glmeta::gl
