#pragma once

#include "glmeta/glmeta_export.hxx"

#include <stdexcept>

namespace glmeta
{
    class GLMETA_EXPORT glmeta_error : public std::runtime_error
    {
        using runtime_error::runtime_error;
    };
}
