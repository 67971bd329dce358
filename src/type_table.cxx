#include "glmeta/type_table.hxx"

#include "glad/glad.h"

#include <unordered_map>

namespace
{
    using glmeta::attribute_type_info;
    namespace shape = glmeta::shape;

    auto attribute_types() -> std::unordered_map<unsigned int, attribute_type_info> const&
    {
        static auto const table = std::unordered_map<unsigned int, attribute_type_info>{
            { GL_INT,               { 1, GL_INT, 1, 1, false, shape::signed_int } },
            { GL_INT_VEC2,          { 2, GL_INT, 1, 2, false, shape::signed_int } },
            { GL_INT_VEC3,          { 3, GL_INT, 1, 3, false, shape::signed_int } },
            { GL_INT_VEC4,          { 4, GL_INT, 1, 4, false, shape::signed_int } },

            { GL_UNSIGNED_INT,      { 1, GL_UNSIGNED_INT, 1, 1, false, shape::unsigned_int } },
            { GL_UNSIGNED_INT_VEC2, { 2, GL_UNSIGNED_INT, 1, 2, false, shape::unsigned_int } },
            { GL_UNSIGNED_INT_VEC3, { 3, GL_UNSIGNED_INT, 1, 3, false, shape::unsigned_int } },
            { GL_UNSIGNED_INT_VEC4, { 4, GL_UNSIGNED_INT, 1, 4, false, shape::unsigned_int } },

            { GL_FLOAT,             { 1, GL_FLOAT, 1, 1, true, shape::single_float } },
            { GL_FLOAT_VEC2,        { 2, GL_FLOAT, 1, 2, true, shape::single_float } },
            { GL_FLOAT_VEC3,        { 3, GL_FLOAT, 1, 3, true, shape::single_float } },
            { GL_FLOAT_VEC4,        { 4, GL_FLOAT, 1, 4, true, shape::single_float } },

            { GL_DOUBLE,            { 1, GL_DOUBLE, 1, 1, false, shape::double_float } },
            { GL_DOUBLE_VEC2,       { 2, GL_DOUBLE, 1, 2, false, shape::double_float } },
            { GL_DOUBLE_VEC3,       { 3, GL_DOUBLE, 1, 3, false, shape::double_float } },
            { GL_DOUBLE_VEC4,       { 4, GL_DOUBLE, 1, 4, false, shape::double_float } },

            { GL_FLOAT_MAT2,        {  4, GL_FLOAT, 2, 2, true, shape::single_float } },
            { GL_FLOAT_MAT2x3,      {  6, GL_FLOAT, 2, 3, true, shape::single_float } },
            { GL_FLOAT_MAT2x4,      {  8, GL_FLOAT, 2, 4, true, shape::single_float } },
            { GL_FLOAT_MAT3x2,      {  6, GL_FLOAT, 3, 2, true, shape::single_float } },
            { GL_FLOAT_MAT3,        {  9, GL_FLOAT, 3, 3, true, shape::single_float } },
            { GL_FLOAT_MAT3x4,      { 12, GL_FLOAT, 3, 4, true, shape::single_float } },
            { GL_FLOAT_MAT4x2,      {  8, GL_FLOAT, 4, 2, true, shape::single_float } },
            { GL_FLOAT_MAT4x3,      { 12, GL_FLOAT, 4, 3, true, shape::single_float } },
            { GL_FLOAT_MAT4,        { 16, GL_FLOAT, 4, 4, true, shape::single_float } },

            { GL_DOUBLE_MAT2,       {  4, GL_DOUBLE, 2, 2, false, shape::double_float } },
            { GL_DOUBLE_MAT2x3,     {  6, GL_DOUBLE, 2, 3, false, shape::double_float } },
            { GL_DOUBLE_MAT2x4,     {  8, GL_DOUBLE, 2, 4, false, shape::double_float } },
            { GL_DOUBLE_MAT3x2,     {  6, GL_DOUBLE, 3, 2, false, shape::double_float } },
            { GL_DOUBLE_MAT3,       {  9, GL_DOUBLE, 3, 3, false, shape::double_float } },
            { GL_DOUBLE_MAT3x4,     { 12, GL_DOUBLE, 3, 4, false, shape::double_float } },
            { GL_DOUBLE_MAT4x2,     {  8, GL_DOUBLE, 4, 2, false, shape::double_float } },
            { GL_DOUBLE_MAT4x3,     { 12, GL_DOUBLE, 4, 3, false, shape::double_float } },
            { GL_DOUBLE_MAT4,       { 16, GL_DOUBLE, 4, 4, false, shape::double_float } },
        };
        return table;
    }
}

auto glmeta::lookup_attribute_type(unsigned int gl_type) -> attribute_type_info const&
{
    auto const& table = attribute_types();
    if (auto it = table.find(gl_type); it != table.end()) {
        return it->second;
    }
    return unknown_attribute_type;
}

auto glmeta::is_known_attribute_type(unsigned int gl_type) -> bool
{
    return attribute_types().contains(gl_type);
}
