#include "glmeta/attribute.hxx"

#include "glad/glad.h"

#include <gtest/gtest.h>

#include <any>
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>

TEST(Attribute, StoresConstructionArguments)
{
    auto attr = glmeta::make_attribute("in_position", GL_FLOAT_VEC3, 7, 2, 1);

    EXPECT_EQ(attr->name(), "in_position");
    EXPECT_EQ(attr->gl_type(), static_cast<unsigned int>(GL_FLOAT_VEC3));
    EXPECT_EQ(attr->program(), 7u);
    EXPECT_EQ(attr->location(), 2);
    EXPECT_EQ(attr->array_length(), 1);
    EXPECT_EQ(attr->dimension(), 3);
    EXPECT_EQ(attr->shape(), 'f');
    EXPECT_EQ(attr->scalar_type(), static_cast<unsigned int>(GL_FLOAT));
    EXPECT_EQ(attr->rows_length(), 1);
    EXPECT_EQ(attr->row_length(), 3);
    EXPECT_TRUE(attr->normalizable());
}

TEST(Attribute, NameIsReturnedUnchanged)
{
    auto attr = glmeta::make_attribute("foo", GL_INT, 1, 0, 1);
    EXPECT_EQ(attr->name(), "foo");
}

TEST(Attribute, DoubleMatrix)
{
    auto attr = glmeta::make_attribute("in_transform", GL_DOUBLE_MAT4, 1, 4, 1);

    EXPECT_EQ(attr->dimension(), 16);
    EXPECT_EQ(attr->shape(), 'd');
    EXPECT_EQ(attr->rows_length(), 4);
    EXPECT_EQ(attr->row_length(), 4);
    EXPECT_FALSE(attr->normalizable());
}

TEST(Attribute, RowLengthScalesWithArrayLength)
{
    auto vec2s = glmeta::make_attribute("in_offsets", GL_FLOAT_VEC2, 1, 0, 5);
    EXPECT_EQ(vec2s->array_length(), 5);
    EXPECT_EQ(vec2s->row_length(), 10);
    EXPECT_EQ(vec2s->rows_length(), 1);

    auto mat3x4s = glmeta::make_attribute("in_bones", GL_FLOAT_MAT3x4, 1, 0, 3);
    EXPECT_EQ(mat3x4s->row_length(), 12);
    EXPECT_EQ(mat3x4s->rows_length(), 3);
    EXPECT_EQ(mat3x4s->dimension(), 12);
}

TEST(Attribute, UnknownTypeDoesNotThrow)
{
    auto attr = glmeta::make_attribute("in_sampler", GL_SAMPLER_2D, 1, 3, 2);

    EXPECT_EQ(attr->dimension(), 1);
    EXPECT_EQ(attr->shape(), '?');
    EXPECT_EQ(attr->scalar_type(), 0u);
    EXPECT_EQ(attr->rows_length(), 1);
    EXPECT_EQ(attr->row_length(), 2);
    EXPECT_FALSE(attr->normalizable());
    EXPECT_EQ(attr->gl_type(), static_cast<unsigned int>(GL_SAMPLER_2D));
}

TEST(Attribute, IdenticalArgumentsGiveDistinctAttributes)
{
    auto a = glmeta::make_attribute("in_color", GL_FLOAT_VEC4, 1, 1, 1);
    auto b = glmeta::make_attribute("in_color", GL_FLOAT_VEC4, 1, 1, 1);

    EXPECT_TRUE(*a == *a);
    EXPECT_FALSE(*a == *b);
    EXPECT_TRUE(*a != *b);
}

TEST(Attribute, UsableAsIdentityKey)
{
    auto a = glmeta::make_attribute("in_color", GL_FLOAT_VEC4, 1, 1, 1);
    auto b = glmeta::make_attribute("in_color", GL_FLOAT_VEC4, 1, 1, 1);

    using key = std::reference_wrapper<glmeta::attribute const>;
    auto offsets = std::unordered_map<key, int, std::hash<glmeta::attribute>, std::equal_to<glmeta::attribute>>{ };
    offsets.emplace(*a, 0);
    offsets.emplace(*b, 16);

    EXPECT_EQ(offsets.size(), 2u);
    EXPECT_EQ(offsets.at(*a), 0);
    EXPECT_EQ(offsets.at(*b), 16);

    auto seen = std::unordered_set<glmeta::attribute const*>{ a.get(), b.get() };
    EXPECT_EQ(seen.size(), 2u);
}

TEST(Attribute, ExtraHoldsUserData)
{
    auto attr = glmeta::make_attribute("in_uv", GL_FLOAT_VEC2, 1, 0, 1);
    EXPECT_FALSE(attr->extra.has_value());

    attr->extra = std::string{ "texcoord" };
    EXPECT_EQ(std::any_cast<std::string>(attr->extra), "texcoord");
}

TEST(Attribute, StreamsLocation)
{
    auto attr = glmeta::make_attribute("in_normal", GL_FLOAT_VEC3, 1, 3, 1);

    auto ss = std::ostringstream{ };
    ss << *attr;
    EXPECT_EQ(ss.str(), "<attribute: 3>");
}
