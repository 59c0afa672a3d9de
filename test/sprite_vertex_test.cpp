#include "catch.hpp"

#include "sprite_vertex.h"

TEST_CASE("A sprite quad spans its rectangle with unit texture coordinates")
{
    SpriteVertex vertices[SPRITE_QUAD_VERTEX_COUNT];
    uint16 indices[SPRITE_QUAD_INDEX_COUNT];
    Vector4 tint(0.5f, 0.25f, 1.0f, 1.0f);

    makeSpriteQuad(Vector2(10.0f, 20.0f), Vector2(30.0f, 40.0f), tint, vertices, indices);

    REQUIRE(vertices[0].position == Vector2(10.0f, 20.0f));
    REQUIRE(vertices[1].position == Vector2(10.0f, 60.0f));
    REQUIRE(vertices[2].position == Vector2(40.0f, 60.0f));
    REQUIRE(vertices[3].position == Vector2(40.0f, 20.0f));

    REQUIRE(vertices[0].texCoord == Vector2(0.0f, 0.0f));
    REQUIRE(vertices[1].texCoord == Vector2(0.0f, 1.0f));
    REQUIRE(vertices[2].texCoord == Vector2(1.0f, 1.0f));
    REQUIRE(vertices[3].texCoord == Vector2(1.0f, 0.0f));

    for(int i=0; i<SPRITE_QUAD_VERTEX_COUNT; i++)
    {
        REQUIRE(vertices[i].color == tint);
    }
}

TEST_CASE("A sprite quad is drawn as two triangles sharing the diagonal")
{
    SpriteVertex vertices[SPRITE_QUAD_VERTEX_COUNT];
    uint16 indices[SPRITE_QUAD_INDEX_COUNT];
    makeSpriteQuad(Vector2(), Vector2(1.0f, 1.0f), Vector4(), vertices, indices);

    const uint16 expected[SPRITE_QUAD_INDEX_COUNT] = {0, 1, 2, 0, 2, 3};
    for(int i=0; i<SPRITE_QUAD_INDEX_COUNT; i++)
    {
        REQUIRE(indices[i] == expected[i]);
    }
}

TEST_CASE("A full-canvas quad covers exactly the clip space square")
{
    SpriteVertex vertices[SPRITE_QUAD_VERTEX_COUNT];
    uint16 indices[SPRITE_QUAD_INDEX_COUNT];
    makeSpriteQuad(Vector2(), Vector2(640.0f, 480.0f), Vector4(1.0f, 1.0f, 1.0f, 1.0f),
                   vertices, indices);

    Uniforms uniforms;
    uniforms.resolution = Vector2(640.0f, 480.0f);
    uniforms.constTriangle = 0;

    const Vector4 expected[SPRITE_QUAD_VERTEX_COUNT] =
    {
        Vector4(-1.0f, 1.0f, 0.0f, 1.0f),
        Vector4(-1.0f, -1.0f, 0.0f, 1.0f),
        Vector4(1.0f, -1.0f, 0.0f, 1.0f),
        Vector4(1.0f, 1.0f, 0.0f, 1.0f)
    };
    for(int i=0; i<SPRITE_QUAD_VERTEX_COUNT; i++)
    {
        VertexInput input = vertexInputFromSpriteVertex(vertices[i]);
        VertexOutput out = SpriteShader::runVertexStage(SPRITE_VARIANT, input, uniforms, i);
        REQUIRE(out.clipPosition == expected[i]);
    }
}

TEST_CASE("Both sprite triangles are counter-clockwise in clip space")
{
    SpriteVertex vertices[SPRITE_QUAD_VERTEX_COUNT];
    uint16 indices[SPRITE_QUAD_INDEX_COUNT];
    makeSpriteQuad(Vector2(100.0f, 50.0f), Vector2(64.0f, 32.0f), Vector4(1.0f, 1.0f, 1.0f, 1.0f),
                   vertices, indices);

    Uniforms uniforms;
    uniforms.resolution = Vector2(800.0f, 600.0f);
    uniforms.constTriangle = 0;

    for(int triangle=0; triangle<2; triangle++)
    {
        Vector4 clip[3];
        for(int corner=0; corner<3; corner++)
        {
            int vertexIndex = indices[3*triangle + corner];
            VertexInput input = vertexInputFromSpriteVertex(vertices[vertexIndex]);
            clip[corner] = SpriteShader::runVertexStage(SPRITE_VARIANT, input, uniforms,
                                                        vertexIndex).clipPosition;
        }

        // Twice the signed area, positive for counter-clockwise (GL_CCW front faces)
        float doubleArea = (clip[1].x - clip[0].x)*(clip[2].y - clip[0].y) -
                           (clip[2].x - clip[0].x)*(clip[1].y - clip[0].y);
        REQUIRE(doubleArea > 0.0f);
    }
}

TEST_CASE("A sprite is centred in the viewport it is given")
{
    Vector2 size(256.0f, 256.0f);

    REQUIRE(centeredSpritePosition(size, 1024, 768) == Vector2(384.0f, 256.0f));
    REQUIRE(centeredSpritePosition(size, 1920, 1080) == Vector2(832.0f, 412.0f));
    REQUIRE(centeredSpritePosition(size, 200, 100) == Vector2(-28.0f, -78.0f));
}

TEST_CASE("A centred quad stays symmetric in clip space after a resize")
{
    Vector2 size(256.0f, 256.0f);
    const int viewports[2][2] = {{1024, 768}, {1600, 900}};

    for(int i=0; i<2; i++)
    {
        int width = viewports[i][0];
        int height = viewports[i][1];
        SpriteVertex vertices[SPRITE_QUAD_VERTEX_COUNT];
        uint16 indices[SPRITE_QUAD_INDEX_COUNT];
        makeSpriteQuad(centeredSpritePosition(size, width, height), size,
                       Vector4(1.0f, 1.0f, 1.0f, 1.0f), vertices, indices);

        Uniforms uniforms;
        uniforms.resolution = Vector2((float)width, (float)height);
        uniforms.constTriangle = 0;

        // Top-left and bottom-right are opposite corners, so they mirror through the origin
        Vector4 topLeft = SpriteShader::runVertexStage(SPRITE_VARIANT,
            vertexInputFromSpriteVertex(vertices[0]), uniforms, 0).clipPosition;
        Vector4 bottomRight = SpriteShader::runVertexStage(SPRITE_VARIANT,
            vertexInputFromSpriteVertex(vertices[2]), uniforms, 2).clipPosition;
        REQUIRE(topLeft.x == Approx(-bottomRight.x));
        REQUIRE(topLeft.y == Approx(-bottomRight.y));
        REQUIRE(topLeft.x == Approx(-256.0f/width));
    }
}

TEST_CASE("The interleaved layout keeps attributes in declaration order")
{
    REQUIRE(SPRITE_VERTEX_POSITION_OFFSET == 0);
    REQUIRE(SPRITE_VERTEX_TEXCOORD_OFFSET == 2*sizeof(float));
    REQUIRE(SPRITE_VERTEX_COLOR_OFFSET == 4*sizeof(float));
    REQUIRE(SPRITE_VERTEX_STRIDE == 8*sizeof(float));
}
